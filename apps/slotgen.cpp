#include <slotsched/core/types.hpp>

#include <slotsched/io/request_generation.hpp>
#include <slotsched/io/request_loader.hpp>

#include <cxxopts.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <string>

namespace {

namespace core = slotsched::core;
namespace io = slotsched::io;

struct Config {
    io::GenerationParams params;
    std::string output_file{"-"};
    std::optional<uint64_t> seed;
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("slotgen", "Random scheduling request generator (UUniFast)");

    // clang-format off
    options.add_options()
        ("n,tasks", "Number of tasks (required)", cxxopts::value<std::size_t>())
        ("days", "Working days in the horizon (default: 5)", cxxopts::value<std::size_t>()->default_value("5"))
        ("slots-per-day", "Slots in each daily window (default: 16)", cxxopts::value<std::size_t>()->default_value("16"))
        ("slot-length", "Slot length in minutes (default: 25)", cxxopts::value<int64_t>()->default_value("25"))
        ("day-start", "Daily window start in minutes after midnight (default: 540)",
            cxxopts::value<int64_t>()->default_value("540"))
        ("l,load", "Total demand / capacity, > 1 over-commits (default: 0.8)",
            cxxopts::value<double>()->default_value("0.8"))
        ("priorities", "Number of priority levels (default: 5)", cxxopts::value<std::size_t>()->default_value("5"))
        ("o,output", "Output file (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("seed", "Random seed", cxxopts::value<uint64_t>())
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    Config config;

    if (result.count("tasks") == 0U) {
        std::cerr << "Error: --tasks (-n) is required" << std::endl;
        std::exit(64);
    }
    config.params.num_tasks = result["tasks"].as<std::size_t>();
    config.params.days = result["days"].as<std::size_t>();
    config.params.slots_per_day = result["slots-per-day"].as<std::size_t>();
    config.params.slot_length = core::duration_from_minutes(result["slot-length"].as<int64_t>());
    config.params.day_start = core::duration_from_minutes(result["day-start"].as<int64_t>());
    config.params.load = result["load"].as<double>();
    config.params.priority_levels = result["priorities"].as<std::size_t>();
    config.output_file = result["output"].as<std::string>();

    if (result.count("seed") != 0U) {
        config.seed = result["seed"].as<uint64_t>();
    }

    // Validation
    if (config.params.num_tasks < 1) {
        std::cerr << "Error: num_tasks must be >= 1" << std::endl;
        std::exit(64);
    }

    if (config.params.load <= 0.0) {
        std::cerr << "Error: load must be > 0" << std::endl;
        std::exit(64);
    }

    if (config.params.slot_length <= core::Duration::zero()) {
        std::cerr << "Error: slot length must be positive" << std::endl;
        std::exit(64);
    }

    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // Initialize RNG
        std::mt19937 rng;
        if (config.seed.has_value()) {
            rng.seed(static_cast<std::mt19937::result_type>(config.seed.value()));
        } else {
            std::random_device rd;
            rng.seed(rd());
        }

        auto request = io::generate_request(config.params, rng);

        if (config.output_file == "-") {
            io::write_request_to_stream(request, std::cout);
            std::cout << std::endl;
        } else {
            std::ofstream outfile(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open file: " << config.output_file << std::endl;
                return 1;
            }
            io::write_request_to_stream(request, outfile);
        }

        return 0;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
