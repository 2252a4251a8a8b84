#include <slotsched/core/error.hpp>
#include <slotsched/core/types.hpp>

#include <slotsched/algo/layout_strategy.hpp>
#include <slotsched/algo/schedule.hpp>

#include <slotsched/io/error.hpp>
#include <slotsched/io/request_loader.hpp>
#include <slotsched/io/result_writer.hpp>
#include <slotsched/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

namespace core = slotsched::core;
namespace algo = slotsched::algo;
namespace io = slotsched::io;

struct Config {
    std::string request_file;
    std::string output_file{"-"};
    std::string format{"text"};
    std::optional<uint32_t> seed;
    std::optional<std::string> strategy;
    std::optional<std::size_t> attempts;
    long time_limit_ms{0};  // 0 = unlimited
    std::string trace_file;
    std::string trace_format{"json"};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("slotsched", "Slot scheduler for personal tasks");

    options.add_options()
        ("i,input", "Request file (JSON)", cxxopts::value<std::string>())
        ("o,output", "Result output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Result format: json|text (default: text)", cxxopts::value<std::string>()->default_value("text"))
        ("seed", "Shuffle seed (overrides the request)", cxxopts::value<uint32_t>())
        ("strategy", "Layout strategy (overrides the request)", cxxopts::value<std::string>())
        ("attempts", "Layout search attempts (default: request or 100)", cxxopts::value<std::size_t>())
        ("time-limit", "Layout search time limit in ms (default: unlimited)", cxxopts::value<long>()->default_value("0"))
        ("trace", "Trace output file ('-' for stderr)", cxxopts::value<std::string>())
        ("trace-format", "Trace format: json|text (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.request_file = result["input"].as<std::string>();
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    if (result.count("seed") != 0U) {
        config.seed = result["seed"].as<uint32_t>();
    }
    if (result.count("strategy") != 0U) {
        config.strategy = result["strategy"].as<std::string>();
    }
    if (result.count("attempts") != 0U) {
        config.attempts = result["attempts"].as<std::size_t>();
    }
    config.time_limit_ms = result["time-limit"].as<long>();
    if (result.count("trace") != 0U) {
        config.trace_file = result["trace"].as<std::string>();
    }
    config.trace_format = result["trace-format"].as<std::string>();
    config.verbose = result.count("verbose") != 0U;

    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        const auto format = io::parse_result_format(config.format);
        if (!format) {
            std::cerr << "Error: unknown format: " << config.format << std::endl;
            return 64;
        }

        if (config.verbose) {
            std::cerr << "Loading request from: " << config.request_file << std::endl;
        }

        // 1. Load request and apply overrides
        auto request = io::load_request(config.request_file);
        if (config.seed) {
            request.seed = config.seed;
        }
        if (config.strategy) {
            request.strategy = algo::parse_layout_strategy(*config.strategy);
            if (!request.strategy) {
                std::cerr << "Error: unknown strategy: " << *config.strategy << std::endl;
                return 64;
            }
        }
        if (config.attempts) {
            request.strategy_attempts = *config.attempts;
        }
        if (config.time_limit_ms > 0) {
            request.strategy_time_budget = std::chrono::milliseconds{config.time_limit_ms};
        }

        // 2. Setup trace writer
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream tracefile;
        if (!config.trace_file.empty()) {
            std::ostream* sink = &std::cerr;
            if (config.trace_file != "-") {
                tracefile.open(config.trace_file);
                if (!tracefile) {
                    std::cerr << "Error: cannot open trace file: " << config.trace_file << std::endl;
                    return 1;
                }
                sink = &tracefile;
            }
            if (config.trace_format == "text") {
                writer = std::make_unique<io::TextualTraceWriter>(*sink, config.trace_file == "-");
            } else if (config.trace_format == "json") {
                writer = std::make_unique<io::JsonTraceWriter>(*sink);
            } else {
                std::cerr << "Error: unknown trace format: " << config.trace_format << std::endl;
                return 64;
            }
        }

        if (config.verbose) {
            std::cerr << "Scheduling " << request.tasks.size() << " tasks over "
                      << request.active_periods.size() << " active periods..." << std::endl;
        }

        // 3. Run the pipeline
        const auto result = algo::schedule(request, writer.get());

        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        // 4. Write result
        if (config.output_file == "-") {
            if (*format == io::ResultFormat::Json) {
                io::write_result_json(result, std::cout);
            } else {
                io::write_result_text(result, std::cout);
            }
        } else {
            io::write_result(result, config.output_file, *format);
        }

        if (config.verbose) {
            std::cerr << "Seed: " << result.seed << ", claims: " << result.stats.claims
                      << ", captures: " << result.stats.captures
                      << ", triage passes: " << result.stats.triage_passes
                      << ", swaps: " << result.stats.swaps << std::endl;
            std::cerr << "Unschedulable tasks: " << result.unschedulable().size() << std::endl;
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::ValidationError& e) {
        std::cerr << "Invalid request: " << e.what() << std::endl;
        return 2;
    }
    catch (const core::InvariantViolation& e) {
        std::cerr << "Internal error: " << e.what() << std::endl;
        return 70;
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
