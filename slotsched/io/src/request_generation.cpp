#include <slotsched/io/request_generation.hpp>

#include <slotsched/core/slicer.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace slotsched::io {

using namespace slotsched::core;

namespace {

constexpr Duration DAY = duration_from_hours(24);

} // anonymous namespace

std::vector<double> uunifast(std::size_t count, double total, std::mt19937& rng) {
    if (count == 0) {
        return {};
    }

    if (count == 1) {
        return {total};
    }

    std::vector<double> shares(count);
    double remaining = total;
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    for (std::size_t idx = 0; idx < count - 1; ++idx) {
        // next = remaining * random^(1/(n-i-1))
        double exponent = 1.0 / static_cast<double>(count - idx - 1);
        double next = remaining * std::pow(dist(rng), exponent);
        shares[idx] = remaining - next;
        remaining = next;
    }
    shares[count - 1] = remaining;

    return shares;
}

algo::ScheduleRequest generate_request(const GenerationParams& params, std::mt19937& rng) {
    if (params.num_tasks == 0 || params.days == 0 || params.slots_per_day == 0 ||
        params.priority_levels == 0) {
        throw std::invalid_argument("generate_request: counts must be positive");
    }
    if (!(params.load > 0.0)) {
        throw std::invalid_argument("generate_request: load must be positive");
    }
    if (params.slot_length <= Duration::zero()) {
        throw std::invalid_argument("generate_request: slot length must be positive");
    }
    const Duration day_end =
        params.day_start + params.slot_length * static_cast<int64_t>(params.slots_per_day);
    if (params.day_start < Duration::zero() || day_end > DAY) {
        throw std::invalid_argument("generate_request: daily window does not fit in a day");
    }

    algo::ScheduleRequest request;
    request.horizon_start = params.horizon_start;
    request.slot_length = params.slot_length;

    const double capacity = static_cast<double>(params.days * params.slots_per_day);
    const double demand = std::max(static_cast<double>(params.num_tasks),
                                   std::round(params.load * capacity));
    const auto shares = uunifast(params.num_tasks, demand, rng);

    std::uniform_int_distribution<std::size_t> day_dist(0, params.days - 1);
    std::uniform_int_distribution<Priority> prio_dist(1, static_cast<Priority>(params.priority_levels));

    for (std::size_t idx = 0; idx < params.num_tasks; ++idx) {
        std::size_t first_day = day_dist(rng);
        std::size_t last_day = day_dist(rng);
        if (last_day < first_day) {
            std::swap(first_day, last_day);
        }

        const int64_t slots = std::max<int64_t>(1, std::llround(shares[idx]));
        const TimePoint start = params.horizon_start + DAY * static_cast<int64_t>(first_day);
        const TimePoint due = params.horizon_start + DAY * static_cast<int64_t>(last_day + 1);

        Task task("t" + std::to_string(idx), slots, start, due, prio_dist(rng));
        task.set_name("Task " + std::to_string(idx));
        request.tasks.push_back(std::move(task));
    }

    const TimePoint until = params.horizon_start + DAY * static_cast<int64_t>(params.days);
    request.active_periods = daily_active_periods(params.horizon_start, until,
                                                  params.day_start, day_end);
    request.seed = static_cast<uint32_t>(rng());
    return request;
}

} // namespace slotsched::io
