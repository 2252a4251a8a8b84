#pragma once

/// @file request_generation.hpp
/// @brief Random scheduling requests for experiments, benchmarks and tests.
///
/// Splits a total slot demand over the tasks with UUniFast and scatters
/// task windows over a number of working days. The total demand is a
/// multiple (`load`) of the capacity of the horizon, so a load above 1
/// produces over-committed requests that exercise triage.
///
/// @ingroup io_generation

#include <slotsched/algo/schedule.hpp>
#include <slotsched/core/types.hpp>

#include <cstddef>
#include <random>
#include <vector>

namespace slotsched::io {

/// @brief Parameters of generate_request().
/// @ingroup io_generation
struct GenerationParams {
    std::size_t num_tasks{10};        ///< Number of tasks.
    std::size_t days{5};              ///< Working days in the horizon.
    std::size_t slots_per_day{16};    ///< Slots in each daily window.
    core::Duration slot_length{core::duration_from_minutes(25)};
    core::Duration day_start{core::duration_from_hours(9)};  ///< Window start after midnight.
    double load{0.8};                 ///< Total demand / capacity.
    std::size_t priority_levels{5};   ///< Priorities are drawn in [1, priority_levels].
    core::TimePoint horizon_start{};  ///< Midnight of the first day.
};

/// @brief UUniFast algorithm: split @p total into @p count positive shares.
///
/// Implements the unbiased random splitting algorithm by Bini and Buttazzo,
/// here used to spread slot demand over tasks.
///
/// @param count  Number of shares to generate.
/// @param total  Desired sum of all shares.
/// @param rng    Mersenne Twister PRNG instance.
/// @return Vector of shares (size == @p count).
std::vector<double> uunifast(std::size_t count, double total, std::mt19937& rng);

/// @brief Generate a random, valid scheduling request.
///
/// Every task gets a window of whole days `[start day, due day]` drawn
/// uniformly inside the horizon, a duration of at least one slot, and a
/// uniform priority. Active periods come from the daily window. The
/// request carries a seed drawn from @p rng so that the run is
/// reproducible.
///
/// @param params  Generation parameters.
/// @param rng     Mersenne Twister PRNG instance.
/// @return A request accepted by algo::validate().
///
/// @throws std::invalid_argument  If a count is zero, @p params.load is not
///         positive, or the daily window does not fit in a day.
algo::ScheduleRequest generate_request(const GenerationParams& params, std::mt19937& rng);

} // namespace slotsched::io
