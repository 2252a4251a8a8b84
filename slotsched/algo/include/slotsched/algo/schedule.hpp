#pragma once

#include <slotsched/algo/layout_strategy.hpp>

#include <slotsched/core/board.hpp>
#include <slotsched/core/slicer.hpp>
#include <slotsched/core/slot_sequence.hpp>
#include <slotsched/core/task.hpp>
#include <slotsched/core/trace_writer.hpp>
#include <slotsched/core/types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace slotsched::algo {

/// @brief Everything one scheduling run needs.
/// @ingroup algo_pipeline
struct ScheduleRequest {
    core::TimePoint horizon_start{};                 ///< "Now".
    core::Duration slot_length{};                    ///< Length of one slot.
    std::vector<core::ActivePeriod> active_periods;  ///< When work may happen.
    core::BreakPattern breaks{};                     ///< Optional work/break rhythm.
    std::vector<core::Task> tasks;                   ///< Tasks to place.
    core::PriorityOrder priority_order{core::PriorityOrder::HigherIsFavored};
    std::optional<uint32_t> seed;                    ///< Shuffle seed; drawn when absent.

    /// Layout search in place of the single shuffle.
    std::optional<LayoutStrategy> strategy;
    std::size_t strategy_attempts{100};
    std::optional<std::chrono::milliseconds> strategy_time_budget;
};

/// @brief One slot of the result.
/// @ingroup algo_pipeline
struct SlotAssignment {
    core::Slot slot;
    std::optional<std::size_t> task;  ///< Position in ScheduleResult::tasks, or empty.
};

/// @brief Final state of one task, in request order.
/// @ingroup algo_pipeline
struct TaskOutcome {
    core::TaskId id;
    std::string name;
    core::TaskStatus status{core::TaskStatus::Unsatisfied};
    std::size_t duration{0};
    std::size_t shortfall{0};
    std::vector<core::SlotIndex> slots;  ///< Held slots, ascending.
};

/// @brief Counters gathered across the phases.
/// @ingroup algo_pipeline
struct ScheduleStats {
    std::size_t claims{0};
    std::size_t captures{0};
    std::size_t triage_passes{0};
    std::size_t swaps{0};
};

/// @brief Output of schedule().
/// @ingroup algo_pipeline
struct ScheduleResult {
    uint32_t seed{0};                         ///< Seed actually used.
    ScheduleStats stats;
    std::vector<SlotAssignment> slots;
    std::vector<TaskOutcome> tasks;
    std::optional<LayoutStrategy> strategy;   ///< Set when a layout search ran.
    double layout_score{0.0};                 ///< Score of the retained layout.

    /// @brief Tasks that ended Unschedulable, in request order.
    [[nodiscard]] std::vector<const TaskOutcome*> unschedulable() const;
};

/// @brief Reject a request that cannot be scheduled at all.
///
/// Checks every task (non-empty unique id, duration >= 1, due not before
/// start), the task set (not empty), the slot length (positive) and the
/// layout search (at least one attempt). Active periods are checked by
/// core::slice().
///
/// @param request Request to check.
/// @throws core::ValidationError describing the first problem found.
void validate(const ScheduleRequest& request);

/// @brief Run the full pipeline: slice, resolve windows, claim, triage, shuffle.
/// @ingroup algo_pipeline
///
/// The horizon runs from `request.horizon_start` to the latest due date.
/// The board is verified after every phase.
///
/// @par Example
/// @code
/// algo::ScheduleRequest request;
/// request.horizon_start = core::time_from_seconds(0);
/// request.slot_length = core::duration_from_minutes(25);
/// request.active_periods = {{core::time_from_seconds(0), core::time_from_seconds(36000)}};
/// request.tasks.emplace_back("essay", 4, core::time_from_seconds(0),
///                            core::time_from_seconds(36000), 3);
/// request.seed = 42;
/// auto result = algo::schedule(request);
/// @endcode
///
/// @param request Immutable run input.
/// @param writer  Optional trace writer (not owned).
/// @return Slot assignment, per-task outcomes and statistics.
/// @throws core::ValidationError if the request is rejected.
/// @throws core::InvariantViolation on an internal inconsistency.
ScheduleResult schedule(const ScheduleRequest& request, core::TraceWriter* writer = nullptr);

} // namespace slotsched::algo
