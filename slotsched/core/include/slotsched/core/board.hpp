#pragma once

#include <slotsched/core/trace_writer.hpp>
#include <slotsched/core/types.hpp>
#include <slotsched/core/working_period.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace slotsched::core {

/// @brief Satisfaction state of a task on the board.
/// @ingroup core
enum class TaskStatus {
    Unsatisfied,   ///< Holds fewer slots than its duration; still contending.
    Satisfied,     ///< Holds exactly its duration.
    Unschedulable  ///< Gave up: empty working period, or short after triage.
};

/// @brief Lower-case name of a status (`"satisfied"`, ...).
/// @param status Status to name.
/// @return Static string.
[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;

/// @brief Mutable slot occupancy and per-task counters for one scheduling run.
/// @ingroup core
///
/// The Board is the only mutable state of a run. Every phase (claim, triage,
/// shuffle) works through its three mutators, claim(), capture() and swap(),
/// each of which refuses any move that would break an invariant:
///
///   - a slot is held by at most one task;
///   - a task only holds slots of its own working period;
///   - a task never holds more slots than its duration;
///   - `Satisfied` if and only if `claimed == duration`.
///
/// Refusals throw InvariantViolation: reaching one means the calling
/// algorithm is wrong, not the input.
///
/// Tasks are addressed by TaskRef, their insertion position.
///
/// @see TaskStatus, TraceWriter
class Board {
public:
    /// @brief Position of a task on the board (insertion order, 0-based).
    using TaskRef = std::size_t;

    /// @brief Create an empty board.
    /// @param slot_count Number of slots in the horizon.
    explicit Board(std::size_t slot_count);

    /// @brief Register a task.
    ///
    /// A task with an empty working period starts (and stays) Unschedulable.
    ///
    /// @param id             Task identifier.
    /// @param duration       Required slot count (>= 1).
    /// @param priority       Contention priority.
    /// @param working_period Slots the task may occupy (all < slot_count()).
    /// @return Reference used by every other accessor.
    /// @throws ValidationError if @p duration is zero or the working period
    ///         names a slot beyond the board.
    TaskRef add_task(TaskId id, std::size_t duration, Priority priority,
                     WorkingPeriod working_period);

    [[nodiscard]] std::size_t slot_count() const noexcept { return occupancy_.size(); }
    [[nodiscard]] std::size_t task_count() const noexcept { return tasks_.size(); }

    [[nodiscard]] const TaskId& id(TaskRef task) const { return entry(task).id; }
    [[nodiscard]] std::size_t duration(TaskRef task) const { return entry(task).duration; }
    [[nodiscard]] Priority priority(TaskRef task) const { return entry(task).priority; }
    [[nodiscard]] const WorkingPeriod& working_period(TaskRef task) const {
        return entry(task).working_period;
    }
    [[nodiscard]] std::size_t claimed(TaskRef task) const { return entry(task).claimed; }
    [[nodiscard]] TaskStatus status(TaskRef task) const { return entry(task).status; }

    /// @brief Slots still missing for @p task.
    /// @return `duration - claimed`.
    [[nodiscard]] std::size_t shortfall(TaskRef task) const {
        return entry(task).duration - entry(task).claimed;
    }

    /// @brief Task holding @p slot, if any.
    /// @param slot Slot index (< slot_count()).
    /// @return The holder, or std::nullopt for an empty slot.
    [[nodiscard]] std::optional<TaskRef> holder(SlotIndex slot) const;

    [[nodiscard]] bool is_free(SlotIndex slot) const { return !holder(slot).has_value(); }

    /// @brief Give an empty slot to a task.
    /// @throws InvariantViolation if the slot is held, outside the task's
    ///         working period, or the task is already complete.
    void claim(SlotIndex slot, TaskRef task);

    /// @brief Move a slot to a task, evicting the current holder if any.
    ///
    /// Exactly one slot changes hands; the evicted task loses one slot and
    /// becomes Unsatisfied.
    ///
    /// @return The evicted task, or std::nullopt if the slot was empty.
    /// @throws InvariantViolation if the slot is outside the task's working
    ///         period, already held by the task, or the task is complete.
    std::optional<TaskRef> capture(SlotIndex slot, TaskRef task);

    /// @brief Exchange the contents of two slots.
    /// @throws InvariantViolation if either occupant would leave its
    ///         working period.
    void swap(SlotIndex lhs, SlotIndex rhs);

    /// @brief Give up on an incomplete task; it keeps the slots it holds.
    /// @throws InvariantViolation if the task is already satisfied.
    void mark_unschedulable(TaskRef task);

    /// @brief Slots held by @p task, in slot order.
    [[nodiscard]] std::vector<SlotIndex> held_slots(TaskRef task) const;

    /// @brief Number of occupied slots.
    [[nodiscard]] std::size_t total_claimed() const noexcept { return total_claimed_; }

    /// @brief Recompute every counter from the occupancy and compare.
    /// @throws InvariantViolation on the first inconsistency found.
    void verify() const;

    /// @brief Set the trace writer for scheduling event logging.
    ///
    /// Pass nullptr to disable tracing. The writer is not owned.
    ///
    /// @param writer Pointer to a TraceWriter, or nullptr.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    [[nodiscard]] TraceWriter* trace_writer() const noexcept { return trace_writer_; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    ///
    /// Wraps the callback between begin()/end() with the next sequence
    /// number.
    ///
    /// @tparam F Callable with signature void(TraceWriter&).
    /// @param func Callback that writes trace data.
    template<typename F>
    void trace(F&& func);

private:
    struct Entry {
        TaskId id;
        std::size_t duration;
        Priority priority;
        WorkingPeriod working_period;
        std::size_t claimed{0};
        TaskStatus status{TaskStatus::Unsatisfied};
    };

    const Entry& entry(TaskRef task) const;
    Entry& entry(TaskRef task);
    void check_slot(SlotIndex slot) const;

    std::vector<std::optional<TaskRef>> occupancy_;
    std::vector<Entry> tasks_;
    std::size_t total_claimed_{0};
    TraceWriter* trace_writer_{nullptr};
    uint64_t next_sequence_{0};
};

template<typename F>
void Board::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(next_sequence_++);
        std::forward<F>(func)(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace slotsched::core
