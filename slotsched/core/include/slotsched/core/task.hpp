#pragma once

#include <slotsched/core/types.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace slotsched::core {

/// @brief A pending piece of work to place on the slot sequence.
/// @ingroup core
///
/// Tasks are part of the caller's immutable snapshot: the scheduler reads
/// them but never modifies them. Per-run state (claimed slots, status) lives
/// on the Board.
///
/// The duration is kept signed so that a bad input (zero or negative) can be
/// represented and rejected by validation rather than wrapped silently.
///
/// @see Board, slotsched::algo::validate
class Task {
public:
    /// @brief Construct a new Task.
    /// @param id        Unique identifier.
    /// @param duration  Required number of slots (must be >= 1 to schedule).
    /// @param start     Earliest time work may begin.
    /// @param due       Time by which work must be finished.
    /// @param priority  Contention priority, see PriorityOrder.
    Task(TaskId id, int64_t duration, TimePoint start, TimePoint due, Priority priority);

    [[nodiscard]] const TaskId& id() const noexcept { return id_; }

    /// @brief Human-friendly name, falling back to the identifier.
    /// @return The name set with set_name(), or id() when none was set.
    [[nodiscard]] const std::string& name() const noexcept { return name_.empty() ? id_ : name_; }

    /// @brief Attach a display name.
    /// @param name Display name (empty clears it).
    void set_name(std::string name) { name_ = std::move(name); }

    /// @brief Get the required number of slots.
    /// @return Duration in slot units.
    [[nodiscard]] int64_t duration() const noexcept { return duration_; }

    [[nodiscard]] TimePoint start() const noexcept { return start_; }
    [[nodiscard]] TimePoint due() const noexcept { return due_; }
    [[nodiscard]] Priority priority() const noexcept { return priority_; }

private:
    TaskId id_;
    std::string name_;
    int64_t duration_;
    TimePoint start_;
    TimePoint due_;
    Priority priority_;
};

} // namespace slotsched::core
