#pragma once

#include <slotsched/core/slot_sequence.hpp>
#include <slotsched/core/types.hpp>

#include <cstddef>
#include <initializer_list>
#include <span>
#include <vector>

namespace slotsched::core {

/// @brief Ordered set of slot indices a task may occupy.
/// @ingroup core
///
/// Produced by resolve_working_period() from a task's start and due dates,
/// or built directly from indices when a caller has already resolved the
/// window. Indices are kept sorted and unique; the set may be empty and may
/// be non-contiguous in time (spanning a gap between active periods).
class WorkingPeriod {
public:
    WorkingPeriod() = default;

    /// @brief Build from arbitrary indices (sorted and de-duplicated).
    /// @param slots Slot indices.
    explicit WorkingPeriod(std::vector<SlotIndex> slots);

    WorkingPeriod(std::initializer_list<SlotIndex> slots);

    /// @brief Build the contiguous range `[first, last]`.
    /// @param first First slot index.
    /// @param last  Last slot index (inclusive).
    /// @return Working period covering every index in the range.
    static WorkingPeriod range(SlotIndex first, SlotIndex last);

    [[nodiscard]] std::size_t size() const noexcept { return slots_.size(); }
    [[nodiscard]] bool empty() const noexcept { return slots_.empty(); }

    /// @brief Test membership in O(log n).
    /// @param slot Slot index.
    /// @return True if a task with this working period may occupy @p slot.
    [[nodiscard]] bool contains(SlotIndex slot) const noexcept;

    [[nodiscard]] std::span<const SlotIndex> slots() const noexcept { return slots_; }
    [[nodiscard]] auto begin() const noexcept { return slots_.begin(); }
    [[nodiscard]] auto end() const noexcept { return slots_.end(); }

    bool operator==(const WorkingPeriod&) const = default;

private:
    std::vector<SlotIndex> slots_;
};

/// @brief Resolve a task window against the slot sequence.
///
/// A slot belongs to the working period when it lies wholly inside
/// `[start, due]`: `slot.start >= start` and `slot.end <= due`. The slot
/// sequence never extends before the horizon start, so the lower bound is
/// effectively `max(now, start)`.
///
/// @param slots Slot sequence from slice().
/// @param start Earliest start of the task.
/// @param due   Due date of the task.
/// @return The (possibly empty) working period.
WorkingPeriod resolve_working_period(const SlotSequence& slots, TimePoint start, TimePoint due);

} // namespace slotsched::core
