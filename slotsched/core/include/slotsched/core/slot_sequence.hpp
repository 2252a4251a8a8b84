#pragma once

#include <slotsched/core/types.hpp>

#include <cstddef>
#include <span>
#include <vector>

namespace slotsched::core {

/// @brief One indivisible unit of schedulable time.
/// @ingroup core
struct Slot {
    SlotIndex index{};  ///< Position in the horizon.
    TimePoint start{};  ///< Inclusive start.
    TimePoint end{};    ///< Exclusive end.

    constexpr bool operator==(const Slot&) const = default;
};

/// @brief Ordered, gap-tolerant sequence of slots produced by slice().
/// @ingroup core
///
/// Slots are sorted by start time and indexed 0..size()-1. Consecutive
/// slots may be separated by gaps (breaks, nights, inactive time) but never
/// overlap.
///
/// @see slice
class SlotSequence {
public:
    SlotSequence() = default;

    /// @brief Wrap an already ordered slot list.
    /// @param slots       Slots with `slots[i].index == i`, sorted by start.
    /// @param slot_length Common length of every slot.
    SlotSequence(std::vector<Slot> slots, Duration slot_length);

    [[nodiscard]] std::size_t size() const noexcept { return slots_.size(); }
    [[nodiscard]] bool empty() const noexcept { return slots_.empty(); }
    [[nodiscard]] Duration slot_length() const noexcept { return slot_length_; }

    [[nodiscard]] const Slot& operator[](SlotIndex index) const noexcept { return slots_[index]; }

    /// @brief Bounds-checked access.
    /// @throws std::out_of_range if @p index >= size().
    [[nodiscard]] const Slot& at(SlotIndex index) const { return slots_.at(index); }

    [[nodiscard]] std::span<const Slot> slots() const noexcept { return slots_; }

    [[nodiscard]] auto begin() const noexcept { return slots_.begin(); }
    [[nodiscard]] auto end() const noexcept { return slots_.end(); }

    /// @brief Index of the first slot starting at or after @p time.
    /// @param time Lower bound.
    /// @return A slot index, or size() if every slot starts earlier.
    [[nodiscard]] SlotIndex first_starting_at_or_after(TimePoint time) const noexcept;

private:
    std::vector<Slot> slots_;
    Duration slot_length_{};
};

} // namespace slotsched::core
