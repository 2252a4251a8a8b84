#include <slotsched/core/slot_sequence.hpp>

#include <algorithm>
#include <utility>

namespace slotsched::core {

SlotSequence::SlotSequence(std::vector<Slot> slots, Duration slot_length)
    : slots_(std::move(slots))
    , slot_length_(slot_length) {}

SlotIndex SlotSequence::first_starting_at_or_after(TimePoint time) const noexcept {
    auto it = std::partition_point(slots_.begin(), slots_.end(),
        [time](const Slot& slot) { return slot.start < time; });
    return static_cast<SlotIndex>(it - slots_.begin());
}

} // namespace slotsched::core
