#include <slotsched/core/working_period.hpp>

#include <algorithm>
#include <utility>

namespace slotsched::core {

WorkingPeriod::WorkingPeriod(std::vector<SlotIndex> slots)
    : slots_(std::move(slots)) {
    std::sort(slots_.begin(), slots_.end());
    slots_.erase(std::unique(slots_.begin(), slots_.end()), slots_.end());
}

WorkingPeriod::WorkingPeriod(std::initializer_list<SlotIndex> slots)
    : WorkingPeriod(std::vector<SlotIndex>(slots)) {}

WorkingPeriod WorkingPeriod::range(SlotIndex first, SlotIndex last) {
    std::vector<SlotIndex> slots;
    if (first <= last) {
        slots.reserve(last - first + 1);
        for (SlotIndex idx = first; idx <= last; ++idx) {
            slots.push_back(idx);
        }
    }
    return WorkingPeriod(std::move(slots));
}

bool WorkingPeriod::contains(SlotIndex slot) const noexcept {
    return std::binary_search(slots_.begin(), slots_.end(), slot);
}

WorkingPeriod resolve_working_period(const SlotSequence& slots, TimePoint start, TimePoint due) {
    std::vector<SlotIndex> indices;
    for (SlotIndex idx = slots.first_starting_at_or_after(start); idx < slots.size(); ++idx) {
        if (slots[idx].end > due) {
            break;
        }
        indices.push_back(idx);
    }
    return WorkingPeriod(std::move(indices));
}

} // namespace slotsched::core
