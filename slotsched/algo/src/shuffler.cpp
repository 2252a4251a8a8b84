#include <slotsched/algo/shuffler.hpp>

#include <cstdint>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace slotsched::algo {

using core::Board;
using core::SlotIndex;

Shuffler::Shuffler(std::mt19937& rng)
    : rng_(rng) {}

std::vector<SlotIndex> Shuffler::candidates(const Board& board, SlotIndex slot) {
    std::vector<SlotIndex> result{slot};
    const auto occupant = board.holder(slot);

    for (SlotIndex other = slot + 1; other < board.slot_count(); ++other) {
        if (occupant && !board.working_period(*occupant).contains(other)) {
            continue;
        }
        const auto partner = board.holder(other);
        if (partner && !board.working_period(*partner).contains(slot)) {
            continue;
        }
        result.push_back(other);
    }
    return result;
}

ShuffleReport Shuffler::run(Board& board) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    ShuffleReport report;

    for (SlotIndex slot = 0; slot < board.slot_count(); ++slot) {
        const auto choices = candidates(board, slot);
        std::uniform_int_distribution<std::size_t> pick(0, choices.size() - 1);
        const SlotIndex other = choices[pick(rng_)];

        if (other == slot || board.holder(slot) == board.holder(other)) {
            continue;
        }
        board.swap(slot, other);
        ++report.swaps;
        board.trace([&](core::TraceWriter& w) {
            w.type("slots_swapped");
            w.field("left", static_cast<uint64_t>(slot));
            w.field("right", static_cast<uint64_t>(other));
        });
    }

    return report;
}

} // namespace slotsched::algo
