#include <slotsched/algo/claim_engine.hpp>

#include <algorithm>
#include <cstdint>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace slotsched::algo {

using core::Board;
using core::TaskStatus;

std::vector<Board::TaskRef> claim_order(const Board& board) {
    std::vector<Board::TaskRef> order;
    order.reserve(board.task_count());
    for (Board::TaskRef task = 0; task < board.task_count(); ++task) {
        if (board.status(task) != TaskStatus::Unschedulable && !board.working_period(task).empty()) {
            order.push_back(task);
        }
    }

    std::stable_sort(order.begin(), order.end(), [&board](Board::TaskRef lhs, Board::TaskRef rhs) {
        const auto lsize = board.working_period(lhs).size();
        const auto rsize = board.working_period(rhs).size();
        if (lsize != rsize) {
            return lsize < rsize;
        }
        if (board.id(lhs) != board.id(rhs)) {
            return board.id(lhs) < board.id(rhs);
        }
        return lhs < rhs;
    });
    return order;
}

ClaimReport claim_slots(Board& board) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    ClaimReport report;

    for (Board::TaskRef task : claim_order(board)) {
        for (core::SlotIndex slot : board.working_period(task)) {
            if (board.claimed(task) == board.duration(task)) {
                break;
            }
            if (!board.is_free(slot)) {
                continue;
            }
            board.claim(slot, task);
            ++report.claims;
            board.trace([&](core::TraceWriter& w) {
                w.type("slot_claimed");
                w.field("task", board.id(task));
                w.field("slot", static_cast<uint64_t>(slot));
            });
        }

        if (board.status(task) != TaskStatus::Satisfied) {
            report.unsatisfied.push_back(task);
            board.trace([&](core::TraceWriter& w) {
                w.type("claim_shortfall");
                w.field("task", board.id(task));
                w.field("shortfall", static_cast<uint64_t>(board.shortfall(task)));
            });
        }
    }

    return report;
}

} // namespace slotsched::algo
