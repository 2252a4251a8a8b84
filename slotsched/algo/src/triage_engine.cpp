#include <slotsched/algo/triage_engine.hpp>

#include <slotsched/core/error.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace slotsched::algo {

using core::Board;
using core::SlotIndex;
using core::TaskStatus;

TriageEngine::TriageEngine(core::PriorityOrder order)
    : order_(order) {}

std::size_t TriageEngine::pass_limit(const Board& board) {
    std::set<core::Priority> levels;
    for (Board::TaskRef task = 0; task < board.task_count(); ++task) {
        levels.insert(board.priority(task));
    }
    return board.slot_count() * levels.size() + 1;
}

std::vector<Board::TaskRef> TriageEngine::deficient_tasks(const Board& board) const {
    std::vector<Board::TaskRef> tasks;
    for (Board::TaskRef task = 0; task < board.task_count(); ++task) {
        if (board.claimed(task) < board.duration(task) && !board.working_period(task).empty()) {
            tasks.push_back(task);
        }
    }

    // Least favored first
    std::stable_sort(tasks.begin(), tasks.end(), [&](Board::TaskRef lhs, Board::TaskRef rhs) {
        const auto lprio = board.priority(lhs);
        const auto rprio = board.priority(rhs);
        if (lprio != rprio) {
            return core::is_more_favored(rprio, lprio, order_);
        }
        return board.id(lhs) < board.id(rhs);
    });
    return tasks;
}

std::size_t TriageEngine::serve(Board& board, Board::TaskRef task, TriageReport& report) const {
    const core::Priority own = board.priority(task);

    std::vector<SlotIndex> free_slots;
    std::vector<SlotIndex> held_slots;
    for (SlotIndex slot : board.working_period(task)) {
        const auto holder = board.holder(slot);
        if (!holder) {
            free_slots.push_back(slot);
        } else if (*holder != task && core::is_more_favored(own, board.priority(*holder), order_)) {
            held_slots.push_back(slot);
        }
    }
    std::stable_sort(held_slots.begin(), held_slots.end(), [&](SlotIndex lhs, SlotIndex rhs) {
        return core::is_more_favored(board.priority(*board.holder(rhs)),
                                     board.priority(*board.holder(lhs)), order_);
    });

    std::vector<SlotIndex> targets = std::move(free_slots);
    targets.insert(targets.end(), held_slots.begin(), held_slots.end());

    std::size_t captures = 0;
    for (SlotIndex slot : targets) {
        if (board.claimed(task) == board.duration(task)) {
            break;
        }
        const std::optional<Board::TaskRef> victim = board.capture(slot, task);
        ++captures;
        if (!victim) {
            ++report.captures_from_empty;
        }
        board.trace([&](core::TraceWriter& w) {
            w.type("slot_captured");
            w.field("task", board.id(task));
            w.field("slot", static_cast<uint64_t>(slot));
            w.field("victim", victim ? std::string_view{board.id(*victim)} : std::string_view{});
        });
    }
    return captures;
}

TriageReport TriageEngine::run(Board& board) const {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    TriageReport report;
    const std::size_t limit = pass_limit(board);

    while (true) {
        if (++report.passes > limit) {
            throw core::InvariantViolation("triage did not reach a fixpoint within " +
                                           std::to_string(limit) + " passes");
        }

        std::size_t pass_captures = 0;
        // Tasks evicted during this pass wait for the next one
        for (Board::TaskRef task : deficient_tasks(board)) {
            pass_captures += serve(board, task, report);
        }
        report.captures += pass_captures;

        board.trace([&](core::TraceWriter& w) {
            w.type("triage_pass");
            w.field("pass", static_cast<uint64_t>(report.passes));
            w.field("captures", static_cast<uint64_t>(pass_captures));
        });

        if (pass_captures == 0) {
            break;
        }
    }

    for (Board::TaskRef task = 0; task < board.task_count(); ++task) {
        if (board.claimed(task) == board.duration(task) || board.working_period(task).empty()) {
            continue;
        }
        report.unschedulable.push_back(task);
        if (board.status(task) == TaskStatus::Unschedulable) {
            continue;
        }
        board.mark_unschedulable(task);
        board.trace([&](core::TraceWriter& w) {
            w.type("task_unschedulable");
            w.field("task", board.id(task));
            w.field("shortfall", static_cast<uint64_t>(board.shortfall(task)));
            w.field("reason", "outranked");
        });
    }

    return report;
}

} // namespace slotsched::algo
