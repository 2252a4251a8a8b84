#include <slotsched/algo/schedule.hpp>

#include <slotsched/algo/claim_engine.hpp>
#include <slotsched/algo/shuffler.hpp>
#include <slotsched/algo/triage_engine.hpp>

#include <slotsched/core/error.hpp>
#include <slotsched/core/working_period.hpp>

#include <algorithm>
#include <random>
#include <unordered_set>
#include <utility>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace slotsched::algo {

using core::Board;

std::vector<const TaskOutcome*> ScheduleResult::unschedulable() const {
    std::vector<const TaskOutcome*> out;
    for (const auto& task : tasks) {
        if (task.status == core::TaskStatus::Unschedulable) {
            out.push_back(&task);
        }
    }
    return out;
}

void validate(const ScheduleRequest& request) {
    if (request.tasks.empty()) {
        throw core::ValidationError("no task to schedule");
    }
    if (request.slot_length <= core::Duration::zero()) {
        throw core::ValidationError("slot length must be positive");
    }
    if (request.strategy && request.strategy_attempts == 0) {
        throw core::ValidationError("layout search needs at least one attempt");
    }

    std::unordered_set<core::TaskId> seen;
    for (const auto& task : request.tasks) {
        if (task.id().empty()) {
            throw core::ValidationError("task with an empty id");
        }
        if (!seen.insert(task.id()).second) {
            throw core::ValidationError("duplicate task id '" + task.id() + "'");
        }
        if (task.duration() <= 0) {
            throw core::ValidationError("task '" + task.id() + "': duration must be at least one slot");
        }
        if (task.due() < task.start()) {
            throw core::ValidationError("task '" + task.id() + "': due date precedes start date");
        }
    }
}

ScheduleResult schedule(const ScheduleRequest& request, core::TraceWriter* writer) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    validate(request);

    const auto latest = std::max_element(
        request.tasks.begin(), request.tasks.end(),
        [](const core::Task& lhs, const core::Task& rhs) { return lhs.due() < rhs.due(); });
    const core::SlotSequence slots = core::slice(request.horizon_start, latest->due(),
                                                 request.active_periods, request.slot_length,
                                                 request.breaks);

    Board board(slots.size());
    board.set_trace_writer(writer);
    board.trace([&](core::TraceWriter& w) {
        w.type("slots_sliced");
        w.field("count", static_cast<uint64_t>(slots.size()));
    });

    for (const auto& task : request.tasks) {
        auto period = core::resolve_working_period(slots, task.start(), task.due());
        board.trace([&](core::TraceWriter& w) {
            w.type("window_resolved");
            w.field("task", task.id());
            w.field("slots", static_cast<uint64_t>(period.size()));
        });
        const bool empty_window = period.empty();
        const auto ref = board.add_task(task.id(), static_cast<std::size_t>(task.duration()),
                                        task.priority(), std::move(period));
        if (empty_window) {
            board.trace([&](core::TraceWriter& w) {
                w.type("task_unschedulable");
                w.field("task", task.id());
                w.field("shortfall", static_cast<uint64_t>(board.shortfall(ref)));
                w.field("reason", "empty_window");
            });
        }
    }

    ScheduleResult result;

    const ClaimReport claimed = claim_slots(board);
    board.verify();
    result.stats.claims = claimed.claims;

    const TriageReport triaged = TriageEngine(request.priority_order).run(board);
    board.verify();
    result.stats.captures = triaged.captures;
    result.stats.triage_passes = triaged.passes;

    result.seed = request.seed ? *request.seed : std::random_device{}();
    std::mt19937 rng(result.seed);
    result.stats.swaps = Shuffler(rng).run(board).swaps;
    if (request.strategy) {
        // Keeps the shuffled layout unless a candidate scores strictly higher
        const LayoutSearchReport searched =
            shuffle_maximizing(board, rng, *request.strategy, request.strategy_attempts,
                               request.strategy_time_budget);
        result.stats.swaps += searched.swaps;
        result.strategy = request.strategy;
        result.layout_score = searched.score;
    }
    board.verify();

    result.tasks.reserve(board.task_count());
    for (Board::TaskRef ref = 0; ref < board.task_count(); ++ref) {
        const core::Task& task = request.tasks[ref];
        result.tasks.push_back(TaskOutcome{task.id(), task.name(), board.status(ref),
                                           board.duration(ref), board.shortfall(ref),
                                           board.held_slots(ref)});
    }

    result.slots.reserve(slots.size());
    for (const auto& slot : slots) {
        result.slots.push_back(SlotAssignment{slot, board.holder(slot.index)});
    }

    return result;
}

} // namespace slotsched::algo
