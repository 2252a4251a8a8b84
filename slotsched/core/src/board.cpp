#include <slotsched/core/board.hpp>
#include <slotsched/core/error.hpp>

#include <string>

namespace slotsched::core {

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Unsatisfied:   return "unsatisfied";
        case TaskStatus::Satisfied:     return "satisfied";
        case TaskStatus::Unschedulable: return "unschedulable";
    }
    return "unknown";
}

Board::Board(std::size_t slot_count)
    : occupancy_(slot_count) {}

Board::TaskRef Board::add_task(TaskId id, std::size_t duration, Priority priority,
                               WorkingPeriod working_period) {
    if (duration == 0) {
        throw ValidationError("task '" + id + "': duration must be at least one slot");
    }
    if (!working_period.empty() && working_period.slots().back() >= slot_count()) {
        throw ValidationError("task '" + id + "': working period exceeds the slot sequence");
    }

    Entry entry{std::move(id), duration, priority, std::move(working_period)};
    if (entry.working_period.empty()) {
        entry.status = TaskStatus::Unschedulable;
    }
    tasks_.push_back(std::move(entry));
    return tasks_.size() - 1;
}

const Board::Entry& Board::entry(TaskRef task) const {
    if (task >= tasks_.size()) {
        throw InvariantViolation("unknown task reference " + std::to_string(task));
    }
    return tasks_[task];
}

Board::Entry& Board::entry(TaskRef task) {
    if (task >= tasks_.size()) {
        throw InvariantViolation("unknown task reference " + std::to_string(task));
    }
    return tasks_[task];
}

void Board::check_slot(SlotIndex slot) const {
    if (slot >= occupancy_.size()) {
        throw InvariantViolation("slot " + std::to_string(slot) + " is beyond the board");
    }
}

std::optional<Board::TaskRef> Board::holder(SlotIndex slot) const {
    check_slot(slot);
    return occupancy_[slot];
}

void Board::claim(SlotIndex slot, TaskRef task) {
    check_slot(slot);
    Entry& claimer = entry(task);

    if (occupancy_[slot]) {
        throw InvariantViolation("slot " + std::to_string(slot) + " claimed by '" + claimer.id +
                                 "' is already held by '" + tasks_[*occupancy_[slot]].id + "'");
    }
    if (!claimer.working_period.contains(slot)) {
        throw InvariantViolation("slot " + std::to_string(slot) +
                                 " is outside the working period of '" + claimer.id + "'");
    }
    if (claimer.claimed >= claimer.duration) {
        throw InvariantViolation("task '" + claimer.id + "' already holds its full duration");
    }

    occupancy_[slot] = task;
    ++claimer.claimed;
    ++total_claimed_;
    if (claimer.claimed == claimer.duration) {
        claimer.status = TaskStatus::Satisfied;
    }
}

std::optional<Board::TaskRef> Board::capture(SlotIndex slot, TaskRef task) {
    check_slot(slot);
    Entry& capturer = entry(task);
    const std::optional<TaskRef> victim = occupancy_[slot];

    if (victim == task) {
        throw InvariantViolation("task '" + capturer.id + "' already holds slot " +
                                 std::to_string(slot));
    }
    if (!capturer.working_period.contains(slot)) {
        throw InvariantViolation("slot " + std::to_string(slot) +
                                 " is outside the working period of '" + capturer.id + "'");
    }
    if (capturer.claimed >= capturer.duration) {
        throw InvariantViolation("task '" + capturer.id + "' already holds its full duration");
    }

    if (victim) {
        Entry& evicted = tasks_[*victim];
        --evicted.claimed;
        evicted.status = TaskStatus::Unsatisfied;
    } else {
        ++total_claimed_;
    }

    occupancy_[slot] = task;
    ++capturer.claimed;
    if (capturer.claimed == capturer.duration) {
        capturer.status = TaskStatus::Satisfied;
    }
    return victim;
}

void Board::swap(SlotIndex lhs, SlotIndex rhs) {
    check_slot(lhs);
    check_slot(rhs);
    if (lhs == rhs) {
        return;
    }

    const auto left = occupancy_[lhs];
    const auto right = occupancy_[rhs];
    if (left && !tasks_[*left].working_period.contains(rhs)) {
        throw InvariantViolation("swap would move '" + tasks_[*left].id + "' to slot " +
                                 std::to_string(rhs) + " outside its working period");
    }
    if (right && !tasks_[*right].working_period.contains(lhs)) {
        throw InvariantViolation("swap would move '" + tasks_[*right].id + "' to slot " +
                                 std::to_string(lhs) + " outside its working period");
    }

    occupancy_[lhs] = right;
    occupancy_[rhs] = left;
}

void Board::mark_unschedulable(TaskRef task) {
    Entry& target = entry(task);
    if (target.claimed == target.duration) {
        throw InvariantViolation("task '" + target.id + "' is satisfied and cannot be unschedulable");
    }
    target.status = TaskStatus::Unschedulable;
}

std::vector<SlotIndex> Board::held_slots(TaskRef task) const {
    entry(task);
    std::vector<SlotIndex> slots;
    for (SlotIndex slot = 0; slot < occupancy_.size(); ++slot) {
        if (occupancy_[slot] == task) {
            slots.push_back(slot);
        }
    }
    return slots;
}

void Board::verify() const {
    std::vector<std::size_t> counts(tasks_.size(), 0);
    std::size_t total = 0;

    for (SlotIndex slot = 0; slot < occupancy_.size(); ++slot) {
        if (!occupancy_[slot]) {
            continue;
        }
        const TaskRef task = *occupancy_[slot];
        if (task >= tasks_.size()) {
            throw InvariantViolation("slot " + std::to_string(slot) + " held by unknown task");
        }
        if (!tasks_[task].working_period.contains(slot)) {
            throw InvariantViolation("slot " + std::to_string(slot) + " held by '" +
                                     tasks_[task].id + "' outside its working period");
        }
        ++counts[task];
        ++total;
    }

    if (total != total_claimed_) {
        throw InvariantViolation("occupied slot count " + std::to_string(total) +
                                 " differs from tracked total " + std::to_string(total_claimed_));
    }

    for (TaskRef task = 0; task < tasks_.size(); ++task) {
        const Entry& e = tasks_[task];
        if (counts[task] != e.claimed) {
            throw InvariantViolation("task '" + e.id + "' holds " + std::to_string(counts[task]) +
                                     " slots but counts " + std::to_string(e.claimed));
        }
        if (e.claimed > e.duration) {
            throw InvariantViolation("task '" + e.id + "' holds more slots than its duration");
        }
        if ((e.status == TaskStatus::Satisfied) != (e.claimed == e.duration)) {
            throw InvariantViolation("task '" + e.id + "' status does not match its claimed count");
        }
    }
}

} // namespace slotsched::core
