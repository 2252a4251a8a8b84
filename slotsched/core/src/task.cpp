#include <slotsched/core/task.hpp>

#include <utility>

namespace slotsched::core {

Task::Task(TaskId id, int64_t duration, TimePoint start, TimePoint due, Priority priority)
    : id_(std::move(id))
    , duration_(duration)
    , start_(start)
    , due_(due)
    , priority_(priority) {}

} // namespace slotsched::core
