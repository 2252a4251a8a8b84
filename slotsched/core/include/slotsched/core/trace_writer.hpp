#pragma once

#include <cstdint>
#include <string_view>

namespace slotsched::core {

/// @brief Sink for the events of one scheduling run.
/// @ingroup core
///
/// Every state change on a Board (a claim, a capture, a swap, a task given
/// up) becomes one record. A record is streamed in four steps so that writers
/// never allocate an intermediate event object:
///
/// @code
/// w.begin(seq);                 // numbered in emission order
/// w.type("slot_captured");
/// w.field("task", "essay");     // any number of fields
/// w.field("slot", uint64_t{5});
/// w.end();
/// @endcode
///
/// Sequence numbers run across all phases of a run (claim, triage, shuffle,
/// layout search) without gaps. Installing no writer costs one pointer test
/// per event.
///
/// @see Board::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Open a record.
    virtual void begin(uint64_t sequence) = 0;

    /// @brief Event name, e.g. `"slot_claimed"` or `"task_unschedulable"`.
    virtual void type(std::string_view name) = 0;

    virtual void field(std::string_view key, double value) = 0;
    virtual void field(std::string_view key, uint64_t value) = 0;
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief Close the record opened by begin().
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace slotsched::core
