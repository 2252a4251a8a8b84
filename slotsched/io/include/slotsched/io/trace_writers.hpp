#pragma once

/// @file trace_writers.hpp
/// @brief Trace sinks: discard, JSON array, in-memory records, aligned text.
/// @ingroup io_writers

#include <slotsched/core/trace_writer.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace slotsched::io {

/// @brief Discards every event. Used to measure tracing overhead.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(uint64_t /*sequence*/) override {}
    void type(std::string_view /*name*/) override {}
    void field(std::string_view /*key*/, double /*value*/) override {}
    void field(std::string_view /*key*/, uint64_t /*value*/) override {}
    void field(std::string_view /*key*/, std::string_view /*value*/) override {}
    void end() override {}
};

/// @brief Streams the run as one JSON array, one object per line.
///
/// @code
/// [
///   {"seq": 0, "type": "slot_claimed", "task": "essay", "slot": 3},
///   {"seq": 1, "type": "triage_pass", "pass": 1, "captures": 0}
/// ]
/// @endcode
///
/// The opening bracket is written on construction and the closing one by
/// finalize() or, failing that, by the destructor.
///
/// @ingroup io_writers
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream; must outlive the writer.
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(uint64_t sequence) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    /// String values are JSON-escaped.
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the array. Later calls do nothing.
    void finalize();

    [[nodiscard]] std::size_t records_written() const noexcept { return records_; }

private:
    void write_key(std::string_view key);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::size_t records_{0};
    bool closed_{false};
};

/// @brief One buffered event.
/// @ingroup io_writers
struct TraceRecord {
    using Value = std::variant<double, uint64_t, std::string>;

    uint64_t sequence{0};
    std::string type;
    std::unordered_map<std::string, Value> fields;
};

/// @brief Keeps every event in memory so tests can inspect the run.
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(uint64_t sequence) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Copies of the records named @p type, in emission order.
    [[nodiscard]] std::vector<TraceRecord> records_of(std::string_view type) const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord pending_;
};

/// @brief One aligned line per event, for reading a run in a terminal.
///
/// @code
/// [      12]        slot_captured: task = A, slot = 5
/// @endcode
///
/// With colour enabled the event name is tinted by phase: claim green,
/// triage yellow, tasks given up red, shuffle and layout search cyan.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @param output         Destination stream; must outlive the writer.
    /// @param color_enabled  Emit ANSI colour codes around event names.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(uint64_t sequence) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;

    /// @brief Write the assembled line.
    void end() override;

private:
    void append_field(std::string_view key, std::string_view value);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    uint64_t sequence_{0};
    std::string event_;
    std::string fields_;
};

} // namespace slotsched::io
