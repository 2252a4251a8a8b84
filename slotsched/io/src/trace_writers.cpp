#include <slotsched/io/trace_writers.hpp>

#include <array>
#include <iomanip>
#include <sstream>
#include <utility>

namespace slotsched::io {

namespace {

constexpr std::string_view kReset = "\033[0m";

std::string_view phase_color(std::string_view event) {
    if (event == "slot_claimed" || event == "claim_shortfall") {
        return "\033[32m";
    }
    if (event == "slot_captured" || event == "triage_pass") {
        return "\033[33m";
    }
    if (event == "task_unschedulable") {
        return "\033[31m";
    }
    if (event == "slots_swapped" || event == "layout_selected") {
        return "\033[36m";
    }
    return kReset;
}

void append_json_escaped(std::string& out, std::string_view text) {
    static constexpr std::array<char, 16> hex{'0', '1', '2', '3', '4', '5', '6', '7',
                                              '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    for (char ch : text) {
        switch (ch) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default: {
                const auto code = static_cast<unsigned char>(ch);
                if (code < 0x20) {
                    out += "\\u00";
                    out += hex[code >> 4U];
                    out += hex[code & 0x0FU];
                } else {
                    out += ch;
                }
            }
        }
    }
}

std::string format_double(double value, int precision) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << value;
    return oss.str();
}

} // anonymous namespace

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output) {
    output_ << "[\n";
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(uint64_t sequence) {
    if (records_ > 0) {
        output_ << ",\n";
    }
    ++records_;
    output_ << "  {\"seq\": " << sequence;
}

void JsonTraceWriter::write_key(std::string_view key) {
    output_ << ", \"" << key << "\": ";
}

void JsonTraceWriter::type(std::string_view name) {
    write_key("type");
    output_ << '"' << name << '"';
}

void JsonTraceWriter::field(std::string_view key, double value) {
    write_key(key);
    output_ << format_double(value, 15);
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    write_key(key);
    output_ << value;
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    std::string quoted{"\""};
    append_json_escaped(quoted, value);
    quoted += '"';
    write_key(key);
    output_ << quoted;
}

void JsonTraceWriter::end() {
    output_ << '}';
}

void JsonTraceWriter::finalize() {
    if (closed_) {
        return;
    }
    closed_ = true;
    output_ << (records_ > 0 ? "\n]\n" : "]\n");
    output_.flush();
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(uint64_t sequence) {
    pending_ = TraceRecord{};
    pending_.sequence = sequence;
}

void MemoryTraceWriter::type(std::string_view name) {
    pending_.type.assign(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    pending_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    pending_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    pending_.fields.insert_or_assign(std::string(key), std::string(value));
}

void MemoryTraceWriter::end() {
    records_.push_back(std::exchange(pending_, TraceRecord{}));
}

std::vector<TraceRecord> MemoryTraceWriter::records_of(std::string_view type) const {
    std::vector<TraceRecord> matching;
    for (const auto& record : records_) {
        if (record.type == type) {
            matching.push_back(record);
        }
    }
    return matching;
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(uint64_t sequence) {
    sequence_ = sequence;
    event_.clear();
    fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    event_.assign(name);
}

void TextualTraceWriter::append_field(std::string_view key, std::string_view value) {
    if (!fields_.empty()) {
        fields_ += ',';
    }
    fields_ += ' ';
    fields_ += key;
    fields_ += " = ";
    fields_ += value;
}

void TextualTraceWriter::field(std::string_view key, double value) {
    append_field(key, format_double(value, 10));
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    append_field(key, std::to_string(value));
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    append_field(key, value);
}

void TextualTraceWriter::end() {
    output_ << '[' << std::setw(8) << sequence_ << "] ";
    if (color_enabled_) {
        output_ << phase_color(event_) << std::setw(20) << std::right << event_ << kReset;
    } else {
        output_ << std::setw(20) << std::right << event_;
    }
    output_ << ':' << fields_ << '\n';
}

} // namespace slotsched::io
