#include <slotsched/io/request_loader.hpp>
#include <slotsched/io/error.hpp>

#include <slotsched/core/error.hpp>
#include <slotsched/core/slicer.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace slotsched::io {

namespace {

using namespace slotsched::core;

const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

int64_t get_int64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    return member.GetInt64();
}

uint64_t get_uint64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

const rapidjson::Value& get_object(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsObject()) {
        throw LoaderError(std::string("field '") + name + "' must be an object", context);
    }
    return member;
}

Duration get_positive_seconds(const rapidjson::Value& val, const char* name, const std::string& context) {
    const int64_t seconds = get_int64(val, name, context);
    if (seconds <= 0) {
        throw LoaderError(std::string("field '") + name + "' must be positive", context);
    }
    return duration_from_seconds(seconds);
}

PriorityOrder parse_priority_order(const rapidjson::Value& doc) {
    if (!doc.HasMember("priority_order")) {
        return PriorityOrder::HigherIsFavored;
    }
    const std::string order = get_string(doc, "priority_order", "request");
    if (order == "higher") {
        return PriorityOrder::HigherIsFavored;
    }
    if (order == "lower") {
        return PriorityOrder::LowerIsFavored;
    }
    throw LoaderError("priority_order must be \"higher\" or \"lower\", got \"" + order + "\"", "request");
}

BreakPattern parse_breaks(const rapidjson::Value& doc) {
    BreakPattern breaks;
    if (!doc.HasMember("breaks")) {
        return breaks;
    }
    const auto& obj = get_object(doc, "breaks", "request");
    breaks.short_break = duration_from_seconds(static_cast<int64_t>(get_uint64(obj, "short", "breaks")));
    breaks.long_break = duration_from_seconds(static_cast<int64_t>(get_uint64(obj, "long", "breaks")));
    const uint64_t interval = get_uint64(obj, "interval", "breaks");
    if (interval > std::numeric_limits<unsigned>::max()) {
        throw LoaderError("interval out of range", "breaks");
    }
    breaks.interval = static_cast<unsigned>(interval);
    return breaks;
}

Task parse_task(const rapidjson::Value& obj, Duration slot_length, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("task must be an object", ctx);
    }

    std::string id = get_string(obj, "id", ctx);
    const TimePoint start = time_from_seconds(get_int64(obj, "start", ctx));
    const TimePoint due = time_from_seconds(get_int64(obj, "due", ctx));
    const Priority priority = obj.HasMember("priority") ? get_int64(obj, "priority", ctx) : 0;

    int64_t slots = 0;
    if (obj.HasMember("slots")) {
        slots = get_int64(obj, "slots", ctx);
    } else if (obj.HasMember("length")) {
        const int64_t length = get_int64(obj, "length", ctx);
        const int64_t worked = obj.HasMember("worked") ? get_int64(obj, "worked", ctx) : 0;
        if (length <= 0) {
            throw LoaderError("length must be positive", ctx);
        }
        if (worked < 0 || worked > length) {
            throw LoaderError("worked must lie in [0, length]", ctx);
        }
        if (worked == length) {
            throw LoaderError("no work left (worked == length)", ctx);
        }
        slots = slots_to_cover(duration_from_seconds(length - worked), slot_length);
    } else {
        throw LoaderError("either 'slots' or 'length' must be specified", ctx);
    }

    Task task(std::move(id), slots, start, due, priority);
    if (obj.HasMember("name")) {
        task.set_name(get_string(obj, "name", ctx));
    }
    return task;
}

void parse_request_impl(algo::ScheduleRequest& result, const rapidjson::Document& doc) {
    result.horizon_start = time_from_seconds(get_int64(doc, "horizon_start", "request"));
    result.slot_length = get_positive_seconds(doc, "slot_length", "request");
    result.priority_order = parse_priority_order(doc);
    result.breaks = parse_breaks(doc);

    if (doc.HasMember("seed")) {
        const uint64_t seed = get_uint64(doc, "seed", "request");
        if (seed > std::numeric_limits<uint32_t>::max()) {
            throw LoaderError("seed must fit in 32 bits", "request");
        }
        result.seed = static_cast<uint32_t>(seed);
    }

    if (doc.HasMember("strategy")) {
        const std::string name = get_string(doc, "strategy", "request");
        result.strategy = algo::parse_layout_strategy(name);
        if (!result.strategy) {
            throw LoaderError("unknown strategy '" + name + "'", "request");
        }
    }
    if (doc.HasMember("strategy_attempts")) {
        result.strategy_attempts = get_uint64(doc, "strategy_attempts", "request");
    }

    const auto& tasks = get_array(doc, "tasks", "request");
    for (rapidjson::SizeType tidx = 0; tidx < tasks.Size(); ++tidx) {
        const std::string ctx = "tasks[" + std::to_string(tidx) + "]";
        result.tasks.push_back(parse_task(tasks[tidx], result.slot_length, ctx));
    }

    const bool has_periods = doc.HasMember("active_periods");
    const bool has_window = doc.HasMember("daily_window");
    if (has_periods == has_window) {
        throw LoaderError("exactly one of 'active_periods' and 'daily_window' is required", "request");
    }

    if (has_periods) {
        const auto& periods = get_array(doc, "active_periods", "request");
        for (rapidjson::SizeType pidx = 0; pidx < periods.Size(); ++pidx) {
            const std::string ctx = "active_periods[" + std::to_string(pidx) + "]";
            if (!periods[pidx].IsObject()) {
                throw LoaderError("active period must be an object", ctx);
            }
            result.active_periods.push_back(
                ActivePeriod{time_from_seconds(get_int64(periods[pidx], "start", ctx)),
                             time_from_seconds(get_int64(periods[pidx], "end", ctx))});
        }
        return;
    }

    const auto& window = get_object(doc, "daily_window", "request");
    const Duration day_start = duration_from_seconds(get_int64(window, "start", "daily_window"));
    const Duration day_end = duration_from_seconds(get_int64(window, "end", "daily_window"));

    TimePoint until = result.horizon_start;
    for (const auto& task : result.tasks) {
        until = std::max(until, task.due());
    }
    result.active_periods = daily_active_periods(result.horizon_start, until, day_start, day_end);
}

} // anonymous namespace

algo::ScheduleRequest load_request(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_request_from_string(oss.str());
}

algo::ScheduleRequest load_request_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "request");
    }

    algo::ScheduleRequest result;
    try {
        parse_request_impl(result, doc);
    } catch (const core::ValidationError& e) {
        // Raised by daily_active_periods for a malformed window
        throw LoaderError(e.what(), "daily_window");
    }
    return result;
}

void write_request_to_stream(const algo::ScheduleRequest& request, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("horizon_start");
    writer.Int64(time_to_seconds(request.horizon_start));

    writer.Key("slot_length");
    writer.Int64(duration_to_seconds(request.slot_length));

    writer.Key("priority_order");
    writer.String(request.priority_order == core::PriorityOrder::HigherIsFavored ? "higher" : "lower");

    if (request.seed) {
        writer.Key("seed");
        writer.Uint(*request.seed);
    }

    if (request.breaks.interval != 0) {
        writer.Key("breaks");
        writer.StartObject();
        writer.Key("short");
        writer.Int64(duration_to_seconds(request.breaks.short_break));
        writer.Key("long");
        writer.Int64(duration_to_seconds(request.breaks.long_break));
        writer.Key("interval");
        writer.Uint(request.breaks.interval);
        writer.EndObject();
    }

    if (request.strategy) {
        const auto name = algo::to_string(*request.strategy);
        writer.Key("strategy");
        writer.String(name.data(), static_cast<rapidjson::SizeType>(name.size()));
        writer.Key("strategy_attempts");
        writer.Uint64(request.strategy_attempts);
    }

    writer.Key("active_periods");
    writer.StartArray();
    for (const auto& period : request.active_periods) {
        writer.StartObject();
        writer.Key("start");
        writer.Int64(time_to_seconds(period.start));
        writer.Key("end");
        writer.Int64(time_to_seconds(period.end));
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("tasks");
    writer.StartArray();
    for (const auto& task : request.tasks) {
        writer.StartObject();

        writer.Key("id");
        writer.String(task.id().c_str(), static_cast<rapidjson::SizeType>(task.id().size()));

        if (task.name() != task.id()) {
            writer.Key("name");
            writer.String(task.name().c_str(), static_cast<rapidjson::SizeType>(task.name().size()));
        }

        writer.Key("priority");
        writer.Int64(task.priority());

        writer.Key("start");
        writer.Int64(time_to_seconds(task.start()));

        writer.Key("due");
        writer.Int64(time_to_seconds(task.due()));

        writer.Key("slots");
        writer.Int64(task.duration());

        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString();
}

void write_request(const algo::ScheduleRequest& request, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_request_to_stream(request, file);
}

} // namespace slotsched::io
