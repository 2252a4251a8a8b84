#include <slotsched/io/result_writer.hpp>
#include <slotsched/io/error.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <string>

namespace slotsched::io {

namespace {

void write_string(rapidjson::Writer<rapidjson::StringBuffer>& writer, std::string_view str) {
    writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

} // anonymous namespace

std::optional<ResultFormat> parse_result_format(std::string_view name) noexcept {
    if (name == "json") {
        return ResultFormat::Json;
    }
    if (name == "text") {
        return ResultFormat::Text;
    }
    return std::nullopt;
}

void write_result_json(const algo::ScheduleResult& result, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("seed");
    writer.Uint(result.seed);

    writer.Key("stats");
    writer.StartObject();
    writer.Key("claims");
    writer.Uint64(result.stats.claims);
    writer.Key("captures");
    writer.Uint64(result.stats.captures);
    writer.Key("triage_passes");
    writer.Uint64(result.stats.triage_passes);
    writer.Key("swaps");
    writer.Uint64(result.stats.swaps);
    writer.EndObject();

    if (result.strategy) {
        writer.Key("strategy");
        writer.StartObject();
        writer.Key("name");
        write_string(writer, algo::to_string(*result.strategy));
        writer.Key("score");
        writer.Double(result.layout_score);
        writer.EndObject();
    }

    writer.Key("slots");
    writer.StartArray();
    for (const auto& assignment : result.slots) {
        writer.StartObject();
        writer.Key("index");
        writer.Uint64(assignment.slot.index);
        writer.Key("start");
        writer.Int64(core::time_to_seconds(assignment.slot.start));
        writer.Key("end");
        writer.Int64(core::time_to_seconds(assignment.slot.end));
        writer.Key("task");
        if (assignment.task) {
            write_string(writer, result.tasks[*assignment.task].id);
        } else {
            writer.Null();
        }
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("tasks");
    writer.StartArray();
    for (const auto& task : result.tasks) {
        writer.StartObject();
        writer.Key("id");
        write_string(writer, task.id);
        writer.Key("name");
        write_string(writer, task.name);
        writer.Key("status");
        write_string(writer, core::to_string(task.status));
        writer.Key("duration");
        writer.Uint64(task.duration);
        writer.Key("shortfall");
        writer.Uint64(task.shortfall);
        writer.Key("slots");
        writer.StartArray();
        for (core::SlotIndex slot : task.slots) {
            writer.Uint64(slot);
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString() << "\n";
}

void write_result_text(const algo::ScheduleResult& result, std::ostream& out) {
    for (const auto& assignment : result.slots) {
        out << std::setw(5) << assignment.slot.index << "  "
            << std::setw(12) << core::time_to_seconds(assignment.slot.start) << "  ";
        if (assignment.task) {
            out << result.tasks[*assignment.task].name;
        } else {
            out << "Free";
        }
        out << "\n";
    }

    const auto short_tasks = result.unschedulable();
    if (short_tasks.empty()) {
        return;
    }
    out << "\nUnschedulable:\n";
    for (const auto* task : short_tasks) {
        out << "  " << task->name << " (" << task->id << "): short by " << task->shortfall
            << " of " << task->duration << " slot" << (task->duration == 1 ? "" : "s") << "\n";
    }
}

void write_result(const algo::ScheduleResult& result, const std::filesystem::path& path,
                  ResultFormat format) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    if (format == ResultFormat::Json) {
        write_result_json(result, file);
    } else {
        write_result_text(result, file);
    }
}

} // namespace slotsched::io
