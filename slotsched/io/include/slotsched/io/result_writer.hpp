#pragma once

/// @file result_writer.hpp
/// @brief JSON and text rendering of a schedule result.
/// @ingroup io_writers

#include <slotsched/algo/schedule.hpp>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string_view>

namespace slotsched::io {

/// @brief Output format of a schedule result.
/// @ingroup io_writers
enum class ResultFormat {
    Json,  ///< Machine-readable, see write_result_json().
    Text   ///< One line per slot, see write_result_text().
};

/// @brief Parse a format name (`"json"` or `"text"`).
/// @return The format, or std::nullopt for an unknown name.
[[nodiscard]] std::optional<ResultFormat> parse_result_format(std::string_view name) noexcept;

/// @brief Write a result as JSON.
///
/// @code{.json}
/// {"seed": 42,
///  "stats": {"claims": 9, "captures": 1, "triage_passes": 2, "swaps": 4},
///  "slots": [{"index": 0, "start": 0, "end": 1500, "task": "A"}, ...],
///  "tasks": [{"id": "A", "name": "A", "status": "satisfied",
///             "duration": 7, "shortfall": 0, "slots": [0, 1, ...]}, ...]}
/// @endcode
///
/// Empty slots carry `"task": null`. A `"strategy"` object with the name and
/// score is added when a layout search ran.
///
/// @param result  Result to serialise.
/// @param out     Output stream.
void write_result_json(const algo::ScheduleResult& result, std::ostream& out);

/// @brief Write a result as aligned text.
///
/// One line per slot (`index  start  task-name`, or `Free`), then an
/// `Unschedulable:` section listing each short task and its shortfall.
///
/// @param result  Result to render.
/// @param out     Output stream.
void write_result_text(const algo::ScheduleResult& result, std::ostream& out);

/// @brief Write a result to a file in the given format.
/// @throws LoaderError  If the file cannot be opened.
void write_result(const algo::ScheduleResult& result, const std::filesystem::path& path,
                  ResultFormat format);

} // namespace slotsched::io
