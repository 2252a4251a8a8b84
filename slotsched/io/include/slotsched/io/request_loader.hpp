#pragma once

/// @file request_loader.hpp
/// @brief Functions for loading and writing JSON scheduling requests.
/// @ingroup io_loaders

#include <slotsched/algo/schedule.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>

namespace slotsched::io {

/// @brief Load a scheduling request from a JSON file.
///
/// Recognised root fields (times and lengths are integer seconds):
///
/// | field               | type                         | required |
/// |---------------------|------------------------------|----------|
/// | `horizon_start`     | integer                      | yes      |
/// | `slot_length`       | positive integer             | yes      |
/// | `priority_order`    | `"higher"` or `"lower"`      | no       |
/// | `seed`              | 32-bit unsigned integer      | no       |
/// | `breaks`            | `{short, long, interval}`    | no       |
/// | `active_periods`    | array of `{start, end}`      | one of   |
/// | `daily_window`      | `{start, end}` (offsets)     | one of   |
/// | `strategy`          | layout strategy name         | no       |
/// | `strategy_attempts` | positive integer             | no       |
/// | `tasks`             | array of task objects        | yes      |
///
/// A task has `id`, optional `name`, optional `priority` (0), `start`, `due`
/// and either `slots` or `length` with an optional `worked`; the latter
/// gives `ceil((length - worked) / slot_length)` slots. A `daily_window`
/// expands over `[horizon_start, latest due)`.
///
/// @param path  Filesystem path to the JSON request file.
/// @return Parsed request, ready for algo::schedule().
///
/// @throws LoaderError  If the file cannot be read, the JSON is malformed,
///         or a field is missing or has the wrong type or range.
///
/// @see load_request_from_string, write_request
algo::ScheduleRequest load_request(const std::filesystem::path& path);

/// @brief Load a scheduling request from a JSON string.
/// @param json  JSON content describing the request.
/// @return Parsed request.
/// @throws LoaderError  If the JSON is malformed or a field is invalid.
algo::ScheduleRequest load_request_from_string(std::string_view json);

/// @brief Write a request to a JSON file in canonical form.
///
/// The canonical form lists explicit `active_periods` and gives every task
/// its `slots` count.
///
/// @param request  The request to serialise.
/// @param path     Destination file path.
/// @throws LoaderError  If the file cannot be opened.
void write_request(const algo::ScheduleRequest& request, const std::filesystem::path& path);

/// @brief Write a request to an output stream in canonical form.
/// @param request  The request to serialise.
/// @param out      Output stream (file, stringstream, stdout, etc.).
void write_request_to_stream(const algo::ScheduleRequest& request, std::ostream& out);

} // namespace slotsched::io
