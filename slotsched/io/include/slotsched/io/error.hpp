#pragma once

/// @file error.hpp
/// @brief Errors raised while reading or writing request and result files.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace slotsched::io {

/// @brief A request or result file could not be read, parsed or written.
///
/// The context names where the problem sits: a file path, or a JSON location
/// such as `tasks[2]` or `daily_window`. what() reads `"context: message"`.
///
/// Problems with the content itself (duplicate ids, overlapping periods)
/// surface later as core::ValidationError.
///
/// @ingroup io
/// @see load_request, write_result
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @param message  What went wrong.
    /// @param context  File path or JSON location.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message)
        , context_(context) {}

    /// @brief File path or JSON location, empty when none was given.
    [[nodiscard]] const std::string& context() const noexcept { return context_; }

private:
    std::string context_;
};

} // namespace slotsched::io
