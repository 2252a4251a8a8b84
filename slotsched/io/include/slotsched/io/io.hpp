#pragma once

/// @defgroup io I/O Library
/// @brief JSON requests and results, trace output, and request generation.
///
/// The I/O library handles all external data formats: loading and writing
/// JSON scheduling requests, rendering results as JSON or text, writing
/// scheduling traces (JSON, textual, in-memory), and generating random
/// requests. Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Request JSON loader and writer.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief Result writers and JSON, textual, memory, and null trace writers.

/// @defgroup io_generation Generation
/// @ingroup io
/// @brief Random request generation (UUniFast).

// Convenience header for Library 3 (I/O)

#include <slotsched/io/error.hpp>
#include <slotsched/io/trace_writers.hpp>
#include <slotsched/io/request_loader.hpp>
#include <slotsched/io/result_writer.hpp>
#include <slotsched/io/request_generation.hpp>
