#pragma once

/// @defgroup core Core Library
/// @brief Time types, slot sequence, working periods and the board.
///
/// The core library provides the data model shared by every scheduling
/// phase: strong time types, the slicer that turns active periods into an
/// indexed slot sequence, working-period resolution, and the Board that
/// holds per-run occupancy. It has no dependencies on scheduling
/// algorithms or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for time, slot indices, and priorities.

// Convenience header for Library 1
#include <slotsched/core/types.hpp>
#include <slotsched/core/error.hpp>
#include <slotsched/core/trace_writer.hpp>

#include <slotsched/core/task.hpp>
#include <slotsched/core/slot_sequence.hpp>
#include <slotsched/core/slicer.hpp>
#include <slotsched/core/working_period.hpp>

#include <slotsched/core/board.hpp>
