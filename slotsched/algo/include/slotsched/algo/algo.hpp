#pragma once

/// @defgroup algo Algo Library
/// @brief Claim, triage and shuffle phases, layout search, and the pipeline.
///
/// The algo library implements the slot-allocation algorithm on top of the
/// core board: a greedy tightest-first claim, priority-ordered triage to a
/// fixpoint, a constrained random shuffle, and an optional search for the
/// layout that best fits a strategy. schedule() chains them. Depends on
/// core only.

/// @defgroup algo_phases Phases
/// @ingroup algo
/// @brief Claim, triage and shuffle.

/// @defgroup algo_layout Layout Strategies
/// @ingroup algo
/// @brief Layout scores and the shuffle-for-strategy search.

/// @defgroup algo_pipeline Pipeline
/// @ingroup algo
/// @brief Request, result, and the schedule() entry point.

// Convenience header for Library 2 (libslotsched-algo)
// Includes all public headers for scheduling algorithms

#include <slotsched/algo/claim_engine.hpp>
#include <slotsched/algo/layout_strategy.hpp>
#include <slotsched/algo/schedule.hpp>
#include <slotsched/algo/shuffler.hpp>
#include <slotsched/algo/triage_engine.hpp>
