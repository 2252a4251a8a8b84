#pragma once

#include <slotsched/core/board.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <random>
#include <span>
#include <string_view>

namespace slotsched::algo {

/// @brief Preference used to pick among shuffled layouts.
/// @ingroup algo_layout
enum class LayoutStrategy {
    SmallVictories,      ///< Finish tasks as early as possible.
    Procrastinator,      ///< Finish tasks as late as possible.
    EarlyRiser,          ///< Work first, free time at the end.
    ProblemForFutureMe,  ///< Free time first, work at the end.
    Pwm,                 ///< Short free gaps spread through the horizon.
    Explosive,           ///< Long stretches of free time.
    ContextSwitch,       ///< Short runs of the same task.
    Hyperfocus           ///< Long runs of the same task.
};

/// @brief Raw layout measures, using slot index as the time axis.
/// @ingroup algo_layout
///
/// Every measure is a mean; an empty population gives 0.
struct LayoutMetrics {
    double finish_index{0.0};  ///< Last held slot, averaged over tasks holding slots.
    double free_index{0.0};    ///< Index of empty slots.
    double free_run{0.0};      ///< Length of maximal runs of empty slots.
    double focus_run{0.0};     ///< Length of maximal runs held by one task.
};

/// @brief Command-line name of a strategy (`"small-victories"`, ...).
[[nodiscard]] std::string_view to_string(LayoutStrategy strategy) noexcept;

/// @brief Parse a command-line strategy name.
/// @param name Name as printed by to_string().
/// @return The strategy, or std::nullopt for an unknown name.
[[nodiscard]] std::optional<LayoutStrategy> parse_layout_strategy(std::string_view name) noexcept;

/// @brief Every strategy, in declaration order.
[[nodiscard]] std::span<const LayoutStrategy> all_layout_strategies() noexcept;

/// @brief Measure the current layout of @p board.
[[nodiscard]] LayoutMetrics measure_layout(const core::Board& board);

/// @brief Score a layout; larger is better for @p strategy.
///
/// | strategy           | score          |
/// |--------------------|----------------|
/// | SmallVictories     | -finish_index  |
/// | Procrastinator     | +finish_index  |
/// | EarlyRiser         | +free_index    |
/// | ProblemForFutureMe | -free_index    |
/// | Pwm                | -free_run      |
/// | Explosive          | +free_run      |
/// | ContextSwitch      | -focus_run     |
/// | Hyperfocus         | +focus_run     |
[[nodiscard]] double score_layout(const LayoutMetrics& metrics, LayoutStrategy strategy) noexcept;

/// @brief Score the current layout of @p board.
[[nodiscard]] double score_layout(const core::Board& board, LayoutStrategy strategy);

/// @brief Outcome of shuffle_maximizing().
/// @ingroup algo_layout
struct LayoutSearchReport {
    std::size_t attempts{0};      ///< Shuffles tried.
    std::size_t improvements{0};  ///< Shuffles that beat the best so far.
    std::size_t swaps{0};         ///< Exchanges in the retained layout.
    double score{0.0};            ///< Score of the retained layout.
};

/// @brief Search random legal layouts for the best score.
/// @ingroup algo_layout
///
/// Each attempt shuffles a fresh copy of the incoming board with a
/// Shuffler and keeps it when its score strictly beats the best so far.
/// The incoming layout is the initial best, so the result never scores
/// lower. Stops after @p attempts shuffles, or once @p time_budget has
/// elapsed (at least one attempt always runs when @p attempts > 0).
///
/// Candidates run untraced; one `layout_selected` event records the choice.
///
/// @param board       Board after triage; replaced by the best layout.
/// @param rng         Seeded generator.
/// @param strategy    Scoring strategy.
/// @param attempts    Maximum number of shuffles.
/// @param time_budget Optional wall-clock limit.
/// @return Attempt counts and the retained score.
LayoutSearchReport shuffle_maximizing(core::Board& board,
                                      std::mt19937& rng,
                                      LayoutStrategy strategy,
                                      std::size_t attempts,
                                      std::optional<std::chrono::milliseconds> time_budget = std::nullopt);

} // namespace slotsched::algo
