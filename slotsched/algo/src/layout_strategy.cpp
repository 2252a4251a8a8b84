#include <slotsched/algo/layout_strategy.hpp>
#include <slotsched/algo/shuffler.hpp>

#include <array>
#include <cstdint>
#include <utility>
#include <vector>

namespace slotsched::algo {

using core::Board;
using core::SlotIndex;

namespace {

constexpr std::array<LayoutStrategy, 8> ALL_STRATEGIES = {
    LayoutStrategy::SmallVictories, LayoutStrategy::Procrastinator,
    LayoutStrategy::EarlyRiser,     LayoutStrategy::ProblemForFutureMe,
    LayoutStrategy::Pwm,            LayoutStrategy::Explosive,
    LayoutStrategy::ContextSwitch,  LayoutStrategy::Hyperfocus,
};

double mean(double sum, std::size_t count) {
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
}

} // anonymous namespace

std::string_view to_string(LayoutStrategy strategy) noexcept {
    switch (strategy) {
        case LayoutStrategy::SmallVictories:     return "small-victories";
        case LayoutStrategy::Procrastinator:     return "procrastinator";
        case LayoutStrategy::EarlyRiser:         return "early-riser";
        case LayoutStrategy::ProblemForFutureMe: return "future-me";
        case LayoutStrategy::Pwm:                return "pwm";
        case LayoutStrategy::Explosive:          return "explosive";
        case LayoutStrategy::ContextSwitch:      return "context-switch";
        case LayoutStrategy::Hyperfocus:         return "hyperfocus";
    }
    return "unknown";
}

std::optional<LayoutStrategy> parse_layout_strategy(std::string_view name) noexcept {
    for (LayoutStrategy strategy : ALL_STRATEGIES) {
        if (to_string(strategy) == name) {
            return strategy;
        }
    }
    return std::nullopt;
}

std::span<const LayoutStrategy> all_layout_strategies() noexcept {
    return ALL_STRATEGIES;
}

LayoutMetrics measure_layout(const Board& board) {
    LayoutMetrics metrics;
    const std::size_t count = board.slot_count();

    std::vector<std::optional<SlotIndex>> last_held(board.task_count());
    double free_sum = 0.0;
    std::size_t free_count = 0;
    std::size_t free_runs = 0;
    std::size_t focus_runs = 0;
    std::size_t focus_len = 0;

    for (SlotIndex slot = 0; slot < count; ++slot) {
        const auto holder = board.holder(slot);
        const bool run_start = slot == 0 || board.holder(slot - 1) != holder;

        if (!holder) {
            free_sum += static_cast<double>(slot);
            ++free_count;
            if (run_start) {
                ++free_runs;
            }
            continue;
        }
        last_held[*holder] = slot;
        ++focus_len;
        if (run_start) {
            ++focus_runs;
        }
    }

    double finish_sum = 0.0;
    std::size_t finishing = 0;
    for (const auto& last : last_held) {
        if (last) {
            finish_sum += static_cast<double>(*last);
            ++finishing;
        }
    }

    metrics.finish_index = mean(finish_sum, finishing);
    metrics.free_index = mean(free_sum, free_count);
    metrics.free_run = mean(static_cast<double>(free_count), free_runs);
    metrics.focus_run = mean(static_cast<double>(focus_len), focus_runs);
    return metrics;
}

double score_layout(const LayoutMetrics& metrics, LayoutStrategy strategy) noexcept {
    switch (strategy) {
        case LayoutStrategy::SmallVictories:     return -metrics.finish_index;
        case LayoutStrategy::Procrastinator:     return metrics.finish_index;
        case LayoutStrategy::EarlyRiser:         return metrics.free_index;
        case LayoutStrategy::ProblemForFutureMe: return -metrics.free_index;
        case LayoutStrategy::Pwm:                return -metrics.free_run;
        case LayoutStrategy::Explosive:          return metrics.free_run;
        case LayoutStrategy::ContextSwitch:      return -metrics.focus_run;
        case LayoutStrategy::Hyperfocus:         return metrics.focus_run;
    }
    return 0.0;
}

double score_layout(const Board& board, LayoutStrategy strategy) {
    return score_layout(measure_layout(board), strategy);
}

LayoutSearchReport shuffle_maximizing(Board& board,
                                      std::mt19937& rng,
                                      LayoutStrategy strategy,
                                      std::size_t attempts,
                                      std::optional<std::chrono::milliseconds> time_budget) {
    using Clock = std::chrono::steady_clock;
    const auto started = Clock::now();

    LayoutSearchReport report;
    report.score = score_layout(board, strategy);

    Board pristine = board;
    pristine.set_trace_writer(nullptr);
    std::optional<Board> best;
    Shuffler shuffler(rng);

    while (report.attempts < attempts) {
        if (report.attempts > 0 && time_budget && Clock::now() - started >= *time_budget) {
            break;
        }
        ++report.attempts;

        Board candidate = pristine;
        const ShuffleReport shuffled = shuffler.run(candidate);
        const double score = score_layout(candidate, strategy);
        if (score > report.score) {
            report.score = score;
            report.swaps = shuffled.swaps;
            ++report.improvements;
            best = std::move(candidate);
        }
    }

    if (best) {
        core::TraceWriter* writer = board.trace_writer();
        board = std::move(*best);
        board.set_trace_writer(writer);
    }

    board.trace([&](core::TraceWriter& w) {
        w.type("layout_selected");
        w.field("strategy", to_string(strategy));
        w.field("score", report.score);
        w.field("attempts", static_cast<uint64_t>(report.attempts));
    });

    return report;
}

} // namespace slotsched::algo
