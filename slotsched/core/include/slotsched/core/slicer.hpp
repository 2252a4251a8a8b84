#pragma once

#include <slotsched/core/slot_sequence.hpp>
#include <slotsched/core/types.hpp>

#include <span>
#include <vector>

namespace slotsched::core {

/// @brief A contiguous range of time the person is willing to work.
/// @ingroup core
struct ActivePeriod {
    TimePoint start{};  ///< Inclusive start.
    TimePoint end{};    ///< Exclusive end; must not precede @c start.

    [[nodiscard]] constexpr Duration length() const noexcept { return end - start; }

    constexpr bool operator==(const ActivePeriod&) const = default;
};

/// @brief Work/break rhythm applied between consecutive slots.
/// @ingroup core
///
/// After each slot the cursor skips @c short_break, except after every
/// @c interval-th slot where it skips @c long_break. The rhythm restarts at
/// the beginning of every active period. An @c interval of zero disables
/// breaks entirely.
///
/// @code
///   interval = 4:  W s W s W s W L W s W ...
/// @endcode
struct BreakPattern {
    Duration short_break{};
    Duration long_break{};
    unsigned interval{0};
};

/// @brief Lay out the slot sequence for a scheduling horizon.
///
/// Emits every slot of length @p slot_length that fits entirely inside one
/// active period and inside `[horizon_start, horizon_end)`. Within a period,
/// slots are anchored at `max(period.start, horizon_start)`. Periods are
/// processed in start order regardless of the order they are given in.
///
/// @param horizon_start Now; no slot starts earlier.
/// @param horizon_end   Furthest due date; no slot ends later.
/// @param periods       Active periods (any order, must not overlap).
/// @param slot_length   Length of one slot (positive).
/// @param breaks        Optional break rhythm.
/// @return The ordered, indexed slot sequence (never empty).
///
/// @throws ValidationError if the horizon is empty, a period ends before it
///         starts, two periods overlap, a length is out of range, or no
///         slot fits.
SlotSequence slice(TimePoint horizon_start,
                   TimePoint horizon_end,
                   std::span<const ActivePeriod> periods,
                   Duration slot_length,
                   const BreakPattern& breaks = {});

/// @brief Build one active period per day from a daily working window.
///
/// Days are counted in whole 24 h steps from the epoch; the caller is
/// responsible for shifting times into the desired local time.
/// Each period covers `[day + day_start, day + day_end)` clipped to
/// `[from, until)`; empty clips are dropped.
///
/// @param from      Start of the range to cover.
/// @param until     End of the range to cover.
/// @param day_start Offset of the window start from midnight.
/// @param day_end   Offset of the window end from midnight.
/// @return Ordered, non-overlapping active periods.
///
/// @throws ValidationError unless `0 <= day_start <= day_end <= 24h`.
std::vector<ActivePeriod> daily_active_periods(TimePoint from,
                                               TimePoint until,
                                               Duration day_start,
                                               Duration day_end);

} // namespace slotsched::core
