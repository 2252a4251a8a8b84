#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>

namespace slotsched::core {

/// @brief Time interval represented as an integer second count.
///
/// Duration wraps an `int64_t` second value with a private constructor.
/// All construction goes through named factories, so that the unit is
/// always spelled out at the call site.
///
/// Slot-level scheduling never needs sub-second precision; calendar
/// conversion (time zones, local days) is left to the caller.
///
/// @see duration_from_seconds, duration_from_minutes, duration_to_seconds
/// @see TimePoint
/// @ingroup core_types
class Duration {
    int64_t s_;

    explicit constexpr Duration(int64_t s) noexcept : s_(s) {}

    friend constexpr Duration duration_from_seconds(int64_t s) noexcept;
    friend constexpr Duration duration_from_minutes(int64_t m) noexcept;
    friend constexpr Duration duration_from_hours(int64_t h) noexcept;
    friend constexpr int64_t duration_to_seconds(Duration d) noexcept;

public:
    constexpr Duration() noexcept : s_(0) {}

    static constexpr Duration zero() noexcept { return Duration{0}; }

    [[nodiscard]] constexpr int64_t seconds() const noexcept { return s_; }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{s_ + rhs.s_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{s_ - rhs.s_};
    }

    /// @brief Scale by an integer factor.
    /// @param factor Multiplier.
    /// @return Scaled duration.
    constexpr Duration operator*(int64_t factor) const noexcept {
        return Duration{s_ * factor};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        s_ += rhs.s_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        s_ -= rhs.s_;
        return *this;
    }

    constexpr Duration operator-() const noexcept {
        return Duration{-s_};
    }

    constexpr auto operator<=>(const Duration&) const noexcept = default;
    constexpr bool operator==(const Duration&) const noexcept = default;
};

/// @brief Instant on the scheduling clock, in whole seconds since 1970-01-01.
///
/// Slot boundaries, task start and due dates and active periods are all
/// TimePoints. Shifting by a Duration gives a TimePoint; the gap between two
/// TimePoints is a Duration.
///
/// @see time_from_seconds, time_to_seconds
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_seconds(int64_t s) noexcept;

public:
    constexpr TimePoint() noexcept = default;

    static constexpr TimePoint epoch() noexcept { return TimePoint{}; }

    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_epoch_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    /// Signed gap from @p rhs to this instant.
    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint&) const noexcept = default;
    constexpr bool operator==(const TimePoint&) const noexcept = default;
};

/// @brief Position of a slot in the horizon (0-based).
/// @ingroup core_types
using SlotIndex = std::size_t;

/// @brief Caller-supplied task identifier.
/// @ingroup core_types
using TaskId = std::string;

/// @brief Opaque task priority.
///
/// Only the order matters. Which end of the order is favored is chosen per
/// run with PriorityOrder.
///
/// @ingroup core_types
using Priority = int64_t;

/// @brief Direction in which priority values are favored.
///
/// @see is_more_favored
/// @ingroup core_types
enum class PriorityOrder {
    HigherIsFavored,  ///< Numerically larger priorities win contention (default).
    LowerIsFavored    ///< Numerically smaller priorities win contention.
};

// ============================================================================
// Bridge functions
// ============================================================================

/// @brief Create a Duration from a second count.
/// @param s Seconds.
/// @return Duration of @p s seconds.
[[nodiscard]] constexpr Duration duration_from_seconds(int64_t s) noexcept {
    return Duration{s};
}

/// @brief Create a Duration from a minute count.
/// @param m Minutes.
/// @return Duration of @p m minutes.
[[nodiscard]] constexpr Duration duration_from_minutes(int64_t m) noexcept {
    return Duration{m * 60};
}

/// @brief Create a Duration from an hour count.
/// @param h Hours.
/// @return Duration of @p h hours.
[[nodiscard]] constexpr Duration duration_from_hours(int64_t h) noexcept {
    return Duration{h * 3600};
}

/// @brief Seconds in @p d.
[[nodiscard]] constexpr int64_t duration_to_seconds(Duration d) noexcept {
    return d.s_;
}

/// @brief Instant @p s seconds after 1970-01-01 00:00 (negative before).
[[nodiscard]] constexpr TimePoint time_from_seconds(int64_t s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

/// @brief Seconds since 1970-01-01 00:00.
[[nodiscard]] constexpr int64_t time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

/// @brief Number of whole slots needed to cover @p length.
///
/// Rounds up: a 30 minute task on 25 minute slots needs two slots.
///
/// @param length      Work to cover (must be non-negative).
/// @param slot_length Length of one slot (must be positive).
/// @return `ceil(length / slot_length)`.
[[nodiscard]] constexpr int64_t slots_to_cover(Duration length, Duration slot_length) noexcept {
    return (length.seconds() + slot_length.seconds() - 1) / slot_length.seconds();
}

/// @brief Test whether priority @p a wins contention against priority @p b.
///
/// Strict: equal priorities never favor one another.
///
/// @param a     Candidate priority.
/// @param b     Priority compared against.
/// @param order Direction of the run.
/// @return True if @p a is strictly more favored than @p b.
[[nodiscard]] constexpr bool is_more_favored(Priority a, Priority b, PriorityOrder order) noexcept {
    return order == PriorityOrder::HigherIsFavored ? a > b : a < b;
}

} // namespace slotsched::core
