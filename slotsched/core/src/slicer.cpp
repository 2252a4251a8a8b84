#include <slotsched/core/slicer.hpp>
#include <slotsched/core/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace slotsched::core {

namespace {

constexpr Duration DAY = duration_from_hours(24);

std::string describe(TimePoint start, TimePoint end) {
    return "[" + std::to_string(time_to_seconds(start)) + ", " +
           std::to_string(time_to_seconds(end)) + ")";
}

// Floor division so that days before the epoch are counted correctly
int64_t floor_div(int64_t num, int64_t den) {
    int64_t q = num / den;
    if ((num % den != 0) && ((num < 0) != (den < 0))) {
        --q;
    }
    return q;
}

} // anonymous namespace

SlotSequence slice(TimePoint horizon_start,
                   TimePoint horizon_end,
                   std::span<const ActivePeriod> periods,
                   Duration slot_length,
                   const BreakPattern& breaks) {
    if (slot_length <= Duration::zero()) {
        throw ValidationError("slot length must be positive");
    }
    if (horizon_end <= horizon_start) {
        throw ValidationError("empty scheduling horizon " + describe(horizon_start, horizon_end));
    }
    if (breaks.short_break < Duration::zero() || breaks.long_break < Duration::zero()) {
        throw ValidationError("break lengths must not be negative");
    }

    std::vector<ActivePeriod> sorted(periods.begin(), periods.end());
    for (const auto& period : sorted) {
        if (period.end < period.start) {
            throw ValidationError("active period ends before it starts " +
                                  describe(period.start, period.end));
        }
    }
    std::sort(sorted.begin(), sorted.end(), [](const ActivePeriod& lhs, const ActivePeriod& rhs) {
        return lhs.start < rhs.start || (lhs.start == rhs.start && lhs.end < rhs.end);
    });
    for (std::size_t idx = 1; idx < sorted.size(); ++idx) {
        if (sorted[idx].start < sorted[idx - 1].end) {
            throw ValidationError("active periods overlap " +
                                  describe(sorted[idx - 1].start, sorted[idx - 1].end) + " and " +
                                  describe(sorted[idx].start, sorted[idx].end));
        }
    }

    std::vector<Slot> slots;
    for (const auto& period : sorted) {
        TimePoint cursor = std::max(period.start, horizon_start);
        const TimePoint limit = std::min(period.end, horizon_end);
        unsigned streak = 0;

        while (cursor + slot_length <= limit) {
            slots.push_back(Slot{slots.size(), cursor, cursor + slot_length});
            cursor += slot_length;

            if (breaks.interval == 0) {
                continue;
            }
            if (++streak == breaks.interval) {
                cursor += breaks.long_break;
                streak = 0;
            } else {
                cursor += breaks.short_break;
            }
        }
    }

    if (slots.empty()) {
        throw ValidationError("horizon " + describe(horizon_start, horizon_end) +
                              " contains no schedulable slot");
    }

    return SlotSequence{std::move(slots), slot_length};
}

std::vector<ActivePeriod> daily_active_periods(TimePoint from,
                                               TimePoint until,
                                               Duration day_start,
                                               Duration day_end) {
    if (day_start < Duration::zero() || day_end < day_start || day_end > DAY) {
        throw ValidationError("daily window must satisfy 0 <= start <= end <= 24h");
    }

    std::vector<ActivePeriod> periods;
    if (until <= from) {
        return periods;
    }

    const int64_t day_seconds = duration_to_seconds(DAY);
    for (int64_t day = floor_div(time_to_seconds(from), day_seconds);
         day * day_seconds < time_to_seconds(until); ++day) {
        const TimePoint midnight = time_from_seconds(day * day_seconds);
        const TimePoint start = std::max(midnight + day_start, from);
        const TimePoint end = std::min(midnight + day_end, until);
        if (start < end) {
            periods.push_back(ActivePeriod{start, end});
        }
    }

    return periods;
}

} // namespace slotsched::core
