#include <slotsched/core/error.hpp>
#include <slotsched/core/slicer.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace slotsched::core;

namespace {

TimePoint at(int64_t seconds) {
    return time_from_seconds(seconds);
}

std::vector<int64_t> starts(const SlotSequence& slots) {
    std::vector<int64_t> out;
    for (const auto& slot : slots) {
        out.push_back(time_to_seconds(slot.start));
    }
    return out;
}

} // anonymous namespace

// =============================================================================
// Basic layout
// =============================================================================

TEST(SlicerTest, SinglePeriodBackToBack) {
    std::vector<ActivePeriod> periods{{at(0), at(10000)}};
    auto slots = slice(at(0), at(10000), periods, duration_from_seconds(1000));

    ASSERT_EQ(slots.size(), 10U);
    for (SlotIndex idx = 0; idx < slots.size(); ++idx) {
        EXPECT_EQ(slots[idx].index, idx);
        EXPECT_EQ(slots[idx].start, at(static_cast<int64_t>(idx) * 1000));
        EXPECT_EQ(slots[idx].end - slots[idx].start, duration_from_seconds(1000));
    }
    EXPECT_EQ(slots.slot_length(), duration_from_seconds(1000));
}

TEST(SlicerTest, PartialTrailingSlotIsDropped) {
    std::vector<ActivePeriod> periods{{at(0), at(2500)}};
    auto slots = slice(at(0), at(10000), periods, duration_from_seconds(1000));
    EXPECT_EQ(starts(slots), (std::vector<int64_t>{0, 1000}));
}

TEST(SlicerTest, AnchorsAtNowInsideRunningPeriod) {
    std::vector<ActivePeriod> periods{{at(0), at(5000)}};
    auto slots = slice(at(1500), at(10000), periods, duration_from_seconds(1000));
    EXPECT_EQ(starts(slots), (std::vector<int64_t>{1500, 2500, 3500}));
}

TEST(SlicerTest, ClipsAtHorizonEnd) {
    std::vector<ActivePeriod> periods{{at(0), at(10000)}};
    auto slots = slice(at(0), at(3500), periods, duration_from_seconds(1000));
    EXPECT_EQ(starts(slots), (std::vector<int64_t>{0, 1000, 2000}));
}

TEST(SlicerTest, PeriodsAreSortedAndGapsKept) {
    std::vector<ActivePeriod> periods{{at(5000), at(7000)}, {at(0), at(2000)}};
    auto slots = slice(at(0), at(10000), periods, duration_from_seconds(1000));

    EXPECT_EQ(starts(slots), (std::vector<int64_t>{0, 1000, 5000, 6000}));
    EXPECT_EQ(slots[2].index, 2U);
}

TEST(SlicerTest, AdjacentPeriodsAreAccepted) {
    std::vector<ActivePeriod> periods{{at(0), at(2000)}, {at(2000), at(4000)}};
    auto slots = slice(at(0), at(4000), periods, duration_from_seconds(1000));
    EXPECT_EQ(slots.size(), 4U);
}

TEST(SlicerTest, PeriodBeforeNowIsSkipped) {
    std::vector<ActivePeriod> periods{{at(0), at(2000)}, {at(4000), at(6000)}};
    auto slots = slice(at(3000), at(6000), periods, duration_from_seconds(1000));
    EXPECT_EQ(starts(slots), (std::vector<int64_t>{4000, 5000}));
}

TEST(SlicerTest, FirstStartingAtOrAfter) {
    std::vector<ActivePeriod> periods{{at(0), at(5000)}};
    auto slots = slice(at(0), at(5000), periods, duration_from_seconds(1000));

    EXPECT_EQ(slots.first_starting_at_or_after(at(0)), 0U);
    EXPECT_EQ(slots.first_starting_at_or_after(at(1000)), 1U);
    EXPECT_EQ(slots.first_starting_at_or_after(at(1001)), 2U);
    EXPECT_EQ(slots.first_starting_at_or_after(at(-50)), 0U);
    EXPECT_EQ(slots.first_starting_at_or_after(at(4001)), slots.size());
}

// =============================================================================
// Break rhythm
// =============================================================================

TEST(SlicerTest, ShortAndLongBreaks) {
    std::vector<ActivePeriod> periods{{at(0), at(10000)}};
    BreakPattern breaks{duration_from_seconds(100), duration_from_seconds(500), 3};
    auto slots = slice(at(0), at(10000), periods, duration_from_seconds(1000), breaks);

    EXPECT_EQ(starts(slots),
              (std::vector<int64_t>{0, 1100, 2200, 3700, 4800, 5900, 7400, 8500}));
}

TEST(SlicerTest, RhythmRestartsInEveryPeriod) {
    std::vector<ActivePeriod> periods{{at(0), at(2000)}, {at(5000), at(9000)}};
    BreakPattern breaks{Duration::zero(), duration_from_seconds(500), 3};
    auto slots = slice(at(0), at(9000), periods, duration_from_seconds(1000), breaks);

    EXPECT_EQ(starts(slots), (std::vector<int64_t>{0, 1000, 5000, 6000, 7000}));
}

TEST(SlicerTest, ZeroIntervalIgnoresBreaks) {
    std::vector<ActivePeriod> periods{{at(0), at(3000)}};
    BreakPattern breaks{duration_from_seconds(100), duration_from_seconds(500), 0};
    auto slots = slice(at(0), at(3000), periods, duration_from_seconds(1000), breaks);
    EXPECT_EQ(starts(slots), (std::vector<int64_t>{0, 1000, 2000}));
}

// =============================================================================
// Validation
// =============================================================================

TEST(SlicerTest, RejectsNonPositiveSlotLength) {
    std::vector<ActivePeriod> periods{{at(0), at(1000)}};
    EXPECT_THROW(slice(at(0), at(1000), periods, Duration::zero()), ValidationError);
    EXPECT_THROW(slice(at(0), at(1000), periods, duration_from_seconds(-5)), ValidationError);
}

TEST(SlicerTest, RejectsEmptyHorizon) {
    std::vector<ActivePeriod> periods{{at(0), at(1000)}};
    EXPECT_THROW(slice(at(500), at(500), periods, duration_from_seconds(100)), ValidationError);
    EXPECT_THROW(slice(at(500), at(100), periods, duration_from_seconds(100)), ValidationError);
}

TEST(SlicerTest, RejectsMalformedPeriod) {
    std::vector<ActivePeriod> periods{{at(2000), at(1000)}};
    EXPECT_THROW(slice(at(0), at(5000), periods, duration_from_seconds(100)), ValidationError);
}

TEST(SlicerTest, RejectsOverlappingPeriods) {
    std::vector<ActivePeriod> periods{{at(0), at(2000)}, {at(1500), at(3000)}};
    EXPECT_THROW(slice(at(0), at(5000), periods, duration_from_seconds(100)), ValidationError);
}

TEST(SlicerTest, RejectsNegativeBreaks) {
    std::vector<ActivePeriod> periods{{at(0), at(2000)}};
    BreakPattern breaks{duration_from_seconds(-1), Duration::zero(), 2};
    EXPECT_THROW(slice(at(0), at(2000), periods, duration_from_seconds(100), breaks),
                 ValidationError);
}

TEST(SlicerTest, RejectsHorizonWithoutSlots) {
    std::vector<ActivePeriod> periods{{at(0), at(500)}};
    EXPECT_THROW(slice(at(0), at(5000), periods, duration_from_seconds(1000)), ValidationError);

    std::vector<ActivePeriod> none;
    EXPECT_THROW(slice(at(0), at(5000), none, duration_from_seconds(1000)), ValidationError);
}

// =============================================================================
// Daily window
// =============================================================================

TEST(DailyActivePeriodsTest, OnePeriodPerDay) {
    auto periods = daily_active_periods(at(0), at(3 * 86400), duration_from_hours(9),
                                        duration_from_hours(17));
    ASSERT_EQ(periods.size(), 3U);
    EXPECT_EQ(periods[0], (ActivePeriod{at(32400), at(61200)}));
    EXPECT_EQ(periods[1], (ActivePeriod{at(118800), at(147600)}));
    EXPECT_EQ(periods[2], (ActivePeriod{at(205200), at(234000)}));
}

TEST(DailyActivePeriodsTest, ClipsToRange) {
    // From 10:00 on day 0 to 10:00 on day 2
    auto periods = daily_active_periods(at(36000), at(2 * 86400 + 36000), duration_from_hours(9),
                                        duration_from_hours(17));
    ASSERT_EQ(periods.size(), 3U);
    EXPECT_EQ(periods.front(), (ActivePeriod{at(36000), at(61200)}));
    EXPECT_EQ(periods.back(), (ActivePeriod{at(205200), at(208800)}));
}

TEST(DailyActivePeriodsTest, DaysBeforeEpoch) {
    auto periods = daily_active_periods(at(-86400), at(0), duration_from_hours(9),
                                        duration_from_hours(17));
    ASSERT_EQ(periods.size(), 1U);
    EXPECT_EQ(periods[0], (ActivePeriod{at(-86400 + 32400), at(-86400 + 61200)}));
}

TEST(DailyActivePeriodsTest, EmptyRange) {
    EXPECT_TRUE(daily_active_periods(at(100), at(100), duration_from_hours(9),
                                     duration_from_hours(17)).empty());
}

TEST(DailyActivePeriodsTest, RejectsInvalidWindow) {
    EXPECT_THROW(daily_active_periods(at(0), at(86400), duration_from_hours(17),
                                      duration_from_hours(9)),
                 ValidationError);
    EXPECT_THROW(daily_active_periods(at(0), at(86400), duration_from_hours(9),
                                      duration_from_hours(25)),
                 ValidationError);
    EXPECT_THROW(daily_active_periods(at(0), at(86400), duration_from_hours(-1),
                                      duration_from_hours(9)),
                 ValidationError);
}

TEST(DailyActivePeriodsTest, FeedsSlicer) {
    auto periods = daily_active_periods(at(0), at(2 * 86400), duration_from_hours(9),
                                        duration_from_hours(10));
    auto slots = slice(at(0), at(2 * 86400), periods, duration_from_minutes(30));
    EXPECT_EQ(starts(slots), (std::vector<int64_t>{32400, 34200, 118800, 120600}));
}
