#include <slotsched/core/slicer.hpp>
#include <slotsched/core/working_period.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace slotsched::core;

class WorkingPeriodTest : public ::testing::Test {
protected:
    TimePoint at(int64_t seconds) { return time_from_seconds(seconds); }

    // Ten 1000 s slots starting at 0
    SlotSequence contiguous() {
        std::vector<ActivePeriod> periods{{at(0), at(10000)}};
        return slice(at(0), at(10000), periods, duration_from_seconds(1000));
    }

    static std::vector<SlotIndex> indices(const WorkingPeriod& period) {
        return {period.begin(), period.end()};
    }
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(WorkingPeriodTest, SortsAndDeduplicates) {
    WorkingPeriod period{5, 1, 3, 1};
    EXPECT_EQ(indices(period), (std::vector<SlotIndex>{1, 3, 5}));
    EXPECT_EQ(period.size(), 3U);
}

TEST_F(WorkingPeriodTest, Range) {
    EXPECT_EQ(indices(WorkingPeriod::range(2, 4)), (std::vector<SlotIndex>{2, 3, 4}));
    EXPECT_EQ(indices(WorkingPeriod::range(3, 3)), (std::vector<SlotIndex>{3}));
    EXPECT_TRUE(WorkingPeriod::range(4, 2).empty());
}

TEST_F(WorkingPeriodTest, Contains) {
    WorkingPeriod period{2, 4, 9};
    EXPECT_TRUE(period.contains(4));
    EXPECT_FALSE(period.contains(3));
    EXPECT_FALSE(period.contains(10));
    EXPECT_FALSE(WorkingPeriod{}.contains(0));
}

// =============================================================================
// Resolution against the slot sequence
// =============================================================================

TEST_F(WorkingPeriodTest, SlotsWhollyInsideWindow) {
    auto slots = contiguous();
    EXPECT_EQ(indices(resolve_working_period(slots, at(2000), at(5000))),
              (std::vector<SlotIndex>{2, 3, 4}));
}

TEST_F(WorkingPeriodTest, PartiallyCoveredSlotsAreExcluded) {
    auto slots = contiguous();
    // Slot 2 starts before the window, slot 4 ends after the due date
    EXPECT_EQ(indices(resolve_working_period(slots, at(2500), at(4999))),
              (std::vector<SlotIndex>{3}));
}

TEST_F(WorkingPeriodTest, WindowCoveringEverything) {
    auto slots = contiguous();
    EXPECT_EQ(resolve_working_period(slots, at(-100000), at(100000)).size(), 10U);
}

TEST_F(WorkingPeriodTest, EmptyWhenWindowMissesHorizon) {
    auto slots = contiguous();
    EXPECT_TRUE(resolve_working_period(slots, at(20000), at(30000)).empty());
    EXPECT_TRUE(resolve_working_period(slots, at(-5000), at(-1000)).empty());
    EXPECT_TRUE(resolve_working_period(slots, at(1200), at(1900)).empty());
}

TEST_F(WorkingPeriodTest, SpansGapBetweenPeriods) {
    std::vector<ActivePeriod> periods{{at(0), at(2000)}, {at(5000), at(7000)}};
    auto slots = slice(at(0), at(7000), periods, duration_from_seconds(1000));

    auto period = resolve_working_period(slots, at(1000), at(6000));
    EXPECT_EQ(indices(period), (std::vector<SlotIndex>{1, 2}));
}
