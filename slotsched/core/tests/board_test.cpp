#include <slotsched/core/board.hpp>
#include <slotsched/core/error.hpp>
#include <slotsched/core/trace_writer.hpp>

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace slotsched::core;

// Records every event in memory
class MockTraceWriter : public TraceWriter {
public:
    struct Record {
        uint64_t sequence{0};
        std::string type_name;
        std::vector<std::pair<std::string, std::string>> fields;
    };

    void begin(uint64_t sequence) override {
        current_record_ = Record{};
        current_record_.sequence = sequence;
    }

    void type(std::string_view name) override {
        current_record_.type_name = std::string(name);
    }

    void field(std::string_view key, double value) override {
        current_record_.fields.emplace_back(std::string(key), std::to_string(value));
    }

    void field(std::string_view key, uint64_t value) override {
        current_record_.fields.emplace_back(std::string(key), std::to_string(value));
    }

    void field(std::string_view key, std::string_view value) override {
        current_record_.fields.emplace_back(std::string(key), std::string(value));
    }

    void end() override {
        records.push_back(current_record_);
    }

    std::vector<Record> records;

private:
    Record current_record_;
};

class BoardTest : public ::testing::Test {
protected:
    // Ten slots; "long" may use all of them, "short" only slots 4 and 5
    BoardTest() : board(10) {
        wide = board.add_task("long", 3, 1, WorkingPeriod::range(0, 9));
        narrow = board.add_task("short", 2, 2, WorkingPeriod{4, 5});
    }

    Board board;
    Board::TaskRef wide{};
    Board::TaskRef narrow{};
};

// =============================================================================
// Registration
// =============================================================================

TEST_F(BoardTest, InitialState) {
    EXPECT_EQ(board.slot_count(), 10U);
    EXPECT_EQ(board.task_count(), 2U);
    EXPECT_EQ(board.id(narrow), "short");
    EXPECT_EQ(board.duration(wide), 3U);
    EXPECT_EQ(board.priority(narrow), 2);
    EXPECT_EQ(board.claimed(wide), 0U);
    EXPECT_EQ(board.shortfall(wide), 3U);
    EXPECT_EQ(board.status(wide), TaskStatus::Unsatisfied);
    EXPECT_EQ(board.total_claimed(), 0U);
    for (SlotIndex slot = 0; slot < board.slot_count(); ++slot) {
        EXPECT_TRUE(board.is_free(slot));
    }
    EXPECT_NO_THROW(board.verify());
}

TEST_F(BoardTest, EmptyWorkingPeriodIsUnschedulable) {
    auto task = board.add_task("nowhere", 1, 0, WorkingPeriod{});
    EXPECT_EQ(board.status(task), TaskStatus::Unschedulable);
    EXPECT_EQ(board.shortfall(task), 1U);
}

TEST_F(BoardTest, RejectsInvalidTasks) {
    EXPECT_THROW(board.add_task("zero", 0, 0, WorkingPeriod{1}), ValidationError);
    EXPECT_THROW(board.add_task("beyond", 1, 0, WorkingPeriod{3, 10}), ValidationError);
}

TEST_F(BoardTest, UnknownReferencesAreRefused) {
    EXPECT_THROW(static_cast<void>(board.claimed(7)), InvariantViolation);
    EXPECT_THROW(static_cast<void>(board.holder(10)), InvariantViolation);
}

TEST(TaskStatusTest, Names) {
    EXPECT_EQ(to_string(TaskStatus::Unsatisfied), "unsatisfied");
    EXPECT_EQ(to_string(TaskStatus::Satisfied), "satisfied");
    EXPECT_EQ(to_string(TaskStatus::Unschedulable), "unschedulable");
}

// =============================================================================
// Claim
// =============================================================================

TEST_F(BoardTest, ClaimUpdatesCounters) {
    board.claim(0, wide);
    board.claim(1, wide);

    EXPECT_EQ(board.holder(0), wide);
    EXPECT_EQ(board.claimed(wide), 2U);
    EXPECT_EQ(board.status(wide), TaskStatus::Unsatisfied);

    board.claim(7, wide);
    EXPECT_EQ(board.status(wide), TaskStatus::Satisfied);
    EXPECT_EQ(board.shortfall(wide), 0U);
    EXPECT_EQ(board.total_claimed(), 3U);
    EXPECT_EQ(board.held_slots(wide), (std::vector<SlotIndex>{0, 1, 7}));
    EXPECT_NO_THROW(board.verify());
}

TEST_F(BoardTest, ClaimRefusesHeldSlot) {
    board.claim(4, narrow);
    EXPECT_THROW(board.claim(4, wide), InvariantViolation);
    EXPECT_EQ(board.holder(4), narrow);
}

TEST_F(BoardTest, ClaimRefusesSlotOutsideWorkingPeriod) {
    EXPECT_THROW(board.claim(3, narrow), InvariantViolation);
    EXPECT_TRUE(board.is_free(3));
}

TEST_F(BoardTest, ClaimRefusesCompleteTask) {
    board.claim(0, wide);
    board.claim(1, wide);
    board.claim(2, wide);
    EXPECT_THROW(board.claim(3, wide), InvariantViolation);
    EXPECT_TRUE(board.is_free(3));
}

// =============================================================================
// Capture
// =============================================================================

TEST_F(BoardTest, CaptureEmptySlot) {
    auto victim = board.capture(4, narrow);
    EXPECT_FALSE(victim.has_value());
    EXPECT_EQ(board.claimed(narrow), 1U);
    EXPECT_EQ(board.total_claimed(), 1U);
}

TEST_F(BoardTest, CaptureEvictsHolder) {
    board.claim(3, wide);
    board.claim(4, wide);
    board.claim(5, wide);
    ASSERT_EQ(board.status(wide), TaskStatus::Satisfied);

    auto victim = board.capture(4, narrow);
    ASSERT_TRUE(victim.has_value());
    EXPECT_EQ(*victim, wide);
    EXPECT_EQ(board.holder(4), narrow);
    EXPECT_EQ(board.claimed(wide), 2U);
    EXPECT_EQ(board.status(wide), TaskStatus::Unsatisfied);
    EXPECT_EQ(board.claimed(narrow), 1U);
    EXPECT_EQ(board.total_claimed(), 3U);
    EXPECT_NO_THROW(board.verify());
}

TEST_F(BoardTest, CaptureRefusals) {
    board.claim(4, narrow);
    EXPECT_THROW(board.capture(4, narrow), InvariantViolation);
    EXPECT_THROW(board.capture(8, narrow), InvariantViolation);

    board.claim(5, narrow);
    board.claim(0, wide);
    EXPECT_THROW(board.capture(0, narrow), InvariantViolation);
    EXPECT_EQ(board.holder(0), wide);
}

// =============================================================================
// Swap and status
// =============================================================================

TEST_F(BoardTest, SwapMovesBothOccupants) {
    board.claim(4, narrow);
    board.claim(0, wide);

    board.swap(0, 5);
    EXPECT_EQ(board.holder(5), wide);
    EXPECT_TRUE(board.is_free(0));

    board.swap(4, 5);
    EXPECT_EQ(board.holder(4), wide);
    EXPECT_EQ(board.holder(5), narrow);
    EXPECT_EQ(board.claimed(wide), 1U);
    EXPECT_EQ(board.claimed(narrow), 1U);
    EXPECT_NO_THROW(board.verify());
}

TEST_F(BoardTest, SwapRefusesLeavingWorkingPeriod) {
    board.claim(4, narrow);
    board.claim(0, wide);

    EXPECT_THROW(board.swap(4, 0), InvariantViolation);
    EXPECT_THROW(board.swap(9, 4), InvariantViolation);
    EXPECT_EQ(board.holder(4), narrow);
    EXPECT_EQ(board.holder(0), wide);
}

TEST_F(BoardTest, SwapWithItselfIsNoop) {
    board.claim(2, wide);
    EXPECT_NO_THROW(board.swap(2, 2));
    EXPECT_EQ(board.holder(2), wide);
}

TEST_F(BoardTest, MarkUnschedulableKeepsSlots) {
    board.claim(4, narrow);
    board.mark_unschedulable(narrow);

    EXPECT_EQ(board.status(narrow), TaskStatus::Unschedulable);
    EXPECT_EQ(board.holder(4), narrow);
    EXPECT_EQ(board.shortfall(narrow), 1U);
    EXPECT_NO_THROW(board.verify());
}

TEST_F(BoardTest, MarkUnschedulableRefusesSatisfiedTask) {
    board.claim(4, narrow);
    board.claim(5, narrow);
    EXPECT_THROW(board.mark_unschedulable(narrow), InvariantViolation);
}

TEST_F(BoardTest, CopyIsIndependent) {
    board.claim(0, wide);
    Board copy = board;
    copy.claim(1, wide);

    EXPECT_EQ(board.claimed(wide), 1U);
    EXPECT_EQ(copy.claimed(wide), 2U);
    EXPECT_TRUE(board.is_free(1));
}

// =============================================================================
// Tracing
// =============================================================================

TEST_F(BoardTest, TraceWithoutWriterIsNoop) {
    bool called = false;
    board.trace([&called](TraceWriter& writer) {
        called = true;
        writer.type("never");
    });
    EXPECT_FALSE(called);
}

TEST_F(BoardTest, TraceNumbersEventsInOrder) {
    MockTraceWriter writer;
    board.set_trace_writer(&writer);
    EXPECT_EQ(board.trace_writer(), &writer);

    for (uint64_t slot = 0; slot < 3; ++slot) {
        board.trace([slot](TraceWriter& wr) {
            wr.type("slot_claimed");
            wr.field("slot", slot);
            wr.field("task", std::string_view{"long"});
        });
    }

    ASSERT_EQ(writer.records.size(), 3U);
    for (uint64_t idx = 0; idx < 3; ++idx) {
        EXPECT_EQ(writer.records[idx].sequence, idx);
        EXPECT_EQ(writer.records[idx].type_name, "slot_claimed");
        ASSERT_EQ(writer.records[idx].fields.size(), 2U);
        EXPECT_EQ(writer.records[idx].fields[0].second, std::to_string(idx));
    }
}

TEST_F(BoardTest, SequenceSurvivesWriterChange) {
    MockTraceWriter first;
    MockTraceWriter second;

    board.set_trace_writer(&first);
    board.trace([](TraceWriter& wr) { wr.type("a"); });
    board.set_trace_writer(nullptr);
    board.trace([](TraceWriter& wr) { wr.type("skipped"); });
    board.set_trace_writer(&second);
    board.trace([](TraceWriter& wr) { wr.type("b"); });

    ASSERT_EQ(first.records.size(), 1U);
    ASSERT_EQ(second.records.size(), 1U);
    EXPECT_EQ(first.records[0].sequence, 0U);
    EXPECT_EQ(second.records[0].sequence, 1U);
}
