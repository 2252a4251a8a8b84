#include <slotsched/algo/claim_engine.hpp>
#include <slotsched/algo/shuffler.hpp>
#include <slotsched/algo/triage_engine.hpp>

#include <slotsched/core/board.hpp>
#include <slotsched/core/working_period.hpp>

#include <slotsched/io/trace_writers.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <random>
#include <vector>

using namespace slotsched::algo;
using namespace slotsched::core;

class ShufflerTest : public ::testing::Test {
protected:
    // Twelve slots shared by three overlapping tasks, claimed and triaged
    static Board settled_board() {
        Board board(12);
        board.add_task("wide", 4, 1, WorkingPeriod::range(0, 11));
        board.add_task("early", 3, 2, WorkingPeriod::range(0, 5));
        board.add_task("late", 2, 3, WorkingPeriod::range(6, 11));
        static_cast<void>(claim_slots(board));
        static_cast<void>(TriageEngine().run(board));
        return board;
    }

    static std::vector<std::optional<Board::TaskRef>> layout(const Board& board) {
        std::vector<std::optional<Board::TaskRef>> out;
        for (SlotIndex slot = 0; slot < board.slot_count(); ++slot) {
            out.push_back(board.holder(slot));
        }
        return out;
    }
};

// =============================================================================
// Candidates
// =============================================================================

TEST_F(ShufflerTest, CandidatesIncludeSelf) {
    Board board(3);
    EXPECT_EQ(Shuffler::candidates(board, 1), (std::vector<SlotIndex>{1, 2}));
    EXPECT_EQ(Shuffler::candidates(board, 2), (std::vector<SlotIndex>{2}));
}

TEST_F(ShufflerTest, CandidatesRespectOccupantWindow) {
    Board board(4);
    auto task = board.add_task("t", 1, 0, WorkingPeriod{0, 1});
    board.claim(0, task);
    EXPECT_EQ(Shuffler::candidates(board, 0), (std::vector<SlotIndex>{0, 1}));
}

TEST_F(ShufflerTest, CandidatesRespectPartnerWindow) {
    Board board(4);
    auto pinned = board.add_task("pinned", 1, 0, WorkingPeriod{3});
    board.claim(3, pinned);
    EXPECT_EQ(Shuffler::candidates(board, 1), (std::vector<SlotIndex>{1, 2}));
}

// =============================================================================
// Run
// =============================================================================

TEST_F(ShufflerTest, PreservesCountsAndStatuses) {
    Board board = settled_board();
    const Board before = board;

    std::mt19937 rng(7);
    for (int round = 0; round < 20; ++round) {
        static_cast<void>(Shuffler(rng).run(board));
        ASSERT_NO_THROW(board.verify());
        for (Board::TaskRef task = 0; task < board.task_count(); ++task) {
            EXPECT_EQ(board.claimed(task), before.claimed(task));
            EXPECT_EQ(board.status(task), before.status(task));
        }
        EXPECT_EQ(board.total_claimed(), before.total_claimed());
    }
}

TEST_F(ShufflerTest, SameSeedSameLayout) {
    Board first = settled_board();
    Board second = settled_board();

    std::mt19937 rng_a(1234);
    std::mt19937 rng_b(1234);
    const auto report_a = Shuffler(rng_a).run(first);
    const auto report_b = Shuffler(rng_b).run(second);

    EXPECT_EQ(report_a.swaps, report_b.swaps);
    EXPECT_EQ(layout(first), layout(second));
}

TEST_F(ShufflerTest, SwapsBetweenIdenticalOccupantsAreNotCounted) {
    Board board(6);
    auto only = board.add_task("only", 6, 0, WorkingPeriod::range(0, 5));
    static_cast<void>(claim_slots(board));
    ASSERT_EQ(board.claimed(only), 6U);

    std::mt19937 rng(99);
    EXPECT_EQ(Shuffler(rng).run(board).swaps, 0U);

    Board empty(6);
    EXPECT_EQ(Shuffler(rng).run(empty).swaps, 0U);
}

TEST_F(ShufflerTest, PinnedTasksStayPut) {
    Board board(5);
    auto pinned = board.add_task("pinned", 1, 0, WorkingPeriod{2});
    auto loose = board.add_task("loose", 2, 0, WorkingPeriod::range(0, 4));
    board.claim(2, pinned);
    board.claim(0, loose);
    board.claim(1, loose);

    std::mt19937 rng(5);
    for (int round = 0; round < 50; ++round) {
        static_cast<void>(Shuffler(rng).run(board));
        EXPECT_EQ(board.holder(2), pinned);
        EXPECT_EQ(board.claimed(loose), 2U);
    }
}

TEST_F(ShufflerTest, TracesEverySwap) {
    Board board = settled_board();
    slotsched::io::MemoryTraceWriter writer;
    board.set_trace_writer(&writer);

    std::mt19937 rng(42);
    const auto report = Shuffler(rng).run(board);
    EXPECT_EQ(writer.records_of("slots_swapped").size(), report.swaps);
}
