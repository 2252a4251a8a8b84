#pragma once

#include <slotsched/core/board.hpp>

#include <cstddef>
#include <vector>

namespace slotsched::algo {

/// @brief Outcome of the claim phase.
/// @ingroup algo_phases
struct ClaimReport {
    std::size_t claims{0};                          ///< Slots claimed.
    std::vector<core::Board::TaskRef> unsatisfied;  ///< Tasks left short, in claim order.
};

/// @brief Order in which the claim phase serves tasks.
///
/// Tightest first: ascending working-period size, then task identifier,
/// then insertion position. Tasks with an empty working period or already
/// marked Unschedulable are left out.
///
/// @param board Board with every task added.
/// @return Task references in service order.
[[nodiscard]] std::vector<core::Board::TaskRef> claim_order(const core::Board& board);

/// @brief Greedy initial assignment.
///
/// Each task, in claim_order(), scans its working period from the first
/// slot forward and claims every empty slot until it reaches its duration
/// or runs out of window. A claim never displaces another task.
///
/// Emits `slot_claimed` for every claim and `claim_shortfall` for every
/// task left short.
///
/// @param board Board to fill.
/// @return Claim count and the unsatisfied tasks.
/// @see TriageEngine
ClaimReport claim_slots(core::Board& board);

} // namespace slotsched::algo
