#pragma once

#include <slotsched/core/board.hpp>
#include <slotsched/core/types.hpp>

#include <cstddef>
#include <vector>

namespace slotsched::algo {

/// @brief Outcome of the triage phase.
/// @ingroup algo_phases
struct TriageReport {
    std::size_t passes{0};               ///< Passes run, including the final quiet one.
    std::size_t captures{0};             ///< Slots that changed hands.
    std::size_t captures_from_empty{0};  ///< Captures of previously empty slots.
    std::vector<core::Board::TaskRef> unschedulable;  ///< Tasks still short at the fixpoint.
};

/// @brief Priority-ordered displacement among deficient tasks.
/// @ingroup algo_phases
///
/// Repeats passes until one makes no capture. Within a pass every task
/// whose claimed count is below its duration (and whose working period is
/// not empty) is served in turn, least favored first, ties by identifier.
///
/// A served task looks at the slots of its working period it does not
/// hold. A slot is capturable when it is empty, or when its holder is
/// strictly less favored. Capturable slots are taken in this order until
/// the task is satisfied or none is left:
///   -# empty slots, in slot order;
///   -# held slots, least favored holder first, ties in slot order.
///
/// An evicted task is served again only on a later pass, in its own turn.
///
/// Every capture strictly raises the favor of the holder of one slot, so
/// the number of productive passes never exceeds
/// `slot_count * distinct_priority_levels`. A run needing more passes is
/// reported as an InvariantViolation.
///
/// Tasks still short at the fixpoint are marked Unschedulable and keep the
/// slots they hold.
///
/// Emits `slot_captured`, `triage_pass` and `task_unschedulable`.
///
/// @see claim_slots, core::is_more_favored
class TriageEngine {
public:
    /// @brief Construct a triage engine.
    /// @param order Direction in which priorities are favored.
    explicit TriageEngine(core::PriorityOrder order = core::PriorityOrder::HigherIsFavored);

    /// @brief Run triage to its fixpoint.
    /// @param board Board after the claim phase.
    /// @return Pass and capture counts plus the unschedulable tasks.
    /// @throws core::InvariantViolation if the pass limit is exceeded.
    TriageReport run(core::Board& board) const;

    /// @brief Maximum number of passes a run may take on @p board.
    /// @return `slot_count * distinct_priority_levels + 1` (the quiet pass).
    [[nodiscard]] static std::size_t pass_limit(const core::Board& board);

    [[nodiscard]] core::PriorityOrder priority_order() const noexcept { return order_; }

private:
    std::vector<core::Board::TaskRef> deficient_tasks(const core::Board& board) const;
    std::size_t serve(core::Board& board, core::Board::TaskRef task, TriageReport& report) const;

    core::PriorityOrder order_;
};

} // namespace slotsched::algo
