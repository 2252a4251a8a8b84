#pragma once

#include <slotsched/core/board.hpp>
#include <slotsched/core/types.hpp>

#include <cstddef>
#include <random>
#include <vector>

namespace slotsched::algo {

/// @brief Outcome of one shuffle sweep.
/// @ingroup algo_phases
struct ShuffleReport {
    std::size_t swaps{0};  ///< Exchanges that changed the layout.
};

/// @brief Constrained random reordering of a finished board.
/// @ingroup algo_phases
///
/// Sweeps the slot sequence left to right. At slot @c i it collects every
/// @c j >= i whose exchange with @c i keeps both occupants inside their own
/// working periods (an empty slot fits anywhere), picks one uniformly and
/// exchanges the two slots. @c i itself is always a candidate.
///
/// Held-slot counts never change, so every status computed by claim and
/// triage survives the shuffle.
///
/// The generator is borrowed; its state advances with every pick so that a
/// fixed seed reproduces the same layout.
///
/// @see shuffle_maximizing
class Shuffler {
public:
    /// @brief Construct a shuffler drawing from @p rng.
    /// @param rng Seeded generator, must outlive the shuffler.
    explicit Shuffler(std::mt19937& rng);

    /// @brief Shuffle @p board in place.
    ///
    /// Emits `slots_swapped` for every exchange that changed the layout.
    ///
    /// @param board Board after triage.
    /// @return Number of effective exchanges.
    ShuffleReport run(core::Board& board);

    /// @brief Legal exchange partners of @p slot.
    /// @param board Board to inspect.
    /// @param slot  Slot being visited.
    /// @return Ascending slot indices >= @p slot, always starting with @p slot.
    [[nodiscard]] static std::vector<core::SlotIndex> candidates(const core::Board& board,
                                                                 core::SlotIndex slot);

private:
    std::mt19937& rng_;
};

} // namespace slotsched::algo
