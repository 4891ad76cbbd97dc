//
// Board.hpp
//

#ifndef CAROQUEST_BOARD_HPP
#define CAROQUEST_BOARD_HPP

#include "State.hpp"

namespace caroquest::core::board
{
    struct Analysis
    {
        std::set<SquareIdx> blocked;
        std::set<SquareIdx> blocking;
        std::map<SquareIdx, PlayerId> dead_zones;
        std::set<SquareIdx> dead_zone_creators;
    };

    // Whole-board scan over every horizontal and vertical triple.
    //  blocking:  X - Y - X  (pawns, X != Y)     -> Y blocked, both X blocking
    //  dead zone: X - _ - X  (centre is X's color) -> centre dead for X's opponent
    auto Analyze(std::vector<Square> const& board, int board_size) -> Analysis;

    auto RecomputeAnalysis(GameState& s) -> void;

    // true when the square has opponent pawns on both sides, horizontally or vertically
    auto IsSandwichedBy(GameState const& s, SquareIdx idx, PlayerId opponent) -> bool;

    [[nodiscard]]
    auto IsWinEligible(GameState const& s, SquareIdx idx, PlayerId p) -> bool;

    // First diagonal run found in row-major scan order, down-right before down-left.
    auto FindWinningLine(GameState const& s, PlayerId p) -> std::optional<std::vector<SquareIdx>>;

    auto ClearMarks(GameState& s) -> void;

    // Out-of-range values fall back to their defaults: board size in [1, MaxBoardSize],
    // win length in [1, board size], pawns per player in [1, half the board].
    auto SanitizeConfig(GameConfig& cfg) -> void;

    // Default resolution for states that did not come out of the rule engine (wire, store writes).
    //  - squares get their geometry back, pawns on the other player's color or beyond the pawn supply are dropped
    //  - placed counts follow the board, remaining = pawns per player - placed, the phase follows the counts
    //  - bad player ids fall back to 1, dangling indices and out-of-range winning lines are dropped
    //  - derived sets are rebuilt
    auto Normalize(GameState& s) -> void;
}

#endif //CAROQUEST_BOARD_HPP
