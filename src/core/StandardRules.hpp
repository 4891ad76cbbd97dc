//
// StandardRules.hpp
//

#ifndef CAROQUEST_STANDARDRULES_HPP
#define CAROQUEST_STANDARDRULES_HPP
#include "Rules.hpp"

namespace caroquest::core
{
    class StandardRules final : public Rules
    {
    public:
        auto Validate(GameState const& s, PlayerAction const& a) const -> CheckResult override;
        auto Apply(GameState const& s, PlayerAction const& a) const -> ApplyResult override;
        auto LegalActions(GameState const& s) const -> std::vector<PlayerAction> override;

        auto PlacePawn(GameState const& s, SquareIdx square) const -> ApplyResult;

        // Soft: an unusable selection yields the cleared state.
        auto HighlightValidMoves(GameState const& s, SquareIdx square) const -> GameState;

        auto MovePawn(GameState const& s, SquareIdx from, SquareIdx to) const -> ApplyResult;

        auto ClearHighlights(GameState const& s) const -> GameState;

        static auto IsValidPlacement(GameState const& s, SquareIdx square, PlayerId p) -> CheckResult;
        static auto CheckSelectable(GameState const& s, SquareIdx square) -> CheckResult;
        static auto ValidMoveDestinations(GameState const& s, SquareIdx from) -> std::vector<SquareIdx>;
    };
}

#endif //CAROQUEST_STANDARDRULES_HPP
