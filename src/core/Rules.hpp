//
// Rules.hpp
//

#ifndef CAROQUEST_RULES_HPP
#define CAROQUEST_RULES_HPP

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace caroquest::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;
        using ApplyResult = error::RuleResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameState const& s, PlayerAction const& a) const -> CheckResult = 0;

        // Pure: never mutates s.
        virtual auto Apply(GameState const& s, PlayerAction const& a) const -> ApplyResult = 0;

        // Every place/move the current player may make. Selections are implied by moves.
        virtual auto LegalActions(GameState const& s) const -> std::vector<PlayerAction> = 0;
    };

    inline auto ClassifyOutcome(GameState const& before, GameState const& after) -> MoveOutcome
    {
        if (after.winner && !before.winner) return MoveOutcome::GameEnded;
        if (after.phase != before.phase) return MoveOutcome::PhaseChanged;
        return MoveOutcome::Applied;
    }
}

#endif //CAROQUEST_RULES_HPP
