//
// RandomAi.cpp
//

#include "RandomAi.hpp"
#include <random>
#include <ranges>
#include <utility>

namespace caroquest::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomAI::ComputeMove(std::shared_ptr<GameState const> snapshot,
                               Difficulty difficulty,
                               std::chrono::steady_clock::time_point deadline)
        -> std::optional<PlayerAction>
    {
        if (!snapshot || snapshot->winner) return std::nullopt;

        std::vector<PlayerAction> const legal = rules_.LegalActions(*snapshot);
        if (legal.empty()) return std::nullopt;

        if (difficulty != Difficulty::Easy)
        {
            if (auto win = WinningAction(*snapshot, legal)) return win;
        }

        if (difficulty == Difficulty::Hard)
        {
            std::vector<PlayerAction> const safe = SafeActions(*snapshot, legal, deadline);
            if (!safe.empty()) return safe[pick(safe)];
        }

        return legal[pick(legal)];
    }

    auto RandomAI::WinningAction(GameState const& s, std::vector<PlayerAction> const& legal) const
        -> std::optional<PlayerAction>
    {
        for (PlayerAction const& a : legal)
        {
            auto next = rules_.Apply(s, a);
            if (next && next->winner == s.current_player) return a;
        }
        return std::nullopt;
    }

    auto RandomAI::SafeActions(GameState const& s, std::vector<PlayerAction> const& legal,
                               std::chrono::steady_clock::time_point deadline) const -> std::vector<PlayerAction>
    {
        std::vector<PlayerAction> safe;
        for (PlayerAction const& a : legal)
        {
            if (std::chrono::steady_clock::now() >= deadline) break;

            auto next = rules_.Apply(s, a);
            if (!next) continue;

            auto const replies = rules_.LegalActions(*next);
            if (!WinningAction(*next, replies)) safe.push_back(a);
        }
        return safe;
    }
}
