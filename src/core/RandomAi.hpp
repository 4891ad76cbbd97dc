//
// RandomAi.hpp
//

#ifndef CAROQUEST_RANDOMAI_HPP
#define CAROQUEST_RANDOMAI_HPP

#include <mutex>
#include <random>

#include "AiOpponent.hpp"
#include "StandardRules.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace caroquest::core
{
    // Uniform choice among legal actions. Medium takes an immediate win when one exists,
    // Hard additionally avoids handing the opponent one.
    class RandomAI final : public caroquest::core::AiOpponent
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto ComputeMove(std::shared_ptr<GameState const> snapshot,
                         Difficulty difficulty,
                         std::chrono::steady_clock::time_point deadline)
            -> std::optional<PlayerAction> override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            std::lock_guard<std::mutex> lock(rng_mtx_);
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto WinningAction(GameState const& s, std::vector<PlayerAction> const& legal) const
            -> std::optional<PlayerAction>;
        auto SafeActions(GameState const& s, std::vector<PlayerAction> const& legal,
                         std::chrono::steady_clock::time_point deadline) const -> std::vector<PlayerAction>;

    private:
        StandardRules rules_;
        std::mutex rng_mtx_;
        std::mt19937 rng_;
    };
}

#endif //CAROQUEST_RANDOMAI_HPP
