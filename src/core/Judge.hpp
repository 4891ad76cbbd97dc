//
// Judge.hpp
//

#ifndef CAROQUEST_JUDGE_HPP
#define CAROQUEST_JUDGE_HPP

#include "Actions.hpp"
#include "AiOpponent.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace caroquest::core
{
    enum class DecisionResult : uint8_t
    {
        OK,
        NoMove,
        Timeout
    };

    struct TimedDecision
    {
        std::optional<PlayerAction> action{};
        DecisionResult result{};
    };

    class Judge
    {
    public:
        explicit Judge(std::chrono::milliseconds timeout) : timeout_(timeout) {}

        // Blocks the calling thread for at most the timeout. The AI keeps running detached on timeout,
        // so it is held by shared_ptr.
        auto GetDecision(std::shared_ptr<AiOpponent> ai,
                         std::shared_ptr<GameState const> snapshot,
                         Difficulty difficulty) const -> TimedDecision;

    private:
        std::chrono::milliseconds timeout_;
    };
}
#endif //CAROQUEST_JUDGE_HPP
