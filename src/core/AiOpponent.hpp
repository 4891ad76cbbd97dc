//
// AiOpponent.hpp
//

#ifndef CAROQUEST_AIOPPONENT_HPP
#define CAROQUEST_AIOPPONENT_HPP

#include <chrono>
#include <memory>

#include "Actions.hpp"
#include "State.hpp"

namespace caroquest::core
{
    enum class Difficulty : std::int8_t
    {
        Easy = 0,
        Medium,
        Hard
    };

    class AiOpponent
    {
    public:
        virtual ~AiOpponent() = default;

        // Runs off the session thread. The deadline is advisory; the Judge stops waiting at it.
        // nullopt means "no move".
        virtual auto ComputeMove(std::shared_ptr<GameState const> snapshot,
                                 Difficulty difficulty,
                                 std::chrono::steady_clock::time_point deadline)
            -> std::optional<PlayerAction> = 0;
    };
}
#endif //CAROQUEST_AIOPPONENT_HPP
