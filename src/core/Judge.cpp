//
// Judge.cpp
//
#include "Judge.hpp"
#include <future>
#include <thread>
#include <utility>
#include "Exception.hpp"

namespace caroquest::core
{
    auto Judge::GetDecision(std::shared_ptr<AiOpponent> ai,
                            std::shared_ptr<GameState const> snapshot,
                            Difficulty difficulty) const -> TimedDecision
    {
        CQ_ASSERT(ai != nullptr, "Judge::GetDecision called without an AI");
        auto const deadline = std::chrono::steady_clock::now() + timeout_;

        std::packaged_task<std::optional<PlayerAction>()> task(
            [p = std::move(ai),
             snp = std::move(snapshot),
             difficulty,
             deadline]() mutable
            {
                return p->ComputeMove(std::move(snp), difficulty, deadline);
            }
        );

        std::future<std::optional<PlayerAction>> fut = task.get_future();

        std::thread worker(std::move(task));
        worker.detach();

        if (fut.wait_until(deadline) != std::future_status::ready)
        {
            return {std::nullopt, DecisionResult::Timeout};
        }

        // an exception thrown by the AI is rethrown here
        std::optional<PlayerAction> action = fut.get();
        if (!action)
        {
            return {std::nullopt, DecisionResult::NoMove};
        }
        return {std::move(action), DecisionResult::OK};
    }
}
