//
// AiCoordinator.cpp
//

#include "AiCoordinator.hpp"

#include <exception>
#include <print>
#include <thread>
#include <utility>

#include "../core/Exception.hpp"

namespace caroquest::server
{
    AiCoordinator::AiCoordinator(std::shared_ptr<core::AiOpponent> ai, std::chrono::milliseconds timeout)
        : ai_(std::move(ai)), judge_(timeout)
    {
        CQ_ASSERT(ai_ != nullptr, "AiCoordinator needs an opponent");
    }

    AiCoordinator::~AiCoordinator()
    {
        std::unique_lock lock(mtx_);
        shutting_down_ = true;
        latest_.clear();
        idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
    }

    auto AiCoordinator::Request(std::string const& game_id,
                                core::GameState snapshot,
                                std::int64_t seq_id,
                                core::Difficulty difficulty,
                                Callback on_done) -> std::uint64_t
    {
        std::uint64_t id = 0;
        {
            std::scoped_lock lock(mtx_);
            if (shutting_down_) return 0;
            id = next_request_++;
            latest_[game_id] = id;
            ++outstanding_;
        }

        auto snap = std::make_shared<core::GameState const>(std::move(snapshot));
        std::thread([this, game_id, id, seq_id, difficulty, snap = std::move(snap), cb = std::move(on_done)]
        {
            // The Judge returns by the deadline; a late AI call keeps only its own shared state alive.
            AiAnswer answer{game_id, id, seq_id, {}};
            try
            {
                answer.decision = judge_.GetDecision(ai_, snap, difficulty);
            }
            catch (core::OmegaException<core::error::Code>& e)
            {
                std::print("[AiCoordinator] AI failed: {}\n", e.with_game(game_id));
                answer.decision.result = core::DecisionResult::NoMove;
            }
            catch (std::exception const& e)
            {
                std::print("[AiCoordinator] AI failed for {}: {}\n", game_id, e.what());
                answer.decision.result = core::DecisionResult::NoMove;
            }

            if (!IsLatest(game_id, id))
            {
                std::print("[AiCoordinator] Dropping stale answer {} for {}\n", id, game_id);
            }
            else if (answer.decision.result != core::DecisionResult::OK)
            {
                std::print("[AiCoordinator] No usable answer for {} ({})\n", game_id,
                           answer.decision.result == core::DecisionResult::Timeout ? "timeout" : "no move");
            }
            else if (cb)
            {
                cb(answer);
            }

            std::scoped_lock lock(mtx_);
            --outstanding_;
            if (outstanding_ == 0) idle_cv_.notify_all();
        }).detach();

        return id;
    }

    auto AiCoordinator::IsLatest(std::string const& game_id, std::uint64_t request_id) const -> bool
    {
        std::scoped_lock lock(mtx_);
        if (shutting_down_) return false;
        auto const it = latest_.find(game_id);
        return it != latest_.end() && it->second == request_id;
    }

    auto AiCoordinator::Forget(std::string const& game_id) -> void
    {
        std::scoped_lock lock(mtx_);
        latest_.erase(game_id);
    }

    auto AiCoordinator::Outstanding() const -> std::size_t
    {
        std::scoped_lock lock(mtx_);
        return outstanding_;
    }
}
