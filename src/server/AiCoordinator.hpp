//
// AiCoordinator.hpp
//

#ifndef CAROQUEST_AICOORDINATOR_HPP
#define CAROQUEST_AICOORDINATOR_HPP

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../core/AiOpponent.hpp"
#include "../core/Judge.hpp"

namespace caroquest::server
{
    struct AiAnswer
    {
        std::string game_id;
        std::uint64_t request_id{0};
        std::int64_t seq_id{0}; // session sequence the snapshot was taken at
        core::TimedDecision decision{};
    };

    // Runs AI requests on worker threads. Only the newest request per game may deliver an answer;
    // older ones are dropped when they finish.
    class AiCoordinator
    {
    public:
        using Callback = std::function<void(AiAnswer const&)>;

        AiCoordinator(std::shared_ptr<core::AiOpponent> ai, std::chrono::milliseconds timeout);

        // Blocks until every worker has returned.
        ~AiCoordinator();

        AiCoordinator(AiCoordinator const&) = delete;
        auto operator=(AiCoordinator const&) -> AiCoordinator& = delete;

        auto Request(std::string const& game_id,
                     core::GameState snapshot,
                     std::int64_t seq_id,
                     core::Difficulty difficulty,
                     Callback on_done) -> std::uint64_t;

        [[nodiscard]]
        auto IsLatest(std::string const& game_id, std::uint64_t request_id) const -> bool;

        // Supersedes anything in flight for the game.
        auto Forget(std::string const& game_id) -> void;

        [[nodiscard]]
        auto Outstanding() const -> std::size_t;

    private:
        std::shared_ptr<core::AiOpponent> ai_;
        core::Judge judge_;

        mutable std::mutex mtx_;
        std::condition_variable idle_cv_;
        std::unordered_map<std::string, std::uint64_t> latest_;
        std::uint64_t next_request_{1};
        std::size_t outstanding_{0};
        bool shutting_down_{false};
    };
}

#endif //CAROQUEST_AICOORDINATOR_HPP
