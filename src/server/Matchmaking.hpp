//
// Matchmaking.hpp
//

#ifndef CAROQUEST_MATCHMAKING_HPP
#define CAROQUEST_MATCHMAKING_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include "SessionStore.hpp"

namespace caroquest::server
{
    struct MatchNotification
    {
        std::string game_id;
        core::PlayerId player_id{1};
        std::string opponent_name;
        std::int64_t timestamp{0}; // ms since epoch
    };

    struct MatchmakingEntry
    {
        ConnectionId handle;
        std::string name;
        int rating{DefaultRating};
        Clock::time_point enqueued_at{};
        std::function<void(MatchNotification const&)> notify;
    };

    struct MatchmakingConfig
    {
        std::chrono::milliseconds tick_interval{std::chrono::seconds(5)};
        int pawns_per_player{core::constants::PawnsPerPlayer};
    };

    // Pairs the two longest-waiting entries per step into a fresh ranked session.
    // An entry leaves the queue only through a completed pairing or Dequeue.
    class MatchmakingProcessor
    {
    public:
        MatchmakingProcessor(asio::io_context& io, SessionStore& store, MatchmakingConfig cfg = {});
        ~MatchmakingProcessor();

        MatchmakingProcessor(MatchmakingProcessor const&) = delete;
        auto operator=(MatchmakingProcessor const&) -> MatchmakingProcessor& = delete;

        auto Start() -> void;
        auto Stop() -> void;

        // 1-based queue position on success.
        auto Enqueue(MatchmakingEntry entry) -> std::expected<std::size_t, StoreError>;
        auto Dequeue(ConnectionId const& handle) -> bool;

        // Returns the number of pairs made.
        auto Tick() -> std::size_t;

        [[nodiscard]] auto QueueSize() const -> std::size_t;
        [[nodiscard]] auto IsQueued(ConnectionId const& handle) const -> bool;

    private:
        auto Arm() -> void;

        SessionStore& store_;
        MatchmakingConfig cfg_;

        mutable std::mutex mtx_;
        std::deque<MatchmakingEntry> queue_;

        // shared with the pending timer handler so a late tick after Stop() is a no-op
        std::shared_ptr<std::atomic<bool>> running_;
        asio::steady_timer timer_;
    };
}

#endif //CAROQUEST_MATCHMAKING_HPP
