//
// SessionStore.hpp
//

#ifndef CAROQUEST_SESSIONSTORE_HPP
#define CAROQUEST_SESSIONSTORE_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio/io_context.hpp>

#include "../core/AiOpponent.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace caroquest::server
{
    using Clock = std::chrono::steady_clock;
    using ConnectionId = std::string;

    // Seat taken by the built-in opponent in single-player games.
    inline constexpr std::string_view AiHandle = "ai";
    inline constexpr int DefaultRating = 1000;
    inline constexpr std::size_t GameIdLength = 8;

    // wall clock, ms since epoch
    [[nodiscard]]
    auto NowMs() -> std::int64_t;

    struct GameOptions
    {
        int pawns_per_player{core::constants::PawnsPerPlayer};
        bool is_public{false};
        bool is_matchmaking{false};
        bool is_ranked{false};
        std::optional<core::Difficulty> ai_difficulty{};
    };

    struct PlayerRecord
    {
        ConnectionId handle;
        std::string name;
        core::PlayerId player_id{1};
        bool is_connected{false};
        bool is_creator{false};
        std::optional<int> rating{};

        [[nodiscard]]
        auto IsAi() const -> bool { return handle == AiHandle; }
    };

    struct Session
    {
        std::string game_id;
        core::GameState state;
        std::vector<PlayerRecord> players;
        std::int64_t seq_id{0};
        Clock::time_point last_activity{};
        Clock::time_point created_at{};
        bool scheduled_for_cleanup{false};
        GameOptions options{};

        [[nodiscard]]
        auto FindByHandle(ConnectionId const& h) const -> PlayerRecord const*;

        [[nodiscard]]
        auto HasConnectedHumans() const -> bool;
    };

    struct GameStatus
    {
        bool exists{false};
        bool has_active_players{false};
        bool scheduled_for_cleanup{false};
    };

    enum class StoreErrorKind : std::uint8_t
    {
        NotFound,
        NameInUse,
        GameFull,
        DuplicateId,
        Rejected
    };

    struct StoreError
    {
        StoreErrorKind kind{};
        std::string message;
    };

    struct JoinResult
    {
        core::PlayerId player_id{1};
        std::vector<PlayerRecord> players;
        bool reconnected{false};
    };

    struct StoreConfig
    {
        std::chrono::milliseconds game_ttl{std::chrono::hours(24)};
        std::chrono::milliseconds sweep_interval{std::chrono::minutes(30)};
    };

    // Owns every live session. One mutex serialises foreground calls and timer callbacks;
    // all reads hand out copies.
    class SessionStore
    {
    public:
        // Runs the fn under the store lock against a copy of the session. nullopt rejects the write.
        // fn must not call back into the store.
        using Mutation = std::function<std::optional<core::GameState>(Session const&)>;
        // Called after a session is erased by expiry, sweep or DeleteGame, outside the store lock.
        using RemovalHandler = std::function<void(std::string const& game_id)>;

        explicit SessionStore(asio::io_context& io, StoreConfig cfg = {});
        ~SessionStore();

        SessionStore(SessionStore const&) = delete;
        auto operator=(SessionStore const&) -> SessionStore& = delete;

        // A supplied id is upper-cased and must not be in use.
        auto CreateGame(ConnectionId const& creator,
                        std::string const& creator_name,
                        GameOptions const& options,
                        std::optional<std::string> game_id = std::nullopt) -> std::expected<std::string, StoreError>;

        [[nodiscard]]
        auto GetGame(std::string const& game_id) const -> std::optional<Session>;

        auto UpdateGameState(std::string const& game_id, core::GameState state) -> bool;

        auto UpdateWith(std::string const& game_id, Mutation const& fn) -> std::expected<Session, StoreError>;

        auto AddPlayerToGame(std::string const& game_id,
                             ConnectionId const& handle,
                             std::string const& name) -> std::expected<JoinResult, StoreError>;

        auto RemovePlayerFromGame(std::string const& game_id, ConnectionId const& handle)
            -> std::optional<PlayerRecord>;

        [[nodiscard]]
        auto GetGameStatus(std::string const& game_id) const -> GameStatus;

        // Idempotent. Returns whether a session was removed.
        auto DeleteGame(std::string const& game_id) -> bool;

        // Games in which the handle holds a connected seat.
        [[nodiscard]]
        auto GamesOf(ConnectionId const& handle) const -> std::vector<std::string>;

        [[nodiscard]]
        auto Size() const -> std::size_t;

        // Removes every session idle for more than twice the TTL, scheduled or not. Returns the count.
        auto Sweep() -> std::size_t;

        auto SetRemovalHandler(RemovalHandler handler) -> void;

#if CQ_ENABLE_TEST_HOOKS == true
        // 0 when no cleanup is pending
        [[nodiscard]]
        auto CleanupTokenOf(std::string const& game_id) const -> std::uint64_t;

        // Runs the expiry path exactly as a timer completion carrying this token would.
        auto CompleteCleanup(std::string const& game_id, std::uint64_t token) -> void;
#endif

    private:
        struct Impl;
        std::shared_ptr<Impl> impl_;
    };
}

#endif //CAROQUEST_SESSIONSTORE_HPP
