//
// GameService.hpp
//

#ifndef CAROQUEST_GAMESERVICE_HPP
#define CAROQUEST_GAMESERVICE_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

#include "../core/AiOpponent.hpp"
#include "../core/StandardRules.hpp"
#include "../debug/AuditLogger.hpp"
#include "../net/codec.hpp"
#include "AiCoordinator.hpp"
#include "Matchmaking.hpp"
#include "SessionStore.hpp"

namespace caroquest::server
{
    inline constexpr std::size_t MaxNameLength = 30;

    // Outbound side of the connection layer. Send must be callable from any thread.
    class Transport
    {
    public:
        virtual ~Transport() = default;
        virtual auto Send(ConnectionId const& to, std::span<std::byte const> bytes) -> void = 0;
    };

    struct ServiceConfig
    {
        std::chrono::milliseconds ai_timeout{std::chrono::seconds(2)};
        std::optional<std::string> audit_dir{};
    };

    // Turns request envelopes into store transactions and fans the results out.
    class GameService
    {
    public:
        GameService(SessionStore& store,
                    MatchmakingProcessor& matchmaking,
                    Transport& transport,
                    std::shared_ptr<core::AiOpponent> ai,
                    ServiceConfig cfg = {});
        ~GameService();

        GameService(GameService const&) = delete;
        auto operator=(GameService const&) -> GameService& = delete;

        auto OnMessage(ConnectionId const& from, std::span<std::byte const> bytes) -> void;
        auto OnDisconnect(ConnectionId const& from) -> void;

        [[nodiscard]]
        auto Ai() -> AiCoordinator& { return ai_; }

        // transcripts still open
        [[nodiscard]]
        auto OpenAudits() const -> std::size_t;

    private:
        auto HandleCreate(ConnectionId const& from, std::uint64_t msg_id, core::net::CreateGameRequest const& r) -> void;
        auto HandleJoin(ConnectionId const& from, std::uint64_t msg_id, core::net::JoinGameRequest const& r) -> void;
        auto HandleLeave(ConnectionId const& from, std::uint64_t msg_id, core::net::LeaveGameRequest const& r) -> void;
        auto HandleAction(ConnectionId const& from, std::uint64_t msg_id, core::net::ActionRequest const& r) -> void;
        auto HandleFullState(ConnectionId const& from, std::uint64_t msg_id, core::net::FullStateRequest const& r) -> void;
        auto HandleEnqueue(ConnectionId const& from, std::uint64_t msg_id, core::net::EnqueueRequest const& r) -> void;
        auto HandleDequeue(ConnectionId const& from, std::uint64_t msg_id) -> void;

        auto OnAiAnswer(AiAnswer const& answer) -> void;
        auto MaybeTriggerAi(Session const& s) -> void;

        auto Broadcast(Session const& s, flatbuffers::DetachedBuffer const& buf) -> void;
        auto BroadcastState(Session const& s) -> void;
        auto SendTo(ConnectionId const& to, flatbuffers::DetachedBuffer const& buf) -> void;
        auto SendError(ConnectionId const& to, core::net::ErrorKind kind, std::string_view msg, std::uint64_t msg_id) -> void;

        auto AuditTurn(std::string const& game_id, core::GameState const& before, core::PlayerId actor,
                       core::PlayerAction const& a) -> void;
        auto AuditResult(std::string const& game_id, core::GameState const& before,
                         std::optional<core::GameState> const& after,
                         std::optional<core::error::RuleViolation> const& violation) -> void;
        auto CloseAudit(std::string const& game_id) -> void;
        auto OnGameRemoved(std::string const& game_id) -> void;

        auto NextMsgId() -> std::uint64_t { return next_msg_id_.fetch_add(1); }

        SessionStore& store_;
        MatchmakingProcessor& matchmaking_;
        Transport& transport_;
        core::StandardRules rules_;
        ServiceConfig cfg_;
        std::atomic<std::uint64_t> next_msg_id_{1};

        mutable std::mutex audit_mtx_;
        std::unordered_map<std::string, std::unique_ptr<core::debug::AuditLogger>> audits_;

        // last: its destructor waits for workers that call back into this object
        AiCoordinator ai_;
    };

    [[nodiscard]]
    auto ToPlayerInfos(std::vector<PlayerRecord> const& players) -> std::vector<core::net::PlayerInfo>;
}

#endif //CAROQUEST_GAMESERVICE_HPP
