//
// GameService.cpp
//

#include "GameService.hpp"

#include <filesystem>
#include <format>
#include <print>
#include <utility>

#include "../core/Rules.hpp"
#include "../core/Util.hpp"

namespace caroquest::server
{
    namespace net = core::net;

    namespace
    {
        // trimmed display name, or nullopt when empty / too long
        auto CleanName(std::string_view raw) -> std::optional<std::string>
        {
            std::string name = core::util::Trim(raw);
            if (name.empty() || name.size() > MaxNameLength) return std::nullopt;
            return name;
        }

        constexpr std::string_view kBadName = "Player name must be 1 to 30 characters.";
        constexpr std::string_view kNoGame = "Game not found.";
        constexpr std::string_view kNotYourTurn = "Not your turn or not in game.";
    }

    auto ToPlayerInfos(std::vector<PlayerRecord> const& players) -> std::vector<net::PlayerInfo>
    {
        std::vector<net::PlayerInfo> out;
        out.reserve(players.size());
        for (PlayerRecord const& p : players)
        {
            out.push_back(net::PlayerInfo{
                .player_id = p.player_id,
                .name = p.name,
                .is_connected = p.is_connected,
                .is_creator = p.is_creator,
                .rating = p.rating,
            });
        }
        return out;
    }

    GameService::GameService(SessionStore& store,
                             MatchmakingProcessor& matchmaking,
                             Transport& transport,
                             std::shared_ptr<core::AiOpponent> ai,
                             ServiceConfig cfg)
        : store_(store),
          matchmaking_(matchmaking),
          transport_(transport),
          cfg_(std::move(cfg)),
          ai_(std::move(ai), cfg_.ai_timeout)
    {
        if (cfg_.audit_dir)
        {
            std::error_code ec;
            std::filesystem::create_directories(*cfg_.audit_dir, ec);
            if (ec)
            {
                std::print("[GameService] Cannot create audit dir {}: {} (auditing off)\n", *cfg_.audit_dir, ec.message());
                cfg_.audit_dir.reset();
            }
        }
        store_.SetRemovalHandler([this](std::string const& game_id) { OnGameRemoved(game_id); });
    }

    GameService::~GameService()
    {
        store_.SetRemovalHandler({});
    }

    auto GameService::OpenAudits() const -> std::size_t
    {
        std::scoped_lock lock(audit_mtx_);
        return audits_.size();
    }

    // Expired, swept or deleted: nothing will act on the game again.
    auto GameService::OnGameRemoved(std::string const& game_id) -> void
    {
        ai_.Forget(game_id);
        CloseAudit(game_id);
    }

    auto GameService::OnMessage(ConnectionId const& from, std::span<std::byte const> bytes) -> void
    {
        auto decoded = net::DecodeRequest(bytes);
        if (!decoded)
        {
            std::print("[GameService] Bad request from {}: {}\n", from, decoded.error().message);
            SendError(from, net::ErrorKind::BadRequest, std::format("Malformed request: {}", decoded.error().message), 0);
            return;
        }

        std::uint64_t const msg_id = decoded->msg_id;
        std::visit([&]<typename T0>(T0 const& req)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, net::CreateGameRequest>)
            {
                HandleCreate(from, msg_id, req);
            }
            else if constexpr (std::is_same_v<T, net::JoinGameRequest>)
            {
                HandleJoin(from, msg_id, req);
            }
            else if constexpr (std::is_same_v<T, net::LeaveGameRequest>)
            {
                HandleLeave(from, msg_id, req);
            }
            else if constexpr (std::is_same_v<T, net::ActionRequest>)
            {
                HandleAction(from, msg_id, req);
            }
            else if constexpr (std::is_same_v<T, net::FullStateRequest>)
            {
                HandleFullState(from, msg_id, req);
            }
            else if constexpr (std::is_same_v<T, net::EnqueueRequest>)
            {
                HandleEnqueue(from, msg_id, req);
            }
            else
            {
                static_assert(std::is_same_v<T, net::DequeueRequest>);
                HandleDequeue(from, msg_id);
            }
        }, decoded->request);
    }

    auto GameService::OnDisconnect(ConnectionId const& from) -> void
    {
        matchmaking_.Dequeue(from);

        for (std::string const& game_id : store_.GamesOf(from))
        {
            auto removed = store_.RemovePlayerFromGame(game_id, from);
            if (!removed) continue;

            auto sess = store_.GetGame(game_id);
            if (!sess) continue;

            std::print("[GameService] Player {} of {} disconnected\n", static_cast<int>(removed->player_id), game_id);
            Broadcast(*sess, net::BuildOpponentDisconnected(game_id, removed->player_id, NextMsgId()));
            if (!sess->HasConnectedHumans()) ai_.Forget(game_id);
        }
    }

    auto GameService::HandleCreate(ConnectionId const& from, std::uint64_t msg_id, net::CreateGameRequest const& r) -> void
    {
        auto name = CleanName(r.player_name);
        if (!name)
        {
            SendError(from, net::ErrorKind::Validation, kBadName, msg_id);
            return;
        }

        int const max_pawns = core::constants::BoardSize * core::constants::BoardSize / 2;
        if (r.pawns_per_player < 1 || r.pawns_per_player > max_pawns)
        {
            SendError(from, net::ErrorKind::Validation,
                      std::format("Pawns per player must be between 1 and {}.", max_pawns), msg_id);
            return;
        }

        GameOptions const opts{
            .pawns_per_player = r.pawns_per_player,
            .is_public = r.is_public,
            .ai_difficulty = r.ai_difficulty,
        };

        auto created = store_.CreateGame(from, *name, opts, r.game_id);
        if (!created)
        {
            SendError(from, net::ErrorKind::BadRequest, created.error().message, msg_id);
            return;
        }

        auto sess = store_.GetGame(*created);
        if (!sess)
        {
            SendError(from, net::ErrorKind::SessionNotFound, kNoGame, msg_id);
            return;
        }

        if (cfg_.audit_dir)
        {
            auto const path = std::filesystem::path(*cfg_.audit_dir) / std::format("{}.log", *created);
            auto logger = std::make_unique<core::debug::AuditLogger>(path.string());
            logger->start(*created, sess->state, 0);

            std::scoped_lock lock(audit_mtx_);
            audits_[*created] = std::move(logger);
        }

        std::print("[GameService] {} created {} ({})\n", *name, *created, opts.ai_difficulty ? "vs AI" : "open");
        SendTo(from, net::BuildGameCreated(*created, 1, msg_id));
        SendTo(from, net::BuildStateUpdate(*created, sess->seq_id, sess->state, NowMs(), NextMsgId()));

        if (opts.ai_difficulty)
        {
            Broadcast(*sess, net::BuildGameStart(*created, ToPlayerInfos(sess->players), NextMsgId()));
        }
    }

    auto GameService::HandleJoin(ConnectionId const& from, std::uint64_t msg_id, net::JoinGameRequest const& r) -> void
    {
        auto name = CleanName(r.player_name);
        if (!name)
        {
            SendError(from, net::ErrorKind::Validation, kBadName, msg_id);
            return;
        }

        std::string const game_id = core::util::ToUpper(r.game_id);
        auto joined = store_.AddPlayerToGame(game_id, from, *name);
        if (!joined)
        {
            auto const kind = joined.error().kind == StoreErrorKind::NotFound ? net::ErrorKind::SessionNotFound
                                                                              : net::ErrorKind::JoinConflict;
            SendError(from, kind, joined.error().message, msg_id);
            return;
        }

        auto sess = store_.GetGame(game_id);
        if (!sess)
        {
            SendError(from, net::ErrorKind::SessionNotFound, kNoGame, msg_id);
            return;
        }

        auto const infos = ToPlayerInfos(sess->players);
        SendTo(from, net::BuildGameJoined(game_id, joined->player_id, infos, sess->seq_id, sess->state, msg_id));

        auto const opponent_joined = net::BuildOpponentJoined(game_id, infos, NextMsgId());
        for (PlayerRecord const& p : sess->players)
        {
            if (p.is_connected && !p.IsAi() && p.handle != from) SendTo(p.handle, opponent_joined);
        }

        auto const connected = std::ranges::count_if(sess->players, &PlayerRecord::is_connected);
        if (connected >= 2)
        {
            Broadcast(*sess, net::BuildGameStart(game_id, infos, NextMsgId()));
        }

        // a reconnect may land on a turn the AI never answered
        MaybeTriggerAi(*sess);
    }

    auto GameService::HandleLeave(ConnectionId const& from, std::uint64_t msg_id, net::LeaveGameRequest const& r) -> void
    {
        std::string const game_id = core::util::ToUpper(r.game_id);
        auto removed = store_.RemovePlayerFromGame(game_id, from);
        if (!removed)
        {
            SendError(from, net::ErrorKind::SessionNotFound, kNoGame, msg_id);
            return;
        }

        auto sess = store_.GetGame(game_id);
        if (!sess) return;

        Broadcast(*sess, net::BuildOpponentDisconnected(game_id, removed->player_id, NextMsgId()));
        if (!sess->HasConnectedHumans()) ai_.Forget(game_id);
    }

    auto GameService::HandleAction(ConnectionId const& from, std::uint64_t msg_id, net::ActionRequest const& r) -> void
    {
        std::string const game_id = core::util::ToUpper(r.game_id);

        std::optional<net::ErrorReply> refusal;
        std::optional<core::error::RuleViolation> violation;
        core::GameState before{};
        core::PlayerId actor = 0;

        auto res = store_.UpdateWith(game_id, [&](Session const& s) -> std::optional<core::GameState>
        {
            PlayerRecord const* p = s.FindByHandle(from);
            if (!p || !p->is_connected || p->player_id != s.state.current_player)
            {
                refusal = net::ErrorReply{net::ErrorKind::NotYourTurn, std::string{kNotYourTurn}};
                return std::nullopt;
            }

            before = s.state;
            actor = p->player_id;
            core::error::RuleResult applied;
            try
            {
                applied = rules_.Apply(s.state, r.action);
            }
            catch (core::OmegaException<core::error::Code>& e)
            {
                e.with_game(s.game_id);
                throw;
            }
            if (!applied)
            {
                violation = applied.error();
                return std::nullopt;
            }
            return std::move(*applied);
        });

        if (actor != 0) AuditTurn(game_id, before, actor, r.action);

        if (!res)
        {
            if (violation)
            {
                AuditResult(game_id, before, std::nullopt, violation);
                SendTo(from, net::BuildViolation(*violation, msg_id));
            }
            else if (refusal)
            {
                SendError(from, refusal->kind, refusal->message, msg_id);
            }
            else
            {
                SendError(from, net::ErrorKind::SessionNotFound, kNoGame, msg_id);
            }
            return;
        }

        AuditResult(game_id, before, res->state, std::nullopt);
        BroadcastState(*res);
        if (res->state.winner)
        {
            std::print("[GameService] {} won by player {}\n", game_id, static_cast<int>(*res->state.winner));
        }
        MaybeTriggerAi(*res);
    }

    auto GameService::HandleFullState(ConnectionId const& from, std::uint64_t msg_id, net::FullStateRequest const& r) -> void
    {
        auto sess = store_.GetGame(r.game_id);
        if (!sess)
        {
            SendError(from, net::ErrorKind::SessionNotFound, kNoGame, msg_id);
            return;
        }
        if (!sess->FindByHandle(from))
        {
            SendError(from, net::ErrorKind::BadRequest, "Not in game.", msg_id);
            return;
        }
        SendTo(from, net::BuildStateUpdate(sess->game_id, sess->seq_id, sess->state, NowMs(), msg_id));
    }

    auto GameService::HandleEnqueue(ConnectionId const& from, std::uint64_t msg_id, net::EnqueueRequest const& r) -> void
    {
        auto name = CleanName(r.player_name);
        if (!name)
        {
            SendError(from, net::ErrorKind::Validation, kBadName, msg_id);
            return;
        }

        MatchmakingEntry entry{
            .handle = from,
            .name = *name,
            .rating = r.rating,
            .enqueued_at = Clock::now(),
            .notify = [this, from](MatchNotification const& n)
            {
                SendTo(from, net::BuildMatchFound(net::MatchFoundMsg{
                    .game_id = n.game_id,
                    .opponent_name = n.opponent_name,
                    .player_id = n.player_id,
                    .timestamp = n.timestamp,
                }, NextMsgId()));
            },
        };

        auto pos = matchmaking_.Enqueue(std::move(entry));
        if (!pos)
        {
            SendError(from, net::ErrorKind::Matchmaking, pos.error().message, msg_id);
            return;
        }
        SendTo(from, net::BuildQueueStatus(static_cast<int>(*pos), true, msg_id));
    }

    auto GameService::HandleDequeue(ConnectionId const& from, std::uint64_t msg_id) -> void
    {
        bool const was_queued = matchmaking_.Dequeue(from);
        if (!was_queued)
        {
            SendError(from, net::ErrorKind::Matchmaking, "You are not in the matchmaking queue.", msg_id);
            return;
        }
        SendTo(from, net::BuildQueueStatus(0, false, msg_id));
    }

    auto GameService::MaybeTriggerAi(Session const& s) -> void
    {
        if (!s.options.ai_difficulty || s.state.winner || s.state.current_player != 2) return;
        if (!s.HasConnectedHumans()) return;

        ai_.Request(s.game_id, s.state, s.seq_id, *s.options.ai_difficulty,
                    [this](AiAnswer const& a) { OnAiAnswer(a); });
    }

    auto GameService::OnAiAnswer(AiAnswer const& answer) -> void
    {
        if (!answer.decision.action) return;
        core::PlayerAction const& action = *answer.decision.action;

        std::optional<core::error::RuleViolation> violation;
        core::GameState before{};
        bool fresh = false;

        auto res = store_.UpdateWith(answer.game_id, [&](Session const& s) -> std::optional<core::GameState>
        {
            // anything that moved the session on since the snapshot makes the answer stale
            if (s.seq_id != answer.seq_id || s.state.winner || s.state.current_player != 2) return std::nullopt;

            fresh = true;
            before = s.state;
            auto applied = rules_.Apply(s.state, action);
            if (!applied)
            {
                violation = applied.error();
                return std::nullopt;
            }
            return std::move(*applied);
        });

        if (!res)
        {
            if (violation)
            {
                AuditTurn(answer.game_id, before, 2, action);
                AuditResult(answer.game_id, before, std::nullopt, violation);
                std::print("[GameService] AI action rejected in {}: {}\n", answer.game_id, core::error::describe(*violation));
            }
            else if (!fresh)
            {
                std::print("[GameService] AI answer for {} arrived after seq {}\n", answer.game_id, answer.seq_id);
            }
            return;
        }

        AuditTurn(answer.game_id, before, 2, action);
        AuditResult(answer.game_id, before, res->state, std::nullopt);
        BroadcastState(*res);
        MaybeTriggerAi(*res);
    }

    auto GameService::Broadcast(Session const& s, flatbuffers::DetachedBuffer const& buf) -> void
    {
        for (PlayerRecord const& p : s.players)
        {
            if (p.is_connected && !p.IsAi()) SendTo(p.handle, buf);
        }
    }

    auto GameService::BroadcastState(Session const& s) -> void
    {
        Broadcast(s, net::BuildStateUpdate(s.game_id, s.seq_id, s.state, NowMs(), NextMsgId()));
    }

    auto GameService::SendTo(ConnectionId const& to, flatbuffers::DetachedBuffer const& buf) -> void
    {
        transport_.Send(to, net::AsBytes(buf));
    }

    auto GameService::SendError(ConnectionId const& to, net::ErrorKind kind, std::string_view msg, std::uint64_t msg_id)
        -> void
    {
        SendTo(to, net::BuildError(kind, msg, msg_id));
    }

    auto GameService::AuditTurn(std::string const& game_id, core::GameState const& before, core::PlayerId actor,
                                core::PlayerAction const& a) -> void
    {
        std::scoped_lock lock(audit_mtx_);
        auto const it = audits_.find(game_id);
        if (it == audits_.end()) return;
        it->second->turn(before, actor, a);
    }

    auto GameService::AuditResult(std::string const& game_id, core::GameState const& before,
                                  std::optional<core::GameState> const& after,
                                  std::optional<core::error::RuleViolation> const& violation) -> void
    {
        {
            std::scoped_lock lock(audit_mtx_);
            auto const it = audits_.find(game_id);
            if (it == audits_.end()) return;

            if (violation)
            {
                it->second->rejected(*violation);
                return;
            }
            if (!after) return;

            it->second->outcome(core::ClassifyOutcome(before, *after));
            if (!after->winner) return;
            it->second->end(*after);
        }
        CloseAudit(game_id);
    }

    auto GameService::CloseAudit(std::string const& game_id) -> void
    {
        std::scoped_lock lock(audit_mtx_);
        audits_.erase(game_id);
    }
}
