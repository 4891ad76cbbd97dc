//
// SessionStore.cpp
//

#include "SessionStore.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <print>
#include <random>
#include <unordered_map>
#include <utility>
#include <vector>

#include <asio/steady_timer.hpp>

#include "../core/Board.hpp"
#include "../core/Util.hpp"

namespace caroquest::server
{
    auto NowMs() -> std::int64_t
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    auto Session::FindByHandle(ConnectionId const& h) const -> PlayerRecord const*
    {
        auto const it = std::ranges::find(players, h, &PlayerRecord::handle);
        return it == players.end() ? nullptr : &*it;
    }

    auto Session::HasConnectedHumans() const -> bool
    {
        return std::ranges::any_of(players, [](PlayerRecord const& p) { return p.is_connected && !p.IsAi(); });
    }

    struct SessionStore::Impl : std::enable_shared_from_this<Impl>
    {
        struct Entry
        {
            Session session;
            std::shared_ptr<asio::steady_timer> cleanup;
            // identifies the pending cleanup; 0 when none is scheduled
            std::uint64_t cleanup_token{0};
        };

        asio::io_context& io;
        StoreConfig cfg;

        mutable std::mutex mtx;
        std::unordered_map<std::string, Entry> games;
        asio::steady_timer sweep_timer;
        bool stopped{false};
        std::uint64_t last_token{0};
        RemovalHandler on_removed;
        std::mt19937 rng{std::random_device{}()};

        Impl(asio::io_context& io_, StoreConfig cfg_)
            : io(io_), cfg(cfg_), sweep_timer(io_)
        {}

        auto NewGameId() -> std::string
        {
            static constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-";
            std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);
            for (;;)
            {
                std::string id(GameIdLength, ' ');
                for (char& ch : id) ch = alphabet[pick(rng)];
                if (!games.contains(id)) return id;
            }
        }

        // caller holds mtx
        auto CancelCleanup(Entry& e) -> void
        {
            if (e.cleanup)
            {
                e.cleanup->cancel();
                e.cleanup.reset();
            }
            e.cleanup_token = 0;
            e.session.scheduled_for_cleanup = false;
        }

        auto Touch(Entry& e) -> void
        {
            CancelCleanup(e);
            e.session.last_activity = Clock::now();
        }

        // caller holds mtx
        auto ScheduleCleanup(std::string const& game_id, Entry& e) -> void
        {
            CancelCleanup(e);
            auto timer = std::make_shared<asio::steady_timer>(io, cfg.game_ttl);
            std::uint64_t const token = ++last_token;
            e.cleanup = timer;
            e.cleanup_token = token;
            e.session.scheduled_for_cleanup = true;

            std::weak_ptr<Impl> weak = weak_from_this();
            timer->async_wait([weak, game_id, token](asio::error_code const& ec)
            {
                if (ec == asio::error::operation_aborted) return;
                auto self = weak.lock();
                if (!self) return;
                self->FireCleanup(game_id, token);
            });
            std::print("[SessionStore] Game {} scheduled for cleanup in {} ms\n", game_id, cfg.game_ttl.count());
        }

        // A completion may already be queued when the timer is cancelled, so the token decides.
        auto FireCleanup(std::string const& game_id, std::uint64_t token) -> void
        {
            RemovalHandler notify;
            {
                std::scoped_lock lock(mtx);
                auto const it = games.find(game_id);
                // superseded by a reconnect, an update or a newer schedule
                if (it == games.end() || it->second.cleanup_token != token) return;
                if (it->second.session.HasConnectedHumans()) return;

                games.erase(it);
                notify = on_removed;
                std::print("[SessionStore] Game {} expired after idle TTL\n", game_id);
            }
            if (notify) notify(game_id);
        }

        auto ArmSweep() -> void
        {
            sweep_timer.expires_after(cfg.sweep_interval);
            std::weak_ptr<Impl> weak = weak_from_this();
            sweep_timer.async_wait([weak](asio::error_code const& ec)
            {
                if (ec == asio::error::operation_aborted) return;
                auto self = weak.lock();
                if (!self) return;
                self->SweepOnce();

                std::scoped_lock lock(self->mtx);
                if (!self->stopped) self->ArmSweep();
            });
        }

        auto SweepOnce() -> std::size_t
        {
            std::vector<std::string> removed;
            RemovalHandler notify;
            {
                std::scoped_lock lock(mtx);
                auto const now = Clock::now();
                auto const limit = 2 * cfg.game_ttl;

                for (auto it = games.begin(); it != games.end();)
                {
                    Entry& e = it->second;
                    if (now - e.session.last_activity > limit)
                    {
                        std::print("[SessionStore] Sweep removed stale game {}\n", it->first);
                        CancelCleanup(e);
                        removed.push_back(it->first);
                        it = games.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }
                notify = on_removed;
            }

            if (notify)
            {
                for (auto const& id : removed) notify(id);
            }
            return removed.size();
        }
    };

    SessionStore::SessionStore(asio::io_context& io, StoreConfig cfg)
        : impl_(std::make_shared<Impl>(io, cfg))
    {
        std::scoped_lock lock(impl_->mtx);
        impl_->ArmSweep();
    }

    SessionStore::~SessionStore()
    {
        std::scoped_lock lock(impl_->mtx);
        impl_->stopped = true;
        impl_->sweep_timer.cancel();
        for (auto& [id, e] : impl_->games)
        {
            impl_->CancelCleanup(e);
        }
        impl_->games.clear();
    }

    auto SessionStore::CreateGame(ConnectionId const& creator,
                                  std::string const& creator_name,
                                  GameOptions const& options,
                                  std::optional<std::string> game_id) -> std::expected<std::string, StoreError>
    {
        std::scoped_lock lock(impl_->mtx);

        std::string id;
        if (game_id)
        {
            id = core::util::ToUpper(*game_id);
            if (id.empty() || impl_->games.contains(id))
            {
                return std::unexpected(StoreError{StoreErrorKind::DuplicateId,
                                                  std::format("Game id \"{}\" is already in use.", id)});
            }
        }
        else
        {
            id = impl_->NewGameId();
        }

        core::GameConfig cfg{};
        cfg.pawns_per_player = options.pawns_per_player;
        cfg.is_public = options.is_public;
        cfg.is_matchmaking = options.is_matchmaking;
        cfg.is_ranked = options.is_ranked;
        core::board::SanitizeConfig(cfg);

        auto const now = Clock::now();
        Impl::Entry e{};
        e.session.game_id = id;
        e.session.state = core::MakeInitialState(cfg);
        e.session.created_at = now;
        e.session.last_activity = now;
        e.session.options = options;
        e.session.options.pawns_per_player = cfg.pawns_per_player;

        e.session.players.push_back(PlayerRecord{
            .handle = creator,
            .name = creator_name,
            .player_id = 1,
            .is_connected = true,
            .is_creator = true,
            .rating = options.is_ranked ? std::optional<int>{DefaultRating} : std::nullopt,
        });
        if (options.ai_difficulty)
        {
            e.session.players.push_back(PlayerRecord{
                .handle = std::string{AiHandle},
                .name = "AI",
                .player_id = 2,
                .is_connected = true,
                .is_creator = false,
            });
        }

        impl_->games.emplace(id, std::move(e));
        std::print("[SessionStore] Created game {} for \"{}\" (pawns={} ranked={} ai={})\n",
                   id, creator_name, cfg.pawns_per_player, options.is_ranked, options.ai_difficulty.has_value());
        return id;
    }

    auto SessionStore::GetGame(std::string const& game_id) const -> std::optional<Session>
    {
        std::scoped_lock lock(impl_->mtx);
        auto const it = impl_->games.find(core::util::ToUpper(game_id));
        if (it == impl_->games.end()) return std::nullopt;
        return it->second.session;
    }

    auto SessionStore::UpdateGameState(std::string const& game_id, core::GameState state) -> bool
    {
        std::scoped_lock lock(impl_->mtx);
        auto const it = impl_->games.find(core::util::ToUpper(game_id));
        if (it == impl_->games.end())
        {
            std::print("[SessionStore] UpdateGameState: unknown game {}\n", game_id);
            return false;
        }

        core::board::Normalize(state);
        Impl::Entry& e = it->second;
        e.session.state = std::move(state);
        ++e.session.seq_id;
        impl_->Touch(e);
        return true;
    }

    auto SessionStore::UpdateWith(std::string const& game_id, Mutation const& fn) -> std::expected<Session, StoreError>
    {
        std::scoped_lock lock(impl_->mtx);
        auto const it = impl_->games.find(core::util::ToUpper(game_id));
        if (it == impl_->games.end())
        {
            return std::unexpected(StoreError{StoreErrorKind::NotFound, "Game not found or has expired."});
        }

        Impl::Entry& e = it->second;
        std::optional<core::GameState> next = fn(std::as_const(e.session));
        if (!next)
        {
            return std::unexpected(StoreError{StoreErrorKind::Rejected, "Update rejected."});
        }

        core::board::Normalize(*next);
        e.session.state = std::move(*next);
        ++e.session.seq_id;
        impl_->Touch(e);
        return e.session;
    }

    auto SessionStore::AddPlayerToGame(std::string const& game_id,
                                       ConnectionId const& handle,
                                       std::string const& name) -> std::expected<JoinResult, StoreError>
    {
        std::scoped_lock lock(impl_->mtx);
        auto const it = impl_->games.find(core::util::ToUpper(game_id));
        if (it == impl_->games.end())
        {
            return std::unexpected(StoreError{StoreErrorKind::NotFound, "Game not found or has expired."});
        }

        Impl::Entry& e = it->second;
        auto& players = e.session.players;

        auto const rejoin = [&](PlayerRecord& p) -> JoinResult
        {
            p.is_connected = true;
            p.name = name;
            p.handle = handle;
            impl_->Touch(e);
            std::print("[SessionStore] \"{}\" reconnected to {} as player {}\n",
                       name, it->first, static_cast<int>(p.player_id));
            return JoinResult{p.player_id, players, true};
        };

        // 1. same connection handle
        if (auto p = std::ranges::find(players, handle, &PlayerRecord::handle); p != players.end())
        {
            return rejoin(*p);
        }

        // 2. disconnected record under the same name, new handle
        auto const by_name = std::ranges::find_if(players, [&](PlayerRecord const& p)
        {
            return !p.is_connected && !p.IsAi() && p.name == name;
        });
        if (by_name != players.end())
        {
            return rejoin(*by_name);
        }

        // 3. name held by someone still connected
        if (std::ranges::any_of(players, [&](PlayerRecord const& p) { return p.is_connected && p.name == name; }))
        {
            return std::unexpected(StoreError{
                StoreErrorKind::NameInUse,
                std::format("Player name \"{}\" is already in use in this game by an active player.", name)});
        }

        // 4. both seats taken
        auto const connected = std::ranges::count_if(players, &PlayerRecord::is_connected);
        bool const has_1 = std::ranges::contains(players, core::PlayerId{1}, &PlayerRecord::player_id);
        bool const has_2 = std::ranges::contains(players, core::PlayerId{2}, &PlayerRecord::player_id);
        if (connected >= 2 || (has_1 && has_2))
        {
            return std::unexpected(StoreError{StoreErrorKind::GameFull, "Game is full. Cannot add new player."});
        }

        // 5. first free slot
        core::PlayerId const slot = has_1 ? core::PlayerId{2} : core::PlayerId{1};
        players.push_back(PlayerRecord{
            .handle = handle,
            .name = name,
            .player_id = slot,
            .is_connected = true,
            .is_creator = false,
            .rating = e.session.options.is_ranked ? std::optional<int>{DefaultRating} : std::nullopt,
        });
        impl_->Touch(e);

        std::print("[SessionStore] \"{}\" joined {} as player {}\n", name, it->first, static_cast<int>(slot));
        return JoinResult{slot, players, false};
    }

    auto SessionStore::RemovePlayerFromGame(std::string const& game_id, ConnectionId const& handle)
        -> std::optional<PlayerRecord>
    {
        std::scoped_lock lock(impl_->mtx);
        auto const it = impl_->games.find(core::util::ToUpper(game_id));
        if (it == impl_->games.end()) return std::nullopt;

        Impl::Entry& e = it->second;
        auto p = std::ranges::find(e.session.players, handle, &PlayerRecord::handle);
        if (p == e.session.players.end() || !p->is_connected) return std::nullopt;

        p->is_connected = false;
        e.session.last_activity = Clock::now();
        PlayerRecord removed = *p;
        std::print("[SessionStore] \"{}\" left {}\n", removed.name, it->first);

        if (!e.session.HasConnectedHumans())
        {
            impl_->ScheduleCleanup(it->first, e);
        }
        return removed;
    }

    auto SessionStore::GetGameStatus(std::string const& game_id) const -> GameStatus
    {
        std::scoped_lock lock(impl_->mtx);
        auto const it = impl_->games.find(core::util::ToUpper(game_id));
        if (it == impl_->games.end()) return {};

        return GameStatus{
            .exists = true,
            .has_active_players = it->second.session.HasConnectedHumans(),
            .scheduled_for_cleanup = it->second.session.scheduled_for_cleanup,
        };
    }

    auto SessionStore::DeleteGame(std::string const& game_id) -> bool
    {
        std::string const id = core::util::ToUpper(game_id);
        RemovalHandler notify;
        {
            std::scoped_lock lock(impl_->mtx);
            auto const it = impl_->games.find(id);
            if (it == impl_->games.end()) return false;

            impl_->CancelCleanup(it->second);
            impl_->games.erase(it);
            notify = impl_->on_removed;
            std::print("[SessionStore] Deleted game {}\n", id);
        }
        if (notify) notify(id);
        return true;
    }

    auto SessionStore::SetRemovalHandler(RemovalHandler handler) -> void
    {
        std::scoped_lock lock(impl_->mtx);
        impl_->on_removed = std::move(handler);
    }

    auto SessionStore::GamesOf(ConnectionId const& handle) const -> std::vector<std::string>
    {
        std::scoped_lock lock(impl_->mtx);
        std::vector<std::string> out;
        for (auto const& [id, e] : impl_->games)
        {
            auto const* p = e.session.FindByHandle(handle);
            if (p && p->is_connected) out.push_back(id);
        }
        return out;
    }

    auto SessionStore::Size() const -> std::size_t
    {
        std::scoped_lock lock(impl_->mtx);
        return impl_->games.size();
    }

    auto SessionStore::Sweep() -> std::size_t
    {
        return impl_->SweepOnce();
    }

#if CQ_ENABLE_TEST_HOOKS == true
    auto SessionStore::CleanupTokenOf(std::string const& game_id) const -> std::uint64_t
    {
        std::scoped_lock lock(impl_->mtx);
        auto const it = impl_->games.find(core::util::ToUpper(game_id));
        return it == impl_->games.end() ? 0 : it->second.cleanup_token;
    }

    auto SessionStore::CompleteCleanup(std::string const& game_id, std::uint64_t token) -> void
    {
        impl_->FireCleanup(core::util::ToUpper(game_id), token);
    }
#endif
}
