//
// main.cpp: caroquestd, the session server behind WebSocket++
//

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <random>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Exception.hpp"
#include "core/RandomAi.hpp"
#include "server/GameService.hpp"
#include "server/Matchmaking.hpp"
#include "server/SessionStore.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::chrono::milliseconds ttl{std::chrono::hours(24)};
        std::chrono::milliseconds sweep{std::chrono::minutes(30)};
        std::chrono::milliseconds match_tick{std::chrono::seconds(5)};
        int pawns{caroquest::core::constants::PawnsPerPlayer};
        std::chrono::milliseconds ai_timeout{std::chrono::seconds(2)};
        std::uint64_t seed{std::random_device{}()};
        std::optional<std::string> audit_dir{};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                if (res.ec != std::errc{})
                {
                    std::print("[caroquestd] ignoring bad value '{}' for {}\n", s, arg);
                    return false;
                }
                return true;
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--ttl_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.ttl = std::chrono::milliseconds(v); }
            }
            else if (arg == "--sweep_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.sweep = std::chrono::milliseconds(v); }
            }
            else if (arg == "--match_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.match_tick = std::chrono::milliseconds(v); }
            }
            else if (arg == "--pawns")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0) { cfg.pawns = static_cast<int>(v); }
            }
            else if (arg == "--ai_timeout_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.ai_timeout = std::chrono::milliseconds(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--audit_dir")
            {
                if (i + 1 < argc) { cfg.audit_dir = argv[++i]; }
            }
            else
            {
                std::print("[caroquestd] unknown flag {}\n", arg);
            }
        }
        return cfg;
    }

    // ConnectionId <-> websocket handle. Send is called from the io thread and from AI workers.
    class WsTransport final : public caroquest::server::Transport
    {
    public:
        explicit WsTransport(std::shared_ptr<WsServer> ep) : ep_(std::move(ep)) {}

        auto Bind(Hdl hdl) -> caroquest::server::ConnectionId
        {
            std::lock_guard<std::mutex> lock(mtx_);
            caroquest::server::ConnectionId id = std::format("c{}", next_id_++);
            by_id_[id] = hdl;
            by_key_[hdl.lock().get()] = id;
            return id;
        }

        auto Unbind(Hdl hdl) -> std::optional<caroquest::server::ConnectionId>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = by_key_.find(hdl.lock().get());
            if (it == by_key_.end()) { return std::nullopt; }

            caroquest::server::ConnectionId id = it->second;
            by_key_.erase(it);
            by_id_.erase(id);
            return id;
        }

        auto Lookup(Hdl hdl) const -> std::optional<caroquest::server::ConnectionId>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = by_key_.find(hdl.lock().get());
            if (it == by_key_.end()) { return std::nullopt; }
            return it->second;
        }

        auto Send(caroquest::server::ConnectionId const& to, std::span<std::byte const> bytes) -> void override
        {
            Hdl hdl;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                auto it = by_id_.find(to);
                if (it == by_id_.end()) { return; }
                hdl = it->second;
            }

            websocketpp::lib::error_code ec;
            ep_->send(hdl, bytes.data(), bytes.size(), websocketpp::frame::opcode::binary, ec);
            if (ec)
            {
                std::print("[caroquestd] send() to {} failed: {}\n", to, ec.message());
            }
        }

    private:
        std::shared_ptr<WsServer> ep_;
        mutable std::mutex mtx_;
        std::uint64_t next_id_{1};
        std::unordered_map<caroquest::server::ConnectionId, Hdl> by_id_;
        std::unordered_map<void*, caroquest::server::ConnectionId> by_key_;
    };
}

int main(int argc, char** argv)
{
    using namespace caroquest;

    ServerConfig const sc = ParseArgs(argc, argv);

    std::print("[caroquestd] starting on port {} | ttl={}ms sweep={}ms match={}ms pawns={} ai_timeout={}ms\n",
               sc.port, sc.ttl.count(), sc.sweep.count(), sc.match_tick.count(), sc.pawns, sc.ai_timeout.count());

    asio::io_context io;

    auto ep = std::make_shared<WsServer>();
    ep->clear_access_channels(websocketpp::log::alevel::all);
    ep->clear_error_channels(websocketpp::log::elevel::all);
    ep->init_asio(&io);
    ep->set_reuse_addr(true);

    server::SessionStore store(io, server::StoreConfig{.game_ttl = sc.ttl, .sweep_interval = sc.sweep});
    server::MatchmakingProcessor matchmaking(io, store,
                                             server::MatchmakingConfig{.tick_interval = sc.match_tick,
                                                                       .pawns_per_player = sc.pawns});
    WsTransport transport(ep);

    auto ai = std::make_shared<core::RandomAI>(sc.seed);
    server::GameService service(store, matchmaking, transport, ai,
                                server::ServiceConfig{.ai_timeout = sc.ai_timeout, .audit_dir = sc.audit_dir});

    ep->set_open_handler([&](Hdl hdl)
    {
        server::ConnectionId const id = transport.Bind(hdl);
        std::print("[caroquestd] client connected -> {}\n", id);
    });

    ep->set_close_handler([&](Hdl hdl)
    {
        if (auto id = transport.Unbind(hdl))
        {
            std::print("[caroquestd] {} disconnected\n", *id);
            service.OnDisconnect(*id);
        }
    });

    ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[caroquestd] ignoring non-binary frame\n");
            return;
        }

        auto id = transport.Lookup(hdl);
        if (!id)
        {
            return;
        }

        auto const& payload = msg->get_payload();
        std::span<std::byte const> bytes{reinterpret_cast<std::byte const*>(payload.data()), payload.size()};

        try
        {
            service.OnMessage(*id, bytes);
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            std::print("[caroquestd] request from {} broke an invariant: {}\n", *id, e);
        }
    });

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](asio::error_code const& ec, int signo)
    {
        if (ec) { return; }
        std::print("[caroquestd] signal {} -> shutting down\n", signo);
        matchmaking.Stop();

        websocketpp::lib::error_code close_ec;
        ep->stop_listening(close_ec);
        io.stop();
    });

    ep->listen(sc.port);
    ep->start_accept();
    matchmaking.Start();

    std::thread net_thr([&io]
    {
        io.run();
    });

    if (net_thr.joinable())
    {
        net_thr.join();
    }

    std::print("[caroquestd] stopped with {} live game(s)\n", store.Size());
    return 0;
}
