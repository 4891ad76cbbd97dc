// File: src/BotClientMain.cpp
//
// A headless client that plays one seat with RandomAI. Connects to caroquestd,
// enters matchmaking (or joins / creates a game), and answers every state update
// where it is the player to move.
//

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <print>
#include <string>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Actions.hpp"
#include "core/RandomAi.hpp"
#include "core/State.hpp"
#include "core/Types.hpp"
#include "net/codec.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;
    namespace cq = caroquest::core;

    struct CmdLine
    {
        std::string url{"ws://127.0.0.1:9002"};
        std::uint64_t seed{424242ULL};
        std::string name{"bot"};
        int rating{1000};
        std::optional<std::string> join{};          // join this game id instead of queueing
        std::optional<cq::Difficulty> vs_ai{};      // create a game against the server AI
        cq::Difficulty level{cq::Difficulty::Medium};
    };

    auto ParseDifficulty(std::string_view s) -> std::optional<cq::Difficulty>
    {
        if (s == "easy") { return cq::Difficulty::Easy; }
        if (s == "medium") { return cq::Difficulty::Medium; }
        if (s == "hard") { return cq::Difficulty::Hard; }
        return std::nullopt;
    }

    auto ParseArgs(int argc, char** argv) -> CmdLine
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string k = argv[i];
            if (k == "--url" && i + 1 < argc)
            {
                c.url = argv[++i];
            }
            else if (k == "--seed" && i + 1 < argc)
            {
                char const* s = argv[++i];
                std::from_chars(s, s + std::strlen(s), c.seed);
            }
            else if (k == "--name" && i + 1 < argc)
            {
                c.name = argv[++i];
            }
            else if (k == "--rating" && i + 1 < argc)
            {
                char const* s = argv[++i];
                std::from_chars(s, s + std::strlen(s), c.rating);
            }
            else if (k == "--join" && i + 1 < argc)
            {
                c.join = argv[++i];
            }
            else if (k == "--vs_ai" && i + 1 < argc)
            {
                c.vs_ai = ParseDifficulty(argv[++i]);
            }
            else if (k == "--level" && i + 1 < argc)
            {
                c.level = ParseDifficulty(argv[++i]).value_or(cq::Difficulty::Medium);
            }
        }
        return c;
    }

    // What the bot knows about its current game.
    struct Seat
    {
        std::string game_id;
        cq::PlayerId player_id{0};
        std::int64_t last_acted_seq{-1};
        bool finished{false};
    };
} // anon

int main(int argc, char** argv)
{
    CmdLine const cfg = ParseArgs(argc, argv);
    std::print("[Bot] Connecting to {} as \"{}\" | seed={}\n", cfg.url, cfg.name, cfg.seed);

    WsClient c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.clear_error_channels(websocketpp::log::elevel::all);
    c.init_asio();

    websocketpp::connection_hdl hdl{};
    std::uint64_t next_msg_id{1};
    Seat seat{};

    auto ai = std::make_shared<cq::RandomAI>(cfg.seed);

    auto send = [&](flatbuffers::DetachedBuffer const& buf)
    {
        websocketpp::lib::error_code ec;
        c.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[Bot] send() failed: {}\n", ec.message());
        }
    };

    auto act_on = [&](std::int64_t seq_id, cq::GameState const& state)
    {
        if (state.winner)
        {
            if (!seat.finished)
            {
                seat.finished = true;
                std::print("[Bot] Game {} over, winner P{} ({})\n", seat.game_id, static_cast<int>(*state.winner),
                           *state.winner == seat.player_id ? "me" : "opponent");
                websocketpp::lib::error_code ec;
                c.close(hdl, websocketpp::close::status::normal, "game over", ec);
            }
            return;
        }
        if (state.current_player != seat.player_id)
        {
            return;
        }
        if (seq_id <= seat.last_acted_seq)
        {
            std::print("[Bot][P{}] Already acted for seq {}, skipping.\n", static_cast<int>(seat.player_id), seq_id);
            return;
        }

        auto snapshot = std::make_shared<cq::GameState const>(state);
        auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
        std::optional<cq::PlayerAction> action = ai->ComputeMove(snapshot, cfg.level, deadline);
        if (!action)
        {
            std::print("[Bot][P{}] No legal action at seq {}.\n", static_cast<int>(seat.player_id), seq_id);
            return;
        }

        seat.last_acted_seq = seq_id;
        send(cq::net::BuildAction(seat.game_id, *action, next_msg_id++));
    };

    c.set_message_handler([&](websocketpp::connection_hdl, WsClient::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Bot] Ignoring non-binary frame\n");
            return;
        }

        std::string const& pl = msg->get_payload();
        std::span<std::byte const> bytes{reinterpret_cast<std::byte const*>(pl.data()), pl.size()};

        auto decoded = cq::net::DecodeServerMessage(bytes);
        if (!decoded)
        {
            std::print("[Bot] Bad server frame: {}\n", decoded.error().message);
            return;
        }

        std::visit([&]<typename T0>(T0 const& m)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, cq::net::QueueStatusMsg>)
            {
                std::print("[Bot] Queue position {} (queued={})\n", m.position, m.queued);
            }
            else if constexpr (std::is_same_v<T, cq::net::MatchFoundMsg>)
            {
                std::print("[Bot] Match {} vs \"{}\", I am P{}\n", m.game_id, m.opponent_name, static_cast<int>(m.player_id));
                seat = Seat{.game_id = m.game_id, .player_id = m.player_id};
                send(cq::net::BuildJoinGame(m.game_id, cfg.name, next_msg_id++));
            }
            else if constexpr (std::is_same_v<T, cq::net::GameCreatedMsg>)
            {
                std::print("[Bot] Created {} as P{}\n", m.game_id, static_cast<int>(m.player_id));
                seat = Seat{.game_id = m.game_id, .player_id = m.player_id};
            }
            else if constexpr (std::is_same_v<T, cq::net::GameJoinedMsg>)
            {
                std::print("[Bot] Joined {} as P{} (seq {})\n", m.game_id, static_cast<int>(m.player_id), m.seq_id);
                seat.game_id = m.game_id;
                seat.player_id = m.player_id;
                act_on(m.seq_id, m.state);
            }
            else if constexpr (std::is_same_v<T, cq::net::StateUpdateMsg>)
            {
                if (m.game_id == seat.game_id)
                {
                    act_on(m.seq_id, m.state);
                }
            }
            else if constexpr (std::is_same_v<T, cq::net::GameStartMsg>)
            {
                std::print("[Bot] Game {} started with {} player(s)\n", m.game_id, m.players.size());
            }
            else if constexpr (std::is_same_v<T, cq::net::OpponentJoinedMsg>)
            {
                std::print("[Bot] Opponent joined {}\n", m.game_id);
            }
            else if constexpr (std::is_same_v<T, cq::net::OpponentDisconnectedMsg>)
            {
                std::print("[Bot] P{} left {}\n", static_cast<int>(m.player_id), m.game_id);
            }
            else
            {
                static_assert(std::is_same_v<T, cq::net::ErrorReply>);
                std::print("[Bot] Server error ({}): {}\n", static_cast<int>(m.kind), m.message);
            }
        }, *decoded);
    });

    c.set_open_handler([&](websocketpp::connection_hdl h)
    {
        hdl = h;
        std::print("[Bot] Connected.\n");

        if (cfg.join)
        {
            send(cq::net::BuildJoinGame(*cfg.join, cfg.name, next_msg_id++));
        }
        else if (cfg.vs_ai)
        {
            cq::net::CreateGameRequest req{};
            req.player_name = cfg.name;
            req.ai_difficulty = cfg.vs_ai;
            send(cq::net::BuildCreateGame(req, next_msg_id++));
        }
        else
        {
            send(cq::net::BuildEnqueue(cfg.name, cfg.rating, next_msg_id++));
        }
    });

    c.set_close_handler([&](websocketpp::connection_hdl)
    {
        std::print("[Bot] Connection closed.\n");
    });

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = c.get_connection(cfg.url, ec);
    if (ec)
    {
        std::print("[Bot] get_connection error: {}\n", ec.message());
        return 2;
    }

    c.connect(con);

    // Run the client loop (blocking)
    c.run();

    return seat.finished ? 0 : 1;
}
