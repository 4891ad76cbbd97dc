#include <gtest/gtest.h>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <asio/io_context.hpp>

#include "../core/RandomAi.hpp"
#include "../net/codec.hpp"
#include "../server/GameService.hpp"
#include "../server/Matchmaking.hpp"
#include "../server/SessionStore.hpp"

using namespace caroquest;
using namespace std::chrono_literals;
namespace cn = caroquest::core::net;

namespace
{
    // Records every frame the service sends, per connection.
    class FakeTransport final : public server::Transport
    {
    public:
        auto Send(server::ConnectionId const& to, std::span<std::byte const> bytes) -> void override
        {
            std::scoped_lock lock(mtx_);
            sent_.emplace_back(to, std::vector<std::byte>(bytes.begin(), bytes.end()));
        }

        auto For(server::ConnectionId const& who) const -> std::vector<cn::ServerMessage>
        {
            std::scoped_lock lock(mtx_);
            std::vector<cn::ServerMessage> out;
            for (auto const& [to, bytes] : sent_)
            {
                if (to != who) continue;
                auto m = cn::DecodeServerMessage(bytes);
                EXPECT_TRUE(m.has_value());
                if (m) out.push_back(std::move(*m));
            }
            return out;
        }

        auto Clear() -> void
        {
            std::scoped_lock lock(mtx_);
            sent_.clear();
        }

    private:
        mutable std::mutex mtx_;
        std::vector<std::pair<server::ConnectionId, std::vector<std::byte>>> sent_;
    };

    template <class T>
    auto All(std::vector<cn::ServerMessage> const& msgs) -> std::vector<T>
    {
        std::vector<T> out;
        for (auto const& m : msgs)
        {
            if (auto const* p = std::get_if<T>(&m)) out.push_back(*p);
        }
        return out;
    }

    template <class T>
    auto Last(std::vector<cn::ServerMessage> const& msgs) -> std::optional<T>
    {
        auto all = All<T>(msgs);
        if (all.empty()) return std::nullopt;
        return all.back();
    }

    struct Harness
    {
        asio::io_context io;
        server::SessionStore store{io};
        server::MatchmakingProcessor matchmaking{io, store};
        FakeTransport transport;
        server::GameService service;

        explicit Harness(server::ServiceConfig cfg = {})
            : service(store, matchmaking, transport, std::make_shared<core::RandomAI>(17), std::move(cfg))
        {
        }

        auto Send(server::ConnectionId const& from, flatbuffers::DetachedBuffer const& buf) -> void
        {
            service.OnMessage(from, cn::AsBytes(buf));
        }

        auto Create(server::ConnectionId const& from, std::string name,
                    std::optional<core::Difficulty> ai = std::nullopt) -> std::string
        {
            cn::CreateGameRequest r{};
            r.player_name = std::move(name);
            r.ai_difficulty = ai;
            Send(from, cn::BuildCreateGame(r, 1));
            auto created = Last<cn::GameCreatedMsg>(transport.For(from));
            EXPECT_TRUE(created.has_value());
            return created ? created->game_id : std::string{};
        }
    };

    template <class Pred>
    auto WaitFor(Pred pred, std::chrono::milliseconds limit = 3s) -> bool
    {
        auto const until = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < until)
        {
            if (pred()) return true;
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }
}

TEST(GameService, CreateThenJoinStartsTheGame)
{
    Harness h;
    std::string const id = h.Create("c1", "alice");
    ASSERT_EQ(id.size(), server::GameIdLength);

    auto to_c1 = h.transport.For("c1");
    ASSERT_EQ(to_c1.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<cn::GameCreatedMsg>(to_c1[0]));
    auto initial = Last<cn::StateUpdateMsg>(to_c1);
    ASSERT_TRUE(initial);
    EXPECT_EQ(initial->seq_id, 0);
    EXPECT_EQ(initial->state.current_player, 1);

    std::string lower = id;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    h.Send("c2", cn::BuildJoinGame(lower, "  bob  ", 2));

    auto joined = Last<cn::GameJoinedMsg>(h.transport.For("c2"));
    ASSERT_TRUE(joined);
    EXPECT_EQ(joined->game_id, id);
    EXPECT_EQ(joined->player_id, 2);
    ASSERT_EQ(joined->players.size(), 2u);
    EXPECT_EQ(joined->players[1].name, "bob");
    EXPECT_EQ(joined->state.phase, core::GamePhase::Placement);

    EXPECT_EQ(All<cn::OpponentJoinedMsg>(h.transport.For("c1")).size(), 1u);
    EXPECT_TRUE(All<cn::OpponentJoinedMsg>(h.transport.For("c2")).empty());
    EXPECT_EQ(All<cn::GameStartMsg>(h.transport.For("c1")).size(), 1u);
    EXPECT_EQ(All<cn::GameStartMsg>(h.transport.For("c2")).size(), 1u);
}

TEST(GameService, NamesAndPawnCountsAreValidated)
{
    Harness h;

    cn::CreateGameRequest r{};
    r.player_name = "   ";
    h.Send("c1", cn::BuildCreateGame(r, 5));
    auto err = Last<cn::ErrorReply>(h.transport.For("c1"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, cn::ErrorKind::Validation);
    EXPECT_EQ(err->message, "Player name must be 1 to 30 characters.");

    r.player_name = std::string(31, 'x');
    h.Send("c1", cn::BuildCreateGame(r, 6));
    EXPECT_EQ(All<cn::ErrorReply>(h.transport.For("c1")).size(), 2u);

    r.player_name = "alice";
    r.pawns_per_player = 0;
    h.Send("c1", cn::BuildCreateGame(r, 7));
    err = Last<cn::ErrorReply>(h.transport.For("c1"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->message, "Pawns per player must be between 1 and 32.");
    EXPECT_EQ(h.store.Size(), 0u);
}

TEST(GameService, JoinErrorsMapToKinds)
{
    Harness h;
    h.Send("c2", cn::BuildJoinGame("NOPE0000", "bob", 2));
    auto err = Last<cn::ErrorReply>(h.transport.For("c2"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, cn::ErrorKind::SessionNotFound);

    std::string const id = h.Create("c1", "alice");
    h.Send("c2", cn::BuildJoinGame(id, "alice", 3));
    err = Last<cn::ErrorReply>(h.transport.For("c2"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, cn::ErrorKind::JoinConflict);

    h.Send("c2", cn::BuildJoinGame(id, "bob", 4));
    h.Send("c3", cn::BuildJoinGame(id, "carol", 5));
    err = Last<cn::ErrorReply>(h.transport.For("c3"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, cn::ErrorKind::JoinConflict);
    EXPECT_EQ(err->message, "Game is full. Cannot add new player.");
}

TEST(GameService, OnlyTheCurrentPlayerMayAct)
{
    Harness h;
    std::string const id = h.Create("c1", "alice");
    h.Send("c2", cn::BuildJoinGame(id, "bob", 2));
    h.transport.Clear();

    h.Send("c2", cn::BuildAction(id, core::PlaceAction{1}, 3));
    auto err = Last<cn::ErrorReply>(h.transport.For("c2"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, cn::ErrorKind::NotYourTurn);
    EXPECT_EQ(err->message, "Not your turn or not in game.");

    h.Send("c9", cn::BuildAction(id, core::PlaceAction{0}, 4));
    err = Last<cn::ErrorReply>(h.transport.For("c9"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, cn::ErrorKind::NotYourTurn);

    h.Send("c1", cn::BuildAction("NOPE0000", core::PlaceAction{0}, 5));
    err = Last<cn::ErrorReply>(h.transport.For("c1"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, cn::ErrorKind::SessionNotFound);

    EXPECT_EQ(h.store.GetGame(id)->seq_id, 0);
}

TEST(GameService, RuleViolationIsReportedToTheActorOnly)
{
    Harness h;
    std::string const id = h.Create("c1", "alice");
    h.Send("c2", cn::BuildJoinGame(id, "bob", 2));
    h.transport.Clear();

    h.Send("c1", cn::BuildAction(id, core::PlaceAction{1}, 3));
    auto err = Last<cn::ErrorReply>(h.transport.For("c1"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, cn::ErrorKind::Validation);
    EXPECT_NE(err->message.find("not the player's color"), std::string::npos) << err->message;
    EXPECT_TRUE(h.transport.For("c2").empty());
    EXPECT_EQ(h.store.GetGame(id)->seq_id, 0);
}

TEST(GameService, AcceptedActionIsBroadcast)
{
    Harness h;
    std::string const id = h.Create("c1", "alice");
    h.Send("c2", cn::BuildJoinGame(id, "bob", 2));
    h.transport.Clear();

    h.Send("c1", cn::BuildAction(id, core::PlaceAction{0}, 3));

    for (char const* who : {"c1", "c2"})
    {
        auto upd = Last<cn::StateUpdateMsg>(h.transport.For(who));
        ASSERT_TRUE(upd) << who;
        EXPECT_EQ(upd->seq_id, 1);
        EXPECT_EQ(upd->state.current_player, 2);
        EXPECT_TRUE(upd->state.board[0].pawn.has_value());
    }

    h.Send("c2", cn::BuildAction(id, core::PlaceAction{1}, 4));
    auto upd = Last<cn::StateUpdateMsg>(h.transport.For("c1"));
    ASSERT_TRUE(upd);
    EXPECT_EQ(upd->seq_id, 2);
    EXPECT_EQ(upd->state.current_player, 1);
}

TEST(GameService, FullStateNeedsASeat)
{
    Harness h;
    std::string const id = h.Create("c1", "alice");
    h.transport.Clear();

    h.Send("c1", cn::BuildFullStateRequest(id, 9));
    auto upd = Last<cn::StateUpdateMsg>(h.transport.For("c1"));
    ASSERT_TRUE(upd);
    EXPECT_EQ(upd->game_id, id);

    h.Send("c3", cn::BuildFullStateRequest(id, 10));
    auto err = Last<cn::ErrorReply>(h.transport.For("c3"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->message, "Not in game.");
}

TEST(GameService, DisconnectNotifiesTheOpponent)
{
    Harness h;
    std::string const id = h.Create("c1", "alice");
    h.Send("c2", cn::BuildJoinGame(id, "bob", 2));
    h.transport.Clear();

    h.service.OnDisconnect("c2");
    auto gone = Last<cn::OpponentDisconnectedMsg>(h.transport.For("c1"));
    ASSERT_TRUE(gone);
    EXPECT_EQ(gone->player_id, 2);
    EXPECT_TRUE(h.transport.For("c2").empty());

    // bob comes back on a new connection
    h.Send("c5", cn::BuildJoinGame(id, "bob", 3));
    auto back = Last<cn::GameJoinedMsg>(h.transport.For("c5"));
    ASSERT_TRUE(back);
    EXPECT_EQ(back->player_id, 2);
}

TEST(GameService, QueueAndMatch)
{
    Harness h;
    h.Send("c1", cn::BuildEnqueue("alice", 1200, 1));
    h.Send("c2", cn::BuildEnqueue("bob", 1100, 2));

    auto q1 = Last<cn::QueueStatusMsg>(h.transport.For("c1"));
    auto q2 = Last<cn::QueueStatusMsg>(h.transport.For("c2"));
    ASSERT_TRUE(q1);
    ASSERT_TRUE(q2);
    EXPECT_EQ(q1->position, 1);
    EXPECT_EQ(q2->position, 2);
    EXPECT_TRUE(q2->queued);

    h.Send("c1", cn::BuildEnqueue("alice", 1200, 3));
    auto dup = Last<cn::ErrorReply>(h.transport.For("c1"));
    ASSERT_TRUE(dup);
    EXPECT_EQ(dup->kind, cn::ErrorKind::Matchmaking);

    EXPECT_EQ(h.matchmaking.Tick(), 1u);
    auto m1 = Last<cn::MatchFoundMsg>(h.transport.For("c1"));
    auto m2 = Last<cn::MatchFoundMsg>(h.transport.For("c2"));
    ASSERT_TRUE(m1);
    ASSERT_TRUE(m2);
    EXPECT_EQ(m1->game_id, m2->game_id);
    EXPECT_EQ(m1->player_id, 1);
    EXPECT_EQ(m2->player_id, 2);
    EXPECT_EQ(m1->opponent_name, "bob");

    // already seated by matchmaking; joining again is a reconnect
    h.Send("c2", cn::BuildJoinGame(m2->game_id, "bob", 4));
    auto joined = Last<cn::GameJoinedMsg>(h.transport.For("c2"));
    ASSERT_TRUE(joined);
    EXPECT_EQ(joined->player_id, 2);
}

TEST(GameService, DequeueReportsStatus)
{
    Harness h;
    h.Send("c1", cn::BuildDequeue(1));
    auto err = Last<cn::ErrorReply>(h.transport.For("c1"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->message, "You are not in the matchmaking queue.");

    h.Send("c1", cn::BuildEnqueue("alice", 1000, 2));
    h.Send("c1", cn::BuildDequeue(3));
    auto st = Last<cn::QueueStatusMsg>(h.transport.For("c1"));
    ASSERT_TRUE(st);
    EXPECT_FALSE(st->queued);
    EXPECT_EQ(h.matchmaking.QueueSize(), 0u);

    h.Send("c1", cn::BuildEnqueue("alice", 1000, 4));
    h.service.OnDisconnect("c1");
    EXPECT_EQ(h.matchmaking.QueueSize(), 0u);
}

TEST(GameService, MalformedFrameIsABadRequest)
{
    Harness h;
    std::vector<std::byte> junk(16, std::byte{0x7f});
    h.service.OnMessage("c1", junk);

    auto err = Last<cn::ErrorReply>(h.transport.For("c1"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, cn::ErrorKind::BadRequest);
    EXPECT_EQ(err->message.rfind("Malformed request: ", 0), 0u);
}

TEST(GameService, AiAnswersTheHumanMove)
{
    auto const dir = std::filesystem::temp_directory_path() / "caroquest_service_audit";
    Harness h(server::ServiceConfig{.ai_timeout = 1s, .audit_dir = dir.string()});

    std::string const id = h.Create("c1", "alice", core::Difficulty::Medium);
    EXPECT_EQ(All<cn::GameStartMsg>(h.transport.For("c1")).size(), 1u);
    EXPECT_TRUE(std::filesystem::exists(dir / (id + ".log")));

    h.Send("c1", cn::BuildAction(id, core::PlaceAction{0}, 2));

    bool const answered = WaitFor([&]
    {
        auto upd = Last<cn::StateUpdateMsg>(h.transport.For("c1"));
        return upd && upd->seq_id == 2;
    });
    ASSERT_TRUE(answered);

    auto upd = Last<cn::StateUpdateMsg>(h.transport.For("c1"));
    EXPECT_EQ(upd->state.current_player, 1);
    EXPECT_EQ(upd->state.pawns_placed[1], 1);
    EXPECT_TRUE(WaitFor([&] { return h.service.Ai().Outstanding() == 0; }));
}

TEST(GameService, RemovedGameClosesItsTranscript)
{
    auto const dir = std::filesystem::temp_directory_path() / "caroquest_service_audit_close";
    Harness h(server::ServiceConfig{.audit_dir = dir.string()});

    std::string const kept = h.Create("c1", "alice");
    std::string const dropped = h.Create("c2", "bob");
    ASSERT_EQ(h.service.OpenAudits(), 2u);

    ASSERT_TRUE(h.store.DeleteGame(dropped));
    EXPECT_EQ(h.service.OpenAudits(), 1u);
    EXPECT_TRUE(std::filesystem::exists(dir / (dropped + ".log")));

    // a late action on the removed game is answered, not transcribed
    h.Send("c2", cn::BuildAction(dropped, core::PlaceAction{0}, 2));
    EXPECT_EQ(h.service.OpenAudits(), 1u);
    EXPECT_TRUE(h.store.GetGame(kept).has_value());
}
