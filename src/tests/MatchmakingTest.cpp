#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <string>
#include <vector>

#include <asio/io_context.hpp>

#include "../server/Matchmaking.hpp"
#include "../server/SessionStore.hpp"

using namespace caroquest;
using namespace std::chrono_literals;

namespace
{
    struct Inbox
    {
        std::map<std::string, std::vector<server::MatchNotification>> by_handle;

        auto Entry(std::string handle, std::string name, server::Clock::time_point at = {}) -> server::MatchmakingEntry
        {
            server::MatchmakingEntry e{};
            e.handle = handle;
            e.name = std::move(name);
            e.enqueued_at = at;
            e.notify = [this, handle](server::MatchNotification const& n) { by_handle[handle].push_back(n); };
            return e;
        }
    };
}

TEST(Matchmaking, PairsTheTwoLongestWaiting)
{
    asio::io_context io;
    server::SessionStore store(io);
    server::MatchmakingProcessor mm(io, store, server::MatchmakingConfig{.pawns_per_player = 5});
    Inbox inbox;

    auto const t0 = server::Clock::now();
    ASSERT_EQ(mm.Enqueue(inbox.Entry("late", "carol", t0 + 2s)).value(), 1u);
    ASSERT_EQ(mm.Enqueue(inbox.Entry("first", "alice", t0)).value(), 2u);
    ASSERT_EQ(mm.Enqueue(inbox.Entry("second", "bob", t0 + 1s)).value(), 3u);

    EXPECT_EQ(mm.Tick(), 1u);
    EXPECT_EQ(mm.QueueSize(), 1u);
    EXPECT_TRUE(mm.IsQueued("late"));
    EXPECT_TRUE(inbox.by_handle["late"].empty());

    ASSERT_EQ(inbox.by_handle["first"].size(), 1u);
    ASSERT_EQ(inbox.by_handle["second"].size(), 1u);
    auto const& a = inbox.by_handle["first"].front();
    auto const& b = inbox.by_handle["second"].front();

    EXPECT_EQ(a.game_id, b.game_id);
    EXPECT_EQ(a.player_id, 1);
    EXPECT_EQ(b.player_id, 2);
    EXPECT_EQ(a.opponent_name, "bob");
    EXPECT_EQ(b.opponent_name, "alice");
    EXPECT_GT(a.timestamp, 0);

    auto s = store.GetGame(a.game_id);
    ASSERT_TRUE(s);
    EXPECT_TRUE(s->options.is_matchmaking);
    EXPECT_TRUE(s->options.is_ranked);
    EXPECT_FALSE(s->options.is_public);
    EXPECT_EQ(s->state.config.pawns_per_player, 5);
    ASSERT_EQ(s->players.size(), 2u);
    EXPECT_EQ(s->players[0].handle, "first");
    EXPECT_EQ(s->players[1].handle, "second");
}

TEST(Matchmaking, EmptyOrSingleQueueMakesNoPairs)
{
    asio::io_context io;
    server::SessionStore store(io);
    server::MatchmakingProcessor mm(io, store);
    Inbox inbox;

    EXPECT_EQ(mm.Tick(), 0u);
    ASSERT_TRUE(mm.Enqueue(inbox.Entry("h1", "alice")));
    EXPECT_EQ(mm.Tick(), 0u);
    EXPECT_EQ(mm.QueueSize(), 1u);
    EXPECT_EQ(store.Size(), 0u);
}

TEST(Matchmaking, DuplicateEnqueueIsRejected)
{
    asio::io_context io;
    server::SessionStore store(io);
    server::MatchmakingProcessor mm(io, store);
    Inbox inbox;

    ASSERT_TRUE(mm.Enqueue(inbox.Entry("h1", "alice")));
    auto again = mm.Enqueue(inbox.Entry("h1", "alice"));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().message, "You are already in the matchmaking queue.");
    EXPECT_EQ(mm.QueueSize(), 1u);
}

TEST(Matchmaking, DequeueRemovesOnlyThatHandle)
{
    asio::io_context io;
    server::SessionStore store(io);
    server::MatchmakingProcessor mm(io, store);
    Inbox inbox;

    ASSERT_TRUE(mm.Enqueue(inbox.Entry("h1", "alice")));
    ASSERT_TRUE(mm.Enqueue(inbox.Entry("h2", "bob")));

    EXPECT_TRUE(mm.Dequeue("h1"));
    EXPECT_FALSE(mm.Dequeue("h1"));
    EXPECT_FALSE(mm.IsQueued("h1"));
    EXPECT_TRUE(mm.IsQueued("h2"));
    EXPECT_EQ(mm.Tick(), 0u);
}

TEST(Matchmaking, FailedJoinRequeuesBothInOrder)
{
    asio::io_context io;
    server::SessionStore store(io);
    server::MatchmakingProcessor mm(io, store);
    Inbox inbox;

    // same display name: the second seat is refused as a name clash
    auto const t0 = server::Clock::now();
    ASSERT_TRUE(mm.Enqueue(inbox.Entry("h1", "sam", t0)));
    ASSERT_TRUE(mm.Enqueue(inbox.Entry("h2", "sam", t0 + 1ms)));

    EXPECT_EQ(mm.Tick(), 0u);
    EXPECT_EQ(mm.QueueSize(), 2u);
    EXPECT_TRUE(mm.IsQueued("h1"));
    EXPECT_TRUE(mm.IsQueued("h2"));
    EXPECT_EQ(store.Size(), 0u);
    EXPECT_TRUE(inbox.by_handle.empty());

    // h1 is still first in line
    ASSERT_TRUE(mm.Enqueue(inbox.Entry("h3", "tess", t0 + 2ms)));
    EXPECT_TRUE(mm.Dequeue("h2"));
    EXPECT_EQ(mm.Tick(), 1u);
    ASSERT_EQ(inbox.by_handle["h1"].size(), 1u);
    EXPECT_EQ(inbox.by_handle["h1"].front().player_id, 1);
    EXPECT_EQ(inbox.by_handle["h3"].front().opponent_name, "sam");
}

TEST(Matchmaking, TimerDrivesPairing)
{
    asio::io_context io;
    server::SessionStore store(io);
    server::MatchmakingProcessor mm(io, store, server::MatchmakingConfig{.tick_interval = 10ms});
    Inbox inbox;

    ASSERT_TRUE(mm.Enqueue(inbox.Entry("h1", "alice")));
    ASSERT_TRUE(mm.Enqueue(inbox.Entry("h2", "bob")));

    mm.Start();
    io.run_for(100ms);
    mm.Stop();

    EXPECT_EQ(mm.QueueSize(), 0u);
    EXPECT_EQ(inbox.by_handle["h1"].size(), 1u);
    EXPECT_EQ(inbox.by_handle["h2"].size(), 1u);
    EXPECT_EQ(store.Size(), 1u);
}
