#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <print>

#include "../core/Judge.hpp"
#include "../core/RandomAi.hpp"
#include "../core/Rules.hpp"
#include "../core/StandardRules.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"

using namespace caroquest::core;

namespace
{
    constexpr int kMaxPlies = 400;

    struct GameResult
    {
        int plies{0};
        std::optional<PlayerId> winner{};
        bool phase_changed{false};
    };

    // Two AIs through the Judge, every state checked and transcribed.
    auto PlayOut(std::uint64_t seed, Difficulty level, debug::AuditLogger& log, int max_plies = kMaxPlies) -> GameResult
    {
        StandardRules const rules;
        Judge const judge(std::chrono::seconds(2));
        std::shared_ptr<AiOpponent> const seats[2] = {
            std::make_shared<RandomAI>(seed + 1),
            std::make_shared<RandomAI>(seed + 2),
        };

        GameResult result{};
        GameState s = MakeInitialState(GameConfig{});
        log.start(std::format("SELF{}", seed), s, seed);

        while (!s.winner && result.plies < max_plies)
        {
            PlayerId const actor = s.current_player;
            auto snap = std::make_shared<GameState const>(s);
            TimedDecision const d = judge.GetDecision(seats[actor - 1], snap, level);
            if (!d.action)
            {
                // a fully blocked side has nothing to play
                EXPECT_TRUE(rules.LegalActions(s).empty()) << "seed " << seed << " ply " << result.plies;
                break;
            }

            log.turn(s, actor, *d.action);
            auto next = rules.Apply(s, *d.action);
            if (!next)
            {
                log.rejected(next.error());
                ADD_FAILURE() << "AI chose an illegal action: " << error::describe(next.error());
                break;
            }

            MoveOutcome const out = ClassifyOutcome(s, *next);
            log.outcome(out);
            if (out == MoveOutcome::PhaseChanged) result.phase_changed = true;

            s = std::move(*next);
            debug::CheckInvariants(s);
            ++result.plies;
        }

        log.end(s);
        result.winner = s.winner;
        return result;
    }
}

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            auto const path = fs::path(std::format("_artifacts/game_{}.log", seed));
            GameResult r{};
            {
                debug::AuditLogger log(path.string());
                ASSERT_TRUE(log.is_open());
                r = PlayOut(seed, Difficulty::Easy, log);
            }

            EXPECT_GE(r.plies, 7);
            if (r.plies >= 2 * constants::PawnsPerPlayer)
            {
                EXPECT_TRUE(r.phase_changed || r.winner.has_value());
            }
            std::print("[SelfPlay] seed {} -> {} plies, winner {}\n", seed, r.plies,
                       r.winner ? static_cast<int>(*r.winner) : 0);

            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        FAIL() << e.to_str();
    }
}

TEST(SelfPlay, HardLevelPlaysLegally)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");

    for (std::uint64_t seed : {5ull, 6ull})
    {
        debug::AuditLogger log(std::format("_artifacts/hard_{}.log", seed));
        GameResult const r = PlayOut(seed, Difficulty::Hard, log, 40);
        EXPECT_GT(r.plies, 0);
    }
}
