#include <gtest/gtest.h>
#include <algorithm>
#include <format>
#include <initializer_list>
#include <string>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Board.hpp"
#include "../core/Exception.hpp"
#include "../core/StandardRules.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"
#include "../debug/Invariants.hpp"

using namespace caroquest::core;
using RVC = caroquest::core::error::RuleViolationCode;

namespace
{
    constexpr auto Idx(int row, int col) -> SquareIdx { return row * constants::BoardSize + col; }

    struct Cell
    {
        int row;
        int col;
        PlayerId player;
    };

    // Movement-phase position with every pawn already seated. Both players must own the same number of pawns.
    auto MovementState(std::initializer_list<Cell> cells, PlayerId to_move) -> GameState
    {
        int per_player = 0;
        for (Cell const& c : cells) per_player += (c.player == 1);

        GameConfig cfg{};
        cfg.pawns_per_player = per_player;
        GameState s = MakeInitialState(cfg);

        for (Cell const& c : cells)
        {
            int const slot = c.player == 1 ? 0 : 1;
            s.board[static_cast<std::size_t>(Idx(c.row, c.col))].pawn = Pawn{
                .id = std::format("p{}_{}", static_cast<int>(c.player), s.pawns_placed[slot] + 1),
                .player = c.player,
                .color = ColorOf(c.player),
            };
            ++s.pawns_placed[slot];
            --s.pawns_to_place[slot];
        }
        s.phase = GamePhase::Movement;
        s.current_player = to_move;
        board::RecomputeAnalysis(s);
        return s;
    }

    // Applies placements in order, alternating players, asserting each one is accepted.
    auto PlaceAll(StandardRules const& rules, GameState s, std::initializer_list<SquareIdx> squares) -> GameState
    {
        for (SquareIdx const sq : squares)
        {
            auto next = rules.Apply(s, PlaceAction{sq});
            EXPECT_TRUE(next.has_value()) << "placement at " << sq << " rejected: "
                                          << (next ? "" : error::describe(next.error()));
            if (!next) return s;
            s = std::move(*next);
        }
        return s;
    }
}

TEST(Board, InitialStateLayout)
{
    GameState const s = MakeInitialState(GameConfig{});

    ASSERT_EQ(s.board.size(), 64u);
    EXPECT_EQ(s.current_player, 1);
    EXPECT_EQ(s.phase, GamePhase::Placement);
    EXPECT_EQ(s.pawns_to_place[0], 6);
    EXPECT_EQ(s.pawns_to_place[1], 6);
    EXPECT_FALSE(s.selected.has_value());
    EXPECT_FALSE(s.winner.has_value());

    EXPECT_EQ(s.board[Idx(0, 0)].color, SquareColor::Light);
    EXPECT_EQ(s.board[Idx(0, 1)].color, SquareColor::Dark);
    EXPECT_EQ(s.board[Idx(7, 7)].color, SquareColor::Light);
    EXPECT_EQ(s.board[Idx(3, 5)].row, 3);
    EXPECT_EQ(s.board[Idx(3, 5)].col, 5);

    EXPECT_NO_THROW(debug::CheckInvariants(s));
}

TEST(Rules, PlaceRejectsWrongColorOccupiedAndOutOfBounds)
{
    StandardRules const rules;
    GameState const s0 = MakeInitialState(GameConfig{});

    auto wrong = rules.Apply(s0, PlaceAction{Idx(0, 1)});
    ASSERT_FALSE(wrong);
    EXPECT_EQ(wrong.error().code, RVC::Place_WrongColor);

    auto oob = rules.Apply(s0, PlaceAction{64});
    ASSERT_FALSE(oob);
    EXPECT_EQ(oob.error().code, RVC::Place_OutOfBounds);

    auto neg = rules.Apply(s0, PlaceAction{constants::NoIndex});
    ASSERT_FALSE(neg);
    EXPECT_EQ(neg.error().code, RVC::Place_OutOfBounds);

    // P1 at (0,0), P2 at (0,1); P1 cannot stack on (0,0)
    GameState const s1 = PlaceAll(rules, s0, {Idx(0, 0), Idx(0, 1)});
    auto occ = rules.Apply(s1, PlaceAction{Idx(0, 0)});
    ASSERT_FALSE(occ);
    EXPECT_EQ(occ.error().code, RVC::Place_Occupied);
}

TEST(Rules, PlacementPawnIdsAndLastMove)
{
    StandardRules const rules;
    GameState const s = PlaceAll(rules, MakeInitialState(GameConfig{}), {Idx(0, 0), Idx(0, 3), Idx(2, 2)});

    ASSERT_TRUE(s.board[Idx(0, 0)].pawn);
    EXPECT_EQ(s.board[Idx(0, 0)].pawn->id, "p1_1");
    EXPECT_EQ(s.board[Idx(0, 3)].pawn->id, "p2_1");
    EXPECT_EQ(s.board[Idx(2, 2)].pawn->id, "p1_2");
    EXPECT_EQ(s.board[Idx(0, 3)].pawn->color, SquareColor::Dark);

    ASSERT_TRUE(s.last_move);
    EXPECT_FALSE(s.last_move->from.has_value());
    EXPECT_EQ(s.last_move->to, Idx(2, 2));
    EXPECT_EQ(s.current_player, 2);
}

TEST(Rules, PlacementIntoRestrictedZoneIsRejected)
{
    StandardRules const rules;
    // P2 flanks (3,3) horizontally with (3,2) and (3,4)
    GameState const s = PlaceAll(rules, MakeInitialState(GameConfig{}),
                                 {Idx(0, 0), Idx(3, 2), Idx(0, 2), Idx(3, 4)});

    ASSERT_EQ(s.current_player, 1);
    // the flanked centre is the other color, so no dead zone forms
    EXPECT_TRUE(s.dead_zones.empty());
    EXPECT_TRUE(s.dead_zone_creators.empty());

    auto res = rules.Apply(s, PlaceAction{Idx(3, 3)});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, RVC::Place_RestrictedZone);

    auto const v = rules.Validate(s, PlaceAction{Idx(3, 3)});
    EXPECT_FALSE(v);
}

TEST(Rules, PhaseSwitchesOnceAfterLastPlacement)
{
    StandardRules const rules;
    std::vector<SquareIdx> const order{
        Idx(0, 0), Idx(1, 2),
        Idx(0, 4), Idx(1, 6),
        Idx(4, 0), Idx(5, 2),
        Idx(4, 4), Idx(5, 6),
        Idx(7, 1), Idx(2, 5),
        Idx(7, 5), Idx(6, 3),
    };

    GameState s = MakeInitialState(GameConfig{});
    int switches = 0;
    for (std::size_t i = 0; i < order.size(); ++i)
    {
        auto next = rules.Apply(s, PlaceAction{order[i]});
        ASSERT_TRUE(next) << "step " << i << ": " << error::describe(next.error());

        if (next->phase != s.phase) ++switches;
        s = std::move(*next);

        for (int p = 0; p < 2; ++p)
        {
            EXPECT_EQ(s.pawns_placed[p] + s.pawns_to_place[p], s.config.pawns_per_player);
        }
        EXPECT_TRUE(s.blocked.empty());
        EXPECT_TRUE(s.blocking.empty());
        EXPECT_NO_THROW(debug::CheckInvariants(s));

        if (i + 1 < order.size())
        {
            EXPECT_EQ(s.phase, GamePhase::Placement) << "step " << i;
        }
    }

    EXPECT_EQ(switches, 1);
    EXPECT_EQ(s.phase, GamePhase::Movement);
    EXPECT_EQ(s.current_player, 1);
    EXPECT_FALSE(s.winner.has_value());

    auto late = rules.Apply(s, PlaceAction{Idx(2, 0)});
    ASSERT_FALSE(late);
    EXPECT_EQ(late.error().code, RVC::WrongPhase_PlacementRequired);
}

TEST(Rules, DiagonalPlacementWins)
{
    StandardRules const rules;
    GameState const s = PlaceAll(rules, MakeInitialState(GameConfig{}),
                                 {Idx(0, 0), Idx(0, 7), Idx(1, 1), Idx(4, 7), Idx(2, 2), Idx(7, 0), Idx(3, 3)});

    ASSERT_TRUE(s.winner);
    EXPECT_EQ(*s.winner, 1);
    ASSERT_TRUE(s.winning_line);
    EXPECT_EQ(*s.winning_line, (std::vector<SquareIdx>{Idx(0, 0), Idx(1, 1), Idx(2, 2), Idx(3, 3)}));
    EXPECT_EQ(s.current_player, 1);
    EXPECT_NO_THROW(debug::CheckInvariants(s));

    // nothing leaves game over
    auto after = rules.Apply(s, PlaceAction{Idx(5, 5)});
    ASSERT_FALSE(after);
    EXPECT_EQ(after.error().code, RVC::GameOver);
    EXPECT_TRUE(rules.LegalActions(s).empty());
}

TEST(Rules, BlockingPawnBreaksTheLine)
{
    StandardRules const rules;
    // P1 sandwiches the P2 pawn on (1,2) with (1,1) and (1,3); (1,1) is then part of the diagonal
    GameState const s = PlaceAll(rules, MakeInitialState(GameConfig{}),
                                 {Idx(1, 1), Idx(1, 2), Idx(1, 3), Idx(0, 7), Idx(0, 0), Idx(4, 7),
                                  Idx(2, 2), Idx(7, 0), Idx(3, 3)});

    EXPECT_TRUE(s.blocked.contains(Idx(1, 2)));
    EXPECT_TRUE(s.blocking.contains(Idx(1, 1)));
    EXPECT_TRUE(s.blocking.contains(Idx(1, 3)));
    EXPECT_FALSE(s.winner.has_value());
    EXPECT_FALSE(board::FindWinningLine(s, 1).has_value());
    EXPECT_FALSE(board::IsWinEligible(s, Idx(1, 1), 1));
}

TEST(Rules, FlankingAnOpponentColoredSquareKeepsTheLine)
{
    StandardRules const rules;
    // (0,0) and (0,2) flank the empty dark square (0,1)
    GameState const s = PlaceAll(rules, MakeInitialState(GameConfig{}),
                                 {Idx(0, 2), Idx(0, 7), Idx(0, 0), Idx(4, 7), Idx(1, 1), Idx(7, 0),
                                  Idx(2, 2), Idx(6, 1), Idx(3, 3)});

    EXPECT_TRUE(s.dead_zones.empty());
    EXPECT_FALSE(s.dead_zone_creators.contains(Idx(0, 0)));
    ASSERT_TRUE(s.winner);
    EXPECT_EQ(*s.winner, 1);
    EXPECT_EQ(*s.winning_line, (std::vector<SquareIdx>{Idx(0, 0), Idx(1, 1), Idx(2, 2), Idx(3, 3)}));
}

TEST(Rules, DeadZoneCreatorIsNotWinEligible)
{
    GameState s = MovementState({
        {0, 0, 1}, {1, 1, 1}, {2, 2, 1}, {3, 3, 1}, {1, 3, 1},
        {0, 7, 2}, {4, 7, 2}, {7, 0, 2}, {6, 1, 2}, {5, 0, 2},
    }, 1);
    ASSERT_TRUE(board::FindWinningLine(s, 1).has_value());

    // a checkerboard never puts P1's color between two P1 pawns; repaint (1,2) to get one
    s.board[Idx(1, 2)].color = SquareColor::Light;
    board::RecomputeAnalysis(s);

    ASSERT_TRUE(s.dead_zones.contains(Idx(1, 2)));
    EXPECT_EQ(s.dead_zones.at(Idx(1, 2)), 2);
    EXPECT_TRUE(s.dead_zone_creators.contains(Idx(1, 1)));
    EXPECT_TRUE(s.dead_zone_creators.contains(Idx(1, 3)));
    EXPECT_FALSE(board::IsWinEligible(s, Idx(1, 1), 1));
    EXPECT_FALSE(board::FindWinningLine(s, 1).has_value());
}

TEST(Rules, BlockedPawnCannotMove)
{
    StandardRules const rules;
    GameState const s = MovementState({
        {1, 1, 1}, {1, 3, 1},
        {1, 2, 2}, {6, 1, 2},
    }, 2);

    ASSERT_TRUE(s.blocked.contains(Idx(1, 2)));

    auto sel = rules.Validate(s, SelectAction{Idx(1, 2)});
    ASSERT_FALSE(sel);
    EXPECT_EQ(sel.error().code, RVC::Select_PawnBlocked);

    GameState const h = rules.HighlightValidMoves(s, Idx(1, 2));
    EXPECT_FALSE(h.selected.has_value());
    EXPECT_TRUE(h.highlighted.empty());

    auto mv = rules.Apply(s, MoveAction{Idx(1, 2), Idx(3, 2)});
    ASSERT_FALSE(mv);
    EXPECT_EQ(mv.error().code, RVC::Select_PawnBlocked);

    for (PlayerAction const& a : rules.LegalActions(s))
    {
        auto const* m = std::get_if<MoveAction>(&a);
        ASSERT_NE(m, nullptr);
        EXPECT_NE(m->from, Idx(1, 2));
    }
}

TEST(Rules, HighlightOffersEveryEmptySquareOfOwnColor)
{
    StandardRules const rules;
    // P2 sandwiches (3,3); that only restricts placement
    GameState const s = MovementState({
        {0, 0, 1}, {7, 7, 1},
        {3, 2, 2}, {3, 4, 2},
    }, 1);

    GameState const h = rules.HighlightValidMoves(s, Idx(0, 0));
    ASSERT_TRUE(h.selected);
    EXPECT_EQ(*h.selected, Idx(0, 0));
    EXPECT_EQ(h.board[Idx(0, 0)].highlight, Highlight::SelectedPawn);

    // 32 light squares, two of them taken by P1
    EXPECT_EQ(h.highlighted.size(), 30u);
    EXPECT_TRUE(std::ranges::contains(h.highlighted, Idx(3, 3)));
    EXPECT_TRUE(std::ranges::contains(h.highlighted, Idx(0, 2)));
    for (SquareIdx const t : h.highlighted)
    {
        EXPECT_EQ(h.board[static_cast<std::size_t>(t)].color, SquareColor::Light);
        EXPECT_FALSE(h.board[static_cast<std::size_t>(t)].pawn.has_value());
        EXPECT_EQ(h.board[static_cast<std::size_t>(t)].highlight, Highlight::ValidMove);
    }

    auto moved = rules.Apply(s, MoveAction{Idx(0, 0), Idx(3, 3)});
    ASSERT_TRUE(moved) << error::describe(moved.error());
    ASSERT_TRUE(moved->board[Idx(3, 3)].pawn.has_value());
    EXPECT_EQ(moved->board[Idx(3, 3)].pawn->player, 1);

    GameState const cleared = rules.ClearHighlights(h);
    EXPECT_FALSE(cleared.selected.has_value());
    EXPECT_TRUE(cleared.highlighted.empty());
    EXPECT_EQ(cleared.board[Idx(0, 0)].highlight, Highlight::None);
}

TEST(Rules, MoveMustTargetAHighlightedSquare)
{
    StandardRules const rules;
    GameState const s = MovementState({
        {0, 0, 1}, {7, 7, 1},
        {0, 7, 2}, {7, 0, 2},
    }, 1);

    auto none = rules.MovePawn(s, Idx(0, 0), Idx(0, 2));
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error().code, RVC::Move_NoSelection);

    GameState const h = rules.HighlightValidMoves(s, Idx(0, 0));

    auto other = rules.MovePawn(h, Idx(7, 7), Idx(0, 2));
    ASSERT_FALSE(other);
    EXPECT_EQ(other.error().code, RVC::Move_SourceNotSelected);

    auto dark = rules.MovePawn(h, Idx(0, 0), Idx(0, 1));
    ASSERT_FALSE(dark);
    EXPECT_EQ(dark.error().code, RVC::Move_TargetNotHighlighted);

    auto occupied = rules.MovePawn(h, Idx(0, 0), Idx(7, 7));
    ASSERT_FALSE(occupied);
    EXPECT_EQ(occupied.error().code, RVC::Move_TargetNotHighlighted);

    auto ok = rules.MovePawn(h, Idx(0, 0), Idx(0, 2));
    ASSERT_TRUE(ok);
    EXPECT_FALSE(ok->board[Idx(0, 0)].pawn.has_value());
    ASSERT_TRUE(ok->board[Idx(0, 2)].pawn.has_value());
    EXPECT_EQ(ok->board[Idx(0, 2)].pawn->id, "p1_1");
    EXPECT_EQ(ok->current_player, 2);
    EXPECT_FALSE(ok->selected.has_value());
    ASSERT_TRUE(ok->last_move);
    EXPECT_EQ(ok->last_move->from, Idx(0, 0));
    EXPECT_EQ(ok->last_move->to, Idx(0, 2));
}

TEST(Rules, DeselectClearsSelectionWithoutPassingTheTurn)
{
    StandardRules const rules;
    GameState const s = MovementState({
        {0, 0, 1}, {7, 7, 1},
        {0, 7, 2}, {7, 0, 2},
    }, 1);

    GameState const h = rules.HighlightValidMoves(s, Idx(0, 0));
    ASSERT_TRUE(h.selected);
    ASSERT_FALSE(h.highlighted.empty());

    auto cleared = rules.Apply(h, DeselectAction{});
    ASSERT_TRUE(cleared);
    EXPECT_FALSE(cleared->selected.has_value());
    EXPECT_TRUE(cleared->highlighted.empty());
    EXPECT_EQ(cleared->current_player, 1);
    for (auto const& sq : cleared->board) EXPECT_EQ(sq.highlight, Highlight::None);
}

TEST(Rules, BareMoveSelectsImplicitly)
{
    StandardRules const rules;
    GameState const s = MovementState({
        {0, 0, 1}, {1, 1, 1}, {2, 2, 1}, {5, 5, 1},
        {0, 7, 2}, {7, 0, 2}, {6, 1, 2}, {4, 7, 2},
    }, 1);

    // opponent pawns cannot be moved
    auto theirs = rules.Apply(s, MoveAction{Idx(0, 7), Idx(1, 6)});
    ASSERT_FALSE(theirs);
    EXPECT_EQ(theirs.error().code, RVC::Select_NotOwnPawn);

    auto won = rules.Apply(s, MoveAction{Idx(5, 5), Idx(3, 3)});
    ASSERT_TRUE(won) << error::describe(won.error());
    ASSERT_TRUE(won->winner);
    EXPECT_EQ(*won->winner, 1);
    EXPECT_EQ(*won->winning_line, (std::vector<SquareIdx>{Idx(0, 0), Idx(1, 1), Idx(2, 2), Idx(3, 3)}));
    EXPECT_EQ(won->last_move->from, Idx(5, 5));
    EXPECT_NO_THROW(debug::CheckInvariants(*won));
}

TEST(Rules, WinningLineFollowsScanOrder)
{
    // two disjoint lines; the one starting on the earlier row is reported
    GameState const s = MovementState({
        {0, 0, 1}, {1, 1, 1}, {2, 2, 1}, {3, 3, 1}, {4, 0, 1}, {5, 1, 1}, {6, 2, 1}, {7, 3, 1},
        {0, 7, 2}, {1, 6, 2}, {2, 7, 2}, {3, 6, 2}, {4, 7, 2}, {5, 6, 2}, {6, 7, 2}, {7, 6, 2},
    }, 1);

    auto line = board::FindWinningLine(s, 1);
    ASSERT_TRUE(line);
    EXPECT_EQ(*line, (std::vector<SquareIdx>{Idx(0, 0), Idx(1, 1), Idx(2, 2), Idx(3, 3)}));
    EXPECT_FALSE(board::FindWinningLine(s, 2).has_value());
}

TEST(Errors, BrokenInvariantCarriesCodeAndGame)
{
    try
    {
        (void)InitializeBoard(0);
        FAIL() << "a zero-sized board was accepted";
    }
    catch (error::AssertionError& e)
    {
        EXPECT_EQ(e.data(), error::Code::Assertion);
        EXPECT_EQ(e.code_name(), "assertion");
        EXPECT_FALSE(e.game().has_value());

        e.with_game("ABCD1234").with_game("OTHER");
        ASSERT_TRUE(e.game().has_value());
        EXPECT_EQ(*e.game(), "ABCD1234");

        std::string const text = std::format("{}", e);
        EXPECT_NE(text.find("[assertion] game ABCD1234:"), std::string::npos) << text;
        EXPECT_NE(text.find("board size must be positive"), std::string::npos) << text;
    }
}
