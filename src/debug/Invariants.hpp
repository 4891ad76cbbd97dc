//
// Invariants.hpp
//

#ifndef CAROQUEST_INVARIANTS_HPP
#define CAROQUEST_INVARIANTS_HPP

#include <format>
#include <set>

#include "../core/Board.hpp"
#include "../core/Exception.hpp"
#include "../core/State.hpp"

namespace caroquest::core::debug
{
    // A second layer of checks on top of the rule engine. Throws AssertionError on the first failure.
    inline auto CheckInvariants(GameState const& s) -> void
    {
#if CQ_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        int const n = s.config.board_size;
        CQ_ASSERT(s.board.size() == static_cast<std::size_t>(n * n),
                  std::format("board has {} squares for size {}", s.board.size(), n));
        CQ_ASSERT(IsPlayer(s.current_player), std::format("current player {}", static_cast<int>(s.current_player)));

        // 1) every pawn stands on its owner's color, ids are unique
        std::array<int, 2> on_board{0, 0};
        std::set<std::string> ids;
        for (Square const& sq : s.board)
        {
            CQ_ASSERT(sq.index == sq.row * n + sq.col, std::format("square {} has row {} col {}", sq.index, sq.row, sq.col));
            CQ_ASSERT(sq.color == SquareColorAt(sq.row, sq.col), std::format("square {} has the wrong color", sq.index));
            if (!sq.pawn) continue;

            CQ_ASSERT(IsPlayer(sq.pawn->player), std::format("pawn {} has owner {}", sq.pawn->id, static_cast<int>(sq.pawn->player)));
            CQ_ASSERT(sq.pawn->color == ColorOf(sq.pawn->player), std::format("pawn {} has the wrong color", sq.pawn->id));
            CQ_ASSERT(sq.color == sq.pawn->color, std::format("pawn {} stands on square {} of the other color", sq.pawn->id, sq.index));
            CQ_ASSERT(ids.insert(sq.pawn->id).second, std::format("duplicate pawn id {}", sq.pawn->id));
            ++on_board[sq.pawn->player == 1 ? 0 : 1];
        }

        // 2) pawn accounting
        for (PlayerId p : {PlayerId{1}, PlayerId{2}})
        {
            int const i = p == 1 ? 0 : 1;
            CQ_ASSERT(s.pawns_to_place[i] >= 0, std::format("player {} has negative remaining pawns", i + 1));
            CQ_ASSERT(s.pawns_to_place[i] + s.pawns_placed[i] == s.config.pawns_per_player,
                      std::format("player {}: placed {} + remaining {} != {}", i + 1,
                                  s.pawns_placed[i], s.pawns_to_place[i], s.config.pawns_per_player));
            CQ_ASSERT(on_board[i] == s.pawns_placed[i],
                      std::format("player {}: {} pawns on board, {} placed", i + 1, on_board[i], s.pawns_placed[i]));
        }

        // 3) phase consistency
        bool const all_placed = s.pawns_to_place[0] == 0 && s.pawns_to_place[1] == 0;
        CQ_ASSERT((s.phase == GamePhase::Movement) == all_placed, "phase does not match remaining pawns");

        // 4) derived sets agree with a fresh scan
        board::Analysis const fresh = board::Analyze(s.board, n);
        CQ_ASSERT(fresh.blocked == s.blocked, "blocked set is stale");
        CQ_ASSERT(fresh.blocking == s.blocking, "blocking set is stale");
        CQ_ASSERT(fresh.dead_zones == s.dead_zones, "dead zone map is stale");
        CQ_ASSERT(fresh.dead_zone_creators == s.dead_zone_creators, "dead zone creators are stale");

        // 5) a reported line is made of eligible squares of the winner
        if (s.winner)
        {
            CQ_ASSERT(s.winning_line.has_value(), "winner without a winning line");
            for (SquareIdx const idx : *s.winning_line)
            {
                CQ_ASSERT(board::IsWinEligible(s, idx, *s.winner), std::format("square {} is not win-eligible", idx));
            }
        }
        else
        {
            CQ_ASSERT(!s.winning_line.has_value(), "winning line without a winner");
        }
#endif // CQ_ENABLE_TEST_HOOKS == true
    }
}
#endif //CAROQUEST_INVARIANTS_HPP
