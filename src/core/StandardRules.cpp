//
// StandardRules.cpp
//

#include "StandardRules.hpp"

#include "Board.hpp"
#include "Util.hpp"
#include <algorithm>
#include <format>
#include <ranges>

namespace
{
    inline auto Viol(caroquest::core::error::RuleViolationCode code) -> caroquest::core::error::RuleViolation
    {
        return caroquest::core::error::RuleViolation{ .code = code };
    }
}

namespace caroquest::core
{
    using RVC = ::caroquest::core::error::RuleViolationCode;

    // Common tail of a placement or move: analysis, win check for the mover, turn switch.
    static auto Conclude(GameState& s, PlayerId mover) -> void
    {
        board::RecomputeAnalysis(s);

        if (auto line = board::FindWinningLine(s, mover))
        {
            s.winner = mover;
            s.winning_line = std::move(line);
            s.current_player = mover;
            return;
        }
        s.current_player = Opponent(mover);
    }

    auto StandardRules::IsValidPlacement(GameState const& s, SquareIdx square, PlayerId p) -> CheckResult
    {
        if (s.winner)
            return std::unexpected(Viol(RVC::GameOver).with_actor(p));

        if (s.phase != GamePhase::Placement)
            return std::unexpected(Viol(RVC::WrongPhase_PlacementRequired).with_phase(s.phase).with_actor(p));

        if (!s.InBounds(square))
            return std::unexpected(Viol(RVC::Place_OutOfBounds).with_actor(p).with_square(square));

        Square const& sq = s.board[static_cast<std::size_t>(square)];
        if (sq.pawn)
            return std::unexpected(Viol(RVC::Place_Occupied).with_actor(p).with_square(square));

        if (sq.color != ColorOf(p))
            return std::unexpected(Viol(RVC::Place_WrongColor).with_actor(p).with_square(square));

        if (s.RemainingFor(p) <= 0)
            return std::unexpected(Viol(RVC::Place_NoPawnsLeft).with_actor(p).with_phase(s.phase));

        if (board::IsSandwichedBy(s, square, Opponent(p)))
            return std::unexpected(Viol(RVC::Place_RestrictedZone).with_actor(p).with_square(square));

        return {};
    }

    auto StandardRules::CheckSelectable(GameState const& s, SquareIdx square) -> CheckResult
    {
        PlayerId const actor = s.current_player;

        if (s.winner)
            return std::unexpected(Viol(RVC::GameOver).with_actor(actor));

        if (s.phase != GamePhase::Movement)
            return std::unexpected(Viol(RVC::WrongPhase_MovementRequired).with_phase(s.phase).with_actor(actor));

        if (!s.InBounds(square))
            return std::unexpected(Viol(RVC::Select_NotOwnPawn).with_actor(actor).with_square(square));

        Square const& sq = s.board[static_cast<std::size_t>(square)];
        if (!sq.pawn || sq.pawn->player != actor)
            return std::unexpected(Viol(RVC::Select_NotOwnPawn).with_actor(actor).with_square(square));

        if (s.blocked.contains(square))
            return std::unexpected(Viol(RVC::Select_PawnBlocked).with_actor(actor).with_square(square));

        return {};
    }

    auto StandardRules::ValidMoveDestinations(GameState const& s, SquareIdx from) -> std::vector<SquareIdx>
    {
        if (!CheckSelectable(s, from)) return {};

        PlayerId const p = s.current_player;
        auto dests = s.board
            | std::views::filter([&](Square const& sq) { return !sq.pawn && sq.color == ColorOf(p); })
            | std::views::transform([](Square const& sq) { return sq.index; });

        return std::ranges::to<std::vector<SquareIdx>>(dests);
    }

    auto StandardRules::PlacePawn(GameState const& s, SquareIdx square) const -> ApplyResult
    {
        PlayerId const p = s.current_player;
        if (auto ok = IsValidPlacement(s, square, p); !ok)
            return std::unexpected(ok.error());

        GameState next = s;
        board::ClearMarks(next);

        int const slot = p == 1 ? 0 : 1;
        next.board[static_cast<std::size_t>(square)].pawn = Pawn{
            .id = std::format("p{}_{}", static_cast<int>(p), next.pawns_placed[slot] + 1),
            .player = p,
            .color = ColorOf(p),
        };
        --next.pawns_to_place[slot];
        ++next.pawns_placed[slot];

        if (next.pawns_to_place[0] == 0 && next.pawns_to_place[1] == 0)
        {
            next.phase = GamePhase::Movement;
        }

        next.last_move = LastMove{.from = std::nullopt, .to = square};
        Conclude(next, p);
        return next;
    }

    auto StandardRules::HighlightValidMoves(GameState const& s, SquareIdx square) const -> GameState
    {
        if (s.winner) return s;
        if (!CheckSelectable(s, square)) return ClearHighlights(s);

        GameState next = ClearHighlights(s);
        next.highlighted = ValidMoveDestinations(s, square);
        next.selected = square;

        next.board[static_cast<std::size_t>(square)].highlight = Highlight::SelectedPawn;
        for (SquareIdx const t : next.highlighted)
        {
            next.board[static_cast<std::size_t>(t)].highlight = Highlight::ValidMove;
        }
        return next;
    }

    auto StandardRules::MovePawn(GameState const& s, SquareIdx from, SquareIdx to) const -> ApplyResult
    {
        PlayerId const p = s.current_player;

        if (s.winner)
            return std::unexpected(Viol(RVC::GameOver).with_actor(p));

        if (s.phase != GamePhase::Movement)
            return std::unexpected(Viol(RVC::WrongPhase_MovementRequired).with_phase(s.phase).with_actor(p));

        if (!s.selected)
            return std::unexpected(Viol(RVC::Move_NoSelection).with_actor(p).with_square(from));

        if (*s.selected != from)
            return std::unexpected(Viol(RVC::Move_SourceNotSelected)
                                   .with_actor(p).with_square(from).with_selected(s.selected));

        if (auto ok = CheckSelectable(s, from); !ok)
            return std::unexpected(ok.error());

        if (!util::Contains(s.highlighted, to) || !s.InBounds(to) || s.board[static_cast<std::size_t>(to)].pawn)
            return std::unexpected(Viol(RVC::Move_TargetNotHighlighted)
                                   .with_actor(p).with_square(from).with_target(to));

        GameState next = s;
        board::ClearMarks(next);

        auto& src = next.board[static_cast<std::size_t>(from)];
        next.board[static_cast<std::size_t>(to)].pawn = std::move(src.pawn);
        src.pawn.reset();

        next.last_move = LastMove{.from = from, .to = to};
        Conclude(next, p);
        return next;
    }

    auto StandardRules::ClearHighlights(GameState const& s) const -> GameState
    {
        GameState next = s;
        board::ClearMarks(next);
        return next;
    }

    auto StandardRules::Validate(GameState const& s, PlayerAction const& a) const -> CheckResult
    {
        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlaceAction>)
            {
                return IsValidPlacement(s, act.square, s.current_player);
            }
            else if constexpr (std::is_same_v<T, SelectAction>)
            {
                return CheckSelectable(s, act.square);
            }
            else if constexpr (std::is_same_v<T, MoveAction>)
            {
                if (auto ok = CheckSelectable(s, act.from); !ok) return ok;
                if (!util::Contains(ValidMoveDestinations(s, act.from), act.to))
                    return std::unexpected(Viol(RVC::Move_TargetNotHighlighted)
                                           .with_actor(s.current_player)
                                           .with_square(act.from).with_target(act.to));
                return {};
            }
            else
            {
                return {};
            }
        }, a);
    }

    auto StandardRules::Apply(GameState const& s, PlayerAction const& a) const -> ApplyResult
    {
        return std::visit([&]<typename T0>(T0 const& act) -> ApplyResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlaceAction>)
            {
                return PlacePawn(s, act.square);
            }
            else if constexpr (std::is_same_v<T, SelectAction>)
            {
                return HighlightValidMoves(s, act.square);
            }
            else if constexpr (std::is_same_v<T, MoveAction>)
            {
                if (s.selected == act.from)
                {
                    return MovePawn(s, act.from, act.to);
                }
                // select implicitly so that a bare move intent behaves like select + move
                if (auto ok = CheckSelectable(s, act.from); !ok) return std::unexpected(ok.error());
                return MovePawn(HighlightValidMoves(s, act.from), act.from, act.to);
            }
            else
            {
                static_assert(std::is_same_v<T, DeselectAction>);
                return ClearHighlights(s);
            }
        }, a);
    }

    auto StandardRules::LegalActions(GameState const& s) const -> std::vector<PlayerAction>
    {
        std::vector<PlayerAction> out;
        if (s.winner) return out;

        PlayerId const p = s.current_player;
        if (s.phase == GamePhase::Placement)
        {
            for (Square const& sq : s.board)
            {
                if (IsValidPlacement(s, sq.index, p)) out.emplace_back(PlaceAction{sq.index});
            }
            return out;
        }

        for (Square const& sq : s.board)
        {
            if (!sq.pawn || sq.pawn->player != p || s.blocked.contains(sq.index)) continue;
            for (SquareIdx const to : ValidMoveDestinations(s, sq.index))
            {
                out.emplace_back(MoveAction{sq.index, to});
            }
        }
        return out;
    }
}
