//
// Board.cpp
//

#include "Board.hpp"

#include <algorithm>
#include <format>

#include "Exception.hpp"

namespace caroquest::core
{
    auto InitializeBoard(int board_size) -> std::vector<Square>
    {
        CQ_ASSERT(board_size > 0, std::format("board size must be positive, got {}", board_size));

        std::vector<Square> board;
        board.reserve(static_cast<std::size_t>(board_size * board_size));
        for (int row = 0; row < board_size; ++row)
        {
            for (int col = 0; col < board_size; ++col)
            {
                board.push_back(Square{
                    .index = row * board_size + col,
                    .row = row,
                    .col = col,
                    .color = SquareColorAt(row, col),
                });
            }
        }
        return board;
    }

    auto MakeInitialState(GameConfig const& cfg) -> GameState
    {
        GameState s{};
        s.config = cfg;
        s.board = InitializeBoard(cfg.board_size);
        s.pawns_to_place = {cfg.pawns_per_player, cfg.pawns_per_player};
        s.pawns_placed = {0, 0};
        return s;
    }
}

namespace caroquest::core::board
{
    namespace
    {
        struct Axis
        {
            int dr;
            int dc;
        };

        constexpr Axis kHorizontal{0, 1};
        constexpr Axis kVertical{1, 0};

        auto At(std::vector<Square> const& board, int n, int row, int col) -> Square const*
        {
            if (row < 0 || col < 0 || row >= n || col >= n) return nullptr;
            return &board[static_cast<std::size_t>(row * n + col)];
        }

        auto Owner(Square const* sq) -> PlayerId
        {
            return (sq && sq->pawn) ? sq->pawn->player : PlayerId{0};
        }
    }

    auto Analyze(std::vector<Square> const& board, int board_size) -> Analysis
    {
        CQ_ASSERT(board.size() == static_cast<std::size_t>(board_size * board_size),
                  std::format("board has {} squares, expected {}", board.size(), board_size * board_size));

        Analysis out{};
        for (Square const& centre : board)
        {
            for (Axis const ax : {kHorizontal, kVertical})
            {
                Square const* a = At(board, board_size, centre.row - ax.dr, centre.col - ax.dc);
                Square const* b = At(board, board_size, centre.row + ax.dr, centre.col + ax.dc);
                PlayerId const end = Owner(a);
                if (end == 0 || end != Owner(b)) continue;

                if (centre.pawn)
                {
                    if (centre.pawn->player == end) continue;
                    out.blocked.insert(centre.index);
                    out.blocking.insert(a->index);
                    out.blocking.insert(b->index);
                }
                else if (centre.color == ColorOf(end))
                {
                    out.dead_zones[centre.index] = Opponent(end);
                    out.dead_zone_creators.insert(a->index);
                    out.dead_zone_creators.insert(b->index);
                }
            }
        }
        return out;
    }

    auto RecomputeAnalysis(GameState& s) -> void
    {
        Analysis a = Analyze(s.board, s.config.board_size);
        s.blocked = std::move(a.blocked);
        s.blocking = std::move(a.blocking);
        s.dead_zones = std::move(a.dead_zones);
        s.dead_zone_creators = std::move(a.dead_zone_creators);
    }

    auto IsSandwichedBy(GameState const& s, SquareIdx idx, PlayerId opponent) -> bool
    {
        auto const& sq = s.board[static_cast<std::size_t>(idx)];
        for (Axis const ax : {kHorizontal, kVertical})
        {
            if (s.OwnerAt(sq.row - ax.dr, sq.col - ax.dc) == opponent &&
                s.OwnerAt(sq.row + ax.dr, sq.col + ax.dc) == opponent)
            {
                return true;
            }
        }
        return false;
    }

    auto IsWinEligible(GameState const& s, SquareIdx idx, PlayerId p) -> bool
    {
        auto const& sq = s.board[static_cast<std::size_t>(idx)];
        if (!sq.pawn || sq.pawn->player != p) return false;
        if (sq.color != ColorOf(p)) return false;
        if (s.blocked.contains(idx) || s.blocking.contains(idx) || s.dead_zone_creators.contains(idx)) return false;

        auto const dz = s.dead_zones.find(idx);
        return dz == s.dead_zones.end() || dz->second != p;
    }

    auto FindWinningLine(GameState const& s, PlayerId p) -> std::optional<std::vector<SquareIdx>>
    {
        int const n = s.config.board_size;
        int const k = s.config.win_length;
        constexpr std::array<Axis, 2> diagonals{Axis{1, 1}, Axis{1, -1}};

        for (int r = 0; r < n; ++r)
        {
            for (int c = 0; c < n; ++c)
            {
                for (Axis const d : diagonals)
                {
                    int const last_r = r + d.dr * (k - 1);
                    int const last_c = c + d.dc * (k - 1);
                    if (last_r >= n || last_c < 0 || last_c >= n) continue;

                    std::vector<SquareIdx> line;
                    line.reserve(static_cast<std::size_t>(k));
                    for (int step = 0; step < k; ++step)
                    {
                        SquareIdx const idx = (r + d.dr * step) * n + (c + d.dc * step);
                        if (!IsWinEligible(s, idx, p)) break;
                        line.push_back(idx);
                    }
                    if (static_cast<int>(line.size()) == k) return line;
                }
            }
        }
        return std::nullopt;
    }

    auto ClearMarks(GameState& s) -> void
    {
        for (Square& sq : s.board)
        {
            sq.highlight = Highlight::None;
        }
        s.selected.reset();
        s.highlighted.clear();
    }

    auto SanitizeConfig(GameConfig& cfg) -> void
    {
        if (cfg.board_size <= 0 || cfg.board_size > constants::MaxBoardSize)
            cfg.board_size = constants::BoardSize;

        if (cfg.win_length <= 0 || cfg.win_length > cfg.board_size)
            cfg.win_length = std::min(constants::WinningLineLength, cfg.board_size);

        int const per_color = std::max(1, cfg.board_size * cfg.board_size / 2);
        if (cfg.pawns_per_player <= 0 || cfg.pawns_per_player > per_color)
            cfg.pawns_per_player = std::min(constants::PawnsPerPlayer, per_color);
    }

    auto Normalize(GameState& s) -> void
    {
        SanitizeConfig(s.config);
        int const n = s.config.board_size;
        int const supply = s.config.pawns_per_player;

        if (s.board.size() != static_cast<std::size_t>(n * n))
        {
            s.board = InitializeBoard(n);
        }

        std::array<int, 2> on_board{0, 0};
        for (std::size_t i = 0; i < s.board.size(); ++i)
        {
            Square& sq = s.board[i];
            sq.index = static_cast<SquareIdx>(i);
            sq.row = sq.index / n;
            sq.col = sq.index % n;
            sq.color = SquareColorAt(sq.row, sq.col);

            if (!sq.pawn) continue;
            PlayerId const p = sq.pawn->player;
            if (!IsPlayer(p) || sq.color != ColorOf(p) || on_board[p - 1] >= supply)
            {
                sq.pawn.reset();
                continue;
            }
            sq.pawn->color = ColorOf(p);
            ++on_board[p - 1];
        }

        for (int i = 0; i < 2; ++i)
        {
            s.pawns_placed[i] = on_board[i];
            s.pawns_to_place[i] = supply - on_board[i];
        }
        s.phase = (s.pawns_to_place[0] == 0 && s.pawns_to_place[1] == 0) ? GamePhase::Movement : GamePhase::Placement;

        if (!IsPlayer(s.current_player)) s.current_player = 1;
        if (s.winner && !IsPlayer(*s.winner)) s.winner.reset();
        if (s.selected && !s.InBounds(*s.selected)) s.selected.reset();
        if (s.last_move)
        {
            if (!s.InBounds(s.last_move->to)) s.last_move.reset();
            else if (s.last_move->from && !s.InBounds(*s.last_move->from)) s.last_move->from.reset();
        }
        if (s.winning_line)
        {
            bool const in_range = std::ranges::all_of(*s.winning_line, [&](SquareIdx i) { return s.InBounds(i); });
            if (!s.winner || s.winning_line->empty() || !in_range) s.winning_line.reset();
        }

        s.highlighted.clear();
        for (Square const& sq : s.board)
        {
            if (sq.highlight == Highlight::ValidMove) s.highlighted.push_back(sq.index);
        }

        RecomputeAnalysis(s);
    }
}
