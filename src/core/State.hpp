//
// State.hpp
//

#ifndef CAROQUEST_STATE_HPP
#define CAROQUEST_STATE_HPP

#include <map>
#include <set>

#include "Types.hpp"
#include "Actions.hpp"

namespace caroquest::core
{
    struct LastMove
    {
        std::optional<SquareIdx> from{};
        SquareIdx to{constants::NoIndex};

        auto operator==(LastMove const&) const -> bool = default;
    };

    // Canonical value snapshot. Rule functions take one by const& and return a new one.
    struct GameState
    {
        std::vector<Square> board;
        PlayerId current_player{1};
        GamePhase phase{GamePhase::Placement};

        // index 0 -> player 1, index 1 -> player 2
        std::array<int, 2> pawns_to_place{constants::PawnsPerPlayer, constants::PawnsPerPlayer};
        std::array<int, 2> pawns_placed{0, 0};

        std::optional<SquareIdx> selected{};

        // derived; rebuilt by RecomputeAnalysis after every accepted placement or move
        std::set<SquareIdx> blocked;
        std::set<SquareIdx> blocking;
        std::map<SquareIdx, PlayerId> dead_zones; // square -> player it is forbidden for
        std::set<SquareIdx> dead_zone_creators;

        std::optional<PlayerId> winner{};
        std::optional<LastMove> last_move{};
        std::optional<std::vector<SquareIdx>> winning_line{};
        std::vector<SquareIdx> highlighted;

        GameConfig config{};

        auto operator==(GameState const&) const -> bool = default;

        [[nodiscard]]
        auto RemainingFor(PlayerId p) const -> int { return pawns_to_place[p == 1 ? 0 : 1]; }

        [[nodiscard]]
        auto PlacedFor(PlayerId p) const -> int { return pawns_placed[p == 1 ? 0 : 1]; }

        [[nodiscard]]
        auto InBounds(SquareIdx i) const noexcept -> bool
        {
            return i >= 0 && static_cast<std::size_t>(i) < board.size();
        }

        [[nodiscard]]
        auto OwnerAt(int row, int col) const -> PlayerId
        {
            if (row < 0 || col < 0 || row >= config.board_size || col >= config.board_size) return 0;
            auto const& sq = board[static_cast<std::size_t>(row * config.board_size + col)];
            return sq.pawn ? sq.pawn->player : PlayerId{0};
        }
    };

    auto InitializeBoard(int board_size) -> std::vector<Square>;
    auto MakeInitialState(GameConfig const& cfg) -> GameState;

} // namespace caroquest::core

#endif //CAROQUEST_STATE_HPP
