//
// Types.hpp
//

#ifndef CAROQUEST_TYPES_HPP
#define CAROQUEST_TYPES_HPP

#define CQ_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <array>
#include <variant>

namespace caroquest::core::constants
{
    inline constexpr int BoardSize = 8;
    inline constexpr int PawnsPerPlayer = 6;
    inline constexpr int WinningLineLength = 4;
    inline constexpr int MaxBoardSize = 64;
    inline constexpr int NoIndex = -1;
}

namespace caroquest::core
{
    // 1 or 2; 0 is used on the wire for "nobody"
    using PlayerId = std::int8_t;
    using SquareIdx = int;

    enum class SquareColor : std::int8_t
    {
        Light = 0,
        Dark
    };

    enum class GamePhase : std::int8_t
    {
        Placement = 0,
        Movement
    };

    enum class Highlight : std::int8_t
    {
        None = 0,
        SelectedPawn,
        ValidMove,
        DeadZoneIndicator
    };

    struct Pawn
    {
        std::string id;
        PlayerId player{1};
        SquareColor color{SquareColor::Light};

        auto operator==(Pawn const&) const -> bool = default;
    };

    struct Square
    {
        SquareIdx index{};
        int row{};
        int col{};
        SquareColor color{SquareColor::Light};
        std::optional<Pawn> pawn{};
        Highlight highlight{Highlight::None};

        auto operator==(Square const&) const -> bool = default;
    };

    struct GameConfig
    {
        int board_size{constants::BoardSize};
        int pawns_per_player{constants::PawnsPerPlayer};
        int win_length{constants::WinningLineLength};
        bool is_public{false};
        bool is_matchmaking{false};
        bool is_ranked{false};

        auto operator==(GameConfig const&) const -> bool = default;
    };

    // Player 1 plays the light squares, player 2 the dark ones.
    constexpr auto ColorOf(PlayerId p) noexcept -> SquareColor
    {
        return p == 1 ? SquareColor::Light : SquareColor::Dark;
    }

    constexpr auto Opponent(PlayerId p) noexcept -> PlayerId
    {
        return p == 1 ? PlayerId{2} : PlayerId{1};
    }

    constexpr auto IsPlayer(int p) noexcept -> bool
    {
        return p == 1 || p == 2;
    }

    constexpr auto SquareColorAt(int row, int col) noexcept -> SquareColor
    {
        return (row + col) % 2 == 0 ? SquareColor::Light : SquareColor::Dark;
    }
}

#endif //CAROQUEST_TYPES_HPP
