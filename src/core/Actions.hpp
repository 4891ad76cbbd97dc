//
// Actions.hpp
//

#ifndef CAROQUEST_ACTIONS_HPP
#define CAROQUEST_ACTIONS_HPP

#include "Types.hpp"

namespace caroquest::core
{
    struct PlaceAction    { SquareIdx square{constants::NoIndex}; };
    struct SelectAction   { SquareIdx square{constants::NoIndex}; };
    // from must be the current selection unless the caller selects first
    struct MoveAction     { SquareIdx from{constants::NoIndex}; SquareIdx to{constants::NoIndex}; };
    struct DeselectAction {};

    using PlayerAction = std::variant<
      PlaceAction, SelectAction, MoveAction, DeselectAction>;

    enum class MoveOutcome : std::uint8_t
    {
        Invalid,
        Applied,
        PhaseChanged,
        GameEnded
    };
} // namespace caroquest::core

#endif //CAROQUEST_ACTIONS_HPP
