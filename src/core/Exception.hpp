//
// Exception.hpp
//

#ifndef CAROQUEST_EXCEPTION_HPP
#define CAROQUEST_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <string_view>
#include <format>
#include <utility>
#include "Types.hpp"
#include "State.hpp"

namespace caroquest::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rule engine misuse (not an illegal move)
        State, // malformed game state handed to the engine
        Session, // session store misuse
        Timeout, // deadline exceeded waiting for the AI
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    inline auto to_string(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "unknown";
        case Code::Rules: return "rules";
        case Code::State: return "state";
        case Code::Session: return "session";
        case Code::Timeout: return "timeout";
        case Code::Network: return "network";
        case Code::Serialization: return "serialization";
        case Code::Assertion: return "assertion";
        }
        return "unknown";
    }

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SessionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TimeoutError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Session: throw SessionError(std::move(msg), c, loc);
        case Code::Timeout: throw TimeoutError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define CQ_THROW(code_enum, msg) ::caroquest::core::error::fail((code_enum), (msg))
#define CQ_ASSERT(cond, msg) do { if(!(cond)) ::caroquest::core::error::fail(::caroquest::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        GameOver,
        WrongPhase_PlacementRequired,
        WrongPhase_MovementRequired,

        // Place
        Place_OutOfBounds,
        Place_Occupied,
        Place_WrongColor,
        Place_RestrictedZone,
        Place_NoPawnsLeft,

        // Select
        Select_NotOwnPawn,
        Select_PawnBlocked,

        // Move
        Move_NoSelection,
        Move_SourceNotSelected,
        Move_TargetNotHighlighted,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<GamePhase> phase{};
        std::optional<PlayerId> actor{};
        std::optional<SquareIdx> square{};
        std::optional<SquareIdx> target{};
        std::optional<SquareIdx> selected{};

        auto with_phase(GamePhase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlayerId p) -> RuleViolation&
        {
            actor = p;
            return *this;
        }

        auto with_square(SquareIdx i) -> RuleViolation&
        {
            square = i;
            return *this;
        }

        auto with_target(SquareIdx i) -> RuleViolation&
        {
            target = i;
            return *this;
        }

        auto with_selected(std::optional<SquareIdx> i) -> RuleViolation&
        {
            selected = i;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::GameOver: return "Game is already over";
        case E::WrongPhase_PlacementRequired: return "Wrong phase (placement required)";
        case E::WrongPhase_MovementRequired: return "Wrong phase (movement required)";

        case E::Place_OutOfBounds: return "Place: square out of bounds";
        case E::Place_Occupied: return "Place: square occupied";
        case E::Place_WrongColor: return "Place: square is not the player's color";
        case E::Place_RestrictedZone: return "Place: square sandwiched by opponent pawns";
        case E::Place_NoPawnsLeft: return "Place: no pawns left to place";

        case E::Select_NotOwnPawn: return "Select: square does not hold a pawn of the current player";
        case E::Select_PawnBlocked: return "Select: pawn is blocked";

        case E::Move_NoSelection: return "Move: no pawn selected";
        case E::Move_SourceNotSelected: return "Move: source is not the selected pawn";
        case E::Move_TargetNotHighlighted: return "Move: target is not a valid move";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", *v.phase == GamePhase::Placement ? "placement" : "movement");
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.square) s += std::format(" | square={}", *v.square);
        if (v.target) s += std::format(" | target={}", *v.target);
        if (v.selected) s += std::format(" | selected={}", *v.selected);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
    using RuleResult = std::expected<GameState, RuleViolation>;
}

#endif //CAROQUEST_EXCEPTION_HPP
