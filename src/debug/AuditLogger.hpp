//
// AuditLogger.hpp
//

#ifndef CAROQUEST_AUDITLOGGER_HPP
#define CAROQUEST_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>

#include "../core/Actions.hpp"
#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace caroquest::core::debug
{
    // Plain-text transcript of one game.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

        // Session header (game id, seed, board parameters)
        auto start(std::string_view game_id, GameState const& s, std::uint64_t seed) -> void;

        // Before Apply: actor, phase and proposed action
        auto turn(GameState const& s, PlayerId actor, PlayerAction const& a) -> void;

        auto outcome(MoveOutcome m) -> void;

        auto rejected(error::RuleViolation const& v) -> void;

        // Board picture plus winner and line; flushes.
        auto end(GameState const& s) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //CAROQUEST_AUDITLOGGER_HPP
