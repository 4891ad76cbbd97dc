#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

using namespace caroquest::core;

namespace
{

auto s_square(SquareIdx i, int n) -> std::string
{
    if (i < 0 || n <= 0) return "--";
    return std::format("{}{}", static_cast<char>('a' + i % n), i / n + 1);
}

auto s_action(PlayerAction const& a, int n) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlaceAction>)
            {
                return std::format("Place({})", s_square(act.square, n));
            }
            else if constexpr (std::is_same_v<T, SelectAction>)
            {
                return std::format("Select({})", s_square(act.square, n));
            }
            else if constexpr (std::is_same_v<T, MoveAction>)
            {
                return std::format("Move({}->{})", s_square(act.from, n), s_square(act.to, n));
            }
            else
            {
                return "Deselect";
            }
        },
        a
    );
}

auto s_line(std::vector<SquareIdx> const& line, int n) -> std::string
{
    std::string body;
    for (size_t i{}; i < line.size(); ++i)
    {
        body += (i ? "," : "");
        body += s_square(line[i], n);
    }
    return body;
}

// one row per line, '1'/'2' for pawns, '.' light, ':' dark
auto s_board(GameState const& s) -> std::string
{
    int const n = s.config.board_size;
    std::string out;
    for (int r = 0; r < n; ++r)
    {
        for (int c = 0; c < n; ++c)
        {
            Square const& sq = s.board[static_cast<size_t>(r * n + c)];
            if (sq.pawn)
            {
                out += static_cast<char>('0' + sq.pawn->player);
            }
            else
            {
                out += (sq.color == SquareColor::Light ? '.' : ':');
            }
        }
        out += '\n';
    }
    return out;
}

} // anonymous namespace

namespace caroquest::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(std::string_view game_id, GameState const& s, std::uint64_t seed) -> void
{
    out_ << std::format("Game={}\n", game_id);
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Board={} Pawns={} Line={}\n",
                        s.config.board_size, s.config.pawns_per_player, s.config.win_length);
    out_.flush();
}

auto AuditLogger::turn(GameState const& s, PlayerId actor, PlayerAction const& a) -> void
{
    out_ << std::format(
        "Turn actor=P{} phase={} left=[{},{}] blocked={} dead={}\n",
        static_cast<int>(actor),
        (s.phase == GamePhase::Placement ? "P" : "M"),
        s.pawns_to_place[0],
        s.pawns_to_place[1],
        s.blocked.size(),
        s.dead_zones.size()
    );

    out_ << std::format("Action: {}\n", s_action(a, s.config.board_size));
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    char const* txt =
        (m == MoveOutcome::Applied      ? "Applied" :
        (m == MoveOutcome::PhaseChanged ? "PhaseChanged" :
        (m == MoveOutcome::GameEnded    ? "GameEnded" : "Invalid")));
    out_ << std::format("Outcome: {}\n", txt);
}

auto AuditLogger::rejected(error::RuleViolation const& v) -> void
{
    out_ << std::format("Outcome: Invalid ({})\n", error::describe(v));
}

auto AuditLogger::end(GameState const& s) -> void
{
    out_ << s_board(s);
    int const winner = s.winner ? static_cast<int>(*s.winner) : 0;
    out_ << std::format("Winner={}\n", winner);
    if (s.winning_line)
    {
        out_ << std::format("Line=[{}]\n", s_line(*s.winning_line, s.config.board_size));
    }
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace caroquest::core::debug
