//
// codec.hpp
//

#ifndef CAROQUEST_CODEC_HPP
#define CAROQUEST_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/AiOpponent.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/caroquest_net_generated.h"

namespace caroquest::core::net
{
    struct ParseError
    {
        std::string message;
    };

    enum class ErrorKind : std::int8_t
    {
        Validation = 0,
        SessionNotFound,
        JoinConflict,
        NotYourTurn,
        BadRequest,
        Matchmaking
    };

    // Wire view of a session player.
    struct PlayerInfo
    {
        PlayerId player_id{1};
        std::string name;
        bool is_connected{false};
        bool is_creator{false};
        std::optional<int> rating{};

        auto operator==(PlayerInfo const&) const -> bool = default;
    };

    auto ToFbColor(SquareColor c) noexcept -> caroquest::gen::net::SquareColor;
    auto ToFbPhase(GamePhase p) noexcept -> caroquest::gen::net::GamePhase;
    auto ToFbHighlight(Highlight h) noexcept -> caroquest::gen::net::Highlight;

    auto FromFbColor(caroquest::gen::net::SquareColor c) noexcept -> SquareColor;
    auto FromFbPhase(caroquest::gen::net::GamePhase p) noexcept -> GamePhase;
    auto FromFbHighlight(caroquest::gen::net::Highlight h) noexcept -> Highlight;

    // ---------- GameState <-> GameStateBuffer ----------

    struct DecodedState
    {
        GameState state;
        std::int64_t seq_id{0};
        std::int64_t timestamp{0};
    };

    auto WriteState(flatbuffers::FlatBufferBuilder& fbb,
                    GameState const& s,
                    std::int64_t seq_id,
                    std::int64_t timestamp)
        -> flatbuffers::Offset<caroquest::gen::net::GameStateBuffer>;

    // Standalone buffer with GameStateBuffer as root.
    auto EncodeState(GameState const& s, std::int64_t seq_id, std::int64_t timestamp)
        -> flatbuffers::DetachedBuffer;

    // Absent fields take their documented defaults; derived sets are regenerated.
    auto ReadState(caroquest::gen::net::GameStateBuffer const& buf) -> DecodedState;

    auto DecodeState(std::span<std::byte const> bytes) -> std::expected<DecodedState, ParseError>;

    // ---------- client -> server ----------

    struct CreateGameRequest
    {
        std::string player_name;
        int pawns_per_player{constants::PawnsPerPlayer};
        bool is_public{false};
        std::optional<Difficulty> ai_difficulty{};
        std::optional<std::string> game_id{};
    };

    struct JoinGameRequest
    {
        std::string game_id;
        std::string player_name;
    };

    struct LeaveGameRequest
    {
        std::string game_id;
    };

    // place / select / move / deselect
    struct ActionRequest
    {
        std::string game_id;
        PlayerAction action;
    };

    struct FullStateRequest
    {
        std::string game_id;
    };

    struct EnqueueRequest
    {
        std::string player_name;
        int rating{1000};
    };

    struct DequeueRequest {};

    using Request = std::variant<CreateGameRequest, JoinGameRequest, LeaveGameRequest,
                                 ActionRequest, FullStateRequest, EnqueueRequest, DequeueRequest>;

    struct DecodedRequest
    {
        std::uint64_t msg_id{};
        Request request;
    };

    auto BuildCreateGame(CreateGameRequest const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildJoinGame(std::string_view game_id, std::string_view name, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildLeaveGame(std::string_view game_id, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildAction(std::string_view game_id, PlayerAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildFullStateRequest(std::string_view game_id, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildEnqueue(std::string_view name, int rating, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildDequeue(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto DecodeRequest(std::span<std::byte const> bytes) -> std::expected<DecodedRequest, ParseError>;

    // ---------- server -> client ----------

    struct GameCreatedMsg
    {
        std::string game_id;
        PlayerId player_id{1};
    };

    struct GameJoinedMsg
    {
        std::string game_id;
        PlayerId player_id{1};
        std::vector<PlayerInfo> players;
        std::int64_t seq_id{0};
        GameState state;
    };

    struct OpponentJoinedMsg
    {
        std::string game_id;
        std::vector<PlayerInfo> players;
    };

    struct OpponentDisconnectedMsg
    {
        std::string game_id;
        PlayerId player_id{1};
    };

    struct GameStartMsg
    {
        std::string game_id;
        std::vector<PlayerInfo> players;
    };

    struct StateUpdateMsg
    {
        std::string game_id;
        std::int64_t seq_id{0};
        GameState state;
    };

    struct QueueStatusMsg
    {
        int position{0};
        bool queued{false};
    };

    struct MatchFoundMsg
    {
        std::string game_id;
        std::string opponent_name;
        PlayerId player_id{1};
        std::int64_t timestamp{0};
    };

    struct ErrorReply
    {
        ErrorKind kind{ErrorKind::BadRequest};
        std::string message;
    };

    using ServerMessage = std::variant<GameCreatedMsg, GameJoinedMsg, OpponentJoinedMsg, OpponentDisconnectedMsg,
                                       GameStartMsg, StateUpdateMsg, QueueStatusMsg, MatchFoundMsg, ErrorReply>;

    auto BuildGameCreated(std::string_view game_id, PlayerId p, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildGameJoined(std::string_view game_id, PlayerId p, std::span<PlayerInfo const> players,
                         std::int64_t seq_id, GameState const& s, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildOpponentJoined(std::string_view game_id, std::span<PlayerInfo const> players, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildOpponentDisconnected(std::string_view game_id, PlayerId p, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildGameStart(std::string_view game_id, std::span<PlayerInfo const> players, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildStateUpdate(std::string_view game_id, std::int64_t seq_id, GameState const& s,
                          std::int64_t timestamp, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildQueueStatus(int position, bool queued, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildMatchFound(MatchFoundMsg const& m, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildError(ErrorKind kind, std::string_view message, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto DecodeServerMessage(std::span<std::byte const> bytes) -> std::expected<ServerMessage, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace caroquest::core::net


#endif //CAROQUEST_CODEC_HPP
