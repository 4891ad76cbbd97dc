//
// codec.cpp
//
#include "codec.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include <vector>

#include "../core/Board.hpp"

namespace fbn = caroquest::gen::net;

namespace caroquest::core::net
{
    auto ToFbColor(SquareColor c) noexcept -> fbn::SquareColor
    {
        switch (c)
        {
        case SquareColor::Light: return fbn::SquareColor::Light;
        case SquareColor::Dark: return fbn::SquareColor::Dark;
        }
        return fbn::SquareColor::Light;
    }

    auto FromFbColor(fbn::SquareColor c) noexcept -> SquareColor
    {
        switch (c)
        {
        case fbn::SquareColor::Light: return SquareColor::Light;
        case fbn::SquareColor::Dark: return SquareColor::Dark;
        }
        return SquareColor::Light;
    }

    auto ToFbPhase(GamePhase p) noexcept -> fbn::GamePhase
    {
        switch (p)
        {
        case GamePhase::Placement: return fbn::GamePhase::Placement;
        case GamePhase::Movement: return fbn::GamePhase::Movement;
        }
        return fbn::GamePhase::Placement;
    }

    auto FromFbPhase(fbn::GamePhase p) noexcept -> GamePhase
    {
        switch (p)
        {
        case fbn::GamePhase::Placement: return GamePhase::Placement;
        case fbn::GamePhase::Movement: return GamePhase::Movement;
        }
        return GamePhase::Placement;
    }

    auto ToFbHighlight(Highlight h) noexcept -> fbn::Highlight
    {
        switch (h)
        {
        case Highlight::None: return fbn::Highlight::None;
        case Highlight::SelectedPawn: return fbn::Highlight::SelectedPawn;
        case Highlight::ValidMove: return fbn::Highlight::ValidMove;
        case Highlight::DeadZoneIndicator: return fbn::Highlight::DeadZoneIndicator;
        }
        return fbn::Highlight::None;
    }

    auto FromFbHighlight(fbn::Highlight h) noexcept -> Highlight
    {
        switch (h)
        {
        case fbn::Highlight::None: return Highlight::None;
        case fbn::Highlight::SelectedPawn: return Highlight::SelectedPawn;
        case fbn::Highlight::ValidMove: return Highlight::ValidMove;
        case fbn::Highlight::DeadZoneIndicator: return Highlight::DeadZoneIndicator;
        }
        return Highlight::None;
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)caroquest::core::SquareColor::Dark == (int)fbn::SquareColor::Dark);
    static_assert((int)caroquest::core::GamePhase::Movement == (int)fbn::GamePhase::Movement);
    static_assert((int)caroquest::core::Highlight::DeadZoneIndicator == (int)fbn::Highlight::DeadZoneIndicator);
    static_assert((int)caroquest::core::net::ErrorKind::Matchmaking == (int)fbn::ErrorKind::Matchmaking);

    constexpr std::int8_t kNoDifficulty = -1;
    constexpr int kUnrated = -1;

    inline auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    inline auto AsPlayer(int v) -> std::optional<caroquest::core::PlayerId>
    {
        if (!caroquest::core::IsPlayer(v)) return std::nullopt;
        return static_cast<caroquest::core::PlayerId>(v);
    }

    template <typename T>
    auto FinishEnvelope(flatbuffers::FlatBufferBuilder& fbb, std::uint64_t msg_id, flatbuffers::Offset<T> body)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fbn::CreateEnvelope(fbb, msg_id, fbn::MessageTraits<T>::enum_value, body.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    auto WritePlayers(flatbuffers::FlatBufferBuilder& fbb, std::span<caroquest::core::net::PlayerInfo const> players)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fbn::PlayerInfo>>>
    {
        std::vector<flatbuffers::Offset<fbn::PlayerInfo>> vec;
        vec.reserve(players.size());
        for (auto const& p : players)
        {
            auto const name = fbb.CreateString(p.name);
            vec.push_back(fbn::CreatePlayerInfo(fbb, p.player_id, name, p.is_connected, p.is_creator,
                                                p.rating.value_or(kUnrated)));
        }
        return fbb.CreateVector(vec);
    }

    auto ReadPlayers(flatbuffers::Vector<flatbuffers::Offset<fbn::PlayerInfo>> const* v)
        -> std::vector<caroquest::core::net::PlayerInfo>
    {
        std::vector<caroquest::core::net::PlayerInfo> out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* p : *v)
        {
            caroquest::core::net::PlayerInfo info{};
            info.player_id = AsPlayer(p->player_id()).value_or(caroquest::core::PlayerId{1});
            info.name = Str(p->name());
            info.is_connected = p->is_connected();
            info.is_creator = p->is_creator();
            if (p->rating() >= 0) info.rating = p->rating();
            out.push_back(std::move(info));
        }
        return out;
    }

    auto VerifiedEnvelope(std::span<std::byte const> bytes)
        -> std::expected<fbn::Envelope const*, caroquest::core::net::ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(caroquest::core::net::ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(caroquest::core::net::ParseError{"envelope failed verification"});

        return fbn::GetEnvelope(data);
    }
} // anonymous

namespace caroquest::core::net
{
    // ---------- GameState ----------

    auto WriteState(flatbuffers::FlatBufferBuilder& fbb,
                    GameState const& s,
                    std::int64_t seq_id,
                    std::int64_t timestamp)
        -> flatbuffers::Offset<fbn::GameStateBuffer>
    {
        std::vector<flatbuffers::Offset<fbn::SquareBuffer>> squares;
        squares.reserve(s.board.size());
        for (Square const& sq : s.board)
        {
            flatbuffers::Offset<fbn::PawnBuffer> pawn_off{};
            if (sq.pawn)
            {
                auto const id = fbb.CreateString(sq.pawn->id);
                pawn_off = fbn::CreatePawnBuffer(fbb, id, sq.pawn->player, ToFbColor(sq.pawn->color));
            }
            squares.push_back(fbn::CreateSquareBuffer(fbb, sq.index, sq.row, sq.col, ToFbColor(sq.color),
                                                      pawn_off, ToFbHighlight(sq.highlight)));
        }
        auto const board_vec = fbb.CreateVector(squares);

        flatbuffers::Offset<flatbuffers::Vector<std::int32_t>> line_vec{};
        if (s.winning_line)
        {
            std::vector<std::int32_t> line(s.winning_line->begin(), s.winning_line->end());
            line_vec = fbb.CreateVector(line);
        }

        fbn::GameStateBufferBuilder b(fbb);
        b.add_board(board_vec);
        b.add_current_player_id(s.current_player);
        b.add_game_phase(ToFbPhase(s.phase));
        b.add_pawns_to_place_p1(s.pawns_to_place[0]);
        b.add_pawns_to_place_p2(s.pawns_to_place[1]);
        b.add_pawns_placed_p1(s.pawns_placed[0]);
        b.add_pawns_placed_p2(s.pawns_placed[1]);
        b.add_selected_pawn_index(s.selected.value_or(constants::NoIndex));
        b.add_winner(s.winner.value_or(PlayerId{0}));
        b.add_last_move_from(s.last_move ? s.last_move->from.value_or(constants::NoIndex) : constants::NoIndex);
        b.add_last_move_to(s.last_move ? s.last_move->to : constants::NoIndex);
        b.add_seq_id(seq_id);
        b.add_timestamp(timestamp);
        if (s.winning_line) b.add_winning_line(line_vec);
        b.add_pawns_per_player(s.config.pawns_per_player);
        b.add_board_size(s.config.board_size);
        b.add_win_length(s.config.win_length);
        b.add_is_public(s.config.is_public);
        b.add_is_matchmaking(s.config.is_matchmaking);
        b.add_is_ranked(s.config.is_ranked);
        return b.Finish();
    }

    auto EncodeState(GameState const& s, std::int64_t seq_id, std::int64_t timestamp)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        fbb.Finish(WriteState(fbb, s, seq_id, timestamp));
        return fbb.Release();
    }

    auto ReadState(fbn::GameStateBuffer const& buf) -> DecodedState
    {
        DecodedState out{};
        GameState& s = out.state;

        // config first: the board and the pawn-count defaults depend on it
        GameConfig cfg{};
        if (auto const v = buf.board_size(); v.has_value()) cfg.board_size = v.value();
        if (auto const v = buf.pawns_per_player(); v.has_value()) cfg.pawns_per_player = v.value();
        if (auto const v = buf.win_length(); v.has_value()) cfg.win_length = v.value();
        cfg.is_public = buf.is_public();
        cfg.is_matchmaking = buf.is_matchmaking();
        cfg.is_ranked = buf.is_ranked();
        board::SanitizeConfig(cfg);
        s = MakeInitialState(cfg);

        if (auto const* squares = buf.board(); squares && squares->size() == s.board.size())
        {
            for (flatbuffers::uoffset_t i = 0; i < squares->size(); ++i)
            {
                auto const* in = squares->Get(i);
                Square& sq = s.board[i];
                sq.highlight = FromFbHighlight(in->highlight());
                if (auto const* p = in->pawn())
                {
                    // a pawn with a bad owner is treated as absent
                    if (auto owner = AsPlayer(p->player_id()))
                    {
                        sq.pawn = Pawn{.id = Str(p->id()), .player = *owner, .color = FromFbColor(p->color())};
                    }
                }
            }
        }

        s.current_player = AsPlayer(buf.current_player_id()).value_or(PlayerId{1});
        s.phase = FromFbPhase(buf.game_phase());

        s.pawns_to_place[0] = buf.pawns_to_place_p1().has_value() ? buf.pawns_to_place_p1().value() : cfg.pawns_per_player;
        s.pawns_to_place[1] = buf.pawns_to_place_p2().has_value() ? buf.pawns_to_place_p2().value() : cfg.pawns_per_player;
        s.pawns_placed[0] = buf.pawns_placed_p1();
        s.pawns_placed[1] = buf.pawns_placed_p2();

        if (s.InBounds(buf.selected_pawn_index())) s.selected = buf.selected_pawn_index();
        s.winner = AsPlayer(buf.winner());

        if (s.InBounds(buf.last_move_to()))
        {
            LastMove lm{.from = std::nullopt, .to = buf.last_move_to()};
            if (s.InBounds(buf.last_move_from())) lm.from = buf.last_move_from();
            s.last_move = lm;
        }

        if (auto const* line = buf.winning_line(); line && line->size() > 0)
        {
            s.winning_line = std::vector<SquareIdx>(line->begin(), line->end());
        }

        // highlighted targets come back from the per-square tags
        board::Normalize(s);

        out.seq_id = buf.seq_id();
        out.timestamp = buf.timestamp();
        return out;
    }

    auto DecodeState(std::span<std::byte const> bytes) -> std::expected<DecodedState, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!verifier.VerifyBuffer<fbn::GameStateBuffer>(nullptr))
            return std::unexpected(ParseError{"GameStateBuffer failed verification"});

        return ReadState(*flatbuffers::GetRoot<fbn::GameStateBuffer>(data));
    }

    // ---------- Builders (client -> server) ----------

    auto BuildCreateGame(CreateGameRequest const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const name = fbb.CreateString(r.player_name);
        flatbuffers::Offset<flatbuffers::String> gid{};
        if (r.game_id) gid = fbb.CreateString(*r.game_id);

        std::int8_t const ai = r.ai_difficulty ? static_cast<std::int8_t>(*r.ai_difficulty) : kNoDifficulty;
        auto const m = fbn::CreateNewGameReq(fbb, name, r.pawns_per_player, r.is_public, ai, gid);
        return FinishEnvelope(fbb, msg_id, m);
    }

    auto BuildJoinGame(std::string_view game_id, std::string_view name, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(game_id);
        auto const nm = fbb.CreateString(name);
        return FinishEnvelope(fbb, msg_id, fbn::CreateJoinGameReq(fbb, gid, nm));
    }

    auto BuildLeaveGame(std::string_view game_id, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(game_id);
        return FinishEnvelope(fbb, msg_id, fbn::CreateLeaveGameReq(fbb, gid));
    }

    auto BuildAction(std::string_view game_id, PlayerAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(game_id);

        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlaceAction>)
            {
                return FinishEnvelope(fbb, msg_id, fbn::CreatePlacePawnReq(fbb, gid, act.square));
            }
            else if constexpr (std::is_same_v<T, SelectAction>)
            {
                return FinishEnvelope(fbb, msg_id, fbn::CreateSelectPawnReq(fbb, gid, act.square));
            }
            else if constexpr (std::is_same_v<T, MoveAction>)
            {
                return FinishEnvelope(fbb, msg_id, fbn::CreateMovePawnReq(fbb, gid, act.from, act.to));
            }
            else
            {
                static_assert(std::is_same_v<T, DeselectAction>);
                return FinishEnvelope(fbb, msg_id, fbn::CreateClearSelectionReq(fbb, gid));
            }
        }, a);
    }

    auto BuildFullStateRequest(std::string_view game_id, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(game_id);
        return FinishEnvelope(fbb, msg_id, fbn::CreateFullStateReq(fbb, gid));
    }

    auto BuildEnqueue(std::string_view name, int rating, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const nm = fbb.CreateString(name);
        return FinishEnvelope(fbb, msg_id, fbn::CreateEnqueueReq(fbb, nm, rating));
    }

    auto BuildDequeue(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        return FinishEnvelope(fbb, msg_id, fbn::CreateDequeueReq(fbb));
    }

    // ---------- Decode (server <- inbound wire) ----------

    auto DecodeRequest(std::span<std::byte const> bytes) -> std::expected<DecodedRequest, ParseError>
    {
        auto env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        fbn::Envelope const* e = *env;
        DecodedRequest out{};
        out.msg_id = e->msg_id();

        switch (e->message_type())
        {
        case fbn::Message::NewGameReq:
        {
            auto const* m = e->message_as_NewGameReq();
            CreateGameRequest r{};
            r.player_name = Str(m->player_name());
            r.pawns_per_player = m->pawns_per_player();
            r.is_public = m->is_public();
            auto const ai = m->ai_difficulty();
            if (ai >= static_cast<std::int8_t>(Difficulty::Easy) && ai <= static_cast<std::int8_t>(Difficulty::Hard))
            {
                r.ai_difficulty = static_cast<Difficulty>(ai);
            }
            if (m->game_id()) r.game_id = m->game_id()->str();
            out.request = std::move(r);
            return out;
        }
        case fbn::Message::JoinGameReq:
        {
            auto const* m = e->message_as_JoinGameReq();
            out.request = JoinGameRequest{Str(m->game_id()), Str(m->player_name())};
            return out;
        }
        case fbn::Message::LeaveGameReq:
        {
            out.request = LeaveGameRequest{Str(e->message_as_LeaveGameReq()->game_id())};
            return out;
        }
        case fbn::Message::PlacePawnReq:
        {
            auto const* m = e->message_as_PlacePawnReq();
            out.request = ActionRequest{Str(m->game_id()), PlaceAction{m->square_index()}};
            return out;
        }
        case fbn::Message::SelectPawnReq:
        {
            auto const* m = e->message_as_SelectPawnReq();
            out.request = ActionRequest{Str(m->game_id()), SelectAction{m->square_index()}};
            return out;
        }
        case fbn::Message::MovePawnReq:
        {
            auto const* m = e->message_as_MovePawnReq();
            out.request = ActionRequest{Str(m->game_id()), MoveAction{m->from_index(), m->to_index()}};
            return out;
        }
        case fbn::Message::ClearSelectionReq:
        {
            out.request = ActionRequest{Str(e->message_as_ClearSelectionReq()->game_id()), DeselectAction{}};
            return out;
        }
        case fbn::Message::FullStateReq:
        {
            out.request = FullStateRequest{Str(e->message_as_FullStateReq()->game_id())};
            return out;
        }
        case fbn::Message::EnqueueReq:
        {
            auto const* m = e->message_as_EnqueueReq();
            out.request = EnqueueRequest{Str(m->player_name()), m->rating()};
            return out;
        }
        case fbn::Message::DequeueReq:
        {
            out.request = DequeueRequest{};
            return out;
        }
        default:
            return std::unexpected(ParseError{std::format("not a request message (type {})",
                                                          static_cast<int>(e->message_type()))});
        }
    }

    // ---------- Builders (server -> client) ----------

    auto BuildGameCreated(std::string_view game_id, PlayerId p, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(game_id);
        return FinishEnvelope(fbb, msg_id, fbn::CreateGameCreated(fbb, gid, p));
    }

    auto BuildGameJoined(std::string_view game_id, PlayerId p, std::span<PlayerInfo const> players,
                         std::int64_t seq_id, GameState const& s, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(game_id);
        auto const ps = WritePlayers(fbb, players);
        auto const st = WriteState(fbb, s, seq_id, 0);
        return FinishEnvelope(fbb, msg_id, fbn::CreateGameJoined(fbb, gid, p, ps, seq_id, st));
    }

    auto BuildOpponentJoined(std::string_view game_id, std::span<PlayerInfo const> players, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(game_id);
        auto const ps = WritePlayers(fbb, players);
        return FinishEnvelope(fbb, msg_id, fbn::CreateOpponentJoined(fbb, gid, ps));
    }

    auto BuildOpponentDisconnected(std::string_view game_id, PlayerId p, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(game_id);
        return FinishEnvelope(fbb, msg_id, fbn::CreateOpponentDisconnected(fbb, gid, p));
    }

    auto BuildGameStart(std::string_view game_id, std::span<PlayerInfo const> players, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(game_id);
        auto const ps = WritePlayers(fbb, players);
        return FinishEnvelope(fbb, msg_id, fbn::CreateGameStart(fbb, gid, ps));
    }

    auto BuildStateUpdate(std::string_view game_id, std::int64_t seq_id, GameState const& s,
                          std::int64_t timestamp, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(game_id);
        auto const st = WriteState(fbb, s, seq_id, timestamp);
        return FinishEnvelope(fbb, msg_id, fbn::CreateStateUpdate(fbb, gid, seq_id, st));
    }

    auto BuildQueueStatus(int position, bool queued, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        return FinishEnvelope(fbb, msg_id, fbn::CreateQueueStatus(fbb, position, queued));
    }

    auto BuildMatchFound(MatchFoundMsg const& m, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const gid = fbb.CreateString(m.game_id);
        auto const opp = fbb.CreateString(m.opponent_name);
        return FinishEnvelope(fbb, msg_id, fbn::CreateMatchFound(fbb, gid, opp, m.player_id, m.timestamp));
    }

    auto BuildError(ErrorKind kind, std::string_view message, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(message);
        return FinishEnvelope(fbb, msg_id,
                              fbn::CreateErrorMsg(fbb, static_cast<fbn::ErrorKind>(kind), txt));
    }

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        return BuildError(ErrorKind::Validation, error::describe(v), msg_id);
    }

    // ---------- Decode (client <- server) ----------

    auto DecodeServerMessage(std::span<std::byte const> bytes) -> std::expected<ServerMessage, ParseError>
    {
        auto env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        fbn::Envelope const* e = *env;
        switch (e->message_type())
        {
        case fbn::Message::GameCreated:
        {
            auto const* m = e->message_as_GameCreated();
            return GameCreatedMsg{Str(m->game_id()), AsPlayer(m->player_id()).value_or(PlayerId{1})};
        }
        case fbn::Message::GameJoined:
        {
            auto const* m = e->message_as_GameJoined();
            GameJoinedMsg out{};
            out.game_id = Str(m->game_id());
            out.player_id = AsPlayer(m->player_id()).value_or(PlayerId{1});
            out.players = ReadPlayers(m->players());
            out.seq_id = m->seq_id();
            out.state = m->state() ? ReadState(*m->state()).state : MakeInitialState(GameConfig{});
            return out;
        }
        case fbn::Message::OpponentJoined:
        {
            auto const* m = e->message_as_OpponentJoined();
            return OpponentJoinedMsg{Str(m->game_id()), ReadPlayers(m->players())};
        }
        case fbn::Message::OpponentDisconnected:
        {
            auto const* m = e->message_as_OpponentDisconnected();
            return OpponentDisconnectedMsg{Str(m->game_id()), AsPlayer(m->player_id()).value_or(PlayerId{1})};
        }
        case fbn::Message::GameStart:
        {
            auto const* m = e->message_as_GameStart();
            return GameStartMsg{Str(m->game_id()), ReadPlayers(m->players())};
        }
        case fbn::Message::StateUpdate:
        {
            auto const* m = e->message_as_StateUpdate();
            if (!m->state()) return std::unexpected(ParseError{"StateUpdate without state"});
            return StateUpdateMsg{Str(m->game_id()), m->seq_id(), ReadState(*m->state()).state};
        }
        case fbn::Message::QueueStatus:
        {
            auto const* m = e->message_as_QueueStatus();
            return QueueStatusMsg{m->position(), m->queued()};
        }
        case fbn::Message::MatchFound:
        {
            auto const* m = e->message_as_MatchFound();
            return MatchFoundMsg{Str(m->game_id()), Str(m->opponent_name()),
                                 AsPlayer(m->player_id()).value_or(PlayerId{1}), m->timestamp()};
        }
        case fbn::Message::ErrorMsg:
        {
            auto const* m = e->message_as_ErrorMsg();
            auto const raw = static_cast<int>(m->kind());
            ErrorKind kind = ErrorKind::BadRequest;
            if (raw >= 0 && raw <= static_cast<int>(ErrorKind::Matchmaking)) kind = static_cast<ErrorKind>(raw);
            return ErrorReply{kind, Str(m->message())};
        }
        default:
            return std::unexpected(ParseError{std::format("not a server message (type {})",
                                                          static_cast<int>(e->message_type()))});
        }
    }
} // namespace caroquest::core::net
