//
// Created by Malik T on 19/10/2026.
//
#include "codec.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

namespace fb = fasttrack::gen::net;

namespace
{
    // Verify enum layouts (first and last value catch drift in either direction)
    static_assert((int)fasttrack::core::Suit::Hearts == (int)fb::Suit::Hearts);
    static_assert((int)fasttrack::core::Suit::None == (int)fb::Suit::NoSuit);
    static_assert((int)fasttrack::core::Rank::Ace == (int)fb::Rank::Ace);
    static_assert((int)fasttrack::core::Rank::Joker == (int)fb::Rank::Joker);
    static_assert((int)fasttrack::core::MoveType::Enter == (int)fb::MoveType::Enter);
    static_assert((int)fasttrack::core::MoveType::ExitCaptureHole == (int)fb::MoveType::ExitCaptureHole);
    static_assert((int)fasttrack::core::Phase::Lobby == (int)fb::Phase::Lobby);
    static_assert((int)fasttrack::core::Phase::GameWon == (int)fb::Phase::GameWon);

    constexpr std::uint8_t FlagEligible = 1u << 0;
    constexpr std::uint8_t FlagShortcut = 1u << 1;
    constexpr std::uint8_t FlagCompleted = 1u << 2;
    constexpr std::uint8_t FlagExitedCapture = 1u << 3;

    constexpr std::uint64_t FnvOffset = 14695981039346656037ull;
    constexpr std::uint64_t FnvPrime = 1099511628211ull;

    auto Bytes(flatbuffers::FlatBufferBuilder const& fbb) -> std::vector<std::uint8_t>
    {
        return {fbb.GetBufferPointer(), fbb.GetBufferPointer() + fbb.GetSize()};
    }

    auto Fail(std::string msg) -> std::unexpected<fasttrack::core::net::ParseError>
    {
        return std::unexpected(fasttrack::core::net::ParseError{std::move(msg)});
    }

    template <class V>
    auto ToSeats(V const* v) -> std::vector<std::uint8_t>
    {
        if (!v) return {};
        return {v->begin(), v->end()};
    }
} // anonymous

namespace fasttrack::core::net
{
    auto ToFbSuit(Suit s) noexcept -> fb::Suit { return static_cast<fb::Suit>(std::to_underlying(s)); }
    auto ToFbRank(Rank r) noexcept -> fb::Rank { return static_cast<fb::Rank>(std::to_underlying(r)); }
    auto ToFbMoveType(MoveType t) noexcept -> fb::MoveType { return static_cast<fb::MoveType>(std::to_underlying(t)); }
    auto ToFbPhase(Phase p) noexcept -> fb::Phase { return static_cast<fb::Phase>(std::to_underlying(p)); }

    auto FromFbSuit(fb::Suit s) noexcept -> Suit { return static_cast<Suit>(std::to_underlying(s)); }
    auto FromFbRank(fb::Rank r) noexcept -> Rank { return static_cast<Rank>(std::to_underlying(r)); }
    auto FromFbMoveType(fb::MoveType t) noexcept -> MoveType { return static_cast<MoveType>(std::to_underlying(t)); }
    auto FromFbPhase(fb::Phase p) noexcept -> Phase { return static_cast<Phase>(std::to_underlying(p)); }

    // ---------- Events ----------

    static auto BuildEventMsg(flatbuffers::FlatBufferBuilder& fbb, Event const& e)
        -> flatbuffers::Offset<fb::EventMsg>
    {
        auto const [type, payload] = std::visit(
            [&]<typename T0>(T0 const& ev) -> std::pair<fb::EventPayload, flatbuffers::Offset<void>>
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, PlayerJoined>)
                {
                    return {fb::EventPayload::PlayerJoined, fb::CreatePlayerJoined(fbb, ev.seat).Union()};
                }
                else if constexpr (std::is_same_v<T, GameStarted>)
                {
                    auto const order = fbb.CreateVector(ev.player_order);
                    return {fb::EventPayload::GameStarted, fb::CreateGameStarted(fbb, ev.seed, order).Union()};
                }
                else if constexpr (std::is_same_v<T, CardDrawn>)
                {
                    return {fb::EventPayload::CardDrawn, fb::CreateCardDrawn(fbb, ev.seat).Union()};
                }
                else if constexpr (std::is_same_v<T, MovePlayed>)
                {
                    auto const path = fbb.CreateVector(ev.path);
                    return {
                        fb::EventPayload::MovePlayed,
                        fb::CreateMovePlayed(fbb, ev.seat, ev.piece, ToFbMoveType(ev.type), path).Union()
                    };
                }
                else if constexpr (std::is_same_v<T, SplitMovePlayed>)
                {
                    auto const path = fbb.CreateVector(ev.path);
                    return {
                        fb::EventPayload::SplitMovePlayed,
                        fb::CreateSplitMovePlayed(fbb, ev.seat, ev.piece, ToFbMoveType(ev.type), path).Union()
                    };
                }
                else
                {
                    return {fb::EventPayload::TurnEnded, fb::CreateTurnEnded(fbb, ev.seat).Union()};
                }
            },
            e.payload);

        return fb::CreateEventMsg(fbb, e.sequence, type, payload);
    }

    static auto ReadPath(flatbuffers::Vector<std::uint16_t> const* v) -> std::vector<HoleId>
    {
        if (!v) return {};
        return {v->begin(), v->end()};
    }

    static auto ReadEventMsg(fb::EventMsg const* msg) -> std::expected<Event, ParseError>
    {
        if (!msg) return Fail("missing event");
        Event out{.sequence = msg->sequence()};

        auto move_type = [](fb::MoveType t) -> std::expected<MoveType, ParseError>
        {
            if (t > fb::MoveType::MAX)
                return Fail(std::format("move type {} out of range", static_cast<int>(t)));
            return FromFbMoveType(t);
        };

        if (!msg->payload()) return Fail(std::format("event {} has no payload", msg->sequence()));

        switch (msg->payload_type())
        {
        case fb::EventPayload::PlayerJoined:
            out.payload = PlayerJoined{.seat = msg->payload_as_PlayerJoined()->seat()};
            return out;
        case fb::EventPayload::GameStarted:
        {
            auto const* g = msg->payload_as_GameStarted();
            out.payload = GameStarted{.seed = g->seed(), .player_order = ToSeats(g->player_order())};
            return out;
        }
        case fb::EventPayload::CardDrawn:
            out.payload = CardDrawn{.seat = msg->payload_as_CardDrawn()->seat()};
            return out;
        case fb::EventPayload::MovePlayed:
        {
            auto const* m = msg->payload_as_MovePlayed();
            auto const t = move_type(m->move_type());
            if (!t) return std::unexpected(t.error());
            out.payload = MovePlayed{.seat = m->seat(), .piece = m->piece(), .type = *t, .path = ReadPath(m->path())};
            return out;
        }
        case fb::EventPayload::SplitMovePlayed:
        {
            auto const* m = msg->payload_as_SplitMovePlayed();
            auto const t = move_type(m->move_type());
            if (!t) return std::unexpected(t.error());
            out.payload = SplitMovePlayed{
                .seat = m->seat(), .piece = m->piece(), .type = *t, .path = ReadPath(m->path())
            };
            return out;
        }
        case fb::EventPayload::TurnEnded:
            out.payload = TurnEnded{.seat = msg->payload_as_TurnEnded()->seat()};
            return out;
        default:
            break;
        }
        return Fail(std::format("event {} has no payload", msg->sequence()));
    }

    // ---------- Envelopes ----------

    auto EncodeEvent(Event const& e, std::uint8_t sender) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const msg = BuildEventMsg(fbb, e);
        auto const env = fb::CreateEnvelope(fbb, SchemaVersion, sender, fb::Message::EventMsg, msg.Union());
        fbb.Finish(env);
        return Bytes(fbb);
    }

    auto EncodeSyncRequest(SyncRequest const& r, std::uint8_t sender) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const req = fb::CreateSyncRequest(fbb, r.sequence, r.hash);
        auto const env = fb::CreateEnvelope(fbb, SchemaVersion, sender, fb::Message::SyncRequest, req.Union());
        fbb.Finish(env);
        return Bytes(fbb);
    }

    auto EncodeSyncResponse(SyncResponse const& r, std::uint8_t sender) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const res = fb::CreateSyncResponse(fbb, r.sequence, r.hash);
        auto const env = fb::CreateEnvelope(fbb, SchemaVersion, sender, fb::Message::SyncResponse, res.Union());
        fbb.Finish(env);
        return Bytes(fbb);
    }

    auto DecodeFrame(std::span<std::uint8_t const> bytes) -> std::expected<Frame, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return Fail("buffer too small");

        flatbuffers::Verifier verifier(bytes.data(), bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return Fail("envelope failed verification");

        auto const* env = fb::GetEnvelope(bytes.data());
        if (env->schema_version() != SchemaVersion)
            return Fail(std::format("unsupported schema version {}", env->schema_version()));

        if (!env->message()) return Fail("envelope carries no message");

        Frame out{.sender = env->sender()};
        switch (env->message_type())
        {
        case fb::Message::EventMsg:
        {
            auto ev = ReadEventMsg(env->message_as_EventMsg());
            if (!ev) return std::unexpected(ev.error());
            out.body = std::move(*ev);
            return out;
        }
        case fb::Message::SyncRequest:
        {
            auto const* r = env->message_as_SyncRequest();
            out.body = SyncRequest{.sequence = r->sequence(), .hash = r->hash()};
            return out;
        }
        case fb::Message::SyncResponse:
        {
            auto const* r = env->message_as_SyncResponse();
            out.body = SyncResponse{.sequence = r->sequence(), .hash = r->hash()};
            return out;
        }
        default:
            break;
        }
        return Fail("envelope carries no message");
    }

    // ---------- Snapshot ----------

    static auto ToRecord(Card const& c) -> fb::CardRecord
    {
        return fb::CardRecord(ToFbRank(c.rank), ToFbSuit(c.suit));
    }

    static auto FromRecord(fb::CardRecord const* c) -> Card
    {
        return Card{.rank = FromFbRank(c->rank()), .suit = FromFbSuit(c->suit())};
    }

    static auto ToRecords(std::vector<Card> const& cards) -> std::vector<fb::CardRecord>
    {
        std::vector<fb::CardRecord> out;
        out.reserve(cards.size());
        std::ranges::transform(cards, std::back_inserter(out), ToRecord);
        return out;
    }

    static auto ValidRecord(fb::CardRecord const* c) -> bool
    {
        return c->rank() <= fb::Rank::MAX && c->suit() <= fb::Suit::MAX;
    }

    static auto ValidRecords(flatbuffers::Vector<fb::CardRecord const*> const* v) -> bool
    {
        if (!v) return true;
        for (fb::CardRecord const* c : *v)
        {
            if (!ValidRecord(c)) return false;
        }
        return true;
    }

    static auto FromRecords(flatbuffers::Vector<fb::CardRecord const*> const* v) -> std::vector<Card>
    {
        std::vector<Card> out;
        if (!v) return out;
        out.reserve(v->size());
        for (fb::CardRecord const* c : *v) out.push_back(FromRecord(c));
        return out;
    }

    auto EncodeSnapshot(GameState const& s) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::PlayerRecord>> players;
        players.reserve(s.players.size());
        for (PlayerState const& p : s.players)
        {
            auto const pieces = fbb.CreateVector(p.pieces);
            auto const draw = fbb.CreateVectorOfStructs(ToRecords(p.deck.draw_pile));
            auto const discard = fbb.CreateVectorOfStructs(ToRecords(p.deck.discard_pile));
            players.push_back(fb::CreatePlayerRecord(fbb, p.seat, p.section, pieces, draw, discard));
        }
        auto const players_vec = fbb.CreateVector(players);

        std::vector<fb::PieceRecord> pieces;
        pieces.reserve(s.pieces.size());
        for (Piece const& p : s.pieces)
        {
            std::uint8_t flags{};
            flags |= p.eligible_for_safe_zone ? FlagEligible : 0;
            flags |= p.on_shortcut ? FlagShortcut : 0;
            flags |= p.completed_circuit ? FlagCompleted : 0;
            flags |= p.exited_capture_hole ? FlagExitedCapture : 0;
            pieces.emplace_back(p.id, p.owner, p.location, flags, p.shortcut_entry);
        }
        auto const pieces_vec = fbb.CreateVectorOfStructs(pieces);

        std::optional<fb::CardRecord> card{};
        if (s.turn.card) card = ToRecord(*s.turn.card);
        auto const turn = fb::CreateTurnRecord(
            fbb,
            /*active*/ s.turn.active,
            /*number*/ s.turn.number,
            /*card*/ card ? &*card : nullptr,
            /*split_remaining*/ s.turn.split_remaining,
            /*split_first*/ s.turn.split_first ? static_cast<std::int16_t>(*s.turn.split_first) : std::int16_t{-1},
            /*shortcut_movers*/ fbb.CreateVector(s.turn.shortcut_movers)
        );

        auto const snap = fb::CreateGameSnapshot(
            fbb,
            /*phase*/ ToFbPhase(s.phase),
            /*lobby*/ fbb.CreateVector(s.lobby),
            /*players*/ players_vec,
            /*pieces*/ pieces_vec,
            /*rng_seed*/ s.rng.seed,
            /*rng_consumed*/ s.rng.consumed,
            /*turn*/ turn,
            /*winner*/ s.winner ? static_cast<std::int16_t>(*s.winner) : std::int16_t{-1},
            /*next_sequence*/ s.next_sequence
        );
        fbb.Finish(snap);
        return fbb.Release();
    }

    auto DecodeSnapshot(std::span<std::uint8_t const> bytes) -> std::expected<GameState, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return Fail("buffer too small");

        flatbuffers::Verifier verifier(bytes.data(), bytes.size());
        if (!verifier.VerifyBuffer<fb::GameSnapshot>(nullptr))
            return Fail("snapshot failed verification");

        auto const* snap = flatbuffers::GetRoot<fb::GameSnapshot>(bytes.data());
        if (snap->phase() > fb::Phase::MAX)
            return Fail("snapshot phase out of range");

        GameState s{
            .phase = FromFbPhase(snap->phase()),
            .lobby = ToSeats(snap->lobby()),
            .rng = RngState{.seed = snap->rng_seed(), .consumed = snap->rng_consumed()},
            .next_sequence = snap->next_sequence()
        };
        if (snap->winner() >= 0) s.winner = static_cast<SeatT>(snap->winner());

        if (auto const* players = snap->players())
        {
            for (fb::PlayerRecord const* p : *players)
            {
                if (!ValidRecords(p->draw_pile()) || !ValidRecords(p->discard_pile()))
                    return Fail(std::format("P{} deck holds a card out of range", static_cast<int>(p->seat())));
                s.players.push_back(PlayerState{
                    .seat = p->seat(),
                    .section = p->section(),
                    .pieces = ToSeats(p->pieces()),
                    .deck = DeckState{
                        .draw_pile = FromRecords(p->draw_pile()), .discard_pile = FromRecords(p->discard_pile())
                    }
                });
            }
        }

        if (auto const* pieces = snap->pieces())
        {
            for (fb::PieceRecord const* p : *pieces)
            {
                if (p->id() != s.pieces.size())
                    return Fail(std::format("piece record {} out of order", p->id()));
                s.pieces.push_back(Piece{
                    .id = p->id(),
                    .owner = p->owner(),
                    .location = p->location(),
                    .eligible_for_safe_zone = (p->flags() & FlagEligible) != 0,
                    .on_shortcut = (p->flags() & FlagShortcut) != 0,
                    .completed_circuit = (p->flags() & FlagCompleted) != 0,
                    .shortcut_entry = p->shortcut_entry(),
                    .exited_capture_hole = (p->flags() & FlagExitedCapture) != 0
                });
            }
        }

        if (auto const* t = snap->turn())
        {
            s.turn.active = t->active();
            s.turn.number = t->number();
            if (t->card())
            {
                if (!ValidRecord(t->card())) return Fail("card in play out of range");
                s.turn.card = FromRecord(t->card());
            }
            s.turn.split_remaining = t->split_remaining();
            if (t->split_first() >= 0) s.turn.split_first = static_cast<PieceId>(t->split_first());
            s.turn.shortcut_movers = ToSeats(t->shortcut_movers());
        }
        if (!s.players.empty() && s.turn.active >= s.players.size())
            return Fail("active player index out of range");

        for (PlayerState const& p : s.players)
        {
            if (std::ranges::any_of(p.pieces, [&](PieceId id) { return id >= s.pieces.size(); }))
                return Fail(std::format("P{} lists an unknown piece", static_cast<int>(p.seat)));
        }
        for (Piece const& p : s.pieces)
        {
            if (!FindPlayer(s, p.owner) && !s.players.empty())
                return Fail(std::format("piece {} owned by an unknown seat", static_cast<int>(p.id)));
        }
        if (s.turn.split_first && *s.turn.split_first >= s.pieces.size())
            return Fail("split piece out of range");
        if (std::ranges::any_of(s.turn.shortcut_movers, [&](PieceId id) { return id >= s.pieces.size(); }))
            return Fail("shortcut mover out of range");
        return s;
    }

    auto DecodeSnapshot(std::span<std::uint8_t const> bytes, Board const& board)
        -> std::expected<GameState, ParseError>
    {
        auto s = DecodeSnapshot(bytes);
        if (!s) return s;

        for (PlayerState const& p : s->players)
        {
            if (p.section >= board.Sections())
                return Fail(std::format("P{} sits on section {} of {}", static_cast<int>(p.seat),
                                        static_cast<int>(p.section), static_cast<int>(board.Sections())));
        }
        for (Piece const& p : s->pieces)
        {
            if (!board.Contains(p.location))
                return Fail(std::format("piece {} off the board at {}", static_cast<int>(p.id), p.location));
            if (p.shortcut_entry != NoHole && (!board.Contains(p.shortcut_entry) || !board.IsCorner(p.shortcut_entry)))
                return Fail(std::format("piece {} entered the shortcut at {}", static_cast<int>(p.id),
                                        p.shortcut_entry));
        }
        return s;
    }

    auto ComputeStateHash(GameState const& s) -> std::uint64_t
    {
        flatbuffers::DetachedBuffer const buf = EncodeSnapshot(s);
        std::uint64_t h = FnvOffset;
        for (std::uint8_t const b : std::span{buf.data(), buf.size()})
        {
            h ^= b;
            h *= FnvPrime;
        }
        return h;
    }

    // ---------- Replay log ----------

    auto EncodeEventLog(std::span<Event const> events) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        std::vector<flatbuffers::Offset<fb::EventMsg>> msgs;
        msgs.reserve(events.size());
        for (Event const& e : events) msgs.push_back(BuildEventMsg(fbb, e));
        auto const log = fb::CreateEventLog(fbb, SchemaVersion, fbb.CreateVector(msgs));
        fbb.Finish(log);
        return Bytes(fbb);
    }

    auto DecodeEventLog(std::span<std::uint8_t const> bytes) -> std::expected<std::vector<Event>, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return Fail("buffer too small");

        flatbuffers::Verifier verifier(bytes.data(), bytes.size());
        if (!verifier.VerifyBuffer<fb::EventLog>(nullptr))
            return Fail("event log failed verification");

        auto const* log = flatbuffers::GetRoot<fb::EventLog>(bytes.data());
        if (log->schema_version() != SchemaVersion)
            return Fail(std::format("unsupported schema version {}", log->schema_version()));

        std::vector<Event> out;
        if (!log->events()) return out;
        out.reserve(log->events()->size());
        for (fb::EventMsg const* msg : *log->events())
        {
            auto ev = ReadEventMsg(msg);
            if (!ev) return std::unexpected(ev.error());
            if (ev->sequence != out.size())
                return Fail(std::format("event log gap at sequence {}", out.size()));
            out.push_back(std::move(*ev));
        }
        return out;
    }

    auto WriteEventLog(std::filesystem::path const& path, std::span<Event const> events) -> void
    {
        std::vector<std::uint8_t> const bytes = EncodeEventLog(events);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
            FTK_THROW(error::Code::Serialization, std::format("cannot open {} for writing", path.string()));
        out.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out)
            FTK_THROW(error::Code::Serialization, std::format("short write to {}", path.string()));
    }

    auto ReadEventLog(std::filesystem::path const& path) -> std::expected<std::vector<Event>, ParseError>
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) return Fail(std::format("cannot open {}", path.string()));
        std::vector<std::uint8_t> const bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        return DecodeEventLog(bytes);
    }
} // namespace fasttrack::core::net
