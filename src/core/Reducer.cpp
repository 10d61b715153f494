//
// Created by Malik T on 19/10/2026.
//
#include "Reducer.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

#include "Rng.hpp"

namespace fasttrack::core
{
    namespace
    {
        auto Invalid(std::string msg) -> std::unexpected<Rejection>
        {
            return std::unexpected(Rejection{.code = error::Code::InvalidEvent, .message = std::move(msg)});
        }

        auto Illegal(std::string msg, std::vector<error::RuleViolation> violations) -> std::unexpected<Rejection>
        {
            return std::unexpected(Rejection{
                .code = error::Code::IllegalMove, .message = std::move(msg), .violations = std::move(violations)
            });
        }

        auto PhaseName(Phase p) -> std::string_view
        {
            switch (p)
            {
            case Phase::Lobby: return "Lobby";
            case Phase::AwaitingDraw: return "AwaitingDraw";
            case Phase::AwaitingMove: return "AwaitingMove";
            case Phase::AwaitingSplitMove: return "AwaitingSplitMove";
            case Phase::TurnResolution: return "TurnResolution";
            case Phase::GameWon: return "GameWon";
            }
            return "?";
        }

        auto ExpectActive(GameState const& s, SeatT seat, std::initializer_list<Phase> phases)
            -> std::expected<void, Rejection>
        {
            if (std::ranges::find(phases, s.phase) == phases.end())
                return Invalid(std::format("event not accepted in phase {}", PhaseName(s.phase)));
            if (s.players.empty() || ActivePlayer(s).seat != seat)
                return Invalid(std::format("P{} is not the active player", static_cast<int>(seat)));
            return {};
        }

        // Hole ids come straight off the wire; anything outside the board is malformed.
        auto ExpectOnBoard(Board const& b, std::vector<HoleId> const& path) -> std::expected<void, Rejection>
        {
            auto const bad = std::ranges::find_if(path, [&](HoleId h) { return !b.Contains(h); });
            if (bad != path.end())
                return Invalid(std::format("path names hole {} outside the board", *bad));
            return {};
        }

        auto IsShortcutMove(MoveType t) -> bool
        {
            return t == MoveType::EnterShortcut || t == MoveType::ContinueShortcut || t == MoveType::EnterCaptureHole;
        }
    }

    auto ToString(EffectKind k) -> std::string_view
    {
        switch (k)
        {
        case EffectKind::PlayerJoined: return "PlayerJoined";
        case EffectKind::GameStarted: return "GameStarted";
        case EffectKind::CardDrawn: return "CardDrawn";
        case EffectKind::DeckReshuffled: return "DeckReshuffled";
        case EffectKind::PieceEntered: return "PieceEntered";
        case EffectKind::PieceMoved: return "PieceMoved";
        case EffectKind::CaptureResolved: return "CaptureResolved";
        case EffectKind::ShortcutRevoked: return "ShortcutRevoked";
        case EffectKind::ForcedShortcutExit: return "ForcedShortcutExit";
        case EffectKind::NoLegalMoves: return "NoLegalMoves";
        case EffectKind::ExtraTurn: return "ExtraTurn";
        case EffectKind::TurnPassed: return "TurnPassed";
        case EffectKind::GameWon: return "GameWon";
        }
        return "?";
    }

    Reducer::Reducer(Config const& config, std::unique_ptr<RuleRegistry> rules, CardTable cards) :
        cfg_(config),
        board_(std::make_shared<Board const>(config.board)),
        cards_(std::move(cards)),
        rules_(std::move(rules)),
        generator_(board_)
    {
        FTK_ASSERT(rules_ != nullptr, "Reducer without a rule registry");
        FTK_ASSERT(cfg_.pieces_per_player >= 1, "Players need at least one piece");
        FTK_ASSERT(cfg_.pieces_start_on_home <= 1, "Only one piece fits on the home hole");
        FTK_ASSERT(cfg_.pieces_per_player - cfg_.pieces_start_on_home <= cfg_.board.holding_slots,
                   "Starting pieces do not fit in holding");
        FTK_ASSERT(cfg_.pieces_per_player * constants::MaxSeats <= std::numeric_limits<PieceId>::max(),
                   "Too many pieces for the piece id range");
    }

    auto Reducer::CurrentCard(GameState const& s) const -> CardSpec const*
    {
        if (!s.turn.card) return nullptr;
        return &cards_.Spec(*s.turn.card);
    }

    auto Reducer::Apply(GameState const& s, Event const& e) const -> ApplyOutcome
    {
        if (s.phase == Phase::GameWon)
            return Invalid("game already won");
        if (e.sequence != s.next_sequence)
            return Invalid(std::format("expected sequence {}, got {}", s.next_sequence, e.sequence));

        ApplyResult r{.state = s, .effects = {}};

        auto const handled = std::visit([&]<typename T0>(T0 const& ev) -> std::expected<void, Rejection>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PlayerJoined>) return OnJoined(r, ev);
            else if constexpr (std::is_same_v<T, GameStarted>) return OnStarted(r, ev);
            else if constexpr (std::is_same_v<T, CardDrawn>) return OnCardDrawn(r, ev);
            else if constexpr (std::is_same_v<T, MovePlayed>) return OnMovePlayed(r, ev);
            else if constexpr (std::is_same_v<T, SplitMovePlayed>) return OnSplitMovePlayed(r, ev);
            else return OnTurnEnded(r, ev);
        }, e.payload);

        if (!handled) return std::unexpected(handled.error());
        r.state.next_sequence = s.next_sequence + 1;
        return r;
    }

    auto Reducer::OnJoined(ApplyResult& r, PlayerJoined const& e) const -> std::expected<void, Rejection>
    {
        GameState& s = r.state;
        if (s.phase != Phase::Lobby) return Invalid("players can only join in the lobby");
        if (e.seat >= constants::MaxSeats || e.seat >= board_->Sections())
            return Invalid(std::format("seat P{} out of range", static_cast<int>(e.seat)));
        if (std::ranges::find(s.lobby, e.seat) != s.lobby.end())
            return Invalid(std::format("seat P{} already joined", static_cast<int>(e.seat)));

        s.lobby.push_back(e.seat);
        r.effects.push_back(Effect{.kind = EffectKind::PlayerJoined, .seat = e.seat});
        return {};
    }

    auto Reducer::OnStarted(ApplyResult& r, GameStarted const& e) const -> std::expected<void, Rejection>
    {
        GameState& s = r.state;
        if (s.phase != Phase::Lobby) return Invalid("game already started");

        std::size_t const n = e.player_order.size();
        std::size_t const max_players = std::min<std::size_t>(constants::MaxSeats, board_->Sections());
        if (n < constants::MinPlayers || n > max_players)
            return Invalid(std::format("{} players, need {}..{}", n, constants::MinPlayers, max_players));

        std::vector<SeatT> sorted = e.player_order;
        std::ranges::sort(sorted);
        if (std::ranges::adjacent_find(sorted) != sorted.end()) return Invalid("duplicate seat in player order");
        if (sorted.back() >= max_players) return Invalid("seat out of range in player order");
        if (!s.lobby.empty())
        {
            std::vector<SeatT> joined = s.lobby;
            std::ranges::sort(joined);
            if (joined != sorted) return Invalid("player order does not match the joined seats");
        }

        s.rng = RngState{.seed = e.seed, .consumed = 0};
        DeterministicRng rng{s.rng};
        uint8_t const in_holding = cfg_.pieces_per_player - cfg_.pieces_start_on_home;

        for (std::size_t i{}; i < n; ++i)
        {
            PlayerState p{.seat = e.player_order[i], .section = Board::SectionForSeat(i, n, board_->Sections())};
            for (uint8_t k = 0; k < cfg_.pieces_per_player; ++k)
            {
                auto const id = static_cast<PieceId>(s.pieces.size());
                HoleId const at = k < in_holding ? board_->Holding(p.section, k) : board_->Home(p.section);
                s.pieces.push_back(Piece{.id = id, .owner = p.seat, .location = at});
                p.pieces.push_back(id);
            }
            p.deck.draw_pile = BuildDeck(cfg_.jokers);
            rng.Shuffle(p.deck.draw_pile);
            s.players.push_back(std::move(p));
        }

        s.turn = TurnState{.active = 0, .number = 1};
        s.phase = Phase::AwaitingDraw;
        r.effects.push_back(Effect{.kind = EffectKind::GameStarted, .seat = s.players.front().seat});
        return {};
    }

    auto Reducer::Draw(GameState& s, std::vector<Effect>& effects) const -> Card
    {
        PlayerState& p = s.players[s.turn.active];
        if (p.deck.draw_pile.empty())
        {
            if (p.deck.discard_pile.empty())
                FTK_THROW(error::Code::State, std::format("P{} has no cards left anywhere", static_cast<int>(p.seat)));
            p.deck.draw_pile = std::move(p.deck.discard_pile);
            p.deck.discard_pile.clear();
            DeterministicRng{s.rng}.Shuffle(p.deck.draw_pile);
            effects.push_back(Effect{.kind = EffectKind::DeckReshuffled, .seat = p.seat});
        }
        Card const c = p.deck.draw_pile.back();
        p.deck.draw_pile.pop_back();
        return c;
    }

    auto Reducer::OnCardDrawn(ApplyResult& r, CardDrawn const& e) const -> std::expected<void, Rejection>
    {
        if (auto ok = ExpectActive(r.state, e.seat, {Phase::AwaitingDraw}); !ok) return ok;
        GameState& s = r.state;

        Card const card = Draw(s, r.effects);
        s.turn.card = card;
        s.turn.shortcut_movers.clear();
        r.effects.push_back(Effect{.kind = EffectKind::CardDrawn, .seat = e.seat, .card = card});

        CardSpec const& spec = cards_.Spec(card);
        if (spec.revokes_shortcut)
        {
            for (Piece& p : s.pieces)
            {
                if (!p.on_shortcut) continue;
                p.on_shortcut = false;
                p.shortcut_entry = NoHole;
                r.effects.push_back(Effect{.kind = EffectKind::ShortcutRevoked, .seat = p.owner, .piece = p.id,
                                           .hole = p.location});
            }
        }

        s.phase = Phase::AwaitingMove;
        if (LegalMoves(s).empty())
        {
            r.effects.push_back(Effect{.kind = EffectKind::NoLegalMoves, .seat = e.seat, .card = card});
            ResolveTurn(r, false);
        }
        return {};
    }

    auto Reducer::IsLegal(GameState const& s, SeatT seat, Candidate const& c) const -> bool
    {
        CardSpec const* spec = CurrentCard(s);
        FTK_ASSERT(spec != nullptr, "Legality check without a card in play");
        return rules_->Validate(BuildContext(*board_, s, *spec, seat, c.move)).Legal();
    }

    auto Reducer::Validate(GameState const& s, SeatT seat, Move const& m) const -> ValidationReport
    {
        CardSpec const* spec = CurrentCard(s);
        if (!spec) FTK_THROW(error::Code::State, "No card in play to validate against");
        return rules_->Validate(BuildContext(*board_, s, *spec, seat, m));
    }

    auto Reducer::HasSplitCompletion(GameState const& s, SeatT seat, Candidate const& first, uint8_t remaining) const
        -> bool
    {
        GameState after = s;
        std::vector<Effect> scratch;
        MovePiece(after, seat, first, scratch);
        CardSpec const* spec = CurrentCard(after);
        return std::ranges::any_of(generator_.ForSeat(after, seat, *spec, remaining, first.move.piece),
                                   [&](Candidate const& c) { return IsLegal(after, seat, c); });
    }

    auto Reducer::SplitFirstParts(GameState const& s, SeatT seat, CardSpec const& card) const -> std::vector<Candidate>
    {
        std::vector<Candidate> out;
        for (uint8_t k = 1; k < card.movement; ++k)
        {
            for (Candidate& c : generator_.ForSeat(s, seat, card, k))
            {
                if (IsHopExempt(c.move.type)) continue;
                if (!IsLegal(s, seat, c)) continue;
                if (!HasSplitCompletion(s, seat, c, static_cast<uint8_t>(card.movement - k))) continue;
                c.notes |= Note_SplitPart;
                out.push_back(std::move(c));
            }
        }
        return out;
    }

    auto Reducer::LegalMoves(GameState const& s) const -> std::vector<Candidate>
    {
        CardSpec const* spec = CurrentCard(s);
        if (!spec || s.players.empty()) return {};
        SeatT const seat = ActivePlayer(s).seat;

        std::vector<Candidate> out;
        if (s.phase == Phase::AwaitingMove)
        {
            for (Candidate& c : generator_.ForSeat(s, seat, *spec, spec->movement))
            {
                if (IsLegal(s, seat, c)) out.push_back(std::move(c));
            }
            if (spec->split_move)
            {
                auto parts = SplitFirstParts(s, seat, *spec);
                std::ranges::move(parts, std::back_inserter(out));
            }
        }
        else if (s.phase == Phase::AwaitingSplitMove)
        {
            for (Candidate& c : generator_.ForSeat(s, seat, *spec, s.turn.split_remaining, s.turn.split_first))
            {
                if (IsHopExempt(c.move.type) || !IsLegal(s, seat, c)) continue;
                c.notes |= Note_SplitPart;
                out.push_back(std::move(c));
            }
        }
        return out;
    }

    auto Reducer::Resolve(GameState const& s, SeatT seat, Move const& m, std::optional<PieceId> exclude) const
        -> std::expected<Candidate, Rejection>
    {
        ValidationReport report = Validate(s, seat, m);

        std::optional<Candidate> match{};
        if (m.piece < s.pieces.size() && (!exclude || *exclude != m.piece))
        {
            for (Candidate& c : generator_.ForPiece(s, m.piece, *CurrentCard(s), m.hops))
            {
                if (c.move.type == m.type && c.move.path == m.path)
                {
                    match = std::move(c);
                    break;
                }
            }
        }
        if (!match && report.Legal())
        {
            report.violations.push_back(error::RuleViolation{.code = error::RuleViolationCode::Path_Unreachable}
                                        .with_rule("move-generator").with_piece(m.piece).with_seat(seat));
        }
        if (!report.Legal())
        {
            for (auto& v : report.violations)
            {
                if (!v.seat) v.with_seat(seat);
                v.with_phase(s.phase);
            }
            return Illegal(std::format("move of piece {} rejected", static_cast<int>(m.piece)),
                           std::move(report.violations));
        }
        return *match;
    }

    auto Reducer::MovePiece(GameState& s, SeatT seat, Candidate const& c, std::vector<Effect>& effects) const -> void
    {
        generator_.VerifyHops(c);

        Piece& mover = s.pieces.at(c.move.piece);
        FTK_ASSERT(mover.owner == seat, "Moving a piece of another seat");
        HoleId const to = c.move.To();

        if (c.captures)
        {
            Piece& victim = s.pieces.at(*c.captures);
            auto const slot = FreeHoldingSlot(*board_, s, victim.owner);
            if (!slot)
                FTK_THROW(error::Code::State, std::format("P{} holding full while capturing",
                                                          static_cast<int>(victim.owner)));
            victim.location = *slot;
            victim.eligible_for_safe_zone = false;
            victim.on_shortcut = false;
            victim.completed_circuit = false;
            victim.shortcut_entry = NoHole;
            victim.exited_capture_hole = false;
            effects.push_back(Effect{.kind = EffectKind::CaptureResolved, .seat = victim.owner, .piece = mover.id,
                                     .other = victim.id, .hole = to});
        }

        mover.location = to;
        mover.eligible_for_safe_zone = c.flags.eligible_for_safe_zone;
        mover.on_shortcut = c.flags.on_shortcut;
        mover.completed_circuit = c.flags.completed_circuit;
        mover.shortcut_entry = c.flags.shortcut_entry;
        mover.exited_capture_hole = c.flags.exited_capture_hole;

        if (IsShortcutMove(c.move.type) && std::ranges::find(s.turn.shortcut_movers, mover.id) == s.turn.shortcut_movers.end())
            s.turn.shortcut_movers.push_back(mover.id);

        effects.push_back(Effect{
            .kind = c.move.type == MoveType::Enter ? EffectKind::PieceEntered : EffectKind::PieceMoved,
            .seat = seat, .piece = mover.id, .hole = to
        });
    }

    auto Reducer::FinishMove(ApplyResult& r, Candidate const& c) const -> void
    {
        GameState& s = r.state;
        SeatT const seat = ActivePlayer(s).seat;
        MovePiece(s, seat, c, r.effects);

        if (c.Has(Note_Wins))
        {
            PlayerState& p = s.players[s.turn.active];
            if (s.turn.card) p.deck.discard_pile.push_back(*s.turn.card);
            s.turn.card.reset();
            s.winner = seat;
            s.phase = Phase::GameWon;
            r.effects.push_back(Effect{.kind = EffectKind::GameWon, .seat = seat, .piece = c.move.piece});
        }
    }

    auto Reducer::OnMovePlayed(ApplyResult& r, MovePlayed const& e) const -> std::expected<void, Rejection>
    {
        if (auto ok = ExpectActive(r.state, e.seat, {Phase::AwaitingMove}); !ok) return ok;
        if (e.piece >= r.state.pieces.size())
            return Invalid(std::format("unknown piece {}", static_cast<int>(e.piece)));
        if (auto ok = ExpectOnBoard(*board_, e.path); !ok) return ok;

        CardSpec const& spec = *CurrentCard(r.state);
        Move const m{.piece = e.piece, .type = e.type, .path = e.path, .hops = spec.movement};
        auto cand = Resolve(r.state, e.seat, m, std::nullopt);
        if (!cand) return std::unexpected(cand.error());

        FinishMove(r, *cand);
        if (r.state.phase != Phase::GameWon) ResolveTurn(r, true);
        return {};
    }

    auto Reducer::OnSplitMovePlayed(ApplyResult& r, SplitMovePlayed const& e) const -> std::expected<void, Rejection>
    {
        if (auto ok = ExpectActive(r.state, e.seat, {Phase::AwaitingMove, Phase::AwaitingSplitMove}); !ok) return ok;
        if (e.piece >= r.state.pieces.size())
            return Invalid(std::format("unknown piece {}", static_cast<int>(e.piece)));
        if (auto ok = ExpectOnBoard(*board_, e.path); !ok) return ok;

        GameState& s = r.state;
        CardSpec const& spec = *CurrentCard(s);
        using RVC = error::RuleViolationCode;
        auto const hops = static_cast<uint8_t>(e.path.empty() ? 0 : e.path.size() - 1);
        auto viol = [&](RVC code)
        {
            return Illegal("split move rejected", {
                error::RuleViolation{.code = code}.with_rule("split-move").with_seat(e.seat).with_piece(e.piece)
                                                 .with_phase(s.phase).with_rank(spec.rank)
            });
        };

        if (!spec.split_move) return viol(RVC::Split_NotAllowed);

        if (s.phase == Phase::AwaitingMove)
        {
            if (hops == 0 || hops >= spec.movement) return viol(RVC::Hop_CountMismatch);
            Move const m{.piece = e.piece, .type = e.type, .path = e.path, .hops = hops};
            auto cand = Resolve(s, e.seat, m, std::nullopt);
            if (!cand) return std::unexpected(cand.error());
            auto const remaining = static_cast<uint8_t>(spec.movement - hops);
            if (!HasSplitCompletion(s, e.seat, *cand, remaining)) return viol(RVC::Split_NoSecondMove);

            FinishMove(r, *cand);
            if (s.phase == Phase::GameWon) return {};
            s.turn.split_remaining = remaining;
            s.turn.split_first = e.piece;
            s.phase = Phase::AwaitingSplitMove;
            return {};
        }

        if (s.turn.split_first && *s.turn.split_first == e.piece) return viol(RVC::Split_SamePiece);
        Move const m{.piece = e.piece, .type = e.type, .path = e.path, .hops = s.turn.split_remaining};
        auto cand = Resolve(s, e.seat, m, s.turn.split_first);
        if (!cand) return std::unexpected(cand.error());

        FinishMove(r, *cand);
        if (s.phase != Phase::GameWon) ResolveTurn(r, true);
        return {};
    }

    auto Reducer::OnTurnEnded(ApplyResult& r, TurnEnded const& e) const -> std::expected<void, Rejection>
    {
        if (auto ok = ExpectActive(r.state, e.seat,
                                   {Phase::AwaitingDraw, Phase::AwaitingMove, Phase::AwaitingSplitMove}); !ok)
            return ok;
        ResolveTurn(r, false);
        return {};
    }

    auto Reducer::ForceShortcutExits(ApplyResult& r) const -> void
    {
        GameState& s = r.state;
        PlayerState const& p = s.players[s.turn.active];
        for (PieceId const id : p.pieces)
        {
            Piece& piece = s.pieces[id];
            if (!piece.on_shortcut) continue;
            if (std::ranges::find(s.turn.shortcut_movers, id) != s.turn.shortcut_movers.end()) continue;

            piece.on_shortcut = false;
            piece.shortcut_entry = NoHole;
            if (cfg_.forced_exit == ForcedExitRule::NextPerimeterHole)
            {
                HoleId const next = board_->NextPerimeter(piece.location, Direction::Forward);
                if (!PieceAt(s, next)) piece.location = next;
            }
            r.effects.push_back(Effect{.kind = EffectKind::ForcedShortcutExit, .seat = piece.owner, .piece = id,
                                       .hole = piece.location});
        }
    }

    auto Reducer::ResolveTurn(ApplyResult& r, bool allow_extra) const -> void
    {
        GameState& s = r.state;
        s.phase = Phase::TurnResolution;

        PlayerState& p = s.players[s.turn.active];
        bool extra = false;
        if (s.turn.card)
        {
            extra = allow_extra && cards_.Spec(*s.turn.card).extra_turn;
            p.deck.discard_pile.push_back(*s.turn.card);
            s.turn.card.reset();
        }

        ForceShortcutExits(r);

        if (extra)
        {
            r.effects.push_back(Effect{.kind = EffectKind::ExtraTurn, .seat = p.seat});
        }
        else
        {
            s.turn.active = static_cast<uint8_t>((s.turn.active + 1) % s.players.size());
            r.effects.push_back(Effect{.kind = EffectKind::TurnPassed, .seat = s.players[s.turn.active].seat});
        }

        ++s.turn.number;
        s.turn.split_remaining = 0;
        s.turn.split_first.reset();
        s.turn.shortcut_movers.clear();
        s.phase = Phase::AwaitingDraw;
    }

    auto Reducer::Replay(std::span<Event const> log) const -> std::expected<GameState, Rejection>
    {
        GameState s{};
        for (Event const& e : log)
        {
            auto r = Apply(s, e);
            if (!r) return std::unexpected(r.error());
            s = std::move(r->state);
        }
        return s;
    }
}
