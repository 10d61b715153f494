//
// Created by Malik T on 19/10/2026.
//

#include "MoveGenerator.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <print>
#include "Exception.hpp"

namespace fasttrack::core
{
    auto ToString(BlockReason r) -> std::string_view
    {
        switch (r)
        {
        case BlockReason::None: return "none";
        case BlockReason::OwnPiece: return "own piece in the way";
        case BlockReason::BackwardIntoProtected: return "backward into protected hole";
        case BlockReason::BackwardFromSafeZone: return "backward out of the safe zone";
        case BlockReason::SafeZoneEnd: return "past the end of the safe zone";
        case BlockReason::WinnerOvershoot: return "past the winner hole";
        case BlockReason::InHolding: return "piece still in holding";
        case BlockReason::CaptureHoleLocked: return "capture hole needs an exit card";
        case BlockReason::NoEntryCard: return "card cannot enter";
        case BlockReason::NoExitCorner: return "every corner holds an own piece";
        case BlockReason::CaptureHoleSpent: return "capture hole already left once";
        }
        return "unknown";
    }

    auto FlagsOf(Piece const& p) -> PieceFlags
    {
        return PieceFlags{
            .eligible_for_safe_zone = p.eligible_for_safe_zone,
            .on_shortcut = p.on_shortcut,
            .completed_circuit = p.completed_circuit,
            .shortcut_entry = p.shortcut_entry,
            .exited_capture_hole = p.exited_capture_hole
        };
    }

    namespace
    {
        auto Blocked(PathTrace t, uint8_t hop, BlockReason r) -> PathTrace
        {
            t.blocked = true;
            t.blocked_at_hop = hop;
            t.reason = r;
            return t;
        }

        auto IsOwnOther(Piece const* occ, Piece const& mover) -> bool
        {
            return occ && occ->owner == mover.owner && occ->id != mover.id;
        }

        auto FormatPath(Board const& b, std::vector<HoleId> const& path) -> std::string
        {
            std::string s;
            for (std::size_t i{}; i < path.size(); ++i)
            {
                s += (i ? " -> " : "");
                s += b.Contains(path[i]) ? b.Name(path[i]) : std::format("#{}", path[i]);
            }
            return s;
        }
    }

    MoveGenerator::MoveGenerator(std::shared_ptr<Board const> board) :
        board_(std::move(board))
    {
        FTK_ASSERT(board_ != nullptr, "Move generator without a board");
    }

    auto MoveGenerator::NextHop(GameState const& s, Piece const& piece, PieceFlags& flags, HoleId cur,
                                Direction dir) const -> std::expected<HoleId, BlockReason>
    {
        Board const& b = *board_;
        uint8_t const section = OwnerSection(s, piece.owner);

        switch (b.At(cur).kind)
        {
        case HoleKind::Holding:
            return std::unexpected(BlockReason::InHolding);
        case HoleKind::CaptureHole:
            return std::unexpected(BlockReason::CaptureHoleLocked);
        case HoleKind::SafeZone:
        {
            if (dir == Direction::Backward) return std::unexpected(BlockReason::BackwardFromSafeZone);
            auto const next = b.NextSafe(cur);
            if (!next) return std::unexpected(BlockReason::SafeZoneEnd);
            return *next;
        }
        default:
            break;
        }

        if (dir == Direction::Backward)
        {
            // corners are plain waypoints when moving backward
            flags.on_shortcut = false;
            flags.shortcut_entry = NoHole;
            return b.NextPerimeter(cur, Direction::Backward);
        }

        if (flags.on_shortcut && b.IsCorner(cur))
        {
            HoleId const ring_next = b.NextShortcut(cur);
            if (!IsOwnOther(PieceAt(s, ring_next), piece)) return ring_next;
            // own piece ahead on the ring: drop back to the perimeter from here
            flags.on_shortcut = false;
            flags.shortcut_entry = NoHole;
            return b.NextPerimeter(cur, Direction::Forward);
        }

        if (cur == b.SafeEntry(section) && flags.eligible_for_safe_zone)
        {
            if (SafeZoneFull(b, s, piece.owner)) return b.NextPerimeter(cur, Direction::Forward);
            return b.SafeSlot(section, 0);
        }

        return b.NextPerimeter(cur, Direction::Forward);
    }

    auto MoveGenerator::UpdateFlags(PieceFlags& flags, uint8_t section, HoleId from, HoleId to) const -> void
    {
        Board const& b = *board_;
        if (flags.on_shortcut && !b.IsCorner(to))
        {
            flags.on_shortcut = false;
            flags.shortcut_entry = NoHole;
        }
        if (flags.on_shortcut && b.IsCorner(from) && to == b.ShortcutExit(section) && to != flags.shortcut_entry)
        {
            flags.on_shortcut = false;
            flags.shortcut_entry = NoHole;
            flags.completed_circuit = true;
            flags.eligible_for_safe_zone = true;
        }
        if (to == b.SafeEntry(section) && !flags.completed_circuit)
        {
            flags.completed_circuit = true;
            flags.eligible_for_safe_zone = true;
        }
        if (b.IsSafe(to))
        {
            flags.eligible_for_safe_zone = false;
        }
    }

    auto MoveGenerator::Walk(GameState const& s, Piece const& piece, PieceFlags flags, uint8_t hops,
                             Direction dir, MoveType type) const -> PathTrace
    {
        Board const& b = *board_;
        uint8_t const section = OwnerSection(s, piece.owner);
        bool const safe_full = SafeZoneFull(b, s, piece.owner);

        PathTrace t{.type = type, .path = {piece.location}, .flags = flags};
        t.path.reserve(hops + 1);
        HoleId cur = piece.location;

        for (uint8_t hop = 1; hop <= hops; ++hop)
        {
            auto const next = NextHop(s, piece, t.flags, cur, dir);
            if (!next) return Blocked(std::move(t), hop, next.error());

            if (IsOwnOther(PieceAt(s, *next), piece))
                return Blocked(std::move(t), hop, BlockReason::OwnPiece);

            if (dir == Direction::Backward && b.IsProtected(*next))
                return Blocked(std::move(t), hop, BlockReason::BackwardIntoProtected);

            bool const winner_mode = safe_full && t.flags.completed_circuit;
            if (dir == Direction::Forward && winner_mode && *next == b.Home(section) && hop < hops)
                return Blocked(std::move(t), hop, BlockReason::WinnerOvershoot);

            t.path.push_back(*next);
            if (dir == Direction::Forward) UpdateFlags(t.flags, section, cur, *next);
            cur = *next;
        }
        return t;
    }

    auto MoveGenerator::CaptureHoleRoute(GameState const& s, Piece const& piece, uint8_t hops) const -> PathTrace
    {
        Board const& b = *board_;
        uint8_t const section = OwnerSection(s, piece.owner);

        // the first hops - 1 stay on the ring, the last drops into the centre
        PathTrace t = Walk(s, piece, FlagsOf(piece), static_cast<uint8_t>(hops - 1), Direction::Forward,
                           MoveType::EnterCaptureHole);
        if (t.blocked) return t;

        auto const hop = static_cast<uint8_t>(hops);
        HoleId const last = t.path.back();
        if (!t.flags.on_shortcut || !b.IsCorner(last) || last == b.ShortcutExit(section))
            return Blocked(std::move(t), hop, BlockReason::CaptureHoleLocked);

        if (piece.exited_capture_hole)
            return Blocked(std::move(t), hop, BlockReason::CaptureHoleSpent);
        if (IsOwnOther(PieceAt(s, b.CaptureHole()), piece))
            return Blocked(std::move(t), hop, BlockReason::OwnPiece);

        t.path.push_back(b.CaptureHole());
        t.flags.on_shortcut = false;
        t.flags.shortcut_entry = NoHole;
        return t;
    }

    auto MoveGenerator::Trace(GameState const& s, PieceId id, CardSpec const& card, uint8_t hops) const
        -> std::vector<PathTrace>
    {
        Board const& b = *board_;
        FTK_ASSERT(id < s.pieces.size(), std::format("Unknown piece {}", static_cast<int>(id)));
        Piece const& piece = s.pieces[id];
        uint8_t const section = OwnerSection(s, piece.owner);
        PieceFlags const start = FlagsOf(piece);

        std::vector<PathTrace> out;

        if (b.IsHolding(piece.location))
        {
            PathTrace t{.type = MoveType::Enter, .path = {piece.location}};
            if (!card.entry)
            {
                out.push_back(Blocked(std::move(t), 0, BlockReason::NoEntryCard));
                return out;
            }
            HoleId const home = b.Home(section);
            if (IsOwnOther(PieceAt(s, home), piece))
            {
                out.push_back(Blocked(std::move(t), 1, BlockReason::OwnPiece));
                return out;
            }
            t.path.push_back(home);
            out.push_back(std::move(t));
            return out;
        }

        if (piece.location == b.CaptureHole())
        {
            PathTrace t{.type = MoveType::ExitCaptureHole, .path = {piece.location}, .flags = start};
            if (!card.exit_capture)
            {
                out.push_back(Blocked(std::move(t), 0, BlockReason::CaptureHoleLocked));
                return out;
            }
            // own exit corner first, then back around the ring
            HoleId target = b.ShortcutExit(section);
            for (uint8_t i = 0; i < b.Sections(); ++i)
            {
                if (!IsOwnOther(PieceAt(s, target), piece))
                {
                    t.path.push_back(target);
                    t.flags.on_shortcut = false;
                    t.flags.shortcut_entry = NoHole;
                    t.flags.exited_capture_hole = true;
                    out.push_back(std::move(t));
                    return out;
                }
                target = b.PrevShortcut(target);
            }
            out.push_back(Blocked(std::move(t), 1, BlockReason::NoExitCorner));
            return out;
        }

        if (hops == 0) return out;

        if (card.direction == Direction::Backward)
        {
            PieceFlags f = start;
            f.on_shortcut = false;
            f.shortcut_entry = NoHole;
            out.push_back(Walk(s, piece, f, hops, Direction::Backward, MoveType::Retreat));
            return out;
        }

        if (piece.on_shortcut)
        {
            PathTrace cont = Walk(s, piece, start, hops, Direction::Forward, MoveType::ContinueShortcut);

            PieceFlags off = start;
            off.on_shortcut = false;
            off.shortcut_entry = NoHole;
            PathTrace leave = Walk(s, piece, off, hops, Direction::Forward, MoveType::LeaveShortcut);
            bool const same_route = !cont.blocked && !leave.blocked && cont.path == leave.path;

            out.push_back(std::move(cont));
            if (!same_route) out.push_back(std::move(leave));
            out.push_back(CaptureHoleRoute(s, piece, hops));
        }
        else
        {
            PathTrace adv = Walk(s, piece, start, hops, Direction::Forward, MoveType::Advance);
            if (!adv.blocked && !adv.flags.on_shortcut)
            {
                HoleId const last = adv.path.back();
                if (b.IsCorner(last) && last != b.ShortcutExit(section))
                {
                    PathTrace enter = adv;
                    enter.type = MoveType::EnterShortcut;
                    enter.flags.on_shortcut = true;
                    enter.flags.shortcut_entry = last;
                    out.push_back(std::move(adv));
                    out.push_back(std::move(enter));
                    return AppendBackwardCapture(s, piece, card, std::move(out));
                }
            }
            out.push_back(std::move(adv));
        }
        return AppendBackwardCapture(s, piece, card, std::move(out));
    }

    auto MoveGenerator::AppendBackwardCapture(GameState const& s, Piece const& piece, CardSpec const& card,
                                              std::vector<PathTrace> out) const -> std::vector<PathTrace>
    {
        Board const& b = *board_;
        if (!card.backward_capture || piece.on_shortcut || !IsBackwardCaptureOrigin(b, piece.location)) return out;

        HoleId const prev = b.NextPerimeter(piece.location, Direction::Backward);
        Piece const* occ = PieceAt(s, prev);
        if (!occ || occ->owner == piece.owner || b.IsProtected(prev)) return out;

        out.push_back(PathTrace{.type = MoveType::Retreat, .path = {piece.location, prev}, .flags = FlagsOf(piece)});
        return out;
    }

    auto MoveGenerator::ToCandidate(GameState const& s, Piece const& piece, PathTrace const& t, uint8_t hops) const
        -> Candidate
    {
        Board const& b = *board_;
        Candidate c{
            .move = Move{.piece = piece.id, .type = t.type, .path = t.path, .hops = hops},
            .flags = t.flags
        };
        if (t.type == MoveType::Enter)
        {
            c.flags = PieceFlags{};
        }

        HoleId const to = c.move.To();
        if (Piece const* occ = PieceAt(s, to); occ && occ->owner != piece.owner)
        {
            c.captures = occ->id;
            c.notes |= Note_Capture;
        }
        if (b.IsSafe(to) && !b.IsSafe(piece.location)) c.notes |= Note_EntersSafeZone;
        if (!piece.completed_circuit && c.flags.completed_circuit) c.notes |= Note_CompletesCircuit;
        if (!piece.on_shortcut && c.flags.on_shortcut) c.notes |= Note_EntersShortcut;
        if (piece.on_shortcut && !c.flags.on_shortcut) c.notes |= Note_LeavesShortcut;
        if (to == b.CaptureHole()) c.notes |= Note_EntersCaptureHole;

        uint8_t const section = OwnerSection(s, piece.owner);
        bool const forward = t.type != MoveType::Retreat && t.type != MoveType::Enter;
        if (forward && to == b.Home(section) && c.flags.completed_circuit && SafeZoneFull(b, s, piece.owner))
            c.notes |= Note_Wins;
        return c;
    }

    auto MoveGenerator::ForPiece(GameState const& s, PieceId id, CardSpec const& card, uint8_t hops) const
        -> std::vector<Candidate>
    {
        std::vector<Candidate> out;
        for (PathTrace const& t : Trace(s, id, card, hops))
        {
            if (t.blocked) continue;
            Candidate c = ToCandidate(s, s.pieces[id], t, hops);
            VerifyHops(c);
            out.push_back(std::move(c));
        }
        return out;
    }

    auto MoveGenerator::ForSeat(GameState const& s, SeatT seat, CardSpec const& card, uint8_t hops,
                                std::optional<PieceId> exclude) const -> std::vector<Candidate>
    {
        PlayerState const* player = FindPlayer(s, seat);
        if (!player) FTK_THROW(error::Code::State, std::format("Seat P{} is not playing", static_cast<int>(seat)));

        std::vector<Candidate> out;
        bool holding_offered = false;
        for (PieceId const id : player->pieces)
        {
            if (exclude && *exclude == id) continue;
            if (board_->IsHolding(s.pieces[id].location))
            {
                if (holding_offered) continue;
                holding_offered = true;
            }
            auto cands = ForPiece(s, id, card, hops);
            std::ranges::move(cands, std::back_inserter(out));
        }
        return out;
    }

    auto MoveGenerator::VerifyHops(Candidate const& c) const -> void
    {
        if (IsHopExempt(c.move.type)) return;
        if (c.move.PathHops() == c.move.hops) return;

        std::string const msg = std::format(
            "Hop mismatch for piece {} (type {}): declared {} hops, path covers {} [{}]",
            static_cast<int>(c.move.piece), static_cast<int>(std::to_underlying(c.move.type)),
            c.move.hops, c.move.PathHops(), FormatPath(*board_, c.move.path));
        std::print(stderr, "{}\n", msg);
        FTK_THROW(error::Code::HopMismatch, msg);
    }
}
