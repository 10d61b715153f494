//
// Created by Malik T on 19/10/2026.
//

#include "Rules.hpp"

#include <algorithm>

namespace fasttrack::core
{
    auto BuildContext(Board const& board, GameState const& state, CardSpec const& card, SeatT seat,
                      Move const& move) -> MoveContext
    {
        Piece const* piece = move.piece < state.pieces.size() ? &state.pieces[move.piece] : nullptr;
        SeatT const owner = piece ? piece->owner : seat;

        MoveContext ctx{
            .board = board,
            .state = state,
            .card = card,
            .move = move,
            .piece = piece,
            .seat = seat,
            .section = OwnerSection(state, owner),
            .expected_hops = move.hops
        };
        if (!piece || move.path.empty()) return ctx;

        auto const& path = move.path;
        auto valid = [&](HoleId h) { return board.Contains(h); };

        // pieces along the way (destination excluded) and at the destination
        for (std::size_t i = 1; i + 1 < path.size(); ++i)
        {
            if (!valid(path[i])) continue;
            Piece const* occ = PieceAt(state, path[i]);
            if (occ && occ->owner == owner && occ->id != piece->id)
            {
                ctx.own_on_path = occ;
                break;
            }
        }
        HoleId const to = path.back();
        if (path.size() > 1 && valid(to))
        {
            if (Piece const* occ = PieceAt(state, to); occ && occ->id != piece->id)
            {
                if (occ->owner == owner)
                {
                    ctx.own_at_destination = occ;
                }
                else
                {
                    ctx.opponent_at_destination = occ;
                    ctx.opponent_holding_used = HoldingCount(board, state, occ->owner);
                    ctx.opponent_can_receive_capture = ctx.opponent_holding_used < board.Config().holding_slots;
                }
            }
            ctx.destination_protected = board.IsProtected(to);
        }

        // replay the route for circuit and safe-zone facts
        bool completed = piece->completed_circuit;
        bool const safe_full = SafeZoneFull(board, state, owner);
        bool const forward = move.type != MoveType::Retreat && move.type != MoveType::Enter;
        for (std::size_t i = 1; i < path.size(); ++i)
        {
            HoleId const prev = path[i - 1];
            HoleId const h = path[i];
            if (!valid(prev) || !valid(h)) continue;
            Hole const& ph = board.At(prev);
            Hole const& hh = board.At(h);

            if (forward && h == board.SafeEntry(ctx.section)) completed = true;
            if (ph.kind == HoleKind::ShortcutCorner && hh.kind == HoleKind::ShortcutCorner
                && h == board.ShortcutExit(ctx.section))
                completed = true;

            if (hh.kind == HoleKind::SafeZone)
            {
                if (*hh.section != ctx.section && !ctx.foreign_safe_hole) ctx.foreign_safe_hole = h;
                if (ph.kind != HoleKind::SafeZone)
                {
                    ctx.enters_safe_zone = true;
                    ctx.circuit_complete_at_safe_entry = completed;
                }
                else if (hh.slot <= ph.slot)
                {
                    ctx.safe_zone_backward = true;
                }
            }
            else if (ph.kind == HoleKind::SafeZone)
            {
                ctx.safe_zone_backward = true;
            }

            if (forward && safe_full && completed && h == board.Home(ctx.section) && i + 1 < path.size())
                ctx.winner_overshoot = true;
        }

        if (!IsHopExempt(move.type) && valid(path.front()) && valid(to))
        {
            Hole const& from = board.At(path.front());
            uint8_t const slots = board.Config().safe_slots;
            if (from.kind == HoleKind::SafeZone && move.hops > slots - 1 - from.slot)
                ctx.safe_zone_overshoot = true;
            if (board.IsSafe(to) && move.PathHops() < move.hops)
                ctx.safe_zone_overshoot = true;
        }

        ctx.wins = forward && to == board.Home(ctx.section) && completed && safe_full;
        return ctx;
    }

    auto ToString(RuleTag t) -> std::string_view
    {
        switch (t)
        {
        case RuleTag::Ownership: return "ownership";
        case RuleTag::Entry: return "entry";
        case RuleTag::Path: return "path";
        case RuleTag::Blocking: return "blocking";
        case RuleTag::Direction: return "direction";
        case RuleTag::Capture: return "capture";
        case RuleTag::SafeZone: return "safe-zone";
        case RuleTag::CaptureHole: return "capture-hole";
        case RuleTag::Win: return "win";
        }
        return "?";
    }

    auto RuleRegistry::Add(std::unique_ptr<Rule> rule) -> RuleRegistry&
    {
        FTK_ASSERT(rule != nullptr, "Null rule added to registry");
        FTK_ASSERT(std::ranges::none_of(rules_, [&](auto const& r) { return r->Id() == rule->Id(); }),
                   std::format("Duplicate rule id {}", rule->Id()));
        rules_.push_back(std::move(rule));
        return *this;
    }

    auto RuleRegistry::Validate(MoveContext const& ctx) const -> ValidationReport
    {
        ValidationReport report{};
        for (auto const& rule : rules_)
        {
            if (auto const r = rule->Evaluate(ctx); !r.has_value())
            {
                error::RuleViolation v = r.error();
                if (v.rule.empty()) v.with_rule(rule->Id());
                v.with_tag(ToString(rule->Tag()));
                report.violations.push_back(v);
            }
        }
        report.wins = ctx.wins && report.violations.empty();
        return report;
    }

    auto RuleRegistry::Ids() const -> std::vector<std::string_view>
    {
        std::vector<std::string_view> ids;
        ids.reserve(rules_.size());
        for (auto const& r : rules_) ids.push_back(r->Id());
        return ids;
    }
}
