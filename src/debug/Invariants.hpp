//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_INVARIANTS_HPP
#define FASTTRACK_INVARIANTS_HPP

#include <algorithm>
#include <format>
#include <print>
#include <string>
#include <unordered_set>

#include "../core/Exception.hpp"
#include "../core/Reducer.hpp"
#include "AuditLogger.hpp"

namespace fasttrack::core::debug
{
    // A second layer of checks over a reduced state. Any breach is an engine bug,
    // so it surfaces as an AssertionError rather than a rule violation.
    inline auto CheckInvariants(Reducer const& r, GameState const& s) -> void
    {
#if FTK_ENABLE_TEST_HOOKS == false
        (void)r;
        (void)s;
#else
        Board const& board = r.GetBoard();

        // 1) Every piece sits on a real hole and no two share one
        {
            std::unordered_set<HoleId> seen;
            seen.reserve(s.pieces.size());
            for (Piece const& p : s.pieces)
            {
                FTK_ASSERT(board.Contains(p.location), std::format("piece {} off the board", p.id));
                FTK_ASSERT(seen.insert(p.location).second,
                           std::format("two pieces on {}", board.Name(p.location)));
            }
        }

        // 2) Flag consistency
        for (Piece const& p : s.pieces)
        {
            FTK_ASSERT(!p.eligible_for_safe_zone || p.completed_circuit,
                       std::format("piece {} eligible without a completed circuit", p.id));
            FTK_ASSERT(!p.on_shortcut || board.IsCorner(p.location),
                       std::format("piece {} on the shortcut away from a corner", p.id));

            Hole const& h = board.At(p.location);
            if (h.kind == HoleKind::Holding || h.kind == HoleKind::SafeZone)
            {
                FTK_ASSERT(h.section == OwnerSection(s, p.owner),
                           std::format("piece {} in another player's {}", p.id, h.name));
            }
        }

        // 3) Holding never over capacity
        for (PlayerState const& p : s.players)
        {
            FTK_ASSERT(HoldingCount(board, s, p.seat) <= board.Config().holding_slots,
                       std::format("P{} holding over capacity", static_cast<int>(p.seat)));
        }

        // 4) Card conservation per deck (the card in play belongs to the active player)
        std::size_t const deck = constants::StandardDeckSize + (r.GetConfig().jokers ? constants::JokersPerDeck : 0);
        for (std::size_t i{}; i < s.players.size(); ++i)
        {
            DeckState const& d = s.players[i].deck;
            std::size_t const in_play = (i == s.turn.active && s.turn.card) ? 1 : 0;
            FTK_ASSERT(d.draw_pile.size() + d.discard_pile.size() + in_play == deck,
                       std::format("P{} deck holds {} cards", static_cast<int>(s.players[i].seat),
                                   d.draw_pile.size() + d.discard_pile.size() + in_play));
        }

        // 5) Phase and turn agree
        bool const needs_card = s.phase == Phase::AwaitingMove || s.phase == Phase::AwaitingSplitMove;
        FTK_ASSERT(needs_card == s.turn.card.has_value(), "card in play does not match the phase");
        FTK_ASSERT((s.phase == Phase::AwaitingSplitMove) == s.turn.split_first.has_value(),
                   "split bookkeeping does not match the phase");
        FTK_ASSERT((s.phase == Phase::GameWon) == s.winner.has_value(), "winner does not match the phase");
#endif // FTK_ENABLE_TEST_HOOKS == true
    }

    // Explicit repair pass for piece flags that drifted from the piece's location.
    // Every correction is printed and, when a logger is given, written to the transcript.
    inline auto AuditFlags(Board const& board, GameState& s, AuditLogger* log = nullptr) -> std::size_t
    {
        std::size_t fixes{};
        auto note = [&](Piece const& p, std::string_view what)
        {
            std::string const line = std::format("piece {} (P{}) at {}: {}", p.id, static_cast<int>(p.owner),
                                                 board.Contains(p.location) ? board.Name(p.location) : "?", what);
            std::print(stderr, "[audit] {}\n", line);
            if (log) log->correction(line);
            ++fixes;
        };

        for (Piece& p : s.pieces)
        {
            if (!board.Contains(p.location)) continue;
            Hole const& h = board.At(p.location);

            if (h.kind == HoleKind::Holding
                && (p.eligible_for_safe_zone || p.on_shortcut || p.completed_circuit || p.shortcut_entry != NoHole
                    || p.exited_capture_hole))
            {
                p.eligible_for_safe_zone = false;
                p.on_shortcut = false;
                p.completed_circuit = false;
                p.shortcut_entry = NoHole;
                p.exited_capture_hole = false;
                note(p, "clearing stale flags in holding");
                continue;
            }

            if (p.on_shortcut && h.kind != HoleKind::ShortcutCorner)
            {
                p.on_shortcut = false;
                p.shortcut_entry = NoHole;
                note(p, "on the shortcut away from a corner, leaving shortcut mode");
            }
            if (!p.on_shortcut && p.shortcut_entry != NoHole)
            {
                p.shortcut_entry = NoHole;
                note(p, "stale shortcut entry cleared");
            }
            if (p.eligible_for_safe_zone && !p.completed_circuit)
            {
                p.eligible_for_safe_zone = false;
                note(p, "eligible without a completed circuit, clearing eligibility");
            }
            if (h.kind == HoleKind::SafeZone && (p.eligible_for_safe_zone || !p.completed_circuit))
            {
                p.eligible_for_safe_zone = false;
                p.completed_circuit = true;
                note(p, "safe-zone piece flags normalised");
            }
        }

        if (fixes > 0) std::print(stderr, "[audit] applied {} fixes\n", fixes);
        return fixes;
    }
}
#endif //FASTTRACK_INVARIANTS_HPP
