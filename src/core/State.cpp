//
// Created by Malik T on 19/10/2026.
//

#include "State.hpp"

#include <algorithm>
#include <format>
#include "Exception.hpp"

namespace fasttrack::core
{
    auto ActivePlayer(GameState const& s) -> PlayerState const&
    {
        FTK_ASSERT(s.turn.active < s.players.size(), "Active player index out of range");
        return s.players[s.turn.active];
    }

    auto FindPlayer(GameState const& s, SeatT seat) -> PlayerState const*
    {
        auto const it = std::ranges::find(s.players, seat, &PlayerState::seat);
        return it != s.players.end() ? &*it : nullptr;
    }

    auto PieceAt(GameState const& s, HoleId h) -> Piece const*
    {
        auto const it = std::ranges::find(s.pieces, h, &Piece::location);
        return it != s.pieces.end() ? &*it : nullptr;
    }

    auto OwnerSection(GameState const& s, SeatT seat) -> uint8_t
    {
        PlayerState const* p = FindPlayer(s, seat);
        if (!p) FTK_THROW(error::Code::State, std::format("Seat P{} is not playing", static_cast<int>(seat)));
        return p->section;
    }

    auto HoldingCount(Board const& board, GameState const& s, SeatT seat) -> uint8_t
    {
        return static_cast<uint8_t>(std::ranges::count_if(s.pieces, [&](Piece const& p)
        {
            return p.owner == seat && board.IsHolding(p.location);
        }));
    }

    auto FreeHoldingSlot(Board const& board, GameState const& s, SeatT seat) -> std::optional<HoleId>
    {
        uint8_t const section = OwnerSection(s, seat);
        for (uint8_t i = 0; i < board.Config().holding_slots; ++i)
        {
            HoleId const h = board.Holding(section, i);
            if (!PieceAt(s, h)) return h;
        }
        return std::nullopt;
    }

    auto SafeZoneFull(Board const& board, GameState const& s, SeatT seat) -> bool
    {
        uint8_t const section = OwnerSection(s, seat);
        for (uint8_t i = 0; i < board.Config().safe_slots; ++i)
        {
            Piece const* p = PieceAt(s, board.SafeSlot(section, i));
            if (!p || p->owner != seat) return false;
        }
        return true;
    }
}
