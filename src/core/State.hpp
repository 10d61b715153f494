//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_STATE_HPP
#define FASTTRACK_STATE_HPP

#include "Types.hpp"
#include "Events.hpp"
#include "Board.hpp"

namespace fasttrack::core
{
    // Legality fields only; presentation data lives with the UI keyed by piece id.
    struct Piece
    {
        PieceId id{};
        SeatT owner{};
        HoleId location{NoHole};
        bool eligible_for_safe_zone{false}; // next pass over the entry hole diverts into the safe zone
        bool on_shortcut{false};
        bool completed_circuit{false};      // lap requirement met
        HoleId shortcut_entry{NoHole};
        bool exited_capture_hole{false};    // cleared only by a capture
    };

    struct DeckState
    {
        std::vector<Card> draw_pile;    // top of the pile is back()
        std::vector<Card> discard_pile;
    };

    struct PlayerState
    {
        SeatT seat{};
        uint8_t section{};
        std::vector<PieceId> pieces;
        DeckState deck;
    };

    struct TurnState
    {
        uint8_t active{}; // index into GameState::players
        uint32_t number{};
        std::optional<Card> card{};
        uint8_t split_remaining{};
        std::optional<PieceId> split_first{};
        std::vector<PieceId> shortcut_movers; // pieces that took a shortcut move with this card
    };

    // The seeded engine is rebuilt from (seed, consumed) whenever randomness is needed.
    struct RngState
    {
        uint64_t seed{};
        uint64_t consumed{};
    };

    struct GameState
    {
        Phase phase{Phase::Lobby};
        std::vector<SeatT> lobby;
        std::vector<PlayerState> players;
        std::vector<Piece> pieces; // indexed by PieceId
        RngState rng{};
        TurnState turn{};
        std::optional<SeatT> winner{};
        uint64_t next_sequence{};
    };

    // Read-only queries shared by the generator, the rules and the reducer.
    auto ActivePlayer(GameState const& s) -> PlayerState const&;
    auto FindPlayer(GameState const& s, SeatT seat) -> PlayerState const*;
    auto PieceAt(GameState const& s, HoleId h) -> Piece const*;
    auto OwnerSection(GameState const& s, SeatT seat) -> uint8_t;
    auto HoldingCount(Board const& board, GameState const& s, SeatT seat) -> uint8_t;
    auto FreeHoldingSlot(Board const& board, GameState const& s, SeatT seat) -> std::optional<HoleId>;
    // Every safe slot of the seat holds one of its own pieces.
    auto SafeZoneFull(Board const& board, GameState const& s, SeatT seat) -> bool;
}

#endif //FASTTRACK_STATE_HPP
