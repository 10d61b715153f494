//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_PLAYER_HPP
#define FASTTRACK_PLAYER_HPP

#include <span>
#include "Events.hpp"
#include "MoveGenerator.hpp"
#include "State.hpp"

namespace fasttrack::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by the game loop whenever this seat is active. `legal` holds the validated
        // candidates for the current phase (empty while a card is still to be drawn).
        virtual auto Play(GameState const& snapshot, std::span<Candidate const> legal) -> EventPayload = 0;
    };

    // Event that plays the candidate; split parts go out as SplitMovePlayed.
    inline auto ToPayload(SeatT seat, Candidate const& c) -> EventPayload
    {
        if (c.Has(Note_SplitPart))
            return SplitMovePlayed{.seat = seat, .piece = c.move.piece, .type = c.move.type, .path = c.move.path};
        return MovePlayed{.seat = seat, .piece = c.move.piece, .type = c.move.type, .path = c.move.path};
    }
}
#endif //FASTTRACK_PLAYER_HPP
