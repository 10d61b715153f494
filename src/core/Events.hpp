//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_EVENTS_HPP
#define FASTTRACK_EVENTS_HPP

#include "Types.hpp"

namespace fasttrack::core
{
    enum class MoveType : uint8_t
    {
        Enter,            // holding -> home, hop count exempt
        Advance,          // forward along the perimeter or safe zone
        Retreat,          // backward along the perimeter
        EnterShortcut,    // forward, landing on a foreign corner and switching to shortcut mode
        ContinueShortcut, // forward along the shortcut ring
        LeaveShortcut,    // forward from a corner, back on the perimeter
        EnterCaptureHole, // last hop from a corner into the capture hole
        ExitCaptureHole   // capture hole -> corner, hop count exempt
    };

    enum class Phase : uint8_t
    {
        Lobby,
        AwaitingDraw,
        AwaitingMove,
        AwaitingSplitMove,
        TurnResolution,
        GameWon
    };

    struct PlayerJoined    { SeatT seat{}; };
    struct GameStarted     { uint64_t seed{}; std::vector<SeatT> player_order; };
    struct CardDrawn       { SeatT seat{}; };
    struct MovePlayed
    {
        SeatT seat{};
        PieceId piece{};
        MoveType type{MoveType::Advance};
        std::vector<HoleId> path;
    };
    // one half of a split card; hops are path.size() - 1
    struct SplitMovePlayed
    {
        SeatT seat{};
        PieceId piece{};
        MoveType type{MoveType::Advance};
        std::vector<HoleId> path;
    };
    struct TurnEnded       { SeatT seat{}; };

    using EventPayload = std::variant<
        PlayerJoined, GameStarted, CardDrawn, MovePlayed, SplitMovePlayed, TurnEnded>;

    struct Event
    {
        uint64_t sequence{};
        EventPayload payload;
    };

    inline auto IsHopExempt(MoveType t) noexcept -> bool
    {
        return t == MoveType::Enter || t == MoveType::ExitCaptureHole;
    }
} // namespace fasttrack::core

#endif //FASTTRACK_EVENTS_HPP
