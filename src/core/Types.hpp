//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_TYPES_HPP
#define FASTTRACK_TYPES_HPP

#define FTK_ALLOW_EXCEPTIONS true
#define FTK_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <string>
#include <variant>

namespace fasttrack::core::constants
{
    inline constexpr std::size_t MaxSeats = 6;
    inline constexpr std::size_t MinPlayers = 2;
    inline constexpr std::size_t StandardDeckSize = 52;
    inline constexpr std::size_t JokersPerDeck = 2;
}

namespace fasttrack::core
{
    using SeatT = uint8_t;
    using PieceId = uint8_t;
    using HoleId = uint16_t;

    inline constexpr HoleId NoHole = std::numeric_limits<HoleId>::max();

    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades,
        None // jokers
    };

    enum class Rank : uint8_t
    {
        Ace = 0,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Joker
    };

    inline constexpr std::size_t RankCount = static_cast<std::size_t>(Rank::Joker) + 1;

    struct Card
    {
        Rank rank{Rank::Ace};
        Suit suit{Suit::Hearts};
    };
    inline auto operator==(Card const& a, Card const& b) -> bool { return a.suit == b.suit && a.rank == b.rank; }

    enum class Direction : uint8_t
    {
        Forward,
        Backward
    };

    enum class HoleKind : uint8_t
    {
        Perimeter,
        SafeEntry,      // perimeter hole that branches into the owner's safe zone
        Home,           // perimeter start hole, also the winner hole
        ShortcutCorner, // perimeter hole shared with the shortcut ring
        SafeZone,
        Holding,
        CaptureHole
    };

    // Movement mode used when asking the board for the next hole.
    enum class Traversal : uint8_t
    {
        Perimeter,
        Shortcut,
        SafeZone
    };

    // Geometry of the hexagonal board. Every section has three lanes
    // (side-left, outer edge, side-right) plus a home hole and a shortcut corner.
    struct BoardConfig
    {
        uint8_t sections{6};
        uint8_t lane_holes{4};
        uint8_t safe_slots{4};
        uint8_t holding_slots{4};
    };

    // What happens in turn resolution to a piece that stayed on the shortcut
    // without taking a shortcut move with the card just played.
    enum class ForcedExitRule : uint8_t
    {
        DemoteInPlace,     // stays on its corner as an ordinary perimeter piece
        NextPerimeterHole  // steps one perimeter hole forward when free, else demotes
    };

    struct Config
    {
        BoardConfig board{};
        uint8_t pieces_per_player{5};
        uint8_t pieces_start_on_home{1};
        bool jokers{true};
        ForcedExitRule forced_exit{ForcedExitRule::DemoteInPlace};
    };
}

#endif //FASTTRACK_TYPES_HPP
