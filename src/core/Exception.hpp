//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_EXCEPTION_HPP
#define FASTTRACK_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Events.hpp"

namespace fasttrack::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a user illegal move)
        State, // state engine misuse (not a user illegal move)
        IllegalMove, // validator rejected the move
        NoLegalMoves, // nothing playable with the drawn card
        HopMismatch, // generated path length differs from the card's movement
        SyncDiverged, // peers disagree on the state hash
        InvalidEvent, // wrong player, phase, sequence or malformed payload
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct IllegalMoveError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NoLegalMovesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct HopMismatchError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SyncDivergedError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidEventError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Rules: throw RulesError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::IllegalMove: throw IllegalMoveError(std::move(msg), c);
        case Code::NoLegalMoves: throw NoLegalMovesError(std::move(msg), c);
        case Code::HopMismatch: throw HopMismatchError(std::move(msg), c);
        case Code::SyncDiverged: throw SyncDivergedError(std::move(msg), c);
        case Code::InvalidEvent: throw InvalidEventError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

    inline auto to_string(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "Unknown";
        case Code::Rules: return "Rules";
        case Code::State: return "State";
        case Code::IllegalMove: return "IllegalMove";
        case Code::NoLegalMoves: return "NoLegalMoves";
        case Code::HopMismatch: return "HopMismatch";
        case Code::SyncDiverged: return "SyncDiverged";
        case Code::InvalidEvent: return "InvalidEvent";
        case Code::Serialization: return "Serialization";
        case Code::Assertion: return "Assertion";
        }
        return "Unknown";
    }

#define FTK_THROW(code_enum, msg) ::fasttrack::core::error::fail((code_enum), (msg))
#define FTK_ASSERT(cond, msg) do { if(!(cond)) ::fasttrack::core::error::fail(::fasttrack::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by the rule that raises them.
    enum class RuleViolationCode : std::uint16_t
    {
        // Ownership / entry
        Piece_NotOwned,
        Entry_CardCannotEnter,
        Entry_PieceNotInHolding,
        Entry_PieceInHolding,

        // Path shape
        Path_Empty,
        Path_StartMismatch,
        Path_Disconnected,
        Path_Unreachable,
        Hop_CountMismatch,

        // Blocking
        Block_OwnPieceOnPath,
        Block_OwnPieceAtDestination,

        // Backward movement
        Backward_IntoProtected,
        Backward_InitiatesShortcut,
        Backward_FromRestrictedHole,
        Direction_Mismatch,

        // Capture
        Capture_ProtectedHole,
        Capture_HoldingFull,

        // Safe zone
        SafeZone_NotOwner,
        SafeZone_CircuitIncomplete,
        SafeZone_Backward,
        SafeZone_Overshoot,

        // Capture hole
        CaptureHole_NotOnShortcut,
        CaptureHole_FromOwnExit,
        CaptureHole_ExitCardRequired,
        CaptureHole_MustExit,
        CaptureHole_AlreadyExited,

        // Winner hole
        Win_Overshoot,

        // Split card
        Split_SamePiece,
        Split_NoSecondMove,
        Split_NotAllowed,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::string_view rule{}; // id of the rule that raised it
        std::string_view tag{};  // family of that rule
        std::optional<Phase> phase{};
        std::optional<SeatT> seat{};
        std::optional<PieceId> piece{};
        std::optional<HoleId> hole{};

        // Small integers useful in error messages
        std::optional<std::uint8_t> expected_hops{};
        std::optional<std::uint8_t> attempted_hops{};
        std::optional<std::uint8_t> holding_used{};
        std::optional<std::uint8_t> holding_capacity{};

        std::optional<Rank> rank{};

        // Quick helpers to build enriched violations (fluent style).
        auto with_rule(std::string_view id) -> RuleViolation&
        {
            rule = id;
            return *this;
        }

        auto with_tag(std::string_view t) -> RuleViolation&
        {
            tag = t;
            return *this;
        }

        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_seat(SeatT s) -> RuleViolation&
        {
            seat = s;
            return *this;
        }

        auto with_piece(PieceId p) -> RuleViolation&
        {
            piece = p;
            return *this;
        }

        auto with_hole(HoleId h) -> RuleViolation&
        {
            hole = h;
            return *this;
        }

        auto with_hops(std::uint8_t expected, std::uint8_t attempted) -> RuleViolation&
        {
            expected_hops = expected;
            attempted_hops = attempted;
            return *this;
        }

        auto with_holding(std::uint8_t used, std::uint8_t capacity) -> RuleViolation&
        {
            holding_used = used;
            holding_capacity = capacity;
            return *this;
        }

        auto with_rank(Rank r) -> RuleViolation&
        {
            rank = r;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Piece_NotOwned: return "piece not owned by player";
        case E::Entry_CardCannotEnter: return "card cannot bring a piece out of holding";
        case E::Entry_PieceNotInHolding: return "entry move for a piece outside holding";
        case E::Entry_PieceInHolding: return "piece in holding can only enter";

        case E::Path_Empty: return "path is empty";
        case E::Path_StartMismatch: return "path does not start at the piece";
        case E::Path_Disconnected: return "path holes are not adjacent";
        case E::Path_Unreachable: return "path not reachable under traversal rules";
        case E::Hop_CountMismatch: return "hop count differs from card movement";

        case E::Block_OwnPieceOnPath: return "cannot pass own piece";
        case E::Block_OwnPieceAtDestination: return "cannot land on own piece";

        case E::Backward_IntoProtected: return "backward move into protected hole";
        case E::Backward_InitiatesShortcut: return "backward move cannot enter shortcut";
        case E::Backward_FromRestrictedHole: return "joker cannot step back from a corner, home or safe entry";
        case E::Direction_Mismatch: return "move direction does not match the card";

        case E::Capture_ProtectedHole: return "cannot capture in protected hole";
        case E::Capture_HoldingFull: return "cannot capture, holding full";

        case E::SafeZone_NotOwner: return "safe zone belongs to another player";
        case E::SafeZone_CircuitIncomplete: return "circuit not completed before safe zone";
        case E::SafeZone_Backward: return "safe zone is forward only";
        case E::SafeZone_Overshoot: return "safe zone overshoot";

        case E::CaptureHole_NotOnShortcut: return "capture hole only reachable from the shortcut";
        case E::CaptureHole_FromOwnExit: return "capture hole not reachable from own shortcut exit";
        case E::CaptureHole_ExitCardRequired: return "leaving the capture hole needs a face card";
        case E::CaptureHole_MustExit: return "piece in capture hole can only exit";
        case E::CaptureHole_AlreadyExited: return "piece already left the capture hole once";

        case E::Win_Overshoot: return "winner hole overshoot";

        case E::Split_SamePiece: return "split must move two different pieces";
        case E::Split_NoSecondMove: return "split leaves no legal second move";
        case E::Split_NotAllowed: return "card cannot be split";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (!v.rule.empty()) s += std::format(" | rule={}", v.rule);
        if (!v.tag.empty()) s += std::format(" | tag={}", v.tag);
        if (v.phase) s += std::format(" | phase={}", static_cast<int>(std::to_underlying(*v.phase)));
        if (v.seat) s += std::format(" | seat=P{}", static_cast<int>(*v.seat));
        if (v.piece) s += std::format(" | piece={}", static_cast<int>(*v.piece));
        if (v.hole) s += std::format(" | hole={}", *v.hole);
        if (v.expected_hops) s += std::format(" | expected={}", *v.expected_hops);
        if (v.attempted_hops) s += std::format(" | attempted={}", *v.attempted_hops);
        if (v.holding_used) s += std::format(" | holding={}/{}", *v.holding_used, v.holding_capacity.value_or(0));
        if (v.rank) s += std::format(" | rank={}", static_cast<int>(std::to_underlying(*v.rank)));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //FASTTRACK_EXCEPTION_HPP
