//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_MOVEGENERATOR_HPP
#define FASTTRACK_MOVEGENERATOR_HPP

#include <expected>
#include <string_view>
#include "Board.hpp"
#include "Cards.hpp"
#include "State.hpp"

namespace fasttrack::core
{
    enum class BlockReason : uint8_t
    {
        None,
        OwnPiece,
        BackwardIntoProtected,
        BackwardFromSafeZone,
        SafeZoneEnd,
        WinnerOvershoot,
        InHolding,
        CaptureHoleLocked,
        NoEntryCard,
        NoExitCorner,
        CaptureHoleSpent
    };

    auto ToString(BlockReason r) -> std::string_view;

    // Flag set carried while a move is simulated hop by hop.
    struct PieceFlags
    {
        bool eligible_for_safe_zone{false};
        bool on_shortcut{false};
        bool completed_circuit{false};
        HoleId shortcut_entry{NoHole};
        bool exited_capture_hole{false};

        auto operator==(PieceFlags const&) const -> bool = default;
    };

    auto FlagsOf(Piece const& p) -> PieceFlags;

    // Plain perimeter hole; a joker may only step back from one of these.
    inline auto IsBackwardCaptureOrigin(Board const& b, HoleId h) -> bool
    {
        return b.Contains(h) && b.At(h).kind == HoleKind::Perimeter;
    }

    // One simulated route, kept even when blocked so that callers can see where it stopped.
    struct PathTrace
    {
        MoveType type{MoveType::Advance};
        std::vector<HoleId> path;
        PieceFlags flags{};
        bool blocked{false};
        uint8_t blocked_at_hop{};
        BlockReason reason{BlockReason::None};
    };

    enum Note : uint16_t
    {
        Note_None = 0,
        Note_Capture = 1 << 0,
        Note_EntersSafeZone = 1 << 1,
        Note_CompletesCircuit = 1 << 2,
        Note_Wins = 1 << 3,
        Note_EntersShortcut = 1 << 4,
        Note_LeavesShortcut = 1 << 5,
        Note_EntersCaptureHole = 1 << 6,
        Note_SplitPart = 1 << 7
    };

    struct Move
    {
        PieceId piece{};
        MoveType type{MoveType::Advance};
        std::vector<HoleId> path;
        uint8_t hops{}; // declared movement

        auto From() const -> HoleId { return path.empty() ? NoHole : path.front(); }
        auto To() const -> HoleId { return path.empty() ? NoHole : path.back(); }
        auto PathHops() const -> uint8_t { return path.empty() ? 0 : static_cast<uint8_t>(path.size() - 1); }
    };

    struct Candidate
    {
        Move move;
        uint16_t notes{Note_None};
        std::optional<PieceId> captures{};
        PieceFlags flags{}; // flags of the piece after the move

        auto Has(Note n) const noexcept -> bool { return (notes & n) != 0; }
    };

    class MoveGenerator
    {
    public:
        explicit MoveGenerator(std::shared_ptr<Board const> board);

        // Every route the piece could attempt with the card, blocked ones included.
        auto Trace(GameState const& s, PieceId piece, CardSpec const& card, uint8_t hops) const
            -> std::vector<PathTrace>;

        // Unblocked routes as annotated candidates. Rules are not consulted here.
        auto ForPiece(GameState const& s, PieceId piece, CardSpec const& card, uint8_t hops) const
            -> std::vector<Candidate>;

        // Candidates for all of a seat's pieces; only the first holding piece is offered an entry.
        auto ForSeat(GameState const& s, SeatT seat, CardSpec const& card, uint8_t hops,
                     std::optional<PieceId> exclude = std::nullopt) const -> std::vector<Candidate>;

        // Throws HopMismatchError (after logging the route) when a non-exempt path
        // does not cover exactly the declared hops.
        auto VerifyHops(Candidate const& c) const -> void;

        auto BoardRef() const noexcept -> Board const& { return *board_; }

    private:
        auto Walk(GameState const& s, Piece const& piece, PieceFlags flags, uint8_t hops,
                  Direction dir, MoveType type) const -> PathTrace;
        auto NextHop(GameState const& s, Piece const& piece, PieceFlags& flags, HoleId cur,
                     Direction dir) const -> std::expected<HoleId, BlockReason>;
        auto UpdateFlags(PieceFlags& flags, uint8_t section, HoleId from, HoleId to) const -> void;
        auto CaptureHoleRoute(GameState const& s, Piece const& piece, uint8_t hops) const -> PathTrace;
        auto AppendBackwardCapture(GameState const& s, Piece const& piece, CardSpec const& card,
                                   std::vector<PathTrace> out) const -> std::vector<PathTrace>;
        auto ToCandidate(GameState const& s, Piece const& piece, PathTrace const& t, uint8_t hops) const
            -> Candidate;

    private:
        std::shared_ptr<Board const> board_;
    };
}

#endif //FASTTRACK_MOVEGENERATOR_HPP
