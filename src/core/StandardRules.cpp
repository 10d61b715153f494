//
// Created by Malik T on 19/10/2026.
//

#include "StandardRules.hpp"

#include <algorithm>
namespace
{
    inline auto Viol(fasttrack::core::error::RuleViolationCode code) -> fasttrack::core::error::RuleViolation
    {
        return fasttrack::core::error::RuleViolation{ .code = code };
    }
}

namespace fasttrack::core
{
    using RVC = ::fasttrack::core::error::RuleViolationCode;

    auto PieceOwnershipRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        if (!ctx.piece)
            return std::unexpected(Viol(RVC::Piece_NotOwned).with_seat(ctx.seat).with_piece(ctx.move.piece));
        if (ctx.piece->owner != ctx.seat)
            return std::unexpected(Viol(RVC::Piece_NotOwned).with_seat(ctx.seat).with_piece(ctx.piece->id));
        return {};
    }

    auto EntryCardRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        if (!ctx.piece) return {};
        bool const in_holding = ctx.board.Contains(ctx.piece->location) && ctx.board.IsHolding(ctx.piece->location);

        if (ctx.move.type == MoveType::Enter)
        {
            if (!ctx.card.entry)
                return std::unexpected(Viol(RVC::Entry_CardCannotEnter).with_rank(ctx.card.rank));
            if (!in_holding)
                return std::unexpected(Viol(RVC::Entry_PieceNotInHolding).with_piece(ctx.piece->id));
            if (ctx.move.To() != ctx.board.Home(ctx.section))
                return std::unexpected(Viol(RVC::Path_Disconnected).with_hole(ctx.move.To()));
            return {};
        }
        if (in_holding)
            return std::unexpected(Viol(RVC::Entry_PieceInHolding).with_piece(ctx.piece->id));
        return {};
    }

    auto PathTopologyRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        auto const& path = ctx.move.path;
        if (path.size() < 2)
            return std::unexpected(Viol(RVC::Path_Empty).with_piece(ctx.move.piece));
        if (ctx.piece && path.front() != ctx.piece->location)
            return std::unexpected(Viol(RVC::Path_StartMismatch).with_piece(ctx.piece->id).with_hole(path.front()));
        for (std::size_t i = 1; i < path.size(); ++i)
        {
            if (!ctx.board.Connected(path[i - 1], path[i]))
                return std::unexpected(Viol(RVC::Path_Disconnected).with_hole(path[i]));
        }
        return {};
    }

    auto HopCountRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        if (IsHopExempt(ctx.move.type)) return {};
        if (ctx.move.PathHops() != ctx.expected_hops)
            return std::unexpected(Viol(RVC::Hop_CountMismatch)
                                   .with_piece(ctx.move.piece)
                                   .with_hops(ctx.expected_hops, ctx.move.PathHops()));
        return {};
    }

    auto OwnPieceBlockingRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        if (ctx.own_on_path)
            return std::unexpected(Viol(RVC::Block_OwnPieceOnPath)
                                   .with_piece(ctx.own_on_path->id).with_hole(ctx.own_on_path->location));
        if (ctx.own_at_destination)
            return std::unexpected(Viol(RVC::Block_OwnPieceAtDestination)
                                   .with_piece(ctx.own_at_destination->id).with_hole(ctx.own_at_destination->location));
        return {};
    }

    auto BackwardProtectedRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        bool const backward_move = ctx.move.type == MoveType::Retreat;

        if (!backward_move)
        {
            if (ctx.card.direction != Direction::Backward) return {};
            if (ctx.move.type == MoveType::EnterShortcut)
                return std::unexpected(Viol(RVC::Backward_InitiatesShortcut).with_rank(ctx.card.rank));
            return std::unexpected(Viol(RVC::Direction_Mismatch).with_rank(ctx.card.rank));
        }

        if (ctx.card.direction != Direction::Backward)
        {
            // a forward card only retreats one hole onto an opponent
            bool const capture_step = ctx.card.backward_capture && ctx.move.PathHops() == 1 && ctx.opponent_at_destination;
            if (!capture_step)
                return std::unexpected(Viol(RVC::Direction_Mismatch).with_rank(ctx.card.rank));
            if (ctx.piece && ctx.board.Contains(ctx.piece->location) && !ctx.board.IsProtected(ctx.piece->location)
                && !IsBackwardCaptureOrigin(ctx.board, ctx.piece->location))
                return std::unexpected(Viol(RVC::Backward_FromRestrictedHole).with_hole(ctx.piece->location));
        }

        for (std::size_t i = 1; i < ctx.move.path.size(); ++i)
        {
            HoleId const h = ctx.move.path[i];
            if (ctx.board.Contains(h) && ctx.board.IsProtected(h))
                return std::unexpected(Viol(RVC::Backward_IntoProtected).with_hole(h));
        }
        if (ctx.piece && ctx.board.Contains(ctx.piece->location) && ctx.board.IsProtected(ctx.piece->location))
            return std::unexpected(Viol(RVC::Backward_IntoProtected).with_hole(ctx.piece->location));
        return {};
    }

    auto CaptureEligibilityRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        if (!ctx.opponent_at_destination) return {};
        if (ctx.destination_protected)
            return std::unexpected(Viol(RVC::Capture_ProtectedHole)
                                   .with_piece(ctx.opponent_at_destination->id).with_hole(ctx.move.To()));
        if (!ctx.opponent_can_receive_capture)
            return std::unexpected(Viol(RVC::Capture_HoldingFull)
                                   .with_seat(ctx.opponent_at_destination->owner)
                                   .with_piece(ctx.opponent_at_destination->id)
                                   .with_holding(ctx.opponent_holding_used, ctx.board.Config().holding_slots));
        return {};
    }

    auto SafeZoneOwnershipRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        if (ctx.foreign_safe_hole)
            return std::unexpected(Viol(RVC::SafeZone_NotOwner).with_seat(ctx.seat).with_hole(*ctx.foreign_safe_hole));
        return {};
    }

    auto CircuitCompletionRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        if (ctx.enters_safe_zone && !ctx.circuit_complete_at_safe_entry)
            return std::unexpected(Viol(RVC::SafeZone_CircuitIncomplete).with_piece(ctx.move.piece));
        return {};
    }

    auto SafeZoneForwardRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        if (ctx.safe_zone_backward)
            return std::unexpected(Viol(RVC::SafeZone_Backward).with_piece(ctx.move.piece));
        if (ctx.safe_zone_overshoot)
            return std::unexpected(Viol(RVC::SafeZone_Overshoot)
                                   .with_piece(ctx.move.piece)
                                   .with_hops(ctx.expected_hops, ctx.move.PathHops()));
        return {};
    }

    auto CaptureHoleGatingRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        if (!ctx.piece) return {};
        HoleId const centre = ctx.board.CaptureHole();
        auto const& path = ctx.move.path;

        if (ctx.piece->location == centre)
        {
            if (ctx.move.type != MoveType::ExitCaptureHole)
                return std::unexpected(Viol(RVC::CaptureHole_MustExit).with_piece(ctx.piece->id));
            if (!ctx.card.exit_capture)
                return std::unexpected(Viol(RVC::CaptureHole_ExitCardRequired).with_rank(ctx.card.rank));
            return {};
        }
        if (ctx.move.type == MoveType::ExitCaptureHole)
            return std::unexpected(Viol(RVC::Internal_Unreachable).with_piece(ctx.piece->id));

        bool const reaches_centre = std::ranges::find(path, centre) != path.end();
        if (!reaches_centre) return {};

        if (ctx.move.type != MoveType::EnterCaptureHole || !ctx.piece->on_shortcut)
            return std::unexpected(Viol(RVC::CaptureHole_NotOnShortcut).with_piece(ctx.piece->id));
        if (ctx.piece->exited_capture_hole)
            return std::unexpected(Viol(RVC::CaptureHole_AlreadyExited).with_piece(ctx.piece->id));
        if (path.size() >= 2 && path[path.size() - 2] == ctx.board.ShortcutExit(ctx.section))
            return std::unexpected(Viol(RVC::CaptureHole_FromOwnExit).with_hole(path[path.size() - 2]));
        return {};
    }

    auto WinConditionRule::Evaluate(MoveContext const& ctx) const -> CheckResult
    {
        if (ctx.winner_overshoot)
            return std::unexpected(Viol(RVC::Win_Overshoot)
                                   .with_piece(ctx.move.piece)
                                   .with_hole(ctx.board.Home(ctx.section)));
        return {};
    }

    auto MakeStandardRules() -> std::unique_ptr<RuleRegistry>
    {
        auto reg = std::make_unique<RuleRegistry>();
        reg->Add(std::make_unique<PieceOwnershipRule>())
            .Add(std::make_unique<EntryCardRule>())
            .Add(std::make_unique<PathTopologyRule>())
            .Add(std::make_unique<HopCountRule>())
            .Add(std::make_unique<OwnPieceBlockingRule>())
            .Add(std::make_unique<BackwardProtectedRule>())
            .Add(std::make_unique<CaptureEligibilityRule>())
            .Add(std::make_unique<SafeZoneOwnershipRule>())
            .Add(std::make_unique<CircuitCompletionRule>())
            .Add(std::make_unique<SafeZoneForwardRule>())
            .Add(std::make_unique<CaptureHoleGatingRule>())
            .Add(std::make_unique<WinConditionRule>());
        return reg;
    }
}
