//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_STANDARDRULES_HPP
#define FASTTRACK_STANDARDRULES_HPP
#include "Rules.hpp"

namespace fasttrack::core
{
    class PieceOwnershipRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "piece-ownership"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::Ownership; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class EntryCardRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "entry-card"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::Entry; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class PathTopologyRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "path-topology"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::Path; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class HopCountRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "hop-count"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::Path; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class OwnPieceBlockingRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "own-piece-blocking"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::Blocking; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class BackwardProtectedRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "backward-protected"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::Direction; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class CaptureEligibilityRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "capture-eligibility"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::Capture; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class SafeZoneOwnershipRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "safe-zone-ownership"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::SafeZone; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class CircuitCompletionRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "circuit-completion"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::SafeZone; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class SafeZoneForwardRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "safe-zone-forward"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::SafeZone; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class CaptureHoleGatingRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "capture-hole-gating"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::CaptureHole; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    class WinConditionRule final : public Rule
    {
    public:
        auto Id() const noexcept -> std::string_view override { return "win-condition"; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::Win; }
        auto Evaluate(MoveContext const& ctx) const -> CheckResult override;
    };

    // All of the above, in evaluation order.
    auto MakeStandardRules() -> std::unique_ptr<RuleRegistry>;
}

#endif //FASTTRACK_STANDARDRULES_HPP
