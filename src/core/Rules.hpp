//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_RULES_HPP
#define FASTTRACK_RULES_HPP

#include "Board.hpp"
#include "Cards.hpp"
#include "Exception.hpp"
#include "MoveGenerator.hpp"
#include "State.hpp"

namespace fasttrack::core
{
    enum class RuleTag : uint8_t
    {
        Ownership,
        Entry,
        Path,
        Blocking,
        Direction,
        Capture,
        SafeZone,
        CaptureHole,
        Win
    };

    auto ToString(RuleTag t) -> std::string_view;

    // Facts about a proposed move, derived once and shared by every rule.
    struct MoveContext
    {
        Board const& board;
        GameState const& state;
        CardSpec const& card;
        Move const& move;
        Piece const* piece; // nullptr when the id is unknown
        SeatT seat;
        uint8_t section;
        uint8_t expected_hops;

        Piece const* own_on_path{nullptr};
        Piece const* own_at_destination{nullptr};
        Piece const* opponent_at_destination{nullptr};
        bool destination_protected{false};
        uint8_t opponent_holding_used{};
        bool opponent_can_receive_capture{true};
        bool enters_safe_zone{false};
        std::optional<HoleId> foreign_safe_hole{};
        bool circuit_complete_at_safe_entry{false};
        bool safe_zone_backward{false};
        bool safe_zone_overshoot{false};
        bool winner_overshoot{false};
        bool wins{false};
    };

    auto BuildContext(Board const& board, GameState const& state, CardSpec const& card, SeatT seat,
                      Move const& move) -> MoveContext;

    class Rule
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rule() = default;

        virtual auto Id() const noexcept -> std::string_view = 0;
        virtual auto Tag() const noexcept -> RuleTag = 0;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        virtual auto Evaluate(MoveContext const& ctx) const -> CheckResult = 0;
    };

    struct ValidationReport
    {
        std::vector<error::RuleViolation> violations;
        bool wins{false};

        auto Legal() const noexcept -> bool { return violations.empty(); }
    };

    // Ordered, flat table of rules. Every rule runs; a move is legal when none objects.
    class RuleRegistry
    {
    public:
        auto Add(std::unique_ptr<Rule> rule) -> RuleRegistry&;
        auto Validate(MoveContext const& ctx) const -> ValidationReport;

        auto Size() const noexcept -> std::size_t { return rules_.size(); }
        auto Ids() const -> std::vector<std::string_view>;

    private:
        std::vector<std::unique_ptr<Rule>> rules_;
    };
}

#endif //FASTTRACK_RULES_HPP
