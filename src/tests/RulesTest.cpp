//
// Created by Malik T on 19/10/2026.
//

#include <gtest/gtest.h>

#include "Fixtures.hpp"

using namespace fasttrack::core;
using namespace fasttrack::test;
using RVC = error::RuleViolationCode;

namespace
{
    struct RulesFixture : ::testing::Test
    {
        Reducer reducer{};
        GameState s = Started(reducer, 2);

        auto BoardRef() const -> Board const& { return reducer.GetBoard(); }
        auto Hops(Rank r) const -> uint8_t { return reducer.Cards().Spec(r).movement; }

        auto FillSafeZone(SeatT seat) -> void
        {
            PlayerState const& p = *FindPlayer(s, seat);
            for (uint8_t i = 0; i < 4; ++i) Place(s, p.pieces[i], BoardRef().SafeSlot(p.section, i), true, false);
        }
    };

    class AlwaysFails final : public Rule
    {
    public:
        AlwaysFails(std::string_view id, RVC code) :
            id_(id), code_(code) {}

        auto Id() const noexcept -> std::string_view override { return id_; }
        auto Tag() const noexcept -> RuleTag override { return RuleTag::Path; }
        auto Evaluate(MoveContext const&) const -> CheckResult override
        {
            return std::unexpected(error::RuleViolation{.code = code_});
        }

    private:
        std::string_view id_;
        RVC code_;
    };
}

TEST_F(RulesFixture, Last_Piece_Lands_Exactly_On_Home_And_Wins)
{
    FillSafeZone(0);
    Place(s, 4, 2, true, true);
    s = WithCard(s, Rank::Six);

    auto const legal = reducer.LegalMoves(s);
    Candidate const* win = FindCandidate(legal, 4, MoveType::Advance);
    ASSERT_NE(win, nullptr);
    EXPECT_EQ(win->move.path, (std::vector<HoleId>{2, 3, 4, 5, 6, 7, 8}));
    EXPECT_TRUE(win->Has(Note_Wins));

    ValidationReport const report = reducer.Validate(s, 0, win->move);
    EXPECT_TRUE(report.Legal());
    EXPECT_TRUE(report.wins);

    auto const r = MustStep(reducer, s, MovePlayed{.seat = 0, .piece = 4, .type = MoveType::Advance, .path = win->move.path});
    EXPECT_EQ(r.state.phase, Phase::GameWon);
    ASSERT_TRUE(r.state.winner.has_value());
    EXPECT_EQ(*r.state.winner, 0);
    EXPECT_EQ(r.effects.back().kind, EffectKind::GameWon);

    auto const after = Step(reducer, r.state, CardDrawn{.seat = 1});
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error().code, error::Code::InvalidEvent);
}

TEST_F(RulesFixture, Passing_Home_With_A_Full_Safe_Zone_Is_An_Overshoot)
{
    FillSafeZone(0);
    Place(s, 4, 3, true, true);
    s = WithCard(s, Rank::Six);

    EXPECT_EQ(FindCandidate(reducer.LegalMoves(s), 4, MoveType::Advance), nullptr);

    Move const m{.piece = 4, .type = MoveType::Advance, .path = {3, 4, 5, 6, 7, 8, 9}, .hops = Hops(Rank::Six)};
    ValidationReport const report = reducer.Validate(s, 0, m);
    EXPECT_TRUE(HasCode(report.violations, RVC::Win_Overshoot));
    EXPECT_FALSE(report.wins);
}

TEST_F(RulesFixture, Capture_Is_Illegal_When_The_Victims_Holding_Is_Full)
{
    Place(s, 4, 45);
    s = WithCard(s, Rank::Five);
    ASSERT_EQ(HoldingCount(BoardRef(), s, 1), 4);

    Move const m{.piece = 4, .type = MoveType::Advance, .path = {45, 46, 47, 48, 49, 50}, .hops = Hops(Rank::Five)};
    ValidationReport const report = reducer.Validate(s, 0, m);
    ASSERT_TRUE(HasCode(report.violations, RVC::Capture_HoldingFull));
    auto const& v = report.violations.front();
    EXPECT_EQ(v.rule, "capture-eligibility");
    EXPECT_EQ(error::to_string(v.code), "cannot capture, holding full");
    EXPECT_EQ(v.holding_used, std::optional<uint8_t>{4});

    EXPECT_EQ(FindCandidate(reducer.LegalMoves(s), 4, MoveType::Advance), nullptr);

    auto const r = Step(reducer, s, MovePlayed{.seat = 0, .piece = 4, .type = MoveType::Advance, .path = m.path});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::Code::IllegalMove);
    EXPECT_TRUE(HasCode(r.error().violations, RVC::Capture_HoldingFull));
}

TEST_F(RulesFixture, Capture_Sends_The_Victim_To_Holding)
{
    Place(s, 5, 60);
    Place(s, 4, 45);
    s = WithCard(s, Rank::Five);

    auto const r = MustStep(reducer, s, MovePlayed{
                                .seat = 0, .piece = 4, .type = MoveType::Advance, .path = {45, 46, 47, 48, 49, 50}
                            });
    EXPECT_EQ(r.state.pieces[4].location, 50);
    EXPECT_TRUE(BoardRef().IsHolding(r.state.pieces[9].location));
    EXPECT_FALSE(r.state.pieces[9].completed_circuit);
    EXPECT_TRUE(std::ranges::any_of(r.effects, [](Effect const& e)
    {
        return e.kind == EffectKind::CaptureResolved && e.other == PieceId{9};
    }));
}

TEST_F(RulesFixture, Nothing_Is_Captured_In_The_Capture_Hole)
{
    Place(s, 9, BoardRef().CaptureHole());
    Piece& p = Place(s, 4, 27, true, false);
    p.on_shortcut = true;
    p.shortcut_entry = 27;
    s = WithCard(s, Rank::Ace);

    Move const m{.piece = 4, .type = MoveType::EnterCaptureHole, .path = {27, 132}, .hops = 1};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, m).violations, RVC::Capture_ProtectedHole));
    EXPECT_EQ(FindCandidate(reducer.LegalMoves(s), 4, MoveType::EnterCaptureHole), nullptr);
}

TEST_F(RulesFixture, Retreat_Through_The_Capture_Hole_Is_Rejected)
{
    Place(s, 4, 13);
    s = WithCard(s, Rank::Four);

    Move const m{.piece = 4, .type = MoveType::Retreat, .path = {13, 132, 27, 26, 25}, .hops = Hops(Rank::Four)};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, m).violations, RVC::Backward_IntoProtected));

    auto const r = Step(reducer, s, MovePlayed{.seat = 0, .piece = 4, .type = MoveType::Retreat, .path = m.path});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::Code::IllegalMove);
    EXPECT_TRUE(HasCode(r.error().violations, RVC::Backward_IntoProtected));
    for (auto const& v : r.error().violations)
    {
        EXPECT_EQ(v.seat, std::optional<SeatT>{0});
        EXPECT_EQ(v.phase, std::optional<Phase>{Phase::AwaitingMove});
    }
}

TEST_F(RulesFixture, Safe_Zone_Needs_A_Completed_Circuit)
{
    Place(s, 4, 6);
    s = WithCard(s, Rank::Two);

    Move const m{.piece = 4, .type = MoveType::Advance, .path = {6, 84, 85}, .hops = 2};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, m).violations, RVC::SafeZone_CircuitIncomplete));

    auto const legal = reducer.LegalMoves(s);
    Candidate const* adv = FindCandidate(legal, 4, MoveType::Advance);
    ASSERT_NE(adv, nullptr);
    EXPECT_EQ(adv->move.path, (std::vector<HoleId>{6, 7, 8}));
}

TEST_F(RulesFixture, Foreign_Safe_Zones_Are_Closed)
{
    Place(s, 4, 47, true, true);
    s = WithCard(s, Rank::Two);

    Move const m{.piece = 4, .type = MoveType::Advance, .path = {47, 48, BoardRef().SafeSlot(3, 0)}, .hops = 2};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, m).violations, RVC::SafeZone_NotOwner));
}

TEST_F(RulesFixture, Every_Rule_Reports)
{
    Place(s, 4, 85, true, false);
    s = WithCard(s, Rank::Ace);

    Move const m{.piece = 4, .type = MoveType::Advance, .path = {85, 84}, .hops = 1};
    auto const report = reducer.Validate(s, 0, m);
    EXPECT_TRUE(HasCode(report.violations, RVC::Path_Disconnected));
    EXPECT_TRUE(HasCode(report.violations, RVC::SafeZone_Backward));
    EXPECT_GE(report.violations.size(), 2u);
}

TEST_F(RulesFixture, Safe_Zone_Overshoot)
{
    Place(s, 4, 86, true, false);
    s = WithCard(s, Rank::Two);

    Move const m{.piece = 4, .type = MoveType::Advance, .path = {86, 87}, .hops = 2};
    auto const report = reducer.Validate(s, 0, m);
    EXPECT_TRUE(HasCode(report.violations, RVC::SafeZone_Overshoot));
    EXPECT_TRUE(HasCode(report.violations, RVC::Hop_CountMismatch));
}

TEST_F(RulesFixture, Entry_And_Ownership)
{
    s = WithCard(s, Rank::Five);
    Move enter{.piece = 0, .type = MoveType::Enter, .path = {108, 8}, .hops = 5};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, enter).violations, RVC::Entry_CardCannotEnter));

    Move from_holding{.piece = 0, .type = MoveType::Advance, .path = {108, 8}, .hops = 5};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, from_holding).violations, RVC::Entry_PieceInHolding));

    Move foreign{.piece = 9, .type = MoveType::Advance, .path = {50, 51, 52, 53, 54, 55}, .hops = 5};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, foreign).violations, RVC::Piece_NotOwned));
}

TEST_F(RulesFixture, Own_Piece_Blocks_Path_And_Destination)
{
    Place(s, 4, 10);
    Place(s, 0, 12);
    s = WithCard(s, Rank::Two);

    Move land{.piece = 4, .type = MoveType::Advance, .path = {10, 11, 12}, .hops = 2};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, land).violations, RVC::Block_OwnPieceAtDestination));

    s = WithCard(s, Rank::Three);
    Move pass{.piece = 4, .type = MoveType::Advance, .path = {10, 11, 12, 13}, .hops = 3};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, pass).violations, RVC::Block_OwnPieceOnPath));
}

TEST_F(RulesFixture, Backward_Card_Cannot_Enter_The_Shortcut)
{
    Place(s, 4, 17);
    s = WithCard(s, Rank::Four);
    Move m{.piece = 4, .type = MoveType::EnterShortcut, .path = {17, 16, 15, 14, 13}, .hops = 4};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, m).violations, RVC::Backward_InitiatesShortcut));
}

TEST_F(RulesFixture, Hop_Count_Must_Match)
{
    Place(s, 4, 10);
    s = WithCard(s, Rank::Five);
    Move m{.piece = 4, .type = MoveType::Advance, .path = {10, 11, 12}, .hops = 5};
    auto const report = reducer.Validate(s, 0, m);
    ASSERT_TRUE(HasCode(report.violations, RVC::Hop_CountMismatch));
    auto const it = std::ranges::find(report.violations, RVC::Hop_CountMismatch, &error::RuleViolation::code);
    EXPECT_EQ(it->expected_hops, std::optional<uint8_t>{5});
    EXPECT_EQ(it->attempted_hops, std::optional<uint8_t>{2});
}

TEST(RuleRegistry, Standard_Order_And_Ids)
{
    auto const reg = MakeStandardRules();
    std::vector<std::string_view> const expected{
        "piece-ownership", "entry-card", "path-topology", "hop-count", "own-piece-blocking",
        "backward-protected", "capture-eligibility", "safe-zone-ownership", "circuit-completion",
        "safe-zone-forward", "capture-hole-gating", "win-condition"
    };
    EXPECT_EQ(reg->Ids(), expected);
    EXPECT_EQ(reg->Size(), expected.size());
}

TEST(RuleRegistry, Rejects_Duplicates_And_Null)
{
    RuleRegistry reg;
    reg.Add(std::make_unique<AlwaysFails>("a", RVC::Path_Empty));
    EXPECT_THROW(reg.Add(std::make_unique<AlwaysFails>("a", RVC::Path_Empty)), error::AssertionError);
    EXPECT_THROW(reg.Add(nullptr), error::AssertionError);
}

TEST(RuleRegistry, Runs_Every_Rule)
{
    RuleRegistry reg;
    reg.Add(std::make_unique<AlwaysFails>("first", RVC::Path_Empty))
       .Add(std::make_unique<AlwaysFails>("second", RVC::Hop_CountMismatch));

    Reducer const reducer{};
    GameState s = WithCard(Started(reducer, 2), Rank::Five);
    Move const m{.piece = 4, .type = MoveType::Advance, .path = {8, 9, 10, 11, 12, 13}, .hops = 5};
    MoveContext const ctx = BuildContext(reducer.GetBoard(), s, reducer.Cards().Spec(Rank::Five), 0, m);

    ValidationReport const report = reg.Validate(ctx);
    ASSERT_EQ(report.violations.size(), 2u);
    EXPECT_EQ(report.violations[0].rule, "first");
    EXPECT_EQ(report.violations[1].rule, "second");
    EXPECT_FALSE(report.Legal());
}

TEST(RuleRegistry, Custom_Registry_Drives_The_Reducer)
{
    auto reg = std::make_unique<RuleRegistry>();
    reg->Add(std::make_unique<AlwaysFails>("nothing-goes", RVC::Path_Empty));
    Reducer const reducer(Config{}, std::move(reg));

    GameState const s = WithCard(Started(reducer, 2), Rank::Five);
    EXPECT_TRUE(reducer.LegalMoves(s).empty());
}

TEST_F(RulesFixture, Joker_Cannot_Step_Back_From_Corner_Home_Or_Safe_Entry)
{
    // corner, foreign safe entry, foreign home, own home
    std::vector<std::pair<HoleId, HoleId>> const origins{{27, 26}, {20, 19}, {22, 21}, {8, 7}};
    for (auto const& [origin, prev] : origins)
    {
        GameState g = s;
        Place(g, 5, 60);
        Place(g, 4, origin);
        Place(g, 9, prev);
        g = WithCard(g, Rank::Joker);

        EXPECT_EQ(FindCandidate(reducer.LegalMoves(g), 4, MoveType::Retreat), nullptr) << "origin " << origin;

        Move const m{.piece = 4, .type = MoveType::Retreat, .path = {origin, prev}, .hops = 1};
        EXPECT_TRUE(HasCode(reducer.Validate(g, 0, m).violations, RVC::Backward_FromRestrictedHole))
            << "origin " << origin;
    }
}

TEST_F(RulesFixture, Joker_Steps_Back_From_A_Plain_Hole)
{
    Place(s, 5, 60);
    Place(s, 4, 19);
    Place(s, 9, 18);
    s = WithCard(s, Rank::Joker);

    Candidate const* back = FindCandidate(reducer.LegalMoves(s), 4, MoveType::Retreat);
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(back->move.path, (std::vector<HoleId>{19, 18}));
    EXPECT_TRUE(reducer.Validate(s, 0, back->move).Legal());
}

TEST_F(RulesFixture, Capture_Hole_Is_Entered_Once_Until_Captured)
{
    Piece& p = Place(s, 4, 27, true, false);
    p.on_shortcut = true;
    p.shortcut_entry = 27;
    p.exited_capture_hole = true;
    s = WithCard(s, Rank::Ace);

    EXPECT_EQ(FindCandidate(reducer.LegalMoves(s), 4, MoveType::EnterCaptureHole), nullptr);

    Move const m{.piece = 4, .type = MoveType::EnterCaptureHole, .path = {27, 132}, .hops = 1};
    EXPECT_TRUE(HasCode(reducer.Validate(s, 0, m).violations, RVC::CaptureHole_AlreadyExited));

    auto const traces = reducer.Generator().Trace(s, 4, reducer.Cards().Spec(Rank::Ace), 1);
    EXPECT_TRUE(std::ranges::any_of(traces, [](PathTrace const& t)
    {
        return t.type == MoveType::EnterCaptureHole && t.blocked && t.reason == BlockReason::CaptureHoleSpent;
    }));
}

TEST_F(RulesFixture, Off_Board_Path_Start_Is_Reported_Not_Thrown)
{
    s = WithCard(s, Rank::Ace);
    Move const m{.piece = 4, .type = MoveType::Advance, .path = {9999, 10}, .hops = 1};

    ValidationReport report{};
    EXPECT_NO_THROW(report = reducer.Validate(s, 0, m));
    EXPECT_TRUE(HasCode(report.violations, RVC::Path_StartMismatch));
}

TEST_F(RulesFixture, Violations_Carry_The_Rule_Tag)
{
    Place(s, 9, BoardRef().CaptureHole());
    Piece& p = Place(s, 4, 27, true, false);
    p.on_shortcut = true;
    p.shortcut_entry = 27;
    s = WithCard(s, Rank::Ace);

    Move const m{.piece = 4, .type = MoveType::EnterCaptureHole, .path = {27, 132}, .hops = 1};
    auto const report = reducer.Validate(s, 0, m);
    auto const it = std::ranges::find(report.violations, RVC::Capture_ProtectedHole, &error::RuleViolation::code);
    ASSERT_NE(it, report.violations.end());
    EXPECT_EQ(it->tag, "capture");
    EXPECT_NE(error::describe(*it).find("tag=capture"), std::string::npos);
}
