//
// Created by Malik T on 19/10/2026.
//

#include <gtest/gtest.h>
#include <algorithm>

#include "Fixtures.hpp"
#include "../core/RandomAi.hpp"
#include "../debug/Invariants.hpp"
#include "../net/codec.hpp"

using namespace fasttrack::core;
using namespace fasttrack::test;
using RVC = error::RuleViolationCode;

namespace
{
    auto HasEffect(std::vector<Effect> const& fx, EffectKind k) -> bool
    {
        return std::ranges::any_of(fx, [&](Effect const& e) { return e.kind == k; });
    }

    auto Rejected(ApplyOutcome const& r, error::Code code) -> bool
    {
        return !r.has_value() && r.error().code == code;
    }

    // Draws the stacked card for the active player.
    auto DrawStacked(Reducer const& r, GameState s, Rank rank) -> ApplyResult
    {
        s = Stack(std::move(s), rank);
        return MustStep(r, s, CardDrawn{.seat = ActivePlayer(s).seat});
    }

    // Plays random legal events for a number of turns and returns the log.
    auto RandomLog(Reducer const& r, std::uint64_t seed, std::size_t n_events) -> std::vector<Event>
    {
        std::vector<Event> log;
        GameState s{};
        auto push = [&](EventPayload p)
        {
            Event const e{.sequence = s.next_sequence, .payload = std::move(p)};
            auto out = r.Apply(s, e);
            if (!out) FTK_THROW(out.error().code, out.error().message);
            s = std::move(out->state);
            log.push_back(e);
        };

        push(PlayerJoined{.seat = 0});
        push(PlayerJoined{.seat = 1});
        push(PlayerJoined{.seat = 2});
        push(GameStarted{.seed = seed, .player_order = {0, 1, 2}});

        std::vector<RandomAI> ais;
        for (SeatT seat = 0; seat < 3; ++seat) ais.emplace_back(seat, seed + seat);
        while (log.size() < n_events && s.phase != Phase::GameWon)
        {
            std::vector<Candidate> const legal = r.LegalMoves(s);
            push(ais[ActivePlayer(s).seat].Play(s, legal));
        }
        return log;
    }
}

TEST(Reducer, Start_Lays_Out_Pieces_And_Decks)
{
    Reducer const r{};
    GameState const s = Started(r, 2);

    EXPECT_EQ(s.phase, Phase::AwaitingDraw);
    EXPECT_EQ(s.next_sequence, 3u);
    ASSERT_EQ(s.players.size(), 2u);
    EXPECT_EQ(s.players[0].section, 0);
    EXPECT_EQ(s.players[1].section, 3);
    ASSERT_EQ(s.pieces.size(), 10u);
    EXPECT_EQ(s.pieces[4].location, 8);
    EXPECT_EQ(s.pieces[9].location, 50);
    for (PieceId id : {0, 1, 2, 3}) EXPECT_EQ(s.pieces[id].location, 108 + id);
    for (PieceId id : {5, 6, 7, 8}) EXPECT_EQ(s.pieces[id].location, 120 + id - 5);
    EXPECT_EQ(s.players[0].deck.draw_pile.size(), 54u);
    EXPECT_EQ(s.turn.number, 1u);
    EXPECT_EQ(s.turn.active, 0);
    EXPECT_NO_THROW(debug::CheckInvariants(r, s));
}

TEST(Reducer, Lobby_Rejections)
{
    Reducer const r{};
    GameState s{};
    s = MustStep(r, s, PlayerJoined{.seat = 0}).state;

    EXPECT_TRUE(Rejected(Step(r, s, PlayerJoined{.seat = 0}), error::Code::InvalidEvent));
    EXPECT_TRUE(Rejected(Step(r, s, PlayerJoined{.seat = 6}), error::Code::InvalidEvent));
    EXPECT_TRUE(Rejected(Step(r, s, GameStarted{.seed = 1, .player_order = {0}}), error::Code::InvalidEvent));
    EXPECT_TRUE(Rejected(Step(r, s, GameStarted{.seed = 1, .player_order = {0, 2}}), error::Code::InvalidEvent));
    EXPECT_TRUE(Rejected(Step(r, s, CardDrawn{.seat = 0}), error::Code::InvalidEvent));

    s = MustStep(r, s, PlayerJoined{.seat = 2}).state;
    EXPECT_TRUE(Rejected(Step(r, s, GameStarted{.seed = 1, .player_order = {2, 2}}), error::Code::InvalidEvent));
    s = MustStep(r, s, GameStarted{.seed = 1, .player_order = {2, 0}}).state;
    EXPECT_EQ(s.players[0].seat, 2);
    EXPECT_EQ(ActivePlayer(s).seat, 2);

    EXPECT_TRUE(Rejected(Step(r, s, PlayerJoined{.seat = 1}), error::Code::InvalidEvent));
    EXPECT_TRUE(Rejected(Step(r, s, GameStarted{.seed = 1, .player_order = {2, 0}}), error::Code::InvalidEvent));
}

TEST(Reducer, Sequence_Numbers_Are_Strict)
{
    Reducer const r{};
    GameState const s = Started(r, 2);

    auto const ahead = r.Apply(s, Event{.sequence = s.next_sequence + 1, .payload = CardDrawn{.seat = 0}});
    EXPECT_TRUE(Rejected(ahead, error::Code::InvalidEvent));
    auto const behind = r.Apply(s, Event{.sequence = s.next_sequence - 1, .payload = CardDrawn{.seat = 0}});
    EXPECT_TRUE(Rejected(behind, error::Code::InvalidEvent));
    EXPECT_EQ(s.next_sequence, 3u);
}

TEST(Reducer, Wrong_Player_Or_Phase)
{
    Reducer const r{};
    GameState const s = Started(r, 2);

    EXPECT_TRUE(Rejected(Step(r, s, CardDrawn{.seat = 1}), error::Code::InvalidEvent));
    EXPECT_TRUE(Rejected(Step(r, s, MovePlayed{.seat = 0, .piece = 4, .path = {8, 9}}), error::Code::InvalidEvent));
    EXPECT_TRUE(Rejected(Step(r, s, SplitMovePlayed{.seat = 0, .piece = 4, .path = {8, 9}}),
                         error::Code::InvalidEvent));

    GameState const moving = WithCard(s, Rank::Five);
    EXPECT_TRUE(Rejected(Step(r, moving, CardDrawn{.seat = 0}), error::Code::InvalidEvent));
    EXPECT_TRUE(Rejected(Step(r, moving, MovePlayed{.seat = 0, .piece = 200, .path = {8, 9}}),
                         error::Code::InvalidEvent));
}

TEST(Reducer, Input_State_Is_Untouched)
{
    Reducer const r{};
    GameState const s = Started(r, 2);
    std::uint64_t const before = fasttrack::core::net::ComputeStateHash(s);

    auto const out = Step(r, s, CardDrawn{.seat = 0});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(fasttrack::core::net::ComputeStateHash(s), before);
    EXPECT_NE(fasttrack::core::net::ComputeStateHash(out->state), before);
}

TEST(Reducer, Plain_Move_Passes_The_Turn)
{
    Reducer const r{};
    ApplyResult const drawn = DrawStacked(r, Started(r, 2), Rank::Five);
    ASSERT_EQ(drawn.state.phase, Phase::AwaitingMove);
    ASSERT_TRUE(drawn.state.turn.card.has_value());
    EXPECT_EQ(drawn.state.turn.card->rank, Rank::Five);
    EXPECT_NO_THROW(debug::CheckInvariants(r, drawn.state));

    auto const out = MustStep(r, drawn.state, MovePlayed{
                                  .seat = 0, .piece = 4, .type = MoveType::Advance, .path = {8, 9, 10, 11, 12, 13}
                              });
    EXPECT_EQ(out.state.pieces[4].location, 13);
    EXPECT_TRUE(HasEffect(out.effects, EffectKind::PieceMoved));
    EXPECT_TRUE(HasEffect(out.effects, EffectKind::TurnPassed));
    EXPECT_EQ(ActivePlayer(out.state).seat, 1);
    EXPECT_EQ(out.state.phase, Phase::AwaitingDraw);
    EXPECT_EQ(out.state.turn.number, 2u);
    EXPECT_FALSE(out.state.turn.card.has_value());
    EXPECT_EQ(out.state.players[0].deck.discard_pile.size(), 1u);
    EXPECT_NO_THROW(debug::CheckInvariants(r, out.state));
}

TEST(Reducer, Path_Must_Match_The_Card)
{
    Reducer const r{};
    ApplyResult const drawn = DrawStacked(r, Started(r, 2), Rank::Five);
    auto const out = Step(r, drawn.state, MovePlayed{
                              .seat = 0, .piece = 4, .type = MoveType::Advance, .path = {8, 9, 10}
                          });
    ASSERT_TRUE(Rejected(out, error::Code::IllegalMove));
    EXPECT_TRUE(HasCode(out.error().violations, RVC::Hop_CountMismatch));
}

TEST(Reducer, Entry_Card_Grants_An_Extra_Turn)
{
    Reducer const r{};
    GameState s = Started(r, 2);
    Place(s, 4, 20);
    ApplyResult const drawn = DrawStacked(r, s, Rank::Six);

    auto const out = MustStep(r, drawn.state, MovePlayed{
                                  .seat = 0, .piece = 0, .type = MoveType::Enter, .path = {108, 8}
                              });
    EXPECT_EQ(out.state.pieces[0].location, 8);
    EXPECT_TRUE(HasEffect(out.effects, EffectKind::PieceEntered));
    EXPECT_TRUE(HasEffect(out.effects, EffectKind::ExtraTurn));
    EXPECT_EQ(ActivePlayer(out.state).seat, 0);
    EXPECT_EQ(out.state.phase, Phase::AwaitingDraw);
    EXPECT_EQ(out.state.turn.number, 2u);
}

TEST(Reducer, No_Legal_Moves_Passes_Without_Extra_Turn)
{
    Reducer const r{};
    GameState s = Started(r, 2);
    Place(s, 4, 87, true, false);

    ApplyResult const out = DrawStacked(r, s, Rank::Five);
    EXPECT_TRUE(HasEffect(out.effects, EffectKind::NoLegalMoves));
    EXPECT_TRUE(HasEffect(out.effects, EffectKind::TurnPassed));
    EXPECT_EQ(ActivePlayer(out.state).seat, 1);
    EXPECT_EQ(out.state.phase, Phase::AwaitingDraw);
    ASSERT_EQ(out.state.players[0].deck.discard_pile.size(), 1u);
    EXPECT_EQ(out.state.players[0].deck.discard_pile[0].rank, Rank::Five);
}

TEST(Reducer, Turn_Can_Be_Ended_Explicitly)
{
    Reducer const r{};
    GameState const s = Started(r, 2);
    auto const out = MustStep(r, s, TurnEnded{.seat = 0});
    EXPECT_EQ(ActivePlayer(out.state).seat, 1);
    EXPECT_TRUE(HasEffect(out.effects, EffectKind::TurnPassed));
    EXPECT_TRUE(Rejected(Step(r, out.state, TurnEnded{.seat = 0}), error::Code::InvalidEvent));
}

TEST(Reducer, Four_Revokes_Every_Shortcut)
{
    Reducer const r{};
    GameState s = Started(r, 2);
    Piece& mine = Place(s, 4, 27, true, false);
    mine.on_shortcut = true;
    mine.shortcut_entry = 27;
    Piece& theirs = Place(s, 9, 69, true, false);
    theirs.on_shortcut = true;
    theirs.shortcut_entry = 69;

    ApplyResult const out = DrawStacked(r, s, Rank::Four);
    EXPECT_FALSE(out.state.pieces[4].on_shortcut);
    EXPECT_FALSE(out.state.pieces[9].on_shortcut);
    EXPECT_EQ(out.state.pieces[9].shortcut_entry, NoHole);
    auto const revoked = std::ranges::count_if(out.effects, [](Effect const& e)
    {
        return e.kind == EffectKind::ShortcutRevoked;
    });
    EXPECT_EQ(revoked, 2);
}

namespace
{
    // Piece 4 waits on the shortcut at corner 27 while piece 0 moves with a Five.
    auto ForcedExitSetup(Reducer const& r) -> ApplyResult
    {
        GameState s = Started(r, 2);
        Piece& p = Place(s, 4, 27, true, false);
        p.on_shortcut = true;
        p.shortcut_entry = 27;
        Place(s, 0, 60);
        ApplyResult const drawn = DrawStacked(r, s, Rank::Five);
        return MustStep(r, drawn.state, MovePlayed{
                            .seat = 0, .piece = 0, .type = MoveType::Advance, .path = {60, 61, 62, 63, 64, 65}
                        });
    }
}

TEST(Reducer, Idle_Shortcut_Piece_Is_Demoted_In_Place)
{
    Reducer const r{};
    ApplyResult const out = ForcedExitSetup(r);
    Piece const& p = out.state.pieces[4];
    EXPECT_EQ(p.location, 27);
    EXPECT_FALSE(p.on_shortcut);
    EXPECT_EQ(p.shortcut_entry, NoHole);
    EXPECT_TRUE(HasEffect(out.effects, EffectKind::ForcedShortcutExit));
    EXPECT_NO_THROW(debug::CheckInvariants(r, out.state));
}

TEST(Reducer, Idle_Shortcut_Piece_Steps_Off_When_Configured)
{
    Config cfg{};
    cfg.forced_exit = ForcedExitRule::NextPerimeterHole;
    Reducer const r(cfg);
    ApplyResult const out = ForcedExitSetup(r);
    EXPECT_EQ(out.state.pieces[4].location, 28);
    EXPECT_FALSE(out.state.pieces[4].on_shortcut);
}

TEST(Reducer, Shortcut_Mover_Keeps_Shortcut_Mode)
{
    Reducer const r{};
    GameState s = Started(r, 2);
    Piece& p = Place(s, 4, 27, true, false);
    p.on_shortcut = true;
    p.shortcut_entry = 27;
    ApplyResult const drawn = DrawStacked(r, s, Rank::Two);
    auto const out = MustStep(r, drawn.state, MovePlayed{
                                  .seat = 0, .piece = 4, .type = MoveType::ContinueShortcut, .path = {27, 41, 55}
                              });
    EXPECT_EQ(out.state.pieces[4].location, 55);
    EXPECT_TRUE(out.state.pieces[4].on_shortcut);
    EXPECT_FALSE(HasEffect(out.effects, EffectKind::ForcedShortcutExit));
}

TEST(Reducer, Seven_Splits_Between_Two_Pieces)
{
    Reducer const r{};
    GameState s = Started(r, 2);
    Place(s, 4, 20);
    Place(s, 0, 30);
    ApplyResult const drawn = DrawStacked(r, s, Rank::Seven);

    auto const legal = r.LegalMoves(drawn.state);
    EXPECT_TRUE(std::ranges::any_of(legal, [](Candidate const& c) { return c.Has(Note_SplitPart); }));
    EXPECT_TRUE(std::ranges::any_of(legal, [](Candidate const& c) { return !c.Has(Note_SplitPart); }));

    EXPECT_TRUE(Rejected(Step(r, drawn.state, SplitMovePlayed{
                             .seat = 0, .piece = 4, .type = MoveType::Advance,
                             .path = {20, 21, 22, 23, 24, 25, 26, 27}
                         }), error::Code::IllegalMove));

    auto const first = MustStep(r, drawn.state, SplitMovePlayed{
                                    .seat = 0, .piece = 4, .type = MoveType::Advance, .path = {20, 21, 22, 23}
                                });
    EXPECT_EQ(first.state.phase, Phase::AwaitingSplitMove);
    EXPECT_EQ(first.state.turn.split_remaining, 4);
    EXPECT_EQ(first.state.turn.split_first, std::optional<PieceId>{4});
    EXPECT_NO_THROW(debug::CheckInvariants(r, first.state));

    for (Candidate const& c : r.LegalMoves(first.state))
    {
        EXPECT_NE(c.move.piece, 4);
        EXPECT_EQ(c.move.PathHops(), 4);
    }

    auto const same = Step(r, first.state, SplitMovePlayed{
                               .seat = 0, .piece = 4, .type = MoveType::Advance, .path = {23, 24, 25, 26, 27}
                           });
    ASSERT_TRUE(Rejected(same, error::Code::IllegalMove));
    EXPECT_TRUE(HasCode(same.error().violations, RVC::Split_SamePiece));

    auto const second = MustStep(r, first.state, SplitMovePlayed{
                                     .seat = 0, .piece = 0, .type = MoveType::Advance, .path = {30, 31, 32, 33, 34}
                                 });
    EXPECT_EQ(second.state.pieces[4].location, 23);
    EXPECT_EQ(second.state.pieces[0].location, 34);
    EXPECT_EQ(ActivePlayer(second.state).seat, 1);
    EXPECT_FALSE(second.state.turn.split_first.has_value());
    EXPECT_NO_THROW(debug::CheckInvariants(r, second.state));
}

TEST(Reducer, Only_Seven_Splits)
{
    Reducer const r{};
    GameState s = Started(r, 2);
    Place(s, 4, 20);
    ApplyResult const drawn = DrawStacked(r, s, Rank::Five);
    auto const out = Step(r, drawn.state, SplitMovePlayed{
                              .seat = 0, .piece = 4, .type = MoveType::Advance, .path = {20, 21, 22}
                          });
    ASSERT_TRUE(Rejected(out, error::Code::IllegalMove));
    EXPECT_TRUE(HasCode(out.error().violations, RVC::Split_NotAllowed));
}

TEST(Reducer, Split_Needs_A_Second_Piece)
{
    Reducer const r{};
    GameState s = Started(r, 2);
    Place(s, 4, 20);
    ApplyResult const drawn = DrawStacked(r, s, Rank::Seven);

    EXPECT_TRUE(std::ranges::none_of(r.LegalMoves(drawn.state), [](Candidate const& c)
    {
        return c.Has(Note_SplitPart);
    }));
    auto const out = Step(r, drawn.state, SplitMovePlayed{
                              .seat = 0, .piece = 4, .type = MoveType::Advance, .path = {20, 21, 22}
                          });
    ASSERT_TRUE(Rejected(out, error::Code::IllegalMove));
    EXPECT_TRUE(HasCode(out.error().violations, RVC::Split_NoSecondMove));
}

TEST(Reducer, Empty_Draw_Pile_Reshuffles_The_Discards)
{
    Reducer const r{};
    GameState s = Started(r, 2);
    DeckState& d = s.players[0].deck;
    d.discard_pile = std::move(d.draw_pile);
    d.draw_pile.clear();

    auto const out = MustStep(r, s, CardDrawn{.seat = 0});
    EXPECT_TRUE(HasEffect(out.effects, EffectKind::DeckReshuffled));
    EXPECT_GT(out.state.rng.consumed, s.rng.consumed);
    EXPECT_NO_THROW(debug::CheckInvariants(r, out.state));
}

TEST(Reducer, Same_Seed_Same_Game)
{
    Reducer const r{};
    auto const a = RandomLog(r, 99, 200);
    auto const b = RandomLog(r, 99, 200);
    ASSERT_EQ(a.size(), b.size());
    EXPECT_EQ(fasttrack::core::net::EncodeEventLog(a), fasttrack::core::net::EncodeEventLog(b));

    GameState const x = Started(r, 2, 1);
    GameState const y = Started(r, 2, 2);
    EXPECT_NE(fasttrack::core::net::ComputeStateHash(x), fasttrack::core::net::ComputeStateHash(y));
}

TEST(Reducer, Replay_Rebuilds_The_Live_State)
{
    Reducer const r{};
    auto const log = RandomLog(r, 4242, 150);

    GameState live{};
    for (Event const& e : log)
    {
        auto out = r.Apply(live, e);
        ASSERT_TRUE(out.has_value()) << out.error().message;
        live = std::move(out->state);
        debug::CheckInvariants(r, live);
    }

    auto const replayed = r.Replay(log);
    ASSERT_TRUE(replayed.has_value());
    EXPECT_EQ(fasttrack::core::net::ComputeStateHash(*replayed), fasttrack::core::net::ComputeStateHash(live));

    std::vector<Event> broken = log;
    broken.erase(broken.begin() + 10);
    auto const bad = r.Replay(broken);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, error::Code::InvalidEvent);
}

TEST(Reducer, Off_Board_Path_Is_An_Invalid_Event)
{
    Reducer const r{};
    GameState const s = WithCard(Started(r, 2), Rank::Five);

    for (std::vector<HoleId> const& path : {std::vector<HoleId>{9999, 10}, std::vector<HoleId>{8, 9, 10, 11, 12, 60000}})
    {
        ApplyOutcome out{};
        EXPECT_NO_THROW(out = Step(r, s, MovePlayed{.seat = 0, .piece = 4, .type = MoveType::Advance, .path = path}));
        EXPECT_TRUE(Rejected(out, error::Code::InvalidEvent));
    }

    GameState const split = WithCard(Started(r, 2), Rank::Seven);
    ApplyOutcome out{};
    EXPECT_NO_THROW(out = Step(r, split, SplitMovePlayed{
                                   .seat = 0, .piece = 4, .type = MoveType::Advance, .path = {8, 9999}}));
    EXPECT_TRUE(Rejected(out, error::Code::InvalidEvent));
}

TEST(Reducer, Leaving_The_Capture_Hole_Is_Final_Until_Captured)
{
    Reducer const r{};
    GameState s = Started(r, 2);
    Place(s, 4, r.GetBoard().CaptureHole());
    s = WithCard(s, Rank::King);

    auto const out = MustStep(r, s, MovePlayed{
                                  .seat = 0, .piece = 4, .type = MoveType::ExitCaptureHole, .path = {132, 83}});
    s = out.state;
    EXPECT_EQ(s.pieces[4].location, 83);
    EXPECT_TRUE(s.pieces[4].exited_capture_hole);

    // P1 takes it off the board: the piece may use the capture hole again
    Place(s, 4, 30);
    Place(s, 0, 40);
    Place(s, 9, 29);
    s.turn.active = 1;
    s = WithCard(s, Rank::Ace);
    auto const hit = MustStep(r, s, MovePlayed{.seat = 1, .piece = 9, .type = MoveType::Advance, .path = {29, 30}});
    EXPECT_TRUE(r.GetBoard().IsHolding(hit.state.pieces[4].location));
    EXPECT_FALSE(hit.state.pieces[4].exited_capture_hole);
}
