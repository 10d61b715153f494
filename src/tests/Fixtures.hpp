//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_TEST_FIXTURES_HPP
#define FASTTRACK_TEST_FIXTURES_HPP

#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>

#include "../core/Reducer.hpp"

namespace fasttrack::test
{
    using namespace fasttrack::core;

    // Applies the payload as the next event in sequence.
    inline auto Step(Reducer const& r, GameState const& s, EventPayload p) -> ApplyOutcome
    {
        return r.Apply(s, Event{.sequence = s.next_sequence, .payload = std::move(p)});
    }

    inline auto MustStep(Reducer const& r, GameState const& s, EventPayload p) -> ApplyResult
    {
        auto out = Step(r, s, std::move(p));
        EXPECT_TRUE(out.has_value()) << (out ? "" : out.error().message);
        if (!out) FTK_THROW(out.error().code, out.error().message);
        return std::move(*out);
    }

    // Lobby, joins and start for seats 0..n-1. Every player begins with its home piece
    // on the board and the rest in holding.
    inline auto Started(Reducer const& r, std::size_t n, std::uint64_t seed = 7) -> GameState
    {
        GameState s{};
        std::vector<SeatT> order(n);
        std::iota(order.begin(), order.end(), SeatT{0});
        for (SeatT const seat : order) s = MustStep(r, s, PlayerJoined{.seat = seat}).state;
        return MustStep(r, s, GameStarted{.seed = seed, .player_order = order}).state;
    }

    // Puts a card of the rank in play for the active player, taken from its draw pile.
    inline auto WithCard(GameState s, Rank rank) -> GameState
    {
        auto& pile = s.players[s.turn.active].deck.draw_pile;
        auto const it = std::ranges::find(pile, rank, &Card::rank);
        if (it == pile.end()) FTK_THROW(error::Code::State, "rank not left in the draw pile");
        s.turn.card = *it;
        pile.erase(it);
        s.phase = Phase::AwaitingMove;
        return s;
    }

    // Moves a card of the rank to the top of the active player's draw pile.
    inline auto Stack(GameState s, Rank rank) -> GameState
    {
        auto& pile = s.players[s.turn.active].deck.draw_pile;
        auto const it = std::ranges::find(pile, rank, &Card::rank);
        if (it == pile.end()) FTK_THROW(error::Code::State, "rank not left in the draw pile");
        Card const c = *it;
        pile.erase(it);
        pile.push_back(c);
        return s;
    }

    inline auto Place(GameState& s, PieceId id, HoleId h, bool completed = false, bool eligible = false) -> Piece&
    {
        Piece& p = s.pieces.at(id);
        p.location = h;
        p.completed_circuit = completed;
        p.eligible_for_safe_zone = eligible;
        p.on_shortcut = false;
        p.shortcut_entry = NoHole;
        return p;
    }

    inline auto PieceOf(GameState const& s, SeatT seat, std::size_t k) -> PieceId
    {
        return FindPlayer(s, seat)->pieces.at(k);
    }

    inline auto HasCode(std::vector<error::RuleViolation> const& vs, error::RuleViolationCode code) -> bool
    {
        return std::ranges::any_of(vs, [&](auto const& v) { return v.code == code; });
    }

    inline auto FindCandidate(std::vector<Candidate> const& cs, PieceId piece, MoveType type) -> Candidate const*
    {
        auto const it = std::ranges::find_if(cs, [&](Candidate const& c)
        {
            return c.move.piece == piece && c.move.type == type;
        });
        return it != cs.end() ? &*it : nullptr;
    }
}

#endif //FASTTRACK_TEST_FIXTURES_HPP
