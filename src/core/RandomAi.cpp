//
// Created by Malik T on 19/10/2026.
//

#include "RandomAi.hpp"
#include <algorithm>
#include <ranges>
#include <vector>

#include "Exception.hpp"

namespace fasttrack::core
{
    RandomAI::RandomAI(SeatT seat, uint64_t rng_seed):
        seat_(seat),
        rng_(rng_seed) {}

    auto RandomAI::Play(GameState const& snapshot, std::span<Candidate const> legal) -> EventPayload
    {
        FTK_ASSERT(!snapshot.players.empty() && ActivePlayer(snapshot).seat == seat_,
                   "RandomAI asked to play out of turn");

        switch (snapshot.phase)
        {
        case Phase::AwaitingDraw:
            return CardDrawn{.seat = seat_};
        case Phase::AwaitingMove:
        case Phase::AwaitingSplitMove:
            if (legal.empty()) return TurnEnded{.seat = seat_};
            return ToPayload(seat_, Choose(legal));
        default:
            break;
        }
        FTK_THROW(error::Code::State, "RandomAI has nothing to do in this phase");
    }

    auto RandomAI::Choose(std::span<Candidate const> legal) -> Candidate const&
    {
        if (auto const win = std::ranges::find_if(legal, [](Candidate const& c) { return c.Has(Note_Wins); });
            win != legal.end())
            return *win;

        // full moves and split first parts get even odds as two groups
        auto full = std::ranges::to<std::vector<std::size_t>>(
            std::views::iota(std::size_t{0}, legal.size()) |
            std::views::filter([&](std::size_t i) { return !legal[i].Has(Note_SplitPart); }));
        bool const only_splits = full.empty();
        bool const any_split = full.size() != legal.size();
        if (only_splits || (any_split && std::bernoulli_distribution{0.5}(rng_)))
        {
            auto split = std::ranges::to<std::vector<std::size_t>>(
                std::views::iota(std::size_t{0}, legal.size()) |
                std::views::filter([&](std::size_t i) { return legal[i].Has(Note_SplitPart); }));
            return legal[split[pick(split)]];
        }
        return legal[full[pick(full)]];
    }
}
