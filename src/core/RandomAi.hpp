//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_RANDOMAI_HPP
#define FASTTRACK_RANDOMAI_HPP

#include <random>
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace fasttrack::core
{
    // Picks uniformly among the legal candidates, taking a win whenever one is offered.
    class RandomAI final : public fasttrack::core::Player
    {
    public:
        RandomAI(SeatT seat, uint64_t rng_seed);

        auto Play(GameState const& snapshot, std::span<Candidate const> legal) -> EventPayload override;

        auto Seat() const noexcept -> SeatT { return seat_; }

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto Choose(std::span<Candidate const> legal) -> Candidate const&;

    private:
        SeatT seat_;
        std::mt19937 rng_;
    };
}

#endif //FASTTRACK_RANDOMAI_HPP
