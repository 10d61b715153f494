//
// Created by Malik T on 19/10/2026.
//

#include "Rng.hpp"

#include <limits>
#include "Exception.hpp"

namespace fasttrack::core
{
    DeterministicRng::DeterministicRng(RngState& state) :
        state_(state),
        engine_(state.seed)
    {
        engine_.discard(state_.consumed);
    }

    auto DeterministicRng::Draw() -> uint64_t
    {
        ++state_.consumed;
        return engine_();
    }

    auto DeterministicRng::Below(uint64_t bound) -> uint64_t
    {
        FTK_ASSERT(bound > 0, "Empty range for random draw");
        constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
        uint64_t const limit = max - (max % bound);
        uint64_t v = Draw();
        while (v >= limit)
        {
            v = Draw();
        }
        return v % bound;
    }
}
