//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_RNG_HPP
#define FASTTRACK_RNG_HPP

#include <random>
#include <utility>
#include "State.hpp"

namespace fasttrack::core
{
    // std::mt19937_64 output is fixed by the standard, the distributions are not,
    // so bounded draws and shuffles are done here by hand to keep replays identical
    // across standard libraries. Every raw draw is counted in the bound RngState.
    class DeterministicRng
    {
    public:
        explicit DeterministicRng(RngState& state);

        // Uniform value in [0, bound) by rejection sampling.
        auto Below(uint64_t bound) -> uint64_t;

        template <class T>
        auto Shuffle(std::vector<T>& v) -> void
        {
            for (std::size_t i = v.size(); i > 1; --i)
            {
                auto const j = static_cast<std::size_t>(Below(i));
                std::swap(v[i - 1], v[j]);
            }
        }

    private:
        auto Draw() -> uint64_t;

        RngState& state_;
        std::mt19937_64 engine_;
    };
}

#endif //FASTTRACK_RNG_HPP
