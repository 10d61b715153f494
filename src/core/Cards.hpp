//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_CARDS_HPP
#define FASTTRACK_CARDS_HPP

#include <string>
#include <string_view>
#include "Types.hpp"

namespace fasttrack::core
{
    // Everything the engine needs to know about a rank.
    struct CardSpec
    {
        Rank rank{};
        uint8_t movement{};
        Direction direction{Direction::Forward};
        bool entry{false};            // may bring a piece from holding to home
        bool split_move{false};       // movement may be divided between two pieces
        bool extra_turn{false};
        bool exit_capture{false};     // may leave the capture hole
        bool revokes_shortcut{false}; // drawing it takes every piece off the shortcut
        bool backward_capture{false}; // may step one hole back onto an opponent
    };

    class CardTable
    {
    public:
        CardTable() = default;
        explicit CardTable(std::array<CardSpec, RankCount> specs);

        static auto Standard() -> CardTable;

        auto Spec(Rank r) const -> CardSpec const&;
        auto Spec(Card const& c) const -> CardSpec const& { return Spec(c.rank); }

    private:
        std::array<CardSpec, RankCount> specs_{};
    };

    // 52 cards, plus jokers when enabled, in a fixed unshuffled order.
    auto BuildDeck(bool jokers) -> std::vector<Card>;

    auto ToString(Rank r) -> std::string_view;
    auto ToString(Suit s) -> std::string_view;
    auto ToString(Card const& c) -> std::string;
}

#endif //FASTTRACK_CARDS_HPP
