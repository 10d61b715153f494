//
// Created by Malik T on 19/10/2026.
//

#include "Cards.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include "Exception.hpp"

namespace fasttrack::core
{
    namespace
    {
        constexpr auto Number(Rank r, uint8_t n) -> CardSpec
        {
            return CardSpec{.rank = r, .movement = n};
        }

        constexpr auto Face(Rank r) -> CardSpec
        {
            return CardSpec{.rank = r, .movement = 1, .extra_turn = true, .exit_capture = true};
        }
    }

    CardTable::CardTable(std::array<CardSpec, RankCount> specs) :
        specs_(specs)
    {
        for (std::size_t i{}; i < RankCount; ++i)
        {
            FTK_ASSERT(specs_[i].rank == static_cast<Rank>(i), "Card table out of rank order");
            FTK_ASSERT(specs_[i].movement > 0 || specs_[i].entry, "Card neither moves nor enters");
        }
    }

    auto CardTable::Standard() -> CardTable
    {
        return CardTable{{
            CardSpec{.rank = Rank::Ace, .movement = 1, .entry = true, .extra_turn = true},
            Number(Rank::Two, 2),
            Number(Rank::Three, 3),
            CardSpec{.rank = Rank::Four, .movement = 4, .direction = Direction::Backward, .revokes_shortcut = true},
            Number(Rank::Five, 5),
            CardSpec{.rank = Rank::Six, .movement = 6, .entry = true, .extra_turn = true},
            CardSpec{.rank = Rank::Seven, .movement = 7, .split_move = true},
            Number(Rank::Eight, 8),
            Number(Rank::Nine, 9),
            Number(Rank::Ten, 10),
            Face(Rank::Jack),
            Face(Rank::Queen),
            Face(Rank::King),
            CardSpec{.rank = Rank::Joker, .movement = 1, .entry = true, .extra_turn = true, .backward_capture = true},
        }};
    }

    auto CardTable::Spec(Rank r) const -> CardSpec const&
    {
        auto const idx = static_cast<std::size_t>(std::to_underlying(r));
        FTK_ASSERT(idx < RankCount, "Rank out of range");
        return specs_[idx];
    }

    auto BuildDeck(bool jokers) -> std::vector<Card>
    {
        std::vector<Card> deck;
        deck.reserve(constants::StandardDeckSize + constants::JokersPerDeck);
        for (std::size_t s{}; s < 4; ++s)
        {
            for (std::size_t r{}; r < static_cast<std::size_t>(Rank::Joker); ++r)
            {
                deck.push_back(Card{static_cast<Rank>(r), static_cast<Suit>(s)});
            }
        }
        if (jokers)
        {
            for (std::size_t j{}; j < constants::JokersPerDeck; ++j)
            {
                deck.push_back(Card{Rank::Joker, Suit::None});
            }
        }
        return deck;
    }

    auto ToString(Rank r) -> std::string_view
    {
        static constexpr std::array<std::string_view, RankCount> map{
            "A", "2", "3", "4", "5", "6", "7", "8", "9", "T", "J", "Q", "K", "JK"
        };
        return map[static_cast<std::size_t>(r)];
    }

    auto ToString(Suit s) -> std::string_view
    {
        switch (s)
        {
        case Suit::Hearts: return "H";
        case Suit::Diamonds: return "D";
        case Suit::Clubs: return "C";
        case Suit::Spades: return "S";
        case Suit::None: return "";
        }
        return "?";
    }

    auto ToString(Card const& c) -> std::string
    {
        return std::format("{}{}", ToString(c.rank), ToString(c.suit));
    }
}
