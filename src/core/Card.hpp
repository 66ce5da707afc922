//
// Created by Malik T on 02/10/2026.
//

#ifndef DRAWPOKER_CARD_HPP
#define DRAWPOKER_CARD_HPP

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "Types.hpp"

namespace drawpoker::core
{
    inline constexpr auto AllSuits() -> std::array<Suit, SuitCount>
    {
        return {Suit::Hearts, Suit::Diamonds, Suit::Clubs, Suit::Spades};
    }

    inline constexpr auto AllRanks() -> std::array<Rank, RankCount>
    {
        return {Rank::Two, Rank::Three, Rank::Four, Rank::Five, Rank::Six, Rank::Seven, Rank::Eight,
                Rank::Nine, Rank::Ten, Rank::Jack, Rank::Queen, Rank::King, Rank::Ace};
    }

    // 2..14, Ace high
    inline constexpr auto RankValue(Rank const r) noexcept -> int
    {
        return static_cast<int>(std::to_underlying(r)) + 2;
    }

    // Rank token + upper-case suit initial, e.g. "10H", "AS"
    auto ToToken(Card const& c) -> std::string;
    // Inverse of ToToken; suit and face letters are case-insensitive.
    // Throws error::InvalidCardTokenError on anything else.
    auto ParseCard(std::string_view token) -> Card;

    auto ToTokens(std::span<Card const> cards) -> std::vector<std::string>;
    auto ParseCards(std::span<std::string const> tokens) -> std::vector<Card>;
}

#endif //DRAWPOKER_CARD_HPP
