//
// Created by Malik T on 02/10/2026.
//

#include "Card.hpp"

#include <cctype>
#include <format>
#include <optional>
#include "Exception.hpp"

namespace
{
    using drawpoker::core::Rank;
    using drawpoker::core::Suit;

    constexpr std::array<std::string_view, drawpoker::core::RankCount> RankTokens{
        "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K", "A"
    };

    auto SuitLetter(Suit const s) -> char
    {
        switch (s)
        {
        case Suit::Hearts:   return 'H';
        case Suit::Diamonds: return 'D';
        case Suit::Clubs:    return 'C';
        case Suit::Spades:   return 'S';
        }
        return '?';
    }

    auto SuitFromLetter(char const c) -> std::optional<Suit>
    {
        switch (std::tolower(static_cast<unsigned char>(c)))
        {
        case 'h': return Suit::Hearts;
        case 'd': return Suit::Diamonds;
        case 'c': return Suit::Clubs;
        case 's': return Suit::Spades;
        default: return std::nullopt;
        }
    }

    auto RankFromToken(std::string_view const tok) -> std::optional<Rank>
    {
        std::string upper(tok);
        for (char& ch : upper)
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));

        for (std::size_t i{}; i < RankTokens.size(); ++i)
        {
            if (RankTokens[i] == upper) return static_cast<Rank>(i);
        }
        return std::nullopt;
    }
}

namespace drawpoker::core
{
    auto ToToken(Card const& c) -> std::string
    {
        return std::format("{}{}", RankTokens[std::to_underlying(c.rank)], SuitLetter(c.suit));
    }

    auto ParseCard(std::string_view const token) -> Card
    {
        using error::Code;
        if (token.size() < 2 || token.size() > 3)
            DPK_THROW(Code::InvalidCardToken, std::format("Card token '{}' must be 2 or 3 characters", token));

        std::optional<Suit> const suit = SuitFromLetter(token.back());
        if (!suit)
            DPK_THROW(Code::InvalidCardToken, std::format("Unknown suit letter in card token '{}'", token));

        std::optional<Rank> const rank = RankFromToken(token.substr(0, token.size() - 1));
        if (!rank)
            DPK_THROW(Code::InvalidCardToken, std::format("Unknown rank in card token '{}'", token));

        return Card{*suit, *rank};
    }

    auto ToTokens(std::span<Card const> const cards) -> std::vector<std::string>
    {
        std::vector<std::string> out;
        out.reserve(cards.size());
        for (Card const& c : cards) out.push_back(ToToken(c));
        return out;
    }

    auto ParseCards(std::span<std::string const> const tokens) -> std::vector<Card>
    {
        std::vector<Card> out;
        out.reserve(tokens.size());
        for (std::string const& t : tokens) out.push_back(ParseCard(t));
        return out;
    }
}
