//
// Created by Malik T on 05/10/2026.
//

#ifndef DRAWPOKER_HANDRESULT_HPP
#define DRAWPOKER_HANDRESULT_HPP

#include <array>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include "Types.hpp"

namespace drawpoker::core
{
    // One alternative per category; each carries exactly the tie-break values
    // that category compares on, in comparison order. Values are 2..14.
    struct HighCard      { std::array<std::uint8_t, 5> values; };
    struct OnePair       { std::uint8_t pair, kicker1, kicker2, kicker3; };
    struct TwoPair       { std::uint8_t high_pair, low_pair, kicker; };
    struct ThreeOfAKind  { std::uint8_t trips, kicker1, kicker2; };
    struct Straight      { std::uint8_t high; }; // 5 for the wheel
    struct Flush         { std::array<std::uint8_t, 5> values; };
    struct FullHouse     { std::uint8_t trips, pair; };
    struct FourOfAKind   { std::uint8_t quads, kicker; };
    struct StraightFlush { std::uint8_t high; };
    struct RoyalFlush    {};

    // Alternative order is category order: index() + 1 is the category rank.
    using HandValue = std::variant<
        HighCard, OnePair, TwoPair, ThreeOfAKind, Straight,
        Flush, FullHouse, FourOfAKind, StraightFlush, RoyalFlush>;

    enum class HandCategory : std::uint8_t
    {
        HighCard = 1,
        Pair,
        TwoPair,
        ThreeOfAKind,
        Straight,
        Flush,
        FullHouse,
        FourOfAKind,
        StraightFlush,
        RoyalFlush
    };

    inline auto to_string(HandCategory const c) -> std::string_view
    {
        switch (c)
        {
        case HandCategory::HighCard: return "High Card";
        case HandCategory::Pair: return "Pair";
        case HandCategory::TwoPair: return "Two Pair";
        case HandCategory::ThreeOfAKind: return "Three of a Kind";
        case HandCategory::Straight: return "Straight";
        case HandCategory::Flush: return "Flush";
        case HandCategory::FullHouse: return "Full House";
        case HandCategory::FourOfAKind: return "Four of a Kind";
        case HandCategory::StraightFlush: return "Straight Flush";
        case HandCategory::RoyalFlush: return "Royal Flush";
        }
        return "Unknown";
    }

    struct HandResult
    {
        HandValue value;
        // Primary grouping first, kickers descending
        std::array<Card, 5> cards;

        [[nodiscard]]
        auto Category() const noexcept -> HandCategory
        {
            return static_cast<HandCategory>(value.index() + 1);
        }

        // 1..10, higher is better
        [[nodiscard]]
        auto Rank() const noexcept -> int { return static_cast<int>(value.index()) + 1; }

        [[nodiscard]]
        auto Name() const -> std::string_view { return to_string(Category()); }

        // Ordered tie-break key for same-category comparison
        [[nodiscard]]
        auto HighCards() const -> std::vector<int>
        {
            return std::visit([]<typename T0>(T0 const& v) -> std::vector<int>
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, HighCard> || std::is_same_v<T, Flush>)
                    return std::vector<int>(v.values.begin(), v.values.end());
                else if constexpr (std::is_same_v<T, OnePair>)
                    return {v.pair, v.kicker1, v.kicker2, v.kicker3};
                else if constexpr (std::is_same_v<T, TwoPair>)
                    return {v.high_pair, v.low_pair, v.kicker};
                else if constexpr (std::is_same_v<T, ThreeOfAKind>)
                    return {v.trips, v.kicker1, v.kicker2};
                else if constexpr (std::is_same_v<T, Straight> || std::is_same_v<T, StraightFlush>)
                    return {v.high};
                else if constexpr (std::is_same_v<T, FullHouse>)
                    return {v.trips, v.pair};
                else if constexpr (std::is_same_v<T, FourOfAKind>)
                    return {v.quads, v.kicker};
                else
                    return {14};
            }, value);
        }
    };
}

#endif //DRAWPOKER_HANDRESULT_HPP
