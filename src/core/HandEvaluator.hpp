//
// Created by Malik T on 05/10/2026.
//

#ifndef DRAWPOKER_HANDEVALUATOR_HPP
#define DRAWPOKER_HANDEVALUATOR_HPP

#include <array>
#include <optional>
#include <span>
#include <vector>
#include "HandResult.hpp"
#include "Types.hpp"

namespace drawpoker::core
{
    using FiveCards = std::array<Card, 5>;

    // Rank descending, then suit order. Every selection below starts from this
    // order, which is what makes evaluation independent of input order.
    auto CanonicalOrder(std::span<Card const> cards) -> std::vector<Card>;

    namespace straight
    {
        // One card per rank, keeping the first one seen. Expects canonical order.
        auto DistinctRanks(std::span<Card const> sorted) -> std::vector<Card>;
        // Highest run of five consecutive values, highest card first.
        auto ScanRun(std::span<Card const> distinct) -> std::optional<FiveCards>;
        // A-2-3-4-5 listed as 5,4,3,2,A.
        auto ScanWheel(std::span<Card const> distinct) -> std::optional<FiveCards>;
        // ScanRun, falling back to ScanWheel. Expects canonical order, duplicates allowed.
        auto Find(std::span<Card const> sorted) -> std::optional<FiveCards>;
    }

    // Needs at least five cards; throws error::InsufficientCardsError otherwise.
    auto Evaluate(std::span<Card const> cards) -> HandResult;

    // Best five-card hand: Evaluate for exactly five cards, otherwise the first
    // maximal result over every five-card subset (21 of them for a seven-card hand).
    auto BestHand(std::span<Card const> cards) -> HandResult;
}

#endif //DRAWPOKER_HANDEVALUATOR_HPP
