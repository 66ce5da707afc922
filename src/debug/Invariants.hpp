//
// Created by Malik T on 07/10/2026.
//

#ifndef DRAWPOKER_INVARIANTS_HPP
#define DRAWPOKER_INVARIANTS_HPP

#include <format>
#include <span>
#include "../core/Card.hpp"
#include "../core/Dealer.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"
#include "../core/Util.hpp"

namespace drawpoker::core::debug
{
    // A second layer of checks over whatever the dealer hands out. Breaks throw AssertionError.
    inline auto CheckDeckPermutation(std::span<Card const> deck) -> void
    {
#if DPK_ENABLE_TEST_HOOKS == false
        (void)deck;
#else
        util::CardUniqueChecker checker{};
        checker.Add(deck);

        // 1) Exactly one standard deck's worth of cards
        DPK_ASSERT(deck.size() == constants::DeckSize,
                   std::format("Deck holds {} cards, expected {}", deck.size(), constants::DeckSize));

        // 2) No card twice; with 52 slots that also means none is missing
        DPK_ASSERT(!checker.ContainsDup(), "Duplicate card in deck");
#endif // DPK_ENABLE_TEST_HOOKS == true
    }

    inline auto CheckDealInvariants(DealtHands const& d) -> void
    {
#if DPK_ENABLE_TEST_HOOKS == false
        (void)d;
#else
        // 1) Fixed slice sizes: 7 + 7 + 38
        DPK_ASSERT(d.player1.size() == constants::HandSize, "Player 1 was not dealt seven cards");
        DPK_ASSERT(d.player2.size() == constants::HandSize, "Player 2 was not dealt seven cards");
        DPK_ASSERT(d.reserve.size() == constants::ReserveSize, "Reserve is not 38 cards");

        // 2) Disjoint groups covering the deck
        util::CardUniqueChecker checker{};
        checker.Add(d.player1);
        checker.Add(d.player2);
        checker.Add(d.reserve);
        DPK_ASSERT(!checker.ContainsDup(), "Card dealt to more than one group");
        DPK_ASSERT(checker.Count() == constants::DeckSize, "Deal does not partition the deck");
#endif // DPK_ENABLE_TEST_HOOKS == true
    }

    // After a draw: still seven cards, no card held twice.
    inline auto CheckHandInvariants(std::span<Card const> hand) -> void
    {
#if DPK_ENABLE_TEST_HOOKS == false
        (void)hand;
#else
        DPK_ASSERT(hand.size() == constants::HandSize, "Hand is not seven cards");
        util::CardUniqueChecker checker{};
        checker.Add(hand);
        DPK_ASSERT(!checker.ContainsDup(), "Hand holds the same card twice");
#endif // DPK_ENABLE_TEST_HOOKS == true
    }
}
#endif //DRAWPOKER_INVARIANTS_HPP
