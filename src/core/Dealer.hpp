//
// Created by Malik T on 03/10/2026.
//

#ifndef DRAWPOKER_DEALER_HPP
#define DRAWPOKER_DEALER_HPP

#include <cstddef>
#include <span>
#include <string_view>
#include "Types.hpp"
#include "Exception.hpp"

namespace drawpoker::core
{
    struct DealtHands
    {
        Hand player1;               // shuffled [0,7)
        Hand player2;               // shuffled [7,14)
        std::vector<Card> reserve;  // shuffled [14,52), feeds the draw phase
    };

    auto DealHands(std::string_view seed) -> DealtHands;

    // Replaces hand[discards[i]] with reserve[cursor + i]. Entries whose index is outside
    // [0,7) or whose reserve slot is past the end are skipped, never rejected.
    auto ApplyDraw(std::span<Card const> hand,
                   std::span<int const> discards,
                   std::span<Card const> reserve,
                   std::size_t reserve_cursor) -> Hand;

    // Both seats draw from one reserve; the second drawer starts after the first drawer's discards.
    inline auto ReserveCursorAfter(std::span<int const> first_discards) noexcept -> std::size_t
    {
        return first_discards.size();
    }

    // Request-shape check for a session manager; ApplyDraw does not call it.
    auto ValidateDiscards(SeatIdxT seat, std::span<int const> discards) -> error::ValidateResult;
}

#endif //DRAWPOKER_DEALER_HPP
