//
// Created by Malik T on 06/10/2026.
//

#ifndef DRAWPOKER_ROUND_HPP
#define DRAWPOKER_ROUND_HPP

#include <cstdint>
#include <span>
#include <string_view>
#include "HandResult.hpp"
#include "Types.hpp"

namespace drawpoker::core
{
    enum class Winner : std::uint8_t
    {
        Player1,
        Player2,
        None
    };

    inline auto to_string(Winner const w) -> std::string_view
    {
        switch (w)
        {
        case Winner::Player1: return "player1";
        case Winner::Player2: return "player2";
        case Winner::None: return "none";
        }
        return "none";
    }

    struct RoundOutcome
    {
        Winner winner{Winner::None};
        HandResult player1_hand;
        HandResult player2_hand;
        bool is_tie{false};
    };

    // <0, 0, >0 like a three-way compare: category rank first, then the tie-break keys
    // element by element. Strict weak ordering over HandResult.
    auto CompareHands(HandResult const& a, HandResult const& b) -> int;

    auto ResolveRound(std::span<Card const> player1_cards,
                      std::span<Card const> player2_cards) -> RoundOutcome;

    // Points for the match winner once a match concludes.
    auto PointsAwarded(std::uint32_t winner_wins, std::uint32_t loser_wins) -> std::uint32_t;
}

#endif //DRAWPOKER_ROUND_HPP
