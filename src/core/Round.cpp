//
// Created by Malik T on 06/10/2026.
//

#include "Round.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include <vector>
#include "Exception.hpp"
#include "HandEvaluator.hpp"

namespace drawpoker::core
{
    auto CompareHands(HandResult const& a, HandResult const& b) -> int
    {
        if (a.Rank() != b.Rank()) return a.Rank() - b.Rank();

        std::vector<int> const ka = a.HighCards();
        std::vector<int> const kb = b.HighCards();
        std::size_t const n = std::min(ka.size(), kb.size());
        for (std::size_t i{}; i < n; ++i)
        {
            if (ka[i] != kb[i]) return ka[i] - kb[i];
        }
        return 0;
    }

    auto ResolveRound(std::span<Card const> const player1_cards,
                      std::span<Card const> const player2_cards) -> RoundOutcome
    {
        HandResult p1 = BestHand(player1_cards);
        HandResult p2 = BestHand(player2_cards);
        int const cmp = CompareHands(p1, p2);

        RoundOutcome out{
            .winner = cmp > 0 ? Winner::Player1 : (cmp < 0 ? Winner::Player2 : Winner::None),
            .player1_hand = std::move(p1),
            .player2_hand = std::move(p2),
            .is_tie = cmp == 0
        };
        return out;
    }

    auto PointsAwarded(std::uint32_t const winner_wins, std::uint32_t const loser_wins) -> std::uint32_t
    {
        DPK_ASSERT(winner_wins >= loser_wins,
                   std::format("Match winner has fewer wins ({}) than the loser ({})", winner_wins, loser_wins));
        return winner_wins - loser_wins;
    }
}
