#include <gtest/gtest.h>
#include <array>
#include <string>
#include <vector>

#include "../core/Card.hpp"
#include "../core/Dealer.hpp"
#include "../core/Exception.hpp"
#include "../core/HandEvaluator.hpp"
#include "../core/Round.hpp"
#include "../core/Types.hpp"

using namespace drawpoker::core;

namespace
{
    auto H(std::vector<std::string> const& tokens) -> std::vector<Card>
    {
        return ParseCards(tokens);
    }

    auto Sign(int const v) -> int
    {
        return (v > 0) - (v < 0);
    }

    // A spread of best hands drawn from seeded deals
    auto SampleHands(int const n) -> std::vector<HandResult>
    {
        std::vector<HandResult> out;
        for (int i = 0; i < n; ++i)
        {
            DealtHands const d = DealHands("sample-" + std::to_string(i));
            out.push_back(BestHand(d.player1));
            out.push_back(BestHand(d.player2));
        }
        return out;
    }
}

TEST(CompareHands, Category_Dominates_Keys)
{
    HandResult const pair = Evaluate(H({"2H", "2D", "3C", "4S", "6H"}));
    HandResult const ace_high = Evaluate(H({"AH", "KD", "QC", "JS", "9H"}));
    EXPECT_GT(CompareHands(pair, ace_high), 0);
    EXPECT_LT(CompareHands(ace_high, pair), 0);

    HandResult const low_straight = Evaluate(H({"AS", "2D", "3C", "4H", "5S"}));
    HandResult const trip_aces = Evaluate(H({"AH", "AD", "AC", "KS", "QH"}));
    EXPECT_GT(CompareHands(low_straight, trip_aces), 0);
}

TEST(CompareHands, Kickers_Break_Ties)
{
    HandResult const a = Evaluate(H({"8H", "8D", "AC", "5S", "3H"}));
    HandResult const b = Evaluate(H({"8C", "8S", "KC", "QS", "JH"}));
    EXPECT_GT(CompareHands(a, b), 0);

    HandResult const low_pair = Evaluate(H({"JH", "JD", "4C", "4S", "2H"}));
    HandResult const hi_pair = Evaluate(H({"JC", "JS", "5C", "5S", "2D"}));
    EXPECT_LT(CompareHands(low_pair, hi_pair), 0);

    HandResult const wheel = Evaluate(H({"AS", "2D", "3C", "4H", "5S"}));
    HandResult const six = Evaluate(H({"2S", "3D", "4C", "5H", "6S"}));
    EXPECT_LT(CompareHands(wheel, six), 0);
}

TEST(CompareHands, Suits_Never_Break_Ties)
{
    HandResult const hearts = Evaluate(H({"AH", "KH", "9D", "7C", "3S"}));
    HandResult const spades = Evaluate(H({"AS", "KS", "9C", "7D", "3H"}));
    EXPECT_EQ(CompareHands(hearts, spades), 0);

    HandResult const royal1 = Evaluate(H({"AH", "KH", "QH", "JH", "10H"}));
    HandResult const royal2 = Evaluate(H({"AS", "KS", "QS", "JS", "10S"}));
    EXPECT_EQ(CompareHands(royal1, royal2), 0);
}

TEST(CompareHands, Strict_Weak_Ordering)
{
    std::vector<HandResult> const hands = SampleHands(40);
    for (HandResult const& a : hands)
    {
        EXPECT_EQ(CompareHands(a, a), 0);
        for (HandResult const& b : hands)
        {
            ASSERT_EQ(Sign(CompareHands(a, b)), -Sign(CompareHands(b, a)));
        }
    }

    for (HandResult const& a : hands)
    for (HandResult const& b : hands)
    {
        if (CompareHands(a, b) > 0) continue;
        for (HandResult const& c : hands)
        {
            // a <= b and b <= c implies a <= c
            if (CompareHands(b, c) <= 0) ASSERT_LE(CompareHands(a, c), 0);
        }
    }
}

TEST(BestHand, Matches_Seven_Card_Evaluate)
{
    for (int i = 0; i < 300; ++i)
    {
        DealtHands const d = DealHands("cross-" + std::to_string(i));
        for (Hand const* h : {&d.player1, &d.player2})
        {
            HandResult const best = BestHand(*h);
            HandResult const direct = Evaluate(*h);
            ASSERT_EQ(CompareHands(best, direct), 0) << i;
            ASSERT_EQ(best.Category(), direct.Category());
        }
    }
}

TEST(BestHand, No_Subset_Beats_It)
{
    std::vector<Card> const fixed = H({"KD", "AH", "AD", "7C", "AS", "KH", "2C"});
    HandResult const fh = BestHand(fixed);
    EXPECT_EQ(fh.Category(), HandCategory::FullHouse);
    EXPECT_EQ(fh.HighCards(), (std::vector<int>{14, 13}));

    for (int i = 0; i < 300; ++i)
    {
        DealtHands const dealt = DealHands("cross-" + std::to_string(i));
        for (Hand const* h : {&dealt.player1, &dealt.player2})
        {
            Hand const& cards = *h;
            HandResult const best = BestHand(cards);
            bool reached = false;

            std::array<Card, 5> combo{};
            for (std::size_t a = 0; a < cards.size(); ++a)
            for (std::size_t b = a + 1; b < cards.size(); ++b)
            for (std::size_t c = b + 1; c < cards.size(); ++c)
            for (std::size_t d = c + 1; d < cards.size(); ++d)
            for (std::size_t e = d + 1; e < cards.size(); ++e)
            {
                combo = {cards[a], cards[b], cards[c], cards[d], cards[e]};
                int const cmp = CompareHands(Evaluate(combo), best);
                ASSERT_LE(cmp, 0) << "deal " << i;
                reached = reached || cmp == 0;
            }
            // the best hand is one of the subsets, not just an upper bound
            EXPECT_TRUE(reached) << "deal " << i;
        }
    }
}

TEST(BestHand, First_Maximal_Subset_Wins)
{
    // Both kings complete the same quads; the earlier subset keeps its king
    HandResult const a = BestHand(H({"AH", "AD", "AC", "AS", "KH", "KD", "2C"}));
    EXPECT_EQ(ToTokens(a.cards), (std::vector<std::string>{"AH", "AD", "AC", "AS", "KH"}));

    HandResult const b = BestHand(H({"KD", "AH", "AD", "AC", "AS", "KH", "2C"}));
    EXPECT_EQ(ToTokens(b.cards), (std::vector<std::string>{"AH", "AD", "AC", "AS", "KD"}));
}

TEST(BestHand, Five_Cards_Is_Evaluate)
{
    std::vector<Card> const five = H({"9S", "9D", "4C", "4H", "4S"});
    HandResult const best = BestHand(five);
    HandResult const direct = Evaluate(five);
    EXPECT_EQ(best.HighCards(), direct.HighCards());
    EXPECT_TRUE(best.cards == direct.cards);
}

TEST(ResolveRound, Reference_Deal_Without_Draws)
{
    DealtHands const d = DealHands("poker-seed-42");
    RoundOutcome const out = ResolveRound(d.player1, d.player2);

    EXPECT_EQ(out.player1_hand.Category(), HandCategory::Pair);
    EXPECT_EQ(out.player1_hand.HighCards(), (std::vector<int>{5, 12, 9, 7}));
    EXPECT_EQ(out.player2_hand.Category(), HandCategory::TwoPair);
    EXPECT_EQ(out.player2_hand.HighCards(), (std::vector<int>{13, 3, 11}));
    EXPECT_EQ(out.winner, Winner::Player2);
    EXPECT_FALSE(out.is_tie);
    EXPECT_EQ(to_string(out.winner), "player2");
}

TEST(ResolveRound, Player1_Wins)
{
    RoundOutcome const out = ResolveRound(H({"AH", "KH", "QH", "JH", "10H", "2C", "3D"}),
                                          H({"2H", "2D", "2C", "2S", "9H", "5D", "3C"}));
    EXPECT_EQ(out.winner, Winner::Player1);
    EXPECT_FALSE(out.is_tie);
    EXPECT_EQ(out.player1_hand.Name(), "Royal Flush");
    EXPECT_EQ(out.player2_hand.Name(), "Four of a Kind");
}

TEST(ResolveRound, Identical_Ranks_Tie)
{
    RoundOutcome const out = ResolveRound(H({"AH", "KD", "9C", "7S", "5H", "3D", "2C"}),
                                          H({"AS", "KC", "9D", "7H", "5C", "3S", "2D"}));
    EXPECT_TRUE(out.is_tie);
    EXPECT_EQ(out.winner, Winner::None);
    EXPECT_EQ(to_string(out.winner), "none");
}

TEST(ResolveRound, Short_Hand_Throws)
{
    EXPECT_THROW((void)ResolveRound(H({"AH", "KD", "9C"}), H({"AS", "KC", "9D", "7H", "5C"})),
                 error::InsufficientCardsError);
}

TEST(MatchRules, Constants)
{
    EXPECT_EQ(constants::WinsToWinMatch, 10u);
    EXPECT_EQ(constants::MaxRounds, 19u);
}

TEST(PointsAwarded, Difference_Of_Wins)
{
    EXPECT_EQ(PointsAwarded(10, 4), 6u);
    EXPECT_EQ(PointsAwarded(10, 9), 1u);
    EXPECT_EQ(PointsAwarded(7, 7), 0u);
    EXPECT_THROW((void)PointsAwarded(3, 5), error::AssertionError);
}
