#include <gtest/gtest.h>
#include <array>
#include <string>
#include <vector>

#include "../core/Card.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

using namespace drawpoker::core;

TEST(CardModel, Enumerations_Are_Complete_And_Ordered)
{
    constexpr auto ranks = AllRanks();
    constexpr auto suits = AllSuits();
    ASSERT_EQ(ranks.size(), 13u);
    ASSERT_EQ(suits.size(), 4u);

    for (std::size_t i{}; i < ranks.size(); ++i)
    {
        EXPECT_EQ(RankValue(ranks[i]), static_cast<int>(i) + 2);
    }
    EXPECT_EQ(RankValue(Rank::Ten), 10);
    EXPECT_EQ(RankValue(Rank::Jack), 11);
    EXPECT_EQ(RankValue(Rank::Ace), 14);
}

TEST(CardModel, ToToken_UsesUpperCaseSuitInitial)
{
    EXPECT_EQ(ToToken(Card{Suit::Hearts, Rank::Ten}), "10H");
    EXPECT_EQ(ToToken(Card{Suit::Spades, Rank::Ace}), "AS");
    EXPECT_EQ(ToToken(Card{Suit::Diamonds, Rank::Two}), "2D");
    EXPECT_EQ(ToToken(Card{Suit::Clubs, Rank::Queen}), "QC");
}

TEST(CardModel, ParseCard_AcceptsEitherCase)
{
    EXPECT_EQ(ParseCard("10H"), (Card{Suit::Hearts, Rank::Ten}));
    EXPECT_EQ(ParseCard("10h"), (Card{Suit::Hearts, Rank::Ten}));
    EXPECT_EQ(ParseCard("as"), (Card{Suit::Spades, Rank::Ace}));
    EXPECT_EQ(ParseCard("kD"), (Card{Suit::Diamonds, Rank::King}));
    EXPECT_EQ(ParseCard("7c"), (Card{Suit::Clubs, Rank::Seven}));
}

TEST(CardModel, Every_Card_Survives_A_Token_Trip)
{
    for (Suit const s : AllSuits())
    {
        for (Rank const r : AllRanks())
        {
            Card const c{s, r};
            EXPECT_EQ(ParseCard(ToToken(c)), c) << ToToken(c);
        }
    }
}

TEST(CardModel, Malformed_Tokens_Throw_InvalidCardToken)
{
    for (std::string const bad : {"", "H", "1H", "11H", "10X", "ZH", "TH", "100H", "A", "AH ", "0S"})
    {
        EXPECT_THROW((void)ParseCard(bad), error::InvalidCardTokenError) << "token '" << bad << "'";
    }

    try
    {
        (void)ParseCard("9Z");
        FAIL() << "expected a throw";
    }
    catch (error::InvalidCardTokenError const& e)
    {
        EXPECT_EQ(e.data(), error::Code::InvalidCardToken);
        EXPECT_NE(e.what().find("9Z"), std::string::npos);
    }
}

TEST(CardModel, Batch_Conversion_Keeps_Order)
{
    std::vector<std::string> const tokens{"AH", "KH", "QH", "JH", "10H"};
    std::vector<Card> const cards = ParseCards(tokens);
    ASSERT_EQ(cards.size(), tokens.size());
    EXPECT_EQ(cards.front(), (Card{Suit::Hearts, Rank::Ace}));
    EXPECT_EQ(cards.back(), (Card{Suit::Hearts, Rank::Ten}));
    EXPECT_EQ(ToTokens(cards), tokens);

    std::vector<std::string> const mixed{"AH", "QQ"};
    EXPECT_THROW((void)ParseCards(mixed), error::InvalidCardTokenError);
}
