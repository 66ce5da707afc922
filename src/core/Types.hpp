//
// Created by Malik T on 02/10/2026.
//

#ifndef DRAWPOKER_TYPES_HPP
#define DRAWPOKER_TYPES_HPP

#define DPK_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace drawpoker::core::constants
{
    inline constexpr std::size_t DeckSize = 52;
    inline constexpr std::size_t HandSize = 7;
    inline constexpr std::size_t EvalSize = 5;
    inline constexpr std::size_t ReserveSize = DeckSize - 2 * HandSize;
    // Shape limit for a single draw request (see ValidateDiscards)
    inline constexpr std::size_t MaxDiscards = 5;

    // Match rules, read by the session manager; nothing in the engine enforces them.
    inline constexpr std::uint32_t WinsToWinMatch = 10;
    inline constexpr std::uint32_t MaxRounds = 19;
}

namespace drawpoker::core
{
    enum class Suit : std::uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades
    };
    enum class Rank : std::uint8_t
    {
        Two = 0,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace
    };
    inline constexpr std::size_t SuitCount = 4;
    inline constexpr std::size_t RankCount = 13;

    struct Card
    {
        Suit suit{};
        Rank rank{};
    };
    inline constexpr auto operator==(Card const& a, Card const& b) -> bool
    {
        return a.suit == b.suit && a.rank == b.rank;
    }

    using Deck = std::vector<Card>;
    using Hand = std::vector<Card>;
    using SeatIdxT = std::uint8_t;

    struct Config
    {
        std::string seed{};
        std::vector<int> p1_discards{};
        std::vector<int> p2_discards{};
        // empty = no transcript
        std::string audit_path{};
    };
}

#endif //DRAWPOKER_TYPES_HPP
