//
// Created by Malik T on 03/10/2026.
//

#ifndef DRAWPOKER_DECK_HPP
#define DRAWPOKER_DECK_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include "Types.hpp"

namespace drawpoker::core
{
    // Canonical order: suit-major (Hearts, Diamonds, Clubs, Spades), rank-minor (Two..Ace)
    auto BuildStandardDeck() -> Deck;

    // Rolling polynomial hash (h * 31 + byte), wrapping at 32 bits.
    auto HashSeed(std::string_view seed) noexcept -> std::uint32_t;

    // Not cryptographically secure. The arithmetic is fixed so a seed replays
    // the same sequence everywhere.
    class SeededRandom
    {
    public:
        explicit SeededRandom(std::string_view seed) noexcept;

        // x = (x * 1103515245 + 12345) mod 2^31
        auto NextRaw() noexcept -> std::uint32_t;
        // NextRaw() / 2^31, always in [0,1)
        auto Next() noexcept -> double;

    private:
        std::uint32_t state_;
    };

    // Fisher-Yates driven by SeededRandom; the input is left untouched.
    auto Shuffle(Deck const& deck, std::string_view seed) -> Deck;

    // "poker-<unix millis>-<base36 entropy>"
    auto GenerateRoundSeed() -> std::string;
    auto GenerateRoundSeed(std::chrono::system_clock::time_point now, std::uint64_t entropy) -> std::string;
}

#endif //DRAWPOKER_DECK_HPP
