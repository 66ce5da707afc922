//
// Created by Malik T on 03/10/2026.
//

#include "Deck.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <random>
#include <utility>
#include "Card.hpp"
#include "Exception.hpp"

namespace drawpoker::core
{
    namespace
    {
        constexpr std::uint64_t LcgMul = 1103515245ULL;
        constexpr std::uint64_t LcgInc = 12345ULL;
        constexpr std::uint32_t Mask31 = 0x7fffffffU;
        constexpr double Two31 = 2147483648.0;

        auto ToBase36(std::uint64_t v) -> std::string
        {
            constexpr std::string_view digits = "0123456789abcdefghijklmnopqrstuvwxyz";
            if (v == 0) return "0";
            std::string out;
            while (v != 0)
            {
                out.push_back(digits[v % 36]);
                v /= 36;
            }
            std::ranges::reverse(out);
            return out;
        }
    }

    auto BuildStandardDeck() -> Deck
    {
        Deck deck;
        deck.reserve(constants::DeckSize);
        for (Suit const s : AllSuits())
        {
            for (Rank const r : AllRanks())
            {
                deck.push_back(Card{s, r});
            }
        }
        return deck;
    }

    auto HashSeed(std::string_view const seed) noexcept -> std::uint32_t
    {
        std::uint32_t hash{0};
        for (char const ch : seed)
        {
            hash = hash * 31U + static_cast<std::uint32_t>(static_cast<unsigned char>(ch));
        }
        return hash;
    }

    SeededRandom::SeededRandom(std::string_view const seed) noexcept :
        state_{HashSeed(seed)}
    {
    }

    auto SeededRandom::NextRaw() noexcept -> std::uint32_t
    {
        // only the low 31 bits survive, so the 64-bit product never needs signed handling
        state_ = static_cast<std::uint32_t>((static_cast<std::uint64_t>(state_) * LcgMul + LcgInc) & Mask31);
        return state_;
    }

    auto SeededRandom::Next() noexcept -> double
    {
        return static_cast<double>(NextRaw()) / Two31;
    }

    auto Shuffle(Deck const& deck, std::string_view const seed) -> Deck
    {
        Deck shuffled{deck};
        if (shuffled.size() < 2) return shuffled;

        SeededRandom random{seed};
        for (std::size_t i = shuffled.size() - 1; i > 0; --i)
        {
            auto const j = static_cast<std::size_t>(std::floor(random.Next() * static_cast<double>(i + 1)));
            DPK_ASSERT(j <= i, "Shuffle swap index escaped the unshuffled prefix");
            std::swap(shuffled[i], shuffled[j]);
        }
        return shuffled;
    }

    auto GenerateRoundSeed(std::chrono::system_clock::time_point const now, std::uint64_t const entropy)
        -> std::string
    {
        auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
        return std::format("poker-{}-{}", millis, ToBase36(entropy));
    }

    auto GenerateRoundSeed() -> std::string
    {
        std::random_device rd{};
        std::uint64_t const entropy = (static_cast<std::uint64_t>(rd()) << 32) | rd();
        return GenerateRoundSeed(std::chrono::system_clock::now(), entropy);
    }
}
