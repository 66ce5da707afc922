//
// Created by Malik T on 07/10/2026.
//

#ifndef DRAWPOKER_UTIL_HPP
#define DRAWPOKER_UTIL_HPP

#include <cstdint>
#include <span>
#include "Types.hpp"

namespace drawpoker::core::util
{
    inline auto CardToUID(Card const& c) -> std::uint64_t
    {
        return static_cast<std::uint64_t>(c.suit) * RankCount + static_cast<std::uint64_t>(c.rank);
    }

    // 52 cards fit one bit each
    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), count_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            std::uint64_t const card = std::uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
            ++count_;
        }
        auto Add(std::span<Card const> cs) -> void
        {
            for (Card const& c : cs) Add(c);
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Count() const -> std::size_t
        {
            return count_;
        }
    private:
        std::uint64_t cards_;
        std::size_t count_;
        bool contains_dup_;
    };
}

#endif //DRAWPOKER_UTIL_HPP
