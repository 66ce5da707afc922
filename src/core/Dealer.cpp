//
// Created by Malik T on 03/10/2026.
//

#include "Dealer.hpp"

#include <algorithm>
#include "Deck.hpp"

namespace
{
    inline auto Viol(drawpoker::core::error::DrawViolationCode code) -> drawpoker::core::error::DrawViolation
    {
        return drawpoker::core::error::DrawViolation{ .code = code };
    }
}

namespace drawpoker::core
{
    auto DealHands(std::string_view const seed) -> DealtHands
    {
        Deck const deck = Shuffle(BuildStandardDeck(), seed);
        DPK_ASSERT(deck.size() == constants::DeckSize, "Shuffled deck lost or gained cards");

        auto const p1_end = deck.begin() + constants::HandSize;
        auto const p2_end = p1_end + constants::HandSize;

        DealtHands dealt{};
        dealt.player1.assign(deck.begin(), p1_end);
        dealt.player2.assign(p1_end, p2_end);
        dealt.reserve.assign(p2_end, deck.end());
        return dealt;
    }

    auto ApplyDraw(std::span<Card const> const hand,
                   std::span<int const> const discards,
                   std::span<Card const> const reserve,
                   std::size_t const reserve_cursor) -> Hand
    {
        DPK_ASSERT(hand.size() == constants::HandSize, "Draw applied to a hand that is not seven cards");

        Hand out(hand.begin(), hand.end());
        for (std::size_t i{}; i < discards.size(); ++i)
        {
            int const idx = discards[i];
            if (idx < 0 || static_cast<std::size_t>(idx) >= constants::HandSize) continue;
            // cursor + i can wrap; measure against the unread part of the reserve
            if (reserve_cursor >= reserve.size() || i >= reserve.size() - reserve_cursor) continue;
            out[static_cast<std::size_t>(idx)] = reserve[reserve_cursor + i];
        }
        return out;
    }

    auto ValidateDiscards(SeatIdxT const seat, std::span<int const> const discards) -> error::ValidateResult
    {
        using DVC = error::DrawViolationCode;

        if (discards.size() > constants::MaxDiscards)
            return std::unexpected(Viol(DVC::TooManyDiscards)
                                   .with_seat(seat)
                                   .with_attempted(static_cast<std::uint8_t>(std::min<std::size_t>(discards.size(), 255)))
                                   .with_allowed(static_cast<std::uint8_t>(constants::MaxDiscards)));

        for (std::size_t i{}; i < discards.size(); ++i)
        {
            int const idx = discards[i];
            if (idx < 0 || static_cast<std::size_t>(idx) >= constants::HandSize)
                return std::unexpected(Viol(DVC::IndexOutOfRange)
                                       .with_seat(seat)
                                       .with_index(idx)
                                       .with_position(static_cast<std::uint8_t>(i)));
        }
        return {};
    }
}
