//
// Created by Malik T on 09/10/2026.
//

#ifndef DRAWPOKER_CODEC_HPP
#define DRAWPOKER_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Dealer.hpp"
#include "../core/Round.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/drawpoker_net_generated.h"

namespace drawpoker::core::net
{
    // Lightweight local parse error
    struct ParseError
    {
        std::string message;
    };

    struct DecodedDeal
    {
        std::uint64_t msg_id{};
        std::string seed;
        Hand player1;
        Hand player2;
        std::uint16_t reserve_size{};
    };

    struct DrawRequest
    {
        std::uint64_t msg_id{};
        SeatIdxT seat{};
        std::vector<int> discards;
        std::size_t reserve_cursor{};
    };

    // HandResult as it crossed the wire; only tokens and keys survive.
    struct DecodedHand
    {
        int rank{};
        std::string name;
        std::vector<Card> cards;
        std::vector<int> high_cards;
    };

    struct DecodedRound
    {
        std::uint64_t msg_id{};
        Winner winner{Winner::None};
        bool is_tie{false};
        DecodedHand player1;
        DecodedHand player2;
    };

    auto ToFbWinner(Winner w) noexcept -> drawpoker::gen::net::Winner;
    auto FromFbWinner(drawpoker::gen::net::Winner w) noexcept -> Winner;

    // --- Outbound builders ---

    auto BuildDeal(std::string_view seed,
                   DealtHands const& dealt,
                   std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildDrawRequest(SeatIdxT seat,
                          std::span<int const> discards,
                          std::size_t reserve_cursor,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildRoundResult(RoundOutcome const& outcome,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::DrawViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified envelope -> engine values) ---

    auto DecodeDeal(std::span<std::byte const> bytes)
        -> std::expected<DecodedDeal, ParseError>;

    auto DecodeDrawRequest(std::span<std::byte const> bytes)
        -> std::expected<DrawRequest, ParseError>;

    auto DecodeRoundResult(std::span<std::byte const> bytes)
        -> std::expected<DecodedRound, ParseError>;
} // namespace drawpoker::core::net


#endif //DRAWPOKER_CODEC_HPP
