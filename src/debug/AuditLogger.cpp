#include "AuditLogger.hpp"

#include <format>
#include <utility>
#include <vector>

#include "../core/Card.hpp"

using namespace drawpoker::core;

namespace
{

auto s_cards(std::span<Card const> const cards) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < cards.size(); ++i)
    {
        body += (i ? "," : "");
        body += ToToken(cards[i]);
    }
    return body;
}

auto s_ints(std::span<int const> const xs) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < xs.size(); ++i)
    {
        body += (i ? "," : "");
        body += std::format("{}", xs[i]);
    }
    return body;
}

auto s_hand(HandResult const& h) -> std::string
{
    std::vector<int> const keys = h.HighCards();
    return std::format("{}({}) cards=[{}] keys=[{}]",
                       h.Name(), h.Rank(), s_cards(h.cards), s_ints(keys));
}

} // anonymous namespace

namespace drawpoker::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(std::string_view const seed, DealtHands const& dealt) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Deal P1=[{}]\n", s_cards(dealt.player1));
    out_ << std::format("Deal P2=[{}]\n", s_cards(dealt.player2));
    out_ << std::format("Reserve={}\n", dealt.reserve.size());
    out_.flush();
}

auto AuditLogger::draw(SeatIdxT const seat,
                       std::span<int const> const discards,
                       std::size_t const reserve_cursor,
                       std::span<Card const> const hand) -> void
{
    out_ << std::format("Draw P{} discards=[{}] cursor={} hand=[{}]\n",
                        static_cast<int>(seat) + 1,
                        s_ints(discards),
                        reserve_cursor,
                        s_cards(hand));
}

auto AuditLogger::outcome(RoundOutcome const& r) -> void
{
    out_ << std::format("Best P1 {}\n", s_hand(r.player1_hand));
    out_ << std::format("Best P2 {}\n", s_hand(r.player2_hand));
    out_ << std::format("Winner={} Tie={}\n", to_string(r.winner), r.is_tie ? 1 : 0);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace drawpoker::core::debug
