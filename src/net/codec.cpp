//
// codec.cpp
//
#include "codec.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <utility>
#include <vector>

#include "../core/Card.hpp"

namespace
{
    namespace fb = drawpoker::gen::net;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)drawpoker::core::Winner::Player1 == (int)fb::Winner::Player1);
    static_assert((int)drawpoker::core::Winner::None == (int)fb::Winner::None);

    auto Verified(std::span<std::byte const> const bytes)
        -> std::expected<fb::Envelope const*, drawpoker::core::net::ParseError>
    {
        using drawpoker::core::net::ParseError;
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        auto const* env = fb::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        return env;
    }

    auto Tokens(flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>> const* v)
        -> std::vector<std::string>
    {
        std::vector<std::string> out;
        if (!v) return out;
        out.reserve(v->size());
        for (flatbuffers::String const* s : *v) out.push_back(s ? s->str() : std::string{});
        return out;
    }

    auto ToFbHand(flatbuffers::FlatBufferBuilder& fbb, drawpoker::core::HandResult const& h)
        -> flatbuffers::Offset<fb::HandResultMsg>
    {
        std::vector<std::uint8_t> keys;
        for (int const k : h.HighCards()) keys.push_back(static_cast<std::uint8_t>(k));

        auto const name = fbb.CreateString(std::string(h.Name()));
        auto const cards = fbb.CreateVectorOfStrings(drawpoker::core::ToTokens(h.cards));
        auto const high = fbb.CreateVector(keys);
        return fb::CreateHandResultMsg(fbb, static_cast<std::uint8_t>(h.Rank()), name, cards, high);
    }

    auto FromFbHand(fb::HandResultMsg const* h)
        -> std::expected<drawpoker::core::net::DecodedHand, drawpoker::core::net::ParseError>
    {
        using drawpoker::core::net::ParseError;
        if (!h)
            return std::unexpected(ParseError{"missing hand result"});

        drawpoker::core::net::DecodedHand out{};
        out.rank = h->rank();
        if (out.rank < 1 || out.rank > 10)
            return std::unexpected(ParseError{std::format("hand rank {} outside 1..10", out.rank)});
        out.name = h->name() ? h->name()->str() : std::string{};

        std::vector<std::string> const tokens = Tokens(h->cards());
        try
        {
            out.cards = drawpoker::core::ParseCards(tokens);
        }
        catch (drawpoker::core::error::InvalidCardTokenError const& e)
        {
            return std::unexpected(ParseError{e.what()});
        }

        if (auto const* keys = h->high_cards())
            out.high_cards.assign(keys->begin(), keys->end());
        return out;
    }
} // anonymous

namespace drawpoker::core::net
{
    auto ToFbWinner(Winner const w) noexcept -> fb::Winner
    {
        switch (w)
        {
        case Winner::Player1: return fb::Winner::Player1;
        case Winner::Player2: return fb::Winner::Player2;
        case Winner::None: return fb::Winner::None;
        }
        return fb::Winner::None;
    }

    auto FromFbWinner(fb::Winner const w) noexcept -> Winner
    {
        switch (w)
        {
        case fb::Winner::Player1: return Winner::Player1;
        case fb::Winner::Player2: return Winner::Player2;
        case fb::Winner::None: return Winner::None;
        }
        return Winner::None;
    }

    // ---------- Deal (engine -> session manager) ----------

    auto BuildDeal(std::string_view const seed,
                   DealtHands const& dealt,
                   std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const s = fbb.CreateString(seed.data(), seed.size());
        auto const p1 = fbb.CreateVectorOfStrings(ToTokens(dealt.player1));
        auto const p2 = fbb.CreateVectorOfStrings(ToTokens(dealt.player2));
        auto const d = fb::CreateDealMsg(fbb, msg_id, s, p1, p2,
                                         static_cast<std::uint16_t>(dealt.reserve.size()));
        auto const e = fb::CreateEnvelope(fbb, fb::Message::DealMsg, d.Union());
        fbb.Finish(e);
        return fbb.Release();
    }

    // ---------- Draw request (client -> session manager) ----------

    auto BuildDrawRequest(SeatIdxT const seat,
                          std::span<int const> const discards,
                          std::size_t const reserve_cursor,
                          std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        if (reserve_cursor > std::numeric_limits<std::uint16_t>::max())
            DPK_THROW(error::Code::Serialization,
                      std::format("Reserve cursor {} does not fit the wire format", reserve_cursor));

        flatbuffers::FlatBufferBuilder fbb;
        std::vector<std::int32_t> const idx(discards.begin(), discards.end());
        auto const r = fb::CreateDrawRequestMsg(fbb, msg_id, seat, fbb.CreateVector(idx),
                                                static_cast<std::uint16_t>(reserve_cursor));
        auto const e = fb::CreateEnvelope(fbb, fb::Message::DrawRequestMsg, r.Union());
        fbb.Finish(e);
        return fbb.Release();
    }

    // ---------- Round result (engine -> session manager) ----------

    auto BuildRoundResult(RoundOutcome const& outcome,
                          std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const p1 = ToFbHand(fbb, outcome.player1_hand);
        auto const p2 = ToFbHand(fbb, outcome.player2_hand);
        auto const r = fb::CreateRoundResultMsg(fbb, msg_id, ToFbWinner(outcome.winner), outcome.is_tie, p1, p2);
        auto const e = fb::CreateEnvelope(fbb, fb::Message::RoundResultMsg, r.Union());
        fbb.Finish(e);
        return fbb.Release();
    }

    // ---------- Violation ----------

    auto BuildViolation(error::DrawViolation const& v,
                        std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fb::CreateViolation(fbb, msg_id, static_cast<std::int16_t>(v.code), txt);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::Violation, vio.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Decode ----------

    auto DecodeDeal(std::span<std::byte const> const bytes)
        -> std::expected<DecodedDeal, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::DealMsg)
            return std::unexpected(ParseError{"not a DealMsg"});

        fb::DealMsg const* d = (*env)->message_as_DealMsg();
        DecodedDeal out{};
        out.msg_id = d->msg_id();
        out.seed = d->seed() ? d->seed()->str() : std::string{};
        out.reserve_size = d->reserve_size();

        try
        {
            out.player1 = ParseCards(Tokens(d->player1()));
            out.player2 = ParseCards(Tokens(d->player2()));
        }
        catch (error::InvalidCardTokenError const& e)
        {
            return std::unexpected(ParseError{e.what()});
        }

        if (out.player1.size() != constants::HandSize || out.player2.size() != constants::HandSize)
            return std::unexpected(ParseError{"deal hands must hold seven cards each"});
        return out;
    }

    auto DecodeDrawRequest(std::span<std::byte const> const bytes)
        -> std::expected<DrawRequest, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::DrawRequestMsg)
            return std::unexpected(ParseError{"not a DrawRequestMsg"});

        fb::DrawRequestMsg const* r = (*env)->message_as_DrawRequestMsg();
        if (r->seat() > 1)
            return std::unexpected(ParseError{std::format("seat {} is not 0 or 1", r->seat())});

        DrawRequest out{};
        out.msg_id = r->msg_id();
        out.seat = r->seat();
        out.reserve_cursor = r->reserve_cursor();
        // indices are passed through as received; ApplyDraw skips the bad ones
        if (auto const* idx = r->discard_indices())
            out.discards.assign(idx->begin(), idx->end());
        return out;
    }

    auto DecodeRoundResult(std::span<std::byte const> const bytes)
        -> std::expected<DecodedRound, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::RoundResultMsg)
            return std::unexpected(ParseError{"not a RoundResultMsg"});

        fb::RoundResultMsg const* r = (*env)->message_as_RoundResultMsg();

        auto p1 = FromFbHand(r->player1());
        if (!p1) return std::unexpected(p1.error());
        auto p2 = FromFbHand(r->player2());
        if (!p2) return std::unexpected(p2.error());

        DecodedRound out{};
        out.msg_id = r->msg_id();
        out.winner = FromFbWinner(r->winner());
        out.is_tie = r->is_tie();
        out.player1 = std::move(*p1);
        out.player2 = std::move(*p2);
        return out;
    }
} // namespace drawpoker::core::net
