//
// Created by Malik T on 02/10/2026.
//

#ifndef DRAWPOKER_EXCEPTION_HPP
#define DRAWPOKER_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace drawpoker::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        InsufficientCards, // evaluation asked for with fewer than five cards
        InvalidCardToken, // malformed card string from the outside world
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed / engine misuse
    };

    inline auto to_string(Code const c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "Unknown";
        case Code::InsufficientCards: return "InsufficientCards";
        case Code::InvalidCardToken: return "InvalidCardToken";
        case Code::Serialization: return "Serialization";
        case Code::Assertion: return "Assertion";
        }
        return "Unknown";
    }

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InsufficientCardsError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidCardTokenError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::InsufficientCards: throw InsufficientCardsError(std::move(msg), c, loc);
        case Code::InvalidCardToken: throw InvalidCardTokenError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define DPK_THROW(code_enum, msg) ::drawpoker::core::error::fail((code_enum), (msg))
#define DPK_ASSERT(cond, msg) do { if(!(cond)) ::drawpoker::core::error::fail(::drawpoker::core::error::Code::Assertion, (msg)); } while(0)

    // Reasons a draw request is refused before it reaches ApplyDraw.
    enum class DrawViolationCode : std::uint16_t
    {
        TooManyDiscards,
        IndexOutOfRange
    };

    struct DrawViolation
    {
        DrawViolationCode code{};
        std::optional<SeatIdxT> seat{};

        std::optional<std::uint8_t> attempted_count{}; // number of discards asked for
        std::optional<std::uint8_t> allowed_count{};
        std::optional<int> index{}; // offending index, as received
        std::optional<std::uint8_t> position{}; // where in the request it sat

        auto with_seat(SeatIdxT s) -> DrawViolation&
        {
            seat = s;
            return *this;
        }

        auto with_attempted(std::uint8_t v) -> DrawViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_allowed(std::uint8_t v) -> DrawViolation&
        {
            allowed_count = v;
            return *this;
        }

        auto with_index(int v) -> DrawViolation&
        {
            index = v;
            return *this;
        }

        auto with_position(std::uint8_t v) -> DrawViolation&
        {
            position = v;
            return *this;
        }
    };

    inline auto to_string(DrawViolationCode c) -> std::string_view
    {
        using E = DrawViolationCode;
        switch (c)
        {
        case E::TooManyDiscards: return "Draw: too many discards";
        case E::IndexOutOfRange: return "Draw: discard index outside the hand";
        }
        return "Unknown";
    }

    inline auto describe(DrawViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.seat) s += std::format(" | seat=P{}", static_cast<int>(*v.seat) + 1);
        if (v.attempted_count) s += std::format(" | attempted={}", *v.attempted_count);
        if (v.allowed_count) s += std::format(" | allowed={}", *v.allowed_count);
        if (v.index) s += std::format(" | index={}", *v.index);
        if (v.position) s += std::format(" | at={}", *v.position);
        return s;
    }

    using ValidateResult = std::expected<void, DrawViolation>;
}

#endif //DRAWPOKER_EXCEPTION_HPP
