//
// Created by Malik T on 02/10/2026.
//

#ifndef DRAWPOKER_OMEGAEXCEPTION_HPP
#define DRAWPOKER_OMEGAEXCEPTION_HPP

#include <concepts>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace drawpoker::core
{
    // Error codes that can name themselves through an ADL to_string()
    template <typename T>
    concept NamedCode = std::is_enum_v<T> && requires(T c)
    {
        { to_string(c) } -> std::convertible_to<std::string_view>;
    };

    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        // "Code(3)" for named codes, the bare number otherwise
        [[nodiscard]]
        auto code_str() const -> std::string
        {
            if constexpr (NamedCode<T>)
                return std::format("{}({})", to_string(usr_data_), std::to_underlying(usr_data_));
            else if constexpr (std::is_enum_v<T>)
                return std::format("{}", std::to_underlying(usr_data_));
            else
                return std::format("{}", usr_data_);
        }

        // Throw site, one line
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            return std::format("at {}:{} in `{}`", src_loc_.file_name(), src_loc_.line(), src_loc_.function_name());
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
    };
}

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<drawpoker::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(drawpoker::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string const s = std::format("[drawpoker] error {}: {}\n  {}\n", p.code_str(), p.what(), p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //DRAWPOKER_OMEGAEXCEPTION_HPP
