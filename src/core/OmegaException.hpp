//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_OMEGAEXCEPTION_HPP
#define FASTTRACK_OMEGAEXCEPTION_HPP
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include "Types.hpp"

namespace fasttrack::core
{
    // Exception carrying a payload (usually an error::Code) together with where it was raised.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        // Origin plus the captured frames, minus the runtime's own entry frames.
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            std::size_t const shown = backtrace_.size() > RuntimeFrames ? backtrace_.size() - RuntimeFrames : 0;
            for (std::size_t i{}; i < shown; ++i)
            {
                auto const& frame = backtrace_[i];
                s += std::format("{}({}):{}\n", frame.source_file(), frame.source_line(), frame.description());
            }
            return s;
        }

    private:
        static constexpr std::size_t RuntimeFrames = 3;

        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

//lets std::print take the exception directly
template <class T>
struct std::formatter<fasttrack::core::OmegaException<T>> : std::formatter<std::string_view>
{
    constexpr auto parse(std::format_parse_context& ctx)
    {
        return std::formatter<std::string_view>::parse(ctx);
    }

    template <class FormatContext>
    auto format(fasttrack::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Engine fault with code ({}): {}\n{}\n", static_cast<int>(p.data()), p.what(),
                                    p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //FASTTRACK_OMEGAEXCEPTION_HPP
