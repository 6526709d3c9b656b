//
// OmegaException.hpp
//

#ifndef MEMSCRAMBLE_OMEGAEXCEPTION_HPP
#define MEMSCRAMBLE_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace scramble::core
{
    // Hard failure carrying a payload, the throw site and the stack at the throw.
    // Only used for engine misuse and broken invariants; rule outcomes travel as
    // std::expected values instead.
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

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            // the innermost frames belong to the throw helpers
            std::size_t skip = 0;
            for (auto const& frame : backtrace_)
            {
                if (skip++ < 2) continue;
                s += std::format("{}({}):{}\n", frame.source_file(), frame.source_line(), frame.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

template <class T>
struct std::formatter<scramble::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(scramble::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed with code ({}): {}\n{}", static_cast<int>(p.data()), p.what(),
                                    p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //MEMSCRAMBLE_OMEGAEXCEPTION_HPP
