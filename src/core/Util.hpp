//
// Util.hpp
//

#ifndef MEMSCRAMBLE_UTIL_HPP
#define MEMSCRAMBLE_UTIL_HPP

#include <charconv>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include "Exception.hpp"
#include "Types.hpp"

namespace scramble::core::util
{
    // "<row>x<col>" -> Location, for callers that receive locations as text; the
    // board itself only takes Location values. Both parts must be plain
    // non-negative decimals.
    inline auto ParseLocation(std::string_view token) -> std::expected<Location, error::Violation>
    {
        auto const bad = [] { return std::unexpected(error::Viol(error::ViolationCode::InvalidLocation)); };

        std::size_t const sep = token.find(constants::LocationSeparator);
        if (sep == std::string_view::npos || sep == 0 || sep + 1 >= token.size()) return bad();

        auto parse_part = [](std::string_view part, int& out) -> bool
        {
            char const* first = part.data();
            char const* last = part.data() + part.size();
            auto const res = std::from_chars(first, last, out);
            return res.ec == std::errc{} && res.ptr == last && out >= 0;
        };

        Location loc{};
        if (!parse_part(token.substr(0, sep), loc.row)) return bad();
        if (!parse_part(token.substr(sep + 1), loc.col)) return bad();
        return loc;
    }

    inline auto InBounds(Location const& l, int rows, int cols) noexcept -> bool
    {
        return l.row >= 0 && l.col >= 0 && l.row < rows && l.col < cols;
    }

    inline auto JoinLines(std::span<std::string const> lines) -> std::string
    {
        std::string out;
        for (std::size_t i{}; i < lines.size(); ++i)
        {
            out += (i ? "\n" : "");
            out += lines[i];
        }
        return out;
    }
}

#endif //MEMSCRAMBLE_UTIL_HPP
