//
// Types.hpp
//

#ifndef MEMSCRAMBLE_TYPES_HPP
#define MEMSCRAMBLE_TYPES_HPP

#ifndef SCR_ENABLE_TEST_HOOKS
#define SCR_ENABLE_TEST_HOOKS true
#endif

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <random>

namespace scramble::core::constants
{
    inline constexpr std::size_t MaxControlled = 2;
    inline constexpr char LocationSeparator = 'x';
}

namespace scramble::core
{
    using SymbolIdT = std::uint32_t;
    using ActorId = std::string;

    // Grid cell. Encoded on the wire and in renderings as "<row>x<col>".
    struct Location
    {
        int row{};
        int col{};

        auto ToToken() const -> std::string
        {
            return std::to_string(row) + constants::LocationSeparator + std::to_string(col);
        }

        friend auto operator==(Location const&, Location const&) -> bool = default;
        friend auto operator<=>(Location const&, Location const&) = default;
    };

    struct LocationHash
    {
        auto operator()(Location const& l) const noexcept -> std::size_t
        {
            return std::hash<std::uint64_t>{}(
                (static_cast<std::uint64_t>(static_cast<std::uint32_t>(l.row)) << 32) |
                static_cast<std::uint32_t>(l.col));
        }
    };

    // Actor ids: non-empty, [A-Za-z0-9_] only.
    inline auto IsValidIdentifier(std::string_view id) noexcept -> bool
    {
        if (id.empty()) return false;
        for (char const c : id)
        {
            bool const ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                            (c >= '0' && c <= '9') || c == '_';
            if (!ok) return false;
        }
        return true;
    }

    // Driver configuration; defaults follow the reference simulation.
    struct SimConfig
    {
        int rows{5};
        int cols{5};
        std::uint32_t n_players{4};
        std::uint32_t tries{100};
        std::chrono::microseconds min_delay{100};
        std::chrono::microseconds max_delay{2000};
        std::uint64_t seed{std::random_device{}()};
        std::vector<std::string> symbols{"A", "B"};
        std::string audit_path{};
    };
}

#endif //MEMSCRAMBLE_TYPES_HPP
