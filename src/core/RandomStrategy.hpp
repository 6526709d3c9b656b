//
// RandomStrategy.hpp
//

#ifndef MEMSCRAMBLE_RANDOMSTRATEGY_HPP
#define MEMSCRAMBLE_RANDOMSTRATEGY_HPP

#include <cstdint>
#include <random>
#include <vector>
#include "Strategy.hpp"
#include "Types.hpp"

namespace scramble::core
{
    // Picks uniformly among cells that still hold a card; any cell once the
    // board is cleared.
    class RandomStrategy final : public Strategy
    {
    public:
        explicit RandomStrategy(std::uint64_t rng_seed);

        auto Choose(std::string_view rendering, int rows, int cols) -> Location override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
    };
}

#endif //MEMSCRAMBLE_RANDOMSTRATEGY_HPP
