//
// RandomStrategy.cpp
//

#include "RandomStrategy.hpp"

#include "Exception.hpp"

namespace scramble::core
{
    RandomStrategy::RandomStrategy(std::uint64_t rng_seed) :
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomStrategy::Choose(std::string_view rendering, int const rows, int const cols) -> Location
    {
        SCR_ASSERT(rows > 0 && cols > 0, "Cannot choose on an empty board");

        std::vector<Location> occupied;
        occupied.reserve(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols));

        // skip the "<rows>x<cols>" header, then one spot per line in row-major order
        std::size_t pos = rendering.find('\n');
        int idx = 0;
        while (pos != std::string_view::npos && idx < rows * cols)
        {
            std::size_t const start = pos + 1;
            pos = rendering.find('\n', start);
            std::string_view const spot = rendering.substr(start, pos == std::string_view::npos ? pos : pos - start);
            if (spot != "none")
            {
                occupied.push_back(Location{idx / cols, idx % cols});
            }
            ++idx;
        }

        if (occupied.empty())
        {
            int const r = std::uniform_int_distribution<int>{0, rows - 1}(rng_);
            int const c = std::uniform_int_distribution<int>{0, cols - 1}(rng_);
            return Location{r, c};
        }
        return occupied[pick(occupied)];
    }
}
