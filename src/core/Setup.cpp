//
// Setup.cpp
//

#include "Setup.hpp"

#include <algorithm>
#include <random>
#include <format>
#include "Exception.hpp"

namespace scramble::core
{
    auto MakeShuffledGrid(int const rows, int const cols, std::size_t const n_symbols, std::uint64_t const seed)
        -> Board::Grid
    {
        if (rows <= 0 || cols <= 0)
            SCR_THROW(error::Code::InvalidArgument, std::format("Cannot deal a {}x{} board", rows, cols));
        if (n_symbols == 0)
            SCR_THROW(error::Code::InvalidArgument, "Cannot deal a board without symbols");

        std::size_t const cells = static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);

        std::vector<SymbolIdT> symbols;
        symbols.reserve(cells);
        for (std::size_t i{}; i < cells; ++i)
        {
            // i/2 keeps both halves of a pair on the same symbol
            symbols.push_back(static_cast<SymbolIdT>((i / 2) % n_symbols));
        }

        std::mt19937_64 rng{seed};
        std::ranges::shuffle(symbols, rng);

        Board::Grid grid;
        grid.reserve(cells);
        std::size_t next{};
        for (int r{}; r < rows; ++r)
        {
            for (int c{}; c < cols; ++c)
            {
                grid.emplace(Location{r, c}, Card{static_cast<std::int64_t>(symbols[next++])});
            }
        }
        return grid;
    }

    auto MakeBoard(SimConfig const& cfg) -> std::unique_ptr<Board>
    {
        Board::Grid grid = MakeShuffledGrid(cfg.rows, cfg.cols, cfg.symbols.size(), cfg.seed);
        return std::make_unique<Board>(std::move(grid), cfg.rows, cfg.cols, cfg.symbols);
    }
}
