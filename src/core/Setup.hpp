//
// Setup.hpp
//

#ifndef MEMSCRAMBLE_SETUP_HPP
#define MEMSCRAMBLE_SETUP_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "Board.hpp"
#include "Types.hpp"

namespace scramble::core
{
    // Deals rows*cols face-down cards: symbols in pairs, cycling through the
    // catalog, shuffled with the given seed. An odd cell count leaves one card
    // without a partner.
    auto MakeShuffledGrid(int rows, int cols, std::size_t n_symbols, std::uint64_t seed) -> Board::Grid;

    auto MakeBoard(SimConfig const& cfg) -> std::unique_ptr<Board>;
}

#endif //MEMSCRAMBLE_SETUP_HPP
