//
// Strategy.hpp
//

#ifndef MEMSCRAMBLE_STRATEGY_HPP
#define MEMSCRAMBLE_STRATEGY_HPP

#include <string_view>
#include "Types.hpp"

namespace scramble::core
{
    class Strategy
    {
    public:
        virtual ~Strategy() = default;

        // Called by a simulated actor before each flip with its current view of
        // the board (a Look() rendering). Returns the location to flip next.
        virtual auto Choose(std::string_view rendering, int rows, int cols) -> Location = 0;
    };
}
#endif //MEMSCRAMBLE_STRATEGY_HPP
