//
// Invariants.hpp
//

#ifndef MEMSCRAMBLE_INVARIANTS_HPP
#define MEMSCRAMBLE_INVARIANTS_HPP

#include "../core/Board.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <format>
#include <unordered_set>
#include <vector>

namespace scramble::core::debug
{
    // Whole-board consistency. Runs after every mutation when test hooks are on,
    // and from tests against any snapshot. Throws AssertionError on the first breach.
    inline auto CheckInvariants(Inspector::SnapshotAll const& s) -> void
    {
#if SCR_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        // 1) Dimensions
        SCR_ASSERT(s.rows > 0 && s.cols > 0, "Board dimensions must be positive");

        // 2) Catalog entries are non-empty
        for (std::string const& sym : s.catalog)
        {
            SCR_ASSERT(!sym.empty(), "Empty symbol in catalog");
        }

        // 3) Every card is in bounds and names a catalog symbol
        for (Inspector::CellView const& c : s.cells)
        {
            SCR_ASSERT(util::InBounds(c.loc, s.rows, s.cols),
                       std::format("Card at {} out of bounds", c.loc.ToToken()));
            SCR_ASSERT(c.symbol < s.catalog.size(),
                       std::format("Card at {} has unknown symbol {}", c.loc.ToToken(), c.symbol));
        }

        // 4) Control: at most two per player, no duplicates, face-up cards only,
        //    and one controller per location
        std::unordered_set<Location, LocationHash> controlled_anywhere;
        for (Inspector::PlayerView const& p : s.players)
        {
            SCR_ASSERT(IsValidIdentifier(p.id), std::format("Invalid player id '{}'", p.id));
            SCR_ASSERT(p.controlled.size() <= constants::MaxControlled,
                       std::format("Player {} controls more than {} cards", p.id, constants::MaxControlled));

            std::unordered_set<Location, LocationHash> mine(p.controlled.begin(), p.controlled.end());
            SCR_ASSERT(mine.size() == p.controlled.size(), std::format("Player {} has duplicate controlled cards", p.id));

            std::unordered_set<Location, LocationHash> seen(p.seen.begin(), p.seen.end());
            SCR_ASSERT(seen.size() == p.seen.size(), std::format("Player {} has duplicate seen cards", p.id));

            for (Location const& loc : p.controlled)
            {
                auto const cell = Inspector::CellAt(s, loc);
                SCR_ASSERT(cell.has_value(), std::format("Player {} controls empty {}", p.id, loc.ToToken()));
                SCR_ASSERT(cell->face_up, std::format("Player {} controls face-down {}", p.id, loc.ToToken()));

                bool const inserted = controlled_anywhere.insert(loc).second;
                SCR_ASSERT(inserted, std::format("Location {} controlled by two players", loc.ToToken()));
            }
        }

        // 5) Waiters: unique (actor, location) pairs, each blocked on a held card
        for (std::size_t i{}; i < s.waiting.size(); ++i)
        {
            for (std::size_t j{i + 1}; j < s.waiting.size(); ++j)
            {
                bool const dup = s.waiting[i].actor == s.waiting[j].actor &&
                                 s.waiting[i].location == s.waiting[j].location;
                SCR_ASSERT(!dup, std::format("Player {} waits twice on {}", s.waiting[i].actor,
                                             s.waiting[i].location.ToToken()));
            }
            SCR_ASSERT(controlled_anywhere.contains(s.waiting[i].location),
                       std::format("Player {} waits on uncontrolled {}", s.waiting[i].actor,
                                   s.waiting[i].location.ToToken()));
        }
#endif
    }

    inline auto CheckInvariants(Board const& b) -> void
    {
        CheckInvariants(Inspector::Gather(b));
    }
}
#endif //MEMSCRAMBLE_INVARIANTS_HPP
