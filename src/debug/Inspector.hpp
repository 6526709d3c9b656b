//
// Inspector.hpp
//

#ifndef MEMSCRAMBLE_INSPECTOR_HPP
#define MEMSCRAMBLE_INSPECTOR_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Board.hpp"

namespace scramble::core::debug
{
    struct Inspector
    {
        struct CellView
        {
            Location loc{};
            SymbolIdT symbol{};
            bool face_up{false};
        };

        struct PlayerView
        {
            ActorId id;
            std::vector<Location> controlled;
            std::vector<Location> seen;
        };

        struct SnapshotAll
        {
            int rows{};
            int cols{};
            std::vector<std::string> catalog;
            std::vector<CellView> cells;
            std::vector<PlayerView> players;
            std::vector<WaitQueue::EntryView> waiting;
            std::size_t observers{};
        };

        // Caller must hold the board's lock (the board itself, after a mutation).
        static inline auto GatherLocked(Board const& b) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.rows = b.rows_;
            ret.cols = b.cols_;
            ret.catalog = b.catalog_;

            ret.cells.reserve(b.grid_.size());
            for (auto const& [loc, card] : b.grid_)
            {
                ret.cells.push_back(CellView{loc, card.Symbol(), card.IsFaceUp()});
            }

            ret.players.reserve(b.players_.size());
            for (auto const& [id, p] : b.players_)
            {
                ret.players.push_back(PlayerView{id, p.Controlled(), p.Seen()});
            }

            ret.waiting = b.queue_.Snapshot();
            ret.observers = b.observers_.size();
            return ret;
        }

        static inline auto Gather(Board const& b) -> SnapshotAll
        {
            std::lock_guard<std::mutex> lock(b.mtx_);
            return GatherLocked(b);
        }

        static inline auto CellAt(SnapshotAll const& s, Location const loc) -> std::optional<CellView>
        {
            for (CellView const& c : s.cells)
            {
                if (c.loc == loc) return c;
            }
            return std::nullopt;
        }
    };
}

#endif //MEMSCRAMBLE_INSPECTOR_HPP
