//
// Board.hpp
//

#ifndef MEMSCRAMBLE_BOARD_HPP
#define MEMSCRAMBLE_BOARD_HPP

#include <expected>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "Card.hpp"
#include "Exception.hpp"
#include "Player.hpp"
#include "Types.hpp"
#include "WaitQueue.hpp"

namespace scramble::core::debug {struct Inspector;}
namespace scramble::core
{
    // Shared card grid. Every operation is serialised on one mutex; the only
    // place a caller blocks is Flip() waiting for a card another player holds,
    // and it does so with the mutex released.
    class Board
    {
    public:
        using Grid = std::unordered_map<Location, Card, LocationHash>;
        using FlipResult = error::CheckResult;
        using LookResult = std::expected<std::string, error::Violation>;
        using WatchResult = std::expected<std::future<std::string>, error::Violation>;
        using SymbolMapFn = std::function<std::string(std::string const&)>;

        Board() = delete;
        // Throws StateError if the layout is inconsistent (empty dimensions,
        // out-of-bounds cells, unknown or empty symbols).
        Board(Grid grid, int rows, int cols, std::vector<std::string> symbol_catalog);

        Board(Board const&) = delete;
        auto operator=(Board const&) -> Board& = delete;

        // Flips the card at loc for actor, following the first/second card rules.
        // May block when the first card is held by someone else.
        auto Flip(ActorId const& actor, Location loc) -> FlipResult;

        // Board as seen by actor: "<rows>x<cols>" then one spot per line.
        auto Look(ActorId const& actor) -> LookResult;

        // Resolves with a fresh Look(actor) after the next completed change.
        auto Watch(ActorId const& actor) -> WatchResult;

        // Rewrites every symbol's display form. fn runs without the lock held.
        auto MapSymbols(ActorId const& actor, SymbolMapFn const& fn) -> error::CheckResult;

        auto Rows() const noexcept -> int { return rows_; }
        auto Cols() const noexcept -> int { return cols_; }
        auto ControlledBy(ActorId const& actor) const -> std::vector<Location>;
        auto CardsRemaining() const -> std::size_t;
        auto PlayerCount() const -> std::size_t;
        auto Waiting() const -> std::vector<WaitQueue::EntryView>;

        friend struct debug::Inspector;

    private:
        // One pass of the first-card rules: either finished, or a ticket to wait on.
        struct Attempt
        {
            FlipResult result{};
            std::optional<WaitQueue::Ticket> wait{};
        };

        struct Observer
        {
            ActorId actor;
            std::promise<std::string> done;
        };

        auto ValidateLayout() const -> void;

        auto PlayerForLocked(ActorId const& actor) -> Player&;
        auto ControllerOfLocked(Location loc) const -> Player const*;

        auto CleanupLocked(Player& player) -> bool;
        auto RemoveMatchedLocked(Player& player) -> bool;
        auto FirstCardLocked(Player& player, Location loc) -> Attempt;
        auto SecondCardLocked(Player& player, Location loc) -> FlipResult;
        auto RecordSeenLocked(Player& player, Location first, Location second) -> void;

        auto ReleaseAvailableLocked() -> void;
        auto NotifyObserversLocked() -> void;
        auto CheckInvariantsLocked() const -> void;
        auto FinishLocked() -> void;

        auto RenderLocked(ActorId const& actor) const -> std::string;

    private:
        int rows_;
        int cols_;
        std::vector<std::string> catalog_;   // index = symbol id

        Grid grid_;                           // cells removed on a match
        std::map<ActorId, Player> players_;   // created lazily, never erased
        WaitQueue queue_;
        std::vector<Observer> observers_;

        mutable std::mutex mtx_;
    };
}
#endif //MEMSCRAMBLE_BOARD_HPP
