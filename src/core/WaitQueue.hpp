//
// WaitQueue.hpp
//

#ifndef MEMSCRAMBLE_WAITQUEUE_HPP
#define MEMSCRAMBLE_WAITQUEUE_HPP

#include <cstddef>
#include <expected>
#include <future>
#include <vector>
#include "Exception.hpp"
#include "Types.hpp"

namespace scramble::core
{
    // Actors blocked on a location. Not synchronised on its own: the owning
    // Board mutates it under its lock, waiters block on the returned future
    // with the lock released.
    class WaitQueue
    {
    public:
        // Granted: empty value. Denied: LocationUnavailable.
        using Outcome = error::CheckResult;
        using Ticket = std::future<Outcome>;

        struct EntryView
        {
            ActorId actor;
            Location location;
        };

        WaitQueue() = default;
        WaitQueue(WaitQueue const&) = delete;
        auto operator=(WaitQueue const&) -> WaitQueue& = delete;

        // An actor waits on a given location at most once at a time.
        auto Enqueue(ActorId const& actor, Location loc) -> std::expected<Ticket, error::Violation>;

        // Removes every waiter for loc and wakes them all. Waking grants nothing,
        // the woken actors race for the card. Returns the number woken.
        auto ReleaseAll(Location loc) -> std::size_t;

        // Removes one waiter and fails it with LocationUnavailable. No-op if absent.
        auto DenyOne(ActorId const& actor, Location loc) -> bool;

        [[nodiscard]]
        auto Contains(ActorId const& actor, Location loc) const -> bool;
        auto WaitingOn(Location loc) const -> std::vector<ActorId>;
        auto Snapshot() const -> std::vector<EntryView>;
        auto Empty() const noexcept -> bool { return entries_.empty(); }

    private:
        struct Entry
        {
            ActorId actor;
            Location location;
            std::promise<Outcome> done;
        };

        std::vector<Entry> entries_;
    };
}

#endif //MEMSCRAMBLE_WAITQUEUE_HPP
