//
// WaitQueue.cpp
//

#include "WaitQueue.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <utility>

namespace scramble::core
{
    using VC = error::ViolationCode;

    auto WaitQueue::Enqueue(ActorId const& actor, Location const loc) -> std::expected<Ticket, error::Violation>
    {
        if (!IsValidIdentifier(actor))
            return std::unexpected(error::Viol(VC::InvalidIdentifier).with_actor(actor));
        if (Contains(actor, loc))
            return std::unexpected(error::Viol(VC::AlreadyWaiting).with_actor(actor).with_location(loc));

        Entry& e = entries_.emplace_back(Entry{actor, loc, std::promise<Outcome>{}});
        return e.done.get_future();
    }

    auto WaitQueue::ReleaseAll(Location const loc) -> std::size_t
    {
        // detach first so the queue is consistent before anyone wakes
        auto const split = std::ranges::stable_partition(entries_,
                                                         [loc](Entry const& e) { return e.location != loc; });
        std::vector<Entry> released(std::make_move_iterator(split.begin()),
                                    std::make_move_iterator(split.end()));
        entries_.erase(split.begin(), split.end());

        for (Entry& e : released)
        {
            e.done.set_value(Outcome{});
        }
        return released.size();
    }

    auto WaitQueue::DenyOne(ActorId const& actor, Location const loc) -> bool
    {
        auto const it = std::ranges::find_if(entries_, [&](Entry const& e)
        {
            return e.actor == actor && e.location == loc;
        });
        if (it == entries_.end()) return false;

        Entry denied = std::move(*it);
        entries_.erase(it);
        denied.done.set_value(std::unexpected(
            error::Viol(VC::LocationUnavailable).with_actor(actor).with_location(loc)));
        return true;
    }

    auto WaitQueue::Contains(ActorId const& actor, Location const loc) const -> bool
    {
        return std::ranges::any_of(entries_, [&](Entry const& e)
        {
            return e.actor == actor && e.location == loc;
        });
    }

    auto WaitQueue::WaitingOn(Location const loc) const -> std::vector<ActorId>
    {
        std::vector<ActorId> out;
        for (Entry const& e : entries_)
        {
            if (e.location == loc) out.push_back(e.actor);
        }
        return out;
    }

    auto WaitQueue::Snapshot() const -> std::vector<EntryView>
    {
        std::vector<EntryView> out;
        out.reserve(entries_.size());
        std::ranges::transform(entries_, std::back_inserter(out),
                               [](Entry const& e) { return EntryView{e.actor, e.location}; });
        return out;
    }
}
