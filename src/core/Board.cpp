//
// Board.cpp
//

#include "Board.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

#include "Util.hpp"
#include "../debug/Invariants.hpp"

namespace scramble::core
{
    using VC = error::ViolationCode;

    namespace
    {
        auto Take(Player& p, Location const loc) -> void
        {
            auto const ok = p.TakeControl(loc);
            SCR_ASSERT(ok.has_value(), error::describe(ok.error()));
        }

        auto GiveUp(Player& p, Location const loc) -> void
        {
            auto const ok = p.GiveUpControl(loc);
            SCR_ASSERT(ok.has_value(), error::describe(ok.error()));
        }
    }

    Board::Board(Grid grid, int const rows, int const cols, std::vector<std::string> symbol_catalog) :
        rows_(rows),
        cols_(cols),
        catalog_(std::move(symbol_catalog)),
        grid_(std::move(grid))
    {
        ValidateLayout();
    }

    auto Board::ValidateLayout() const -> void
    {
        if (rows_ <= 0 || cols_ <= 0)
            SCR_THROW(error::Code::State, std::format("Board dimensions must be positive, got {}x{}", rows_, cols_));

        for (std::size_t i{}; i < catalog_.size(); ++i)
        {
            if (catalog_[i].empty())
                SCR_THROW(error::Code::State, std::format("Symbol {} is empty", i));
        }

        for (auto const& [loc, card] : grid_)
        {
            if (!util::InBounds(loc, rows_, cols_))
                SCR_THROW(error::Code::State, std::format("Card at {} is outside a {}x{} board",
                                                          loc.ToToken(), rows_, cols_));
            if (card.Symbol() >= catalog_.size())
                SCR_THROW(error::Code::State, std::format("Card at {} has unknown symbol {}",
                                                          loc.ToToken(), card.Symbol()));
        }
    }

    auto Board::PlayerForLocked(ActorId const& actor) -> Player&
    {
        auto it = players_.find(actor);
        if (it == players_.end())
        {
            it = players_.emplace(actor, Player{actor}).first;
        }
        return it->second;
    }

    auto Board::ControllerOfLocked(Location const loc) const -> Player const*
    {
        for (auto const& p : players_ | std::views::values)
        {
            if (p.HasControl(loc)) return &p;
        }
        return nullptr;
    }

    auto Board::Flip(ActorId const& actor, Location const loc) -> FlipResult
    {
        if (!IsValidIdentifier(actor))
            return std::unexpected(error::Viol(VC::InvalidIdentifier).with_actor(actor));

        std::unique_lock<std::mutex> lock(mtx_);
        for (;;)
        {
            Player& player = PlayerForLocked(actor);
            bool changed = CleanupLocked(player);

            if (player.ControlCount() == constants::MaxControlled)
            {
                changed = RemoveMatchedLocked(player) || changed;
            }

            if (player.ControlCount() == 1)
            {
                FlipResult const res = SecondCardLocked(player, loc);
                FinishLocked();
                return res;
            }

            Attempt attempt = FirstCardLocked(player, loc);
            if (!attempt.wait)
            {
                FinishLocked();
                return attempt.result;
            }

            // Waiting. Anything cleanup or removal changed is published before we block.
            WaitQueue::Ticket ticket = std::move(*attempt.wait);
            ReleaseAvailableLocked();
            CheckInvariantsLocked();
            if (changed) NotifyObserversLocked();

            lock.unlock();
            WaitQueue::Outcome const outcome = ticket.get();
            lock.lock();

            if (!outcome.has_value())
            {
                FinishLocked();
                return std::unexpected(outcome.error());
            }
            // woken: the board may look nothing like it did, start over
        }
    }

    auto Board::CleanupLocked(Player& player) -> bool
    {
        bool changed = false;
        for (Location const loc : player.Seen())
        {
            if (ControllerOfLocked(loc)) continue;

            if (auto const it = grid_.find(loc); it != grid_.end() && it->second.IsFaceUp())
            {
                it->second.FlipDown();
                changed = true;
            }
            auto const ok = player.ClearSeen(loc);
            SCR_ASSERT(ok.has_value(), error::describe(ok.error()));
        }
        return changed;
    }

    auto Board::RemoveMatchedLocked(Player& player) -> bool
    {
        std::vector<Location> const held = player.Controlled();
        SCR_ASSERT(held.size() == constants::MaxControlled, "Matched pair expected");
        SCR_ASSERT(grid_.at(held[0]).Symbol() == grid_.at(held[1]).Symbol(),
                   std::format("Player {} holds two unmatched cards", player.Id()));

        std::size_t removed{};
        for (Location const loc : held)
        {
            GiveUp(player, loc);
            removed += grid_.erase(loc);
            for (ActorId const& waiter : queue_.WaitingOn(loc))
            {
                queue_.DenyOne(waiter, loc);
            }
        }
        return removed > 0;
    }

    auto Board::FirstCardLocked(Player& player, Location const loc) -> Attempt
    {
        auto const it = grid_.find(loc);
        if (it == grid_.end())
            return {std::unexpected(error::Viol(VC::EmptyLocation).with_actor(player.Id()).with_location(loc)), {}};

        Card& card = it->second;
        if (!card.IsFaceUp())
        {
            card.FlipUp();
            Take(player, loc);
            return {};
        }

        if (!ControllerOfLocked(loc))
        {
            Take(player, loc);
            return {};
        }

        auto ticket = queue_.Enqueue(player.Id(), loc);
        if (!ticket.has_value())
            return {std::unexpected(ticket.error()), {}};
        return {{}, std::move(ticket.value())};
    }

    auto Board::SecondCardLocked(Player& player, Location const loc) -> FlipResult
    {
        Location const first = player.Controlled().front();

        auto const it = grid_.find(loc);
        if (it == grid_.end())
        {
            GiveUp(player, first);
            return std::unexpected(error::Viol(VC::EmptyLocation).with_actor(player.Id()).with_location(loc));
        }

        Card& card = it->second;
        // never wait here: two players each holding the card the other wants would deadlock
        if (card.IsFaceUp() && ControllerOfLocked(loc))
        {
            GiveUp(player, first);
            RecordSeenLocked(player, first, loc);
            return std::unexpected(error::Viol(VC::LocationUnderControl).with_actor(player.Id()).with_location(loc));
        }

        card.FlipUp();

        if (grid_.at(first).Symbol() == card.Symbol())
        {
            Take(player, loc);
            return {};
        }

        RecordSeenLocked(player, first, loc);
        GiveUp(player, first);
        return {};
    }

    auto Board::RecordSeenLocked(Player& player, Location const first, Location const second) -> void
    {
        // only the last player to touch a card turns it back down
        for (auto& other : players_ | std::views::values)
        {
            if (&other == &player) continue;
            for (Location const l : {first, second})
            {
                if (!other.HasSeen(l)) continue;
                auto const ok = other.ClearSeen(l);
                SCR_ASSERT(ok.has_value(), error::describe(ok.error()));
            }
        }
        player.MarkSeen({first, second});
    }

    auto Board::ReleaseAvailableLocked() -> void
    {
        if (queue_.Empty()) return;

        std::vector<Location> waited;
        for (WaitQueue::EntryView const& e : queue_.Snapshot())
        {
            if (std::ranges::find(waited, e.location) == waited.end()) waited.push_back(e.location);
        }

        for (Location const loc : waited)
        {
            if (!ControllerOfLocked(loc)) queue_.ReleaseAll(loc);
        }
    }

    auto Board::NotifyObserversLocked() -> void
    {
        std::vector<Observer> firing = std::exchange(observers_, {});
        for (Observer& o : firing)
        {
            o.done.set_value(RenderLocked(o.actor));
        }
    }

    auto Board::CheckInvariantsLocked() const -> void
    {
#if SCR_ENABLE_TEST_HOOKS == true
        debug::CheckInvariants(debug::Inspector::GatherLocked(*this));
#endif
    }

    auto Board::FinishLocked() -> void
    {
        ReleaseAvailableLocked();
        CheckInvariantsLocked();
        NotifyObserversLocked();
    }

    auto Board::RenderLocked(ActorId const& actor) const -> std::string
    {
        std::vector<std::string> lines;
        lines.reserve(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_) + 1);
        lines.push_back(std::format("{}x{}", rows_, cols_));

        for (int r{}; r < rows_; ++r)
        {
            for (int c{}; c < cols_; ++c)
            {
                Location const loc{r, c};
                auto const it = grid_.find(loc);
                if (it == grid_.end())
                {
                    lines.emplace_back("none");
                    continue;
                }
                if (!it->second.IsFaceUp())
                {
                    lines.emplace_back("down");
                    continue;
                }

                Player const* owner = ControllerOfLocked(loc);
                std::string const& symbol = catalog_[it->second.Symbol()];
                bool const mine = owner && owner->Id() == actor;
                lines.push_back(std::format("{} {}", mine ? "my" : "up", symbol));
            }
        }
        return util::JoinLines(lines);
    }

    auto Board::Look(ActorId const& actor) -> LookResult
    {
        if (!IsValidIdentifier(actor))
            return std::unexpected(error::Viol(VC::InvalidIdentifier).with_actor(actor));

        std::lock_guard<std::mutex> lock(mtx_);
        (void)PlayerForLocked(actor);
        return RenderLocked(actor);
    }

    auto Board::Watch(ActorId const& actor) -> WatchResult
    {
        if (!IsValidIdentifier(actor))
            return std::unexpected(error::Viol(VC::InvalidIdentifier).with_actor(actor));

        std::lock_guard<std::mutex> lock(mtx_);
        (void)PlayerForLocked(actor);
        Observer& o = observers_.emplace_back(Observer{actor, std::promise<std::string>{}});
        return o.done.get_future();
    }

    auto Board::MapSymbols(ActorId const& actor, SymbolMapFn const& fn) -> error::CheckResult
    {
        if (!IsValidIdentifier(actor))
            return std::unexpected(error::Viol(VC::InvalidIdentifier).with_actor(actor));

        std::vector<std::string> before;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            (void)PlayerForLocked(actor);
            before = catalog_;
        }

        std::vector<std::string> after;
        after.reserve(before.size());
        for (std::string const& s : before)
        {
            std::string mapped = fn(s);
            if (mapped.empty())
                SCR_THROW(error::Code::State, std::format("Mapping symbol '{}' produced an empty symbol", s));
            after.push_back(std::move(mapped));
        }

        std::lock_guard<std::mutex> lock(mtx_);
        // the catalog only ever changes here; a racing map may have landed first
        bool changed = false;
        for (std::size_t i{}; i < catalog_.size() && i < after.size(); ++i)
        {
            if (catalog_[i] == before[i] && catalog_[i] != after[i])
            {
                catalog_[i] = std::move(after[i]);
                changed = true;
            }
        }
        CheckInvariantsLocked();
        if (changed) NotifyObserversLocked();
        return {};
    }

    auto Board::ControlledBy(ActorId const& actor) const -> std::vector<Location>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = players_.find(actor);
        return it == players_.end() ? std::vector<Location>{} : it->second.Controlled();
    }

    auto Board::CardsRemaining() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return grid_.size();
    }

    auto Board::PlayerCount() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return players_.size();
    }

    auto Board::Waiting() const -> std::vector<WaitQueue::EntryView>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.Snapshot();
    }
}
