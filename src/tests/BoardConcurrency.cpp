//
// BoardConcurrency.cpp
//
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "TestBoards.hpp"
#include "../core/Board.hpp"
#include "../core/Exception.hpp"
#include "../debug/Invariants.hpp"

using namespace scramble::core;
using namespace scramble::test;
using VC = scramble::core::error::ViolationCode;

namespace
{
    using BoardPtr = std::shared_ptr<Board>;

    // The flipping thread shares ownership of the board, so a test that gives up
    // on a blocked flip can still return.
    auto FlipAsync(BoardPtr const& b, ActorId actor, Location loc) -> std::future<Board::FlipResult>
    {
        return Detached([b, actor = std::move(actor), loc]
        {
            return b->Flip(actor, loc);
        });
    }

    template <class T>
    auto IsReady(std::future<T> const& f) -> bool
    {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
}

TEST(BoardConcurrency, ScenarioD_WaiterGetsCardWhenReleased)
{
    BoardPtr const b = MakeFiveByFive();
    ASSERT_TRUE(b->Flip("p1", {0, 0}).has_value());

    auto waiting = FlipAsync(b, "p2", {0, 0});
    ASSERT_TRUE(Eventually([&] { return IsWaiting(*b, "p2", {0, 0}); }));
    EXPECT_FALSE(IsReady(waiting));

    // p1's second card does not match, so 0x0 is let go
    ASSERT_TRUE(b->Flip("p1", {0, 1}).has_value());

    ASSERT_EQ(waiting.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ASSERT_TRUE(waiting.get().has_value());
    EXPECT_EQ(SpotFor(*b, "p2", {0, 0}), "my A");
    EXPECT_TRUE(b->Waiting().empty());
    EXPECT_NO_THROW(debug::CheckInvariants(*b));
}

TEST(BoardConcurrency, TwoWaitersExactlyOneWinsAndTheOtherWaitsAgain)
{
    BoardPtr const b = MakeFiveByFive();
    ASSERT_TRUE(b->Flip("p1", {0, 0}).has_value());

    auto w2 = FlipAsync(b, "p2", {0, 0});
    auto w3 = FlipAsync(b, "p3", {0, 0});
    ASSERT_TRUE(Eventually([&] { return IsWaiting(*b, "p2", {0, 0}) && IsWaiting(*b, "p3", {0, 0}); }));

    ASSERT_TRUE(b->Flip("p1", {0, 1}).has_value());

    // one of them takes the card, the other goes back to waiting
    ASSERT_TRUE(Eventually([&] { return IsReady(w2) || IsReady(w3); }));
    bool const p2_won = IsReady(w2);
    ActorId const winner = p2_won ? "p2" : "p3";
    ActorId const loser = p2_won ? "p3" : "p2";
    std::future<Board::FlipResult>& won = p2_won ? w2 : w3;
    std::future<Board::FlipResult>& lost = p2_won ? w3 : w2;

    ASSERT_TRUE(won.get().has_value());
    EXPECT_EQ(b->ControlledBy(winner), std::vector<Location>{Location{0, 0}});
    ASSERT_TRUE(Eventually([&] { return IsWaiting(*b, loser, {0, 0}); }));
    EXPECT_FALSE(IsReady(lost));

    // winner misses, loser gets it
    ASSERT_TRUE(b->Flip(winner, {0, 4}).has_value());
    ASSERT_EQ(lost.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ASSERT_TRUE(lost.get().has_value());
    EXPECT_EQ(b->ControlledBy(loser), std::vector<Location>{Location{0, 0}});
    EXPECT_TRUE(b->ControlledBy(winner).empty());
    EXPECT_NO_THROW(debug::CheckInvariants(*b));
}

TEST(BoardConcurrency, WaiterIsDeniedWhenTheCardIsRemoved)
{
    BoardPtr const b = MakeFiveByFive();
    ASSERT_TRUE(b->Flip("p1", {0, 0}).has_value());

    auto waiting = FlipAsync(b, "p2", {0, 0});
    ASSERT_TRUE(Eventually([&] { return IsWaiting(*b, "p2", {0, 0}); }));

    // p1 matches: 0x0 stays controlled, the waiter keeps waiting
    ASSERT_TRUE(b->Flip("p1", {0, 2}).has_value());
    EXPECT_FALSE(IsReady(waiting));

    // p1's next move removes the pair
    ASSERT_TRUE(b->Flip("p1", {1, 0}).has_value());

    ASSERT_EQ(waiting.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto const res = waiting.get();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, VC::LocationUnavailable);
    EXPECT_EQ(res.error().location, (Location{0, 0}));
    EXPECT_TRUE(b->ControlledBy("p2").empty());
    EXPECT_EQ(SpotFor(*b, "p2", {0, 0}), "none");
    EXPECT_TRUE(b->Waiting().empty());
}

TEST(BoardConcurrency, WaitingTwiceOnTheSameCardIsRejected)
{
    BoardPtr const b = MakeFiveByFive();
    ASSERT_TRUE(b->Flip("p1", {0, 0}).has_value());

    auto first = FlipAsync(b, "p2", {0, 0});
    ASSERT_TRUE(Eventually([&] { return IsWaiting(*b, "p2", {0, 0}); }));

    auto const second = b->Flip("p2", {0, 0});
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, VC::AlreadyWaiting);

    ASSERT_TRUE(b->Flip("p1", {0, 1}).has_value());
    ASSERT_EQ(first.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(first.get().has_value());
}

TEST(BoardConcurrency, WatchersWakeOnFlipFromAnotherThread)
{
    BoardPtr const b = MakeFiveByFive();
    auto w1 = b->Watch("w1");
    auto w2 = b->Watch("w2");
    ASSERT_TRUE(w1.has_value());
    ASSERT_TRUE(w2.has_value());

    auto seen1 = Detached([f = std::move(*w1)]() mutable { return f.get(); });
    auto seen2 = Detached([f = std::move(*w2)]() mutable { return f.get(); });

    ASSERT_TRUE(b->Look("p1").has_value());
    EXPECT_EQ(seen1.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);

    auto flip = FlipAsync(b, "p1", {2, 2});
    ASSERT_EQ(flip.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ASSERT_TRUE(flip.get().has_value());

    ASSERT_EQ(seen1.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ASSERT_EQ(seen2.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(Lines(seen1.get())[13], "up G");
    EXPECT_EQ(Lines(seen2.get())[13], "up G");
}

TEST(BoardConcurrency, RemovingAPairThenWaitingNotifiesWatchers)
{
    BoardPtr const b = MakeFiveByFive();
    ASSERT_TRUE(b->Flip("p1", {0, 0}).has_value());
    ASSERT_TRUE(b->Flip("p1", {0, 2}).has_value()); // A pair, held
    ASSERT_TRUE(b->Flip("p2", {1, 1}).has_value());

    auto watch = b->Watch("obs");
    ASSERT_TRUE(watch.has_value());

    // removes the pair, then blocks on p2's card
    auto blocked = FlipAsync(b, "p1", {1, 1});
    ASSERT_TRUE(Eventually([&] { return IsWaiting(*b, "p1", {1, 1}); }));

    ASSERT_EQ(watch->wait_for(std::chrono::seconds(5)), std::future_status::ready);
    std::vector<std::string> const lines = Lines(watch->get());
    EXPECT_EQ(lines[1], "none");
    EXPECT_EQ(lines[3], "none");
    EXPECT_EQ(lines[7], "up D");
    EXPECT_FALSE(IsReady(blocked));

    // p2 misses, p1 gets 1x1
    ASSERT_TRUE(b->Flip("p2", {0, 4}).has_value());
    ASSERT_EQ(blocked.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ASSERT_TRUE(blocked.get().has_value());
    EXPECT_EQ(b->ControlledBy("p1"), std::vector<Location>{Location{1, 1}});
}

TEST(BoardConcurrency, CleanupThenWaitingNotifiesWatchers)
{
    BoardPtr const b = MakeFiveByFive();
    ASSERT_TRUE(b->Flip("p1", {0, 0}).has_value());
    ASSERT_TRUE(b->Flip("p1", {0, 1}).has_value()); // A vs B, both left up
    ASSERT_TRUE(b->Flip("p2", {1, 1}).has_value());

    auto watch = b->Watch("obs");
    ASSERT_TRUE(watch.has_value());

    auto blocked = FlipAsync(b, "p1", {1, 1});
    ASSERT_TRUE(Eventually([&] { return IsWaiting(*b, "p1", {1, 1}); }));

    ASSERT_EQ(watch->wait_for(std::chrono::seconds(5)), std::future_status::ready);
    std::vector<std::string> const lines = Lines(watch->get());
    EXPECT_EQ(lines[1], "down");
    EXPECT_EQ(lines[2], "down");

    ASSERT_TRUE(b->Flip("p2", {0, 4}).has_value());
    ASSERT_EQ(blocked.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(blocked.get().has_value());
}

TEST(BoardConcurrency, WaitingWithNothingToCleanDoesNotNotify)
{
    BoardPtr const b = MakeFiveByFive();
    ASSERT_TRUE(b->Flip("p2", {1, 1}).has_value());

    auto watch = b->Watch("obs");
    ASSERT_TRUE(watch.has_value());

    auto blocked = FlipAsync(b, "p1", {1, 1});
    ASSERT_TRUE(Eventually([&] { return IsWaiting(*b, "p1", {1, 1}); }));
    EXPECT_EQ(watch->wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);

    // the release fires it
    ASSERT_TRUE(b->Flip("p2", {0, 4}).has_value());
    ASSERT_EQ(blocked.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(blocked.get().has_value());
    EXPECT_EQ(watch->wait_for(std::chrono::seconds(0)), std::future_status::ready);
}

TEST(BoardConcurrency, ManyActorsKeepInvariants)
{
    BoardPtr const b = MakeFiveByFive();
    std::vector<std::future<void>> actors;
    for (int i{}; i < 4; ++i)
    {
        actors.push_back(Detached([b, i]
        {
            ActorId const id = "a" + std::to_string(i);
            for (int turn{}; turn < 20; ++turn)
            {
                int const cell = (turn * 7 + i * 3) % 25;
                if (!b->Flip(id, {cell / 5, cell % 5}).has_value()) continue;
                // a second card never blocks, so no turn ends holding a single card
                (void)b->Flip(id, {(cell + 1) % 25 / 5, (cell + 1) % 25 % 5});
            }
            std::vector<Location> const held = b->ControlledBy(id);
            if (held.size() == 2)
                (void)b->Flip(id, held.front());
        }));
    }

    // wait on everyone before judging; an unfinished actor is reported, not joined
    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    std::size_t finished{};
    for (auto& a : actors)
    {
        if (a.wait_until(deadline) == std::future_status::ready) ++finished;
    }
    ASSERT_EQ(finished, actors.size()) << "actors still blocked: " << b->Waiting().size();

    for (auto& a : actors)
    {
        EXPECT_NO_THROW(a.get());
    }
    EXPECT_NO_THROW(debug::CheckInvariants(*b));
}
