//
// CardPlayer.cpp
//
#include <gtest/gtest.h>

#include "../core/Card.hpp"
#include "../core/Exception.hpp"
#include "../core/Player.hpp"
#include "../core/Util.hpp"

using namespace scramble::core;
using VC = scramble::core::error::ViolationCode;

TEST(Card, StartsFaceDownAndFlipsIdempotently)
{
    Card c{3};
    EXPECT_FALSE(c.IsFaceUp());
    EXPECT_EQ(c.Symbol(), 3u);

    c.FlipUp();
    c.FlipUp();
    EXPECT_TRUE(c.IsFaceUp());

    c.FlipDown();
    c.FlipDown();
    EXPECT_FALSE(c.IsFaceUp());
    EXPECT_EQ(c.Symbol(), 3u);
}

TEST(Card, RejectsNegativeSymbol)
{
    EXPECT_THROW(Card{-1}, error::InvalidArgumentError);
}

TEST(Location, TokenRoundTrip)
{
    EXPECT_EQ((Location{0, 1}).ToToken(), "0x1");
    EXPECT_EQ((Location{12, 3}).ToToken(), "12x3");

    auto const parsed = util::ParseLocation("4x2");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, (Location{4, 2}));
}

TEST(Location, ParseRejectsMalformedTokens)
{
    for (char const* bad : {"", "x1", "1x", "ax1", "1xb", "-1x2", "1x-2", "1x2x", "12", " 1x2"})
    {
        auto const parsed = util::ParseLocation(bad);
        ASSERT_FALSE(parsed.has_value()) << bad;
        EXPECT_EQ(parsed.error().code, VC::InvalidLocation);
    }
}

TEST(Identifier, Grammar)
{
    EXPECT_TRUE(IsValidIdentifier("p1"));
    EXPECT_TRUE(IsValidIdentifier("Player_2"));
    EXPECT_FALSE(IsValidIdentifier(""));
    EXPECT_FALSE(IsValidIdentifier("p 1"));
    EXPECT_FALSE(IsValidIdentifier("p-1"));
    EXPECT_FALSE(IsValidIdentifier("p1!"));
}

TEST(Player, RejectsInvalidId)
{
    EXPECT_THROW(Player{"not valid"}, error::InvalidArgumentError);
}

TEST(Player, ControlsAtMostTwoInOrder)
{
    Player p{"p1"};
    ASSERT_TRUE(p.TakeControl({0, 0}).has_value());
    ASSERT_TRUE(p.TakeControl({1, 1}).has_value());

    auto const third = p.TakeControl({2, 2});
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error().code, VC::ControlLimitExceeded);

    std::vector<Location> const held = p.Controlled();
    ASSERT_EQ(held.size(), 2u);
    EXPECT_EQ(held[0], (Location{0, 0}));
    EXPECT_EQ(held[1], (Location{1, 1}));
}

TEST(Player, DuplicateAndMissingControl)
{
    Player p{"p1"};
    ASSERT_TRUE(p.TakeControl({0, 0}).has_value());

    auto const dup = p.TakeControl({0, 0});
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, VC::AlreadyControlled);
    EXPECT_EQ(dup.error().actor, "p1");

    auto const missing = p.GiveUpControl({3, 3});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, VC::NotControlling);

    ASSERT_TRUE(p.GiveUpControl({0, 0}).has_value());
    EXPECT_FALSE(p.HasControl({0, 0}));
    EXPECT_EQ(p.ControlCount(), 0u);
}

TEST(Player, SeenSetDedupsAndClears)
{
    Player p{"p1"};
    p.MarkSeen({{0, 0}, {0, 1}});
    p.MarkSeen({{0, 1}, {0, 0}, {2, 2}});
    EXPECT_EQ(p.Seen().size(), 3u);

    ASSERT_TRUE(p.ClearSeen({0, 1}).has_value());
    EXPECT_FALSE(p.HasSeen({0, 1}));

    auto const again = p.ClearSeen({0, 1});
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, VC::NotSeen);

    p.ClearAllSeen();
    EXPECT_TRUE(p.Seen().empty());
}

TEST(Violation, DescribeCarriesContext)
{
    auto v = error::Viol(VC::LocationUnderControl);
    v.with_actor("p2").with_location({1, 4});
    EXPECT_EQ(error::describe(v), "Card already under control | actor=p2 | at=1x4");
}
