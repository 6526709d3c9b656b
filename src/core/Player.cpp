//
// Player.cpp
//

#include "Player.hpp"

#include <algorithm>
#include <format>

namespace scramble::core
{
    using VC = error::ViolationCode;

    Player::Player(ActorId id) :
        id_(std::move(id))
    {
        if (!IsValidIdentifier(id_))
            SCR_THROW(error::Code::InvalidArgument, std::format("Invalid player id '{}'", id_));
        controlled_.reserve(constants::MaxControlled);
    }

    auto Player::TakeControl(Location const loc) -> CheckResult
    {
        if (HasControl(loc))
            return std::unexpected(error::Viol(VC::AlreadyControlled).with_actor(id_).with_location(loc));
        if (controlled_.size() >= constants::MaxControlled)
            return std::unexpected(error::Viol(VC::ControlLimitExceeded).with_actor(id_).with_location(loc));

        controlled_.push_back(loc);
        return {};
    }

    auto Player::GiveUpControl(Location const loc) -> CheckResult
    {
        auto const it = std::ranges::find(controlled_, loc);
        if (it == controlled_.end())
            return std::unexpected(error::Viol(VC::NotControlling).with_actor(id_).with_location(loc));

        controlled_.erase(it);
        return {};
    }

    auto Player::HasControl(Location const loc) const -> bool
    {
        return std::ranges::find(controlled_, loc) != controlled_.end();
    }

    auto Player::MarkSeen(std::initializer_list<Location> const locs) -> void
    {
        for (Location const& l : locs)
        {
            if (!HasSeen(l)) seen_.push_back(l);
        }
    }

    auto Player::ClearSeen(Location const loc) -> CheckResult
    {
        auto const it = std::ranges::find(seen_, loc);
        if (it == seen_.end())
            return std::unexpected(error::Viol(VC::NotSeen).with_actor(id_).with_location(loc));

        seen_.erase(it);
        return {};
    }

    auto Player::HasSeen(Location const loc) const -> bool
    {
        return std::ranges::find(seen_, loc) != seen_.end();
    }
}
