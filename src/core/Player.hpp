//
// Player.hpp
//

#ifndef MEMSCRAMBLE_PLAYER_HPP
#define MEMSCRAMBLE_PLAYER_HPP

#include <initializer_list>
#include <vector>
#include "Exception.hpp"
#include "Types.hpp"

namespace scramble::core
{
    // Per-actor bookkeeping. Owned by Board, reached by id only.
    class Player
    {
    public:
        using CheckResult = error::CheckResult;

        explicit Player(ActorId id);

        auto Id() const noexcept -> ActorId const& { return id_; }

        // Control is acquired in order; at most constants::MaxControlled at once.
        auto TakeControl(Location loc) -> CheckResult;
        auto GiveUpControl(Location loc) -> CheckResult;

        [[nodiscard]]
        auto HasControl(Location loc) const -> bool;
        auto Controlled() const -> std::vector<Location> { return controlled_; }
        auto ControlCount() const noexcept -> std::size_t { return controlled_.size(); }

        // Face-up cards this player touched last; turned down on its next turn.
        auto MarkSeen(std::initializer_list<Location> locs) -> void;
        auto ClearSeen(Location loc) -> CheckResult;
        auto ClearAllSeen() -> void { seen_.clear(); }

        [[nodiscard]]
        auto HasSeen(Location loc) const -> bool;
        auto Seen() const -> std::vector<Location> { return seen_; }

    private:
        ActorId id_;
        std::vector<Location> controlled_;
        std::vector<Location> seen_;
    };
}
#endif //MEMSCRAMBLE_PLAYER_HPP
