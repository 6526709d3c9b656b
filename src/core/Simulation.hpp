//
// Simulation.hpp
//

#ifndef MEMSCRAMBLE_SIMULATION_HPP
#define MEMSCRAMBLE_SIMULATION_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include "Board.hpp"
#include "Strategy.hpp"
#include "Types.hpp"

namespace scramble::core::debug {class AuditLogger;}
namespace scramble::core
{
    struct ActorStats
    {
        ActorId id;
        std::uint32_t total_moves{};
        std::uint32_t successful{};
        std::uint32_t failed{};
        std::chrono::milliseconds elapsed{};
    };

    struct SimReport
    {
        std::vector<ActorStats> actors;
        std::chrono::milliseconds elapsed{};
        std::size_t cards_remaining{};
    };

    // Plays cfg.tries turns (first card, then second card) for one actor.
    // A turn counts as successful when both flips succeed. Any pair still held
    // at the end is cleared so nobody waits on it forever.
    auto RunActor(Board& board, ActorId const& id, Strategy& strategy, SimConfig const& cfg,
                  debug::AuditLogger* audit = nullptr) -> ActorStats;

    // Gives up whatever id still controls: a matched pair is removed, a lone
    // card is let go face up. Waiters on those cards are denied or woken.
    auto ReleaseHeld(Board& board, ActorId const& id, debug::AuditLogger* audit = nullptr) -> void;

    using StrategyFactory = std::function<std::unique_ptr<Strategy>(std::uint32_t index)>;

    // One thread per actor, named player0..playerN-1. Blocks until every actor
    // is done. An actor that throws releases its cards so the others can finish;
    // the first failure is rethrown here.
    auto RunSimulation(Board& board, SimConfig const& cfg, StrategyFactory const& make_strategy,
                       debug::AuditLogger* audit = nullptr) -> SimReport;

    // Random strategies seeded from cfg.seed.
    auto RunSimulation(Board& board, SimConfig const& cfg, debug::AuditLogger* audit = nullptr) -> SimReport;
}

#endif //MEMSCRAMBLE_SIMULATION_HPP
