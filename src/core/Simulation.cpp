//
// Simulation.cpp
//

#include "Simulation.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <memory>
#include <print>
#include <random>
#include <thread>
#include <utility>

#include "Exception.hpp"
#include "RandomStrategy.hpp"
#include "../debug/AuditLogger.hpp"

namespace scramble::core
{
    namespace
    {
        auto Pause(std::mt19937_64& rng, SimConfig const& cfg) -> void
        {
            auto const lo = cfg.min_delay.count();
            auto const hi = std::max(cfg.max_delay.count(), lo);
            if (hi <= 0) return;
            std::this_thread::sleep_for(std::chrono::microseconds(
                std::uniform_int_distribution<std::int64_t>{lo, hi}(rng)));
        }

        auto FlipLogged(Board& board, ActorId const& id, Location const loc, debug::AuditLogger* audit)
            -> Board::FlipResult
        {
            Board::FlipResult res = board.Flip(id, loc);
            if (audit) audit->flip(id, loc, res);
            return res;
        }

        auto CurrentView(Board& board, ActorId const& id) -> std::string
        {
            auto view = board.Look(id);
            SCR_ASSERT(view.has_value(), error::describe(view.error()));
            return std::move(view.value());
        }
    }

    auto RunActor(Board& board, ActorId const& id, Strategy& strategy, SimConfig const& cfg,
                  debug::AuditLogger* audit) -> ActorStats
    {
        ActorStats stats{.id = id};
        std::mt19937_64 rng{cfg.seed ^ std::hash<ActorId>{}(id)};
        auto const t0 = std::chrono::steady_clock::now();

        for (std::uint32_t j{}; j < cfg.tries; ++j)
        {
            ++stats.total_moves;

            Pause(rng, cfg);
            Location const first = strategy.Choose(CurrentView(board, id), board.Rows(), board.Cols());
            if (!FlipLogged(board, id, first, audit).has_value())
            {
                ++stats.failed;
                continue;
            }

            Pause(rng, cfg);
            Location const second = strategy.Choose(CurrentView(board, id), board.Rows(), board.Cols());
            if (!FlipLogged(board, id, second, audit).has_value())
            {
                ++stats.failed;
                continue;
            }
            ++stats.successful;
        }

        // a matched pair is only removed on this actor's next flip
        ReleaseHeld(board, id, audit);

        stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0);
        return stats;
    }

    auto ReleaseHeld(Board& board, ActorId const& id, debug::AuditLogger* audit) -> void
    {
        std::vector<Location> const held = board.ControlledBy(id);
        if (held.empty()) return;

        // Flipping a held card again: with a pair, the pair goes first and the spot
        // is empty; with one card, it is a second card under control and is let go.
        Board::FlipResult const res = FlipLogged(board, id, held.front(), audit);
        error::ViolationCode const expected = held.size() == constants::MaxControlled
                                                  ? error::ViolationCode::EmptyLocation
                                                  : error::ViolationCode::LocationUnderControl;
        SCR_ASSERT(!res.has_value() && res.error().code == expected,
                   std::format("Releasing the cards held by {} failed", id));
        SCR_ASSERT(board.ControlledBy(id).empty(), std::format("{} still holds cards", id));
    }

    auto RunSimulation(Board& board, SimConfig const& cfg, StrategyFactory const& make_strategy,
                       debug::AuditLogger* audit) -> SimReport
    {
        SimReport report{};
        report.actors.resize(cfg.n_players);
        std::vector<std::exception_ptr> failures(cfg.n_players);
        auto const t0 = std::chrono::steady_clock::now();

        {
            std::vector<std::jthread> workers;
            workers.reserve(cfg.n_players);
            for (std::uint32_t i{}; i < cfg.n_players; ++i)
            {
                workers.emplace_back([&board, &cfg, &make_strategy, &report, &failures, audit, i]
                {
                    ActorId const id = std::format("player{}", i);
                    try
                    {
                        std::unique_ptr<Strategy> strategy = make_strategy(i);
                        SCR_ASSERT(strategy != nullptr, std::format("No strategy for {}", id));
                        report.actors[i] = RunActor(board, id, *strategy, cfg, audit);
                    }
                    catch (...)
                    {
                        // rethrown on the calling thread once everyone is joined
                        failures[i] = std::current_exception();
                    }
                    if (!failures[i]) return;

                    // others may be blocked on a card this actor still holds
                    try
                    {
                        ReleaseHeld(board, id, audit);
                    }
                    catch (OmegaException<error::Code> const& e)
                    {
                        std::print(stderr, "[Sim] {} could not release its cards: {}\n", id, e.what());
                    }
                });
            }
        } // joined

        for (std::exception_ptr const& f : failures)
        {
            if (f) std::rethrow_exception(f);
        }

        report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0);
        report.cards_remaining = board.CardsRemaining();
        return report;
    }

    auto RunSimulation(Board& board, SimConfig const& cfg, debug::AuditLogger* audit) -> SimReport
    {
        return RunSimulation(board, cfg, [&cfg](std::uint32_t const i) -> std::unique_ptr<Strategy>
        {
            return std::make_unique<RandomStrategy>(cfg.seed + i + 1);
        }, audit);
    }
}
