//
// main.cpp
//

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include "core/Board.hpp"
#include "core/Exception.hpp"
#include "core/Setup.hpp"
#include "core/Simulation.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"

namespace
{
    using scramble::core::SimConfig;

    auto SplitSymbols(std::string_view csv) -> std::vector<std::string>
    {
        std::vector<std::string> out;
        std::size_t pos = 0;
        while (pos <= csv.size())
        {
            std::size_t const comma = csv.find(',', pos);
            std::string_view const part = csv.substr(pos, comma == std::string_view::npos ? comma : comma - pos);
            if (!part.empty()) out.emplace_back(part);
            if (comma == std::string_view::npos) break;
            pos = comma + 1;
        }
        return out;
    }

    auto ParseArgs(int argc, char** argv) -> std::optional<SimConfig>
    {
        SimConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            std::uint64_t v{};
            if (arg == "--rows")
            {
                if (next_uint(v)) { cfg.rows = static_cast<int>(v); }
            }
            else if (arg == "--cols")
            {
                if (next_uint(v)) { cfg.cols = static_cast<int>(v); }
            }
            else if (arg == "--players")
            {
                if (next_uint(v)) { cfg.n_players = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--tries")
            {
                if (next_uint(v)) { cfg.tries = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--min_delay_us")
            {
                if (next_uint(v)) { cfg.min_delay = std::chrono::microseconds(v); }
            }
            else if (arg == "--max_delay_us")
            {
                if (next_uint(v)) { cfg.max_delay = std::chrono::microseconds(v); }
            }
            else if (arg == "--symbols")
            {
                if (i + 1 < argc) { cfg.symbols = SplitSymbols(argv[++i]); }
            }
            else if (arg == "--audit")
            {
                if (i + 1 < argc) { cfg.audit_path = argv[++i]; }
            }
            else
            {
                std::print(stderr, "Unknown argument '{}'\n", arg);
                return std::nullopt;
            }
        }
        return cfg;
    }

    auto PrintReport(scramble::core::SimReport const& report) -> void
    {
        auto pct = [](std::uint32_t part, std::uint32_t total)
        {
            return total == 0 ? 0.0 : 100.0 * static_cast<double>(part) / static_cast<double>(total);
        };

        std::print("\n=== Simulation Statistics ===\n");
        std::print("Total simulation time: {}ms ({:.2f}s)\n\n",
                   report.elapsed.count(), static_cast<double>(report.elapsed.count()) / 1000.0);
        for (scramble::core::ActorStats const& s : report.actors)
        {
            std::print("{}:\n", s.id);
            std::print("  Total moves: {}\n", s.total_moves);
            std::print("  Successful: {} ({:.1f}%)\n", s.successful, pct(s.successful, s.total_moves));
            std::print("  Failed: {} ({:.1f}%)\n", s.failed, pct(s.failed, s.total_moves));
            std::print("  Time spent: {}ms ({:.2f}s)\n", s.elapsed.count(),
                       static_cast<double>(s.elapsed.count()) / 1000.0);
        }
        std::print("Cards remaining: {}\n", report.cards_remaining);
        std::print("=============================\n\n");
    }
}

int main(int argc, char** argv)
{
    using namespace scramble;

    std::optional<SimConfig> parsed = ParseArgs(argc, argv);
    if (!parsed)
    {
        std::print(stderr, "usage: {} [--rows N] [--cols N] [--players N] [--tries N] [--seed N]\n"
                           "          [--min_delay_us N] [--max_delay_us N] [--symbols A,B,...] [--audit FILE]\n",
                   argv[0]);
        return 2;
    }
    SimConfig const& cfg = *parsed;

    try
    {
        std::unique_ptr<core::Board> board = core::MakeBoard(cfg);
        std::print("[Sim] {}x{} board, {} player(s), {} tries each, seed {}\n",
                   cfg.rows, cfg.cols, cfg.n_players, cfg.tries, cfg.seed);

        std::unique_ptr<core::debug::AuditLogger> audit;
        if (!cfg.audit_path.empty())
        {
            audit = std::make_unique<core::debug::AuditLogger>(cfg.audit_path);
            if (!audit->IsOpen())
            {
                std::print(stderr, "[Sim] Cannot open audit file '{}'\n", cfg.audit_path);
                return 1;
            }
            audit->start(*board, cfg.seed, cfg.n_players);
        }

        core::SimReport const report = core::RunSimulation(*board, cfg, audit.get());
        core::debug::CheckInvariants(*board);

        if (audit)
        {
            auto const view = board->Look("observer");
            if (view) audit->board("Final", *view);
            audit->end(*board);
        }

        PrintReport(report);
    }
    catch (core::OmegaException<core::error::Code> const& e)
    {
        std::print(stderr, "{}", e);
        return 1;
    }
    return 0;
}
