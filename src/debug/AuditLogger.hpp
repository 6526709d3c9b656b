//
// AuditLogger.hpp
//

#ifndef MEMSCRAMBLE_AUDITLOGGER_HPP
#define MEMSCRAMBLE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

#include "../core/Board.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace scramble::core::debug
{
    // Plain-text transcript of a session. Actors log from their own threads.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        auto IsOpen() const -> bool { return out_.is_open(); }

        // Session header (dimensions, cards, seed, actor count)
        auto start(Board const& board, std::uint64_t seed, std::uint32_t n_players) -> void;

        // One line per flip attempt with its outcome
        auto flip(ActorId const& actor, Location loc, Board::FlipResult const& res) -> void;

        // A board rendering, indented under a title
        auto board(std::string_view title, std::string_view rendering) -> void;

        // Footer with what is left on the board
        auto end(Board const& board) -> void;

    private:
        std::mutex mtx_;
        std::ofstream out_;
    };
}

#endif //MEMSCRAMBLE_AUDITLOGGER_HPP
