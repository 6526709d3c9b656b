#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <thread>
#include <sstream>

using namespace scramble::core;

namespace
{

auto s_outcome(Board::FlipResult const& res) -> std::string
{
    if (res.has_value())
    {
        return "OK";
    }
    return std::format("FAIL({})", error::to_string(res.error().code));
}

auto s_thread() -> std::string
{
    std::ostringstream tid;
    tid << std::this_thread::get_id();
    return tid.str();
}

} // anonymous namespace

namespace scramble::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger()
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
}

auto AuditLogger::start(Board const& board, std::uint64_t seed, std::uint32_t n_players) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Board={}x{}\n", board.Rows(), board.Cols());
    out_ << std::format("Cards={}\n", board.CardsRemaining());
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={}\n", n_players);
    out_.flush();
}

auto AuditLogger::flip(ActorId const& actor, Location const loc, Board::FlipResult const& res) -> void
{
    std::string const line = std::format("Flip actor={} at={} t={} -> {}\n",
                                         actor, loc.ToToken(), s_thread(), s_outcome(res));
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << line;
}

auto AuditLogger::board(std::string_view title, std::string_view rendering) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("{}:\n", title);

    std::size_t pos = 0;
    while (pos <= rendering.size())
    {
        std::size_t const nl = rendering.find('\n', pos);
        std::string_view const line = rendering.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        out_ << std::format("  {}\n", line);
        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
}

auto AuditLogger::end(Board const& board) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Remaining={}\n", board.CardsRemaining());
    out_.flush();
}

} // namespace scramble::core::debug
