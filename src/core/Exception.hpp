//
// Exception.hpp
//

#ifndef MEMSCRAMBLE_EXCEPTION_HPP
#define MEMSCRAMBLE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace scramble::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        State, // board misuse or a construction-time invariant violation
        InvalidArgument, // malformed input handed to a constructor
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidArgumentError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::InvalidArgument: throw InvalidArgumentError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define SCR_THROW(code_enum, msg) ::scramble::core::error::fail((code_enum), (msg))
#define SCR_ASSERT(cond, msg) do { if(!(cond)) ::scramble::core::error::fail(::scramble::core::error::Code::Assertion, (msg)); } while(0)

    // Expected outcomes of contention. None of these leave the board inconsistent.
    enum class ViolationCode : std::uint16_t
    {
        InvalidIdentifier,
        InvalidLocation,

        // Flip
        EmptyLocation,
        LocationUnderControl,
        LocationUnavailable, // waited, and the card was removed meanwhile

        // Player bookkeeping
        AlreadyControlled,
        ControlLimitExceeded,
        NotControlling,
        NotSeen,

        // Wait queue
        AlreadyWaiting
    };

    struct Violation
    {
        ViolationCode code{};
        std::optional<ActorId> actor{};
        std::optional<Location> location{};

        auto with_actor(ActorId a) -> Violation&
        {
            actor = std::move(a);
            return *this;
        }

        auto with_location(Location l) -> Violation&
        {
            location = l;
            return *this;
        }
    };

    inline auto to_string(ViolationCode c) -> std::string_view
    {
        using E = ViolationCode;
        switch (c)
        {
        case E::InvalidIdentifier: return "Invalid identifier";
        case E::InvalidLocation: return "Invalid location";
        case E::EmptyLocation: return "Nothing here";
        case E::LocationUnderControl: return "Card already under control";
        case E::LocationUnavailable: return "Card no longer available";
        case E::AlreadyControlled: return "Player already controls this card";
        case E::ControlLimitExceeded: return "Player cannot control any more cards";
        case E::NotControlling: return "Player is not controlling this card";
        case E::NotSeen: return "Location was not previously seen by player";
        case E::AlreadyWaiting: return "Player already waiting for this card";
        }
        return "Unknown";
    }

    inline auto describe(Violation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.actor) s += std::format(" | actor={}", *v.actor);
        if (v.location) s += std::format(" | at={}", v.location->ToToken());
        return s;
    }

    inline auto Viol(ViolationCode code) -> Violation
    {
        return Violation{ .code = code };
    }

    using CheckResult = std::expected<void, Violation>;
}

#endif //MEMSCRAMBLE_EXCEPTION_HPP
