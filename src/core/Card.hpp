//
// Card.hpp
//

#ifndef MEMSCRAMBLE_CARD_HPP
#define MEMSCRAMBLE_CARD_HPP

#include <cstdint>
#include <format>
#include "Exception.hpp"
#include "Types.hpp"

namespace scramble::core
{
    // Two-sided cell. The symbol is fixed for life, only the face changes.
    class Card
    {
    public:
        Card() = delete;
        explicit Card(std::int64_t symbol_id) :
            symbol_{Checked(symbol_id)}
        {
        }

        auto FlipUp() noexcept -> void { face_up_ = true; }
        auto FlipDown() noexcept -> void { face_up_ = false; }

        [[nodiscard]]
        auto IsFaceUp() const noexcept -> bool { return face_up_; }
        [[nodiscard]]
        auto Symbol() const noexcept -> SymbolIdT { return symbol_; }

    private:
        static auto Checked(std::int64_t symbol_id) -> SymbolIdT
        {
            if (symbol_id < 0 || symbol_id > static_cast<std::int64_t>(UINT32_MAX))
                SCR_THROW(error::Code::InvalidArgument, std::format("Card symbol id {} out of range", symbol_id));
            return static_cast<SymbolIdT>(symbol_id);
        }

        SymbolIdT symbol_;
        bool face_up_{false};
    };
}

#endif //MEMSCRAMBLE_CARD_HPP
