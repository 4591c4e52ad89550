#ifndef KLONDIKE_KLONDIKERULES_HPP
#define KLONDIKE_KLONDIKERULES_HPP

#include <span>
#include "Rules.hpp"

namespace klondike::core
{
    class KlondikeRules final : public Rules
    {
    public:
        auto Validate(Board const& board, PlayerAction const& a) const -> CheckResult override;
        auto Apply(Board& board, PlayerAction const& a, std::mt19937_64& rng) -> void override;
        auto IsWon(Board const& board) const -> bool override;
        auto CanDrag(Slot const& slot, size_t index) const -> bool override;

        // Ace on empty, otherwise same suit and exactly one rank higher.
        static auto CanDropOnFoundation(std::span<Card const> existing, Card const& card) -> CheckResult;
        // King on empty, otherwise opposite color and exactly one rank lower.
        static auto CanDropOnTableau(std::span<Card const> existing, Card const& card) -> CheckResult;
        // Whether the card at index may start a drag out of the slot.
        static auto CanPickUp(Slot const& slot, size_t index) -> CheckResult;

    private:
        static auto ValidateDragEnd(Board const& board, DragEndAction const& a) -> CheckResult;
        static auto ApplyDragEnd(Board& board, DragEndAction const& a) -> void;
        static auto ApplyDraw(Board& board, std::mt19937_64& rng) -> void;
    };
}

#endif //KLONDIKE_KLONDIKERULES_HPP
