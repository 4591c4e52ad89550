#ifndef KLONDIKE_RULES_HPP
#define KLONDIKE_RULES_HPP

#include <random>
#include "Actions.hpp"
#include "Types.hpp"
#include "Slot.hpp"
#include "Exception.hpp"

namespace klondike::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(Board const& board, PlayerAction const& a) const -> CheckResult = 0;

        // Mutate a candidate board. Only called after Validate succeeded.
        virtual auto Apply(Board& board, PlayerAction const& a, std::mt19937_64& rng) -> void = 0;

        virtual auto IsWon(Board const& board) const -> bool = 0;

        // Per-card drag affordance reported to the UI.
        virtual auto CanDrag(Slot const& slot, size_t index) const -> bool = 0;
    };
}

#endif //KLONDIKE_RULES_HPP
