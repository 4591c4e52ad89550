#ifndef KLONDIKE_ACTIONS_HPP
#define KLONDIKE_ACTIONS_HPP

#include <optional>
#include <variant>
#include <vector>
#include "Types.hpp"

namespace klondike::core
{
    struct NewGameAction {};
    // click on the stock
    struct DrawAction    {};
    struct DragStartAction
    {
        SlotId source{};
        size_t index{};
    };
    // source/target are empty when the gesture lost track of them
    struct DragEndAction
    {
        std::optional<SlotId> source;
        size_t index{};
        std::optional<SlotId> target;
    };
    struct QueryAction   {};

    using PlayerAction = std::variant<
      NewGameAction, DrawAction, DragStartAction, DragEndAction, QueryAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        Unchanged, // accepted, nothing to commit (drag-start, query)
        Won
    };

    // Transient, read-only side channel for drag feedback. Never consulted by the rules.
    struct DragInfo
    {
        SlotId source{};
        size_t index{};
        std::vector<Card> cards;
    };
} // namespace klondike::core

#endif //KLONDIKE_ACTIONS_HPP
