#ifndef KLONDIKE_STATE_HPP
#define KLONDIKE_STATE_HPP

#include "Types.hpp"
#include "Slot.hpp"
#include "Actions.hpp"

namespace klondike::core
{
    struct CardView
    {
        Card card{};
        bool draggable{false};
    };

    struct SlotView
    {
        SlotId id{};
        std::vector<CardView> cards;
        bool accepts_drops{false};
        bool draggable{false};
        bool clickable{false};
    };

    // Immutable snapshot exposed to UI/network (owns copies)
    struct GameSnapshot
    {
        std::array<SlotView, constants::SlotCount> slots{};
        bool won{false};
        uint64_t commits{};
    };

} // namespace klondike::core

#endif //KLONDIKE_STATE_HPP
