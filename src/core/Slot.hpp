#ifndef KLONDIKE_SLOT_HPP
#define KLONDIKE_SLOT_HPP

#include <array>
#include <vector>
#include "Types.hpp"

namespace klondike::core
{
    enum class SlotKind : uint8_t
    {
        Stock,
        Waste,
        Reserve,
        Foundation,
        Tableau
    };

    inline constexpr auto IsValidSlot(size_t const id) -> bool { return id < constants::SlotCount; }

    inline constexpr auto IsFoundation(SlotId const id) -> bool
    {
        return id >= constants::FirstFoundation && id <= constants::LastFoundation;
    }
    inline constexpr auto IsTableau(SlotId const id) -> bool
    {
        return id >= constants::FirstTableau && id <= constants::LastTableau;
    }

    inline constexpr auto KindOf(SlotId const id) -> SlotKind
    {
        if (id == constants::StockSlot) return SlotKind::Stock;
        if (id == constants::WasteSlot) return SlotKind::Waste;
        if (id == constants::ReserveSlot) return SlotKind::Reserve;
        if (IsFoundation(id)) return SlotKind::Foundation;
        return SlotKind::Tableau;
    }

    // Static per-slot affordances, fixed for the lifetime of a game.
    inline constexpr auto IsDropTarget(SlotId const id) -> bool
    {
        return id != constants::StockSlot && id != constants::WasteSlot && id != constants::ReserveSlot;
    }
    inline constexpr auto IsDraggable(SlotId const id) -> bool { return id != constants::StockSlot; }
    inline constexpr auto IsClickable(SlotId const id) -> bool { return id == constants::StockSlot; }

    struct Slot
    {
        SlotId id{};
        std::vector<Card> cards;

        auto Empty() const noexcept -> bool { return cards.empty(); }
        auto Size() const noexcept -> size_t { return cards.size(); }
        auto Top() const -> Card const& { return cards.back(); }
        auto Top() -> Card& { return cards.back(); }
        auto Kind() const noexcept -> SlotKind { return KindOf(id); }
    };

    using Board = std::array<Slot, constants::SlotCount>;

    // 14 empty slots with ids 0..13
    inline auto MakeEmptyBoard() -> Board
    {
        Board b{};
        for (size_t i{}; i < b.size(); ++i)
        {
            b[i].id = static_cast<SlotId>(i);
        }
        return b;
    }
}

#endif //KLONDIKE_SLOT_HPP
