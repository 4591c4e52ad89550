#ifndef KLONDIKE_TYPES_HPP
#define KLONDIKE_TYPES_HPP

#define KLD_ENABLE_TEST_HOOKS true

#include <cstddef>
#include <cstdint>
#include <array>
#include <random>
#include <vector>

namespace klondike::core
{
    using SlotId = uint8_t;
}

namespace klondike::core::constants
{
    inline constexpr size_t CardsPerSuit = 13;
    inline constexpr size_t SuitCount    = 4;
    inline constexpr size_t DeckSize     = CardsPerSuit * SuitCount;
    inline constexpr size_t SlotCount    = 14;

    inline constexpr SlotId StockSlot       = 0;
    inline constexpr SlotId WasteSlot       = 1;
    inline constexpr SlotId ReserveSlot     = 2;
    inline constexpr SlotId FirstFoundation = 3;
    inline constexpr SlotId LastFoundation  = 6;
    inline constexpr SlotId FirstTableau    = 7;
    inline constexpr SlotId LastTableau     = 13;

    inline constexpr size_t TableauCount = LastTableau - FirstTableau + 1;
    // 1 + 2 + ... + 7
    inline constexpr size_t TableauDealt = TableauCount * (TableauCount + 1) / 2;
}

namespace klondike::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades
    };
    enum class Rank : uint8_t
    {
        Ace = 0,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King
    };
    enum class Color : uint8_t
    {
        Red,
        Black
    };

    // Identity is (suit, rank); face_up is the only mutable part.
    struct Card
    {
        Suit suit{};
        Rank rank{};
        bool face_up{false};
    };
    inline auto operator==(Card const& a, Card const& b) -> bool { return a.suit == b.suit && a.rank == b.rank; }

    // Same cards in the same order with the same face-up flags.
    inline auto SameFaces(std::vector<Card> const& a, std::vector<Card> const& b) -> bool
    {
        if (a.size() != b.size()) return false;
        for (size_t i{}; i < a.size(); ++i)
        {
            if (a[i] != b[i] || a[i].face_up != b[i].face_up) return false;
        }
        return true;
    }

    struct Config
    {
        uint64_t seed{std::random_device{}()};
        // print rejected actions
        bool     verbose{false};
    };
}

#endif //KLONDIKE_TYPES_HPP
