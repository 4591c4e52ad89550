#ifndef KLONDIKE_UTIL_HPP
#define KLONDIKE_UTIL_HPP

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace klondike::core::util
{
    inline constexpr auto RankIndex(Rank const r) -> int
    {
        return static_cast<int>(std::to_underlying(r));
    }
    inline constexpr auto IsRed(Suit const s) -> bool
    {
        return s == Suit::Hearts || s == Suit::Diamonds;
    }
    inline constexpr auto ColorOf(Suit const s) -> Color
    {
        return IsRed(s) ? Color::Red : Color::Black;
    }

    inline auto ToString(Rank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::CardsPerSuit> map{
            "A","2","3","4","5","6","7","8","9","10","J","Q","K"
        };
        return map[static_cast<size_t>(r)];
    }
    inline auto ToString(Suit const s) -> std::string_view
    {
        switch (s)
        {
        case Suit::Hearts:   return "hearts";
        case Suit::Diamonds: return "diamonds";
        case Suit::Clubs:    return "clubs";
        case Suit::Spades:   return "spades";
        }
        return "?";
    }

    // "<rank>-<suit>", unique across the deck
    inline auto CardKey(Card const& c) -> std::string
    {
        std::string key{ToString(c.rank)};
        key += '-';
        key += ToString(c.suit);
        return key;
    }

    inline auto CardToUID(Card const& c) -> uint64_t
    {
        return static_cast<uint64_t>(c.suit) * constants::CardsPerSuit + static_cast<uint64_t>(c.rank);
    }
    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), count_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
            ++count_;
        }
        auto Add(std::span<Card const> cs) -> void
        {
            for (Card const& c : cs) Add(c);
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        // every one of the 52 identities seen exactly once
        [[nodiscard]]
        auto IsFullDeck() const -> bool
        {
            constexpr uint64_t all = (uint64_t{1} << constants::DeckSize) - 1;
            return !contains_dup_ && count_ == constants::DeckSize && cards_ == all;
        }
        [[nodiscard]]
        auto Count() const -> size_t
        {
            return count_;
        }
    private:
        uint64_t cards_;
        size_t count_;
        bool contains_dup_;
    };
}

#endif //KLONDIKE_UTIL_HPP
