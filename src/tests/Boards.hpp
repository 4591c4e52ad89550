#ifndef KLONDIKE_TEST_BOARDS_HPP
#define KLONDIKE_TEST_BOARDS_HPP

#include <array>
#include <memory>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Slot.hpp"
#include "../core/Game.hpp"
#include "../core/KlondikeRules.hpp"
#include "../core/Util.hpp"

// Hand-built boards for scenario tests. Every board handed to GameImpl must
// still hold all 52 cards, so the builders park the leftovers in one slot.
namespace klondike::test
{
    using namespace klondike::core;

    inline auto Up(Suit s, Rank r) -> Card { return Card{ .suit = s, .rank = r, .face_up = true }; }
    inline auto Down(Suit s, Rank r) -> Card { return Card{ .suit = s, .rank = r, .face_up = false }; }

    // Ace..last of one suit, face up
    inline auto SuitRun(Suit s, Rank last) -> std::vector<Card>
    {
        std::vector<Card> out;
        for (int r{}; r <= util::RankIndex(last); ++r)
        {
            out.push_back(Up(s, static_cast<Rank>(r)));
        }
        return out;
    }

    // Every card not yet on the board goes to `parking`; face-down unless `face_up`.
    inline auto ParkRest(Board& b, SlotId parking, bool face_up = false) -> void
    {
        std::array<bool, constants::DeckSize> seen{};
        for (Slot const& s : b)
            for (Card const& c : s.cards)
                seen[util::CardToUID(c)] = true;

        for (size_t suit{}; suit < constants::SuitCount; ++suit)
        {
            for (size_t rank{}; rank < constants::CardsPerSuit; ++rank)
            {
                Card const c{ .suit = static_cast<Suit>(suit), .rank = static_cast<Rank>(rank), .face_up = face_up };
                if (!seen[util::CardToUID(c)]) b[parking].cards.push_back(c);
            }
        }
    }

    // Three foundations complete, spades up to the queen, the king of spades
    // alone on tableau 7. One drag away from the win.
    inline auto NearlyWon() -> Board
    {
        Board b = MakeEmptyBoard();
        b[3].cards = SuitRun(Suit::Hearts, Rank::King);
        b[4].cards = SuitRun(Suit::Diamonds, Rank::King);
        b[5].cards = SuitRun(Suit::Clubs, Rank::King);
        b[6].cards = SuitRun(Suit::Spades, Rank::Queen);
        b[7].cards = { Up(Suit::Spades, Rank::King) };
        return b;
    }

    inline auto MakeGame(Board b, uint64_t seed = 7) -> GameImpl
    {
        Config cfg{};
        cfg.seed = seed;
        return GameImpl(cfg, std::make_unique<KlondikeRules>(), std::move(b));
    }

    inline auto MakeGame(uint64_t seed) -> GameImpl
    {
        Config cfg{};
        cfg.seed = seed;
        return GameImpl(cfg, std::make_unique<KlondikeRules>());
    }

    // Slot-by-slot structural equality (cards, order, face-up flags)
    inline auto SameBoard(Board const& a, Board const& b) -> bool
    {
        for (size_t i{}; i < a.size(); ++i)
        {
            if (a[i].id != b[i].id || !SameFaces(a[i].cards, b[i].cards)) return false;
        }
        return true;
    }
}

#endif //KLONDIKE_TEST_BOARDS_HPP
