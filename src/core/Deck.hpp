#ifndef KLONDIKE_DECK_HPP
#define KLONDIKE_DECK_HPP

#include <random>
#include <vector>
#include "Types.hpp"
#include "Slot.hpp"

namespace klondike::core
{
    using Deck = std::vector<Card>;

    // All 52 cards, face down, uniformly shuffled.
    auto BuildDeck(std::mt19937_64& rng) -> Deck;

    // Unbiased in-place permutation (Fisher-Yates).
    auto Shuffle(Deck& cards, std::mt19937_64& rng) -> void;

    // Consumes the deck front-to-back: tableau 7..13 receive 1..7 cards with only
    // the last one face up, the remaining 24 go to the stock face down.
    // Throws if the deck is not exactly the 52-card universe.
    auto DealLayout(Deck deck) -> Board;
}

#endif //KLONDIKE_DECK_HPP
