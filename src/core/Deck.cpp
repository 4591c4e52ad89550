#include "Deck.hpp"

#include <algorithm>
#include <iterator>

#include "Exception.hpp"
#include "Util.hpp"

namespace klondike::core
{
    auto BuildDeck(std::mt19937_64& rng) -> Deck
    {
        Deck deck;
        deck.reserve(constants::DeckSize);
        for (size_t i{}; i < constants::SuitCount; ++i)
        {
            for (size_t j{}; j < constants::CardsPerSuit; ++j)
            {
                deck.push_back(Card{
                    .suit = static_cast<Suit>(i),
                    .rank = static_cast<Rank>(j),
                    .face_up = false});
            }
        }
        Shuffle(deck, rng);
        return deck;
    }

    auto Shuffle(Deck& cards, std::mt19937_64& rng) -> void
    {
        if (cards.size() < 2) return;
        for (size_t i = cards.size() - 1; i > 0; --i)
        {
            std::uniform_int_distribution<size_t> dist(0, i);
            std::swap(cards[i], cards[dist(rng)]);
        }
    }

    auto DealLayout(Deck deck) -> Board
    {
        util::CardUniqueChecker checker{};
        checker.Add(deck);
        KLD_ASSERT(checker.IsFullDeck(), "Deal requires exactly the 52 unique cards");

        Board board = MakeEmptyBoard();
        auto next = deck.begin();
        for (SlotId id = constants::FirstTableau; id <= constants::LastTableau; ++id)
        {
            size_t const count = id - constants::FirstTableau + 1;
            std::vector<Card>& column = board[id].cards;
            column.assign(next, next + static_cast<std::ptrdiff_t>(count));
            next += static_cast<std::ptrdiff_t>(count);

            for (Card& c : column) c.face_up = false;
            column.back().face_up = true;
        }

        std::vector<Card>& stock = board[constants::StockSlot].cards;
        stock.assign(next, deck.end());
        for (Card& c : stock) c.face_up = false;

        KLD_ASSERT(stock.size() == constants::DeckSize - constants::TableauDealt, "Stock size after deal");
        return board;
    }
}
