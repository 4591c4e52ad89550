#include <gtest/gtest.h>
#include <algorithm>
#include <random>

#include "../core/Deck.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"

using namespace klondike::core;

namespace
{
    auto Uids(std::vector<Card> const& cards) -> std::vector<uint64_t>
    {
        std::vector<uint64_t> out;
        for (Card const& c : cards) out.push_back(util::CardToUID(c));
        std::ranges::sort(out);
        return out;
    }
}

TEST(Deck, FullFaceDownAndUnique)
{
    std::mt19937_64 rng{42};
    Deck const deck = BuildDeck(rng);

    ASSERT_EQ(deck.size(), 52u);
    util::CardUniqueChecker checker{};
    checker.Add(deck);
    EXPECT_TRUE(checker.IsFullDeck());
    EXPECT_TRUE(std::ranges::none_of(deck, [](Card const& c) { return c.face_up; }));
}

TEST(Deck, SameSeedSameOrder)
{
    std::mt19937_64 a{1234};
    std::mt19937_64 b{1234};
    std::mt19937_64 c{4321};
    Deck const da = BuildDeck(a);
    Deck const db = BuildDeck(b);
    Deck const dc = BuildDeck(c);

    EXPECT_TRUE(SameFaces(da, db));
    EXPECT_FALSE(SameFaces(da, dc));
}

TEST(Deck, ShuffleKeepsTheCards)
{
    std::mt19937_64 rng{9};
    Deck deck = BuildDeck(rng);
    Deck const before = deck;

    Shuffle(deck, rng);
    EXPECT_EQ(Uids(deck), Uids(before));

    Deck tiny{ Card{ .suit = Suit::Hearts, .rank = Rank::Ace } };
    Shuffle(tiny, rng);
    ASSERT_EQ(tiny.size(), 1u);

    Deck none{};
    Shuffle(none, rng);
    EXPECT_TRUE(none.empty());
}

TEST(Deal, InitialLayout)
{
    std::mt19937_64 rng{2024};
    Board const b = DealLayout(BuildDeck(rng));

    for (size_t i{}; i < b.size(); ++i)
    {
        EXPECT_EQ(b[i].id, i);
    }

    // stock: 24 face down
    ASSERT_EQ(b[constants::StockSlot].Size(), 24u);
    EXPECT_TRUE(std::ranges::none_of(b[constants::StockSlot].cards, [](Card const& c) { return c.face_up; }));

    EXPECT_TRUE(b[constants::WasteSlot].Empty());
    EXPECT_TRUE(b[constants::ReserveSlot].Empty());
    for (SlotId id = constants::FirstFoundation; id <= constants::LastFoundation; ++id)
    {
        EXPECT_TRUE(b[id].Empty());
    }

    // tableau 7..13 hold 1..7 cards, only the last face up
    for (SlotId id = constants::FirstTableau; id <= constants::LastTableau; ++id)
    {
        std::vector<Card> const& col = b[id].cards;
        ASSERT_EQ(col.size(), static_cast<size_t>(id - 6));
        for (size_t k{}; k + 1 < col.size(); ++k)
        {
            EXPECT_FALSE(col[k].face_up) << "slot " << int{id} << " card " << k;
        }
        EXPECT_TRUE(col.back().face_up);
    }

    EXPECT_EQ(b[7].Size(), 1u);
    EXPECT_EQ(b[13].Size(), 7u);

    util::CardUniqueChecker checker{};
    for (Slot const& s : b) checker.Add(s.cards);
    EXPECT_TRUE(checker.IsFullDeck());
}

TEST(Deal, RejectsIncompleteDeck)
{
    std::mt19937_64 rng{5};
    Deck deck = BuildDeck(rng);
    deck.pop_back();
    EXPECT_THROW((void)DealLayout(deck), error::AssertionError);

    Deck dup = BuildDeck(rng);
    dup.back() = dup.front();
    EXPECT_THROW((void)DealLayout(dup), error::AssertionError);
}

TEST(Deal, TakesCardsFromTheFrontInOrder)
{
    std::mt19937_64 rng{77};
    Deck const deck = BuildDeck(rng);
    Board const b = DealLayout(deck);

    // slot 7 gets deck[0], slot 8 gets deck[1..2], ... slot 13 gets deck[21..27]
    size_t k{};
    for (SlotId id = constants::FirstTableau; id <= constants::LastTableau; ++id)
    {
        std::vector<Card> const& col = b[id].cards;
        for (size_t j{}; j < col.size(); ++j, ++k)
        {
            EXPECT_EQ(col[j], deck[k]) << "slot " << int{id} << " card " << j;
            EXPECT_EQ(col[j].face_up, j + 1 == col.size());
        }
    }
    ASSERT_EQ(k, 28u);

    // the stock keeps the remainder in deck order
    std::vector<Card> const& stock = b[constants::StockSlot].cards;
    ASSERT_EQ(stock.size(), 24u);
    for (size_t j{}; j < stock.size(); ++j)
    {
        EXPECT_EQ(stock[j], deck[28 + j]) << "stock card " << j;
    }
}
