#ifndef KLONDIKE_INVARIANTS_HPP
#define KLONDIKE_INVARIANTS_HPP

#include <fmt/format.h>

#include "../core/Game.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"

namespace klondike::core::debug
{
    // A second layer of checks over a whole board. Throws AssertionError on the
    // first breach so tests can pinpoint the step that broke it.
    inline auto CheckInvariants(Board const& b) -> void
    {
#if KLD_ENABLE_TEST_HOOKS == false
        (void)b;
#else
        // 1) Every card exactly once
        {
            util::CardUniqueChecker checker{};
            for (Slot const& s : b) checker.Add(s.cards);
            KLD_ASSERT(!checker.ContainsDup(), "Duplicate card across slots");
            KLD_ASSERT(checker.IsFullDeck(), fmt::format("Card count {} != 52", checker.Count()));
        }

        // 2) Stock face down; waste, reserve and foundations face up
        for (Card const& c : b[constants::StockSlot].cards)
            KLD_ASSERT(!c.face_up, fmt::format("Face-up card {} in stock", util::CardKey(c)));
        for (SlotId id : {constants::WasteSlot, constants::ReserveSlot})
            for (Card const& c : b[id].cards)
                KLD_ASSERT(c.face_up, fmt::format("Face-down card {} in slot {}", util::CardKey(c), id));

        // 3) Foundations: A,2,3,... of a single suit
        for (SlotId id = constants::FirstFoundation; id <= constants::LastFoundation; ++id)
        {
            std::vector<Card> const& f = b[id].cards;
            for (size_t i{}; i < f.size(); ++i)
            {
                KLD_ASSERT(f[i].face_up, fmt::format("Face-down card in foundation {}", id));
                KLD_ASSERT(util::RankIndex(f[i].rank) == static_cast<int>(i),
                           fmt::format("Foundation {} out of sequence at {}", id, i));
                KLD_ASSERT(f[i].suit == f.front().suit, fmt::format("Foundation {} mixes suits", id));
            }
        }

        // 4) Tableau: face-up cards form the top run, top is revealed, run alternates and descends
        for (SlotId id = constants::FirstTableau; id <= constants::LastTableau; ++id)
        {
            std::vector<Card> const& t = b[id].cards;
            if (t.empty()) continue;

            KLD_ASSERT(t.back().face_up, fmt::format("Tableau {} top card face down", id));

            size_t first_up = t.size() - 1;
            while (first_up > 0 && t[first_up - 1].face_up) --first_up;
            for (size_t i{}; i < first_up; ++i)
                KLD_ASSERT(!t[i].face_up, fmt::format("Tableau {} has a face-up card below a face-down one", id));

            for (size_t i = first_up + 1; i < t.size(); ++i)
            {
                Card const& lower = t[i - 1];
                Card const& upper = t[i];
                KLD_ASSERT(util::ColorOf(lower.suit) != util::ColorOf(upper.suit),
                           fmt::format("Tableau {} colors do not alternate at {}", id, i));
                KLD_ASSERT(util::RankIndex(lower.rank) == util::RankIndex(upper.rank) + 1,
                           fmt::format("Tableau {} ranks do not descend at {}", id, i));
            }
        }
#endif // KLD_ENABLE_TEST_HOOKS == true
    }

    inline auto CheckInvariants(GameImpl const& g) -> void
    {
        CheckInvariants(Inspector::BoardOf(g));
    }
}
#endif //KLONDIKE_INVARIANTS_HPP
