#include "RandomAi.hpp"
#include <random>
#include <utility>

namespace klondike::core
{
    RandomAI::RandomAI(uint64_t rng_seed, double noise):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)), noise_(noise) {}

    static auto ToBoard(GameSnapshot const& s) -> Board
    {
        Board b = MakeEmptyBoard();
        for (SlotView const& v : s.slots)
        {
            std::vector<Card>& cards = b[v.id].cards;
            cards.reserve(v.cards.size());
            for (CardView const& cv : v.cards) cards.push_back(cv.card);
        }
        return b;
    }

    auto RandomAI::LegalDrags(GameSnapshot const& s) -> std::vector<DragEndAction>
    {
        Board const board = ToBoard(s);
        KlondikeRules const rules{};
        std::vector<DragEndAction> out;

        for (SlotView const& src : s.slots)
        {
            for (size_t i{}; i < src.cards.size(); ++i)
            {
                if (!src.cards[i].draggable) continue;
                for (SlotId dst{}; dst < constants::SlotCount; ++dst)
                {
                    DragEndAction const cand{ .source = src.id, .index = i, .target = dst };
                    if (rules.Validate(board, cand).has_value()) out.push_back(cand);
                }
            }
        }
        return out;
    }

    auto RandomAI::Play(std::shared_ptr<const GameSnapshot> snapshot) -> PlayerAction
    {
        std::bernoulli_distribution noisy{noise_};
        if (noisy(rng_))
        {
            return ArbitraryDrag(*snapshot);
        }

        std::vector<DragEndAction> const legal = LegalDrags(*snapshot);

        bool const can_draw = !snapshot->slots[constants::StockSlot].cards.empty() ||
                              !snapshot->slots[constants::WasteSlot].cards.empty();

        if (legal.empty())
        {
            return can_draw ? PlayerAction{DrawAction{}} : ArbitraryDrag(*snapshot);
        }

        // foundation moves first, they never hurt
        std::vector<DragEndAction> home;
        for (DragEndAction const& d : legal)
        {
            if (IsFoundation(*d.target)) home.push_back(d);
        }
        if (!home.empty())
        {
            return home[pick(home)];
        }

        // draw about as often as any single move
        size_t const n = legal.size() + (can_draw ? 1 : 0);
        size_t const choice = std::uniform_int_distribution<size_t>{0, n - 1}(rng_);
        if (choice == legal.size()) return DrawAction{};
        return legal[choice];
    }

    auto RandomAI::ArbitraryDrag(GameSnapshot const& s) -> PlayerAction
    {
        SlotId const src = static_cast<SlotId>(pick(s.slots));
        SlotId const dst = static_cast<SlotId>(pick(s.slots));
        std::vector<CardView> const& cards = s.slots[src].cards;
        size_t const index = cards.empty() ? 0 : pick(cards);
        return DragEndAction{ .source = src, .index = index, .target = dst };
    }
}
