#include "KlondikeRules.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <variant>

#include "Deck.hpp"
#include "Util.hpp"

namespace
{
    inline auto Viol(klondike::core::error::RuleViolationCode code) -> klondike::core::error::RuleViolation
    {
        return klondike::core::error::RuleViolation{ .code = code };
    }
}

namespace klondike::core
{
    using RVC = ::klondike::core::error::RuleViolationCode;

    auto KlondikeRules::CanDropOnFoundation(std::span<Card const> existing, Card const& card) -> CheckResult
    {
        if (existing.empty())
        {
            if (card.rank != Rank::Ace)
                return std::unexpected(Viol(RVC::Foundation_NeedsAce).with_card(card));
            return {};
        }

        Card const& top = existing.back();
        if (top.suit != card.suit)
            return std::unexpected(Viol(RVC::Foundation_WrongSuit).with_card(card));

        if (util::RankIndex(card.rank) != util::RankIndex(top.rank) + 1)
            return std::unexpected(Viol(RVC::Foundation_WrongRank).with_card(card));

        return {};
    }

    auto KlondikeRules::CanDropOnTableau(std::span<Card const> existing, Card const& card) -> CheckResult
    {
        if (existing.empty())
        {
            if (card.rank != Rank::King)
                return std::unexpected(Viol(RVC::Tableau_NeedsKing).with_card(card));
            return {};
        }

        Card const& top = existing.back();
        if (util::ColorOf(top.suit) == util::ColorOf(card.suit))
            return std::unexpected(Viol(RVC::Tableau_SameColor).with_card(card));

        if (util::RankIndex(card.rank) != util::RankIndex(top.rank) - 1)
            return std::unexpected(Viol(RVC::Tableau_WrongRank).with_card(card));

        return {};
    }

    auto KlondikeRules::CanPickUp(Slot const& slot, size_t const index) -> CheckResult
    {
        if (!IsDraggable(slot.id))
            return std::unexpected(Viol(RVC::Source_NotDraggable).with_source(slot.id));

        if (index >= slot.Size())
            return std::unexpected(Viol(RVC::Source_IndexOutOfRange).with_source(slot.id).with_index(index));

        Card const& c = slot.cards[index];
        if (!c.face_up)
            return std::unexpected(Viol(RVC::Source_FaceDown).with_source(slot.id).with_index(index));

        // only tableau columns allow lifting a run from the middle
        if (!IsTableau(slot.id) && index + 1 != slot.Size())
            return std::unexpected(Viol(RVC::Source_NotTopCard)
                                   .with_source(slot.id).with_index(index).with_card(c));

        return {};
    }

    auto KlondikeRules::ValidateDragEnd(Board const& board, DragEndAction const& act) -> CheckResult
    {
        if (!act.source)
            return std::unexpected(Viol(RVC::DragEnd_MissingSource));
        if (!act.target)
            return std::unexpected(Viol(RVC::DragEnd_MissingTarget).with_source(*act.source));

        SlotId const src = *act.source;
        SlotId const dst = *act.target;

        if (src == dst)
            return std::unexpected(Viol(RVC::Move_SameSlot).with_source(src).with_target(dst));

        if (IsFoundation(src) && IsFoundation(dst))
            return std::unexpected(Viol(RVC::Move_FoundationToFoundation).with_source(src).with_target(dst));

        if (!IsValidSlot(src))
            return std::unexpected(Viol(RVC::Source_OutOfRange).with_source(src));
        if (!IsValidSlot(dst))
            return std::unexpected(Viol(RVC::Target_OutOfRange).with_target(dst));

        Slot const& source = board[src];
        Slot const& target = board[dst];

        if (auto const ok = CanPickUp(source, act.index); !ok.has_value())
            return std::unexpected(error::RuleViolation{ok.error()}.with_target(dst));

        std::span<Card const> const moving = std::span{source.cards}.subspan(act.index);
        Card const& lead = moving.front();

        switch (target.Kind())
        {
        case SlotKind::Stock:
            return std::unexpected(Viol(RVC::Target_NotDroppable).with_source(src).with_target(dst));

        case SlotKind::Foundation:
        {
            if (moving.size() != 1)
                return std::unexpected(Viol(RVC::Foundation_MultiCard)
                                       .with_source(src).with_target(dst)
                                       .with_attempted(static_cast<std::uint8_t>(moving.size())));

            if (auto const ok = CanDropOnFoundation(target.cards, lead); !ok.has_value())
                return std::unexpected(error::RuleViolation{ok.error()}.with_source(src).with_target(dst).with_index(act.index));
            return {};
        }

        case SlotKind::Tableau:
        {
            if (auto const ok = CanDropOnTableau(target.cards, lead); !ok.has_value())
                return std::unexpected(error::RuleViolation{ok.error()}.with_source(src).with_target(dst).with_index(act.index));
            return {};
        }

        case SlotKind::Waste:
        case SlotKind::Reserve:
            // free targets: any stack once the categorical checks passed
            return {};
        }

        return std::unexpected(Viol(RVC::Internal_Unreachable));
    }

    auto KlondikeRules::Validate(Board const& board, PlayerAction const& a) const -> CheckResult
    {
        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, NewGameAction> || std::is_same_v<T, QueryAction>)
            {
                return {};
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                if (board[constants::StockSlot].Empty() && board[constants::WasteSlot].Empty())
                    return std::unexpected(Viol(RVC::Draw_NothingToDraw));
                return {};
            }
            else if constexpr (std::is_same_v<T, DragStartAction>)
            {
                if (!IsValidSlot(act.source))
                    return std::unexpected(Viol(RVC::Source_OutOfRange).with_source(act.source));
                return CanPickUp(board[act.source], act.index);
            }
            else
            {
                static_assert(std::is_same_v<T, DragEndAction>, "Unhandled action in Validate");
                return ValidateDragEnd(board, act);
            }
        }, a);
    }

    auto KlondikeRules::ApplyDragEnd(Board& board, DragEndAction const& act) -> void
    {
        if (!ValidateDragEnd(board, act).has_value())
            KLD_THROW(error::Code::Rules, "Apply called with a drag that does not validate");

        Slot& source = board[*act.source];
        Slot& target = board[*act.target];

        auto const first = source.cards.begin() + static_cast<std::ptrdiff_t>(act.index);
        size_t const before = target.Size();
        target.cards.insert(target.cards.end(), first, source.cards.end());
        for (auto it = target.cards.begin() + static_cast<std::ptrdiff_t>(before); it != target.cards.end(); ++it)
        {
            it->face_up = true;
        }
        source.cards.erase(first, source.cards.end());

        // reveal-on-expose
        if (IsTableau(source.id) && !source.Empty() && !source.Top().face_up)
        {
            source.Top().face_up = true;
        }
    }

    auto KlondikeRules::ApplyDraw(Board& board, std::mt19937_64& rng) -> void
    {
        Slot& stock = board[constants::StockSlot];
        Slot& waste = board[constants::WasteSlot];

        if (!stock.Empty())
        {
            Card c = stock.Top();
            stock.cards.pop_back();
            c.face_up = true;
            waste.cards.push_back(c);
            return;
        }

        if (waste.Empty())
            KLD_THROW(error::Code::Rules, "Draw applied with stock and waste both empty");

        // recycle the waste into a fresh face-down stock
        Deck recycled = std::move(waste.cards);
        waste.cards.clear();
        for (Card& c : recycled) c.face_up = false;
        Shuffle(recycled, rng);
        stock.cards = std::move(recycled);
    }

    auto KlondikeRules::Apply(Board& board, PlayerAction const& a, std::mt19937_64& rng) -> void
    {
        std::visit([&]<typename T0>(T0 const& act)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, NewGameAction>)
                {
                    board = DealLayout(BuildDeck(rng));
                }
                else if constexpr (std::is_same_v<T, DrawAction>)
                {
                    ApplyDraw(board, rng);
                }
                else if constexpr (std::is_same_v<T, DragEndAction>)
                {
                    ApplyDragEnd(board, act);
                }
                else
                {
                    // drag-start and query never mutate
                    (void)act;
                }
            }, a);
    }

    auto KlondikeRules::IsWon(Board const& board) const -> bool
    {
        return std::ranges::all_of(
            std::views::iota(size_t{constants::FirstFoundation}, size_t{constants::LastFoundation} + 1),
            [&](size_t const id) { return board[id].Size() == constants::CardsPerSuit; });
    }

    auto KlondikeRules::CanDrag(Slot const& slot, size_t const index) const -> bool
    {
        return CanPickUp(slot, index).has_value();
    }

} // klondike
