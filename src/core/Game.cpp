#include "Game.hpp"

#include <utility>
#include <fmt/core.h>

#include "Deck.hpp"
#include "Util.hpp"

namespace klondike::core
{
    GameImpl::GameImpl(Config const& config, std::unique_ptr<Rules> rules) :
        cfg_(config),
        rules_(std::move(rules)),
        rng_{cfg_.seed}
    {
        KLD_ASSERT(rules_ != nullptr, "Null rules while initialising core");
        board_ = DealLayout(BuildDeck(rng_));
        CheckConservation(board_);
    }

    GameImpl::GameImpl(Config const& config, std::unique_ptr<Rules> rules, Board initial) :
        cfg_(config),
        rules_(std::move(rules)),
        rng_{cfg_.seed},
        board_(std::move(initial))
    {
        KLD_ASSERT(rules_ != nullptr, "Null rules while initialising core");
        CheckConservation(board_);
        won_ = rules_->IsWon(board_);
    }

    auto GameImpl::CheckConservation(Board const& board) -> void
    {
        util::CardUniqueChecker checker{};
        for (size_t i{}; i < board.size(); ++i)
        {
            if (board[i].id != i)
                KLD_THROW(error::Code::State, fmt::format("Slot at position {} carries id {}", i, board[i].id));
            checker.Add(board[i].cards);
        }
        if (!checker.IsFullDeck())
            KLD_THROW(error::Code::State,
                      fmt::format("Board does not hold the 52 unique cards (count={}, dup={})",
                                  checker.Count(), checker.ContainsDup()));
    }

    auto GameImpl::AddObserver(std::shared_ptr<Observer> observer) -> void
    {
        KLD_ASSERT(observer != nullptr, "Null observer");
        observers_.push_back(std::move(observer));
    }

    auto GameImpl::SlotAt(SlotId const id) const -> Slot const&
    {
        if (!IsValidSlot(id))
            KLD_THROW(error::Code::InvalidAction, fmt::format("No slot with id {}", id));
        return board_[id];
    }

    auto GameImpl::Snapshot() const -> std::shared_ptr<GameSnapshot const>
    {
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->won = won_;
        snap->commits = commits_;

        for (size_t i{}; i < board_.size(); ++i)
        {
            Slot const& slot = board_[i];
            SlotView& view = snap->slots[i];
            view.id = slot.id;
            view.accepts_drops = !won_ && IsDropTarget(slot.id);
            view.draggable = !won_ && IsDraggable(slot.id);
            view.clickable = !won_ && IsClickable(slot.id);

            view.cards.reserve(slot.Size());
            for (size_t c{}; c < slot.Size(); ++c)
            {
                bool const can_drag = !won_ && rules_->CanDrag(slot, c);
                view.cards.push_back(CardView{ .card = slot.cards[c], .draggable = can_drag });
            }
        }
        return snap;
    }

    auto GameImpl::Reject(error::RuleViolation violation) -> MoveOutcome
    {
        if (cfg_.verbose)
        {
            fmt::print("{}\n", error::describe(violation));
        }
        last_violation_ = std::move(violation);
        return MoveOutcome::Invalid;
    }

    auto GameImpl::Commit(Board next) -> MoveOutcome
    {
        bool const was_won = won_;
        board_ = std::move(next);
        ++commits_;
        won_ = was_won || rules_->IsWon(board_);

        if (!observers_.empty())
        {
            std::shared_ptr<GameSnapshot const> snap = Snapshot();
            for (auto const& o : observers_) o->OnCommit(snap);
            if (!was_won && won_)
            {
                for (auto const& o : observers_) o->OnWin(snap);
            }
        }
        return (!was_won && won_) ? MoveOutcome::Won : MoveOutcome::Applied;
    }

    auto GameImpl::Step(PlayerAction const& action) -> MoveOutcome
    {
        using RVC = error::RuleViolationCode;

        last_violation_.reset();

        // the drag gesture is over whatever the outcome
        if (std::holds_alternative<DragEndAction>(action)) drag_.reset();

        bool const is_new_game = std::holds_alternative<NewGameAction>(action);
        if (won_ && !is_new_game)
        {
            return Reject(error::RuleViolation{ .code = RVC::Game_AlreadyWon });
        }

        if (auto const ok = rules_->Validate(board_, action); !ok.has_value())
        {
            return Reject(ok.error());
        }

        if (auto const* start = std::get_if<DragStartAction>(&action))
        {
            Slot const& src = board_[start->source];
            drag_ = DragInfo{
                .source = start->source,
                .index = start->index,
                .cards = std::vector<Card>(src.cards.begin() + static_cast<std::ptrdiff_t>(start->index), src.cards.end())
            };
            return MoveOutcome::Unchanged;
        }
        if (std::holds_alternative<QueryAction>(action))
        {
            return MoveOutcome::Unchanged;
        }

        Board candidate = board_;
        rules_->Apply(candidate, action, rng_);

        if (is_new_game)
        {
            won_ = false;
            drag_.reset();
        }
        return Commit(std::move(candidate));
    }

    auto GameImpl::NewGame() -> MoveOutcome
    {
        return Step(NewGameAction{});
    }

    auto GameImpl::Draw() -> MoveOutcome
    {
        return Step(DrawAction{});
    }

    auto GameImpl::DragStart(SlotId const source, size_t const index) -> MoveOutcome
    {
        return Step(DragStartAction{ .source = source, .index = index });
    }

    auto GameImpl::DragEnd(std::optional<SlotId> const source, size_t const index,
                           std::optional<SlotId> const target) -> MoveOutcome
    {
        return Step(DragEndAction{ .source = source, .index = index, .target = target });
    }
}
