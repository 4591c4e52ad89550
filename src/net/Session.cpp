#include "Session.hpp"

#include <utility>
#include <variant>

namespace klondike::core::net
{
    Session::Session(Config const& config, std::unique_ptr<Rules> rules)
        : game_{config, std::move(rules)}
    {
    }

    Session::Session(Config const& config, std::unique_ptr<Rules> rules, Board initial)
        : game_{config, std::move(rules), std::move(initial)}
    {
    }

    auto Session::EnableAudit(std::string const& path) -> bool
    {
        audit_.emplace(path);
        if (!audit_->is_open())
        {
            audit_.reset();
            return false;
        }
        audit_->start(game_);
        return true;
    }

    auto Session::Greeting() -> std::vector<Frame>
    {
        std::vector<Frame> out;
        out.push_back(BuildSnapshot(*game_.Snapshot(), NextId()));
        return out;
    }

    auto Session::HandleFrame(std::span<std::byte const> bytes) -> std::vector<Frame>
    {
        auto const parsed = DecodeClientAction(bytes);
        if (!parsed.has_value())
        {
            std::vector<Frame> out;
            out.push_back(BuildParseError(parsed.error(), NextId()));
            return out;
        }
        return HandleAction(parsed->action);
    }

    auto Session::HandleAction(PlayerAction const& action) -> std::vector<Frame>
    {
        if (audit_) audit_->turn(action);

        MoveOutcome const outcome = game_.Step(action);

        if (audit_) audit_->outcome(outcome, game_.LastViolation());

        std::vector<Frame> out;
        if (outcome == MoveOutcome::Invalid)
        {
            KLD_ASSERT(game_.LastViolation().has_value(), "Rejected step without a violation");
            out.push_back(BuildViolation(*game_.LastViolation(), NextId()));
        }
        else if (std::holds_alternative<DragStartAction>(action) && game_.ActiveDrag())
        {
            out.push_back(BuildDragPreview(*game_.ActiveDrag(), NextId()));
        }

        auto const snap = game_.Snapshot();
        out.push_back(BuildSnapshot(*snap, NextId()));

        if (outcome == MoveOutcome::Applied || outcome == MoveOutcome::Won)
        {
            if (audit_) audit_->layout(*snap);
        }

        if (outcome == MoveOutcome::Won)
        {
            out.push_back(BuildWin(game_.Commits(), NextId()));
            if (audit_) audit_->end(game_);
        }
        return out;
    }
}
