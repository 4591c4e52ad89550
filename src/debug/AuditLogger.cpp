#include "AuditLogger.hpp"

#include <fmt/format.h>
#include <type_traits>
#include <utility>
#include <variant>

#include "../core/Util.hpp"

using namespace klondike::core;

namespace
{

auto s_slot(std::optional<SlotId> const id) -> std::string
{
    return id ? fmt::format("{}", static_cast<int>(*id)) : std::string("--");
}

auto serialize_slot(std::vector<Card> const& cards) -> std::string
{
    std::string serial;
    for (size_t i{}; i < cards.size(); ++i)
    {
        serial += (i ? "," : "");
        serial += cards[i].face_up ? util::CardKey(cards[i]) : std::string("##");
    }
    return serial;
}

} // anonymous namespace

namespace klondike::core::debug
{

auto ActionToString(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, NewGameAction>)
            {
                return "NewGame";
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                return "Draw";
            }
            else if constexpr (std::is_same_v<T, DragStartAction>)
            {
                return fmt::format("DragStart({}@{})", static_cast<int>(act.source), act.index);
            }
            else if constexpr (std::is_same_v<T, DragEndAction>)
            {
                return fmt::format("DragEnd({}@{} -> {})", s_slot(act.source), act.index, s_slot(act.target));
            }
            else
            {
                return "Query";
            }
        },
        a
    );
}

auto OutcomeToString(MoveOutcome const m) -> std::string_view
{
    switch (m)
    {
    case MoveOutcome::Invalid:   return "Invalid";
    case MoveOutcome::Applied:   return "Applied";
    case MoveOutcome::Unchanged: return "Unchanged";
    case MoveOutcome::Won:       return "Won";
    }
    return "?";
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game) -> void
{
    out_ << fmt::format("Seed={}\n", game.Seed());
    for (SlotId id{}; id < constants::SlotCount; ++id)
    {
        out_ << fmt::format("Slot{}=[{}]\n", static_cast<int>(id), serialize_slot(game.SlotAt(id).cards));
    }
    out_.flush();
}

auto AuditLogger::turn(PlayerAction const& a) -> void
{
    out_ << fmt::format("Action: {}\n", ActionToString(a));
}

auto AuditLogger::outcome(MoveOutcome const m, std::optional<error::RuleViolation> const& v) -> void
{
    if (m == MoveOutcome::Invalid && v)
    {
        out_ << fmt::format("Outcome: {} ({})\n", OutcomeToString(m), error::describe(*v));
        return;
    }
    out_ << fmt::format("Outcome: {}\n", OutcomeToString(m));
}

auto AuditLogger::layout(GameSnapshot const& s) -> void
{
    std::string body;
    for (SlotView const& v : s.slots)
    {
        body += fmt::format("{}{}:{}", (v.id ? "," : ""), static_cast<int>(v.id), v.cards.size());
    }
    out_ << fmt::format("Layout: sizes=[{}]\n", body);
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    std::string body;
    for (SlotId id = constants::FirstFoundation; id <= constants::LastFoundation; ++id)
    {
        body += fmt::format("{}{}", (id != constants::FirstFoundation ? "," : ""), game.SlotAt(id).Size());
    }
    out_ << fmt::format("Won={} Commits={} Foundations=[{}]\n", game.IsWon(), game.Commits(), body);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace klondike::core::debug
