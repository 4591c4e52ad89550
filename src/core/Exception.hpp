#ifndef KLONDIKE_EXCEPTION_HPP
#define KLONDIKE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>
#include "Types.hpp"
#include "Util.hpp"

namespace klondike::core::error
{
    enum class Code : unsigned
    {
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        InvalidAction, // action cannot be applied at all
        Assertion // internal assertion failed
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define KLD_THROW(code_enum, msg) ::klondike::core::error::fail((code_enum), (msg))
#define KLD_ASSERT(cond, msg) do { if(!(cond)) ::klondike::core::error::fail(::klondike::core::error::Code::Assertion, (msg)); } while(0)

    // Why an action was rejected. Rejections never throw; the state is left unchanged.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        Game_AlreadyWon,

        // Drag-end identities
        DragEnd_MissingSource,
        DragEnd_MissingTarget,
        Move_SameSlot,
        Move_FoundationToFoundation,

        // Source position
        Source_OutOfRange,
        Source_IndexOutOfRange,
        Source_NotDraggable,
        Source_FaceDown,
        Source_NotTopCard,

        // Target slot
        Target_OutOfRange,
        Target_NotDroppable,

        // Foundation
        Foundation_MultiCard,
        Foundation_NeedsAce,
        Foundation_WrongSuit,
        Foundation_WrongRank,

        // Tableau
        Tableau_NeedsKing,
        Tableau_SameColor,
        Tableau_WrongRank,

        // Draw
        Draw_NothingToDraw,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<SlotId> source{};
        std::optional<SlotId> target{};
        std::optional<size_t> index{};

        // e.g. number of cards being moved
        std::optional<std::uint8_t> attempted_count{};

        // the card the rule was checked against
        std::optional<Card> card{};

        // Quick helpers to build enriched violations (fluent style).
        auto with_source(SlotId s) -> RuleViolation&
        {
            source = s;
            return *this;
        }

        auto with_target(SlotId t) -> RuleViolation&
        {
            target = t;
            return *this;
        }

        auto with_index(size_t i) -> RuleViolation&
        {
            index = i;
            return *this;
        }

        auto with_attempted(std::uint8_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_card(Card const& c) -> RuleViolation&
        {
            card = c;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Game_AlreadyWon: return "Game already won";

        case E::DragEnd_MissingSource: return "Drag: no source slot";
        case E::DragEnd_MissingTarget: return "Drag: no target slot";
        case E::Move_SameSlot: return "Move: source and target are the same slot";
        case E::Move_FoundationToFoundation: return "Move: foundation to foundation";

        case E::Source_OutOfRange: return "Source: slot id out of range";
        case E::Source_IndexOutOfRange: return "Source: card index out of range";
        case E::Source_NotDraggable: return "Source: slot is not draggable";
        case E::Source_FaceDown: return "Source: card is face down";
        case E::Source_NotTopCard: return "Source: only the top card may move";

        case E::Target_OutOfRange: return "Target: slot id out of range";
        case E::Target_NotDroppable: return "Target: slot does not accept drops";

        case E::Foundation_MultiCard: return "Foundation: only one card at a time";
        case E::Foundation_NeedsAce: return "Foundation: empty foundation needs an ace";
        case E::Foundation_WrongSuit: return "Foundation: suit does not match";
        case E::Foundation_WrongRank: return "Foundation: rank is not next in sequence";

        case E::Tableau_NeedsKing: return "Tableau: empty column needs a king";
        case E::Tableau_SameColor: return "Tableau: colors must alternate";
        case E::Tableau_WrongRank: return "Tableau: rank must be one lower";

        case E::Draw_NothingToDraw: return "Draw: stock and waste are empty";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = fmt::format("{}", to_string(v.code));
        if (v.source) s += fmt::format(" | src={}", static_cast<int>(*v.source));
        if (v.target) s += fmt::format(" | dst={}", static_cast<int>(*v.target));
        if (v.index) s += fmt::format(" | idx={}", *v.index);
        if (v.attempted_count) s += fmt::format(" | attempted={}", *v.attempted_count);
        if (v.card) s += fmt::format(" | card={}", util::CardKey(*v.card));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //KLONDIKE_EXCEPTION_HPP
