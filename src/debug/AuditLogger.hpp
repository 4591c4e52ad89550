#ifndef KLONDIKE_AUDITLOGGER_HPP
#define KLONDIKE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Exception.hpp"

namespace klondike::core::debug
{
    // Plain-text transcript of one game, one line per event.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

        // Session header (seed and the dealt layout)
        auto start(GameImpl const& game) -> void;

        // Per action, before it is stepped
        auto turn(PlayerAction const& a) -> void;

        // Per step outcome; the violation is logged when the outcome is Invalid
        auto outcome(MoveOutcome m, std::optional<error::RuleViolation> const& v = std::nullopt) -> void;

        // Slot sizes after a committed change
        auto layout(GameSnapshot const& s) -> void;

        // Game end footer (won flag and foundation sizes)
        auto end(GameImpl const& game) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    auto ActionToString(PlayerAction const& a) -> std::string;
    auto OutcomeToString(MoveOutcome m) -> std::string_view;
}

#endif //KLONDIKE_AUDITLOGGER_HPP
