#ifndef KLONDIKE_GAME_HPP
#define KLONDIKE_GAME_HPP

#include <memory>
#include <optional>
#include <random>
#include <vector>
#include "Types.hpp"
#include "Slot.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Player.hpp"

namespace klondike::core::debug {struct Inspector;}
namespace klondike::core
{
    // Owns the authoritative board. Every mutation builds a candidate copy,
    // applies the rules to it and commits it whole, or leaves the board untouched.
    class GameImpl
    {
    public:
        GameImpl() = delete;
        // Deals a fresh game from cfg.seed.
        GameImpl(Config const& config, std::unique_ptr<Rules> rules);
        // Starts from a given board (replays, tests). Throws StateError if the
        // board does not hold exactly the 52 cards.
        GameImpl(Config const& config, std::unique_ptr<Rules> rules, Board initial);

        // Validate -> apply on a copy -> commit. Rejections return Invalid and
        // record LastViolation(); they never throw.
        auto Step(PlayerAction const& action) -> MoveOutcome;

        auto NewGame() -> MoveOutcome;
        auto Draw() -> MoveOutcome;
        auto DragStart(SlotId source, size_t index) -> MoveOutcome;
        auto DragEnd(std::optional<SlotId> source, size_t index, std::optional<SlotId> target) -> MoveOutcome;

        auto Snapshot() const -> std::shared_ptr<GameSnapshot const>;
        auto SlotAt(SlotId id) const -> Slot const&;

        auto IsWon() const noexcept -> bool { return won_; }
        auto Commits() const noexcept -> uint64_t { return commits_; }
        auto Seed() const noexcept -> uint64_t { return cfg_.seed; }
        auto LastViolation() const noexcept -> std::optional<error::RuleViolation> const& { return last_violation_; }
        // Set between an accepted drag-start and the next drag-end.
        auto ActiveDrag() const noexcept -> std::optional<DragInfo> const& { return drag_; }

        auto AddObserver(std::shared_ptr<Observer> observer) -> void;

        friend struct debug::Inspector;

    private:
        auto Reject(error::RuleViolation violation) -> MoveOutcome;
        auto Commit(Board next) -> MoveOutcome;
        static auto CheckConservation(Board const& board) -> void;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::mt19937_64 rng_;

        // Authoritative state
        Board board_{};
        bool  won_{false};
        uint64_t commits_{0};

        std::optional<DragInfo> drag_;
        std::optional<error::RuleViolation> last_violation_;
        std::vector<std::shared_ptr<Observer>> observers_;
    };
}
#endif //KLONDIKE_GAME_HPP
