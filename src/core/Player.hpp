#ifndef KLONDIKE_PLAYER_HPP
#define KLONDIKE_PLAYER_HPP

#include <memory>
#include "Actions.hpp"
#include "State.hpp"

namespace klondike::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Chooses the next action from a committed snapshot. Used by self-play drivers.
        virtual PlayerAction Play(std::shared_ptr<const GameSnapshot> snapshot) = 0;
    };

    // Receives every committed state and the one-shot win signal.
    class Observer
    {
    public:
        virtual ~Observer() = default;

        virtual void OnCommit(std::shared_ptr<const GameSnapshot> snapshot) = 0;
        virtual void OnWin(std::shared_ptr<const GameSnapshot> snapshot) = 0;
    };
}
#endif //KLONDIKE_PLAYER_HPP
