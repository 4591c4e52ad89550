#ifndef KLONDIKE_RANDOMAI_HPP
#define KLONDIKE_RANDOMAI_HPP

#include <random>
#include "Player.hpp"
#include "KlondikeRules.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace klondike::core
{
    // Mostly plays legal drags and draws; now and then proposes an arbitrary
    // drag so the rejection paths get exercised too.
    class RandomAI final : public klondike::core::Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed, double noise = 0.1);

        auto Play(std::shared_ptr<const klondike::core::GameSnapshot> snapshot) -> klondike::core::PlayerAction override;

        // All drag-ends that validate against the snapshot.
        static auto LegalDrags(klondike::core::GameSnapshot const& s) -> std::vector<DragEndAction>;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto ArbitraryDrag(klondike::core::GameSnapshot const&) -> klondike::core::PlayerAction;

    private:
        std::mt19937 rng_;
        double noise_;
    };
}

#endif //KLONDIKE_RANDOMAI_HPP
