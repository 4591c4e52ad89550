#ifndef KLONDIKE_INSPECTOR_HPP
#define KLONDIKE_INSPECTOR_HPP

#include <cstdint>
#include <optional>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace klondike::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            Board board{};
            bool won{};
            uint64_t commits{};
            uint64_t seed{};
            std::optional<DragInfo> drag{};
        };

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.board = g.board_;
            ret.won = g.won_;
            ret.commits = g.commits_;
            ret.seed = g.cfg_.seed;
            ret.drag = g.drag_;
            return ret;
        }

        // Direct read of the authoritative board, no copy.
        static inline auto BoardOf(GameImpl const& g) -> Board const&
        {
            return g.board_;
        }
    };
}

#endif //KLONDIKE_INSPECTOR_HPP
