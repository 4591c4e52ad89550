#ifndef KLONDIKE_SESSION_HPP
#define KLONDIKE_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Game.hpp"
#include "../core/Rules.hpp"
#include "../debug/AuditLogger.hpp"
#include "codec.hpp"

namespace klondike::core::net
{
    // One client's game. Frames in, frames out; no I/O of its own.
    class Session
    {
    public:
        using Frame = flatbuffers::DetachedBuffer;

        Session(Config const& config, std::unique_ptr<Rules> rules);
        // Resumes from a stored board
        Session(Config const& config, std::unique_ptr<Rules> rules, Board initial);

        // Writes a transcript of this session to `path`. Returns false when
        // the file could not be opened.
        auto EnableAudit(std::string const& path) -> bool;

        // First frame for a fresh connection: the current snapshot.
        auto Greeting() -> std::vector<Frame>;

        // Decode -> step -> replies. Undecodable frames get a ViolationMsg
        // with a negative code and leave the game alone.
        auto HandleFrame(std::span<std::byte const> bytes) -> std::vector<Frame>;

        // Replies, in order: violation (if rejected), drag preview (accepted
        // drag-start), snapshot (always), win (on the transition only).
        auto HandleAction(PlayerAction const& action) -> std::vector<Frame>;

        auto Game() const noexcept -> GameImpl const& { return game_; }
        auto FramesSent() const noexcept -> std::uint64_t { return next_msg_id_ - 1; }

    private:
        auto NextId() noexcept -> std::uint64_t { return next_msg_id_++; }

        GameImpl game_;
        std::uint64_t next_msg_id_{1};
        std::optional<debug::AuditLogger> audit_;
    };
}

#endif //KLONDIKE_SESSION_HPP
