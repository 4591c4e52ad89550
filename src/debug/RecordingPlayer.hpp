#ifndef KLONDIKE_RECORDINGPLAYER_HPP
#define KLONDIKE_RECORDINGPLAYER_HPP

#include <algorithm>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Player.hpp"

namespace klondike::core::debug
{
    // Forwards to another player and keeps every action it chose, in order.
    // Replaying History() on a game dealt from the same seed reproduces the session.
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
            KLD_ASSERT(inner_ != nullptr, "RecordingPlayer needs a player to record");
        }

        auto Play(std::shared_ptr<const GameSnapshot> s) -> PlayerAction override
        {
            history_.push_back(inner_->Play(std::move(s)));
            return history_.back();
        }

        auto HasLast() const -> bool { return !history_.empty(); }

        auto Last() const -> PlayerAction const&
        {
            KLD_ASSERT(!history_.empty(), "no action recorded yet");
            return history_.back();
        }

        auto Count() const -> size_t { return history_.size(); }

        auto History() const -> std::vector<PlayerAction> const& { return history_; }

        template <typename A>
        auto CountOf() const -> size_t
        {
            return static_cast<size_t>(std::ranges::count_if(history_, [](PlayerAction const& a)
            {
                return std::holds_alternative<A>(a);
            }));
        }

    private:
        std::unique_ptr<Player> inner_;
        std::vector<PlayerAction> history_;
    };

    inline auto WrapRecording(std::unique_ptr<Player> player) -> std::unique_ptr<RecordingPlayer>
    {
        return std::make_unique<RecordingPlayer>(std::move(player));
    }
} // namespace klondike::core::debug

#endif //KLONDIKE_RECORDINGPLAYER_HPP
