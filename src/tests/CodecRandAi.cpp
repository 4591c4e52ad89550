#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <span>
#include <variant>
#include <vector>

#include "../core/Game.hpp"
#include "../core/KlondikeRules.hpp"
#include "../core/RandomAi.hpp"
#include "../debug/Inspector.hpp"
#include "../net/codec.hpp"
#include "Boards.hpp"

using namespace klondike::core;
using namespace klondike::core::net;
namespace fb = ::klondike::gen::net;

namespace
{
    // Field-by-field equality of two actions of the same kind
    auto SameAction(PlayerAction const& a, PlayerAction const& b) -> bool
    {
        if (a.index() != b.index()) return false;
        if (auto const* x = std::get_if<DragStartAction>(&a))
        {
            auto const& y = std::get<DragStartAction>(b);
            return x->source == y.source && x->index == y.index;
        }
        if (auto const* x = std::get_if<DragEndAction>(&a))
        {
            auto const& y = std::get<DragEndAction>(b);
            return x->source == y.source && x->index == y.index && x->target == y.target;
        }
        return true;
    }

    auto Garbage(size_t n) -> std::vector<std::byte>
    {
        std::vector<std::byte> out(n);
        for (size_t i{}; i < n; ++i) out[i] = static_cast<std::byte>((i * 37 + 11) & 0xFF);
        return out;
    }
}

TEST(Codec_RandomAI, ActionsSurviveTheWire)
{
    GameImpl g = klondike::test::MakeGame(31);
    RandomAI ai{32, /*noise*/ 0.3};

    for (std::uint64_t id = 1; id <= 200 && !g.IsWon(); ++id)
    {
        PlayerAction const a = ai.Play(g.Snapshot());
        auto const buf = BuildAction(a, id);

        auto const decoded = DecodeClientAction(AsBytes(buf));
        ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
        EXPECT_EQ(decoded->msg_id, id);
        EXPECT_TRUE(SameAction(decoded->action, a));

        (void)g.Step(decoded->action);
    }
}

TEST(Codec_RandomAI, DragEndKeepsMissingEnds)
{
    auto const buf = BuildAction_DragEnd(std::nullopt, 4, SlotId{9}, 7);
    auto const decoded = DecodeClientAction(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value());

    auto const* d = std::get_if<DragEndAction>(&decoded->action);
    ASSERT_NE(d, nullptr);
    EXPECT_FALSE(d->source.has_value());
    EXPECT_EQ(d->index, 4u);
    ASSERT_TRUE(d->target.has_value());
    EXPECT_EQ(*d->target, 9);
}

TEST(Codec_RandomAI, DecodeRejectsBadFrames)
{
    std::vector<std::byte> const tiny = Garbage(2);
    EXPECT_FALSE(DecodeClientAction(tiny).has_value());

    std::vector<std::byte> const noise = Garbage(64);
    EXPECT_FALSE(DecodeClientAction(noise).has_value());

    // well-formed, but a server message
    auto const snap = BuildWin(3, 1);
    auto const wrong = DecodeClientAction(AsBytes(snap));
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().message, "not a ClientActionMsg");
}

TEST(Codec_RandomAI, BuildSnapshot_MatchesAuthoritativeState)
{
    GameImpl g = klondike::test::MakeGame(55);
    ASSERT_EQ(g.Draw(), MoveOutcome::Applied);
    auto const live = g.Snapshot();

    auto const buf = BuildSnapshot(*live, 9);
    auto const kind = MessageTypeOf(AsBytes(buf));
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, fb::Message::SnapshotMsg);

    auto const back = DecodeSnapshot(AsBytes(buf));
    ASSERT_TRUE(back.has_value()) << back.error().message;
    EXPECT_EQ(back->won, live->won);
    EXPECT_EQ(back->commits, live->commits);

    Board const& board = klondike::core::debug::Inspector::BoardOf(g);
    for (size_t i{}; i < constants::SlotCount; ++i)
    {
        SlotView const& v = back->slots[i];
        EXPECT_EQ(v.id, i);
        EXPECT_EQ(v.accepts_drops, live->slots[i].accepts_drops);
        EXPECT_EQ(v.draggable, live->slots[i].draggable);
        EXPECT_EQ(v.clickable, live->slots[i].clickable);
        ASSERT_EQ(v.cards.size(), board[i].Size());
        for (size_t c{}; c < v.cards.size(); ++c)
        {
            EXPECT_EQ(v.cards[c].card, board[i].cards[c]);
            EXPECT_EQ(v.cards[c].card.face_up, board[i].cards[c].face_up);
            EXPECT_EQ(v.cards[c].draggable, live->slots[i].cards[c].draggable);
        }
    }
}

TEST(Codec_RandomAI, ViolationCarriesCodeAndText)
{
    GameImpl g = klondike::test::MakeGame(4);
    ASSERT_EQ(g.DragEnd(13, 6, 0), MoveOutcome::Invalid);

    auto const buf = BuildViolation(*g.LastViolation(), 12);
    auto const* env = fb::GetEnvelope(buf.data());
    ASSERT_EQ(env->message_type(), fb::Message::ViolationMsg);

    auto const* v = env->message_as_ViolationMsg();
    EXPECT_EQ(v->msg_id(), 12u);
    EXPECT_EQ(v->code(), static_cast<int16_t>(error::RuleViolationCode::Target_NotDroppable));
    EXPECT_EQ(v->text()->str(), error::describe(*g.LastViolation()));
}
