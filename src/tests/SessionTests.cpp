#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

#include "../core/KlondikeRules.hpp"
#include "../net/Session.hpp"
#include "../net/codec.hpp"
#include "Boards.hpp"

using namespace klondike::core;
using namespace klondike::core::net;
namespace fb = ::klondike::gen::net;

namespace
{
    auto MakeSession(std::uint64_t seed) -> Session
    {
        Config cfg{};
        cfg.seed = seed;
        return Session(cfg, std::make_unique<KlondikeRules>());
    }

    auto Kinds(std::vector<Session::Frame> const& frames) -> std::vector<fb::Message>
    {
        std::vector<fb::Message> out;
        for (Session::Frame const& f : frames)
        {
            auto const kind = MessageTypeOf(AsBytes(f));
            EXPECT_TRUE(kind.has_value());
            out.push_back(kind.value_or(fb::Message::NONE));
        }
        return out;
    }

    auto Violation(Session::Frame const& f) -> fb::ViolationMsg const*
    {
        return fb::GetEnvelope(f.data())->message_as_ViolationMsg();
    }
}

TEST(Session, GreetsWithTheDeal)
{
    Session s = MakeSession(1);
    auto const frames = s.Greeting();
    ASSERT_EQ(Kinds(frames), std::vector{fb::Message::SnapshotMsg});

    auto const snap = DecodeSnapshot(AsBytes(frames.front()));
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->slots[0].cards.size(), 24u);
    EXPECT_FALSE(snap->won);
}

TEST(Session, DrawReturnsASnapshot)
{
    Session s = MakeSession(2);
    auto const frames = s.HandleFrame(AsBytes(BuildAction_Draw(1)));
    ASSERT_EQ(Kinds(frames), std::vector{fb::Message::SnapshotMsg});

    auto const snap = DecodeSnapshot(AsBytes(frames.front()));
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->slots[0].cards.size(), 23u);
    EXPECT_EQ(snap->slots[1].cards.size(), 1u);
    EXPECT_EQ(snap->commits, 1u);
}

TEST(Session, RejectionSendsViolationThenSnapshot)
{
    Session s = MakeSession(3);
    auto const frames = s.HandleFrame(AsBytes(BuildAction_DragEnd(SlotId{13}, 6, SlotId{13}, 1)));
    ASSERT_EQ(Kinds(frames), (std::vector{fb::Message::ViolationMsg, fb::Message::SnapshotMsg}));
    EXPECT_EQ(Violation(frames[0])->code(), static_cast<int16_t>(error::RuleViolationCode::Move_SameSlot));
    EXPECT_EQ(s.Game().Commits(), 0u);
}

TEST(Session, DragStartSendsPreview)
{
    Session s = MakeSession(4);
    Card const top = s.Game().SlotAt(13).Top();

    auto const frames = s.HandleAction(DragStartAction{ .source = 13, .index = 6 });
    ASSERT_EQ(Kinds(frames), (std::vector{fb::Message::DragPreviewMsg, fb::Message::SnapshotMsg}));

    auto const* dp = fb::GetEnvelope(frames[0].data())->message_as_DragPreviewMsg();
    EXPECT_EQ(dp->slot(), 13);
    EXPECT_EQ(dp->index(), 6u);
    ASSERT_EQ(dp->cards()->size(), 1u);
    EXPECT_EQ(FromFbSuit(dp->cards()->Get(0)->suit()), top.suit);
    EXPECT_EQ(FromFbRank(dp->cards()->Get(0)->rank()), top.rank);
}

TEST(Session, GarbageIsReportedNotApplied)
{
    Session s = MakeSession(5);
    std::vector<std::byte> const junk(16, std::byte{0xFF});

    auto const frames = s.HandleFrame(junk);
    ASSERT_EQ(Kinds(frames), std::vector{fb::Message::ViolationMsg});
    EXPECT_LT(Violation(frames[0])->code(), 0);
    EXPECT_EQ(s.Game().Commits(), 0u);
}

TEST(Session, WinFrameIsSentOnce)
{
    Config cfg{};
    cfg.seed = 6;
    Session s(cfg, std::make_unique<KlondikeRules>(), klondike::test::NearlyWon());

    auto const frames = s.HandleAction(DragEndAction{ .source = 7, .index = 0, .target = 6 });
    ASSERT_EQ(Kinds(frames), (std::vector{fb::Message::SnapshotMsg, fb::Message::WinMsg}));

    auto const snap = DecodeSnapshot(AsBytes(frames[0]));
    ASSERT_TRUE(snap.has_value());
    EXPECT_TRUE(snap->won);

    auto const again = s.HandleAction(DrawAction{});
    ASSERT_EQ(Kinds(again), (std::vector{fb::Message::ViolationMsg, fb::Message::SnapshotMsg}));
    EXPECT_EQ(Violation(again[0])->code(), static_cast<int16_t>(error::RuleViolationCode::Game_AlreadyWon));
}

TEST(Session, MessageIdsIncrease)
{
    Session s = MakeSession(7);
    (void)s.Greeting();
    (void)s.HandleAction(QueryAction{});
    (void)s.HandleAction(DrawAction{});
    EXPECT_EQ(s.FramesSent(), 3u);
}

TEST(Session, AuditTranscript)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    std::string const path = "_artifacts/session_audit.log";

    {
        Session s = MakeSession(8);
        ASSERT_TRUE(s.EnableAudit(path));
        (void)s.HandleAction(DrawAction{});
        (void)s.HandleAction(DragEndAction{ .source = 13, .index = 6, .target = 0 });
    }

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    std::string const text = ss.str();
    EXPECT_NE(text.find("Seed=8"), std::string::npos);
    EXPECT_NE(text.find("Action: Draw"), std::string::npos);
    EXPECT_NE(text.find("Outcome: Applied"), std::string::npos);
    EXPECT_NE(text.find("Outcome: Invalid (Target: slot does not accept drops"), std::string::npos);
}
