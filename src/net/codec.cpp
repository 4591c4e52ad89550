//
// codec.cpp
//
#include "codec.hpp"

#include <fmt/format.h>
#include <type_traits>
#include <utility>
#include <variant>

namespace fb = ::klondike::gen::net;

namespace klondike::core::net
{
    auto ToFbSuit(klondike::core::Suit s) noexcept -> fb::Suit
    {
        switch (s)
        {
        case klondike::core::Suit::Hearts: return fb::Suit::Hearts;
        case klondike::core::Suit::Diamonds: return fb::Suit::Diamonds;
        case klondike::core::Suit::Clubs: return fb::Suit::Clubs;
        case klondike::core::Suit::Spades: return fb::Suit::Spades;
        }
        return fb::Suit::Hearts;
    }

    auto FromFbSuit(fb::Suit s) noexcept -> klondike::core::Suit
    {
        switch (s)
        {
        case fb::Suit::Hearts: return klondike::core::Suit::Hearts;
        case fb::Suit::Diamonds: return klondike::core::Suit::Diamonds;
        case fb::Suit::Clubs: return klondike::core::Suit::Clubs;
        case fb::Suit::Spades: return klondike::core::Suit::Spades;
        }
        return klondike::core::Suit::Hearts;
    }

    // Both enums run Ace..King from zero (asserted below).
    auto ToFbRank(klondike::core::Rank r) noexcept -> fb::Rank
    {
        return static_cast<fb::Rank>(std::to_underlying(r));
    }

    auto FromFbRank(fb::Rank r) noexcept -> klondike::core::Rank
    {
        auto const raw = static_cast<int>(r);
        if (raw < 0 || raw >= static_cast<int>(constants::CardsPerSuit))
        {
            return klondike::core::Rank::Ace;
        }
        return static_cast<klondike::core::Rank>(raw);
    }
}

namespace
{
    // Verify enum layouts (first and last value catch drift)
    static_assert((int)klondike::core::Suit::Hearts == (int)fb::Suit::Hearts);
    static_assert((int)klondike::core::Suit::Spades == (int)fb::Suit::Spades);
    static_assert((int)klondike::core::Rank::Ace == (int)fb::Rank::Ace);
    static_assert((int)klondike::core::Rank::King == (int)fb::Rank::King);

    inline auto finish(flatbuffers::FlatBufferBuilder& fbb,
                       fb::Message type,
                       flatbuffers::Offset<void> msg)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, type, msg);
        fbb.Finish(env);
        return fbb.Release();
    }

    inline auto finish_action(flatbuffers::FlatBufferBuilder& fbb,
                              std::uint64_t msg_id,
                              fb::Action type,
                              flatbuffers::Offset<void> act)
        -> flatbuffers::DetachedBuffer
    {
        auto const m = fb::CreateClientActionMsg(fbb, msg_id, type, act);
        return finish(fbb, fb::Message::ClientActionMsg, m.Union());
    }

    // Verified root or nothing
    inline auto verified_envelope(std::span<std::byte const> bytes)
        -> std::expected<fb::Envelope const*, klondike::core::net::ParseError>
    {
        using klondike::core::net::ParseError;

        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"buffer failed verification"});

        auto const* env = fb::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        return env;
    }
} // anonymous

namespace klondike::core::net
{
    // ---------- Server -> client ----------

    auto BuildSnapshot(klondike::core::GameSnapshot const& s,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::SlotView>> slots;
        slots.reserve(s.slots.size());
        for (klondike::core::SlotView const& sv : s.slots)
        {
            std::vector<flatbuffers::Offset<fb::CardView>> cards;
            cards.reserve(sv.cards.size());
            for (klondike::core::CardView const& cv : sv.cards)
            {
                cards.push_back(fb::CreateCardView(fbb,
                                                   ToFbSuit(cv.card.suit),
                                                   ToFbRank(cv.card.rank),
                                                   cv.card.face_up,
                                                   cv.draggable));
            }
            auto const card_vec = fbb.CreateVector(cards);

            slots.push_back(fb::CreateSlotView(
                fbb,
                /*id*/ sv.id,
                /*cards*/ card_vec,
                /*accepts_drops*/ sv.accepts_drops,
                /*draggable*/ sv.draggable,
                /*clickable*/ sv.clickable
            ));
        }
        auto const slot_vec = fbb.CreateVector(slots);

        auto const view = fb::CreateBoardView(
            fbb,
            /*schema_version*/ 1,
            /*slots*/ slot_vec,
            /*won*/ s.won,
            /*commits*/ s.commits
        );

        auto const sm = fb::CreateSnapshotMsg(fbb, msg_id, view);
        return finish(fbb, fb::Message::SnapshotMsg, sm.Union());
    }

    auto BuildViolation(klondike::core::error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(klondike::core::error::describe(v));
        auto const vio = fb::CreateViolationMsg(
            fbb, msg_id, static_cast<int16_t>(v.code), txt);
        return finish(fbb, fb::Message::ViolationMsg, vio.Union());
    }

    auto BuildParseError(ParseError const& e,
                         std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(fmt::format("parse error: {}", e.message));
        auto const vio = fb::CreateViolationMsg(fbb, msg_id, /*code*/ -1, txt);
        return finish(fbb, fb::Message::ViolationMsg, vio.Union());
    }

    auto BuildDragPreview(klondike::core::DragInfo const& d,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::Card>> cards;
        cards.reserve(d.cards.size());
        for (klondike::core::Card const& c : d.cards)
        {
            cards.push_back(fb::CreateCard(fbb, ToFbSuit(c.suit), ToFbRank(c.rank), c.face_up));
        }
        auto const card_vec = fbb.CreateVector(cards);

        auto const dp = fb::CreateDragPreviewMsg(
            fbb, msg_id, d.source, static_cast<std::uint32_t>(d.index), card_vec);
        return finish(fbb, fb::Message::DragPreviewMsg, dp.Union());
    }

    auto BuildWin(std::uint64_t commits,
                  std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const w = fb::CreateWinMsg(fbb, msg_id, commits);
        return finish(fbb, fb::Message::WinMsg, w.Union());
    }

    // ---------- Client -> server ----------

    auto BuildAction_NewGame(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const a = fb::CreateAction_NewGame(fbb);
        return finish_action(fbb, msg_id, fb::Action::Action_NewGame, a.Union());
    }

    auto BuildAction_Draw(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const a = fb::CreateAction_Draw(fbb);
        return finish_action(fbb, msg_id, fb::Action::Action_Draw, a.Union());
    }

    auto BuildAction_DragStart(klondike::core::SlotId slot,
                               std::size_t index,
                               std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const a = fb::CreateAction_DragStart(fbb, slot, static_cast<std::uint32_t>(index));
        return finish_action(fbb, msg_id, fb::Action::Action_DragStart, a.Union());
    }

    auto BuildAction_DragEnd(std::optional<klondike::core::SlotId> source,
                             std::size_t index,
                             std::optional<klondike::core::SlotId> target,
                             std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const a = fb::CreateAction_DragEnd(
            fbb,
            /*has_source*/ source.has_value(),
            /*source*/ source.value_or(0),
            /*index*/ static_cast<std::uint32_t>(index),
            /*has_target*/ target.has_value(),
            /*target*/ target.value_or(0)
        );
        return finish_action(fbb, msg_id, fb::Action::Action_DragEnd, a.Union());
    }

    auto BuildAction_Query(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const a = fb::CreateAction_Query(fbb);
        return finish_action(fbb, msg_id, fb::Action::Action_Query, a.Union());
    }

    auto BuildAction(klondike::core::PlayerAction const& a,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        return std::visit(
            [&]<typename T0>(T0 const& act) -> flatbuffers::DetachedBuffer
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, NewGameAction>)
                {
                    return BuildAction_NewGame(msg_id);
                }
                else if constexpr (std::is_same_v<T, DrawAction>)
                {
                    return BuildAction_Draw(msg_id);
                }
                else if constexpr (std::is_same_v<T, DragStartAction>)
                {
                    return BuildAction_DragStart(act.source, act.index, msg_id);
                }
                else if constexpr (std::is_same_v<T, DragEndAction>)
                {
                    return BuildAction_DragEnd(act.source, act.index, act.target, msg_id);
                }
                else
                {
                    static_assert(std::is_same_v<T, QueryAction>, "unhandled action kind");
                    return BuildAction_Query(msg_id);
                }
            },
            a
        );
    }

    // ---------- Decode ----------

    auto AsBytes(flatbuffers::DetachedBuffer const& buf) noexcept -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }

    auto MessageTypeOf(std::span<std::byte const> bytes)
        -> std::expected<fb::Message, ParseError>
    {
        auto const env = verified_envelope(bytes);
        if (!env)
            return std::unexpected(env.error());
        return (*env)->message_type();
    }

    auto DecodeClientAction(std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>
    {
        auto const env = verified_envelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::ClientActionMsg)
            return std::unexpected(ParseError{"not a ClientActionMsg"});

        auto const* cam = (*env)->message_as_ClientActionMsg();
        if (!cam)
            return std::unexpected(ParseError{"empty ClientActionMsg"});

        DecodedAction out{};
        out.msg_id = cam->msg_id();

        switch (cam->action_type())
        {
        case fb::Action::Action_NewGame:
        {
            out.action = klondike::core::NewGameAction{};
            return out;
        }

        case fb::Action::Action_Draw:
        {
            out.action = klondike::core::DrawAction{};
            return out;
        }

        case fb::Action::Action_DragStart:
        {
            auto const* d = cam->action_as_Action_DragStart();
            if (!d)
                return std::unexpected(ParseError{"DragStart without a body"});
            out.action = klondike::core::DragStartAction{
                .source = static_cast<klondike::core::SlotId>(d->slot()),
                .index = static_cast<std::size_t>(d->index())
            };
            return out;
        }

        case fb::Action::Action_DragEnd:
        {
            auto const* d = cam->action_as_Action_DragEnd();
            if (!d)
                return std::unexpected(ParseError{"DragEnd without a body"});
            klondike::core::DragEndAction act{};
            if (d->has_source()) act.source = static_cast<klondike::core::SlotId>(d->source());
            if (d->has_target()) act.target = static_cast<klondike::core::SlotId>(d->target());
            act.index = static_cast<std::size_t>(d->index());
            out.action = act;
            return out;
        }

        case fb::Action::Action_Query:
        {
            out.action = klondike::core::QueryAction{};
            return out;
        }

        default:
            return std::unexpected(ParseError{"unknown action variant"});
        }
    }

    auto DecodeSnapshot(std::span<std::byte const> bytes)
        -> std::expected<klondike::core::GameSnapshot, ParseError>
    {
        auto const env = verified_envelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::SnapshotMsg)
            return std::unexpected(ParseError{"not a SnapshotMsg"});

        auto const* sm = (*env)->message_as_SnapshotMsg();
        auto const* view = sm ? sm->view() : nullptr;
        if (!view || !view->slots() || view->slots()->size() != constants::SlotCount)
            return std::unexpected(ParseError{"snapshot without 14 slots"});

        klondike::core::GameSnapshot out{};
        out.won = view->won();
        out.commits = view->commits();

        for (flatbuffers::uoffset_t i{}; i < view->slots()->size(); ++i)
        {
            auto const* fb_slot = view->slots()->Get(i);
            if (fb_slot->id() != i)
                return std::unexpected(ParseError{fmt::format("slot {} out of order", i)});

            klondike::core::SlotView& sv = out.slots[i];
            sv.id = fb_slot->id();
            sv.accepts_drops = fb_slot->accepts_drops();
            sv.draggable = fb_slot->draggable();
            sv.clickable = fb_slot->clickable();

            if (auto const* cards = fb_slot->cards())
            {
                sv.cards.reserve(cards->size());
                for (auto const* fb_c : *cards)
                {
                    sv.cards.push_back(klondike::core::CardView{
                        .card = klondike::core::Card{FromFbSuit(fb_c->suit()), FromFbRank(fb_c->rank()), fb_c->face_up()},
                        .draggable = fb_c->draggable()
                    });
                }
            }
        }
        return out;
    }
} // namespace klondike::core::net
