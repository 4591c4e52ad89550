#ifndef KLONDIKE_CODEC_HPP
#define KLONDIKE_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/klondike_net_generated.h"

namespace klondike::core::net
{
    struct ParseError
    {
        std::string message;
    };

    // What a client frame decodes into
    struct DecodedAction
    {
        std::uint64_t msg_id{};
        klondike::core::PlayerAction action{};
    };

    auto ToFbSuit(klondike::core::Suit s) noexcept -> klondike::gen::net::Suit;
    auto ToFbRank(klondike::core::Rank r) noexcept -> klondike::gen::net::Rank;

    auto FromFbSuit(klondike::gen::net::Suit s) noexcept -> klondike::core::Suit;
    auto FromFbRank(klondike::gen::net::Rank r) noexcept -> klondike::core::Rank;

    // --- Outbound builders (server -> client) ---

    auto BuildSnapshot(klondike::core::GameSnapshot const& s,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(klondike::core::error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // Frames that never reached the rules (bad bytes, wrong message kind)
    auto BuildParseError(ParseError const& e,
                         std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildDragPreview(klondike::core::DragInfo const& d,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildWin(std::uint64_t commits,
                  std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Builders (client -> server) ---

    auto BuildAction_NewGame(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildAction_Draw(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildAction_DragStart(klondike::core::SlotId slot,
                               std::size_t index,
                               std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_DragEnd(std::optional<klondike::core::SlotId> source,
                             std::size_t index,
                             std::optional<klondike::core::SlotId> target,
                             std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_Query(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // Dispatches to the BuildAction_* above
    auto BuildAction(klondike::core::PlayerAction const& a,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode ---

    auto AsBytes(flatbuffers::DetachedBuffer const& buf) noexcept -> std::span<std::byte const>;

    // Verifies the buffer and reports which message it carries
    auto MessageTypeOf(std::span<std::byte const> bytes)
        -> std::expected<klondike::gen::net::Message, ParseError>;

    auto DecodeClientAction(std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>;

    auto DecodeSnapshot(std::span<std::byte const> bytes)
        -> std::expected<klondike::core::GameSnapshot, ParseError>;
} // namespace klondike::core::net


#endif //KLONDIKE_CODEC_HPP
