//
// Channel.cpp
//

#include "net/Channel.hpp"

#include <fmt/format.h>
#include <utility>

namespace klondike::net
{
    Channel::Channel(WsServer& ep, Hdl hdl, std::unique_ptr<klondike::core::net::Session> session)
        : ep_{&ep}
          , hdl_{std::move(hdl)}
          , session_{std::move(session)}
    {
    }

    auto Channel::SendBinary(std::span<const std::byte> bytes) -> bool
    {
        if (!connected_)
        {
            return false;
        }

        websocketpp::lib::error_code ec;
        ep_->send(hdl_,
                  reinterpret_cast<const void*>(bytes.data()),
                  bytes.size(),
                  websocketpp::frame::opcode::binary,
                  ec);
        if (ec)
        {
            fmt::print("[klondiked] send() error: {}\n", ec.message());
            return false;
        }
        return true;
    }

    auto Channel::SendAll(std::vector<klondike::core::net::Session::Frame> const& frames) -> bool
    {
        for (klondike::core::net::Session::Frame const& f : frames)
        {
            if (!SendBinary(klondike::core::net::AsBytes(f)))
            {
                return false;
            }
        }
        return true;
    }
}
