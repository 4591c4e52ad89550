//
// Channel.hpp: one WebSocket++ connection and the session it drives
//

#ifndef KLONDIKE_CHANNEL_HPP
#define KLONDIKE_CHANNEL_HPP

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "net/Session.hpp"

namespace klondike::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    class Channel
    {
    public:
        Channel(WsServer& ep, Hdl hdl, std::unique_ptr<klondike::core::net::Session> session);

        auto SendBinary(std::span<const std::byte> bytes) -> bool;

        // Sends every frame in order; stops at the first failed send.
        auto SendAll(std::vector<klondike::core::net::Session::Frame> const& frames) -> bool;

        auto SessionRef() noexcept -> klondike::core::net::Session& { return *session_; }

        auto MarkClosed() noexcept -> void { connected_ = false; }
        auto Connected() const noexcept -> bool { return connected_; }

    private:
        WsServer* ep_;
        Hdl hdl_;
        std::unique_ptr<klondike::core::net::Session> session_;
        bool connected_{true};
    };
}

#endif // KLONDIKE_CHANNEL_HPP
