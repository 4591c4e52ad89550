//
// main.cpp: klondiked, one solitaire session per WebSocket++ connection
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Game.hpp"
#include "core/KlondikeRules.hpp"
#include "core/Exception.hpp"
#include "net/Channel.hpp"
#include "net/Session.hpp"

namespace
{
    using klondike::net::WsServer;
    using klondike::net::Hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::uint64_t seed{0};  // 0: fresh random seed per connection
        std::string   audit_dir{};
        bool          verbose{false};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v) && v <= 0xFFFF) { cfg.port = static_cast<std::uint16_t>(v); }
                else { fmt::print("[klondiked] ignoring bad --port\n"); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
                else { fmt::print("[klondiked] ignoring bad --seed\n"); }
            }
            else if (arg == "--audit_dir")
            {
                if (i + 1 < argc) { cfg.audit_dir = argv[++i]; }
            }
            else if (arg == "--verbose")
            {
                cfg.verbose = true;
            }
            else
            {
                fmt::print("[klondiked] unknown argument '{}'\n", arg);
            }
        }
        return cfg;
    }

    // Connection n gets seed + n so concurrent clients do not share a deal.
    auto SeedFor(ServerConfig const& sc, std::uint64_t ordinal) -> std::uint64_t
    {
        if (sc.seed == 0)
        {
            return std::random_device{}();
        }
        return sc.seed + ordinal;
    }
}

int main(int argc, char** argv)
{
    using namespace klondike;
    using namespace klondike::core;

    ServerConfig const sc = ParseArgs(argc, argv);

    if (!sc.audit_dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(sc.audit_dir, ec);
        if (ec)
        {
            fmt::print("[klondiked] cannot create audit dir {}: {}\n", sc.audit_dir, ec.message());
            return 1;
        }
    }

    fmt::print("[klondiked] starting on port {}\n", sc.port);

    auto ep = std::make_shared<WsServer>();
    ep->clear_access_channels(websocketpp::log::alevel::all);
    ep->clear_error_channels(websocketpp::log::elevel::all);

    ep->init_asio();
    ep->set_reuse_addr(true);

    std::map<Hdl, std::unique_ptr<klondike::net::Channel>, std::owner_less<Hdl>> channels;
    std::uint64_t ordinal{0};

    ep->set_open_handler([&](Hdl hdl)
    {
        Config cfg{};
        cfg.seed    = SeedFor(sc, ordinal);
        cfg.verbose = sc.verbose;

        auto session = std::make_unique<klondike::core::net::Session>(cfg, std::make_unique<KlondikeRules>());
        if (!sc.audit_dir.empty())
        {
            std::string const path = fmt::format("{}/session_{}.log", sc.audit_dir, ordinal);
            if (!session->EnableAudit(path))
            {
                fmt::print("[klondiked] cannot open transcript {}\n", path);
            }
        }

        auto chan = std::make_unique<klondike::net::Channel>(*ep, hdl, std::move(session));
        fmt::print("[klondiked] client {} connected (seed {})\n", ordinal, cfg.seed);
        ++ordinal;

        if (!chan->SendAll(chan->SessionRef().Greeting()))
        {
            fmt::print("[klondiked] greeting to client {} not delivered\n", ordinal - 1);
        }
        channels[hdl] = std::move(chan);
    });

    ep->set_close_handler([&](Hdl hdl)
    {
        auto it = channels.find(hdl);
        if (it == channels.end())
        {
            return;
        }
        it->second->MarkClosed();
        fmt::print("[klondiked] client disconnected after {} commit(s), won={}\n",
                   it->second->SessionRef().Game().Commits(),
                   it->second->SessionRef().Game().IsWon());
        channels.erase(it);
    });

    ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        auto it = channels.find(hdl);
        if (it == channels.end())
        {
            return;
        }

        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            if (sc.verbose) { fmt::print("[klondiked] ignoring non-binary frame\n"); }
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> bytes{
            reinterpret_cast<std::byte const*>(payload.data()), payload.size()
        };

        klondike::net::Channel& chan = *it->second;
        try
        {
            if (!chan.SendAll(chan.SessionRef().HandleFrame(bytes)) && sc.verbose)
            {
                fmt::print("[klondiked] reply dropped\n");
            }
        }
        catch (OmegaException<error::Code> const& e)
        {
            // committed board is untouched
            fmt::print("[klondiked] {}", e);
            websocketpp::lib::error_code ec;
            ep->close(hdl, websocketpp::close::status::internal_endpoint_error, "engine error", ec);
        }
    });

    websocketpp::lib::error_code ec;
    ep->listen(sc.port, ec);
    if (ec)
    {
        fmt::print("[klondiked] listen failed: {}\n", ec.message());
        return 1;
    }
    ep->start_accept();

    // Single-threaded: every handler above runs on this thread, one at a time.
    ep->run();

    fmt::print("[klondiked] stopped\n");
    return 0;
}
