#pragma once

#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "wamlink/discovery/discovery.hpp"
#include "wamlink/server/command_gateway.hpp"
#include "wamlink/server/ws_server.hpp"
#include "wamlink/session/session_controller.hpp"
#include "wamlink/util/config_loader.hpp"

namespace wamlink::server {

class SessionServerApp {
public:
    SessionServerApp(boost::asio::io_context& io_context, util::ServerConfig config);
    ~SessionServerApp();

    void start();
    void stop();

    std::uint16_t port() const { return ws_server_.port(); }
    session::SessionController& controller() noexcept { return controller_; }

private:
    void schedule_keepalive_sweep();
    void auto_connect();

    boost::asio::io_context& io_context_;
    util::ServerConfig config_;
    session::SessionController controller_;
    discovery::StaticDiscovery discovery_;
    WsServer ws_server_;
    CommandGateway command_gateway_;
    std::unique_ptr<boost::asio::steady_timer> sweep_timer_;
    bool stopped_{false};
};

// Runs until SIGINT or SIGTERM. Returns the process exit code.
int run(const util::ServerConfig& config);

}  // namespace wamlink::server
