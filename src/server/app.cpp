#include "wamlink/server/app.hpp"

#include <chrono>
#include <csignal>
#include <utility>

#include <boost/asio/signal_set.hpp>

#include "wamlink/core/errors.hpp"
#include "wamlink/transport/tcp_transport.hpp"
#include "wamlink/util/logging.hpp"

namespace wamlink::server {

SessionServerApp::SessionServerApp(boost::asio::io_context& io_context, util::ServerConfig config)
    : io_context_(io_context),
      config_(std::move(config)),
      controller_(std::make_shared<transport::TcpTransport>(config_.connect_timeout), config_.session),
      discovery_(util::descriptors_of(config_)),
      ws_server_(io_context_, config_.server.path),
      command_gateway_(ws_server_, controller_, discovery_, config_.default_device_port) {}

SessionServerApp::~SessionServerApp() {
    stop();
}

void SessionServerApp::start() {
    ws_server_.set_open_handler([this](WsServer::SessionId session_id) { command_gateway_.handle_open(session_id); });
    ws_server_.set_close_handler([this](WsServer::SessionId session_id) { command_gateway_.handle_close(session_id); });
    ws_server_.set_message_handler([this](const std::string& text, WsServer::SessionId session_id) {
        command_gateway_.handle_message(text, session_id);
    });

    ws_server_.start(config_.server.host, config_.server.port);

    sweep_timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);
    schedule_keepalive_sweep();
    auto_connect();
}

void SessionServerApp::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    if (sweep_timer_) {
        sweep_timer_->cancel();
    }
    util::log::info("Closing " + std::to_string(ws_server_.session_count()) + " viewer session(s)");
    ws_server_.stop();
    command_gateway_.stop();
    controller_.broadcaster().close_all("server shutting down");
    const auto disconnected = controller_.disconnect_all();
    util::log::info("Disconnected " + std::to_string(disconnected.size()) + " speaker(s)");
}

void SessionServerApp::schedule_keepalive_sweep() {
    if (!sweep_timer_) {
        return;
    }
    sweep_timer_->expires_after(config_.session.broadcaster.keepalive_interval);
    sweep_timer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopped_) {
            return;
        }
        controller_.broadcaster().expire_stale(std::chrono::steady_clock::now());
        schedule_keepalive_sweep();
    });
}

void SessionServerApp::auto_connect() {
    for (const auto& device : config_.devices) {
        if (!device.auto_connect) {
            continue;
        }
        command_gateway_.submit([this, descriptor = device.descriptor] {
            try {
                controller_.connect(descriptor);
            } catch (const Error& ex) {
                util::log::warn("Auto-connect to " + descriptor.id + " failed: " + ex.what());
            }
        });
    }
}

int run(const util::ServerConfig& config) {
    try {
        boost::asio::io_context io_context;
        SessionServerApp app(io_context, config);
        app.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            util::log::info("Signal received, shutting down...");
            app.stop();
            io_context.stop();
        });

        io_context.run();
    } catch (const std::exception& ex) {
        util::log::error(std::string("Fatal error: ") + ex.what());
        return 1;
    }
    return 0;
}

}  // namespace wamlink::server
