#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "wamlink/discovery/discovery.hpp"
#include "wamlink/server/ws_server.hpp"
#include "wamlink/session/session_controller.hpp"

namespace wamlink::server {

// Translates viewer requests into SessionController calls. Requests that
// talk to devices run on a small worker pool so the WebSocket loop never
// blocks on a speaker.
class CommandGateway {
public:
    CommandGateway(WsServer& ws_server,
                   session::SessionController& controller,
                   discovery::Discovery& discovery,
                   std::uint16_t default_device_port,
                   std::size_t worker_count = 4);
    ~CommandGateway();

    CommandGateway(const CommandGateway&) = delete;
    CommandGateway& operator=(const CommandGateway&) = delete;

    void handle_open(WsServer::SessionId session_id);
    void handle_close(WsServer::SessionId session_id);
    void handle_message(const std::string& text, WsServer::SessionId session_id);

    // Builds the reply for one parsed request from `viewer_id`. Failures are
    // returned as error replies, never thrown.
    nlohmann::json handle_request(const nlohmann::json& request, broadcast::ViewerConnection::Id viewer_id);

    void submit(std::function<void()> task);
    void stop();

private:
    nlohmann::json dispatch(const std::string& type,
                            const nlohmann::json& request,
                            broadcast::ViewerConnection::Id viewer_id);
    std::optional<broadcast::ViewerConnection::Id> viewer_of(WsServer::SessionId session_id) const;

    WsServer& ws_server_;
    session::SessionController& controller_;
    discovery::Discovery& discovery_;
    std::uint16_t default_device_port_;
    boost::asio::thread_pool workers_;
    bool stopped_{false};

    mutable std::mutex viewers_mutex_;
    std::unordered_map<WsServer::SessionId, broadcast::ViewerConnection::Id> viewers_;
};

}  // namespace wamlink::server
