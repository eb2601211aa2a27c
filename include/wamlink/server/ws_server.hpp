#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "wamlink/broadcast/viewer_connection.hpp"

namespace wamlink::server {

class WsSession;

// Accepts viewer WebSockets on one path. Outbound traffic is pulled from
// the ViewerConnection bound to each session; inbound text goes to the
// message handler.
class WsServer {
public:
    using SessionId = std::uint64_t;
    using OpenHandler = std::function<void(SessionId)>;
    using CloseHandler = std::function<void(SessionId)>;
    using MessageHandler = std::function<void(const std::string&, SessionId)>;

    WsServer(boost::asio::io_context& io_context, std::string path);
    ~WsServer();

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    void set_open_handler(OpenHandler handler);
    void set_close_handler(CloseHandler handler);
    void set_message_handler(MessageHandler handler);

    void start(const std::string& host, std::uint16_t port);
    void stop();

    // Messages queued on `outbox` are written to the session in order; the
    // session closes once the outbox is closed and drained.
    bool bind_outbox(SessionId id, std::shared_ptr<broadcast::ViewerConnection> outbox);
    std::size_t session_count() const;
    // Bound port once started; 0 otherwise.
    std::uint16_t port() const;

private:
    friend class WsSession;

    void do_accept();
    void on_session_open(SessionId id, const std::shared_ptr<WsSession>& session);
    void on_session_message(SessionId id, const std::string& text);
    void on_session_close(SessionId id);

    boost::asio::io_context& io_context_;
    std::string path_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    OpenHandler open_handler_;
    CloseHandler close_handler_;
    MessageHandler message_handler_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<SessionId, std::weak_ptr<WsSession>> sessions_;
    SessionId next_session_id_{1};
};

}  // namespace wamlink::server
