#include "wamlink/server/ws_server.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "wamlink/util/logging.hpp"

namespace wamlink::server {

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

constexpr auto kHandshakeTimeout = std::chrono::seconds(30);
}  // namespace

class WsSession : public std::enable_shared_from_this<WsSession> {
public:
    WsSession(tcp::socket&& socket, WsServer& server, WsServer::SessionId id)
        : ws_(std::move(socket)), server_(server), id_(id) {}

    void run() {
        asio::dispatch(ws_.get_executor(), beast::bind_front_handler(&WsSession::do_read_request, shared_from_this()));
    }

    void bind(std::shared_ptr<broadcast::ViewerConnection> outbox) {
        asio::post(ws_.get_executor(), [self = shared_from_this(), outbox = std::move(outbox)]() mutable {
            std::weak_ptr<WsSession> weak = self;
            outbox->set_ready_handler([weak] {
                if (auto session = weak.lock()) {
                    asio::post(session->ws_.get_executor(), [session] { session->drain(); });
                }
            });
            self->outbox_ = std::move(outbox);
            self->drain();
        });
    }

    void shutdown(const std::string& reason) {
        asio::post(ws_.get_executor(), [self = shared_from_this(), reason] {
            // A close frame must not overlap a pending write; drain() closes once idle.
            if (self->outbox_) {
                self->outbox_->close(reason);
                self->drain();
            } else {
                self->close_socket(reason);
            }
        });
    }

private:
    void do_read_request() {
        beast::get_lowest_layer(ws_).expires_after(kHandshakeTimeout);
        http::async_read(ws_.next_layer(), http_buffer_, request_,
                         beast::bind_front_handler(&WsSession::on_read_request, shared_from_this()));
    }

    void on_read_request(beast::error_code ec, std::size_t) {
        if (ec) {
            util::log::debug("Viewer handshake read failed: " + ec.message());
            return;
        }
        if (!websocket::is_upgrade(request_)) {
            respond(http::status::bad_request, "WebSocket upgrade required");
            return;
        }
        const auto target = request_.target();
        std::string path(target.data(), target.size());
        if (auto query = path.find('?'); query != std::string::npos) {
            path.erase(query);
        }
        if (path != server_.path_) {
            respond(http::status::not_found, "Unsupported path");
            return;
        }

        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) { res.set(http::field::server, "wamlink-server/0.1"); }));
        ws_.async_accept(request_, beast::bind_front_handler(&WsSession::on_accept, shared_from_this()));
    }

    void respond(http::status status, const std::string& body) {
        auto response = std::make_shared<http::response<http::string_body>>(status, request_.version());
        response->set(http::field::server, "wamlink-server/0.1");
        response->set(http::field::content_type, "text/plain");
        response->keep_alive(false);
        response->body() = body;
        response->prepare_payload();
        http::async_write(ws_.next_layer(), *response,
                          [self = shared_from_this(), response](beast::error_code, std::size_t) {
                              beast::error_code ignored;
                              beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send, ignored);
                          });
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            util::log::warn("Viewer WebSocket accept failed: " + ec.message());
            return;
        }
        server_.on_session_open(id_, shared_from_this());
        do_read();
    }

    void do_read() {
        ws_.async_read(read_buffer_, beast::bind_front_handler(&WsSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                util::log::debug("Viewer " + std::to_string(id_) + " read error: " + ec.message());
            }
            finish();
            return;
        }
        auto text = beast::buffers_to_string(read_buffer_.data());
        read_buffer_.consume(read_buffer_.size());
        server_.on_session_message(id_, text);
        do_read();
    }

    void drain() {
        if (writing_ || closing_ || finished_ || !outbox_) {
            return;
        }
        auto next = outbox_->try_pop();
        if (!next) {
            if (!outbox_->is_open()) {
                close_socket(outbox_->close_reason());
            }
            return;
        }
        writing_ = true;
        current_ = std::move(*next);
        ws_.text(true);
        ws_.async_write(asio::buffer(current_), beast::bind_front_handler(&WsSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        writing_ = false;
        if (ec) {
            util::log::debug("Viewer " + std::to_string(id_) + " write error: " + ec.message());
            finish();
            return;
        }
        drain();
    }

    void close_socket(const std::string& reason) {
        if (closing_ || finished_) {
            return;
        }
        closing_ = true;
        const auto text = reason.substr(0, 120);
        websocket::close_reason close_reason(websocket::close_code::going_away, beast::string_view(text.data(), text.size()));
        ws_.async_close(close_reason, [self = shared_from_this()](beast::error_code) { self->finish(); });
    }

    void finish() {
        if (finished_) {
            return;
        }
        finished_ = true;
        if (outbox_) {
            outbox_->set_ready_handler({});
        }
        server_.on_session_close(id_);
    }

    websocket::stream<beast::tcp_stream> ws_;
    WsServer& server_;
    const WsServer::SessionId id_;
    beast::flat_buffer http_buffer_;
    http::request<http::string_body> request_;
    beast::flat_buffer read_buffer_;
    std::shared_ptr<broadcast::ViewerConnection> outbox_;
    std::string current_;
    bool writing_{false};
    bool closing_{false};
    bool finished_{false};
};

WsServer::WsServer(boost::asio::io_context& io_context, std::string path)
    : io_context_(io_context), path_(std::move(path)) {}

WsServer::~WsServer() {
    stop();
}

void WsServer::set_open_handler(OpenHandler handler) {
    open_handler_ = std::move(handler);
}

void WsServer::set_close_handler(CloseHandler handler) {
    close_handler_ = std::move(handler);
}

void WsServer::set_message_handler(MessageHandler handler) {
    message_handler_ = std::move(handler);
}

void WsServer::start(const std::string& host, std::uint16_t port) {
    if (acceptor_) {
        return;
    }
    const tcp::endpoint endpoint(asio::ip::make_address(host), port);
    acceptor_ = std::make_unique<tcp::acceptor>(asio::make_strand(io_context_));
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(asio::socket_base::max_listen_connections);
    util::log::info("Viewer WebSocket listening on ws://" + host + ":" + std::to_string(this->port()) + path_);
    do_accept();
}

void WsServer::stop() {
    if (acceptor_) {
        beast::error_code ec;
        acceptor_->close(ec);
        acceptor_.reset();
    }
    std::unordered_map<SessionId, std::weak_ptr<WsSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions = sessions_;
    }
    for (auto& [id, weak] : sessions) {
        if (auto session = weak.lock()) {
            session->shutdown("server shutting down");
        }
    }
}

void WsServer::do_accept() {
    acceptor_->async_accept(asio::make_strand(io_context_), [this](beast::error_code ec, tcp::socket socket) {
        if (!acceptor_ || !acceptor_->is_open()) {
            return;
        }
        if (ec) {
            util::log::warn("Viewer accept error: " + ec.message());
        } else {
            SessionId id;
            {
                std::lock_guard<std::mutex> lock(sessions_mutex_);
                id = next_session_id_++;
            }
            std::make_shared<WsSession>(std::move(socket), *this, id)->run();
        }
        do_accept();
    });
}

bool WsServer::bind_outbox(SessionId id, std::shared_ptr<broadcast::ViewerConnection> outbox) {
    std::shared_ptr<WsSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second.lock();
    }
    if (!session) {
        return false;
    }
    session->bind(std::move(outbox));
    return true;
}

std::size_t WsServer::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::uint16_t WsServer::port() const {
    if (!acceptor_) {
        return 0;
    }
    beast::error_code ec;
    const auto endpoint = acceptor_->local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void WsServer::on_session_open(SessionId id, const std::shared_ptr<WsSession>& session) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[id] = session;
    }
    if (open_handler_) {
        open_handler_(id);
    }
}

void WsServer::on_session_message(SessionId id, const std::string& text) {
    if (message_handler_) {
        message_handler_(text, id);
    }
}

void WsServer::on_session_close(SessionId id) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(id);
    }
    if (close_handler_) {
        close_handler_(id);
    }
}

}  // namespace wamlink::server
