#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>

#include "wamlink/transport/transport.hpp"

namespace wamlink::transport {

// Newline-delimited JSON frames over a plain TCP socket.
class TcpConnection : public Connection {
public:
    TcpConnection();
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    void connect(const std::string& address, std::uint16_t port, std::chrono::milliseconds timeout);

    void write(const Frame& frame) override;
    std::optional<Frame> read_next() override;
    void close() override;

private:
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::streambuf read_buffer_;
    std::mutex close_mutex_;
    std::atomic<bool> closed_{false};
};

class TcpTransport : public Transport {
public:
    explicit TcpTransport(std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(3000));

    std::shared_ptr<Connection> open(const std::string& address, std::uint16_t port) override;

private:
    std::chrono::milliseconds connect_timeout_;
};

}  // namespace wamlink::transport
