#include "wamlink/transport/tcp_transport.hpp"

#include <istream>

#include <boost/asio/connect.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include "wamlink/util/logging.hpp"

namespace wamlink::transport {

namespace {
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using Json = nlohmann::json;
}  // namespace

TcpConnection::TcpConnection()
    : socket_(io_context_) {}

TcpConnection::~TcpConnection() {
    close();
    boost::system::error_code ec;
    socket_.close(ec);
}

void TcpConnection::connect(const std::string& address, std::uint16_t port, std::chrono::milliseconds timeout) {
    tcp::resolver resolver(io_context_);
    boost::system::error_code resolve_ec;
    auto const results = resolver.resolve(address, std::to_string(port), resolve_ec);
    if (resolve_ec) {
        throw TransportError("Failed to resolve " + address + ": " + resolve_ec.message());
    }

    boost::system::error_code connect_ec = asio::error::would_block;
    asio::async_connect(socket_, results,
                        [&connect_ec](const boost::system::error_code& ec, const tcp::endpoint&) { connect_ec = ec; });
    io_context_.run_for(timeout);
    io_context_.restart();

    if (connect_ec == asio::error::would_block) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        throw TransportError("Timed out connecting to " + address + ":" + std::to_string(port));
    }
    if (connect_ec) {
        throw TransportError("Failed to connect to " + address + ":" + std::to_string(port) + ": " +
                             connect_ec.message());
    }
    socket_.set_option(tcp::no_delay(true));
}

void TcpConnection::write(const Frame& frame) {
    if (closed_) {
        throw TransportError("connection closed");
    }
    std::string serialized = encode_frame(frame).dump();
    serialized.push_back('\n');
    boost::system::error_code ec;
    asio::write(socket_, asio::buffer(serialized), ec);
    if (ec) {
        throw TransportError("write failed: " + ec.message());
    }
}

std::optional<Frame> TcpConnection::read_next() {
    while (true) {
        boost::system::error_code ec;
        asio::read_until(socket_, read_buffer_, '\n', ec);
        if (ec == asio::error::eof || ec == asio::error::operation_aborted || closed_) {
            return std::nullopt;
        }
        if (ec) {
            throw TransportError("read failed: " + ec.message());
        }

        std::istream stream(&read_buffer_);
        std::string line;
        std::getline(stream, line);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        Json node = Json::parse(line, nullptr, false);
        if (node.is_discarded()) {
            util::log::warn("Skipping malformed frame: " + line);
            continue;
        }
        try {
            return decode_frame(node);
        } catch (const TransportError& ex) {
            util::log::warn(std::string("Skipping undecodable frame: ") + ex.what());
        }
    }
}

void TcpConnection::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_.exchange(true)) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
}

TcpTransport::TcpTransport(std::chrono::milliseconds connect_timeout)
    : connect_timeout_(connect_timeout) {}

std::shared_ptr<Connection> TcpTransport::open(const std::string& address, std::uint16_t port) {
    auto connection = std::make_shared<TcpConnection>();
    connection->connect(address, port, connect_timeout_);
    return connection;
}

}  // namespace wamlink::transport
