#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "wamlink/core/errors.hpp"
#include "wamlink/core/property_value.hpp"

namespace wamlink::transport {

// One message to or from a device. The core never looks inside beyond
// method/payload, the optional group token and the optional error text.
struct Frame {
    std::string method;
    PropertyMap payload;
    // Present when the device reports its group membership; empty means ungrouped.
    std::optional<std::string> group_token;
    std::string error;
};

nlohmann::json encode_frame(const Frame& frame);
Frame decode_frame(const nlohmann::json& node);

class TransportError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "transport_error"; }
};

class HandshakeError : public TransportError {
public:
    using TransportError::TransportError;
    const char* kind() const noexcept override { return "handshake_rejected"; }
};

// A live socket to one device. write() is called under the owning link's
// write lock; read_next() only from the link worker; close() may be called
// from any thread and must unblock a pending read_next().
class Connection {
public:
    virtual ~Connection() = default;

    virtual void write(const Frame& frame) = 0;
    // nullopt when the peer closed the connection.
    virtual std::optional<Frame> read_next() = 0;
    virtual void close() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Throws TransportError when the socket cannot be opened, HandshakeError
    // when the device refuses the session.
    virtual std::shared_ptr<Connection> open(const std::string& address, std::uint16_t port) = 0;
};

}  // namespace wamlink::transport
