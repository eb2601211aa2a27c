#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "wamlink/core/device_descriptor.hpp"
#include "wamlink/core/property_value.hpp"
#include "wamlink/core/reconnect_backoff.hpp"
#include "wamlink/transport/transport.hpp"

namespace wamlink::session {

enum class LinkState { disconnected, connecting, connected, reconnecting };

const char* to_string(LinkState state);

struct LinkOptions {
    std::chrono::milliseconds command_timeout{1000};
    // Timeouts in a row before the link drops its socket and reconnects.
    int max_consecutive_timeouts{3};
    std::size_t event_log_capacity{50};
    BackoffOptions backoff{};
};

struct CommandOptions {
    bool requires_power_on{false};
    // Method of the frame that acknowledges the command; empty means the
    // command's own method.
    std::string expected_response;
    std::chrono::milliseconds timeout{1000};
};

struct EventRecord {
    std::string method;
    PropertyMap payload;
    std::string error;
    std::chrono::system_clock::time_point received_at{};

    bool success() const { return error.empty(); }
};

struct LinkEvent {
    enum class Kind { state_changed, properties_changed, device_event, group_token_changed, gave_up };

    Kind kind{Kind::state_changed};
    std::string device_id;
    LinkState state{LinkState::disconnected};
    PropertyMap properties;
    std::optional<EventRecord> event;
    std::optional<std::string> group_token;
    std::string reason;
};

struct LinkSnapshot {
    DeviceDescriptor descriptor;
    LinkState state{LinkState::disconnected};
    PropertyMap properties;
    std::optional<std::string> group_token;
};

// Exclusive connection to one device. A worker thread per link reads
// frames, applies them to the property snapshot and event log, and runs
// the reconnection backoff when the socket drops.
class DeviceLink {
public:
    using EventSink = std::function<void(const LinkEvent&)>;

    DeviceLink(DeviceDescriptor descriptor,
               std::shared_ptr<transport::Transport> transport,
               LinkOptions options = {},
               EventSink sink = {});
    ~DeviceLink();

    DeviceLink(const DeviceLink&) = delete;
    DeviceLink& operator=(const DeviceLink&) = delete;

    // Throws ConnectError (link stays disconnected) or AlreadyConnectedError.
    void connect(const std::string& address, std::uint16_t port);
    void connect();

    // Throws NotConnectedError, TimeoutError or CommandRejectedError.
    transport::Frame send_command(const std::string& method,
                                  const PropertyMap& args,
                                  const CommandOptions& options);

    // Returns true when the link was not already disconnected.
    bool disconnect();

    const std::string& id() const noexcept { return descriptor_.id; }
    const DeviceDescriptor& descriptor() const noexcept { return descriptor_; }
    const LinkOptions& options() const noexcept { return options_; }

    LinkState state() const;
    PropertyMap properties() const;
    std::optional<std::string> group_token() const;
    // Newest first; limit 0 returns the whole log.
    std::vector<EventRecord> events(std::size_t limit = 0) const;
    LinkSnapshot snapshot() const;
    int reconnect_attempt() const;

private:
    struct PendingReply {
        std::string method;
        std::promise<transport::Frame> promise;
    };

    void worker_loop(std::shared_ptr<transport::Connection> connection);
    std::string read_until_closed(const std::shared_ptr<transport::Connection>& connection);
    std::shared_ptr<transport::Connection> reconnect();
    void handle_frame(const transport::Frame& frame);
    void request_snapshot(const std::shared_ptr<transport::Connection>& connection);

    transport::Frame exchange(const std::string& method,
                              const PropertyMap& args,
                              const std::string& expected_response,
                              std::chrono::milliseconds timeout);
    void remove_pending(const std::shared_ptr<PendingReply>& pending);
    void fail_pending(const std::string& reason);
    void force_reconnect(const std::shared_ptr<transport::Connection>& connection, const std::string& reason);

    void transition(LinkState state, const std::string& reason = {});
    void emit(const LinkEvent& event) const;
    void join_worker();

    const DeviceDescriptor descriptor_;
    std::shared_ptr<transport::Transport> transport_;
    const LinkOptions options_;
    EventSink sink_;

    std::string address_;
    std::uint16_t port_{kDefaultDevicePort};

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    LinkState state_{LinkState::disconnected};
    std::shared_ptr<transport::Connection> connection_;
    PropertyMap properties_;
    std::optional<std::string> group_token_;
    std::deque<EventRecord> events_;
    std::deque<std::shared_ptr<PendingReply>> pending_;
    ReconnectBackoff backoff_;
    int consecutive_timeouts_{0};
    bool stop_requested_{false};

    std::mutex write_mutex_;
    // Serializes connect() and disconnect(); never taken by the worker.
    std::mutex lifecycle_mutex_;
    std::thread worker_;
};

}  // namespace wamlink::session
