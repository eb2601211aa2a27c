#include "wamlink/session/device_link.hpp"

#include <algorithm>
#include <utility>

#include "wamlink/core/errors.hpp"
#include "wamlink/session/command_catalog.hpp"
#include "wamlink/util/logging.hpp"

namespace wamlink::session {

using transport::Connection;
using transport::Frame;

const char* to_string(LinkState state) {
    switch (state) {
        case LinkState::disconnected:
            return "disconnected";
        case LinkState::connecting:
            return "connecting";
        case LinkState::connected:
            return "connected";
        case LinkState::reconnecting:
            return "reconnecting";
    }
    return "unknown";
}

DeviceLink::DeviceLink(DeviceDescriptor descriptor,
                       std::shared_ptr<transport::Transport> transport,
                       LinkOptions options,
                       EventSink sink)
    : descriptor_(std::move(descriptor)),
      transport_(std::move(transport)),
      options_(options),
      sink_(std::move(sink)),
      address_(descriptor_.address),
      port_(descriptor_.port),
      backoff_(options_.backoff) {
    if (!transport_) {
        throw std::invalid_argument("DeviceLink requires a transport");
    }
}

DeviceLink::~DeviceLink() {
    try {
        disconnect();
    } catch (const std::exception& ex) {
        util::log::error("Link " + descriptor_.id + " teardown failed: " + ex.what());
    }
}

void DeviceLink::connect() {
    connect(descriptor_.address, descriptor_.port);
}

void DeviceLink::connect(const std::string& address, std::uint16_t port) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LinkState::disconnected) {
            throw AlreadyConnectedError("Device " + descriptor_.id + " is already " + to_string(state_));
        }
    }
    // A worker left over from a session that gave up has already exited.
    join_worker();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        address_ = address;
        port_ = port;
        stop_requested_ = false;
    }
    transition(LinkState::connecting);

    std::shared_ptr<Connection> connection;
    try {
        connection = transport_->open(address, port);
    } catch (const transport::HandshakeError& ex) {
        transition(LinkState::disconnected, ex.what());
        throw ConnectError("Handshake rejected by " + descriptor_.id + ": " + ex.what());
    } catch (const transport::TransportError& ex) {
        transition(LinkState::disconnected, ex.what());
        throw ConnectError("Cannot open connection to " + address + ":" + std::to_string(port) + ": " + ex.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = connection;
        backoff_.reset();
        consecutive_timeouts_ = 0;
    }
    transition(LinkState::connected);
    util::log::info("Connected to " + descriptor_.id + " at " + address + ":" + std::to_string(port));

    worker_ = std::thread([this, connection] { worker_loop(connection); });
    request_snapshot(connection);
}

bool DeviceLink::disconnect() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::shared_ptr<Connection> connection;
    LinkState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        connection = std::move(connection_);
        previous = state_;
    }
    stop_cv_.notify_all();
    if (connection) {
        connection->close();
    }
    join_worker();
    fail_pending("link to " + descriptor_.id + " was disconnected");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        group_token_.reset();
    }
    if (previous == LinkState::disconnected) {
        return false;
    }
    transition(LinkState::disconnected, "disconnect requested");
    util::log::info("Disconnected from " + descriptor_.id);
    return true;
}

Frame DeviceLink::send_command(const std::string& method, const PropertyMap& args, const CommandOptions& options) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LinkState::connected) {
            throw NotConnectedError("Device " + descriptor_.id + " is not connected (" + to_string(state_) + ")");
        }
    }

    if (options.requires_power_on) {
        auto power = string_property(properties(), "power");
        if (power && *power == "off") {
            util::log::debug("Powering on " + descriptor_.id + " before " + method);
            exchange(kSetPowerMethod, PropertyMap{{"strValue", std::string("on")}}, "", options.timeout);
        }
    }
    return exchange(method, args, options.expected_response, options.timeout);
}

Frame DeviceLink::exchange(const std::string& method,
                           const PropertyMap& args,
                           const std::string& expected_response,
                           std::chrono::milliseconds timeout) {
    auto pending = std::make_shared<PendingReply>();
    pending->method = expected_response.empty() ? method : expected_response;
    auto reply = pending->promise.get_future();

    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LinkState::connected || !connection_) {
            throw NotConnectedError("Device " + descriptor_.id + " is not connected (" + to_string(state_) + ")");
        }
        connection = connection_;
        pending_.push_back(pending);
    }

    try {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        connection->write(Frame{method, args, std::nullopt, {}});
    } catch (const transport::TransportError& ex) {
        remove_pending(pending);
        force_reconnect(connection, ex.what());
        throw NotConnectedError("Lost connection to " + descriptor_.id + " while sending " + method + ": " +
                                ex.what());
    }

    if (reply.wait_for(timeout) != std::future_status::ready) {
        remove_pending(pending);
        bool escalate = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++consecutive_timeouts_;
            if (consecutive_timeouts_ >= options_.max_consecutive_timeouts) {
                consecutive_timeouts_ = 0;
                escalate = true;
            }
        }
        if (escalate) {
            force_reconnect(connection, "repeated command timeouts");
        }
        throw TimeoutError("Device " + descriptor_.id + " did not acknowledge " + method + " within " +
                           std::to_string(timeout.count()) + " ms");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        consecutive_timeouts_ = 0;
    }
    return reply.get();
}

void DeviceLink::remove_pending(const std::shared_ptr<PendingReply>& pending) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(pending_.begin(), pending_.end(), pending);
    if (it != pending_.end()) {
        pending_.erase(it);
    }
}

void DeviceLink::fail_pending(const std::string& reason) {
    std::deque<std::shared_ptr<PendingReply>> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed.swap(pending_);
    }
    for (auto& pending : failed) {
        pending->promise.set_exception(std::make_exception_ptr(NotConnectedError(reason)));
    }
}

void DeviceLink::force_reconnect(const std::shared_ptr<Connection>& connection, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_ != connection) {
            return;
        }
    }
    util::log::warn("Dropping connection to " + descriptor_.id + ": " + reason);
    connection->close();
}

void DeviceLink::worker_loop(std::shared_ptr<Connection> connection) {
    while (connection) {
        const auto reason = read_until_closed(connection);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) {
                return;
            }
        }
        util::log::warn("Connection to " + descriptor_.id + " lost: " + reason);
        fail_pending("connection to " + descriptor_.id + " lost: " + reason);
        connection = reconnect();
    }
}

std::string DeviceLink::read_until_closed(const std::shared_ptr<Connection>& connection) {
    try {
        while (auto frame = connection->read_next()) {
            handle_frame(*frame);
        }
        return "closed by peer";
    } catch (const transport::TransportError& ex) {
        return ex.what();
    }
}

std::shared_ptr<Connection> DeviceLink::reconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_.reset();
    }
    transition(LinkState::reconnecting);

    while (true) {
        std::optional<std::chrono::milliseconds> delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delay = backoff_.next_delay();
        }
        if (!delay) {
            const auto reason = "gave up after " + std::to_string(options_.backoff.max_attempts) + " attempts";
            util::log::warn("Link to " + descriptor_.id + " " + reason);
            // Emitted while still reconnecting: the registry cannot replace
            // this link until the state flips below.
            LinkEvent event;
            event.kind = LinkEvent::Kind::gave_up;
            event.device_id = descriptor_.id;
            event.state = LinkState::disconnected;
            event.reason = reason;
            emit(event);
            transition(LinkState::disconnected, reason);
            return nullptr;
        }

        util::log::info("Reconnecting to " + descriptor_.id + " in " + std::to_string(delay->count()) +
                        " ms (attempt " + std::to_string(reconnect_attempt()) + "/" +
                        std::to_string(options_.backoff.max_attempts) + ")");
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_cv_.wait_for(lock, *delay, [this] { return stop_requested_; })) {
                return nullptr;
            }
        }
        transition(LinkState::connecting);

        try {
            auto connection = transport_->open(address_, port_);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stop_requested_) {
                    connection->close();
                    return nullptr;
                }
                connection_ = connection;
                backoff_.reset();
                consecutive_timeouts_ = 0;
            }
            transition(LinkState::connected);
            util::log::info("Reconnected to " + descriptor_.id);
            request_snapshot(connection);
            return connection;
        } catch (const transport::TransportError& ex) {
            util::log::warn("Reconnect to " + descriptor_.id + " failed: " + ex.what());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stop_requested_) {
                    return nullptr;
                }
            }
            transition(LinkState::reconnecting, ex.what());
        }
    }
}

void DeviceLink::request_snapshot(const std::shared_ptr<Connection>& connection) {
    try {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        connection->write(Frame{kSnapshotRequestMethod, {}, std::nullopt, {}});
    } catch (const transport::TransportError& ex) {
        // The reader sees the broken socket and starts reconnecting.
        util::log::warn("Snapshot request to " + descriptor_.id + " failed: " + ex.what());
    }
}

void DeviceLink::handle_frame(const Frame& frame) {
    EventRecord record{frame.method, frame.payload, frame.error, std::chrono::system_clock::now()};
    PropertyMap changed;
    std::optional<std::optional<std::string>> token_change;
    std::shared_ptr<PendingReply> resolved;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_front(record);
        while (events_.size() > options_.event_log_capacity) {
            events_.pop_back();
        }

        for (const auto& [name, value] : frame.payload) {
            auto it = properties_.find(name);
            if (it == properties_.end() || it->second != value) {
                properties_.insert_or_assign(name, value);
                changed.insert_or_assign(name, value);
            }
        }

        if (frame.group_token) {
            std::optional<std::string> token;
            if (!frame.group_token->empty()) {
                token = *frame.group_token;
            }
            if (token != group_token_) {
                group_token_ = token;
                token_change.emplace(token);
            }
        }

        auto it = std::find_if(pending_.begin(), pending_.end(),
                               [&frame](const auto& pending) { return pending->method == frame.method; });
        if (it != pending_.end()) {
            resolved = *it;
            pending_.erase(it);
        }
    }

    LinkEvent device_event;
    device_event.kind = LinkEvent::Kind::device_event;
    device_event.device_id = descriptor_.id;
    device_event.event = record;
    emit(device_event);

    if (!changed.empty()) {
        LinkEvent update;
        update.kind = LinkEvent::Kind::properties_changed;
        update.device_id = descriptor_.id;
        update.properties = std::move(changed);
        emit(update);
    }

    if (token_change) {
        LinkEvent membership;
        membership.kind = LinkEvent::Kind::group_token_changed;
        membership.device_id = descriptor_.id;
        membership.group_token = *token_change;
        emit(membership);
    }

    if (resolved) {
        if (frame.error.empty()) {
            resolved->promise.set_value(frame);
        } else {
            resolved->promise.set_exception(std::make_exception_ptr(
                CommandRejectedError("Device " + descriptor_.id + " rejected " + frame.method + ": " + frame.error)));
        }
    }
}

void DeviceLink::transition(LinkState state, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
    }
    util::log::debug("Link " + descriptor_.id + " -> " + to_string(state) + (reason.empty() ? "" : " (" + reason + ")"));
    LinkEvent event;
    event.kind = LinkEvent::Kind::state_changed;
    event.device_id = descriptor_.id;
    event.state = state;
    event.reason = reason;
    emit(event);
}

void DeviceLink::emit(const LinkEvent& event) const {
    if (!sink_) {
        return;
    }
    try {
        sink_(event);
    } catch (const std::exception& ex) {
        util::log::error("Link " + descriptor_.id + " event sink failed: " + ex.what());
    }
}

void DeviceLink::join_worker() {
    if (!worker_.joinable()) {
        return;
    }
    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
        return;
    }
    worker_.join();
}

LinkState DeviceLink::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

PropertyMap DeviceLink::properties() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return properties_;
}

std::optional<std::string> DeviceLink::group_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return group_token_;
}

std::vector<EventRecord> DeviceLink::events(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t count = limit == 0 ? events_.size() : std::min(limit, events_.size());
    return std::vector<EventRecord>(events_.begin(), events_.begin() + static_cast<std::ptrdiff_t>(count));
}

LinkSnapshot DeviceLink::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LinkSnapshot{descriptor_, state_, properties_, group_token_};
}

int DeviceLink::reconnect_attempt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoff_.attempt();
}

}  // namespace wamlink::session
