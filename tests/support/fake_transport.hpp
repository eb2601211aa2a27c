#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "wamlink/session/command_catalog.hpp"
#include "wamlink/session/device_link.hpp"
#include "wamlink/transport/transport.hpp"

namespace wamlink::testing {

using transport::Frame;

// Produces the frames a device answers a written frame with.
using Responder = std::function<std::vector<Frame>(const Frame&)>;

// Answers the snapshot request with `properties` and `group`, acknowledges
// everything else with an empty frame of the same method.
inline Responder acknowledging(PropertyMap properties = {}, std::optional<std::string> group = std::nullopt) {
    return [properties = std::move(properties), group = std::move(group)](const Frame& request) {
        if (request.method == session::kSnapshotRequestMethod) {
            return std::vector<Frame>{Frame{request.method, properties, group.value_or(""), {}}};
        }
        PropertyMap payload;
        if (request.method == session::kSetPowerMethod) {
            if (auto it = request.payload.find("strValue"); it != request.payload.end()) {
                payload.emplace("power", it->second);
            }
        }
        return std::vector<Frame>{Frame{request.method, payload, std::nullopt, {}}};
    };
}

// Answers only the snapshot request; commands time out.
inline Responder silent_after_snapshot(PropertyMap properties = {}, std::optional<std::string> group = std::nullopt) {
    auto snapshot = acknowledging(std::move(properties), std::move(group));
    return [snapshot](const Frame& request) {
        if (request.method == session::kSnapshotRequestMethod) {
            return snapshot(request);
        }
        return std::vector<Frame>{};
    };
}

class FakeConnection : public transport::Connection {
public:
    explicit FakeConnection(Responder responder) : responder_(std::move(responder)) {}

    void write(const Frame& frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw transport::TransportError("fake connection closed");
        }
        written_.push_back(frame);
        if (responder_) {
            for (auto& reply : responder_(frame)) {
                inbox_.push_back(std::move(reply));
            }
        }
        cv_.notify_all();
    }

    std::optional<Frame> read_next() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !inbox_.empty(); });
        if (!inbox_.empty()) {
            auto frame = std::move(inbox_.front());
            inbox_.pop_front();
            return frame;
        }
        return std::nullopt;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    // Frame pushed by the device on its own.
    void deliver(Frame frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbox_.push_back(std::move(frame));
        cv_.notify_all();
    }

    // Peer hangs up.
    void drop() { close(); }

    std::vector<Frame> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    std::size_t written_count(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& frame : written_) {
            if (frame.method == method) {
                ++count;
            }
        }
        return count;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    Responder responder_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Frame> inbox_;
    std::vector<Frame> written_;
    bool closed_{false};
};

// Scriptable in-memory transport keyed by device address.
class FakeTransport : public transport::Transport {
public:
    std::shared_ptr<transport::Connection> open(const std::string& address, std::uint16_t) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++open_counts_[address];
        if (refused_.count(address) != 0) {
            throw transport::TransportError("connection refused by " + address);
        }
        if (rejected_.count(address) != 0) {
            throw transport::HandshakeError("session refused by " + address);
        }
        auto it = responders_.find(address);
        auto connection = std::make_shared<FakeConnection>(it != responders_.end() ? it->second : acknowledging());
        connections_[address].push_back(connection);
        return connection;
    }

    void set_responder(const std::string& address, Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responders_[address] = std::move(responder);
    }

    void refuse(const std::string& address, bool refused = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (refused) {
            refused_.insert(address);
        } else {
            refused_.erase(address);
        }
    }

    void reject_handshake(const std::string& address) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejected_.insert(address);
    }

    std::shared_ptr<FakeConnection> latest(const std::string& address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(address);
        if (it == connections_.end() || it->second.empty()) {
            return nullptr;
        }
        return it->second.back();
    }

    int open_count(const std::string& address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = open_counts_.find(address);
        return it == open_counts_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Responder> responders_;
    std::set<std::string> refused_;
    std::set<std::string> rejected_;
    std::map<std::string, std::vector<std::shared_ptr<FakeConnection>>> connections_;
    std::map<std::string, int> open_counts_;
};

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// Fast timings for tests that exercise timeouts and reconnects.
inline session::LinkOptions fast_link_options() {
    session::LinkOptions options;
    options.command_timeout = std::chrono::milliseconds(100);
    options.max_consecutive_timeouts = 3;
    options.event_log_capacity = 50;
    options.backoff.base = std::chrono::milliseconds(10);
    options.backoff.cap = std::chrono::milliseconds(40);
    options.backoff.max_attempts = 3;
    return options;
}

}  // namespace wamlink::testing
