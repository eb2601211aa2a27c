#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace wamlink::broadcast {

// Bounded outbound queue of one push subscriber. Producers never block: a
// push that would exceed the capacity fails and closes the viewer.
class ViewerConnection {
public:
    using Id = std::uint64_t;
    using ReadyHandler = std::function<void()>;

    ViewerConnection(Id id, std::size_t capacity);

    ViewerConnection(const ViewerConnection&) = delete;
    ViewerConnection& operator=(const ViewerConnection&) = delete;

    Id id() const noexcept { return id_; }
    std::size_t capacity() const noexcept { return capacity_; }

    bool push(std::string message);
    std::optional<std::string> try_pop();
    std::optional<std::string> wait_pop(std::chrono::milliseconds timeout);

    void close(const std::string& reason);
    bool is_open() const;
    std::string close_reason() const;
    std::size_t pending() const;

    // Invoked (without internal locks held) after a push or close.
    void set_ready_handler(ReadyHandler handler);

    void touch(std::chrono::steady_clock::time_point now);
    std::chrono::steady_clock::time_point last_seen() const;

private:
    void notify_ready();

    const Id id_;
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    bool open_{true};
    std::string close_reason_;
    ReadyHandler ready_handler_;
    std::chrono::steady_clock::time_point last_seen_;
};

}  // namespace wamlink::broadcast
