#include "wamlink/broadcast/viewer_connection.hpp"

#include <utility>

namespace wamlink::broadcast {

ViewerConnection::ViewerConnection(Id id, std::size_t capacity)
    : id_(id), capacity_(capacity), last_seen_(std::chrono::steady_clock::now()) {}

bool ViewerConnection::push(std::string message) {
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            open_ = false;
            close_reason_ = "outbound queue overflow";
            queue_.clear();
        } else {
            queue_.push_back(std::move(message));
            accepted = true;
        }
    }
    cv_.notify_all();
    notify_ready();
    return accepted;
}

std::optional<std::string> ViewerConnection::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

std::optional<std::string> ViewerConnection::wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || !open_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

void ViewerConnection::close(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return;
        }
        open_ = false;
        close_reason_ = reason;
    }
    cv_.notify_all();
    notify_ready();
}

bool ViewerConnection::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::string ViewerConnection::close_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
}

std::size_t ViewerConnection::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ViewerConnection::set_ready_handler(ReadyHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_handler_ = std::move(handler);
}

void ViewerConnection::notify_ready() {
    ReadyHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = ready_handler_;
    }
    if (handler) {
        handler();
    }
}

void ViewerConnection::touch(std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_seen_ = now;
}

std::chrono::steady_clock::time_point ViewerConnection::last_seen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seen_;
}

}  // namespace wamlink::broadcast
