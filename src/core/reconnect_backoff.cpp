#include "wamlink/core/reconnect_backoff.hpp"

#include <algorithm>

namespace wamlink {

ReconnectBackoff::ReconnectBackoff(BackoffOptions options)
    : options_(options) {}

std::optional<std::chrono::milliseconds> ReconnectBackoff::next_delay() {
    if (attempt_ >= options_.max_attempts) {
        return std::nullopt;
    }
    auto delay = delay_for(options_, attempt_);
    ++attempt_;
    return delay;
}

std::chrono::milliseconds ReconnectBackoff::delay_for(const BackoffOptions& options, int attempt) {
    auto delay = options.base;
    for (int i = 0; i < attempt; ++i) {
        if (delay >= options.cap) {
            break;
        }
        delay *= 2;
    }
    return std::min(delay, options.cap);
}

}  // namespace wamlink
