#pragma once

#include <chrono>
#include <optional>

namespace wamlink {

struct BackoffOptions {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{30000};
    int max_attempts{10};
};

// Capped exponential backoff: delay(k) = min(base * 2^k, cap).
class ReconnectBackoff {
public:
    explicit ReconnectBackoff(BackoffOptions options = {});

    // Delay before the next attempt, or nullopt once max_attempts is used up.
    std::optional<std::chrono::milliseconds> next_delay();
    void reset() noexcept { attempt_ = 0; }

    int attempt() const noexcept { return attempt_; }
    const BackoffOptions& options() const noexcept { return options_; }

    static std::chrono::milliseconds delay_for(const BackoffOptions& options, int attempt);

private:
    BackoffOptions options_;
    int attempt_{0};
};

}  // namespace wamlink
