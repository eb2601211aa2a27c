#include "wamlink/util/logging.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace wamlink::util::log {

void configure(const std::string& level, const std::string& pattern) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps anything unknown to off; only accept that when asked for.
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    spdlog::set_pattern(pattern);
    spdlog::set_level(parsed);
}

void debug(const std::string& message) {
    spdlog::debug(message);
}

void info(const std::string& message) {
    spdlog::info(message);
}

void warn(const std::string& message) {
    spdlog::warn(message);
}

void error(const std::string& message) {
    spdlog::error(message);
}

}  // namespace wamlink::util::log
