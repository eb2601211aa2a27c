#pragma once

#include <string>

namespace wamlink::util::log {

constexpr const char* kDefaultPattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";

// Throws std::invalid_argument for an unknown level name.
void configure(const std::string& level, const std::string& pattern = kDefaultPattern);

void debug(const std::string& message);
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

}  // namespace wamlink::util::log
