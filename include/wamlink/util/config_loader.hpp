#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "wamlink/core/device_descriptor.hpp"
#include "wamlink/session/session_controller.hpp"
#include "wamlink/util/logging.hpp"

namespace wamlink::util {

struct ListenConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8001};
    std::string path{"/ws"};
};

struct LogConfig {
    std::string level{"info"};
    std::string pattern{log::kDefaultPattern};
};

struct DeviceConfig {
    DeviceDescriptor descriptor;
    bool auto_connect{false};
};

struct ServerConfig {
    ListenConfig server;
    std::uint16_t default_device_port{kDefaultDevicePort};
    std::chrono::milliseconds connect_timeout{3000};
    session::SessionOptions session;
    LogConfig log;
    std::vector<DeviceConfig> devices;
};

// Throws ConfigError naming the offending field.
ServerConfig load_config(const std::string& path);
ServerConfig parse_config(const std::string& yaml_text);

std::vector<DeviceDescriptor> descriptors_of(const ServerConfig& config);

}  // namespace wamlink::util
