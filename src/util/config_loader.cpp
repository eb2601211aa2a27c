#include "wamlink/util/config_loader.hpp"

#include <limits>

#include <yaml-cpp/yaml.h>

#include "wamlink/core/errors.hpp"

namespace wamlink::util {

namespace {

template <typename T>
T scalar_or_throw(const YAML::Node& node, const std::string& field) {
    if (!node || !node.IsScalar()) {
        throw ConfigError("Field '" + field + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError("Field '" + field + "' has an invalid value: " + node.Scalar());
    }
}

template <typename T>
void read_optional(const YAML::Node& parent, const char* key, const std::string& prefix, T& out) {
    if (auto node = parent[key]; node) {
        out = scalar_or_throw<T>(node, prefix + key);
    }
}

std::uint16_t port_or_throw(const YAML::Node& node, const std::string& field) {
    const auto value = scalar_or_throw<long>(node, field);
    if (value < 1 || value > std::numeric_limits<std::uint16_t>::max()) {
        throw ConfigError("Field '" + field + "' must be a port between 1 and 65535");
    }
    return static_cast<std::uint16_t>(value);
}

std::chrono::milliseconds positive_millis(const YAML::Node& node, const std::string& field) {
    const auto value = scalar_or_throw<long>(node, field);
    if (value <= 0) {
        throw ConfigError("Field '" + field + "' must be positive");
    }
    return std::chrono::milliseconds(value);
}

int positive_int(const YAML::Node& node, const std::string& field) {
    const auto value = scalar_or_throw<int>(node, field);
    if (value <= 0) {
        throw ConfigError("Field '" + field + "' must be positive");
    }
    return value;
}

void load_link(const YAML::Node& node, ServerConfig& config) {
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigError("'link' must be a mapping");
    }
    auto& link = config.session.link;
    if (node["default_port"]) {
        config.default_device_port = port_or_throw(node["default_port"], "link.default_port");
    }
    if (node["connect_timeout_ms"]) {
        config.connect_timeout = positive_millis(node["connect_timeout_ms"], "link.connect_timeout_ms");
    }
    if (node["command_timeout_ms"]) {
        link.command_timeout = positive_millis(node["command_timeout_ms"], "link.command_timeout_ms");
    }
    if (node["max_consecutive_timeouts"]) {
        link.max_consecutive_timeouts = positive_int(node["max_consecutive_timeouts"], "link.max_consecutive_timeouts");
    }
    if (node["event_log_capacity"]) {
        link.event_log_capacity =
            static_cast<std::size_t>(positive_int(node["event_log_capacity"], "link.event_log_capacity"));
    }
    if (auto reconnect = node["reconnect"]; reconnect) {
        if (reconnect["base_ms"]) {
            link.backoff.base = positive_millis(reconnect["base_ms"], "link.reconnect.base_ms");
        }
        if (reconnect["cap_ms"]) {
            link.backoff.cap = positive_millis(reconnect["cap_ms"], "link.reconnect.cap_ms");
        }
        if (reconnect["max_attempts"]) {
            link.backoff.max_attempts = positive_int(reconnect["max_attempts"], "link.reconnect.max_attempts");
        }
        if (link.backoff.cap < link.backoff.base) {
            throw ConfigError("Field 'link.reconnect.cap_ms' must not be below base_ms");
        }
    }
}

void load_broadcaster(const YAML::Node& node, ServerConfig& config) {
    if (!node) {
        return;
    }
    auto& options = config.session.broadcaster;
    if (node["queue_capacity"]) {
        options.queue_capacity =
            static_cast<std::size_t>(positive_int(node["queue_capacity"], "broadcaster.queue_capacity"));
    }
    if (node["keepalive_interval_s"]) {
        options.keepalive_interval =
            std::chrono::seconds(positive_int(node["keepalive_interval_s"], "broadcaster.keepalive_interval_s"));
    }
    if (node["max_missed_keepalives"]) {
        options.max_missed_keepalives =
            positive_int(node["max_missed_keepalives"], "broadcaster.max_missed_keepalives");
    }
}

std::vector<DeviceConfig> load_devices(const YAML::Node& node, std::uint16_t default_port) {
    std::vector<DeviceConfig> devices;
    if (!node) {
        return devices;
    }
    if (!node.IsSequence()) {
        throw ConfigError("'devices' must be a sequence");
    }
    for (const auto& device_node : node) {
        DeviceConfig device;
        auto& descriptor = device.descriptor;
        descriptor.address = scalar_or_throw<std::string>(device_node["address"], "devices[].address");
        descriptor.id = descriptor.address;
        read_optional(device_node, "id", "devices[].", descriptor.id);
        descriptor.port = device_node["port"] ? port_or_throw(device_node["port"], "devices[].port") : default_port;
        if (device_node["name"]) {
            descriptor.name = scalar_or_throw<std::string>(device_node["name"], "devices[].name");
        }
        if (device_node["model"]) {
            descriptor.model = scalar_or_throw<std::string>(device_node["model"], "devices[].model");
        }
        device.auto_connect = device_node["auto_connect"].as<bool>(false);
        devices.push_back(std::move(device));
    }
    return devices;
}

ServerConfig parse_root(const YAML::Node& root) {
    ServerConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("configuration root must be a mapping");
    }

    if (auto server = root["server"]; server) {
        read_optional(server, "host", "server.", config.server.host);
        if (server["port"]) {
            config.server.port = port_or_throw(server["port"], "server.port");
        }
        read_optional(server, "path", "server.", config.server.path);
        if (config.server.path.empty() || config.server.path.front() != '/') {
            throw ConfigError("Field 'server.path' must start with '/'");
        }
    }

    load_link(root["link"], config);
    load_broadcaster(root["broadcaster"], config);

    if (auto log_node = root["log"]; log_node) {
        read_optional(log_node, "level", "log.", config.log.level);
        read_optional(log_node, "pattern", "log.", config.log.pattern);
    }

    config.devices = load_devices(root["devices"], config.default_device_port);
    return config;
}

}  // namespace

ServerConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw ConfigError("Failed to read config " + path + ": " + ex.what());
    }
    return parse_root(root);
}

ServerConfig parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("Failed to parse config: ") + ex.what());
    }
    return parse_root(root);
}

std::vector<DeviceDescriptor> descriptors_of(const ServerConfig& config) {
    std::vector<DeviceDescriptor> descriptors;
    descriptors.reserve(config.devices.size());
    for (const auto& device : config.devices) {
        descriptors.push_back(device.descriptor);
    }
    return descriptors;
}

}  // namespace wamlink::util
