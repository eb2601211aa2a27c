#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace wamlink {

constexpr std::uint16_t kDefaultDevicePort = 55001;

// Produced by discovery; never mutated afterwards.
struct DeviceDescriptor {
    std::string id;
    std::string address;
    std::uint16_t port{kDefaultDevicePort};
    std::optional<std::string> name;
    std::optional<std::string> model;
};

}  // namespace wamlink
