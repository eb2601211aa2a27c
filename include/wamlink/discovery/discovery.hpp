#pragma once

#include <vector>

#include "wamlink/core/device_descriptor.hpp"

namespace wamlink::discovery {

class Discovery {
public:
    virtual ~Discovery() = default;

    virtual std::vector<DeviceDescriptor> discover() = 0;
};

// Serves a fixed device list, sorted by address with (address, port)
// duplicates removed.
class StaticDiscovery : public Discovery {
public:
    explicit StaticDiscovery(std::vector<DeviceDescriptor> devices);

    std::vector<DeviceDescriptor> discover() override;

private:
    std::vector<DeviceDescriptor> devices_;
};

}  // namespace wamlink::discovery
