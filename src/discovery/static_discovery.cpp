#include "wamlink/discovery/discovery.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "wamlink/util/logging.hpp"

namespace wamlink::discovery {

StaticDiscovery::StaticDiscovery(std::vector<DeviceDescriptor> devices)
    : devices_(std::move(devices)) {}

std::vector<DeviceDescriptor> StaticDiscovery::discover() {
    std::vector<DeviceDescriptor> found;
    found.reserve(devices_.size());
    for (const auto& device : devices_) {
        auto duplicate = std::any_of(found.begin(), found.end(), [&device](const DeviceDescriptor& other) {
            return other.address == device.address && other.port == device.port;
        });
        if (!duplicate) {
            found.push_back(device);
        }
    }
    std::stable_sort(found.begin(), found.end(),
                     [](const DeviceDescriptor& a, const DeviceDescriptor& b) { return a.address < b.address; });
    util::log::info("Discovered " + std::to_string(found.size()) + " WAM speaker(s)");
    return found;
}

}  // namespace wamlink::discovery
