#include "wamlink/session/device_registry.hpp"

#include <algorithm>
#include <utility>

#include "wamlink/core/errors.hpp"
#include "wamlink/util/logging.hpp"

namespace wamlink::session {

DeviceRegistry::DeviceRegistry(LinkFactory factory)
    : factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("DeviceRegistry requires a link factory");
    }
}

std::shared_ptr<std::mutex> DeviceRegistry::id_lock(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = id_locks_.try_emplace(id);
    if (inserted) {
        it->second = std::make_shared<std::mutex>();
    }
    return it->second;
}

std::shared_ptr<DeviceLink> DeviceRegistry::register_link(const std::string& id, const DeviceDescriptor& descriptor) {
    std::shared_ptr<DeviceLink> replaced;
    std::shared_ptr<DeviceLink> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uint64_t sequence = next_sequence_;
        auto it = links_.find(id);
        if (it != links_.end()) {
            const auto state = it->second.link->state();
            if (state != LinkState::disconnected) {
                throw AlreadyConnectedError("Device " + id + " is already " + to_string(state));
            }
            sequence = it->second.sequence;
            replaced = std::move(it->second.link);
            links_.erase(it);
        } else {
            ++next_sequence_;
        }

        DeviceDescriptor normalized = descriptor;
        normalized.id = id;
        link = factory_(normalized);
        links_.emplace(id, Entry{sequence, link, std::nullopt});
    }
    // Destroying a link joins its worker; keep that outside the registry lock.
    replaced.reset();
    return link;
}

std::shared_ptr<DeviceLink> DeviceRegistry::connect(const DeviceDescriptor& descriptor) {
    auto guard = id_lock(descriptor.id);
    std::lock_guard<std::mutex> id_guard(*guard);

    auto link = register_link(descriptor.id, descriptor);
    try {
        link->connect(descriptor.address, descriptor.port);
    } catch (const Error&) {
        std::shared_ptr<DeviceLink> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = links_.find(descriptor.id);
            if (it != links_.end() && it->second.link == link) {
                dropped = std::move(it->second.link);
                links_.erase(it);
            }
        }
        throw;
    }
    return link;
}

std::shared_ptr<DeviceLink> DeviceRegistry::find(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(std::string(id));
    if (it == links_.end()) {
        return nullptr;
    }
    return it->second.link;
}

std::shared_ptr<DeviceLink> DeviceRegistry::get(std::string_view id) const {
    auto link = find(id);
    if (!link) {
        throw DeviceNotFoundError("Device " + std::string(id) + " is not connected");
    }
    return link;
}

bool DeviceRegistry::remove(const std::string& id) {
    auto guard = id_lock(id);
    std::lock_guard<std::mutex> id_guard(*guard);

    std::shared_ptr<DeviceLink> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = links_.find(id);
        if (it == links_.end()) {
            return false;
        }
        link = std::move(it->second.link);
        links_.erase(it);
    }
    return link->disconnect();
}

std::vector<std::string> DeviceRegistry::disconnect_all() {
    std::vector<std::pair<std::uint64_t, std::string>> order;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        order.reserve(links_.size());
        for (const auto& [id, entry] : links_) {
            order.emplace_back(entry.sequence, id);
        }
    }
    std::sort(order.begin(), order.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> disconnected;
    for (const auto& [sequence, id] : order) {
        (void)sequence;
        // Same lock as connect(), so a link is never taken between its
        // registration and its connect.
        auto guard = id_lock(id);
        std::lock_guard<std::mutex> id_guard(*guard);

        std::shared_ptr<DeviceLink> link;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = links_.find(id);
            if (it == links_.end()) {
                continue;
            }
            link = std::move(it->second.link);
            links_.erase(it);
        }
        if (link->disconnect()) {
            disconnected.push_back(id);
        }
    }
    if (!disconnected.empty()) {
        util::log::info("Disconnected " + std::to_string(disconnected.size()) + " device(s)");
    }
    return disconnected;
}

void DeviceRegistry::mark_failed(const std::string& id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(id);
    if (it == links_.end()) {
        return;
    }
    it->second.last_failure = reason;
    util::log::warn("Device " + id + " failed terminally: " + reason);
}

std::optional<std::string> DeviceRegistry::last_failure(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(std::string(id));
    if (it == links_.end()) {
        return std::nullopt;
    }
    return it->second.last_failure;
}

std::vector<std::shared_ptr<DeviceLink>> DeviceRegistry::ordered_links() const {
    std::vector<std::pair<std::uint64_t, std::shared_ptr<DeviceLink>>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.reserve(links_.size());
        for (const auto& [id, entry] : links_) {
            entries.emplace_back(entry.sequence, entry.link);
        }
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::shared_ptr<DeviceLink>> links;
    links.reserve(entries.size());
    for (auto& [sequence, link] : entries) {
        (void)sequence;
        links.push_back(std::move(link));
    }
    return links;
}

std::vector<LinkSnapshot> DeviceRegistry::snapshot() const {
    std::vector<LinkSnapshot> result;
    for (const auto& link : ordered_links()) {
        result.push_back(link->snapshot());
    }
    return result;
}

std::vector<std::string> DeviceRegistry::ids() const {
    std::vector<std::string> result;
    for (const auto& link : ordered_links()) {
        result.push_back(link->id());
    }
    return result;
}

std::vector<std::string> DeviceRegistry::connected_ids() const {
    std::vector<std::string> result;
    for (const auto& link : ordered_links()) {
        if (link->state() == LinkState::connected) {
            result.push_back(link->id());
        }
    }
    return result;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return links_.size();
}

}  // namespace wamlink::session
