#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "wamlink/core/device_descriptor.hpp"
#include "wamlink/session/device_link.hpp"

namespace wamlink::session {

// Owns every DeviceLink, at most one per device id. Mutations for one id are
// serialized by a per-id lock; multi-id reads copy the entry list and then
// query each link without holding the registry lock.
class DeviceRegistry {
public:
    using LinkFactory = std::function<std::shared_ptr<DeviceLink>(const DeviceDescriptor&)>;

    explicit DeviceRegistry(LinkFactory factory);

    // Throws AlreadyConnectedError when a live link exists for `id`; a
    // disconnected entry is replaced.
    std::shared_ptr<DeviceLink> register_link(const std::string& id, const DeviceDescriptor& descriptor);

    // register_link + DeviceLink::connect under the id's lock. The entry is
    // dropped again when the connect fails.
    std::shared_ptr<DeviceLink> connect(const DeviceDescriptor& descriptor);

    std::shared_ptr<DeviceLink> find(std::string_view id) const;
    // Throws DeviceNotFoundError.
    std::shared_ptr<DeviceLink> get(std::string_view id) const;

    // Returns true when a live link was disconnected.
    bool remove(const std::string& id);

    // Ids whose links were live right before the call, in registration order.
    // Takes each id's lock in turn, so it waits for a connect in progress.
    std::vector<std::string> disconnect_all();

    void mark_failed(const std::string& id, const std::string& reason);
    std::optional<std::string> last_failure(std::string_view id) const;

    // Registration order.
    std::vector<LinkSnapshot> snapshot() const;
    std::vector<std::string> ids() const;
    std::vector<std::string> connected_ids() const;
    std::size_t size() const;

private:
    struct Entry {
        std::uint64_t sequence{0};
        std::shared_ptr<DeviceLink> link;
        std::optional<std::string> last_failure;
    };

    std::shared_ptr<std::mutex> id_lock(const std::string& id);
    std::vector<std::shared_ptr<DeviceLink>> ordered_links() const;

    LinkFactory factory_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> links_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> id_locks_;
    std::uint64_t next_sequence_{0};
};

}  // namespace wamlink::session
