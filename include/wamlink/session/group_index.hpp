#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wamlink/session/device_registry.hpp"

namespace wamlink::session {

// Devices acting together. A group has no identity of its own; any member
// id may be used to address it, `anchor` being the first member.
struct Group {
    std::string token;
    std::vector<std::string> members;

    const std::string& anchor() const { return members.front(); }
    bool contains(std::string_view id) const;
    bool operator==(const Group& other) const { return token == other.token && members == other.members; }
};

// Derives groups from the current registry contents on every call.
class GroupIndex {
public:
    explicit GroupIndex(const DeviceRegistry& registry);

    std::vector<Group> groups() const;
    // Group containing `member_id`; throws GroupNotFoundError.
    Group resolve(std::string_view member_id) const;
    std::optional<Group> find(std::string_view member_id) const;

    // Pure clustering used by groups(); exposed for callers holding a snapshot.
    static std::vector<Group> cluster(const std::vector<LinkSnapshot>& links);

private:
    const DeviceRegistry& registry_;
};

}  // namespace wamlink::session
