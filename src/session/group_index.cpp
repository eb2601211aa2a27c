#include "wamlink/session/group_index.hpp"

#include <algorithm>

#include "wamlink/core/errors.hpp"

namespace wamlink::session {

bool Group::contains(std::string_view id) const {
    return std::find(members.begin(), members.end(), id) != members.end();
}

GroupIndex::GroupIndex(const DeviceRegistry& registry)
    : registry_(registry) {}

std::vector<Group> GroupIndex::cluster(const std::vector<LinkSnapshot>& links) {
    std::vector<Group> clusters;
    for (const auto& link : links) {
        if (link.state != LinkState::connected || !link.group_token || link.group_token->empty()) {
            continue;
        }
        auto it = std::find_if(clusters.begin(), clusters.end(),
                               [&link](const Group& group) { return group.token == *link.group_token; });
        if (it == clusters.end()) {
            clusters.push_back(Group{*link.group_token, {link.descriptor.id}});
        } else {
            it->members.push_back(link.descriptor.id);
        }
    }

    // A device alone with its token is not a group.
    clusters.erase(std::remove_if(clusters.begin(), clusters.end(),
                                  [](const Group& group) { return group.members.size() < 2; }),
                   clusters.end());
    return clusters;
}

std::vector<Group> GroupIndex::groups() const {
    return cluster(registry_.snapshot());
}

std::optional<Group> GroupIndex::find(std::string_view member_id) const {
    for (auto& group : groups()) {
        if (group.contains(member_id)) {
            return std::move(group);
        }
    }
    return std::nullopt;
}

Group GroupIndex::resolve(std::string_view member_id) const {
    auto group = find(member_id);
    if (!group) {
        throw GroupNotFoundError("No group contains device " + std::string(member_id));
    }
    return std::move(*group);
}

}  // namespace wamlink::session
