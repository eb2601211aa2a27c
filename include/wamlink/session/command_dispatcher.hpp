#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "wamlink/session/command_catalog.hpp"
#include "wamlink/session/device_registry.hpp"
#include "wamlink/session/group_index.hpp"

namespace wamlink::session {

struct DeviceResult {
    std::string device_id;
    std::string method;
    transport::Frame response;
};

struct GroupResult {
    struct Failure {
        std::string device_id;
        std::string kind;
        std::string reason;
    };

    // Anchor member the group was resolved from.
    std::string group_id;
    std::vector<std::string> members;
    std::vector<std::string> successes;
    std::vector<Failure> failures;
};

class CommandDispatcher {
public:
    CommandDispatcher(DeviceRegistry& registry,
                      const GroupIndex& group_index,
                      std::chrono::milliseconds base_timeout = std::chrono::milliseconds(1000));

    // Throws DeviceNotFoundError, UnknownCommandError or the link's errors.
    DeviceResult send_to_device(const std::string& id,
                                const std::string& command,
                                const std::optional<std::string>& value);
    DeviceResult send_api(const std::string& id, const ApiCall& call);

    // Membership is fixed when the call starts; every member is attempted
    // concurrently and reported individually. Throws GroupNotFoundError or
    // UnknownCommandError only.
    GroupResult send_to_group(const std::string& group_id,
                              const std::string& command,
                              const std::optional<std::string>& value);

private:
    DeviceResult dispatch(const std::string& id, const ApiCall& call);

    DeviceRegistry& registry_;
    const GroupIndex& group_index_;
    std::chrono::milliseconds base_timeout_;
};

}  // namespace wamlink::session
