#include "wamlink/session/command_dispatcher.hpp"

#include <future>
#include <utility>

#include "wamlink/core/errors.hpp"
#include "wamlink/util/logging.hpp"

namespace wamlink::session {

CommandDispatcher::CommandDispatcher(DeviceRegistry& registry,
                                     const GroupIndex& group_index,
                                     std::chrono::milliseconds base_timeout)
    : registry_(registry), group_index_(group_index), base_timeout_(base_timeout) {}

DeviceResult CommandDispatcher::send_to_device(const std::string& id,
                                               const std::string& command,
                                               const std::optional<std::string>& value) {
    auto call = command_to_api_call(command, value);
    return dispatch(id, call);
}

DeviceResult CommandDispatcher::send_api(const std::string& id, const ApiCall& call) {
    validate(call);
    return dispatch(id, call);
}

DeviceResult CommandDispatcher::dispatch(const std::string& id, const ApiCall& call) {
    auto link = registry_.get(id);

    CommandOptions options;
    options.requires_power_on = call.requires_power_on;
    options.expected_response = call.expected_response;
    options.timeout = base_timeout_ * call.timeout_multiple;

    try {
        auto response = link->send_command(call.method, arguments_of(call), options);
        return DeviceResult{id, call.method, std::move(response)};
    } catch (const Error& ex) {
        util::log::warn("Command " + call.method + " to " + id + " failed: " + ex.what());
        throw;
    }
}

GroupResult CommandDispatcher::send_to_group(const std::string& group_id,
                                             const std::string& command,
                                             const std::optional<std::string>& value) {
    const auto call = command_to_api_call(command, value);
    const auto group = group_index_.resolve(group_id);

    GroupResult result;
    result.group_id = group.anchor();
    result.members = group.members;

    std::vector<std::future<DeviceResult>> pending;
    pending.reserve(group.members.size());
    for (const auto& member : group.members) {
        pending.push_back(std::async(std::launch::async, [this, member, call] { return dispatch(member, call); }));
    }

    for (std::size_t i = 0; i < pending.size(); ++i) {
        const auto& member = group.members[i];
        try {
            pending[i].get();
            result.successes.push_back(member);
        } catch (const Error& ex) {
            result.failures.push_back(GroupResult::Failure{member, ex.kind(), ex.what()});
        } catch (const std::exception& ex) {
            result.failures.push_back(GroupResult::Failure{member, "error", ex.what()});
        }
    }

    util::log::info("Group command " + command + " via " + result.group_id + ": " +
                    std::to_string(result.successes.size()) + " ok, " + std::to_string(result.failures.size()) +
                    " failed");
    return result;
}

}  // namespace wamlink::session
