#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wamlink/session/command_dispatcher.hpp"
#include "wamlink/session/device_link.hpp"
#include "wamlink/session/group_index.hpp"

namespace wamlink::session::messages {

using Json = nlohmann::json;

std::string format_iso8601(std::chrono::system_clock::time_point tp);

std::string display_name(const LinkSnapshot& link);
std::string display_model(const LinkSnapshot& link);

Json device_entry(const LinkSnapshot& link);
Json group_entry(const Group& group);
Json event_record(const EventRecord& record);

Json snapshot(const std::vector<LinkSnapshot>& links, const std::vector<Group>& groups);
Json link_state(const std::string& device_id, LinkState state, const std::string& reason);
Json property_update(const std::string& device_id, const PropertyMap& properties);
Json device_event(const std::string& device_id, const EventRecord& record);
Json groups(const std::vector<Group>& groups);

Json device_result(const DeviceResult& result);
Json group_result(const GroupResult& result);

}  // namespace wamlink::session::messages
