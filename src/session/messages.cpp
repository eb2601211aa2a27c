#include "wamlink/session/messages.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace wamlink::session::messages {

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto time_t_value = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time_t_value, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << buffer << "." << std::setw(3) << std::setfill('0') << millis.count() << "Z";
    return oss.str();
}

std::string display_name(const LinkSnapshot& link) {
    if (link.descriptor.name && !link.descriptor.name->empty()) {
        return *link.descriptor.name;
    }
    if (auto name = string_property(link.properties, "friendlyName")) {
        return *name;
    }
    if (auto name = string_property(link.properties, "modelName")) {
        return *name;
    }
    return "WAM Speaker at " + link.descriptor.id;
}

std::string display_model(const LinkSnapshot& link) {
    if (auto model = string_property(link.properties, "model")) {
        return *model;
    }
    if (link.descriptor.model && !link.descriptor.model->empty()) {
        return *link.descriptor.model;
    }
    return "Samsung WAM Speaker";
}

Json device_entry(const LinkSnapshot& link) {
    Json entry = {
        {"id", link.descriptor.id},
        {"address", link.descriptor.address},
        {"port", link.descriptor.port},
        {"name", display_name(link)},
        {"model", display_model(link)},
        {"state", to_string(link.state)},
        {"properties", to_json_object(link.properties)},
    };
    entry["group"] = link.group_token ? Json(*link.group_token) : Json(nullptr);
    return entry;
}

Json group_entry(const Group& group) {
    return Json{
        {"anchor", group.anchor()},
        {"token", group.token},
        {"members", group.members},
    };
}

Json event_record(const EventRecord& record) {
    return Json{
        {"method", record.method},
        {"payload", to_json_object(record.payload)},
        {"success", record.success()},
        {"error", record.error},
        {"received_at", format_iso8601(record.received_at)},
    };
}

Json snapshot(const std::vector<LinkSnapshot>& links, const std::vector<Group>& group_list) {
    Json devices = Json::array();
    for (const auto& link : links) {
        devices.push_back(device_entry(link));
    }
    Json message = groups(group_list);
    message["type"] = "snapshot";
    message["devices"] = std::move(devices);
    return message;
}

Json link_state(const std::string& device_id, LinkState state, const std::string& reason) {
    Json message = {
        {"type", "link_state"},
        {"device", device_id},
        {"state", to_string(state)},
    };
    if (!reason.empty()) {
        message["reason"] = reason;
    }
    return message;
}

Json property_update(const std::string& device_id, const PropertyMap& properties) {
    return Json{
        {"type", "property_update"},
        {"device", device_id},
        {"properties", to_json_object(properties)},
    };
}

Json device_event(const std::string& device_id, const EventRecord& record) {
    return Json{
        {"type", "event"},
        {"device", device_id},
        {"event", event_record(record)},
    };
}

Json groups(const std::vector<Group>& group_list) {
    Json entries = Json::array();
    for (const auto& group : group_list) {
        entries.push_back(group_entry(group));
    }
    return Json{
        {"type", "groups"},
        {"groups", std::move(entries)},
    };
}

Json device_result(const DeviceResult& result) {
    return Json{
        {"device", result.device_id},
        {"method", result.method},
        {"response", transport::encode_frame(result.response)},
    };
}

Json group_result(const GroupResult& result) {
    Json failures = Json::array();
    for (const auto& failure : result.failures) {
        failures.push_back(Json{{"device", failure.device_id}, {"error", failure.kind}, {"detail", failure.reason}});
    }
    return Json{
        {"group", result.group_id},
        {"members", result.members},
        {"successes", result.successes},
        {"failures", std::move(failures)},
    };
}

}  // namespace wamlink::session::messages
