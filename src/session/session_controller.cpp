#include "wamlink/session/session_controller.hpp"

#include <stdexcept>
#include <utility>

#include "wamlink/core/errors.hpp"
#include "wamlink/session/messages.hpp"
#include "wamlink/util/logging.hpp"

namespace wamlink::session {

namespace {
constexpr std::size_t kMaxEventQuery = 1000;
}

Target parse_target(const std::string& text) {
    if (text == "device") {
        return Target::device;
    }
    if (text == "group") {
        return Target::group;
    }
    throw UnknownCommandError("Unknown command target '" + text + "' (expected device or group)");
}

SessionController::SessionController(std::shared_ptr<transport::Transport> transport, SessionOptions options)
    : transport_(std::move(transport)),
      options_(options),
      registry_([this](const DeviceDescriptor& descriptor) {
          return std::make_shared<DeviceLink>(descriptor, transport_, options_.link,
                                              [this](const LinkEvent& event) { handle_link_event(event); });
      }),
      group_index_(registry_),
      dispatcher_(registry_, group_index_, options_.link.command_timeout),
      broadcaster_([this] { return snapshot(); }, options_.broadcaster) {}

SessionController::~SessionController() {
    // Links publish while disconnecting, so they go before the broadcaster.
    registry_.disconnect_all();
}

void SessionController::connect(const DeviceDescriptor& descriptor) {
    registry_.connect(descriptor);
}

void SessionController::connect(const std::string& id, const std::string& address, std::uint16_t port) {
    DeviceDescriptor descriptor;
    descriptor.id = id.empty() ? address : id;
    descriptor.address = address;
    descriptor.port = port;
    registry_.connect(descriptor);
}

bool SessionController::disconnect(const std::string& id) {
    return registry_.remove(id);
}

std::vector<std::string> SessionController::disconnect_all() {
    return registry_.disconnect_all();
}

DeviceResult SessionController::send_to_device(const std::string& id,
                                               const std::string& command,
                                               const std::optional<std::string>& value) {
    return dispatcher_.send_to_device(id, command, value);
}

GroupResult SessionController::send_to_group(const std::string& group_id,
                                             const std::string& command,
                                             const std::optional<std::string>& value) {
    return dispatcher_.send_to_group(group_id, command, value);
}

nlohmann::json SessionController::send_command(const std::string& id,
                                               const std::string& command,
                                               const std::optional<std::string>& value,
                                               Target target) {
    if (target == Target::group) {
        return messages::group_result(dispatcher_.send_to_group(id, command, value));
    }
    return messages::device_result(dispatcher_.send_to_device(id, command, value));
}

DeviceResult SessionController::send_api(const std::string& id, const ApiCall& call) {
    return dispatcher_.send_api(id, call);
}

std::shared_ptr<broadcast::ViewerConnection> SessionController::subscribe() {
    return broadcaster_.subscribe();
}

bool SessionController::unsubscribe(broadcast::ViewerConnection::Id id) {
    return broadcaster_.unsubscribe(id);
}

PropertyMap SessionController::current_properties(const std::string& id) const {
    return registry_.get(id)->properties();
}

DeviceInfo SessionController::device_info(const std::string& id) const {
    const auto link = registry_.get(id)->snapshot();
    auto text_or_unknown = [&link](const char* name) {
        auto it = link.properties.find(name);
        return it == link.properties.end() ? std::string("Unknown") : describe(it->second);
    };

    DeviceInfo info;
    info.name = messages::display_name(link);
    info.model = messages::display_model(link);
    info.mac = text_or_unknown("mac");
    info.version = text_or_unknown("version");
    info.power = text_or_unknown("power");
    info.volume = text_or_unknown("volume");
    info.input = text_or_unknown("input");
    return info;
}

std::vector<EventRecord> SessionController::events(const std::string& id, std::size_t limit) const {
    if (limit < 1 || limit > kMaxEventQuery) {
        throw std::invalid_argument("event limit must be between 1 and " + std::to_string(kMaxEventQuery));
    }
    return registry_.get(id)->events(limit);
}

std::vector<Group> SessionController::groups() const {
    return group_index_.groups();
}

nlohmann::json SessionController::snapshot() const {
    const auto links = registry_.snapshot();
    return messages::snapshot(links, GroupIndex::cluster(links));
}

void SessionController::handle_link_event(const LinkEvent& event) {
    switch (event.kind) {
        case LinkEvent::Kind::state_changed:
            broadcaster_.publish(messages::link_state(event.device_id, event.state, event.reason));
            publish_groups_if_changed();
            break;
        case LinkEvent::Kind::properties_changed:
            broadcaster_.publish(messages::property_update(event.device_id, event.properties));
            break;
        case LinkEvent::Kind::device_event:
            if (event.event) {
                broadcaster_.publish(messages::device_event(event.device_id, *event.event));
            }
            break;
        case LinkEvent::Kind::group_token_changed:
            publish_groups_if_changed();
            break;
        case LinkEvent::Kind::gave_up:
            registry_.mark_failed(event.device_id, event.reason);
            break;
    }
}

void SessionController::publish_groups_if_changed() {
    std::lock_guard<std::mutex> lock(groups_mutex_);
    auto current = group_index_.groups();
    if (current == last_groups_) {
        return;
    }
    last_groups_ = current;
    broadcaster_.publish(messages::groups(current));
}

}  // namespace wamlink::session
