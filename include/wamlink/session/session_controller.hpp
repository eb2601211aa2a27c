#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wamlink/broadcast/update_broadcaster.hpp"
#include "wamlink/session/command_dispatcher.hpp"
#include "wamlink/session/device_registry.hpp"
#include "wamlink/session/group_index.hpp"
#include "wamlink/transport/transport.hpp"

namespace wamlink::session {

struct SessionOptions {
    LinkOptions link{};
    broadcast::BroadcasterOptions broadcaster{};
};

enum class Target { device, group };

// Throws UnknownCommandError for anything but "device" or "group".
Target parse_target(const std::string& text);

struct DeviceInfo {
    std::string name;
    std::string model;
    std::string mac;
    std::string version;
    std::string power;
    std::string volume;
    std::string input;
};

// Entry point used by the presentation layer. Link events flow into the
// broadcaster from here; nothing else calls back into presentation.
class SessionController {
public:
    explicit SessionController(std::shared_ptr<transport::Transport> transport, SessionOptions options = {});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    void connect(const DeviceDescriptor& descriptor);
    void connect(const std::string& id, const std::string& address, std::uint16_t port);
    bool disconnect(const std::string& id);
    std::vector<std::string> disconnect_all();

    DeviceResult send_to_device(const std::string& id,
                                const std::string& command,
                                const std::optional<std::string>& value);
    GroupResult send_to_group(const std::string& group_id,
                              const std::string& command,
                              const std::optional<std::string>& value);
    // Result of either form, as sent back to viewers.
    nlohmann::json send_command(const std::string& id,
                                const std::string& command,
                                const std::optional<std::string>& value,
                                Target target);
    DeviceResult send_api(const std::string& id, const ApiCall& call);

    std::shared_ptr<broadcast::ViewerConnection> subscribe();
    bool unsubscribe(broadcast::ViewerConnection::Id id);

    // Throws DeviceNotFoundError.
    PropertyMap current_properties(const std::string& id) const;
    DeviceInfo device_info(const std::string& id) const;
    std::vector<EventRecord> events(const std::string& id, std::size_t limit) const;

    std::vector<Group> groups() const;
    nlohmann::json snapshot() const;

    DeviceRegistry& registry() noexcept { return registry_; }
    const GroupIndex& group_index() const noexcept { return group_index_; }
    broadcast::UpdateBroadcaster& broadcaster() noexcept { return broadcaster_; }
    const SessionOptions& options() const noexcept { return options_; }

private:
    void handle_link_event(const LinkEvent& event);
    void publish_groups_if_changed();

    std::shared_ptr<transport::Transport> transport_;
    const SessionOptions options_;
    DeviceRegistry registry_;
    GroupIndex group_index_;
    CommandDispatcher dispatcher_;
    broadcast::UpdateBroadcaster broadcaster_;

    std::mutex groups_mutex_;
    std::vector<Group> last_groups_;
};

}  // namespace wamlink::session
