#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "wamlink/broadcast/viewer_connection.hpp"

namespace wamlink::broadcast {

struct BroadcasterOptions {
    std::size_t queue_capacity{256};
    std::chrono::seconds keepalive_interval{30};
    int max_missed_keepalives{3};
};

// Fans state changes out to every subscribed viewer. Viewers never hold
// device state; the snapshot provider reads it from the registry.
class UpdateBroadcaster {
public:
    using SnapshotProvider = std::function<nlohmann::json()>;

    explicit UpdateBroadcaster(SnapshotProvider snapshot_provider, BroadcasterOptions options = {});

    // The returned viewer's first queued message is the current snapshot.
    std::shared_ptr<ViewerConnection> subscribe();
    bool unsubscribe(ViewerConnection::Id id);

    // Never blocks on a viewer; viewers that overflow are dropped.
    void publish(const nlohmann::json& event);
    bool send_to(ViewerConnection::Id id, const nlohmann::json& message);
    bool send_raw(ViewerConnection::Id id, std::string text);

    // Records a liveness probe; false when the viewer is gone.
    bool keep_alive(ViewerConnection::Id id);
    // Drops viewers that missed too many keep-alive intervals.
    std::vector<ViewerConnection::Id> expire_stale(std::chrono::steady_clock::time_point now);

    std::size_t viewer_count() const;
    void close_all(const std::string& reason);

    const BroadcasterOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<ViewerConnection> find(ViewerConnection::Id id) const;
    void drop(const std::shared_ptr<ViewerConnection>& viewer, const std::string& reason);

    SnapshotProvider snapshot_provider_;
    const BroadcasterOptions options_;
    mutable std::mutex mutex_;
    std::unordered_map<ViewerConnection::Id, std::shared_ptr<ViewerConnection>> viewers_;
    ViewerConnection::Id next_id_{1};
};

}  // namespace wamlink::broadcast
