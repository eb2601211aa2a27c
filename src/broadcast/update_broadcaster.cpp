#include "wamlink/broadcast/update_broadcaster.hpp"

#include <stdexcept>
#include <utility>

#include "wamlink/util/logging.hpp"

namespace wamlink::broadcast {

UpdateBroadcaster::UpdateBroadcaster(SnapshotProvider snapshot_provider, BroadcasterOptions options)
    : snapshot_provider_(std::move(snapshot_provider)), options_(options) {
    if (!snapshot_provider_) {
        throw std::invalid_argument("UpdateBroadcaster requires a snapshot provider");
    }
    if (options_.queue_capacity == 0) {
        throw std::invalid_argument("viewer queue capacity must be positive");
    }
}

std::shared_ptr<ViewerConnection> UpdateBroadcaster::subscribe() {
    // Holding the lock while the snapshot is taken orders it before any
    // publish that can reach this viewer.
    std::lock_guard<std::mutex> lock(mutex_);
    auto viewer = std::make_shared<ViewerConnection>(next_id_++, options_.queue_capacity);
    viewer->push(snapshot_provider_().dump());
    viewers_.emplace(viewer->id(), viewer);
    util::log::info("Viewer " + std::to_string(viewer->id()) + " subscribed (" + std::to_string(viewers_.size()) +
                    " active)");
    return viewer;
}

bool UpdateBroadcaster::unsubscribe(ViewerConnection::Id id) {
    std::shared_ptr<ViewerConnection> viewer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = viewers_.find(id);
        if (it == viewers_.end()) {
            return false;
        }
        viewer = std::move(it->second);
        viewers_.erase(it);
    }
    viewer->close("unsubscribed");
    util::log::info("Viewer " + std::to_string(id) + " unsubscribed");
    return true;
}

void UpdateBroadcaster::publish(const nlohmann::json& event) {
    const std::string message = event.dump();
    std::vector<std::shared_ptr<ViewerConnection>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(viewers_.size());
        for (const auto& [id, viewer] : viewers_) {
            targets.push_back(viewer);
        }
    }

    for (const auto& viewer : targets) {
        if (!viewer->push(message)) {
            auto reason = viewer->close_reason();
            drop(viewer, reason.empty() ? "closed" : reason);
        }
    }
}

bool UpdateBroadcaster::send_to(ViewerConnection::Id id, const nlohmann::json& message) {
    return send_raw(id, message.dump());
}

bool UpdateBroadcaster::send_raw(ViewerConnection::Id id, std::string text) {
    auto viewer = find(id);
    if (!viewer) {
        return false;
    }
    if (!viewer->push(std::move(text))) {
        drop(viewer, viewer->close_reason());
        return false;
    }
    return true;
}

bool UpdateBroadcaster::keep_alive(ViewerConnection::Id id) {
    auto viewer = find(id);
    if (!viewer || !viewer->is_open()) {
        return false;
    }
    viewer->touch(std::chrono::steady_clock::now());
    return true;
}

std::vector<ViewerConnection::Id> UpdateBroadcaster::expire_stale(std::chrono::steady_clock::time_point now) {
    const auto allowance = options_.keepalive_interval * options_.max_missed_keepalives;
    std::vector<std::shared_ptr<ViewerConnection>> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, viewer] : viewers_) {
            if (now - viewer->last_seen() > allowance) {
                stale.push_back(viewer);
            }
        }
    }

    std::vector<ViewerConnection::Id> expired;
    for (const auto& viewer : stale) {
        drop(viewer, "missed " + std::to_string(options_.max_missed_keepalives) + " keep-alives");
        expired.push_back(viewer->id());
    }
    return expired;
}

std::size_t UpdateBroadcaster::viewer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return viewers_.size();
}

void UpdateBroadcaster::close_all(const std::string& reason) {
    std::unordered_map<ViewerConnection::Id, std::shared_ptr<ViewerConnection>> viewers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        viewers.swap(viewers_);
    }
    for (const auto& [id, viewer] : viewers) {
        viewer->close(reason);
    }
}

std::shared_ptr<ViewerConnection> UpdateBroadcaster::find(ViewerConnection::Id id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = viewers_.find(id);
    if (it == viewers_.end()) {
        return nullptr;
    }
    return it->second;
}

void UpdateBroadcaster::drop(const std::shared_ptr<ViewerConnection>& viewer, const std::string& reason) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = viewers_.find(viewer->id());
        if (it != viewers_.end() && it->second == viewer) {
            viewers_.erase(it);
            removed = true;
        }
    }
    viewer->close(reason);
    if (removed) {
        util::log::warn("Dropped viewer " + std::to_string(viewer->id()) + ": " + reason);
    }
}

}  // namespace wamlink::broadcast
