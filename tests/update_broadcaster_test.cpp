#include <catch2/catch_test_macros.hpp>

#include "wamlink/broadcast/update_broadcaster.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>

using namespace wamlink::broadcast;
using Json = nlohmann::json;

namespace {

UpdateBroadcaster::SnapshotProvider counting_snapshot(std::atomic<int>& calls) {
    return [&calls] { return Json{{"type", "snapshot"}, {"sequence", ++calls}}; };
}

Json next_message(ViewerConnection& viewer) {
    auto text = viewer.try_pop();
    REQUIRE(text);
    return Json::parse(*text);
}

}  // namespace

TEST_CASE("A new viewer receives the snapshot before any update", "[broadcast]") {
    std::atomic<int> calls{0};
    UpdateBroadcaster broadcaster(counting_snapshot(calls));

    broadcaster.publish(Json{{"type", "link_state"}, {"device", "early"}});
    auto viewer = broadcaster.subscribe();
    broadcaster.publish(Json{{"type", "link_state"}, {"device", "late"}});

    REQUIRE(next_message(*viewer)["type"] == "snapshot");
    const auto update = next_message(*viewer);
    REQUIRE(update["device"] == "late");
    REQUIRE_FALSE(viewer->try_pop());
    REQUIRE(calls.load() == 1);
}

TEST_CASE("Updates reach every viewer in publish order", "[broadcast]") {
    std::atomic<int> calls{0};
    UpdateBroadcaster broadcaster(counting_snapshot(calls));
    auto first = broadcaster.subscribe();
    auto second = broadcaster.subscribe();

    for (int i = 0; i < 3; ++i) {
        broadcaster.publish(Json{{"type", "property_update"}, {"n", i}});
    }

    for (auto* viewer : {first.get(), second.get()}) {
        REQUIRE(next_message(*viewer)["type"] == "snapshot");
        for (int i = 0; i < 3; ++i) {
            REQUIRE(next_message(*viewer)["n"] == i);
        }
    }
    REQUIRE(broadcaster.viewer_count() == 2);
}

TEST_CASE("A viewer that falls behind is dropped without blocking others", "[broadcast]") {
    std::atomic<int> calls{0};
    BroadcasterOptions options;
    options.queue_capacity = 2;
    UpdateBroadcaster broadcaster(counting_snapshot(calls), options);
    auto slow = broadcaster.subscribe();
    auto fast = broadcaster.subscribe();

    broadcaster.publish(Json{{"n", 1}});
    REQUIRE(fast->try_pop());
    REQUIRE(fast->try_pop());
    broadcaster.publish(Json{{"n", 2}});

    REQUIRE_FALSE(slow->is_open());
    REQUIRE(slow->close_reason() == "outbound queue overflow");
    REQUIRE(fast->is_open());
    REQUIRE(next_message(*fast)["n"] == 2);
    REQUIRE(broadcaster.viewer_count() == 1);
}

TEST_CASE("Viewers that stop pinging are expired", "[broadcast]") {
    std::atomic<int> calls{0};
    BroadcasterOptions options;
    options.keepalive_interval = std::chrono::seconds(1);
    options.max_missed_keepalives = 3;
    UpdateBroadcaster broadcaster(counting_snapshot(calls), options);
    auto idle = broadcaster.subscribe();
    auto active = broadcaster.subscribe();

    const auto now = std::chrono::steady_clock::now();
    REQUIRE(broadcaster.expire_stale(now + std::chrono::seconds(2)).empty());

    REQUIRE(broadcaster.keep_alive(active->id()));
    active->touch(now + std::chrono::seconds(3));
    const auto expired = broadcaster.expire_stale(now + std::chrono::seconds(5));

    REQUIRE(expired == std::vector<ViewerConnection::Id>{idle->id()});
    REQUIRE_FALSE(idle->is_open());
    REQUIRE(active->is_open());
    REQUIRE_FALSE(broadcaster.keep_alive(idle->id()));
}

TEST_CASE("Direct replies go only to the addressed viewer", "[broadcast]") {
    std::atomic<int> calls{0};
    UpdateBroadcaster broadcaster(counting_snapshot(calls));
    auto one = broadcaster.subscribe();
    auto two = broadcaster.subscribe();
    one->try_pop();
    two->try_pop();

    REQUIRE(broadcaster.send_raw(one->id(), "Server received: hello"));
    REQUIRE(one->try_pop() == std::string("Server received: hello"));
    REQUIRE_FALSE(two->try_pop());
    REQUIRE_FALSE(broadcaster.send_to(9999, Json{{"type", "pong"}}));
}

TEST_CASE("Unsubscribing and shutdown close viewer queues", "[broadcast]") {
    std::atomic<int> calls{0};
    UpdateBroadcaster broadcaster(counting_snapshot(calls));
    auto leaving = broadcaster.subscribe();
    auto staying = broadcaster.subscribe();

    REQUIRE(broadcaster.unsubscribe(leaving->id()));
    REQUIRE_FALSE(broadcaster.unsubscribe(leaving->id()));
    REQUIRE_FALSE(leaving->is_open());

    broadcaster.close_all("server shutting down");
    REQUIRE(staying->close_reason() == "server shutting down");
    REQUIRE(broadcaster.viewer_count() == 0);

    REQUIRE_THROWS_AS(UpdateBroadcaster(UpdateBroadcaster::SnapshotProvider{}), std::invalid_argument);
}
