#include <catch2/catch_test_macros.hpp>

#include "support/fake_transport.hpp"
#include "wamlink/core/errors.hpp"
#include "wamlink/session/device_registry.hpp"

#include <future>
#include <memory>
#include <string>
#include <vector>

using namespace wamlink;
using namespace wamlink::session;
using wamlink::testing::FakeTransport;

namespace {

DeviceRegistry make_registry(const std::shared_ptr<FakeTransport>& transport) {
    return DeviceRegistry([transport](const DeviceDescriptor& descriptor) {
        return std::make_shared<DeviceLink>(descriptor, transport, wamlink::testing::fast_link_options());
    });
}

DeviceDescriptor speaker(const std::string& id, const std::string& address) {
    DeviceDescriptor descriptor;
    descriptor.id = id;
    descriptor.address = address;
    return descriptor;
}

}  // namespace

TEST_CASE("Registry keeps devices in registration order", "[registry]") {
    auto transport = std::make_shared<FakeTransport>();
    auto registry = make_registry(transport);

    registry.connect(speaker("kitchen", "10.0.1.2"));
    registry.connect(speaker("bedroom", "10.0.1.1"));

    REQUIRE(registry.ids() == std::vector<std::string>{"kitchen", "bedroom"});
    REQUIRE(registry.connected_ids().size() == 2);
    REQUIRE(registry.get("kitchen")->descriptor().address == "10.0.1.2");
    REQUIRE(registry.find("garage") == nullptr);
    REQUIRE_THROWS_AS(registry.get("garage"), DeviceNotFoundError);
}

TEST_CASE("Only one live link exists per device id", "[registry]") {
    auto transport = std::make_shared<FakeTransport>();
    auto registry = make_registry(transport);
    registry.connect(speaker("den", "10.0.1.3"));

    REQUIRE_THROWS_AS(registry.connect(speaker("den", "10.0.1.3")), AlreadyConnectedError);
    REQUIRE(registry.size() == 1);
    REQUIRE(transport->open_count("10.0.1.3") == 1);
}

TEST_CASE("Concurrent connects for one id produce a single link", "[registry]") {
    auto transport = std::make_shared<FakeTransport>();
    auto registry = make_registry(transport);

    std::vector<std::future<bool>> attempts;
    for (int i = 0; i < 4; ++i) {
        attempts.push_back(std::async(std::launch::async, [&registry] {
            try {
                registry.connect(speaker("hall", "10.0.1.4"));
                return true;
            } catch (const AlreadyConnectedError&) {
                return false;
            }
        }));
    }

    int winners = 0;
    for (auto& attempt : attempts) {
        winners += attempt.get() ? 1 : 0;
    }
    REQUIRE(winners == 1);
    REQUIRE(registry.size() == 1);
    REQUIRE(transport->open_count("10.0.1.4") == 1);
}

TEST_CASE("Failed connects leave no registry entry", "[registry]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->refuse("10.0.1.5");
    auto registry = make_registry(transport);

    REQUIRE_THROWS_AS(registry.connect(speaker("porch", "10.0.1.5")), ConnectError);
    REQUIRE(registry.find("porch") == nullptr);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("Removing a device allows connecting it again", "[registry]") {
    auto transport = std::make_shared<FakeTransport>();
    auto registry = make_registry(transport);
    registry.connect(speaker("study", "10.0.1.6"));

    REQUIRE(registry.remove("study"));
    REQUIRE_FALSE(registry.remove("study"));
    REQUIRE(registry.find("study") == nullptr);

    registry.connect(speaker("study", "10.0.1.6"));
    REQUIRE(registry.get("study")->state() == LinkState::connected);
}

TEST_CASE("Disconnecting everything is idempotent", "[registry]") {
    auto transport = std::make_shared<FakeTransport>();
    auto registry = make_registry(transport);
    registry.connect(speaker("a", "10.0.1.7"));
    registry.connect(speaker("b", "10.0.1.8"));

    REQUIRE(registry.disconnect_all() == std::vector<std::string>{"a", "b"});
    REQUIRE(registry.size() == 0);
    REQUIRE(registry.disconnect_all().empty());
    REQUIRE(transport->latest("10.0.1.7")->closed());
}

TEST_CASE("Terminal failures are remembered on the entry", "[registry]") {
    auto transport = std::make_shared<FakeTransport>();
    auto registry = make_registry(transport);
    registry.connect(speaker("attic", "10.0.1.9"));

    transport->refuse("10.0.1.9");
    transport->latest("10.0.1.9")->drop();
    REQUIRE(wamlink::testing::wait_until([&] { return registry.get("attic")->state() == LinkState::disconnected; }));

    registry.mark_failed("attic", "gave up");
    REQUIRE(registry.last_failure("attic") == std::string("gave up"));
    REQUIRE(registry.connected_ids().empty());

    transport->refuse("10.0.1.9", false);
    registry.connect(speaker("attic", "10.0.1.9"));
    REQUIRE_FALSE(registry.last_failure("attic"));
}

TEST_CASE("Disconnecting everything never strands a link that is still connecting", "[registry]") {
    auto transport = std::make_shared<FakeTransport>();
    auto registry = make_registry(transport);

    for (int round = 0; round < 50; ++round) {
        auto connecting = std::async(std::launch::async, [&] { registry.connect(speaker("porch", "10.0.1.10")); });
        auto cleared = std::async(std::launch::async, [&] { return registry.disconnect_all(); });
        connecting.get();
        const auto disconnected = cleared.get();

        auto live = registry.find("porch");
        auto connection = transport->latest("10.0.1.10");
        REQUIRE(connection != nullptr);
        if (live) {
            // disconnect_all went first; the connect that followed owns the socket.
            REQUIRE(disconnected.empty());
            REQUIRE(live->state() == LinkState::connected);
            REQUIRE_FALSE(connection->closed());
        } else {
            REQUIRE(disconnected == std::vector<std::string>{"porch"});
            REQUIRE(connection->closed());
        }
        registry.disconnect_all();
        REQUIRE(connection->closed());
    }
}
