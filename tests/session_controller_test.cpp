#include <catch2/catch_test_macros.hpp>

#include "support/fake_transport.hpp"
#include "wamlink/core/errors.hpp"
#include "wamlink/session/session_controller.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wamlink;
using namespace wamlink::session;
using wamlink::testing::FakeTransport;
using wamlink::testing::wait_until;
using Json = nlohmann::json;

namespace {

SessionOptions fast_session() {
    SessionOptions options;
    options.link = wamlink::testing::fast_link_options();
    options.link.command_timeout = std::chrono::milliseconds(200);
    return options;
}

// Pops messages until one of `type` arrives.
std::optional<Json> await_message(broadcast::ViewerConnection& viewer, const std::string& type) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto text = viewer.wait_pop(std::chrono::milliseconds(50))) {
            auto message = Json::parse(*text);
            if (message["type"] == type) {
                return message;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

TEST_CASE("Viewers see connected devices in their first snapshot", "[controller]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->set_responder("10.0.3.1", wamlink::testing::acknowledging({{"friendlyName", std::string("Den")}}));
    SessionController controller(transport, fast_session());
    controller.connect("den", "10.0.3.1", kDefaultDevicePort);
    REQUIRE(wait_until([&] { return string_property(controller.current_properties("den"), "friendlyName").has_value(); }));

    auto viewer = controller.subscribe();
    const auto first = Json::parse(*viewer->try_pop());
    REQUIRE(first["type"] == "snapshot");
    REQUIRE(first["devices"].size() == 1);
    REQUIRE(first["devices"][0]["id"] == "den");
    REQUIRE(first["devices"][0]["name"] == "Den");
    REQUIRE(first["devices"][0]["state"] == "connected");
    REQUIRE(first["groups"].empty());
}

TEST_CASE("Device changes are pushed to subscribed viewers", "[controller]") {
    auto transport = std::make_shared<FakeTransport>();
    SessionController controller(transport, fast_session());
    auto viewer = controller.subscribe();

    controller.connect("", "10.0.3.2", kDefaultDevicePort);
    const auto state = await_message(*viewer, "link_state");
    REQUIRE(state);
    REQUIRE((*state)["device"] == "10.0.3.2");

    transport->latest("10.0.3.2")->deliver(testing::Frame{"N2X.Speaker.VolumeChanged", {{"volume", std::int64_t{18}}}, std::nullopt, {}});
    const auto update = await_message(*viewer, "property_update");
    REQUIRE(update);
    REQUIRE((*update)["properties"]["volume"] == 18);

    controller.disconnect("10.0.3.2");
    bool saw_disconnected = false;
    while (auto message = await_message(*viewer, "link_state")) {
        if ((*message)["state"] == "disconnected") {
            saw_disconnected = true;
            break;
        }
    }
    REQUIRE(saw_disconnected);
}

TEST_CASE("Group formation is broadcast", "[controller]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->set_responder("10.0.3.3", wamlink::testing::acknowledging({}, std::string("duo")));
    transport->set_responder("10.0.3.4", wamlink::testing::acknowledging({}, std::string("duo")));
    SessionController controller(transport, fast_session());
    auto viewer = controller.subscribe();

    controller.connect("left", "10.0.3.3", kDefaultDevicePort);
    controller.connect("right", "10.0.3.4", kDefaultDevicePort);

    std::optional<Json> formed;
    while (auto message = await_message(*viewer, "groups")) {
        if (!(*message)["groups"].empty()) {
            formed = message;
            break;
        }
    }
    REQUIRE(formed);
    REQUIRE((*formed)["groups"][0]["anchor"] == "left");
    REQUIRE((*formed)["groups"][0]["members"] == Json::array({"left", "right"}));

    const auto result = controller.send_command("right", "mute", std::nullopt, Target::group);
    REQUIRE(result["successes"].size() == 2);
    REQUIRE(result["failures"].empty());
}

TEST_CASE("Snapshot plus later updates matches the device state for viewers joining mid-stream", "[controller]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->set_responder("10.0.3.7", wamlink::testing::acknowledging({{"volume", std::int64_t{0}}}));
    auto options = fast_session();
    options.broadcaster.queue_capacity = 1024;
    SessionController controller(transport, options);
    controller.connect("den", "10.0.3.7", kDefaultDevicePort);
    REQUIRE(wait_until([&] { return controller.current_properties("den").count("volume") == 1; }));

    constexpr std::int64_t kFrames = 200;
    std::atomic<bool> delivering{true};
    std::thread device([&] {
        auto connection = transport->latest("10.0.3.7");
        for (std::int64_t i = 1; i <= kFrames; ++i) {
            connection->deliver(testing::Frame{"N2X.Speaker.VolumeChanged",
                                               {{"volume", i}, {"title", "track " + std::to_string(i % 7)}},
                                               std::nullopt,
                                               {}});
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
        delivering = false;
    });

    std::vector<std::shared_ptr<broadcast::ViewerConnection>> viewers;
    while (delivering.load() || viewers.size() < 5) {
        viewers.push_back(controller.subscribe());
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    device.join();

    REQUIRE(wait_until([&] {
        const auto properties = controller.current_properties("den");
        auto it = properties.find("volume");
        return it != properties.end() && it->second == PropertyValue{kFrames};
    }));
    // Let the last publish reach every queue.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    const auto expected = to_json_object(controller.current_properties("den"));

    for (const auto& viewer : viewers) {
        auto text = viewer->try_pop();
        REQUIRE(text);
        const auto first = Json::parse(*text);
        REQUIRE(first["type"] == "snapshot");
        REQUIRE(first["devices"].size() == 1);

        auto state = first["devices"][0]["properties"];
        while (auto next = viewer->try_pop()) {
            const auto message = Json::parse(*next);
            REQUIRE(message["type"] != "snapshot");
            if (message["type"] == "property_update" && message["device"] == "den") {
                state.update(message["properties"]);
            }
        }
        REQUIRE(state == expected);
    }
}

TEST_CASE("Device info falls back when properties are missing", "[controller]") {
    auto transport = std::make_shared<FakeTransport>();
    SessionController controller(transport, fast_session());
    controller.connect("bare", "10.0.3.5", kDefaultDevicePort);

    const auto info = controller.device_info("bare");
    REQUIRE(info.name == "WAM Speaker at bare");
    REQUIRE(info.model == "Samsung WAM Speaker");
    REQUIRE(info.mac == "Unknown");
    REQUIRE_THROWS_AS(controller.device_info("ghost"), DeviceNotFoundError);
}

TEST_CASE("Event queries are bounded", "[controller]") {
    auto transport = std::make_shared<FakeTransport>();
    SessionController controller(transport, fast_session());
    controller.connect("log", "10.0.3.6", kDefaultDevicePort);
    controller.send_to_device("log", "play", std::nullopt);

    REQUIRE(wait_until([&] { return controller.events("log", 100).size() == 2; }));
    REQUIRE(controller.events("log", 1).front().method == "N2X.Speaker.Play");
    REQUIRE_THROWS_AS(controller.events("log", 0), std::invalid_argument);
    REQUIRE_THROWS_AS(controller.events("log", 1001), std::invalid_argument);
    REQUIRE_THROWS_AS(controller.events("ghost", 10), DeviceNotFoundError);
}

TEST_CASE("Command targets parse strictly", "[controller]") {
    REQUIRE(parse_target("device") == Target::device);
    REQUIRE(parse_target("group") == Target::group);
    REQUIRE_THROWS_AS(parse_target("room"), UnknownCommandError);

    auto transport = std::make_shared<FakeTransport>();
    SessionController controller(transport, fast_session());
    controller.connect("one", "10.0.3.7", kDefaultDevicePort);
    const auto result = controller.send_command("one", "volume", std::string("5"), Target::device);
    REQUIRE(result["device"] == "one");
    REQUIRE(result["response"]["method"] == "N2X.Speaker.SetVolume");
    REQUIRE(controller.disconnect_all() == std::vector<std::string>{"one"});
}
