#include "wamlink/server/command_gateway.hpp"

#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>

#include "wamlink/core/errors.hpp"
#include "wamlink/session/command_catalog.hpp"
#include "wamlink/session/messages.hpp"
#include "wamlink/util/logging.hpp"

namespace wamlink::server {

namespace {

using Json = nlohmann::json;

constexpr std::size_t kDefaultEventLimit = 100;

std::string required_string(const Json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument(std::string("'") + key + "' is required");
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_value(const Json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<std::int64_t>());
    }
    if (it->is_boolean()) {
        return std::string(it->get<bool>() ? "on" : "off");
    }
    throw std::invalid_argument(std::string("'") + key + "' must be a string or integer");
}

std::uint16_t port_of(const Json& request, std::uint16_t fallback) {
    auto it = request.find("port");
    if (it == request.end() || it->is_null()) {
        return fallback;
    }
    const auto port = it->get<long>();
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("'port' must be between 1 and 65535");
    }
    return static_cast<std::uint16_t>(port);
}

Json result(const std::string& request, Json body = Json::object()) {
    body["type"] = "result";
    body["request"] = request;
    return body;
}

Json error_reply(const std::string& request, const std::string& kind, const std::string& detail) {
    return {{"type", "error"}, {"request", request}, {"error", kind}, {"detail", detail}};
}

Json descriptor_json(const DeviceDescriptor& descriptor) {
    Json node{{"id", descriptor.id}, {"address", descriptor.address}, {"port", descriptor.port}};
    if (descriptor.name) {
        node["name"] = *descriptor.name;
    }
    if (descriptor.model) {
        node["model"] = *descriptor.model;
    }
    return node;
}

session::ApiCall api_call_from(const Json& request) {
    session::ApiCall call;
    call.api_type = request.value("api_type", std::string("UIC"));
    call.method = required_string(request, "method");
    call.requires_power_on = request.value("pwron", false);
    if (auto args = request.find("args"); args != request.end() && !args->is_null()) {
        call.args = session::arguments_from_json(*args);
    }
    call.expected_response = request.value("expected_response", std::string());
    call.timeout_multiple = request.value("timeout", 1);
    return call;
}

}  // namespace

CommandGateway::CommandGateway(WsServer& ws_server,
                               session::SessionController& controller,
                               discovery::Discovery& discovery,
                               std::uint16_t default_device_port,
                               std::size_t worker_count)
    : ws_server_(ws_server),
      controller_(controller),
      discovery_(discovery),
      default_device_port_(default_device_port),
      workers_(worker_count) {}

CommandGateway::~CommandGateway() {
    stop();
}

void CommandGateway::handle_open(WsServer::SessionId session_id) {
    auto viewer = controller_.subscribe();
    {
        std::lock_guard<std::mutex> lock(viewers_mutex_);
        viewers_[session_id] = viewer->id();
    }
    if (!ws_server_.bind_outbox(session_id, viewer)) {
        controller_.unsubscribe(viewer->id());
    }
}

void CommandGateway::handle_close(WsServer::SessionId session_id) {
    std::optional<broadcast::ViewerConnection::Id> viewer_id;
    {
        std::lock_guard<std::mutex> lock(viewers_mutex_);
        auto it = viewers_.find(session_id);
        if (it != viewers_.end()) {
            viewer_id = it->second;
            viewers_.erase(it);
        }
    }
    if (viewer_id) {
        controller_.unsubscribe(*viewer_id);
    }
}

void CommandGateway::handle_message(const std::string& text, WsServer::SessionId session_id) {
    auto viewer_id = viewer_of(session_id);
    if (!viewer_id) {
        return;
    }
    auto request = Json::parse(text, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        controller_.broadcaster().send_raw(*viewer_id, "Server received: " + text);
        return;
    }
    submit([this, request = std::move(request), viewer = *viewer_id] {
        controller_.broadcaster().send_to(viewer, handle_request(request, viewer));
    });
}

Json CommandGateway::handle_request(const Json& request, broadcast::ViewerConnection::Id viewer_id) {
    const auto type_it = request.find("type");
    const auto type = type_it != request.end() && type_it->is_string() ? type_it->get<std::string>() : std::string();
    Json reply;
    try {
        reply = dispatch(type, request, viewer_id);
    } catch (const Error& ex) {
        util::log::warn("Request '" + type + "' failed: " + ex.what());
        reply = error_reply(type, ex.kind(), ex.what());
    } catch (const std::invalid_argument& ex) {
        reply = error_reply(type, "invalid_request", ex.what());
    } catch (const Json::exception& ex) {
        reply = error_reply(type, "invalid_request", ex.what());
    }
    if (auto it = request.find("request_id"); it != request.end()) {
        reply["request_id"] = *it;
    }
    return reply;
}

Json CommandGateway::dispatch(const std::string& type, const Json& request, broadcast::ViewerConnection::Id viewer_id) {
    if (type == "ping") {
        controller_.broadcaster().keep_alive(viewer_id);
        auto& registry = controller_.registry();
        return {{"type", "pong"},
                {"speakers_count", registry.size()},
                {"connected_speakers", registry.connected_ids()}};
    }
    if (type == "discover") {
        Json devices = Json::array();
        for (const auto& descriptor : discovery_.discover()) {
            devices.push_back(descriptor_json(descriptor));
        }
        return result(type, {{"devices", std::move(devices)}});
    }
    if (type == "connect") {
        const auto address = required_string(request, "address");
        const auto id = request.value("id", address);
        controller_.connect(id, address, port_of(request, default_device_port_));
        return result(type, {{"device_id", id}});
    }
    if (type == "disconnect") {
        return result(type, {{"disconnected", controller_.disconnect(required_string(request, "id"))}});
    }
    if (type == "disconnect_all") {
        return result(type, {{"disconnected", controller_.disconnect_all()}});
    }
    if (type == "command") {
        const auto target = session::parse_target(request.value("target", std::string("device")));
        auto body = controller_.send_command(required_string(request, "id"), required_string(request, "command"),
                                             optional_value(request, "value"), target);
        return result(type, {{"result", std::move(body)}});
    }
    if (type == "send_api") {
        const auto id = required_string(request, "id");
        return result(type, {{"result", session::messages::device_result(controller_.send_api(id, api_call_from(request)))}});
    }
    if (type == "properties") {
        const auto id = required_string(request, "id");
        return result(type, {{"device_id", id}, {"properties", to_json_object(controller_.current_properties(id))}});
    }
    if (type == "info") {
        const auto id = required_string(request, "id");
        const auto info = controller_.device_info(id);
        return result(type, {{"device_id", id},
                             {"name", info.name},
                             {"model", info.model},
                             {"mac", info.mac},
                             {"version", info.version},
                             {"power", info.power},
                             {"volume", info.volume},
                             {"input", info.input}});
    }
    if (type == "events") {
        const auto id = required_string(request, "id");
        const auto limit = request.value("limit", static_cast<std::int64_t>(kDefaultEventLimit));
        if (limit < 1) {
            throw std::invalid_argument("'limit' must be positive");
        }
        Json events = Json::array();
        for (const auto& record : controller_.events(id, static_cast<std::size_t>(limit))) {
            events.push_back(session::messages::event_record(record));
        }
        return result(type, {{"device_id", id}, {"events", std::move(events)}});
    }
    return error_reply(type, "unknown_request", "Unsupported request type '" + type + "'");
}

void CommandGateway::submit(std::function<void()> task) {
    boost::asio::post(workers_, [task = std::move(task)] {
        try {
            task();
        } catch (const std::exception& ex) {
            util::log::error(std::string("Gateway task failed: ") + ex.what());
        }
    });
}

void CommandGateway::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    workers_.join();
}

std::optional<broadcast::ViewerConnection::Id> CommandGateway::viewer_of(WsServer::SessionId session_id) const {
    std::lock_guard<std::mutex> lock(viewers_mutex_);
    auto it = viewers_.find(session_id);
    if (it == viewers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace wamlink::server
