#include "wamlink/transport/transport.hpp"

#include <vector>

#include "wamlink/util/logging.hpp"

namespace wamlink::transport {

using Json = nlohmann::json;

Json encode_frame(const Frame& frame) {
    Json node = {
        {"method", frame.method},
        {"payload", to_json_object(frame.payload)},
    };
    if (frame.group_token) {
        node["group"] = *frame.group_token;
    }
    if (!frame.error.empty()) {
        node["error"] = frame.error;
    }
    return node;
}

Frame decode_frame(const Json& node) {
    if (!node.is_object()) {
        throw TransportError("frame must be a JSON object");
    }
    auto method_it = node.find("method");
    if (method_it == node.end() || !method_it->is_string()) {
        throw TransportError("frame is missing a string 'method'");
    }

    Frame frame;
    frame.method = method_it->get<std::string>();
    if (auto payload_it = node.find("payload"); payload_it != node.end()) {
        std::vector<std::string> rejected;
        try {
            frame.payload = properties_from_json(*payload_it, &rejected);
        } catch (const std::invalid_argument& ex) {
            throw TransportError(std::string("frame payload invalid: ") + ex.what());
        }
        for (const auto& name : rejected) {
            util::log::debug("Dropping property '" + name + "' of " + frame.method + ": unsupported value type");
        }
    }
    if (auto group_it = node.find("group"); group_it != node.end()) {
        if (group_it->is_string()) {
            frame.group_token = group_it->get<std::string>();
        } else if (group_it->is_null()) {
            frame.group_token = std::string{};
        }
    }
    if (auto error_it = node.find("error"); error_it != node.end() && error_it->is_string()) {
        frame.error = error_it->get<std::string>();
    }
    return frame;
}

}  // namespace wamlink::transport
