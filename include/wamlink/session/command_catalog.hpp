#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wamlink/core/property_value.hpp"

namespace wamlink::session {

constexpr const char* kSetPowerMethod = "N2X.Speaker.SetPower";
constexpr const char* kSnapshotRequestMethod = "N2X.Speaker.GetAllProperties";

struct ApiArgument {
    std::string name;
    PropertyValue value;
    // "str" or "dec", as the device API declares it.
    std::string type;
};

struct ApiCall {
    std::string api_type{"UIC"};
    std::string method;
    bool requires_power_on{false};
    std::vector<ApiArgument> args;
    std::string expected_response;
    int timeout_multiple{1};
};

// Throws UnknownCommandError describing the first problem found.
void validate(const ApiCall& call);

PropertyMap arguments_of(const ApiCall& call);

// Maps the short command names viewers use ("volume", "play", ...) to calls.
ApiCall command_to_api_call(const std::string& command, const std::optional<std::string>& value);

const std::vector<std::string>& known_commands();

// Parses the `args` list form [[name, value, type], ...].
std::vector<ApiArgument> arguments_from_json(const nlohmann::json& node);

}  // namespace wamlink::session
