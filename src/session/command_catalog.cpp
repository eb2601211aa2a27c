#include "wamlink/session/command_catalog.hpp"

#include <algorithm>
#include <charconv>

#include "wamlink/core/errors.hpp"

namespace wamlink::session {

namespace {

using Json = nlohmann::json;

struct CatalogEntry {
    std::string command;
    std::string method;
    std::optional<std::string> arg_name;
    std::string arg_type;
    std::string default_value;
};

const std::vector<CatalogEntry>& catalog() {
    static const std::vector<CatalogEntry> entries{
        {"power", kSetPowerMethod, "strValue", "str", "on"},
        {"volume", "N2X.Speaker.SetVolume", "nVolume", "dec", "10"},
        {"mute", "N2X.Speaker.SetMute", "strValue", "str", "on"},
        {"play", "N2X.Speaker.Play", std::nullopt, "", ""},
        {"pause", "N2X.Speaker.Pause", std::nullopt, "", ""},
        {"stop", "N2X.Speaker.Stop", std::nullopt, "", ""},
        {"next", "N2X.Speaker.Next", std::nullopt, "", ""},
        {"prev", "N2X.Speaker.Prev", std::nullopt, "", ""},
        {"set_input", "N2X.Speaker.SetInput", "strSource", "str", "BT"},
    };
    return entries;
}

std::int64_t parse_integer(const std::string& text, const std::string& command) {
    std::int64_t value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        throw UnknownCommandError("Command '" + command + "' expects an integer value, got '" + text + "'");
    }
    return value;
}

}  // namespace

void validate(const ApiCall& call) {
    if (call.method.empty()) {
        throw UnknownCommandError("API call method must not be empty");
    }
    if (call.api_type != "UIC" && call.api_type != "CPM") {
        throw UnknownCommandError("Unknown API type '" + call.api_type + "' (expected UIC or CPM)");
    }
    if (call.timeout_multiple < 1) {
        throw UnknownCommandError("timeout multiple must be at least 1");
    }
    for (const auto& arg : call.args) {
        if (arg.name.empty()) {
            throw UnknownCommandError("API call argument name must not be empty");
        }
        if (arg.type == "str") {
            if (!std::holds_alternative<std::string>(arg.value)) {
                throw UnknownCommandError("Argument '" + arg.name + "' declared str but value is not a string");
            }
        } else if (arg.type == "dec") {
            if (!std::holds_alternative<std::int64_t>(arg.value)) {
                throw UnknownCommandError("Argument '" + arg.name + "' declared dec but value is not an integer");
            }
        } else {
            throw UnknownCommandError("Argument '" + arg.name + "' has unknown type '" + arg.type + "'");
        }
    }
}

PropertyMap arguments_of(const ApiCall& call) {
    PropertyMap args;
    for (const auto& arg : call.args) {
        args.insert_or_assign(arg.name, arg.value);
    }
    return args;
}

ApiCall command_to_api_call(const std::string& command, const std::optional<std::string>& value) {
    const auto& entries = catalog();
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&command](const CatalogEntry& entry) { return entry.command == command; });
    if (it == entries.end()) {
        std::string names;
        for (const auto& name : known_commands()) {
            names += names.empty() ? name : ", " + name;
        }
        throw UnknownCommandError("Unknown command: " + command + " (known: " + names + ")");
    }

    ApiCall call;
    call.method = it->method;
    if (it->arg_name) {
        const std::string text = value.value_or(it->default_value);
        ApiArgument arg;
        arg.name = *it->arg_name;
        arg.type = it->arg_type;
        if (it->arg_type == "dec") {
            arg.value = parse_integer(text, command);
        } else {
            arg.value = text;
        }
        call.args.push_back(std::move(arg));
    }
    return call;
}

const std::vector<std::string>& known_commands() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& entry : catalog()) {
            out.push_back(entry.command);
        }
        return out;
    }();
    return names;
}

std::vector<ApiArgument> arguments_from_json(const Json& node) {
    if (node.is_null()) {
        return {};
    }
    if (!node.is_array()) {
        throw UnknownCommandError("args must be a list of [name, value, type] triples");
    }
    std::vector<ApiArgument> args;
    for (const auto& entry : node) {
        if (!entry.is_array() || entry.size() != 3 || !entry[0].is_string() || !entry[2].is_string()) {
            throw UnknownCommandError("each argument must be [name, value, type]");
        }
        auto value = property_from_json(entry[1]);
        if (!value) {
            throw UnknownCommandError("argument '" + entry[0].get<std::string>() + "' has an unsupported value");
        }
        args.push_back(ApiArgument{entry[0].get<std::string>(), std::move(*value), entry[2].get<std::string>()});
    }
    return args;
}

}  // namespace wamlink::session
