#include "wamlink/core/property_value.hpp"

#include <sstream>
#include <stdexcept>

namespace wamlink {

using Json = nlohmann::json;

Json to_json_value(const PropertyValue& value) {
    return std::visit([](const auto& v) { return Json(v); }, value);
}

Json to_json_object(const PropertyMap& properties) {
    Json object = Json::object();
    for (const auto& [name, value] : properties) {
        object[name] = to_json_value(value);
    }
    return object;
}

std::optional<PropertyValue> property_from_json(const Json& node) {
    if (node.is_string()) {
        return PropertyValue{node.get<std::string>()};
    }
    if (node.is_number_integer()) {
        return PropertyValue{node.get<std::int64_t>()};
    }
    if (node.is_array()) {
        std::vector<std::int64_t> values;
        values.reserve(node.size());
        for (const auto& element : node) {
            if (!element.is_number_integer()) {
                return std::nullopt;
            }
            values.push_back(element.get<std::int64_t>());
        }
        return PropertyValue{std::move(values)};
    }
    return std::nullopt;
}

PropertyMap properties_from_json(const Json& object, std::vector<std::string>* rejected) {
    PropertyMap properties;
    if (object.is_null()) {
        return properties;
    }
    if (!object.is_object()) {
        throw std::invalid_argument("property payload must be a JSON object");
    }
    for (const auto& [name, node] : object.items()) {
        auto value = property_from_json(node);
        if (!value) {
            if (rejected) {
                rejected->push_back(name);
            }
            continue;
        }
        properties.insert_or_assign(name, std::move(*value));
    }
    return properties;
}

std::optional<std::string> string_property(const PropertyMap& properties, const std::string& name) {
    auto it = properties.find(name);
    if (it == properties.end()) {
        return std::nullopt;
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return *text;
    }
    return std::nullopt;
}

std::string describe(const PropertyValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*number);
    }
    const auto& list = std::get<std::vector<std::int64_t>>(value);
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < list.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << list[i];
    }
    oss << ']';
    return oss.str();
}

}  // namespace wamlink
