#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace wamlink {

// Device-reported values are strings, integers or lists of integers.
using PropertyValue = std::variant<std::string, std::int64_t, std::vector<std::int64_t>>;
using PropertyMap = std::unordered_map<std::string, PropertyValue>;

nlohmann::json to_json_value(const PropertyValue& value);
nlohmann::json to_json_object(const PropertyMap& properties);

// Returns nullopt for JSON shapes outside the property typing contract
// (floats, booleans, nested objects, mixed arrays).
std::optional<PropertyValue> property_from_json(const nlohmann::json& node);

// Entries with unsupported shapes are skipped and named in `rejected` when given.
PropertyMap properties_from_json(const nlohmann::json& object, std::vector<std::string>* rejected = nullptr);

std::optional<std::string> string_property(const PropertyMap& properties, const std::string& name);

std::string describe(const PropertyValue& value);

}  // namespace wamlink
