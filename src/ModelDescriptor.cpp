#include "ModelDescriptor.hpp"
#include <algorithm>
#include <cctype>

namespace oraenhanced {

bool isBlank(const AttributeValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (const auto* str = std::get_if<std::string>(&value)) {
        return std::all_of(str->begin(), str->end(),
                           [](unsigned char c) { return std::isspace(c); });
    }

    const auto& json = std::get<nlohmann::json>(value);
    if (json.is_null()) {
        return true;
    }
    if (json.is_string()) {
        return isBlank(AttributeValue(json.get<std::string>()));
    }
    if (json.is_object() || json.is_array()) {
        return json.empty();
    }
    return json.is_boolean() && !json.get<bool>();
}

std::string attributeToString(const AttributeValue& value, bool serialize) {
    if (std::holds_alternative<std::monostate>(value)) {
        return serialize ? nlohmann::json().dump() : std::string();
    }
    if (const auto* str = std::get_if<std::string>(&value)) {
        return serialize ? nlohmann::json(*str).dump() : *str;
    }

    const auto& json = std::get<nlohmann::json>(value);
    if (json.is_string() && !serialize) {
        return json.get<std::string>();
    }
    return json.dump();
}

}  // namespace oraenhanced
