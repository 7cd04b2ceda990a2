#pragma once

#include "LogicalType.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <optional>

namespace oraenhanced {

// Sequence name marking a primary key populated by a trigger
inline constexpr const char* kAutogeneratedSequenceName = "autogenerated";

// Attribute value handed over by the mapping layer
using AttributeValue = std::variant<std::monostate, std::string, nlohmann::json>;
using Attributes = std::map<std::string, AttributeValue>;

// True for a missing value, a whitespace-only string and an empty JSON container
bool isBlank(const AttributeValue& value);

// Text stored in the column; serialized attributes are dumped as JSON
std::string attributeToString(const AttributeValue& value, bool serialize);

// What the adapter needs to know about a mapped model
struct ModelDescriptor {
    std::string tableName;
    std::string primaryKey = "id";
    std::optional<std::string> sequenceName;

    // Attribute types declared on the model, keyed by attribute name
    std::map<std::string, LogicalType> attributeTypes;
    std::set<std::string> readonlyAttributes;

    // Custom persistence hooks replace the generated INSERT/UPDATE
    bool customCreateMethod = false;
    bool customUpdateMethod = false;

    bool isAutogenerated() const {
        return sequenceName && *sequenceName == kAutogeneratedSequenceName;
    }
};

}  // namespace oraenhanced
