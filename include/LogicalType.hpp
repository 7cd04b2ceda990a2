#pragma once

#include <string>
#include <optional>

namespace oraenhanced {

// Dialect-neutral column type families
enum class TypeKind {
    Integer,
    Decimal,
    Float,
    String,
    NationalString,
    Text,
    NationalText,
    Boolean,
    Date,
    Timestamp,
    TimestampTz,
    TimestampLtz,
    Raw,
    Binary,
    Json,
    Unknown
};

std::string typeKindToString(TypeKind kind);

struct LogicalType {
    TypeKind kind = TypeKind::Unknown;
    std::optional<int> precision;
    std::optional<int> scale;
    std::optional<int> limit;

    // Values are serialized (dumped to JSON) before being stored
    bool serialized = false;

    bool isStringLike() const {
        return kind == TypeKind::String || kind == TypeKind::NationalString ||
               kind == TypeKind::Text || kind == TypeKind::NationalText;
    }

    bool isBinary() const { return kind == TypeKind::Binary || kind == TypeKind::Raw; }

    bool operator==(const LogicalType& other) const {
        return kind == other.kind && precision == other.precision &&
               scale == other.scale && limit == other.limit &&
               serialized == other.serialized;
    }
    bool operator!=(const LogicalType& other) const { return !(*this == other); }
};

}  // namespace oraenhanced
