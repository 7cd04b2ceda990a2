#include "SchemaManager.hpp"

namespace oraenhanced {

std::string typeKindToString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Integer:
            return "integer";
        case TypeKind::Decimal:
            return "decimal";
        case TypeKind::Float:
            return "float";
        case TypeKind::String:
            return "string";
        case TypeKind::NationalString:
            return "national_string";
        case TypeKind::Text:
            return "text";
        case TypeKind::NationalText:
            return "national_text";
        case TypeKind::Boolean:
            return "boolean";
        case TypeKind::Date:
            return "date";
        case TypeKind::Timestamp:
            return "timestamp";
        case TypeKind::TimestampTz:
            return "timestamptz";
        case TypeKind::TimestampLtz:
            return "timestampltz";
        case TypeKind::Raw:
            return "raw";
        case TypeKind::Binary:
            return "binary";
        case TypeKind::Json:
            return "json";
        case TypeKind::Unknown:
        default:
            return "unknown";
    }
}

std::string ColumnDescriptor::fullSqlType() const {
    // Catalog already carries modifiers for TIMESTAMP(6) and friends
    if (sqlType.find('(') != std::string::npos) {
        return sqlType;
    }

    if (sqlType == "NUMBER") {
        if (!limit && !scale) {
            return sqlType;
        }
        // INTEGER columns report a scale without a precision
        std::string result = sqlType + "(" + std::to_string(limit.value_or(38));
        if (scale && *scale > 0) {
            result += "," + std::to_string(*scale);
        }
        return result + ")";
    }

    if (limit) {
        return sqlType + "(" + std::to_string(*limit) + ")";
    }
    return sqlType;
}

}  // namespace oraenhanced
