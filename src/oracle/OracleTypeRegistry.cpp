#include "OracleTypeRegistry.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <regex>
#include <stdexcept>

namespace oraenhanced {

namespace {

std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool startsWith(const std::string& str, const char* prefix) {
    return str.rfind(prefix, 0) == 0;
}

// Leading decimal digits as an int, 0 when there are none. Numerals too
// large for an int are clamped to INT_MAX.
int leadingInt(const std::string& str) {
    size_t pos = str.find_first_not_of(" \t");
    if (pos == std::string::npos) return 0;
    int value = 0;
    while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
        int digit = str[pos] - '0';
        if (value > (std::numeric_limits<int>::max() - digit) / 10) {
            return std::numeric_limits<int>::max();
        }
        value = value * 10 + digit;
        ++pos;
    }
    return value;
}

LogicalType makeType(TypeKind kind,
                     std::optional<int> precision = std::nullopt,
                     std::optional<int> scale = std::nullopt,
                     std::optional<int> limit = std::nullopt) {
    LogicalType type;
    type.kind = kind;
    type.precision = precision;
    type.scale = scale;
    type.limit = limit;
    return type;
}

}  // namespace

OracleTypeRegistry::OracleTypeRegistry(const AdapterConfig& config)
    : m_emulateBooleans(config.emulate_booleans)
    , m_emulateBooleansFromStrings(config.emulate_booleans_from_strings) {
}

std::optional<int> OracleTypeRegistry::extractPrecision(const std::string& sqlType) {
    static const std::regex pattern(R"(\((\d+)(,\d+)?\))");
    std::smatch match;
    if (std::regex_search(sqlType, match, pattern)) {
        return leadingInt(match[1].str());
    }
    return std::nullopt;
}

std::optional<int> OracleTypeRegistry::extractScale(const std::string& sqlType) {
    static const std::regex precisionOnly(R"(\((\d+)\))");
    static const std::regex precisionAndScale(R"(\((\d+),(\d+)\))");
    std::smatch match;
    if (std::regex_search(sqlType, match, precisionOnly)) {
        return 0;
    }
    if (std::regex_search(sqlType, match, precisionAndScale)) {
        return leadingInt(match[2].str());
    }
    return std::nullopt;
}

std::optional<int> OracleTypeRegistry::extractLimit(const std::string& sqlType) {
    static const std::regex bigint(R"(^bigint)", std::regex::icase);
    static const std::regex parens(R"(\((.*)\))");
    std::smatch match;
    if (std::regex_search(sqlType, match, bigint)) {
        return 19;
    }
    if (std::regex_search(sqlType, match, parens)) {
        return leadingInt(match[1].str());
    }
    return std::nullopt;
}

LogicalType OracleTypeRegistry::resolve(const std::string& nativeType) const {
    const std::string upper = toUpper(nativeType);

    if (m_emulateBooleans) {
        if (m_emulateBooleansFromStrings) {
            if (startsWith(upper, "VARCHAR2(1)")) return makeType(TypeKind::Boolean);
        } else if (startsWith(upper, "NUMBER(1)")) {
            return makeType(TypeKind::Boolean);
        }
    }

    if (contains(upper, "NUMBER")) {
        auto scale = extractScale(nativeType);
        auto precision = extractPrecision(nativeType);
        if (scale && *scale == 0) {
            return makeType(TypeKind::Integer, precision, std::nullopt, extractLimit(nativeType));
        }
        return makeType(TypeKind::Decimal, precision, scale);
    }

    if (contains(upper, "NVARCHAR2") || startsWith(upper, "NCHAR")) {
        return makeType(TypeKind::NationalString, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "NCLOB")) {
        return makeType(TypeKind::NationalText, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "CLOB")) {
        return makeType(TypeKind::Text, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "CHAR")) {
        return makeType(TypeKind::String, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "RAW")) {
        return makeType(TypeKind::Raw, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "WITH LOCAL TIME ZONE")) {
        return makeType(TypeKind::TimestampLtz, extractPrecision(nativeType));
    }
    if (contains(upper, "WITH TIME ZONE")) {
        return makeType(TypeKind::TimestampTz, extractPrecision(nativeType));
    }

    return resolveGeneric(upper, nativeType);
}

LogicalType OracleTypeRegistry::resolveGeneric(const std::string& upper,
                                               const std::string& nativeType) const {
    if (startsWith(upper, "JSON")) {
        return makeType(TypeKind::Json);
    }
    if (contains(upper, "DECIMAL") || contains(upper, "NUMERIC")) {
        return makeType(TypeKind::Decimal, extractPrecision(nativeType), extractScale(nativeType));
    }
    if (contains(upper, "DOUBLE")) {
        return makeType(TypeKind::Float, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "TIMESTAMP")) {
        return makeType(TypeKind::Timestamp, extractPrecision(nativeType));
    }
    if (contains(upper, "BLOB")) {
        return makeType(TypeKind::Binary, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "INT")) {
        return makeType(TypeKind::Integer, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "FLOAT")) {
        return makeType(TypeKind::Float, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "TIME")) {
        return makeType(TypeKind::Timestamp, extractPrecision(nativeType));
    }
    if (contains(upper, "DATE")) {
        return makeType(TypeKind::Date, extractPrecision(nativeType));
    }
    if (contains(upper, "TEXT")) {
        return makeType(TypeKind::Text, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "BINARY")) {
        return makeType(TypeKind::Binary, std::nullopt, std::nullopt, extractLimit(nativeType));
    }
    if (contains(upper, "BOOLEAN")) {
        return makeType(TypeKind::Boolean);
    }
    return makeType(TypeKind::Unknown);
}

std::string OracleTypeRegistry::nativeDatabaseType(TypeKind kind) const {
    switch (kind) {
        case TypeKind::Integer:
            return "NUMBER(38)";
        case TypeKind::Decimal:
            return "DECIMAL";
        case TypeKind::Float:
            return "BINARY_FLOAT";
        case TypeKind::String:
            return "VARCHAR2(255)";
        case TypeKind::NationalString:
            return "NVARCHAR2(255)";
        case TypeKind::Text:
        case TypeKind::Json:
            return "CLOB";
        case TypeKind::NationalText:
            return "NCLOB";
        case TypeKind::Boolean:
            return m_emulateBooleansFromStrings ? "VARCHAR2(1)" : "NUMBER(1)";
        case TypeKind::Date:
            return "DATE";
        case TypeKind::Timestamp:
            return "TIMESTAMP";
        case TypeKind::TimestampTz:
            return "TIMESTAMP WITH TIME ZONE";
        case TypeKind::TimestampLtz:
            return "TIMESTAMP WITH LOCAL TIME ZONE";
        case TypeKind::Raw:
            return "RAW(2000)";
        case TypeKind::Binary:
            return "BLOB";
        case TypeKind::Unknown:
        default:
            throw std::invalid_argument("No native type for " + typeKindToString(kind));
    }
}

}  // namespace oraenhanced
