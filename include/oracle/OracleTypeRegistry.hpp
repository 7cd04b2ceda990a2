#pragma once

/**
 * @file OracleTypeRegistry.hpp
 * @brief Maps Oracle native type strings to logical column types.
 */

#include "Config.hpp"
#include "LogicalType.hpp"
#include <string>
#include <optional>

namespace oraenhanced {

/**
 * @class OracleTypeRegistry
 * @brief Resolves native type strings such as "NUMBER(10,2)" or
 *        "TIMESTAMP(6) WITH TIME ZONE" into LogicalType values.
 *
 * Patterns are tried in a fixed order and the first match wins:
 * - boolean emulation (NUMBER(1), or VARCHAR2(1) when emulating from strings)
 * - NUMBER, dispatched on the extracted scale
 * - national character types before the generic character types
 * - CLOB/NCLOB, RAW
 * - time-zone qualified timestamps before the generic timestamp
 * - generic SQL families (DATE, BLOB, FLOAT, DECIMAL, INT, JSON)
 *
 * The boolean toggles are copied from AdapterConfig at construction.
 */
class OracleTypeRegistry {
public:
    explicit OracleTypeRegistry(const AdapterConfig& config);

    /**
     * @brief Resolve a native type string.
     * @param nativeType Type as reported by the catalog, with modifiers.
     * @return The logical type; TypeKind::Unknown when nothing matches.
     */
    LogicalType resolve(const std::string& nativeType) const;

    /**
     * @brief DDL type used when creating a column of the given kind.
     * @param kind Logical type family.
     * @return Native type with default modifiers, e.g. "VARCHAR2(255)".
     */
    std::string nativeDatabaseType(TypeKind kind) const;

    /** @brief First numeral inside the parentheses. */
    static std::optional<int> extractPrecision(const std::string& sqlType);

    /** @brief 0 for "(p)", s for "(p,s)", none without parentheses. */
    static std::optional<int> extractScale(const std::string& sqlType);

    /** @brief 19 for bigint types, else the parenthesized numeral. */
    static std::optional<int> extractLimit(const std::string& sqlType);

    bool emulateBooleans() const { return m_emulateBooleans; }
    bool emulateBooleansFromStrings() const { return m_emulateBooleansFromStrings; }

private:
    LogicalType resolveGeneric(const std::string& upper, const std::string& nativeType) const;

    bool m_emulateBooleans;
    bool m_emulateBooleansFromStrings;
};

}  // namespace oraenhanced
