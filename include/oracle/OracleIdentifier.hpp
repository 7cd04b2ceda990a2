#pragma once

/**
 * @file OracleIdentifier.hpp
 * @brief Parsing, case folding and quoting of Oracle object names.
 *
 * Oracle stores unquoted identifiers upper-case. References written as plain
 * identifiers are upper-cased before catalog lookups, and names read back from
 * the catalog are lower-cased for presentation when they are all upper-case.
 */

#include "SchemaManager.hpp"
#include <string>
#include <optional>

namespace oraenhanced {

/**
 * @class OracleIdentifier
 * @brief Static helpers for [owner.]name[@dblink] references.
 */
class OracleIdentifier {
public:
    /**
     * @brief Split a table reference into owner, name and database link.
     * @param raw Reference as written, e.g. "hr.employees" or "emp@remote".
     * @param defaultOwner Owner used when the reference has no "owner." part.
     * @return The parsed reference; names valid as unquoted identifiers are upper-cased.
     */
    static TableReference parseTableReference(const std::string& raw,
                                              const std::string& defaultOwner);

    /**
     * @brief Check that a reference can be written without quotes.
     *
     * Accepts [owner.]name[@link] where each part starts with a letter and
     * continues with letters, digits, '_', '$' or '#'. Mixed-case names are
     * rejected since they need quoting to keep their case.
     */
    static bool isValidTableName(const std::string& name);

    /** @brief True when the reference names an object behind a database link. */
    static bool isDbLinkReference(const std::string& raw);

    /** @brief True when the name part contains both upper and lower case letters. */
    static bool isMixedCase(const std::string& name);

    /**
     * @brief Lower-case a name stored upper-case; names with any lower-case
     *        letter are returned unchanged.
     */
    static std::string oracleDowncase(const std::string& name);
    static std::optional<std::string> oracleDowncase(const std::optional<std::string>& name);

    /**
     * @brief Quote a column name.
     *
     * Plain lower-case names are upper-cased inside the quotes so they match
     * the catalog; other names keep their case with embedded double quotes removed.
     */
    static std::string quoteColumnName(const std::string& name);

    /** @brief Quote each dotted part; a "@link" suffix is kept unquoted. */
    static std::string quoteTableName(const std::string& name);

    /** @brief Escape a string literal body by doubling single quotes. */
    static std::string quoteString(const std::string& value);

    /** @brief Quoted string literal, e.g. 'O''Brien'. */
    static std::string quote(const std::string& value);
};

}  // namespace oraenhanced
