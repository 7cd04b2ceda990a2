#pragma once

/**
 * @file OracleDialectTranslator.hpp
 * @brief Rewrites portable statement fragments into Oracle SQL.
 */

#include "Config.hpp"
#include "LogicalType.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace oraenhanced {

/**
 * @class OracleDialectTranslator
 * @brief Pagination, DISTINCT with ORDER BY, default values and DDL fragments.
 *
 * Pagination depends on the server version: releases before 12c have no
 * OFFSET/FETCH clause, so the query is wrapped in ROWNUM-numbered selects.
 * Setting use_old_oracle_visitor forces the ROWNUM form on any release.
 */
class OracleDialectTranslator {
public:
    /** Longest identifier accepted by pre-12.2 servers */
    static constexpr size_t kIdentifierMaxLength = 30;

    /**
     * @param config Adapter toggles (copied).
     * @param serverVersion Version components, e.g. {11, 2, 0, 4, 0}.
     */
    OracleDialectTranslator(const AdapterConfig& config, std::vector<int> serverVersion);

    /** @brief True on 12c and later unless use_old_oracle_visitor is set. */
    bool supportsFetchFirstNRowsAndOffset() const;

    /**
     * @name Capabilities queried by the mapping layer
     * Constant on every supported server unless noted.
     * @{
     */
    bool supportsSavepoints() const { return true; }
    bool supportsTransactionIsolation() const { return true; }
    bool supportsForeignKeys() const { return true; }
    bool supportsForeignKeysInCreate() const { return supportsForeignKeys(); }
    bool supportsViews() const { return true; }
    bool supportsDatetimeWithPrecision() const { return true; }
    bool supportsComments() const { return true; }

    /** @brief INSERT ALL, 11.2 and later. */
    bool supportsMultiInsert() const;

    /** @brief Virtual columns, 11g and later. */
    bool supportsVirtualColumns() const;

    /** @brief IS JSON check constraints, 12c and later. */
    bool supportsJson() const;
    /** @} */

    /**
     * @brief Apply a row limit and offset to a query.
     * @param sql Base SELECT statement.
     * @param limit Maximum number of rows, none for unlimited.
     * @param offset Rows to skip, none for zero.
     * @return Statement that returns the requested window of rows.
     */
    std::string paginate(const std::string& sql,
                         std::optional<uint64_t> limit,
                         std::optional<uint64_t> offset) const;

    /**
     * @brief Build the select list for DISTINCT combined with ORDER BY.
     *
     * Each order expression (ASC/DESC stripped) is projected as
     * FIRST_VALUE(expr) OVER (PARTITION BY <columns> ORDER BY expr) AS alias_<i>__
     * so the outer ORDER BY can reference it without changing the distinct rows.
     *
     * @param columns Distinct column list as SQL text.
     * @param orders ORDER BY expressions.
     * @return Select list: the columns followed by one alias per non-blank order.
     */
    std::string columnsForDistinct(const std::string& columns,
                                   const std::vector<std::string>& orders) const;

    /** @brief Unescape doubled single quotes of a string default. */
    static std::string extractValueFromDefault(const std::string& value);

    /**
     * @brief Normalize a catalog data_default value.
     * @param raw data_default as read from the catalog.
     * @param isVirtual Virtual columns keep their expression untouched.
     * @param type Resolved column type; string-like defaults are unescaped.
     * @return The default literal, none when it is NULL or an empty LOB.
     */
    std::optional<std::string> normalizeDefault(const std::optional<std::string>& raw,
                                                bool isVirtual,
                                                const LogicalType& type) const;

    /** @brief " TABLESPACE x" for the given object kind, or an empty string. */
    std::string tablespaceClause(const std::string& kind,
                                 const std::optional<std::string>& explicitTablespace = std::nullopt) const;

    /** @brief LOB storage clause placing a clob/blob/nclob column in its tablespace. */
    std::string lobStorageClause(const std::string& kind,
                                 const std::string& table,
                                 const std::string& column,
                                 const std::optional<std::string>& explicitTablespace = std::nullopt) const;

    std::string createSequence(const std::string& name,
                               std::optional<int64_t> startValue = std::nullopt) const;
    std::string dropSequence(const std::string& name) const;
    std::string nextSequenceValueSql(const std::string& name) const;

    /** @brief "<table>_seq", the table part truncated to fit the identifier limit. */
    static std::string defaultSequenceName(const std::string& table);

    /** @brief "<table>_pkt", truncated to fit the identifier limit. */
    static std::string defaultTriggerName(const std::string& table);

    /** @brief "<index>_prc", the datastore procedure of a context index. */
    static std::string defaultDatastoreProcedure(const std::string& index);

    const std::vector<int>& serverVersion() const { return m_serverVersion; }

private:
    // Server version compared component-wise; false when unknown
    bool versionAtLeast(int major, int minor = 0) const;

    std::optional<std::string> defaultTablespaceFor(const std::string& kind) const;

    AdapterConfig m_config;
    std::vector<int> m_serverVersion;
};

}  // namespace oraenhanced
