#pragma once

/**
 * @file OracleSchemaManager.hpp
 * @brief Oracle data dictionary introspection.
 *
 * This file provides the SchemaManager implementation for Oracle databases.
 * Every call reads the live catalog through the Connection it was given;
 * results are never cached here.
 */

#include "SchemaManager.hpp"
#include "Connection.hpp"
#include "Config.hpp"
#include "OracleTypeRegistry.hpp"
#include "OracleDialectTranslator.hpp"

namespace oraenhanced {

/**
 * @class OracleSchemaManager
 * @brief SchemaManager implementation for Oracle databases.
 *
 * Queries Oracle data dictionary views and assembles dialect-neutral
 * descriptors. Object names are upper-cased for lookups when written as plain
 * identifiers and lower-cased again for presentation.
 *
 * Data Dictionary Views Used:
 * - ALL_TABLES, ALL_VIEWS, ALL_MVIEWS: object lists
 * - ALL_TAB_COLS, ALL_COL_COMMENTS: column definitions
 * - ALL_INDEXES, ALL_IND_COLUMNS, ALL_IND_EXPRESSIONS: index definitions
 * - ALL_CONSTRAINTS, ALL_CONS_COLUMNS: primary keys
 * - ALL_SEQUENCES, ALL_TRIGGERS: key generation objects
 * - ALL_SYNONYMS, ALL_DB_LINKS: name resolution
 * - ALL_SOURCE: datastore procedures of context indexes
 * - USER_USERS: default tablespace
 *
 * Thread Safety:
 * - Not thread-safe; shares the single session of its Connection.
 */
class OracleSchemaManager : public SchemaManager {
public:
    /**
     * @brief Construct an Oracle schema manager.
     * @param connection Session used for every catalog query (borrowed).
     * @param config Adapter toggles (copied).
     */
    OracleSchemaManager(Connection& connection, const AdapterConfig& config);

    ~OracleSchemaManager() override = default;

    // ----- Table structure -----

    /**
     * @brief Column definitions in catalog order, hidden columns excluded.
     * @param table Table reference, optionally owner-qualified.
     * @return Columns with resolved logical types and normalized defaults.
     */
    std::vector<ColumnDescriptor> columns(const std::string& table) override;

    /**
     * @brief Indexes of a table, excluding the index backing its primary key.
     *
     * The catalog query yields one row per index column; rows are folded
     * into one descriptor per index name in first-seen order. Context
     * indexes also carry the parameters recorded in their datastore procedure.
     *
     * @param table Table reference.
     * @return Index descriptors of the requested table only.
     */
    std::vector<IndexDescriptor> indexes(const std::string& table) override;

    /**
     * @brief All primary key columns ordered by position.
     * @param table Table reference.
     * @return Lower-cased column names; composite keys are returned whole.
     */
    std::vector<std::string> primaryKeys(const std::string& table) override;

    /**
     * @brief Primary key column and default sequence used for key generation.
     *
     * Composite keys are not supported: a warning is logged and none is
     * returned, the same as for a table without primary key.
     *
     * @param table Table reference.
     * @return Key column and "<table>_seq" when that sequence exists.
     */
    std::optional<SequenceBinding> pkAndSequenceFor(const std::string& table) override;

    /** @brief Single-column primary key, none for composite or missing keys. */
    std::optional<std::string> primaryKey(const std::string& table) override;

    /** @brief True when the table has a single-column primary key. */
    bool hasPrimaryKey(const std::string& table) override;

    /** @brief True when an enabled "<table>_pkt" trigger exists on the table. */
    bool hasPrimaryKeyTrigger(const std::string& table) override;

    // ----- Schema objects -----

    /** @brief Tables of the current schema, secondary tables excluded. */
    std::vector<std::string> tables() override;

    /** @brief Views of the current schema. */
    std::vector<std::string> views() override;

    /** @brief Materialized views of the current schema. */
    std::vector<std::string> materializedViews() override;

    /** @brief Synonyms owned by the session user. */
    std::vector<SynonymDescriptor> synonyms() override;

    /** @brief Tables followed by synonym names, without duplicates. */
    std::vector<std::string> dataSources() override;

    /**
     * @brief Check if a local table exists.
     * @return false for database link references.
     */
    bool tableExists(const std::string& table) override;

    /** @brief True when describe() resolves the reference; never throws. */
    bool dataSourceExists(const std::string& table) override;

    /** @brief True for global temporary tables. */
    bool temporaryTable(const std::string& table) override;

    // ----- Name resolution -----

    /**
     * @brief Resolve a reference to the table or view it designates.
     *
     * Looks the name up in tables, views, private synonyms and public synonyms;
     * synonyms are followed, including those pointing through a database link.
     *
     * @throws StatementInvalid (ORA-04043) when the object does not exist.
     */
    TableReference describe(const std::string& table) override;

    // ----- Session -----

    /** @brief Container name, or the database name on non-CDB servers. */
    std::string currentDatabase() override;
    std::string currentUser() override;
    std::string currentSchema() override;

    /** @brief Lower-cased default tablespace of the current schema. */
    std::string defaultTablespace() override;

    const OracleTypeRegistry& typeRegistry() const { return m_registry; }

private:
    TableReference describeReference(const std::string& table, int depth);

    Connection& m_connection;   ///< Session for catalog queries
    AdapterConfig m_config;     ///< Adapter toggles
    OracleTypeRegistry m_registry;
    OracleDialectTranslator m_translator;  ///< Default normalization and object naming
};

}  // namespace oraenhanced
