#pragma once

#include "LogicalType.hpp"
#include <string>
#include <vector>
#include <optional>

namespace oraenhanced {

struct ColumnDescriptor {
    std::string name;
    std::string sqlType;  // catalog data type, e.g. NUMBER, VARCHAR2
    bool nullable = true;
    std::optional<std::string> defaultValue;
    bool isVirtual = false;
    bool isHidden = false;
    std::optional<int> precision;
    std::optional<int> scale;
    std::optional<int> limit;
    std::optional<std::string> typeOwner;
    std::optional<std::string> comment;
    LogicalType type;

    // sqlType with its modifiers, e.g. NUMBER(10,2) or VARCHAR2(255)
    std::string fullSqlType() const;
};

struct IndexDescriptor {
    std::string table;
    std::string name;
    bool unique = false;
    std::vector<std::string> columns;
    std::string indexType;                       // NORMAL, FUNCTION-BASED NORMAL, DOMAIN
    std::optional<std::string> domainType;       // OWNER.NAME, domain indexes only
    std::optional<std::string> parameters;
    std::optional<std::string> statementParameters;
    std::optional<std::string> tablespace;       // absent when the user's default
};

struct SynonymDescriptor {
    std::string name;
    std::string tableOwner;
    std::string tableName;
    std::optional<std::string> dbLink;
};

struct SequenceBinding {
    std::string primaryKey;
    std::optional<std::string> sequenceName;
};

struct TableReference {
    std::string owner;
    std::string name;
    std::optional<std::string> dbLink;  // includes the leading '@'

    // Suffix appended to catalog view names
    std::string linkSuffix() const { return dbLink.value_or(""); }
};

// Abstract base class for schema introspection
class SchemaManager {
public:
    virtual ~SchemaManager() = default;

    // Table structure
    virtual std::vector<ColumnDescriptor> columns(const std::string& table) = 0;
    virtual std::vector<IndexDescriptor> indexes(const std::string& table) = 0;
    virtual std::vector<std::string> primaryKeys(const std::string& table) = 0;
    virtual std::optional<SequenceBinding> pkAndSequenceFor(const std::string& table) = 0;
    virtual std::optional<std::string> primaryKey(const std::string& table) = 0;
    virtual bool hasPrimaryKey(const std::string& table) = 0;
    virtual bool hasPrimaryKeyTrigger(const std::string& table) = 0;

    // Schema objects
    virtual std::vector<std::string> tables() = 0;
    virtual std::vector<std::string> views() = 0;
    virtual std::vector<std::string> materializedViews() = 0;
    virtual std::vector<SynonymDescriptor> synonyms() = 0;
    virtual std::vector<std::string> dataSources() = 0;
    virtual bool tableExists(const std::string& table) = 0;
    virtual bool dataSourceExists(const std::string& table) = 0;
    virtual bool temporaryTable(const std::string& table) = 0;

    // Name resolution
    virtual TableReference describe(const std::string& table) = 0;

    // Session
    virtual std::string currentDatabase() = 0;
    virtual std::string currentUser() = 0;
    virtual std::string currentSchema() = 0;
    virtual std::string defaultTablespace() = 0;

protected:
    SchemaManager() = default;
};

}  // namespace oraenhanced
