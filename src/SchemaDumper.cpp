#include "SchemaDumper.hpp"
#include "OraclePrimaryKeyResolver.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace oraenhanced {

SchemaDumper::SchemaDumper(SchemaManager& schema, OraclePrimaryKeyResolver* keys, DumpOptions options)
    : m_schema(schema), m_keys(keys), m_options(options) {
}

// =============================================================================
// Descriptor Conversion
// =============================================================================

json SchemaDumper::columnToJson(const ColumnDescriptor& column) const {
    json obj = json::object();
    obj["name"] = column.name;
    obj["sql_type"] = column.fullSqlType();
    obj["type"] = typeKindToString(column.type.kind);
    obj["nullable"] = column.nullable;
    putOptional(obj, "default", column.defaultValue);
    putOptional(obj, "precision", column.precision);
    putOptional(obj, "scale", column.scale);
    putOptional(obj, "limit", column.limit);
    putOptional(obj, "comment", column.comment);
    putOptional(obj, "type_owner", column.typeOwner);

    if (column.isVirtual) obj["virtual"] = true;
    if (column.isHidden) obj["hidden"] = true;

    return obj;
}

json SchemaDumper::indexToJson(const IndexDescriptor& index) const {
    json obj = json::object();
    obj["name"] = index.name;
    obj["unique"] = index.unique;
    obj["columns"] = index.columns;
    obj["index_type"] = index.indexType;
    putOptional(obj, "domain_type", index.domainType);
    putOptional(obj, "parameters", index.parameters);
    putOptional(obj, "statement_parameters", index.statementParameters);
    putOptional(obj, "tablespace", index.tablespace);
    return obj;
}

json SchemaDumper::synonymToJson(const SynonymDescriptor& synonym) const {
    json obj = json::object();
    obj["name"] = synonym.name;
    obj["table_owner"] = synonym.tableOwner;
    obj["table_name"] = synonym.tableName;
    putOptional(obj, "db_link", synonym.dbLink);
    return obj;
}

// =============================================================================
// Dump
// =============================================================================

json SchemaDumper::dumpTable(const std::string& table) {
    ErrorContext ctx("dump " + table);

    json obj = json::object();
    obj["name"] = table;
    obj["temporary"] = m_schema.temporaryTable(table);

    json columns = json::array();
    for (const auto& column : m_schema.columns(table)) {
        columns.push_back(columnToJson(column));
    }
    obj["columns"] = std::move(columns);

    json indexes = json::array();
    for (const auto& index : m_schema.indexes(table)) {
        indexes.push_back(indexToJson(index));
    }
    obj["indexes"] = std::move(indexes);

    obj["primary_keys"] = m_schema.primaryKeys(table);

    auto binding = m_schema.pkAndSequenceFor(table);
    if (binding) {
        json seq = json::object();
        seq["primary_key"] = binding->primaryKey;
        putOptional(seq, "sequence_name", binding->sequenceName);
        obj["sequence"] = std::move(seq);
    } else if (m_options.includeNull) {
        obj["sequence"] = nullptr;
    }

    if (m_keys) {
        obj["key_strategy"] = keyStrategyToString(m_keys->resolve(table));
    }

    return obj;
}

json SchemaDumper::dumpSchema() {
    json doc = json::object();
    doc["database"] = m_schema.currentDatabase();
    doc["user"] = m_schema.currentUser();
    doc["schema"] = m_schema.currentSchema();

    json tables = json::array();
    for (const auto& table : m_schema.tables()) {
        try {
            tables.push_back(dumpTable(table));
        } catch (const StatementInvalid& e) {
            // Dropped between listing and describing
            spdlog::warn("Skipping table {}: {}", table, e.what());
        }
    }
    doc["tables"] = std::move(tables);

    doc["views"] = m_schema.views();
    doc["materialized_views"] = m_schema.materializedViews();

    json synonyms = json::array();
    for (const auto& synonym : m_schema.synonyms()) {
        synonyms.push_back(synonymToJson(synonym));
    }
    doc["synonyms"] = std::move(synonyms);

    return doc;
}

std::string SchemaDumper::toString(const json& document) const {
    return m_options.pretty ? document.dump(m_options.indent) : document.dump();
}

}  // namespace oraenhanced
