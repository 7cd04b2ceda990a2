#pragma once

#include "SchemaManager.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace oraenhanced {

using json = nlohmann::json;

class OraclePrimaryKeyResolver;

struct DumpOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
};

// Serializes the introspected structure of a schema to JSON
class SchemaDumper {
public:
    // keys is optional; without it the dump carries no key_strategy
    explicit SchemaDumper(SchemaManager& schema, OraclePrimaryKeyResolver* keys = nullptr,
                          DumpOptions options = DumpOptions{});

    // One table: columns, indexes, primary keys, sequence binding
    json dumpTable(const std::string& table);

    // Session info, every table, views, materialized views and synonyms
    json dumpSchema();

    std::string toString(const json& document) const;

    // Descriptor conversions
    json columnToJson(const ColumnDescriptor& column) const;
    json indexToJson(const IndexDescriptor& index) const;
    json synonymToJson(const SynonymDescriptor& synonym) const;

private:
    template<typename T>
    void putOptional(json& obj, const std::string& key, const std::optional<T>& value) const {
        if (value.has_value()) {
            obj[key] = value.value();
        } else if (m_options.includeNull) {
            obj[key] = nullptr;
        }
    }

    SchemaManager& m_schema;
    OraclePrimaryKeyResolver* m_keys;
    DumpOptions m_options;
};

}  // namespace oraenhanced
