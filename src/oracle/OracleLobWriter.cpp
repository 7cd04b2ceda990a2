#include "OracleLobWriter.hpp"
#include "OracleIdentifier.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace oraenhanced {

namespace {

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

OracleLobWriter::OracleLobWriter(Connection& connection)
    : m_connection(connection) {
}

std::vector<ColumnDescriptor> OracleLobWriter::lobColumns(const std::vector<ColumnDescriptor>& columns) {
    std::vector<ColumnDescriptor> result;
    for (const auto& col : columns) {
        if (endsWith(col.sqlType, "LOB")) {
            result.push_back(col);
        }
    }
    return result;
}

std::vector<ColumnDescriptor> OracleLobWriter::changedLobColumns(
    const std::vector<ColumnDescriptor>& columns,
    const std::set<std::string>& changedAttributes,
    const std::set<std::string>& readonlyAttributes) {
    std::vector<ColumnDescriptor> result;
    for (const auto& col : lobColumns(columns)) {
        if (changedAttributes.count(col.name) && !readonlyAttributes.count(col.name)) {
            result.push_back(col);
        }
    }
    return result;
}

void OracleLobWriter::writeLobs(const ModelDescriptor& model,
                                const Attributes& attributes,
                                const std::vector<ColumnDescriptor>& changedColumns) {
    SqlValue id;
    auto key = attributes.find(model.primaryKey);
    if (key != attributes.end() && !std::holds_alternative<std::monostate>(key->second)) {
        id = attributeToString(key->second, false);
    }

    for (const auto& col : changedColumns) {
        auto attr = attributes.find(col.name);
        if (attr == attributes.end() || isBlank(attr->second)) {
            continue;
        }

        bool serialize = false;
        auto declared = model.attributeTypes.find(col.name);
        if (declared != model.attributeTypes.end()) {
            serialize = declared->second.serialized;
        }
        std::string value = attributeToString(attr->second, serialize);

        std::string sql = "SELECT " + OracleIdentifier::quoteColumnName(col.name) +
                          " FROM " + OracleIdentifier::quoteTableName(model.tableName) +
                          " WHERE " + OracleIdentifier::quoteColumnName(model.primaryKey) +
                          " = :id FOR UPDATE";

        auto lob = m_connection.selectLobForUpdate(sql, "Writable Large Object", {Bind{"id", id}});
        if (!lob) {
            throw RecordNotFound("statement " + sql + " returned no rows");
        }

        bool binary = col.type.kind == TypeKind::Binary || col.sqlType == "BLOB";
        lob->write(value, binary);
        spdlog::debug("Wrote {} bytes to {}.{}", value.size(), model.tableName, col.name);
    }
}

bool OracleLobWriter::afterUpdate(const ModelDescriptor& model,
                                  const Attributes& attributes,
                                  const std::vector<ColumnDescriptor>& changedColumns) {
    if (m_connection.adapterName() != kOracleAdapterName) {
        return false;
    }
    if (model.customCreateMethod || model.customUpdateMethod) {
        return false;
    }
    writeLobs(model, attributes, changedColumns);
    return true;
}

}  // namespace oraenhanced
