#include "OraclePrimaryKeyResolver.hpp"
#include "OracleIdentifier.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace oraenhanced {

std::string keyStrategyToString(KeyStrategy strategy) {
    switch (strategy) {
        case KeyStrategy::NoKey:
            return "no_key";
        case KeyStrategy::TriggerPopulated:
            return "trigger";
        case KeyStrategy::SequencePrefetch:
            return "sequence";
        case KeyStrategy::Unknown:
        default:
            return "unknown";
    }
}

OraclePrimaryKeyResolver::OraclePrimaryKeyResolver(Connection& connection,
                                                   SchemaManager& schema,
                                                   const OracleDialectTranslator& translator)
    : m_connection(connection)
    , m_schema(schema)
    , m_translator(translator) {
}

KeyStrategy OraclePrimaryKeyResolver::resolve(const std::string& table, const ModelDescriptor* model) {
    if (model && model->isAutogenerated()) {
        return KeyStrategy::TriggerPopulated;
    }
    if (!m_schema.hasPrimaryKey(table)) {
        return KeyStrategy::NoKey;
    }
    if (m_schema.hasPrimaryKeyTrigger(table)) {
        return KeyStrategy::TriggerPopulated;
    }
    return KeyStrategy::SequencePrefetch;
}

bool OraclePrimaryKeyResolver::prefetchPrimaryKey(const std::optional<std::string>& table) {
    if (!table) {
        return true;
    }
    return resolve(*table) == KeyStrategy::SequencePrefetch;
}

std::optional<int64_t> OraclePrimaryKeyResolver::nextSequenceValue(const std::string& sequenceName) {
    if (sequenceName == kAutogeneratedSequenceName) {
        return std::nullopt;
    }

    auto value = m_connection.selectValue(m_translator.nextSequenceValueSql(sequenceName), "Sequence");
    if (!value) {
        throw DatabaseError("Sequence " + sequenceName + " returned no value");
    }
    try {
        return std::stoll(*value);
    } catch (const std::logic_error&) {
        throw DatabaseError("Sequence " + sequenceName + " returned a non-numeric value: " + *value);
    }
}

void OraclePrimaryKeyResolver::resetPkSequence(const std::string& table,
                                               std::optional<std::string> primaryKey,
                                               std::optional<std::string> sequenceName) {
    if (!m_schema.dataSourceExists(table)) {
        return;
    }

    if (!primaryKey || !sequenceName) {
        auto binding = m_schema.pkAndSequenceFor(table);
        if (!binding) {
            return;
        }
        primaryKey = binding->primaryKey;
        sequenceName = binding->sequenceName;
    }

    if (!sequenceName) {
        spdlog::warn("{} has primary key {} with no default sequence", table, *primaryKey);
        return;
    }

    auto startValue = m_connection.selectValue(
        "SELECT NVL(MAX(" + OracleIdentifier::quoteColumnName(*primaryKey) + "),0) + 1 FROM " +
        OracleIdentifier::quoteTableName(table),
        "Sequence start value");

    int64_t start = 1;
    if (startValue) {
        try {
            start = std::stoll(*startValue);
        } catch (const std::logic_error&) {
            throw DatabaseError("Unexpected maximum key value for " + table + ": " + *startValue);
        }
    }

    m_connection.execute(m_translator.dropSequence(*sequenceName), "Drop sequence");
    m_connection.execute(m_translator.createSequence(*sequenceName, start), "Create sequence");
}

}  // namespace oraenhanced
