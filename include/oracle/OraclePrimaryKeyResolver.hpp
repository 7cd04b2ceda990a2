#pragma once

/**
 * @file OraclePrimaryKeyResolver.hpp
 * @brief Decides how primary key values are generated on insert.
 *
 * Oracle has no insert-time auto-increment that returns the new key, so a
 * key is either fetched from the table's sequence before the INSERT or
 * filled in by a "<table>_pkt" trigger.
 */

#include "SchemaManager.hpp"
#include "Connection.hpp"
#include "ModelDescriptor.hpp"
#include "OracleDialectTranslator.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace oraenhanced {

enum class KeyStrategy {
    Unknown,           ///< Not resolved yet
    NoKey,             ///< Table has no usable primary key
    TriggerPopulated,  ///< A trigger assigns the key; never prefetch
    SequencePrefetch   ///< Fetch NEXTVAL before the INSERT
};

std::string keyStrategyToString(KeyStrategy strategy);

/**
 * @class OraclePrimaryKeyResolver
 * @brief Per-table key generation strategy and sequence maintenance.
 *
 * Strategies are recomputed from the catalog on every call.
 */
class OraclePrimaryKeyResolver {
public:
    /**
     * @param connection Session used for sequence statements (borrowed).
     * @param schema Introspector for keys and triggers (borrowed).
     * @param translator Provides sequence naming and DDL (borrowed).
     */
    OraclePrimaryKeyResolver(Connection& connection,
                             SchemaManager& schema,
                             const OracleDialectTranslator& translator);

    /**
     * @brief Resolve the key generation strategy of a table.
     *
     * A model whose sequence name is "autogenerated" is TriggerPopulated
     * without querying the catalog.
     *
     * @param table Table reference.
     * @param model Optional model mapped onto the table.
     */
    KeyStrategy resolve(const std::string& table, const ModelDescriptor* model = nullptr);

    /**
     * @brief Whether a key value must be fetched before inserting.
     * @param table Table reference; without one the answer is always true.
     */
    bool prefetchPrimaryKey(const std::optional<std::string>& table = std::nullopt);

    /**
     * @brief Next value of a sequence.
     * @return None for the "autogenerated" sentinel.
     */
    std::optional<int64_t> nextSequenceValue(const std::string& sequenceName);

    /**
     * @brief Restart a key sequence above the highest existing key.
     *
     * Drops and re-creates the sequence. The two statements are not atomic:
     * keys generated concurrently between them are not protected.
     *
     * @param table Table reference; unknown tables are ignored.
     * @param primaryKey Key column, looked up when not given.
     * @param sequenceName Sequence, looked up when not given.
     */
    void resetPkSequence(const std::string& table,
                         std::optional<std::string> primaryKey = std::nullopt,
                         std::optional<std::string> sequenceName = std::nullopt);

private:
    Connection& m_connection;
    SchemaManager& m_schema;
    const OracleDialectTranslator& m_translator;
};

}  // namespace oraenhanced
