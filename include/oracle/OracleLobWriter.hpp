#pragma once

/**
 * @file OracleLobWriter.hpp
 * @brief Writes LOB column values after a row update.
 *
 * LOB columns are written as empty locators by the UPDATE itself; their
 * contents are streamed afterwards through a locator selected FOR UPDATE.
 */

#include "Connection.hpp"
#include "ModelDescriptor.hpp"
#include "SchemaManager.hpp"
#include <set>
#include <string>
#include <vector>

namespace oraenhanced {

/**
 * @class OracleLobWriter
 * @brief Post-update LOB write coordinator.
 *
 * The FOR UPDATE select locks the row until the surrounding transaction
 * ends; it is the only lock taken by the adapter.
 */
class OracleLobWriter {
public:
    explicit OracleLobWriter(Connection& connection);

    /** @brief Columns whose SQL type ends in LOB (BLOB, CLOB, NCLOB). */
    static std::vector<ColumnDescriptor> lobColumns(const std::vector<ColumnDescriptor>& columns);

    /**
     * @brief LOB columns about to be saved.
     * @param columns All columns of the table.
     * @param changedAttributes Attributes with pending changes.
     * @param readonlyAttributes Attributes never written by updates.
     */
    static std::vector<ColumnDescriptor> changedLobColumns(const std::vector<ColumnDescriptor>& columns,
                                                           const std::set<std::string>& changedAttributes,
                                                           const std::set<std::string>& readonlyAttributes);

    /**
     * @brief Stream the values of changed LOB columns into the stored row.
     *
     * Blank values are skipped. Attributes with a serializing type are
     * dumped to JSON first. BLOB columns are written as binary.
     *
     * @param model Model of the updated row; provides table and key.
     * @param attributes Current attribute values, including the key.
     * @param changedColumns Columns from changedLobColumns().
     * @throws RecordNotFound when the row is gone.
     */
    void writeLobs(const ModelDescriptor& model,
                   const Attributes& attributes,
                   const std::vector<ColumnDescriptor>& changedColumns);

    /**
     * @brief After-update hook.
     *
     * Runs writeLobs() only on an Oracle connection and when the model
     * registers no custom create or update method.
     *
     * @return true when LOBs were written.
     */
    bool afterUpdate(const ModelDescriptor& model,
                     const Attributes& attributes,
                     const std::vector<ColumnDescriptor>& changedColumns);

private:
    Connection& m_connection;
};

}  // namespace oraenhanced
