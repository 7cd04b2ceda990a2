#pragma once

/**
 * @file OracleResultSet.hpp
 * @brief Row reader over an executed OCI SELECT statement.
 *
 * Every select-list item is defined as SQLT_STR, so numbers and dates come
 * back formatted by the session NLS settings and the transport only ever
 * hands strings (or NULL) to the adapter.
 */

#include "Connection.hpp"
#include <oci.h>
#include <string>
#include <vector>
#include <cstddef>

namespace oraenhanced {

/**
 * @class OracleResultSet
 * @brief Owns an executed statement handle and converts its rows to Row.
 *
 * Field names are presentation names: an upper-case alias such as
 * TABLE_NAME becomes "table_name", a quoted mixed-case alias is kept.
 *
 * Usage:
 * @code
 *   OracleResultSet result(stmt, err);
 *   Rows rows = result.fetchAll();
 * @endcode
 *
 * Not thread-safe. The owning connection must not run another statement
 * while rows are being fetched.
 */
class OracleResultSet {
public:
    /**
     * @brief Describe the select list and bind one output buffer per item.
     * @param stmt Executed statement handle (owned, freed on destruction).
     * @param err Error handle of the session (borrowed).
     * @throws DatabaseError when the select list cannot be described.
     */
    OracleResultSet(OCIStmt* stmt, OCIError* err);

    ~OracleResultSet();

    OracleResultSet(const OracleResultSet&) = delete;
    OracleResultSet& operator=(const OracleResultSet&) = delete;

    /**
     * @brief Advance to the next row.
     * @return false when the cursor is exhausted.
     * @throws DatabaseError (or a subclass) when the fetch fails.
     */
    bool next();

    /** @brief The current row. */
    Row row() const;

    /** @brief Drain the cursor. */
    Rows fetchAll();

    /** @brief Rows fetched so far. */
    size_t rowCount() const { return m_fetchedRows; }

private:
    void describeSelectList();
    void defineBuffers();
    void release();

    // Output buffer size for a select-list item of the given OCI type
    static ub4 bufferSize(ub2 type, ub2 size);

    struct Field {
        std::string name;        // presentation name
        ub2 type = 0;            // SQLT_* reported by the describe
        ub2 size = 0;            // maximum data size in bytes
        std::vector<char> data;
        sb2 indicator = 0;       // -1 for NULL
        ub2 returnLen = 0;
        OCIDefine* define = nullptr;
    };

    OCIStmt* m_stmt;
    OCIError* m_err;
    size_t m_fetchedRows = 0;
    std::vector<Field> m_fields;
};

/**
 * @brief Raise the classified exception for the error recorded in a handle.
 * @param err Error handle of the failed call.
 * @param action Statement label or OCI step, logged with the error.
 */
[[noreturn]] void throwOciError(OCIError* err, const std::string& action);

}  // namespace oraenhanced
