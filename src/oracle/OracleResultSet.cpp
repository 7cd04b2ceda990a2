#include "OracleResultSet.hpp"
#include "OracleIdentifier.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace oraenhanced {

void throwOciError(OCIError* err, const std::string& action) {
    sb4 errCode = 0;
    char errBuf[512] = {0};
    if (err) {
        OCIErrorGet(err, 1, nullptr, &errCode, reinterpret_cast<OraText*>(errBuf),
                    sizeof(errBuf), OCI_HTYPE_ERROR);
    }

    // OCI terminates the message with a newline
    std::string message(errBuf);
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }
    if (message.empty()) {
        message = action + " failed";
    }

    std::string context = ErrorContext::current();
    if (context.empty()) {
        spdlog::error("{}: {}", action, message);
    } else {
        spdlog::error("{} [{}]: {}", action, context, message);
    }
    ErrorHandler::throwOracleError(errCode, message);
}

// =============================================================================
// Construction
// =============================================================================

OracleResultSet::OracleResultSet(OCIStmt* stmt, OCIError* err)
    : m_stmt(stmt), m_err(err) {
    if (!m_stmt || !m_err) {
        return;
    }
    try {
        describeSelectList();
        defineBuffers();
    } catch (const DatabaseError&) {
        release();
        throw;
    }
}

OracleResultSet::~OracleResultSet() {
    release();
}

void OracleResultSet::release() {
    if (m_stmt) {
        OCIHandleFree(m_stmt, OCI_HTYPE_STMT);
        m_stmt = nullptr;
    }
    m_fields.clear();
}

void OracleResultSet::describeSelectList() {
    ub4 count = 0;
    if (OCIAttrGet(m_stmt, OCI_HTYPE_STMT, &count, nullptr, OCI_ATTR_PARAM_COUNT, m_err) != OCI_SUCCESS) {
        throwOciError(m_err, "Describe select list");
    }

    m_fields.resize(count);
    for (ub4 i = 0; i < count; ++i) {
        OCIParam* param = nullptr;
        if (OCIParamGet(m_stmt, OCI_HTYPE_STMT, m_err, reinterpret_cast<void**>(&param), i + 1) != OCI_SUCCESS) {
            throwOciError(m_err, "Describe select item " + std::to_string(i + 1));
        }

        Field& field = m_fields[i];
        OraText* name = nullptr;
        ub4 nameLen = 0;
        OCIAttrGet(param, OCI_DTYPE_PARAM, &name, &nameLen, OCI_ATTR_NAME, m_err);
        field.name = OracleIdentifier::oracleDowncase(std::string(reinterpret_cast<char*>(name), nameLen));
        OCIAttrGet(param, OCI_DTYPE_PARAM, &field.type, nullptr, OCI_ATTR_DATA_TYPE, m_err);
        OCIAttrGet(param, OCI_DTYPE_PARAM, &field.size, nullptr, OCI_ATTR_DATA_SIZE, m_err);

        OCIDescriptorFree(param, OCI_DTYPE_PARAM);
    }
}

ub4 OracleResultSet::bufferSize(ub2 type, ub2 size) {
    switch (type) {
        case SQLT_CHR:
        case SQLT_AFC:
        case SQLT_STR:
        case SQLT_VCS:
            // Up to 4 bytes per character under CHAR length semantics
            return static_cast<ub4>(size) * 4 + 1;
        case SQLT_NUM:
        case SQLT_VNU:
            return 128;
        case SQLT_DAT:
        case SQLT_TIMESTAMP:
        case SQLT_TIMESTAMP_TZ:
        case SQLT_TIMESTAMP_LTZ:
            return 80;
        case SQLT_LNG:
            // data_default, column_expression and trigger bodies are LONG
            return 32768;
        default:
            return 4000;
    }
}

void OracleResultSet::defineBuffers() {
    for (size_t i = 0; i < m_fields.size(); ++i) {
        Field& field = m_fields[i];
        ub4 size = bufferSize(field.type, field.size);
        field.data.assign(size, '\0');

        sword status = OCIDefineByPos(m_stmt, &field.define, m_err, static_cast<ub4>(i + 1),
                                      field.data.data(), static_cast<sb4>(size), SQLT_STR,
                                      &field.indicator, &field.returnLen, nullptr, OCI_DEFAULT);
        if (status != OCI_SUCCESS) {
            throwOciError(m_err, "Define " + field.name);
        }
    }
}

// =============================================================================
// Fetching
// =============================================================================

bool OracleResultSet::next() {
    if (!m_stmt) return false;

    sword status = OCIStmtFetch2(m_stmt, m_err, 1, OCI_FETCH_NEXT, 0, OCI_DEFAULT);
    if (status == OCI_NO_DATA) {
        return false;
    }
    if (status != OCI_SUCCESS && status != OCI_SUCCESS_WITH_INFO) {
        throwOciError(m_err, "Fetch");
    }
    ++m_fetchedRows;
    return true;
}

Row OracleResultSet::row() const {
    Row result;
    for (const auto& field : m_fields) {
        if (field.indicator == -1) {
            result.add(field.name, std::nullopt);
        } else {
            result.add(field.name, std::string(field.data.data()));
        }
    }
    return result;
}

Rows OracleResultSet::fetchAll() {
    Rows rows;
    while (next()) {
        rows.push_back(row());
    }
    spdlog::trace("Fetched {} rows", m_fetchedRows);
    return rows;
}

}  // namespace oraenhanced
