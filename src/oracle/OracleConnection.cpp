/**
 * @file OracleConnection.cpp
 * @brief Implementation of the OCI-backed Connection.
 *
 * This file implements OracleConnection, which owns the full OCI handle chain
 * of one session (environment, error, server, service context, session), and
 * OracleLob, the writable locator returned by selectLobForUpdate().
 */

#include "OracleConnection.hpp"
#include "OracleResultSet.hpp"
#include "OracleIdentifier.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace oraenhanced {

namespace {

struct StatementDeleter {
    void operator()(OCIStmt* stmt) const {
        if (stmt) OCIHandleFree(stmt, OCI_HTYPE_STMT);
    }
};

using StatementPtr = std::unique_ptr<OCIStmt, StatementDeleter>;

// Error code and text recorded in an error handle
std::pair<int, std::string> lastError(OCIError* err) {
    sb4 errCode = 0;
    char errBuf[512] = {0};
    if (err) {
        OCIErrorGet(err, 1, nullptr, &errCode, (OraText*)errBuf, sizeof(errBuf), OCI_HTYPE_ERROR);
    }
    std::string message(errBuf);
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }
    return {static_cast<int>(errCode), message};
}

bool succeeded(sword status) {
    return status == OCI_SUCCESS || status == OCI_SUCCESS_WITH_INFO;
}

}  // namespace

// =============================================================================
// OracleLob
// =============================================================================

OracleLob::OracleLob(OCISvcCtx* svc, OCIError* err, OCILobLocator* locator, ub1 charsetForm)
    : m_svc(svc), m_err(err), m_locator(locator), m_charsetForm(charsetForm) {
}

OracleLob::~OracleLob() {
    if (m_locator) {
        OCIDescriptorFree(m_locator, OCI_DTYPE_LOB);
    }
}

/**
 * Truncate the LOB, then write the whole value in one piece.
 * Character data is converted from the client character set by OCI.
 */
void OracleLob::write(const std::string& data, bool binary) {
    if (!succeeded(OCILobTrim2(m_svc, m_err, m_locator, 0))) {
        throwOciError(m_err, "Trim LOB");
    }
    if (data.empty()) {
        return;
    }

    oraub8 byteAmount = data.size();
    oraub8 charAmount = 0;
    sword status = OCILobWrite2(m_svc, m_err, m_locator, &byteAmount, &charAmount, 1,
                                (void*)data.data(), data.size(), OCI_ONE_PIECE,
                                nullptr, nullptr, 0,
                                binary ? (ub1)SQLCS_IMPLICIT : m_charsetForm);
    if (!succeeded(status)) {
        throwOciError(m_err, "Write LOB");
    }
}

// =============================================================================
// Constructor and Destructor
// =============================================================================

OracleConnection::OracleConnection(const ConnectionConfig& config, const AdapterConfig& adapter)
    : m_config(config), m_adapter(adapter) {
}

OracleConnection::~OracleConnection() {
    freeHandles();
}

// =============================================================================
// Session Lifecycle
// =============================================================================

/**
 * Create the handle chain and log on:
 * 1. Create the environment and the error handle
 * 2. Attach to the server
 * 3. Allocate the service context and link the server
 * 4. Begin an authenticated session (optionally as SYSDBA/SYSOPER)
 * 5. Link the session and configure it
 *
 * On failure every handle allocated so far is freed before throwing.
 */
void OracleConnection::open() {
    if (isOpen()) return;

    auto fail = [this](const std::string& action) {
        auto [code, message] = lastError(m_err);
        freeHandles();
        spdlog::error("{}: {}", action, message);
        throw ConnectionException(code, action + ": " + message);
    };

    sword status = OCIEnvCreate(&m_env, OCI_THREADED | OCI_OBJECT, nullptr,
                                nullptr, nullptr, nullptr, 0, nullptr);
    if (status != OCI_SUCCESS) {
        freeHandles();
        throw ConnectionException("Failed to create Oracle environment");
    }

    if (OCIHandleAlloc(m_env, (void**)&m_err, OCI_HTYPE_ERROR, 0, nullptr) != OCI_SUCCESS ||
        OCIHandleAlloc(m_env, (void**)&m_server, OCI_HTYPE_SERVER, 0, nullptr) != OCI_SUCCESS) {
        freeHandles();
        throw ConnectionException("Failed to allocate Oracle handles");
    }

    std::string connStr = m_config.connectString();
    status = OCIServerAttach(m_server, m_err, (const OraText*)connStr.c_str(),
                             static_cast<sb4>(connStr.length()), OCI_DEFAULT);
    if (!succeeded(status)) {
        fail("Failed to attach to Oracle server " + connStr);
    }

    if (OCIHandleAlloc(m_env, (void**)&m_svc, OCI_HTYPE_SVCCTX, 0, nullptr) != OCI_SUCCESS) {
        fail("Failed to allocate Oracle service context");
    }
    OCIAttrSet(m_svc, OCI_HTYPE_SVCCTX, m_server, 0, OCI_ATTR_SERVER, m_err);

    if (OCIHandleAlloc(m_env, (void**)&m_session, OCI_HTYPE_SESSION, 0, nullptr) != OCI_SUCCESS) {
        fail("Failed to allocate Oracle session handle");
    }

    OCIAttrSet(m_session, OCI_HTYPE_SESSION,
               (void*)m_config.user.c_str(), static_cast<ub4>(m_config.user.length()),
               OCI_ATTR_USERNAME, m_err);
    OCIAttrSet(m_session, OCI_HTYPE_SESSION,
               (void*)m_config.password.c_str(), static_cast<ub4>(m_config.password.length()),
               OCI_ATTR_PASSWORD, m_err);

    ub4 mode = OCI_DEFAULT;
    if (m_config.privilege == "SYSDBA") {
        mode = OCI_SYSDBA;
    } else if (m_config.privilege == "SYSOPER") {
        mode = OCI_SYSOPER;
    }

    status = OCISessionBegin(m_svc, m_err, m_session, OCI_CRED_RDBMS, mode);
    if (!succeeded(status)) {
        OCIHandleFree(m_session, OCI_HTYPE_SESSION);
        m_session = nullptr;
        fail("Failed to begin Oracle session as " + m_config.user);
    }

    OCIAttrSet(m_svc, OCI_HTYPE_SVCCTX, m_session, 0, OCI_ATTR_SESSION, m_err);

    configureSession();
    spdlog::info("Connected to Oracle at {} as {}", connStr, m_config.user);
}

void OracleConnection::configureSession() {
    for (const auto& [name, value] : m_config.nls) {
        execute("ALTER SESSION SET " + name + " = " + OracleIdentifier::quote(value), "NLS");
    }

    if (!m_config.cursor_sharing.empty()) {
        try {
            execute("ALTER SESSION SET cursor_sharing = " + m_config.cursor_sharing, "SESSION");
        } catch (const StatementInvalid& e) {
            spdlog::warn("Could not set cursor_sharing: {}", e.what());
        }
    }

    if (!m_config.time_zone.empty()) {
        execute("ALTER SESSION SET time_zone = " + OracleIdentifier::quote(m_config.time_zone), "SESSION");
    }
}

/**
 * Release handles in reverse order of creation:
 * session, server attachment, service context, error handle, environment.
 */
void OracleConnection::freeHandles() {
    if (m_session && m_svc) {
        OCISessionEnd(m_svc, m_err, m_session, OCI_DEFAULT);
    }
    if (m_session) {
        OCIHandleFree(m_session, OCI_HTYPE_SESSION);
        m_session = nullptr;
    }
    if (m_server) {
        OCIServerDetach(m_server, m_err, OCI_DEFAULT);
        OCIHandleFree(m_server, OCI_HTYPE_SERVER);
        m_server = nullptr;
    }
    if (m_svc) {
        OCIHandleFree(m_svc, OCI_HTYPE_SVCCTX);
        m_svc = nullptr;
    }
    if (m_err) {
        OCIHandleFree(m_err, OCI_HTYPE_ERROR);
        m_err = nullptr;
    }
    if (m_env) {
        OCIHandleFree(m_env, OCI_HTYPE_ENV);
        m_env = nullptr;
    }
}

void OracleConnection::close() {
    if (isOpen()) {
        spdlog::debug("Closing Oracle session");
    }
    freeHandles();
}

void OracleConnection::requireOpen() const {
    if (!isOpen()) {
        throw ConnectionException(1012, "ORA-01012: not logged on");
    }
}

void OracleConnection::ping() {
    requireOpen();
    if (!succeeded(OCIPing(m_svc, m_err, OCI_DEFAULT))) {
        auto [code, message] = lastError(m_err);
        throw ConnectionException(code, message);
    }
}

void OracleConnection::reset() {
    close();
    open();
}

// =============================================================================
// SQL Execution
// =============================================================================

/**
 * Execute a statement and return its handle.
 *
 * SELECT statements are executed with iters=0 so rows can be fetched
 * afterwards; every other statement runs once. Binds are positional and
 * sent as strings, a missing value binds NULL.
 */
OCIStmt* OracleConnection::prepareAndExecute(const std::string& sql, const std::string& label,
                                             const Binds& binds, bool isQuery) {
    requireOpen();

    if (binds.empty()) {
        spdlog::debug("{}: {}", label, sql);
    } else {
        std::string bindList;
        for (const auto& bind : binds) {
            if (!bindList.empty()) bindList += ", ";
            bindList += bind.name + "=" + bind.value.value_or("NULL");
        }
        spdlog::debug("{}: {} [{}]", label, sql, bindList);
    }

    OCIStmt* raw = nullptr;
    if (OCIHandleAlloc(m_env, (void**)&raw, OCI_HTYPE_STMT, 0, nullptr) != OCI_SUCCESS) {
        throw DatabaseError("Failed to allocate Oracle statement handle");
    }
    StatementPtr stmt(raw);

    sword status = OCIStmtPrepare(stmt.get(), m_err, (const OraText*)sql.c_str(),
                                  static_cast<ub4>(sql.length()), OCI_NTV_SYNTAX, OCI_DEFAULT);
    if (!succeeded(status)) {
        throwOciError(m_err, "Prepare " + label);
    }

    ub4 prefetch = m_config.prefetch_rows;
    OCIAttrSet(stmt.get(), OCI_HTYPE_STMT, &prefetch, 0, OCI_ATTR_PREFETCH_ROWS, m_err);

    // Bind buffers must stay alive until OCIStmtExecute returns
    std::vector<std::string> values(binds.size());
    std::vector<sb2> indicators(binds.size(), 0);
    for (size_t i = 0; i < binds.size(); ++i) {
        if (binds[i].value) {
            values[i] = *binds[i].value;
        } else {
            indicators[i] = -1;
        }
        OCIBind* bind = nullptr;
        status = OCIBindByPos(stmt.get(), &bind, m_err, static_cast<ub4>(i + 1),
                              (void*)values[i].c_str(), static_cast<sb4>(values[i].size() + 1),
                              SQLT_STR, &indicators[i], nullptr, nullptr, 0, nullptr, OCI_DEFAULT);
        if (!succeeded(status)) {
            throwOciError(m_err, "Bind " + binds[i].name);
        }
    }

    ub2 stmtType = 0;
    OCIAttrGet(stmt.get(), OCI_HTYPE_STMT, &stmtType, nullptr, OCI_ATTR_STMT_TYPE, m_err);
    if (isQuery && stmtType != OCI_STMT_SELECT) {
        throw StatementInvalid(label + " is not a SELECT statement");
    }

    ub4 iters = (stmtType == OCI_STMT_SELECT) ? 0 : 1;
    status = OCIStmtExecute(m_svc, stmt.get(), m_err, iters, 0, nullptr, nullptr, OCI_DEFAULT);
    if (!succeeded(status)) {
        throwOciError(m_err, label);
    }

    return stmt.release();
}

Rows OracleConnection::selectAll(const std::string& sql, const std::string& label, const Binds& binds) {
    return ErrorHandler::executeWithRetry([&]() {
        OracleResultSet result(prepareAndExecute(sql, label, binds, true), m_err);
        return result.fetchAll();
    }, m_adapter.auto_retry, [this]() { reset(); });
}

uint64_t OracleConnection::execute(const std::string& sql, const std::string& label, const Binds& binds) {
    return ErrorHandler::executeWithRetry([&]() -> uint64_t {
        StatementPtr stmt(prepareAndExecute(sql, label, binds, false));
        ub4 rowCount = 0;
        OCIAttrGet(stmt.get(), OCI_HTYPE_STMT, &rowCount, nullptr, OCI_ATTR_ROW_COUNT, m_err);
        return rowCount;
    }, m_adapter.auto_retry, [this]() { reset(); });
}

/**
 * Execute a single-column SELECT ... FOR UPDATE and fetch its LOB locator.
 * Returns nullptr when the statement matched no row.
 */
std::unique_ptr<LobHandle> OracleConnection::selectLobForUpdate(const std::string& sql,
                                                                const std::string& label,
                                                                const Binds& binds) {
    StatementPtr stmt(prepareAndExecute(sql, label, binds, true));

    OCIParam* param = nullptr;
    if (OCIParamGet(stmt.get(), OCI_HTYPE_STMT, m_err, (void**)&param, 1) != OCI_SUCCESS) {
        throwOciError(m_err, "Describe " + label);
    }
    ub2 dataType = 0;
    ub1 charsetForm = SQLCS_IMPLICIT;
    OCIAttrGet(param, OCI_DTYPE_PARAM, &dataType, nullptr, OCI_ATTR_DATA_TYPE, m_err);
    OCIAttrGet(param, OCI_DTYPE_PARAM, &charsetForm, nullptr, OCI_ATTR_CHARSET_FORM, m_err);
    OCIDescriptorFree(param, OCI_DTYPE_PARAM);

    if (dataType != SQLT_CLOB && dataType != SQLT_BLOB) {
        throw StatementInvalid(label + " does not select a LOB column");
    }

    OCILobLocator* locator = nullptr;
    if (OCIDescriptorAlloc(m_env, (void**)&locator, OCI_DTYPE_LOB, 0, nullptr) != OCI_SUCCESS) {
        throw DatabaseError("Failed to allocate LOB locator");
    }
    auto lob = std::make_unique<OracleLob>(m_svc, m_err, locator,
                                           charsetForm == SQLCS_NCHAR ? (ub1)SQLCS_NCHAR
                                                                      : (ub1)SQLCS_IMPLICIT);

    OCIDefine* define = nullptr;
    sword status = OCIDefineByPos(stmt.get(), &define, m_err, 1, &locator, sizeof(locator),
                                  dataType, nullptr, nullptr, nullptr, OCI_DEFAULT);
    if (!succeeded(status)) {
        throwOciError(m_err, "Define LOB locator");
    }

    status = OCIStmtFetch2(stmt.get(), m_err, 1, OCI_FETCH_NEXT, 0, OCI_DEFAULT);
    if (status == OCI_NO_DATA) {
        return nullptr;
    }
    if (!succeeded(status)) {
        throwOciError(m_err, "Fetch " + label);
    }
    return lob;
}

}  // namespace oraenhanced
