#pragma once

/**
 * @file OracleConnection.hpp
 * @brief Connection implementation over the Oracle Call Interface.
 *
 * This class owns one OCI session and implements the blocking Connection
 * transport on top of it: parameterized statements with positional string
 * binds, LOB locators selected FOR UPDATE, ping and reconnect.
 */

#include "Connection.hpp"
#include "Config.hpp"
#include <oci.h>
#include <string>
#include <cstdint>

namespace oraenhanced {

/**
 * @class OracleLob
 * @brief Writable LOB locator obtained through selectLobForUpdate().
 *
 * The locator stays valid until the transaction holding the row lock ends.
 */
class OracleLob : public LobHandle {
public:
    /**
     * @param svc Service context of the owning connection (borrowed).
     * @param err Error handle of the owning connection (borrowed).
     * @param locator LOB descriptor (takes ownership).
     * @param charsetForm SQLCS_IMPLICIT, or SQLCS_NCHAR for NCLOB columns.
     */
    OracleLob(OCISvcCtx* svc, OCIError* err, OCILobLocator* locator, ub1 charsetForm);
    ~OracleLob() override;

    OracleLob(const OracleLob&) = delete;
    OracleLob& operator=(const OracleLob&) = delete;

    /**
     * @brief Replace the LOB contents.
     * @param data Bytes (BLOB) or text in the client character set.
     * @param binary true for BLOB columns.
     */
    void write(const std::string& data, bool binary) override;

private:
    OCISvcCtx* m_svc;
    OCIError* m_err;
    OCILobLocator* m_locator;
    ub1 m_charsetForm;
};

/**
 * @class OracleConnection
 * @brief Single OCI session implementing Connection.
 *
 * Session setup after logon:
 * - NLS parameters from ConnectionConfig::nls
 * - cursor_sharing and, when configured, time_zone
 * - prefetch_rows on every statement
 *
 * Errors reported by OCI are classified through ErrorHandler and raised as
 * the matching DatabaseError subclass. With auto_retry enabled, a statement
 * failing with a lost connection is retried once after reconnecting.
 *
 * Thread Safety:
 * - NOT thread-safe; use one OracleConnection per thread.
 *
 * Usage:
 * @code
 *   OracleConnection conn(config.connection, config.adapter);
 *   conn.open();
 *   Rows rows = conn.selectAll("SELECT table_name FROM user_tables", "SCHEMA");
 * @endcode
 */
class OracleConnection : public Connection {
public:
    OracleConnection(const ConnectionConfig& config, const AdapterConfig& adapter);

    /** @brief Ends the session and frees every handle. */
    ~OracleConnection() override;

    OracleConnection(const OracleConnection&) = delete;
    OracleConnection& operator=(const OracleConnection&) = delete;

    /**
     * @brief Log on and configure the session.
     * @throws ConnectionException when the server cannot be reached or logon fails.
     */
    void open();

    /** @brief End the session; safe to call when already closed. */
    void close();

    bool isOpen() const { return m_svc != nullptr; }

    Rows selectAll(const std::string& sql, const std::string& label = "SQL",
                   const Binds& binds = {}) override;

    uint64_t execute(const std::string& sql, const std::string& label = "SQL",
                     const Binds& binds = {}) override;

    std::unique_ptr<LobHandle> selectLobForUpdate(const std::string& sql,
                                                  const std::string& label = "SQL",
                                                  const Binds& binds = {}) override;

    /** @brief Round trip with OCIPing; throws ConnectionException on failure. */
    void ping() override;

    /** @brief Close and re-open the session. */
    void reset() override;

    std::string adapterName() const override { return kOracleAdapterName; }

private:
    /** @brief Prepare, bind and execute; returns the owned statement handle. */
    OCIStmt* prepareAndExecute(const std::string& sql, const std::string& label,
                               const Binds& binds, bool isQuery);

    /** @brief Run the session ALTER statements. */
    void configureSession();

    /** @brief Free every handle without raising. */
    void freeHandles();

    void requireOpen() const;

    ConnectionConfig m_config;
    AdapterConfig m_adapter;

    OCIEnv* m_env = nullptr;          ///< OCI environment handle
    OCIError* m_err = nullptr;        ///< OCI error handle
    OCIServer* m_server = nullptr;    ///< Server attachment
    OCISvcCtx* m_svc = nullptr;       ///< Service context (this connection's session)
    OCISession* m_session = nullptr;  ///< Authenticated session
};

}  // namespace oraenhanced
