#pragma once

#include <string>
#include <stdexcept>
#include <functional>
#include <spdlog/spdlog.h>

namespace oraenhanced {

// Structured classification of a native Oracle error code
enum class ErrorKind {
    UniqueViolation,
    StatementInvalid,
    NotNullViolation,
    ForeignKeyViolation,
    ValueTooLong,
    ConnectionLost,
    Unclassified
};

std::string errorKindToString(ErrorKind kind);

// Base of every error raised by the adapter. Carries the ORA- code (0 when
// the error did not come from the database).
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(int errorCode, const std::string& message);
    explicit DatabaseError(const std::string& message) : DatabaseError(0, message) {}

    int errorCode() const { return m_errorCode; }

private:
    int m_errorCode;
};

// Transport lost or unavailable
class ConnectionException : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

// Malformed SQL or missing object
class StatementInvalid : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

class RecordNotUnique : public StatementInvalid {
public:
    using StatementInvalid::StatementInvalid;
};

class NotNullViolation : public StatementInvalid {
public:
    using StatementInvalid::StatementInvalid;
};

class InvalidForeignKey : public StatementInvalid {
public:
    using StatementInvalid::StatementInvalid;
};

class ValueTooLong : public StatementInvalid {
public:
    using StatementInvalid::StatementInvalid;
};

// Row vanished between an update and the locking re-select of its LOBs
class RecordNotFound : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

class ErrorHandler {
public:
    // Adapter-level table: exact on ORA-00001, 00942, 00955, 01418, 01400,
    // 02291 and 12899. Everything else is Unclassified.
    static ErrorKind classifyOracleError(int oracleError);

    // Generic transport-level classifier used for unclassified codes
    static ErrorKind classifyTransportError(int oracleError);

    // Check if error indicates connection issue
    static bool isConnectionError(int oracleError);

    // Throw the exception matching the classified code
    [[noreturn]] static void throwOracleError(int oracleError, const std::string& message);

    // Run an operation; after a ConnectionException, reconnect and run it
    // once more when retrying is enabled.
    template<typename Func>
    static auto executeWithRetry(Func&& operation, bool autoRetry,
                                 const std::function<void()>& reconnect)
        -> decltype(operation()) {
        try {
            return operation();
        } catch (const ConnectionException& e) {
            if (!autoRetry || !reconnect) {
                throw;
            }
            spdlog::warn("Connection lost ({}), reconnecting and retrying", e.what());
            reconnect();
        }
        return operation();
    }
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

}  // namespace oraenhanced
