#include "ErrorHandler.hpp"

namespace oraenhanced {

thread_local std::string ErrorContext::s_currentContext;

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UniqueViolation:
            return "UniqueViolation";
        case ErrorKind::StatementInvalid:
            return "StatementInvalid";
        case ErrorKind::NotNullViolation:
            return "NotNullViolation";
        case ErrorKind::ForeignKeyViolation:
            return "ForeignKeyViolation";
        case ErrorKind::ValueTooLong:
            return "ValueTooLong";
        case ErrorKind::ConnectionLost:
            return "ConnectionLost";
        case ErrorKind::Unclassified:
        default:
            return "Unclassified";
    }
}

DatabaseError::DatabaseError(int errorCode, const std::string& message)
    : std::runtime_error(message)
    , m_errorCode(errorCode) {
}

ErrorKind ErrorHandler::classifyOracleError(int oracle_error) {
    // OCI reports some codes negated
    int err = (oracle_error < 0) ? -oracle_error : oracle_error;

    switch (err) {
        case 1:     // ORA-00001: unique constraint violated
            return ErrorKind::UniqueViolation;

        case 942:   // ORA-00942: table or view does not exist
        case 955:   // ORA-00955: name is already used by an existing object
        case 1418:  // ORA-01418: specified index does not exist
            return ErrorKind::StatementInvalid;

        case 1400:  // ORA-01400: cannot insert NULL
            return ErrorKind::NotNullViolation;

        case 2291:  // ORA-02291: integrity constraint violated - parent key not found
            return ErrorKind::ForeignKeyViolation;

        case 12899: // ORA-12899: value too large for column
            return ErrorKind::ValueTooLong;

        default:
            return ErrorKind::Unclassified;
    }
}

ErrorKind ErrorHandler::classifyTransportError(int oracle_error) {
    return isConnectionError(oracle_error) ? ErrorKind::ConnectionLost
                                           : ErrorKind::Unclassified;
}

bool ErrorHandler::isConnectionError(int oracle_error) {
    int err = (oracle_error < 0) ? -oracle_error : oracle_error;

    switch (err) {
        case 28:    // ORA-00028: your session has been killed
        case 1012:  // ORA-01012: not logged on
        case 1033:  // ORA-01033: initialization or shutdown in progress
        case 1034:  // ORA-01034: ORACLE not available
        case 1089:  // ORA-01089: immediate shutdown in progress
        case 3113:  // ORA-03113: end-of-file on communication channel
        case 3114:  // ORA-03114: not connected to ORACLE
        case 3135:  // ORA-03135: connection lost contact
        case 12170: // ORA-12170: TNS:Connect timeout
        case 12514: // ORA-12514: TNS:listener does not know of service
        case 12528: // ORA-12528: TNS:listener: all appropriate instances are blocking
        case 12537: // ORA-12537: TNS:connection closed
        case 12541: // ORA-12541: TNS:no listener
        case 12543: // ORA-12543: TNS:destination host unreachable
        case 12545: // ORA-12545: connect failed because target host or object does not exist
        case 12547: // ORA-12547: TNS:lost contact
        case 12571: // ORA-12571: TNS:packet writer failure
            return true;
        default:
            return false;
    }
}

void ErrorHandler::throwOracleError(int oracle_error, const std::string& message) {
    switch (classifyOracleError(oracle_error)) {
        case ErrorKind::UniqueViolation:
            throw RecordNotUnique(oracle_error, message);
        case ErrorKind::StatementInvalid:
            throw StatementInvalid(oracle_error, message);
        case ErrorKind::NotNullViolation:
            throw NotNullViolation(oracle_error, message);
        case ErrorKind::ForeignKeyViolation:
            throw InvalidForeignKey(oracle_error, message);
        case ErrorKind::ValueTooLong:
            throw ValueTooLong(oracle_error, message);
        default:
            break;
    }

    if (classifyTransportError(oracle_error) == ErrorKind::ConnectionLost) {
        throw ConnectionException(oracle_error, message);
    }
    throw DatabaseError(oracle_error, message);
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

}  // namespace oraenhanced
