#include "OracleDialectTranslator.hpp"
#include "OracleIdentifier.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace oraenhanced {

namespace {

bool isBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

std::string rtrim(const std::string& str) {
    auto end = str.find_last_not_of(" \t\r\n\f\v");
    return end == std::string::npos ? std::string() : str.substr(0, end + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

}  // namespace

OracleDialectTranslator::OracleDialectTranslator(const AdapterConfig& config,
                                                 std::vector<int> serverVersion)
    : m_config(config)
    , m_serverVersion(std::move(serverVersion)) {
}

bool OracleDialectTranslator::versionAtLeast(int major, int minor) const {
    if (m_serverVersion.empty()) return false;
    if (m_serverVersion[0] != major) return m_serverVersion[0] > major;
    int serverMinor = m_serverVersion.size() > 1 ? m_serverVersion[1] : 0;
    return serverMinor >= minor;
}

bool OracleDialectTranslator::supportsFetchFirstNRowsAndOffset() const {
    return !m_config.use_old_oracle_visitor && versionAtLeast(12);
}

bool OracleDialectTranslator::supportsMultiInsert() const {
    return versionAtLeast(11, 2);
}

bool OracleDialectTranslator::supportsVirtualColumns() const {
    return versionAtLeast(11);
}

bool OracleDialectTranslator::supportsJson() const {
    return versionAtLeast(12);
}

// ============================================================================
// Query rewriting
// ============================================================================

std::string OracleDialectTranslator::paginate(const std::string& sql,
                                              std::optional<uint64_t> limit,
                                              std::optional<uint64_t> offset) const {
    if (!limit && !offset) {
        return sql;
    }

    if (supportsFetchFirstNRowsAndOffset()) {
        std::string result = sql;
        if (offset) {
            result += " OFFSET " + std::to_string(*offset) + " ROWS";
        }
        if (limit) {
            result += " FETCH FIRST " + std::to_string(*limit) + " ROWS ONLY";
        }
        return result;
    }

    if (!offset) {
        return "SELECT * FROM (" + sql + ") WHERE ROWNUM <= " + std::to_string(*limit);
    }

    std::string inner = "SELECT raw_sql_.*, rownum raw_rnum_ FROM (" + sql + ") raw_sql_";
    if (limit) {
        inner += " WHERE rownum <= " + std::to_string(*offset + *limit);
    }
    return "SELECT * FROM (" + inner + ") WHERE raw_rnum_ > " + std::to_string(*offset);
}

std::string OracleDialectTranslator::columnsForDistinct(const std::string& columns,
                                                        const std::vector<std::string>& orders) const {
    static const std::regex direction(R"(\s+(ASC|DESC)\s*?)", std::regex::icase);

    std::string result = columns;
    size_t index = 0;
    for (const auto& order : orders) {
        if (isBlank(order)) continue;
        std::string column = std::regex_replace(order, direction, "");
        if (isBlank(column)) continue;

        result += ", FIRST_VALUE(" + column + ") OVER (PARTITION BY " + columns +
                  " ORDER BY " + column + ") AS alias_" + std::to_string(index) + "__";
        ++index;
    }
    return result;
}

// ============================================================================
// Default values
// ============================================================================

std::string OracleDialectTranslator::extractValueFromDefault(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        result += value[i];
        if (value[i] == '\'' && i + 1 < value.size() && value[i + 1] == '\'') {
            ++i;
        }
    }
    return result;
}

std::optional<std::string> OracleDialectTranslator::normalizeDefault(
    const std::optional<std::string>& raw, bool isVirtual, const LogicalType& type) const {
    if (!raw || isBlank(*raw)) {
        return std::nullopt;
    }
    if (isVirtual) {
        return raw;
    }

    std::string value = rtrim(*raw);
    if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
        value = value.substr(1, value.size() - 2);
    }

    std::string lower = toLower(value);
    if (lower == "null" || lower == "empty_blob()" || lower == "empty_clob()") {
        return std::nullopt;
    }

    if (value == "N" && m_config.emulate_booleans_from_strings) {
        return std::string("false");
    }

    if (type.isStringLike()) {
        return extractValueFromDefault(value);
    }
    return value;
}

// ============================================================================
// DDL fragments
// ============================================================================

std::optional<std::string> OracleDialectTranslator::defaultTablespaceFor(const std::string& kind) const {
    auto it = m_config.default_tablespaces.find(kind);
    if (it == m_config.default_tablespaces.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string OracleDialectTranslator::tablespaceClause(
    const std::string& kind, const std::optional<std::string>& explicitTablespace) const {
    auto tablespace = explicitTablespace ? explicitTablespace : defaultTablespaceFor(kind);
    if (!tablespace) {
        return "";
    }
    return " TABLESPACE " + *tablespace;
}

std::string OracleDialectTranslator::lobStorageClause(
    const std::string& kind, const std::string& table, const std::string& column,
    const std::optional<std::string>& explicitTablespace) const {
    auto tablespace = explicitTablespace ? explicitTablespace : defaultTablespaceFor(kind);
    if (!tablespace) {
        return "";
    }
    // Segment name: first 11 chars of the column, first 15 of the table
    return " LOB (" + OracleIdentifier::quoteColumnName(column) + ") STORE AS " +
           column.substr(0, 11) + "_" + table.substr(0, 15) + "_ls (TABLESPACE " +
           *tablespace + ")";
}

std::string OracleDialectTranslator::createSequence(const std::string& name,
                                                    std::optional<int64_t> startValue) const {
    int64_t start = startValue.value_or(m_config.default_sequence_start_value);
    return "CREATE SEQUENCE " + OracleIdentifier::quoteTableName(name) +
           " START WITH " + std::to_string(start);
}

std::string OracleDialectTranslator::dropSequence(const std::string& name) const {
    return "DROP SEQUENCE " + OracleIdentifier::quoteTableName(name);
}

std::string OracleDialectTranslator::nextSequenceValueSql(const std::string& name) const {
    return "SELECT " + OracleIdentifier::quoteTableName(name) + ".NEXTVAL FROM dual";
}

std::string OracleDialectTranslator::defaultSequenceName(const std::string& table) {
    // Keep the owner prefix, truncate only the table part
    std::string prefix;
    std::string name = table;
    auto dot = table.rfind('.');
    if (dot != std::string::npos) {
        prefix = table.substr(0, dot + 1);
        name = table.substr(dot + 1);
    }
    return prefix + name.substr(0, kIdentifierMaxLength - 4) + "_seq";
}

std::string OracleDialectTranslator::defaultTriggerName(const std::string& table) {
    return table.substr(0, kIdentifierMaxLength - 4) + "_pkt";
}

std::string OracleDialectTranslator::defaultDatastoreProcedure(const std::string& index) {
    return index + "_prc";
}

}  // namespace oraenhanced
