#include "OracleSchemaManager.hpp"
#include "OracleIdentifier.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace oraenhanced {

namespace {

// Synonym chains longer than this are treated as loops
constexpr int kMaxSynonymDepth = 16;

std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::optional<int> toInt(const SqlValue& value) {
    if (!value || value->empty()) {
        return std::nullopt;
    }
    try {
        return std::stoi(*value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

}  // namespace

OracleSchemaManager::OracleSchemaManager(Connection& connection, const AdapterConfig& config)
    : m_connection(connection)
    , m_config(config)
    , m_registry(config)
    , m_translator(config, {}) {
}

// ============================================================================
// Name resolution
// ============================================================================

TableReference OracleSchemaManager::describe(const std::string& table) {
    ErrorContext ctx("describe " + table);
    return describeReference(table, 0);
}

TableReference OracleSchemaManager::describeReference(const std::string& table, int depth) {
    if (depth > kMaxSynonymDepth) {
        throw StatementInvalid(4043, "\"DESC " + table + "\" failed; synonym chain too long");
    }

    auto at = table.find('@');
    std::string objectPart = at == std::string::npos ? table : table.substr(0, at);

    std::string defaultOwner;
    if (objectPart.find('.') == std::string::npos) {
        if (at != std::string::npos) {
            defaultOwner = m_connection.selectValue(
                "SELECT username FROM all_db_links WHERE db_link = :db_link",
                "CONNECTION", {bindString("db_link", toUpper(table.substr(at + 1)))}).value_or("");
        } else {
            defaultOwner = currentSchema();
        }
    }

    TableReference ref = OracleIdentifier::parseTableReference(table, defaultOwner);
    const std::string link = ref.linkSuffix();
    const std::string realName = ref.dbLink ? objectPart : table;

    std::string sql =
        "SELECT owner, table_name, NULL AS db_link, 'TABLE' name_type "
        "FROM all_tables" + link + " WHERE owner = :owner AND table_name = :table_name "
        "UNION ALL "
        "SELECT owner, view_name table_name, NULL AS db_link, 'VIEW' name_type "
        "FROM all_views" + link + " WHERE owner = :owner AND view_name = :table_name "
        "UNION ALL "
        "SELECT table_owner, table_name, db_link, 'SYNONYM' name_type "
        "FROM all_synonyms" + link + " WHERE owner = :owner AND synonym_name = :table_name "
        "UNION ALL "
        "SELECT table_owner, table_name, db_link, 'SYNONYM' name_type "
        "FROM all_synonyms" + link + " WHERE owner = 'PUBLIC' AND synonym_name = :real_name";

    auto row = m_connection.selectOne(sql, "CONNECTION", {
        bindString("owner", ref.owner), bindString("table_name", ref.name),
        bindString("owner", ref.owner), bindString("table_name", ref.name),
        bindString("owner", ref.owner), bindString("table_name", ref.name),
        bindString("real_name", OracleIdentifier::isValidTableName(realName) ? toUpper(realName) : realName),
    });

    if (!row) {
        throw StatementInvalid(4043, "\"DESC " + table + "\" failed; does it exist?");
    }

    if (row->str("name_type") == "SYNONYM") {
        std::string target;
        if (auto owner = (*row)["owner"]) {
            target = *owner + ".";
        }
        target += row->str("table_name");
        if (auto synonymLink = (*row)["db_link"]) {
            target += "@" + *synonymLink;
        } else {
            target += link;
        }
        return describeReference(target, depth + 1);
    }

    TableReference result;
    result.owner = row->str("owner");
    result.name = row->str("table_name");
    result.dbLink = ref.dbLink;
    return result;
}

// ============================================================================
// Table structure
// ============================================================================

std::vector<ColumnDescriptor> OracleSchemaManager::columns(const std::string& table) {
    ErrorContext ctx("columns " + table);
    TableReference ref = describe(table);
    const std::string link = ref.linkSuffix();

    std::string sql =
        "SELECT cols.column_name AS name, cols.data_type AS sql_type, "
        "cols.data_default, cols.nullable, cols.virtual_column, cols.hidden_column, "
        "cols.data_type_owner AS sql_type_owner, "
        "DECODE(cols.data_type, 'NUMBER', data_precision, "
        "'FLOAT', data_precision, "
        "'VARCHAR2', DECODE(char_used, 'C', char_length, data_length), "
        "'RAW', DECODE(char_used, 'C', char_length, data_length), "
        "'CHAR', DECODE(char_used, 'C', char_length, data_length), "
        "NULL) AS limit, "
        "DECODE(data_type, 'NUMBER', data_scale, NULL) AS scale, "
        "comments.comments AS column_comment "
        "FROM all_tab_cols" + link + " cols, all_col_comments" + link + " comments "
        "WHERE cols.owner = :owner "
        "AND cols.table_name = :table_name "
        "AND cols.hidden_column = 'NO' "
        "AND cols.owner = comments.owner "
        "AND cols.table_name = comments.table_name "
        "AND cols.column_name = comments.column_name "
        "ORDER BY cols.column_id";

    Rows rows = m_connection.selectAll(sql, "Column definitions", {
        bindString("owner", ref.owner), bindString("table_name", ref.name)});

    std::vector<ColumnDescriptor> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        ColumnDescriptor col;
        col.name = OracleIdentifier::oracleDowncase(row.str("name"));
        col.sqlType = row.str("sql_type");
        col.nullable = row.str("nullable") == "Y";
        col.isVirtual = row.str("virtual_column") == "YES";
        col.isHidden = row.str("hidden_column") == "YES";
        col.typeOwner = row["sql_type_owner"];
        col.comment = row["column_comment"];
        col.limit = toInt(row["limit"]);
        col.scale = toInt(row["scale"]);

        col.type = m_registry.resolve(col.fullSqlType());
        col.precision = col.type.precision;
        col.defaultValue = m_translator.normalizeDefault(row["data_default"], col.isVirtual, col.type);

        result.push_back(std::move(col));
    }
    return result;
}

std::vector<IndexDescriptor> OracleSchemaManager::indexes(const std::string& table) {
    ErrorContext ctx("indexes " + table);
    TableReference ref = describe(table);
    const std::string link = ref.linkSuffix();
    const std::string defaultTablespaceName = defaultTablespace();

    std::string sql =
        "SELECT LOWER(i.table_name) AS table_name, LOWER(i.index_name) AS index_name, i.uniqueness, "
        "i.index_type, i.ityp_owner, i.ityp_name, i.parameters, "
        "LOWER(i.tablespace_name) AS tablespace_name, "
        "LOWER(c.column_name) AS column_name, e.column_expression, "
        "atc.virtual_column "
        "FROM all_indexes" + link + " i "
        "JOIN all_ind_columns" + link + " c ON c.index_name = i.index_name AND c.index_owner = i.owner "
        "LEFT OUTER JOIN all_ind_expressions" + link + " e ON e.index_name = i.index_name AND "
        "e.index_owner = i.owner AND e.column_position = c.column_position "
        "LEFT OUTER JOIN all_tab_cols" + link + " atc ON i.table_name = atc.table_name AND "
        "c.column_name = atc.column_name AND i.owner = atc.owner AND atc.hidden_column = 'NO' "
        "WHERE i.owner = :owner "
        "AND i.table_owner = :owner "
        "AND NOT EXISTS (SELECT uc.index_name FROM all_constraints uc "
        "WHERE uc.index_name = i.index_name AND uc.owner = i.owner AND uc.constraint_type = 'P') "
        "ORDER BY i.index_name, c.column_position";

    Rows rows = m_connection.selectAll(sql, "indexes", {
        bindString("owner", ref.owner), bindString("owner", ref.owner)});

    static const std::regex parametersMarker(R"(-- add_context_index_parameters (.+)\n)");

    std::vector<IndexDescriptor> allIndexes;
    std::unordered_map<std::string, size_t> positions;

    for (const auto& row : rows) {
        const std::string indexName = row.str("index_name");
        auto found = positions.find(indexName);

        if (found == positions.end()) {
            IndexDescriptor index;
            index.table = row.str("table_name");
            index.name = indexName;
            index.unique = row.str("uniqueness") == "UNIQUE";
            index.indexType = row.str("index_type");
            index.parameters = row["parameters"];

            if (index.indexType == "DOMAIN") {
                index.domainType = row.str("ityp_owner") + "." + row.str("ityp_name");
            }

            if (index.indexType == "DOMAIN" && row.str("ityp_owner") == "CTXSYS" &&
                row.str("ityp_name") == "CONTEXT") {
                std::string procedure = toUpper(OracleDialectTranslator::defaultDatastoreProcedure(indexName));
                std::string source;
                for (const auto& line : m_connection.selectValues(
                         "SELECT text FROM all_source" + link +
                         " WHERE owner = :owner AND name = :procedure_name ORDER BY line",
                         "procedure",
                         {bindString("owner", ref.owner), bindString("procedure_name", procedure)})) {
                    source += line;
                }
                std::smatch match;
                if (std::regex_search(source, match, parametersMarker)) {
                    index.statementParameters = match[1].str();
                }
            }

            auto tablespace = row["tablespace_name"];
            if (tablespace && *tablespace != defaultTablespaceName) {
                index.tablespace = tablespace;
            }

            positions.emplace(indexName, allIndexes.size());
            allIndexes.push_back(std::move(index));
            found = positions.find(indexName);
        }

        // Re-creating an index on a virtual column from its expression fails
        // with ORA-54018, so virtual columns are listed by name.
        IndexDescriptor& index = allIndexes[found->second];
        auto expression = row["column_expression"];
        if (expression && row.str("virtual_column") != "YES") {
            index.columns.push_back(*expression);
        } else {
            index.columns.push_back(toLower(row.str("column_name")));
        }
    }

    const std::string tableName = toLower(ref.name);
    std::vector<IndexDescriptor> result;
    for (auto& index : allIndexes) {
        if (index.table == tableName) {
            result.push_back(std::move(index));
        }
    }
    return result;
}

std::vector<std::string> OracleSchemaManager::primaryKeys(const std::string& table) {
    TableReference ref = describe(table);
    const std::string link = ref.linkSuffix();

    auto pks = m_connection.selectValues(
        "SELECT cc.column_name "
        "FROM all_constraints" + link + " c, all_cons_columns" + link + " cc "
        "WHERE c.owner = :owner "
        "AND c.table_name = :table_name "
        "AND c.constraint_type = 'P' "
        "AND cc.owner = c.owner "
        "AND cc.constraint_name = c.constraint_name "
        "ORDER BY cc.position",
        "Primary Keys",
        {bindString("owner", ref.owner), bindString("table_name", ref.name)});

    for (auto& pk : pks) {
        pk = OracleIdentifier::oracleDowncase(pk);
    }
    return pks;
}

std::optional<SequenceBinding> OracleSchemaManager::pkAndSequenceFor(const std::string& table) {
    TableReference ref = describe(table);
    const std::string link = ref.linkSuffix();

    auto seqs = m_connection.selectValues(
        "SELECT us.sequence_name "
        "FROM all_sequences" + link + " us "
        "WHERE us.sequence_owner = :owner "
        "AND us.sequence_name = :sequence_name",
        "Sequence",
        {bindString("owner", ref.owner),
         bindString("sequence_name", toUpper(OracleDialectTranslator::defaultSequenceName(ref.name)))});

    auto pks = m_connection.selectValues(
        "SELECT cc.column_name "
        "FROM all_constraints" + link + " c, all_cons_columns" + link + " cc "
        "WHERE c.owner = :owner "
        "AND c.table_name = :table_name "
        "AND c.constraint_type = 'P' "
        "AND cc.owner = c.owner "
        "AND cc.constraint_name = c.constraint_name",
        "Primary Key",
        {bindString("owner", ref.owner), bindString("table_name", ref.name)});

    if (pks.size() > 1) {
        spdlog::warn("{} has composite primary key. Composite primary key is ignored.", table);
    }

    if (pks.size() != 1) {
        return std::nullopt;
    }

    SequenceBinding binding;
    binding.primaryKey = OracleIdentifier::oracleDowncase(pks.front());
    if (!seqs.empty()) {
        binding.sequenceName = OracleIdentifier::oracleDowncase(seqs.front());
    }
    return binding;
}

std::optional<std::string> OracleSchemaManager::primaryKey(const std::string& table) {
    auto binding = pkAndSequenceFor(table);
    if (!binding) {
        return std::nullopt;
    }
    return binding->primaryKey;
}

bool OracleSchemaManager::hasPrimaryKey(const std::string& table) {
    return pkAndSequenceFor(table).has_value();
}

bool OracleSchemaManager::hasPrimaryKeyTrigger(const std::string& table) {
    TableReference ref = describe(table);
    const std::string triggerName = toUpper(OracleDialectTranslator::defaultTriggerName(table));

    auto trigger = m_connection.selectValue(
        "SELECT trigger_name "
        "FROM all_triggers" + ref.linkSuffix() + " "
        "WHERE owner = :owner "
        "AND trigger_name = :trigger_name "
        "AND table_owner = :owner "
        "AND table_name = :table_name "
        "AND status = 'ENABLED'",
        "Primary Key Trigger",
        {bindString("owner", ref.owner), bindString("trigger_name", triggerName),
         bindString("owner", ref.owner), bindString("table_name", ref.name)});

    return trigger.has_value();
}

// ============================================================================
// Schema objects
// ============================================================================

std::vector<std::string> OracleSchemaManager::tables() {
    return m_connection.selectValues(
        "SELECT DECODE(table_name, UPPER(table_name), LOWER(table_name), table_name) "
        "FROM all_tables WHERE owner = SYS_CONTEXT('userenv', 'current_schema') AND secondary = 'N'",
        "SCHEMA");
}

std::vector<std::string> OracleSchemaManager::views() {
    return m_connection.selectValues(
        "SELECT LOWER(view_name) FROM all_views WHERE owner = SYS_CONTEXT('userenv', 'current_schema')",
        "SCHEMA");
}

std::vector<std::string> OracleSchemaManager::materializedViews() {
    return m_connection.selectValues(
        "SELECT LOWER(mview_name) FROM all_mviews WHERE owner = SYS_CONTEXT('userenv', 'current_schema')",
        "SCHEMA");
}

std::vector<SynonymDescriptor> OracleSchemaManager::synonyms() {
    Rows rows = m_connection.selectAll(
        "SELECT synonym_name, table_owner, table_name, db_link "
        "FROM all_synonyms WHERE owner = SYS_CONTEXT('userenv', 'session_user')",
        "SCHEMA");

    std::vector<SynonymDescriptor> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        SynonymDescriptor synonym;
        synonym.name = OracleIdentifier::oracleDowncase(row.str("synonym_name"));
        synonym.tableOwner = OracleIdentifier::oracleDowncase(row.str("table_owner"));
        synonym.tableName = OracleIdentifier::oracleDowncase(row.str("table_name"));
        synonym.dbLink = OracleIdentifier::oracleDowncase(row["db_link"]);
        result.push_back(std::move(synonym));
    }
    return result;
}

std::vector<std::string> OracleSchemaManager::dataSources() {
    std::vector<std::string> result = tables();
    std::unordered_set<std::string> seen(result.begin(), result.end());
    for (const auto& synonym : synonyms()) {
        if (seen.insert(synonym.name).second) {
            result.push_back(synonym.name);
        }
    }
    return result;
}

bool OracleSchemaManager::tableExists(const std::string& table) {
    // A database link reference is never a local table
    if (OracleIdentifier::isDbLinkReference(table)) {
        return false;
    }

    TableReference ref = OracleIdentifier::parseTableReference(table, currentSchema());
    auto found = m_connection.selectValues(
        "SELECT owner, table_name FROM all_tables WHERE owner = :owner AND table_name = :table_name",
        "SCHEMA",
        {bindString("owner", ref.owner), bindString("table_name", ref.name)});
    return !found.empty();
}

bool OracleSchemaManager::dataSourceExists(const std::string& table) {
    try {
        describe(table);
        return true;
    } catch (const DatabaseError& e) {
        spdlog::debug("Data source {} not found: {}", table, e.what());
        return false;
    }
}

bool OracleSchemaManager::temporaryTable(const std::string& table) {
    auto temporary = m_connection.selectValue(
        "SELECT temporary FROM all_tables WHERE table_name = :table_name "
        "AND owner = SYS_CONTEXT('userenv', 'session_user')",
        "temp tables",
        {bindString("table_name", toUpper(table))});
    return temporary.value_or("") == "Y";
}

// ============================================================================
// Session
// ============================================================================

std::string OracleSchemaManager::currentDatabase() {
    try {
        return m_connection.selectValue("SELECT SYS_CONTEXT('userenv', 'con_name') FROM dual").value_or("");
    } catch (const StatementInvalid&) {
        // con_name is unknown before 12c
        return m_connection.selectValue("SELECT SYS_CONTEXT('userenv', 'db_name') FROM dual").value_or("");
    }
}

std::string OracleSchemaManager::currentUser() {
    return m_connection.selectValue("SELECT SYS_CONTEXT('userenv', 'session_user') FROM dual").value_or("");
}

std::string OracleSchemaManager::currentSchema() {
    return m_connection.selectValue("SELECT SYS_CONTEXT('userenv', 'current_schema') FROM dual").value_or("");
}

std::string OracleSchemaManager::defaultTablespace() {
    return m_connection.selectValue(
        "SELECT LOWER(default_tablespace) FROM user_users "
        "WHERE username = SYS_CONTEXT('userenv', 'current_schema')").value_or("");
}

}  // namespace oraenhanced
