#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "OracleDialectTranslator.hpp"

using namespace oraenhanced;
using ::testing::HasSubstr;

class DialectTranslatorTest : public ::testing::Test {
protected:
    AdapterConfig config;

    OracleDialectTranslator translator(std::vector<int> version) {
        return OracleDialectTranslator(config, std::move(version));
    }
};

// Pagination
TEST_F(DialectTranslatorTest, NoLimitOrOffsetLeavesQueryAlone) {
    auto t = translator({11, 2});
    EXPECT_EQ(t.paginate("SELECT * FROM emp", std::nullopt, std::nullopt), "SELECT * FROM emp");
}

TEST_F(DialectTranslatorTest, FetchFirstOn12c) {
    auto t = translator({12, 1});

    EXPECT_TRUE(t.supportsFetchFirstNRowsAndOffset());
    EXPECT_EQ(t.paginate("SELECT * FROM emp", 10, std::nullopt),
              "SELECT * FROM emp FETCH FIRST 10 ROWS ONLY");
    EXPECT_EQ(t.paginate("SELECT * FROM emp", 10, 20),
              "SELECT * FROM emp OFFSET 20 ROWS FETCH FIRST 10 ROWS ONLY");
    EXPECT_EQ(t.paginate("SELECT * FROM emp", std::nullopt, 5),
              "SELECT * FROM emp OFFSET 5 ROWS");
}

TEST_F(DialectTranslatorTest, RownumLimitBefore12c) {
    auto t = translator({11, 2});

    EXPECT_FALSE(t.supportsFetchFirstNRowsAndOffset());
    EXPECT_EQ(t.paginate("SELECT * FROM emp", 10, std::nullopt),
              "SELECT * FROM (SELECT * FROM emp) WHERE ROWNUM <= 10");
}

TEST_F(DialectTranslatorTest, RownumOffsetBefore12c) {
    auto t = translator({11, 2});

    EXPECT_EQ(t.paginate("SELECT * FROM emp", 10, 20),
              "SELECT * FROM (SELECT raw_sql_.*, rownum raw_rnum_ FROM (SELECT * FROM emp) raw_sql_ "
              "WHERE rownum <= 30) WHERE raw_rnum_ > 20");
    EXPECT_EQ(t.paginate("SELECT * FROM emp", std::nullopt, 20),
              "SELECT * FROM (SELECT raw_sql_.*, rownum raw_rnum_ FROM (SELECT * FROM emp) raw_sql_) "
              "WHERE raw_rnum_ > 20");
}

TEST_F(DialectTranslatorTest, OldVisitorForcesRownum) {
    config.use_old_oracle_visitor = true;
    auto t = translator({19, 0});

    EXPECT_FALSE(t.supportsFetchFirstNRowsAndOffset());
    EXPECT_THAT(t.paginate("SELECT * FROM emp", 1, std::nullopt), HasSubstr("ROWNUM <= 1"));
}

TEST_F(DialectTranslatorTest, UnknownVersionUsesRownum) {
    auto t = translator({});
    EXPECT_FALSE(t.supportsFetchFirstNRowsAndOffset());
}

// Capabilities
TEST_F(DialectTranslatorTest, ConstantCapabilities) {
    auto t = translator({});

    EXPECT_TRUE(t.supportsSavepoints());
    EXPECT_TRUE(t.supportsTransactionIsolation());
    EXPECT_TRUE(t.supportsForeignKeys());
    EXPECT_TRUE(t.supportsForeignKeysInCreate());
    EXPECT_TRUE(t.supportsViews());
    EXPECT_TRUE(t.supportsDatetimeWithPrecision());
    EXPECT_TRUE(t.supportsComments());
}

TEST_F(DialectTranslatorTest, VersionDependentCapabilities) {
    auto v10 = translator({10, 2});
    EXPECT_FALSE(v10.supportsVirtualColumns());
    EXPECT_FALSE(v10.supportsMultiInsert());
    EXPECT_FALSE(v10.supportsJson());

    auto v111 = translator({11, 1});
    EXPECT_TRUE(v111.supportsVirtualColumns());
    EXPECT_FALSE(v111.supportsMultiInsert());

    auto v112 = translator({11, 2, 0, 4});
    EXPECT_TRUE(v112.supportsMultiInsert());
    EXPECT_FALSE(v112.supportsJson());

    auto v19 = translator({19});
    EXPECT_TRUE(v19.supportsMultiInsert());
    EXPECT_TRUE(v19.supportsVirtualColumns());
    EXPECT_TRUE(v19.supportsJson());

    auto unknown = translator({});
    EXPECT_FALSE(unknown.supportsVirtualColumns());
    EXPECT_FALSE(unknown.supportsJson());
}

// DISTINCT with ORDER BY
TEST_F(DialectTranslatorTest, ColumnsForDistinctStripsDirection) {
    auto t = translator({19});

    EXPECT_EQ(t.columnsForDistinct("posts.id", {"posts.created_at DESC"}),
              "posts.id, FIRST_VALUE(posts.created_at) OVER (PARTITION BY posts.id "
              "ORDER BY posts.created_at) AS alias_0__");
}

TEST_F(DialectTranslatorTest, ColumnsForDistinctNumbersAliases) {
    auto t = translator({19});

    std::string result = t.columnsForDistinct("a", {"b asc", "  ", "c"});
    EXPECT_THAT(result, HasSubstr("FIRST_VALUE(b) OVER (PARTITION BY a ORDER BY b) AS alias_0__"));
    EXPECT_THAT(result, HasSubstr("FIRST_VALUE(c) OVER (PARTITION BY a ORDER BY c) AS alias_1__"));
}

TEST_F(DialectTranslatorTest, ColumnsForDistinctWithoutOrders) {
    auto t = translator({19});
    EXPECT_EQ(t.columnsForDistinct("a, b", {}), "a, b");
}

// Defaults
TEST_F(DialectTranslatorTest, ExtractValueFromDefault) {
    EXPECT_EQ(OracleDialectTranslator::extractValueFromDefault("it''s"), "it's");
    EXPECT_EQ(OracleDialectTranslator::extractValueFromDefault("plain"), "plain");
}

TEST_F(DialectTranslatorTest, NormalizeDefault) {
    auto t = translator({19});
    LogicalType text;
    text.kind = TypeKind::String;
    LogicalType number;
    number.kind = TypeKind::Integer;

    EXPECT_FALSE(t.normalizeDefault(std::nullopt, false, text).has_value());
    EXPECT_FALSE(t.normalizeDefault(std::string("  \n"), false, text).has_value());
    EXPECT_FALSE(t.normalizeDefault(std::string("NULL "), false, text).has_value());
    EXPECT_FALSE(t.normalizeDefault(std::string("empty_clob()"), false, text).has_value());
    EXPECT_FALSE(t.normalizeDefault(std::string("EMPTY_BLOB() "), false, text).has_value());

    EXPECT_EQ(t.normalizeDefault(std::string("'it''s'\n"), false, text), std::string("it's"));
    EXPECT_EQ(t.normalizeDefault(std::string("0 "), false, number), std::string("0"));
}

TEST_F(DialectTranslatorTest, NormalizeDefaultKeepsVirtualExpression) {
    auto t = translator({19});
    LogicalType number;
    number.kind = TypeKind::Integer;

    EXPECT_EQ(t.normalizeDefault(std::string("\"PRICE\"*2 "), true, number), std::string("\"PRICE\"*2 "));
}

TEST_F(DialectTranslatorTest, NormalizeDefaultBooleanFromStrings) {
    config.emulate_booleans_from_strings = true;
    auto t = translator({19});
    LogicalType boolean;
    boolean.kind = TypeKind::Boolean;

    EXPECT_EQ(t.normalizeDefault(std::string("'N'"), false, boolean), std::string("false"));
}

// DDL fragments
TEST_F(DialectTranslatorTest, TablespaceClause) {
    config.default_tablespaces["table"] = "TS_DATA";
    auto t = translator({19});

    EXPECT_EQ(t.tablespaceClause("table", std::nullopt), " TABLESPACE TS_DATA");
    EXPECT_EQ(t.tablespaceClause("table", std::string("TS_OTHER")), " TABLESPACE TS_OTHER");
    EXPECT_EQ(t.tablespaceClause("index", std::nullopt), "");
}

TEST_F(DialectTranslatorTest, LobStorageClause) {
    config.default_tablespaces["clob"] = "TS_LOB";
    auto t = translator({19});

    EXPECT_EQ(t.lobStorageClause("clob", "customer_documents", "description_text", std::nullopt),
              " LOB (\"DESCRIPTION_TEXT\") STORE AS description_customer_docume_ls (TABLESPACE TS_LOB)");
    EXPECT_EQ(t.lobStorageClause("blob", "t", "c", std::nullopt), "");
}

TEST_F(DialectTranslatorTest, SequenceStatements) {
    auto t = translator({19});

    EXPECT_EQ(t.createSequence("employees_seq", std::nullopt),
              "CREATE SEQUENCE \"EMPLOYEES_SEQ\" START WITH 10000");
    EXPECT_EQ(t.createSequence("employees_seq", 42), "CREATE SEQUENCE \"EMPLOYEES_SEQ\" START WITH 42");
    EXPECT_EQ(t.dropSequence("employees_seq"), "DROP SEQUENCE \"EMPLOYEES_SEQ\"");
    EXPECT_EQ(t.nextSequenceValueSql("hr.employees_seq"), "SELECT \"HR\".\"EMPLOYEES_SEQ\".NEXTVAL FROM dual");
}

// Object naming
TEST_F(DialectTranslatorTest, DefaultObjectNames) {
    EXPECT_EQ(OracleDialectTranslator::defaultSequenceName("employees"), "employees_seq");
    EXPECT_EQ(OracleDialectTranslator::defaultSequenceName("hr.employees"), "hr.employees_seq");
    EXPECT_EQ(OracleDialectTranslator::defaultSequenceName(std::string(40, 't')),
              std::string(26, 't') + "_seq");
    EXPECT_EQ(OracleDialectTranslator::defaultTriggerName("employees"), "employees_pkt");
    EXPECT_EQ(OracleDialectTranslator::defaultTriggerName(std::string(40, 't')),
              std::string(26, 't') + "_pkt");
    EXPECT_EQ(OracleDialectTranslator::defaultDatastoreProcedure("docs_idx"), "docs_idx_prc");
}
