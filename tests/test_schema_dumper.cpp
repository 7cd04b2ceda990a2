#include "MockConnection.hpp"
#include "MockSchemaManager.hpp"
#include "SchemaDumper.hpp"
#include "OraclePrimaryKeyResolver.hpp"
#include "ErrorHandler.hpp"

using namespace oraenhanced;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class SchemaDumperTest : public ::testing::Test {
protected:
    void SetUp() override {
        ColumnDescriptor id;
        id.name = "id";
        id.sqlType = "NUMBER";
        id.limit = 10;
        id.scale = 0;
        id.nullable = false;
        id.type.kind = TypeKind::Integer;

        ColumnDescriptor salary;
        salary.name = "salary";
        salary.sqlType = "NUMBER";
        salary.limit = 8;
        salary.scale = 2;
        salary.defaultValue = "0";
        salary.comment = "Monthly";
        salary.type.kind = TypeKind::Decimal;

        ColumnDescriptor bonus;
        bonus.name = "bonus";
        bonus.sqlType = "NUMBER";
        bonus.defaultValue = "\"SALARY\"*0.1";
        bonus.isVirtual = true;
        bonus.type.kind = TypeKind::Decimal;

        IndexDescriptor byName;
        byName.table = "employees";
        byName.name = "index_employees_on_name";
        byName.columns = {"last_name", "first_name"};
        byName.indexType = "NORMAL";

        ON_CALL(schema, columns("employees"))
            .WillByDefault(Return(std::vector<ColumnDescriptor>{id, salary, bonus}));
        ON_CALL(schema, indexes("employees")).WillByDefault(Return(std::vector<IndexDescriptor>{byName}));
        ON_CALL(schema, primaryKeys("employees")).WillByDefault(Return(std::vector<std::string>{"id"}));
        ON_CALL(schema, pkAndSequenceFor("employees"))
            .WillByDefault(Return(SequenceBinding{"id", std::string("employees_seq")}));
    }

    NiceMock<MockSchemaManager> schema;
};

// Columns
TEST_F(SchemaDumperTest, ColumnFields) {
    SchemaDumper dumper(schema);
    auto table = dumper.dumpTable("employees");

    ASSERT_EQ(table["columns"].size(), 3u);

    const auto& id = table["columns"][0];
    EXPECT_EQ(id["name"], "id");
    EXPECT_EQ(id["sql_type"], "NUMBER(10)");
    EXPECT_EQ(id["type"], "integer");
    EXPECT_EQ(id["nullable"], false);
    EXPECT_TRUE(id["default"].is_null());
    EXPECT_FALSE(id.contains("virtual"));

    const auto& salary = table["columns"][1];
    EXPECT_EQ(salary["sql_type"], "NUMBER(8,2)");
    EXPECT_EQ(salary["default"], "0");
    EXPECT_EQ(salary["comment"], "Monthly");
    EXPECT_EQ(salary["scale"], 2);

    const auto& bonus = table["columns"][2];
    EXPECT_EQ(bonus["virtual"], true);
    EXPECT_EQ(bonus["default"], "\"SALARY\"*0.1");
}

TEST_F(SchemaDumperTest, NullsOmittedWhenDisabled) {
    DumpOptions options;
    options.includeNull = false;
    ON_CALL(schema, pkAndSequenceFor("employees")).WillByDefault(Return(std::nullopt));

    SchemaDumper dumper(schema, nullptr, options);
    auto table = dumper.dumpTable("employees");

    EXPECT_FALSE(table["columns"][0].contains("default"));
    EXPECT_FALSE(table["columns"][0].contains("comment"));
    EXPECT_FALSE(table.contains("sequence"));
}

// Table
TEST_F(SchemaDumperTest, TableStructure) {
    ON_CALL(schema, temporaryTable("employees")).WillByDefault(Return(false));

    SchemaDumper dumper(schema);
    auto table = dumper.dumpTable("employees");

    EXPECT_EQ(table["name"], "employees");
    EXPECT_EQ(table["temporary"], false);
    EXPECT_EQ(table["primary_keys"], json::array({"id"}));
    EXPECT_EQ(table["sequence"]["primary_key"], "id");
    EXPECT_EQ(table["sequence"]["sequence_name"], "employees_seq");
    EXPECT_FALSE(table.contains("key_strategy"));

    ASSERT_EQ(table["indexes"].size(), 1u);
    EXPECT_EQ(table["indexes"][0]["name"], "index_employees_on_name");
    EXPECT_EQ(table["indexes"][0]["columns"], json::array({"last_name", "first_name"}));
    EXPECT_TRUE(table["indexes"][0]["tablespace"].is_null());
}

TEST_F(SchemaDumperTest, TableWithoutKeyHasNullSequence) {
    ON_CALL(schema, primaryKeys("employees")).WillByDefault(Return(std::vector<std::string>{}));
    ON_CALL(schema, pkAndSequenceFor("employees")).WillByDefault(Return(std::nullopt));

    SchemaDumper dumper(schema);
    auto table = dumper.dumpTable("employees");

    EXPECT_TRUE(table["primary_keys"].empty());
    EXPECT_TRUE(table["sequence"].is_null());
}

TEST_F(SchemaDumperTest, KeyStrategyFromResolver) {
    AdapterConfig config;
    NiceMock<MockConnection> conn;
    OracleDialectTranslator translator(config, {19, 0});
    OraclePrimaryKeyResolver resolver(conn, schema, translator);

    ON_CALL(schema, hasPrimaryKey("employees")).WillByDefault(Return(true));
    ON_CALL(schema, hasPrimaryKeyTrigger("employees")).WillByDefault(Return(false));

    SchemaDumper dumper(schema, &resolver);
    auto table = dumper.dumpTable("employees");

    EXPECT_EQ(table["key_strategy"], "sequence");
}

// Schema
TEST_F(SchemaDumperTest, SchemaDocument) {
    SynonymDescriptor remote;
    remote.name = "remote_emp";
    remote.tableOwner = "HR";
    remote.tableName = "EMPLOYEES";
    remote.dbLink = "PROD";

    ON_CALL(schema, currentDatabase()).WillByDefault(Return("ORCLPDB1"));
    ON_CALL(schema, currentUser()).WillByDefault(Return("hr"));
    ON_CALL(schema, currentSchema()).WillByDefault(Return("hr"));
    ON_CALL(schema, tables()).WillByDefault(Return(std::vector<std::string>{"employees"}));
    ON_CALL(schema, views()).WillByDefault(Return(std::vector<std::string>{"emp_details_view"}));
    ON_CALL(schema, materializedViews()).WillByDefault(Return(std::vector<std::string>{}));
    ON_CALL(schema, synonyms()).WillByDefault(Return(std::vector<SynonymDescriptor>{remote}));

    SchemaDumper dumper(schema);
    auto doc = dumper.dumpSchema();

    EXPECT_EQ(doc["database"], "ORCLPDB1");
    EXPECT_EQ(doc["user"], "hr");
    EXPECT_EQ(doc["schema"], "hr");
    ASSERT_EQ(doc["tables"].size(), 1u);
    EXPECT_EQ(doc["tables"][0]["name"], "employees");
    EXPECT_EQ(doc["views"], json::array({"emp_details_view"}));
    EXPECT_TRUE(doc["materialized_views"].empty());
    ASSERT_EQ(doc["synonyms"].size(), 1u);
    EXPECT_EQ(doc["synonyms"][0]["table_owner"], "HR");
    EXPECT_EQ(doc["synonyms"][0]["db_link"], "PROD");
}

TEST_F(SchemaDumperTest, DroppedTableIsSkipped) {
    LogCapture logs;
    ON_CALL(schema, tables()).WillByDefault(Return(std::vector<std::string>{"ghost", "employees"}));
    ON_CALL(schema, columns("ghost"))
        .WillByDefault(Throw(StatementInvalid(4043, "ORA-04043: object ghost does not exist")));

    SchemaDumper dumper(schema);
    auto doc = dumper.dumpSchema();

    ASSERT_EQ(doc["tables"].size(), 1u);
    EXPECT_EQ(doc["tables"][0]["name"], "employees");
    EXPECT_TRUE(logs.contains("Skipping table ghost"));
}

TEST_F(SchemaDumperTest, ConnectionErrorsPropagate) {
    ON_CALL(schema, tables()).WillByDefault(Return(std::vector<std::string>{"employees"}));
    ON_CALL(schema, columns("employees"))
        .WillByDefault(Throw(ConnectionException(3113, "ORA-03113: end-of-file on communication channel")));

    SchemaDumper dumper(schema);
    EXPECT_THROW(dumper.dumpSchema(), ConnectionException);
}

// Output
TEST_F(SchemaDumperTest, CompactOutput) {
    DumpOptions options;
    options.pretty = false;

    SchemaDumper dumper(schema, nullptr, options);
    json doc = {{"name", "employees"}, {"temporary", false}};

    EXPECT_EQ(dumper.toString(doc), "{\"name\":\"employees\",\"temporary\":false}");
}

TEST_F(SchemaDumperTest, PrettyOutput) {
    SchemaDumper dumper(schema);
    json doc = {{"name", "employees"}};

    EXPECT_EQ(dumper.toString(doc), "{\n  \"name\": \"employees\"\n}");
}
