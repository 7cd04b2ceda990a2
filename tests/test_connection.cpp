#include "MockConnection.hpp"
#include "ErrorHandler.hpp"

using namespace oraenhanced;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class ConnectionTest : public ::testing::Test {
protected:
    NiceMock<MockConnection> conn;
};

TEST_F(ConnectionTest, RowKeepsSelectListOrder) {
    Row row{{"owner", "HR"}, {"table_name", "EMPLOYEES"}, {"db_link", std::nullopt}};

    ASSERT_EQ(row.size(), 3u);
    EXPECT_EQ(row.fields()[0].first, "owner");
    EXPECT_EQ(row.fields()[2].first, "db_link");
    EXPECT_EQ(row.at(1), SqlValue("EMPLOYEES"));
}

TEST_F(ConnectionTest, RowAccessors) {
    Row row{{"owner", "HR"}, {"db_link", std::nullopt}};

    EXPECT_EQ(row["owner"], SqlValue("HR"));
    EXPECT_FALSE(row["db_link"].has_value());
    EXPECT_FALSE(row["missing"].has_value());
    EXPECT_EQ(row.str("db_link"), "");
    EXPECT_TRUE(row.has("db_link"));
    EXPECT_FALSE(row.has("missing"));
}

TEST_F(ConnectionTest, SelectOneReturnsFirstRow) {
    EXPECT_CALL(conn, selectAll("SELECT 1 FROM dual", "SQL", _))
        .WillOnce(Return(Rows{Row{{"x", "1"}}, Row{{"x", "2"}}}));

    auto row = conn.selectOne("SELECT 1 FROM dual");

    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->str("x"), "1");
}

TEST_F(ConnectionTest, SelectOneWithoutRows) {
    EXPECT_CALL(conn, selectAll(_, _, _)).WillOnce(Return(Rows{}));

    EXPECT_FALSE(conn.selectOne("SELECT 1 FROM dual WHERE 1 = 0").has_value());
}

TEST_F(ConnectionTest, SelectValueTakesFirstColumn) {
    EXPECT_CALL(conn, selectAll(_, "Sequence", _))
        .WillOnce(Return(Rows{Row{{"nextval", "10000"}, {"other", "x"}}}));

    EXPECT_EQ(conn.selectValue("SELECT seq.NEXTVAL FROM dual", "Sequence"), SqlValue("10000"));
}

TEST_F(ConnectionTest, SelectValuesSkipsNulls) {
    EXPECT_CALL(conn, selectAll(_, _, _))
        .WillOnce(Return(Rows{Row{{"name", "a"}}, Row{{"name", std::nullopt}}, Row{{"name", "b"}}}));

    EXPECT_EQ(conn.selectValues("SELECT name FROM t"), (std::vector<std::string>{"a", "b"}));
}

TEST_F(ConnectionTest, DatabaseVersionIsSplitOnDots) {
    EXPECT_CALL(conn, selectAll(HasSubstr("product_component_version"), _, _))
        .WillOnce(Return(column("version", {"19.0.0.0.0"})));

    EXPECT_EQ(conn.databaseVersion(), (std::vector<int>{19, 0, 0, 0, 0}));
}

TEST_F(ConnectionTest, DatabaseVersionFailsWithoutRow) {
    EXPECT_CALL(conn, selectAll(_, _, _)).WillOnce(Return(Rows{}));

    EXPECT_THROW(conn.databaseVersion(), DatabaseError);
}

TEST_F(ConnectionTest, DatabaseVersionRejectsGarbage) {
    EXPECT_CALL(conn, selectAll(_, _, _)).WillOnce(Return(column("version", {"19.x"})));

    EXPECT_THROW(conn.databaseVersion(), DatabaseError);
}

TEST_F(ConnectionTest, ActiveReflectsPing) {
    EXPECT_CALL(conn, ping())
        .WillOnce(Return())
        .WillOnce(Throw(ConnectionException(3113, "end-of-file on communication channel")));

    EXPECT_TRUE(conn.active());
    EXPECT_FALSE(conn.active());
}

TEST_F(ConnectionTest, ActiveDoesNotSwallowOtherErrors) {
    EXPECT_CALL(conn, ping()).WillOnce(Throw(DatabaseError(600, "internal error")));

    EXPECT_THROW(conn.active(), DatabaseError);
}

TEST_F(ConnectionTest, ReconnectLogsFailure) {
    LogCapture logs;
    EXPECT_CALL(conn, reset()).WillOnce(Throw(ConnectionException(12541, "TNS:no listener")));

    EXPECT_NO_THROW(conn.reconnect());

    EXPECT_TRUE(logs.contains("OracleEnhanced automatic reconnection failed: TNS:no listener"));
}
