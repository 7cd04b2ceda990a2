#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "OracleTypeRegistry.hpp"
#include "SchemaManager.hpp"
#include <limits>

using namespace oraenhanced;

class TypeRegistryTest : public ::testing::Test {
protected:
    AdapterConfig config;

    LogicalType resolve(const std::string& nativeType) {
        return OracleTypeRegistry(config).resolve(nativeType);
    }
};

// Boolean emulation
TEST_F(TypeRegistryTest, NumberOneIsBooleanByDefault) {
    EXPECT_EQ(resolve("NUMBER(1)").kind, TypeKind::Boolean);
    EXPECT_EQ(resolve("number(1)").kind, TypeKind::Boolean);
}

TEST_F(TypeRegistryTest, NumberOneIsIntegerWithoutEmulation) {
    config.emulate_booleans = false;

    LogicalType type = resolve("NUMBER(1)");
    EXPECT_EQ(type.kind, TypeKind::Integer);
    EXPECT_EQ(type.precision, 1);
    EXPECT_EQ(type.limit, 1);
}

TEST_F(TypeRegistryTest, BooleansFromStrings) {
    config.emulate_booleans_from_strings = true;

    EXPECT_EQ(resolve("VARCHAR2(1)").kind, TypeKind::Boolean);
    // NUMBER(1) falls back to the numeric mapping
    EXPECT_EQ(resolve("NUMBER(1)").kind, TypeKind::Integer);
}

TEST_F(TypeRegistryTest, VarcharOneIsStringWithoutStringEmulation) {
    LogicalType type = resolve("VARCHAR2(1)");
    EXPECT_EQ(type.kind, TypeKind::String);
    EXPECT_EQ(type.limit, 1);
}

// Numbers
TEST_F(TypeRegistryTest, NumberWithZeroScaleIsInteger) {
    LogicalType type = resolve("NUMBER(10)");
    EXPECT_EQ(type.kind, TypeKind::Integer);
    EXPECT_EQ(type.precision, 10);
    EXPECT_EQ(type.limit, 10);
}

TEST_F(TypeRegistryTest, NumberWithScaleIsDecimal) {
    LogicalType type = resolve("NUMBER(10,2)");
    EXPECT_EQ(type.kind, TypeKind::Decimal);
    EXPECT_EQ(type.precision, 10);
    EXPECT_EQ(type.scale, 2);
}

TEST_F(TypeRegistryTest, BareNumberIsDecimal) {
    LogicalType type = resolve("NUMBER");
    EXPECT_EQ(type.kind, TypeKind::Decimal);
    EXPECT_FALSE(type.precision.has_value());
    EXPECT_FALSE(type.scale.has_value());
}

TEST_F(TypeRegistryTest, GenericNumericFamilies) {
    EXPECT_EQ(resolve("FLOAT(126)").kind, TypeKind::Float);
    EXPECT_EQ(resolve("BINARY_DOUBLE").kind, TypeKind::Float);
    EXPECT_EQ(resolve("INTEGER").kind, TypeKind::Integer);
    EXPECT_EQ(resolve("DECIMAL(8,3)").kind, TypeKind::Decimal);
    EXPECT_EQ(resolve("DECIMAL(8,3)").scale, 3);
}

// Character types
TEST_F(TypeRegistryTest, CharacterFamilies) {
    EXPECT_EQ(resolve("VARCHAR2(255)").kind, TypeKind::String);
    EXPECT_EQ(resolve("VARCHAR2(255)").limit, 255);
    EXPECT_EQ(resolve("CHAR(3)").kind, TypeKind::String);
    EXPECT_EQ(resolve("NVARCHAR2(50)").kind, TypeKind::NationalString);
    EXPECT_EQ(resolve("NVARCHAR2(50)").limit, 50);
    EXPECT_EQ(resolve("NCHAR(2)").kind, TypeKind::NationalString);
    EXPECT_EQ(resolve("CLOB").kind, TypeKind::Text);
    EXPECT_EQ(resolve("NCLOB").kind, TypeKind::NationalText);
}

// Temporal types
TEST_F(TypeRegistryTest, TemporalFamilies) {
    EXPECT_EQ(resolve("DATE").kind, TypeKind::Date);

    LogicalType ts = resolve("TIMESTAMP(6)");
    EXPECT_EQ(ts.kind, TypeKind::Timestamp);
    EXPECT_EQ(ts.precision, 6);

    EXPECT_EQ(resolve("TIMESTAMP(6) WITH TIME ZONE").kind, TypeKind::TimestampTz);
    EXPECT_EQ(resolve("TIMESTAMP(6) WITH LOCAL TIME ZONE").kind, TypeKind::TimestampLtz);
}

// Binary and other types
TEST_F(TypeRegistryTest, BinaryFamilies) {
    EXPECT_EQ(resolve("RAW(16)").kind, TypeKind::Raw);
    EXPECT_EQ(resolve("RAW(16)").limit, 16);
    EXPECT_EQ(resolve("BLOB").kind, TypeKind::Binary);
    EXPECT_TRUE(resolve("BLOB").isBinary());
}

TEST_F(TypeRegistryTest, JsonAndUnknown) {
    EXPECT_EQ(resolve("JSON").kind, TypeKind::Json);
    EXPECT_EQ(resolve("SDO_GEOMETRY").kind, TypeKind::Unknown);
    EXPECT_EQ(resolve("XMLTYPE").kind, TypeKind::Unknown);
}

// Modifier extraction
TEST_F(TypeRegistryTest, ExtractModifiers) {
    EXPECT_EQ(OracleTypeRegistry::extractPrecision("NUMBER(10,2)"), 10);
    EXPECT_EQ(OracleTypeRegistry::extractScale("NUMBER(10,2)"), 2);
    EXPECT_EQ(OracleTypeRegistry::extractScale("NUMBER(10)"), 0);
    EXPECT_FALSE(OracleTypeRegistry::extractScale("NUMBER").has_value());
    EXPECT_EQ(OracleTypeRegistry::extractLimit("VARCHAR2(40)"), 40);
    EXPECT_EQ(OracleTypeRegistry::extractLimit("bigint"), 19);
    EXPECT_FALSE(OracleTypeRegistry::extractLimit("DATE").has_value());
}

TEST_F(TypeRegistryTest, OversizedModifiersAreClamped) {
    const int max = std::numeric_limits<int>::max();

    EXPECT_EQ(OracleTypeRegistry::extractLimit("RAW(99999999999)"), max);
    EXPECT_EQ(OracleTypeRegistry::extractPrecision("NUMBER(99999999999)"), max);
    EXPECT_EQ(OracleTypeRegistry::extractScale("NUMBER(10,99999999999)"), max);
    EXPECT_EQ(OracleTypeRegistry::extractLimit("RAW(2147483647)"), max);

    EXPECT_NO_THROW(resolve("NUMBER(99999999999,2)"));
}

// Reverse mapping
TEST_F(TypeRegistryTest, NativeDatabaseTypes) {
    OracleTypeRegistry registry(config);

    EXPECT_EQ(registry.nativeDatabaseType(TypeKind::Integer), "NUMBER(38)");
    EXPECT_EQ(registry.nativeDatabaseType(TypeKind::String), "VARCHAR2(255)");
    EXPECT_EQ(registry.nativeDatabaseType(TypeKind::Text), "CLOB");
    EXPECT_EQ(registry.nativeDatabaseType(TypeKind::Binary), "BLOB");
    EXPECT_EQ(registry.nativeDatabaseType(TypeKind::Boolean), "NUMBER(1)");
    EXPECT_EQ(registry.nativeDatabaseType(TypeKind::TimestampTz), "TIMESTAMP WITH TIME ZONE");
    EXPECT_THROW(registry.nativeDatabaseType(TypeKind::Unknown), std::invalid_argument);
}

TEST_F(TypeRegistryTest, NativeBooleanFromStrings) {
    config.emulate_booleans_from_strings = true;
    OracleTypeRegistry registry(config);

    EXPECT_EQ(registry.nativeDatabaseType(TypeKind::Boolean), "VARCHAR2(1)");
}

// Full SQL type of catalog columns
TEST_F(TypeRegistryTest, ColumnFullSqlType) {
    ColumnDescriptor number;
    number.sqlType = "NUMBER";
    EXPECT_EQ(number.fullSqlType(), "NUMBER");

    number.limit = 10;
    number.scale = 2;
    EXPECT_EQ(number.fullSqlType(), "NUMBER(10,2)");

    number.scale = 0;
    EXPECT_EQ(number.fullSqlType(), "NUMBER(10)");

    ColumnDescriptor integer;
    integer.sqlType = "NUMBER";
    integer.scale = 0;
    EXPECT_EQ(integer.fullSqlType(), "NUMBER(38)");

    ColumnDescriptor varchar;
    varchar.sqlType = "VARCHAR2";
    varchar.limit = 40;
    EXPECT_EQ(varchar.fullSqlType(), "VARCHAR2(40)");

    ColumnDescriptor timestamp;
    timestamp.sqlType = "TIMESTAMP(6)";
    EXPECT_EQ(timestamp.fullSqlType(), "TIMESTAMP(6)");
}

TEST_F(TypeRegistryTest, TypeKindNames) {
    EXPECT_EQ(typeKindToString(TypeKind::Integer), "integer");
    EXPECT_EQ(typeKindToString(TypeKind::NationalString), "national_string");
    EXPECT_EQ(typeKindToString(TypeKind::TimestampLtz), "timestampltz");
}
