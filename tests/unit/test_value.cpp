// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Column Type Unit Tests                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "internal/core/value.hpp"

using namespace primdb;
using namespace primdb::core;
using primdb::sql::Literal;

namespace {

Literal integer(std::string text) { return Literal{Literal::Kind::INTEGER, std::move(text)}; }
Literal quoted(std::string text) { return Literal{Literal::Kind::STRING, std::move(text)}; }
Literal word(std::string text) { return Literal{Literal::Kind::WORD, std::move(text)}; }

} // namespace

// ==============================================================================
// Type tags
// ==============================================================================

TEST(ColumnTypeTest, ParseTags) {
    EXPECT_EQ(column_type_from_string("int"), ColumnType::Int);
    EXPECT_EQ(column_type_from_string("str"), ColumnType::Str);
    EXPECT_EQ(column_type_from_string("bool"), ColumnType::Bool);

    EXPECT_FALSE(column_type_from_string("float").has_value());
    EXPECT_FALSE(column_type_from_string("INT").has_value());
    EXPECT_FALSE(column_type_from_string("").has_value());
}

TEST(ColumnTypeTest, TagNames) {
    EXPECT_STREQ(column_type_to_string(ColumnType::Int), "int");
    EXPECT_STREQ(column_type_to_string(ColumnType::Str), "str");
    EXPECT_STREQ(column_type_to_string(ColumnType::Bool), "bool");
}

// ==============================================================================
// Coercion
// ==============================================================================

TEST(CoerceTest, Integers) {
    auto positive = coerce(ColumnType::Int, integer("25"));
    ASSERT_TRUE(positive.has_value());
    EXPECT_EQ(std::get<std::int64_t>(*positive), 25);

    auto negative = coerce(ColumnType::Int, integer("-7"));
    ASSERT_TRUE(negative.has_value());
    EXPECT_EQ(std::get<std::int64_t>(*negative), -7);
}

TEST(CoerceTest, IntegerOutOfRange) {
    auto result = coerce(ColumnType::Int, integer("99999999999999999999"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::TypeError);
}

TEST(CoerceTest, Strings) {
    auto result = coerce(ColumnType::Str, quoted("John Smith"));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<std::string>(*result), "John Smith");
}

TEST(CoerceTest, StringsMustBeUtf8) {
    auto accented = coerce(ColumnType::Str, quoted("Jos\xC3\xA9"));
    ASSERT_TRUE(accented.has_value());
    EXPECT_EQ(std::get<std::string>(*accented), "Jos\xC3\xA9");

    EXPECT_EQ(coerce(ColumnType::Str, quoted("Jos\xE9")).error().code(), ErrorCode::TypeError);
    EXPECT_EQ(coerce(ColumnType::Str, quoted("\xC0\xAF")).error().code(), ErrorCode::TypeError);
    EXPECT_EQ(coerce(ColumnType::Str, quoted("\xED\xA0\x80")).error().code(), ErrorCode::TypeError);
}

TEST(CoerceTest, Booleans) {
    EXPECT_EQ(std::get<bool>(*coerce(ColumnType::Bool, word("true"))), true);
    EXPECT_EQ(std::get<bool>(*coerce(ColumnType::Bool, word("false"))), false);
}

TEST(CoerceTest, NoCrossTypeCoercion) {
    EXPECT_EQ(coerce(ColumnType::Int, quoted("25")).error().code(), ErrorCode::TypeError);
    EXPECT_EQ(coerce(ColumnType::Str, integer("25")).error().code(), ErrorCode::TypeError);
    EXPECT_EQ(coerce(ColumnType::Str, word("John")).error().code(), ErrorCode::TypeError);
    EXPECT_EQ(coerce(ColumnType::Bool, integer("1")).error().code(), ErrorCode::TypeError);
    EXPECT_EQ(coerce(ColumnType::Bool, quoted("true")).error().code(), ErrorCode::TypeError);
    EXPECT_EQ(coerce(ColumnType::Bool, word("yes")).error().code(), ErrorCode::TypeError);
}

// ==============================================================================
// Helpers
// ==============================================================================

TEST(ValueTest, DisplayForm) {
    EXPECT_EQ(value_to_string(Value(std::int64_t{-3})), "-3");
    EXPECT_EQ(value_to_string(Value(std::string("abc"))), "abc");
    EXPECT_EQ(value_to_string(Value(true)), "true");
    EXPECT_EQ(value_to_string(Value(false)), "false");
}

TEST(ValueTest, TypeOf) {
    EXPECT_EQ(type_of(Value(std::int64_t{1})), ColumnType::Int);
    EXPECT_EQ(type_of(Value(std::string("x"))), ColumnType::Str);
    EXPECT_EQ(type_of(Value(false)), ColumnType::Bool);
}

TEST(ValueTest, Identifiers) {
    EXPECT_TRUE(is_valid_identifier("users"));
    EXPECT_TRUE(is_valid_identifier("_tmp1"));
    EXPECT_FALSE(is_valid_identifier(""));
    EXPECT_FALSE(is_valid_identifier("1users"));
    EXPECT_FALSE(is_valid_identifier("../etc"));
    EXPECT_FALSE(is_valid_identifier("a-b"));
}
