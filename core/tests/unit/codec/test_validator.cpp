// tests/unit/codec/test_validator.cpp - Unit tests for semantic validation
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "typecraft/codec/validator.hpp"
#include "typecraft/types/type.hpp"

using namespace typecraft;

// ============================================================================
// Helper Functions
// ============================================================================

static Value json_value(const char * text) { return Value::from_json(nlohmann::json::parse(text)); }

static ValidationOptions all_errors()
{
  ValidationOptions o;
  o.error_reporting = ErrorReportingStrategy::AllErrors;
  return o;
}

// ============================================================================
// Strings
// ============================================================================

TEST(ValidatorTest, StringLength)
{
  TypeContext ctx;
  StringOptions o;
  o.min_length = 2;
  o.max_length = 3;
  const Type * s = ctx.string_type(o);

  EXPECT_TRUE(validate(s, Value::make_string("abc")).is_ok());

  auto too_long = validate(s, Value::make_string("abcd"));
  ASSERT_TRUE(too_long.is_error());
  EXPECT_EQ(too_long.error()[0].assertion, "string longer than max length (3)");
  EXPECT_EQ(too_long.error()[0].got, Value::make_string("abcd"));

  auto too_short = validate(s, Value::make_string("a"));
  ASSERT_TRUE(too_short.is_error());
  EXPECT_EQ(too_short.error()[0].assertion, "string shorter than min length (2)");
}

TEST(ValidatorTest, StringLengthCountsCodePoints)
{
  TypeContext ctx;
  StringOptions o;
  o.max_length = 5;
  const Type * s = ctx.string_type(o);

  EXPECT_TRUE(validate(s, Value::make_string("h\xC3\xA9llo")).is_ok());
  EXPECT_TRUE(validate(s, Value::make_string("h\xC3\xA9llo!")).is_error());
}

TEST(ValidatorTest, StringRegexIsAFullMatch)
{
  TypeContext ctx;
  StringOptions o;
  o.regex = "[a-z]+";
  const Type * s = ctx.string_type(o);

  EXPECT_TRUE(validate(s, Value::make_string("abc")).is_ok());
  auto result = validate(s, Value::make_string("abc1"));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error()[0].assertion, "string regex mismatch ([a-z]+)");
}

// ============================================================================
// Numbers
// ============================================================================

TEST(ValidatorTest, NumberBounds)
{
  TypeContext ctx;
  NumberOptions inclusive;
  inclusive.minimum = 0;
  inclusive.maximum = 10;
  const Type * n = ctx.number_type(inclusive);

  EXPECT_TRUE(validate(n, Value::make_number(0)).is_ok());
  EXPECT_TRUE(validate(n, Value::make_number(10)).is_ok());
  EXPECT_EQ(
    validate(n, Value::make_number(11)).error()[0].assertion,
    "number must be less than or equal to 10");
  EXPECT_EQ(
    validate(n, Value::make_number(-1)).error()[0].assertion,
    "number must be greater than or equal to 0");

  NumberOptions exclusive;
  exclusive.exclusive_minimum = 0;
  exclusive.exclusive_maximum = 1;
  const Type * open = ctx.number_type(exclusive);
  EXPECT_TRUE(validate(open, Value::make_number(0.5)).is_ok());
  EXPECT_EQ(validate(open, Value::make_number(1)).error()[0].assertion, "number must be less than 1");
  EXPECT_EQ(
    validate(open, Value::make_number(0)).error()[0].assertion, "number must be greater than 0");
}

TEST(ValidatorTest, IntegerRejectsFractions)
{
  TypeContext ctx;
  EXPECT_TRUE(validate(ctx.integer_type(), Value::make_number(4)).is_ok());
  EXPECT_EQ(
    validate(ctx.integer_type(), Value::make_number(4.5)).error()[0].assertion,
    "number must be an integer");
}

// ============================================================================
// Arrays and Records
// ============================================================================

TEST(ValidatorTest, ArrayItemCountAndItemPaths)
{
  TypeContext ctx;
  NumberOptions positive;
  positive.exclusive_minimum = 0;
  ArrayOptions bounds;
  bounds.min_items = 1;
  bounds.max_items = 3;
  const Type * list = ctx.array_type(ctx.number_type(positive), bounds);

  EXPECT_EQ(
    validate(list, json_value("[]")).error()[0].assertion, "array must have at least 1 items");
  EXPECT_EQ(
    validate(list, json_value("[1, 2, 3, 4]")).error()[0].assertion,
    "array must have at most 3 items");

  auto items = validate(list, json_value("[1, -1, 0]"), all_errors());
  ASSERT_TRUE(items.is_error());
  ASSERT_EQ(items.error().size(), 2u);
  EXPECT_EQ(items.error()[0].path.to_string(), "$[1]");
  EXPECT_EQ(items.error()[1].path.to_string(), "$[2]");
}

TEST(ValidatorTest, PartialRecordsValidatePresentFields)
{
  TypeContext ctx;
  StringOptions short_text;
  short_text.max_length = 3;
  const Type * user =
    ctx.object_type({{"id", ctx.string_type(short_text)}, {"bio", ctx.string_type(short_text)}});

  EXPECT_TRUE(validate(user, json_value(R"({"id": "abc"})")).is_ok());

  auto result = validate(user, json_value(R"({"id": "abcd", "bio": "long"})"), all_errors());
  ASSERT_TRUE(result.is_error());
  ASSERT_EQ(result.error().size(), 2u);
  EXPECT_EQ(result.error()[0].path.to_string(), "$.id");
  EXPECT_EQ(result.error()[1].path.to_string(), "$.bio");

  EXPECT_EQ(validate(user, json_value(R"({"id": "abcd", "bio": "long"})")).error().size(), 1u);
}

TEST(ValidatorTest, UnionErrorsCarryVariantPath)
{
  TypeContext ctx;
  NumberOptions positive;
  positive.exclusive_minimum = 0;
  const Type * circle = ctx.object_type({{"radius", ctx.number_type(positive)}});
  const Type * shape = ctx.union_type({{"circle", circle}, {"label", ctx.string_type()}});

  auto result = validate(shape, json_value(R"({"radius": -2})"));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error()[0].path.to_string(), "${circle}.radius");
}

TEST(ValidatorTest, OptionalAndNullableSkipEmptyValues)
{
  TypeContext ctx;
  NumberOptions positive;
  positive.exclusive_minimum = 0;
  const Type * n = ctx.number_type(positive);

  EXPECT_TRUE(validate(ctx.optional_type(n), Value{}).is_ok());
  EXPECT_TRUE(validate(ctx.nullable_type(n), Value::make_null()).is_ok());
  EXPECT_TRUE(validate(ctx.nullable_type(n), Value::make_number(-1)).is_error());
}
