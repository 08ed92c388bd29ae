// tests/unit/codec/test_decoder.cpp - Unit tests for decoding
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <variant>

#include "typecraft/codec/decoder.hpp"
#include "typecraft/types/type.hpp"

using namespace typecraft;

// ============================================================================
// Helper Functions
// ============================================================================

static Value json_value(const char * text) { return Value::from_json(nlohmann::json::parse(text)); }

static DecodingOptions casting()
{
  DecodingOptions o;
  o.type_casting = TypeCastingStrategy::TryCasting;
  return o;
}

static DecodingOptions all_errors()
{
  DecodingOptions o;
  o.error_reporting = ErrorReportingStrategy::AllErrors;
  return o;
}

struct PersonFixture
{
  TypeContext ctx;
  const Type * person = ctx.object_type(
    {{"name", ctx.string_type()},
     {"age", ctx.integer_type()},
     {"nickname", ctx.optional_type(ctx.string_type())},
     {"manager", ctx.nullable_type(ctx.string_type())}});
};

// ============================================================================
// Scalars
// ============================================================================

TEST(DecoderTest, ExactScalars)
{
  TypeContext ctx;
  EXPECT_EQ(decode(ctx.string_type(), Value::make_string("a")).value(), Value::make_string("a"));
  EXPECT_EQ(decode(ctx.number_type(), Value::make_number(1.5)).value(), Value::make_number(1.5));
  EXPECT_EQ(decode(ctx.boolean_type(), Value::make_bool(false)).value(), Value::make_bool(false));

  auto mismatch = decode(ctx.number_type(), Value::make_string("12"));
  ASSERT_TRUE(mismatch.is_error());
  ASSERT_EQ(mismatch.error().size(), 1u);
  EXPECT_EQ(mismatch.error()[0].expected, "number");
  EXPECT_EQ(mismatch.error()[0].got, Value::make_string("12"));
  EXPECT_TRUE(mismatch.error()[0].path.is_root());
}

TEST(DecoderTest, IntegerShapeIsCheckedByValidation)
{
  TypeContext ctx;
  // 1.5 is a number: the integer constraint is semantic
  EXPECT_TRUE(decode(ctx.integer_type(), Value::make_number(1.5)).is_ok());
  auto result = decode(ctx.integer_type(), Value::make_bool(true));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error()[0].expected, "integer");
}

TEST(DecoderTest, CastingScalars)
{
  TypeContext ctx;
  EXPECT_EQ(
    decode(ctx.number_type(), Value::make_string("12"), casting()).value(), Value::make_number(12));
  EXPECT_EQ(
    decode(ctx.string_type(), Value::make_number(12), casting()).value(), Value::make_string("12"));
  EXPECT_EQ(
    decode(ctx.string_type(), Value::make_bool(true), casting()).value(),
    Value::make_string("true"));
  EXPECT_EQ(
    decode(ctx.boolean_type(), Value::make_string("false"), casting()).value(),
    Value::make_bool(false));
  EXPECT_EQ(
    decode(ctx.boolean_type(), Value::make_number(1), casting()).value(), Value::make_bool(true));
  EXPECT_TRUE(decode(ctx.number_type(), Value::make_string("12abc"), casting()).is_error());
  EXPECT_TRUE(decode(ctx.boolean_type(), Value::make_string("yes"), casting()).is_error());
}

TEST(DecoderTest, LiteralAndEnum)
{
  TypeContext ctx;
  const Type * lit = ctx.literal_type(Value::make_string("on"));
  EXPECT_TRUE(decode(lit, Value::make_string("on")).is_ok());
  auto bad_literal = decode(lit, Value::make_string("off"));
  ASSERT_TRUE(bad_literal.is_error());
  EXPECT_EQ(bad_literal.error()[0].expected, "literal (\"on\")");

  const Type * null_lit = ctx.literal_type(Value::make_null());
  EXPECT_TRUE(decode(null_lit, Value::make_string("null")).is_error());
  EXPECT_EQ(
    decode(null_lit, Value::make_string("null"), casting()).value(), Value::make_null());

  const Type * color = ctx.enum_type({"Red", "Green"});
  EXPECT_TRUE(decode(color, Value::make_string("Green")).is_ok());
  auto bad_enum = decode(color, Value::make_string("Blue"));
  ASSERT_TRUE(bad_enum.is_error());
  EXPECT_EQ(bad_enum.error()[0].expected, "enum (\"Red\" | \"Green\")");
}

// ============================================================================
// Records
// ============================================================================

TEST(DecoderTest, RecordWithOptionalAndNullable)
{
  PersonFixture f;
  auto result = decode(f.person, json_value(R"({"name": "Ann", "age": 30, "manager": null})"));
  ASSERT_TRUE(result.is_ok());
  EXPECT_FALSE(result.value().has("nickname"));
  EXPECT_TRUE(result.value().get("manager").is_null());
}

TEST(DecoderTest, MissingRequiredField)
{
  PersonFixture f;
  auto result = decode(f.person, json_value(R"({"name": "Ann", "manager": null})"));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error()[0].path.to_string(), "$.age");
  EXPECT_EQ(result.error()[0].expected, "integer");
  EXPECT_TRUE(result.error()[0].got.is_undefined());
}

TEST(DecoderTest, OptionalAcceptsNullAsAbsent)
{
  PersonFixture f;
  auto result =
    decode(f.person, json_value(R"({"name": "Ann", "age": 1, "nickname": null, "manager": null})"));
  ASSERT_TRUE(result.is_ok());
  EXPECT_FALSE(result.value().has("nickname"));
}

TEST(DecoderTest, WrapperAlternativesInExpectation)
{
  PersonFixture f;
  auto result =
    decode(f.person, json_value(R"({"name": "Ann", "age": 1, "nickname": 3, "manager": 4})"),
           all_errors());
  ASSERT_TRUE(result.is_error());
  ASSERT_EQ(result.error().size(), 2u);
  EXPECT_EQ(result.error()[0].path.to_string(), "$.nickname");
  EXPECT_EQ(result.error()[0].expected, "string or undefined");
  EXPECT_EQ(result.error()[1].path.to_string(), "$.manager");
  EXPECT_EQ(result.error()[1].expected, "string or null");
}

TEST(DecoderTest, NullableMissingOnlyUnderCasting)
{
  PersonFixture f;
  const Value raw = json_value(R"({"name": "Ann", "age": 1})");
  EXPECT_TRUE(decode(f.person, raw).is_error());

  auto cast = decode(f.person, raw, casting());
  ASSERT_TRUE(cast.is_ok());
  EXPECT_TRUE(cast.value().get("manager").is_null());
}

TEST(DecoderTest, ErrorReportingStrategies)
{
  TypeContext ctx;
  const Type * pair = ctx.object_type({{"a", ctx.number_type()}, {"b", ctx.number_type()}});
  const Value raw = json_value(R"({"a": "x", "b": "y"})");

  EXPECT_EQ(decode(pair, raw).error().size(), 1u);
  auto all = decode(pair, raw, all_errors());
  ASSERT_EQ(all.error().size(), 2u);
  EXPECT_EQ(all.error()[1].path.to_string(), "$.b");
}

TEST(DecoderTest, AdditionalFields)
{
  TypeContext ctx;
  const Type * point = ctx.object_type({{"x", ctx.number_type()}});
  const Value raw = json_value(R"({"x": 1, "extra": true})");

  auto strict = decode(point, raw);
  ASSERT_TRUE(strict.is_error());
  EXPECT_EQ(strict.error()[0].path.to_string(), "$.extra");
  EXPECT_EQ(strict.error()[0].expected, "undefined");

  DecodingOptions lenient;
  lenient.field_strictness = FieldStrictness::AllowAdditionalFields;
  auto trimmed = decode(point, raw, lenient);
  ASSERT_TRUE(trimmed.is_ok());
  EXPECT_EQ(trimmed.value(), json_value(R"({"x": 1})"));
}

TEST(DecoderTest, NullRecordUnderCasting)
{
  TypeContext ctx;
  const Type * opts = ctx.object_type({{"verbose", ctx.optional_type(ctx.boolean_type())}});
  EXPECT_TRUE(decode(opts, Value::make_null()).is_error());
  EXPECT_EQ(decode(opts, Value::make_null(), casting()).value(), Value::make_object());
}

// ============================================================================
// Arrays
// ============================================================================

TEST(DecoderTest, ArrayItemPaths)
{
  TypeContext ctx;
  const Type * list = ctx.object_type({{"tags", ctx.array_type(ctx.string_type())}});
  auto result = decode(list, json_value(R"({"tags": ["a", 2, "c", false]})"), all_errors());
  ASSERT_TRUE(result.is_error());
  ASSERT_EQ(result.error().size(), 2u);
  EXPECT_EQ(result.error()[0].path.to_string(), "$.tags[1]");
  EXPECT_EQ(result.error()[1].path.to_string(), "$.tags[3]");
}

TEST(DecoderTest, IndexedObjectAsArrayUnderCasting)
{
  TypeContext ctx;
  const Type * list = ctx.array_type(ctx.number_type());
  const Value raw = json_value(R"({"1": 20, "0": 10})");

  EXPECT_TRUE(decode(list, raw).is_error());
  EXPECT_EQ(decode(list, raw, casting()).value(), json_value("[10, 20]"));
  EXPECT_TRUE(decode(list, json_value(R"({"0": 1, "2": 3})"), casting()).is_error());
}

// ============================================================================
// Recursive Types
// ============================================================================

TEST(DecoderTest, RecursiveList)
{
  TypeContext ctx;
  const Type * node = nullptr;
  const Type * lazy = ctx.lazy_type([&]() { return node; });
  node = ctx.object_type({{"value", ctx.number_type()}, {"next", ctx.optional_type(lazy)}});

  EXPECT_TRUE(decode(lazy, json_value(R"({"value": 1, "next": {"value": 2}})")).is_ok());
  auto deep = decode(lazy, json_value(R"({"value": 1, "next": {"value": 2, "next": {"value": "x"}}})"));
  ASSERT_TRUE(deep.is_error());
  EXPECT_EQ(deep.error()[0].path.to_string(), "$.next.next.value");
}

// ============================================================================
// Decode and Validate
// ============================================================================

TEST(DecoderTest, DecodeAndValidateReportsEachStage)
{
  TypeContext ctx;
  NumberOptions small;
  small.maximum = 10;
  const Type * n = ctx.number_type(small);

  EXPECT_EQ(decode_and_validate(n, Value::make_number(3)).value(), Value::make_number(3));

  auto shape = decode_and_validate(n, Value::make_string("3"));
  ASSERT_TRUE(shape.is_error());
  EXPECT_TRUE(std::holds_alternative<DecodingErrors>(shape.error()));

  auto range = decode_and_validate(n, nlohmann::json(30));
  ASSERT_TRUE(range.is_error());
  EXPECT_TRUE(std::holds_alternative<ValidationErrors>(range.error()));
}
