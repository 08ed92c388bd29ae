// tests/unit/basic/test_value.cpp - Unit tests for Value
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "typecraft/basic/value.hpp"

using namespace typecraft;

// ============================================================================
// Construction and Queries
// ============================================================================

TEST(ValueTest, DefaultIsUndefined)
{
  Value v;
  EXPECT_TRUE(v.is_undefined());
  EXPECT_EQ(v.kind(), ValueKind::Undefined);
  EXPECT_EQ(v.to_string(), "undefined");
}

TEST(ValueTest, IntegralNumbers)
{
  EXPECT_TRUE(Value::make_number(3.0).is_integral());
  EXPECT_FALSE(Value::make_number(3.5).is_integral());
  EXPECT_FALSE(Value::make_string("3").is_integral());
}

TEST(ValueTest, ObjectSetReplacesExistingKey)
{
  Value obj = Value::make_object();
  obj.set("a", Value::make_number(1));
  obj.set("b", Value::make_number(2));
  obj.set("a", Value::make_number(3));

  EXPECT_EQ(obj.size(), 2u);
  EXPECT_EQ(obj.get("a"), Value::make_number(3));
  EXPECT_EQ(obj.fields()[0].first, "a");
}

TEST(ValueTest, UndefinedFieldsAreMissing)
{
  Value obj = Value::make_object({{"a", Value{}}, {"b", Value::make_null()}});

  EXPECT_FALSE(obj.has("a"));
  EXPECT_EQ(obj.find("a"), nullptr);
  EXPECT_TRUE(obj.has("b"));
  EXPECT_EQ(obj.size(), 1u);
  EXPECT_EQ(obj, Value::make_object({{"b", Value::make_null()}}));
}

TEST(ValueTest, EraseRemovesField)
{
  Value obj = Value::make_object({{"a", Value::make_bool(true)}});
  obj.erase("a");
  obj.erase("missing");
  EXPECT_EQ(obj.size(), 0u);
}

// ============================================================================
// Equality
// ============================================================================

TEST(ValueTest, ObjectEqualityIgnoresFieldOrder)
{
  Value lhs = Value::make_object({{"x", Value::make_number(1)}, {"y", Value::make_string("s")}});
  Value rhs = Value::make_object({{"y", Value::make_string("s")}, {"x", Value::make_number(1)}});
  EXPECT_EQ(lhs, rhs);
}

TEST(ValueTest, ArrayEqualityIsOrdered)
{
  Value lhs = Value::make_array({Value::make_number(1), Value::make_number(2)});
  Value rhs = Value::make_array({Value::make_number(2), Value::make_number(1)});
  EXPECT_NE(lhs, rhs);
}

TEST(ValueTest, NullIsNotUndefined) { EXPECT_NE(Value::make_null(), Value{}); }

// ============================================================================
// JSON Conversion
// ============================================================================

TEST(ValueTest, FromJson)
{
  const auto json = nlohmann::json::parse(R"({"n": 1, "f": 1.5, "s": "x", "a": [true, null]})");
  Value v = Value::from_json(json);

  ASSERT_TRUE(v.is_object());
  EXPECT_EQ(v.get("n"), Value::make_number(1));
  EXPECT_EQ(v.get("f"), Value::make_number(1.5));
  EXPECT_EQ(v.get("s"), Value::make_string("x"));
  ASSERT_TRUE(v.get("a").is_array());
  EXPECT_TRUE(v.get("a").as_array()[1].is_null());
}

TEST(ValueTest, ToJsonKeepsIntegersIntegral)
{
  EXPECT_TRUE(Value::make_number(42).to_json().is_number_integer());
  EXPECT_TRUE(Value::make_number(0.25).to_json().is_number_float());
}

TEST(ValueTest, ToJsonSkipsUndefinedFields)
{
  Value obj = Value::make_object({{"a", Value{}}, {"b", Value::make_number(1)}});
  EXPECT_EQ(obj.to_json(), nlohmann::json::parse(R"({"b": 1})"));
  EXPECT_EQ(obj.to_string(), R"({"b":1})");
}
