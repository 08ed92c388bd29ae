// tests/unit/arbitrary/test_generator.cpp - Unit tests for arbitrary value generation
//
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "typecraft/arbitrary/generator.hpp"
#include "typecraft/codec/decoder.hpp"
#include "typecraft/codec/encoder.hpp"
#include "typecraft/codec/validator.hpp"
#include "typecraft/types/custom_types.hpp"
#include "typecraft/types/type.hpp"

using namespace typecraft;

// ============================================================================
// Helper Functions
// ============================================================================

/// Entity graph with a self relation and a union
struct CatalogFixture
{
  TypeContext ctx;
  const Type * user = nullptr;
  const Type * lazy_user = ctx.lazy_type([this]() { return user; });

  CatalogFixture()
  {
    StringOptions name_text;
    name_text.min_length = 1;
    name_text.max_length = 12;
    NumberOptions age;
    age.minimum = 0;
    age.maximum = 130;
    ArrayOptions few;
    few.max_items = 4;

    const Type * contact = ctx.union_type(
      {{"email", email_type(ctx)},
       {"phone", ctx.string_type(StringOptions{std::nullopt, std::nullopt, "\\+\\d{6,10}"})}});

    TypeOptions named;
    named.name = "User";
    user = ctx.entity_type(
      {{"id", uuid_type(ctx)},
       {"name", ctx.string_type(name_text)},
       {"age", ctx.integer_type(age)},
       {"role", ctx.enum_type({"admin", "member"})},
       {"contact", ctx.nullable_type(contact)},
       {"tags", ctx.array_type(ctx.string_type(), few)},
       {"bestFriend", ctx.optional_type(lazy_user)},
       {"joined", datetime_type(ctx)}},
      named);
  }
};

/// Number of bestFriend links below a generated user
static int friend_chain(const Value & user)
{
  int links = 0;
  const Value * current = &user;
  while (const Value * next = current->find("bestFriend")) {
    ++links;
    current = next;
  }
  return links;
}

// ============================================================================
// Determinism
// ============================================================================

TEST(GeneratorTest, SameSeedSameSequence)
{
  CatalogFixture f;
  auto first = arbitrary(f.lazy_user, 1234);
  auto second = arbitrary(f.lazy_user, 1234);
  EXPECT_EQ(first.take(20), second.take(20));
}

TEST(GeneratorTest, ResetRestartsSequence)
{
  CatalogFixture f;
  auto generator = arbitrary(f.lazy_user, 99);
  const std::vector<Value> before = generator.take(5);
  generator.reset();
  EXPECT_EQ(generator.take(5), before);
}

TEST(GeneratorTest, DifferentSeedsDiffer)
{
  TypeContext ctx;
  auto first = arbitrary(ctx.number_type(), 1);
  auto second = arbitrary(ctx.number_type(), 2);
  EXPECT_NE(first.take(10), second.take(10));
}

// ============================================================================
// Constraints
// ============================================================================

TEST(GeneratorTest, RespectsScalarBounds)
{
  TypeContext ctx;
  NumberOptions open;
  open.exclusive_minimum = 0;
  open.exclusive_maximum = 1;
  const Type * fraction = ctx.number_type(open);

  NumberOptions dice_faces;
  dice_faces.minimum = 1;
  dice_faces.maximum = 6;
  const Type * dice = ctx.integer_type(dice_faces);

  StringOptions word;
  word.min_length = 3;
  word.max_length = 5;
  const Type * text = ctx.string_type(word);

  for (const Type * type : {fraction, dice, text}) {
    auto generator = arbitrary(type, 5);
    for (const auto & value : generator.take(200)) {
      EXPECT_TRUE(validate(type, value).is_ok()) << value.to_string();
    }
  }
}

TEST(GeneratorTest, RegexStrings)
{
  TypeContext ctx;
  StringOptions code;
  code.regex = "[A-Z]{3}-\\d{2}";
  const Type * type = ctx.string_type(code);

  auto generator = arbitrary(type, 8);
  for (const auto & value : generator.take(50)) {
    EXPECT_TRUE(validate(type, value).is_ok()) << value.to_string();
  }
}

TEST(GeneratorTest, RegexWithLengthBoundsIsRejected)
{
  TypeContext ctx;
  StringOptions conflicting;
  conflicting.regex = "[a-z]+";
  conflicting.max_length = 3;
  auto generator = arbitrary(ctx.string_type(conflicting), 1);
  EXPECT_THROW((void)generator.next(), std::logic_error);
}

TEST(GeneratorTest, ArrayItemCounts)
{
  TypeContext ctx;
  ArrayOptions bounds;
  bounds.min_items = 2;
  bounds.max_items = 5;
  const Type * list = ctx.array_type(ctx.boolean_type(), bounds);

  auto generator = arbitrary(list, 3);
  for (const auto & value : generator.take(50)) {
    ASSERT_TRUE(value.is_array());
    EXPECT_GE(value.size(), 2u);
    EXPECT_LE(value.size(), 5u);
  }

  // Out of depth, arrays keep their required items only
  auto shallow = arbitrary(list, 3, 0);
  EXPECT_EQ(shallow.next().size(), 2u);
}

TEST(GeneratorTest, CustomWithoutGeneratorIsRejected)
{
  TypeContext ctx;
  CustomCodec codec;
  codec.decode = [](const Value & raw, const DecodingOptions &, const nlohmann::json &) {
    return DecodeResult::ok(raw);
  };
  codec.encode = [](const Value & value, const EncodingOptions &, const nlohmann::json &) {
    return value.to_json();
  };
  codec.validate = [](const Value &, const ValidationOptions &, const nlohmann::json &) {
    return ValidationResult::ok();
  };
  auto generator = arbitrary(ctx.custom_type("opaque", codec), 1);
  EXPECT_THROW((void)generator.next(), std::logic_error);
}

// ============================================================================
// Recursion
// ============================================================================

TEST(GeneratorTest, RecursionBoundedByMaxDepth)
{
  CatalogFixture f;
  for (int max_depth = 0; max_depth <= 4; ++max_depth) {
    auto generator = arbitrary(f.lazy_user, 17, max_depth);
    for (const auto & value : generator.take(30)) {
      EXPECT_LE(friend_chain(value), max_depth);
    }
  }
}

TEST(GeneratorTest, RecursiveUnionTerminates)
{
  TypeContext ctx;
  const Type * tree = nullptr;
  const Type * lazy_tree = ctx.lazy_type([&]() { return tree; });
  const Type * node = ctx.object_type({{"left", lazy_tree}, {"right", lazy_tree}});
  tree = ctx.union_type({{"node", node}, {"leaf", ctx.number_type()}});

  auto generator = arbitrary(lazy_tree, 21, 6);
  for (const auto & value : generator.take(50)) {
    EXPECT_TRUE(decode(lazy_tree, encode_without_validation(lazy_tree, value)).is_ok());
  }
}

TEST(GeneratorTest, SelfRequiringRecordIsRejected)
{
  TypeContext ctx;
  const Type * loop = nullptr;
  const Type * lazy_loop = ctx.lazy_type([&]() { return loop; });
  loop = ctx.object_type({{"self", lazy_loop}});

  auto generator = arbitrary(lazy_loop, 1, 2);
  EXPECT_THROW((void)generator.next(), std::logic_error);
}

// ============================================================================
// Codec Agreement
// ============================================================================

TEST(GeneratorTest, GeneratedValuesValidateAndRoundTrip)
{
  CatalogFixture f;
  for (uint64_t seed = 0; seed < 25; ++seed) {
    auto generator = arbitrary(f.lazy_user, seed);
    const Value value = generator.next();

    EXPECT_TRUE(validate(f.lazy_user, value).is_ok()) << value.to_string();

    auto encoded = encode(f.lazy_user, value);
    ASSERT_TRUE(encoded.is_ok()) << value.to_string();
    auto decoded = decode_and_validate(f.lazy_user, encoded.value());
    ASSERT_TRUE(decoded.is_ok()) << encoded.value().dump();
    EXPECT_EQ(decoded.value(), value);
  }
}
