// tests/unit/retrieve/test_derive_retrieve.cpp - Unit tests for retrieve type derivation
//
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "blog_fixture.hpp"
#include "typecraft/codec/decoder.hpp"
#include "typecraft/retrieve/retrieve.hpp"
#include "typecraft/types/type_utils.hpp"

using namespace typecraft;
using typecraft::test_support::BlogFixture;
using typecraft::test_support::json_value;

// ============================================================================
// Helper Functions
// ============================================================================

static std::vector<std::string> field_names(const Type * type)
{
  std::vector<std::string> names;
  for (const auto & f : concretise(type)->fields) {
    names.push_back(f.name);
  }
  return names;
}

/// Concrete type of a record field, with Optional stripped
static const Type * field_type(const Type * record, const char * name)
{
  const Field * field = concretise(record)->find_field(name);
  if (field == nullptr) {
    return nullptr;
  }
  const Type * t = concretise(field->type);
  return t->kind == TypeKind::Optional ? concretise(t->inner) : t;
}

static const Type * derive_all(BlogFixture & f)
{
  auto result = derive_retrieve_type(f.ctx, f.lazy_user, Capabilities::all());
  return result.is_ok() ? result.value() : nullptr;
}

// ============================================================================
// Retrieve Object
// ============================================================================

TEST(DeriveRetrieveTest, AllCapabilities)
{
  BlogFixture f;
  const Type * retrieve = derive_all(f);
  ASSERT_NE(retrieve, nullptr);
  EXPECT_EQ(
    field_names(retrieve),
    (std::vector<std::string>{"where", "select", "orderBy", "skip", "take"}));

  for (const auto & field : retrieve->fields) {
    EXPECT_TRUE(is_optional(field.type)) << field.name;
  }
  EXPECT_EQ(field_type(retrieve, "orderBy")->kind, TypeKind::Array);
}

TEST(DeriveRetrieveTest, OnlyRequestedCapabilities)
{
  BlogFixture f;
  Capabilities caps;
  caps.select = true;
  caps.take = true;
  auto result = derive_retrieve_type(f.ctx, f.user, caps);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(field_names(result.value()), (std::vector<std::string>{"select", "take"}));
}

TEST(DeriveRetrieveTest, TakeIsBounded)
{
  BlogFixture f;
  const Type * retrieve = derive_all(f);
  ASSERT_NE(retrieve, nullptr);
  EXPECT_TRUE(decode_and_validate(retrieve, json_value(R"({"take": 20, "skip": 0})")).is_ok());
  EXPECT_TRUE(decode_and_validate(retrieve, json_value(R"({"take": 21})")).is_error());
  EXPECT_TRUE(decode_and_validate(retrieve, json_value(R"({"skip": -1})")).is_error());

  auto wide = derive_retrieve_type(f.ctx, f.user, Capabilities::all(100));
  ASSERT_TRUE(wide.is_ok());
  EXPECT_TRUE(decode_and_validate(wide.value(), json_value(R"({"take": 100})")).is_ok());
}

// ============================================================================
// Where
// ============================================================================

TEST(DeriveRetrieveTest, WhereShape)
{
  BlogFixture f;
  const Type * where = field_type(derive_all(f), "where");
  ASSERT_NE(where, nullptr);
  EXPECT_EQ(where->name(), "UserWhere");

  // Objects and unions cannot be filtered on
  EXPECT_EQ(
    field_names(where),
    (std::vector<std::string>{
      "id", "name", "age", "active", "tags", "posts", "bestFriend", "AND", "OR", "NOT"}));

  EXPECT_EQ(field_names(field_type(where, "name")), (std::vector<std::string>{"equals", "in"}));
  EXPECT_EQ(
    field_names(field_type(where, "age")),
    (std::vector<std::string>{"equals", "lt", "lte", "gt", "gte", "in"}));
  EXPECT_EQ(field_names(field_type(where, "active")), (std::vector<std::string>{"equals"}));
  EXPECT_EQ(field_names(field_type(where, "tags")), (std::vector<std::string>{"equals"}));
  EXPECT_EQ(
    field_names(field_type(where, "posts")),
    (std::vector<std::string>{"some", "every", "none"}));
  EXPECT_EQ(field_type(field_type(where, "posts"), "some")->name(), "PostWhere");
}

TEST(DeriveRetrieveTest, WhereIsSelfReferential)
{
  BlogFixture f;
  const Type * where = field_type(derive_all(f), "where");
  ASSERT_NE(where, nullptr);
  EXPECT_EQ(field_type(where, "bestFriend"), where);
  EXPECT_EQ(field_type(where, "NOT"), where);
  EXPECT_EQ(concretise(field_type(where, "AND")->inner), where);

  const Type * post_where = field_type(field_type(where, "posts"), "some");
  EXPECT_EQ(field_type(post_where, "author"), where);
}

TEST(DeriveRetrieveTest, DecodesNestedFilters)
{
  BlogFixture f;
  const Type * retrieve = derive_all(f);
  ASSERT_NE(retrieve, nullptr);
  auto result = decode_and_validate(
    retrieve, json_value(R"({
      "where": {
        "age": {"gte": 18},
        "posts": {"some": {"title": {"in": ["a", "b"]}}},
        "OR": [{"name": {"equals": "Ann"}}, {"NOT": {"active": {"equals": false}}}]
      }
    })"));
  EXPECT_TRUE(result.is_ok());

  EXPECT_TRUE(decode(retrieve, json_value(R"({"where": {"address": {}}})")).is_error());
}

// ============================================================================
// Select
// ============================================================================

TEST(DeriveRetrieveTest, SelectShape)
{
  BlogFixture f;
  const Type * select = field_type(derive_all(f), "select");
  ASSERT_NE(select, nullptr);
  EXPECT_EQ(select->name(), "UserSelect");
  EXPECT_EQ(field_names(select).size(), concretise(f.user)->fields.size());

  EXPECT_EQ(field_type(select, "name")->kind, TypeKind::Boolean);
  EXPECT_EQ(field_type(select, "tags")->kind, TypeKind::Boolean);
  EXPECT_EQ(field_type(select, "contact")->kind, TypeKind::Boolean);

  // To-one relation: {retrieve: {select?}} | {all}
  const Type * friend_select = field_type(select, "bestFriend");
  ASSERT_EQ(friend_select->kind, TypeKind::Union);
  const Type * partial = concretise(friend_select->find_variant("retrieve")->type);
  EXPECT_EQ(field_names(partial), (std::vector<std::string>{"select"}));
  EXPECT_EQ(field_type(partial, "select"), select);

  // To-many relation: a full retrieve of the related entity
  const Type * posts_select = field_type(select, "posts");
  ASSERT_EQ(posts_select->kind, TypeKind::Union);
  EXPECT_EQ(
    field_names(posts_select->find_variant("retrieve")->type),
    (std::vector<std::string>{"where", "select", "orderBy", "skip", "take"}));

  // Plain object: {fields: {select: {...}}} | {all}
  const Type * address_select = field_type(select, "address");
  ASSERT_EQ(address_select->kind, TypeKind::Union);
  ASSERT_NE(address_select->find_variant("fields"), nullptr);
  ASSERT_NE(address_select->find_variant("all"), nullptr);
}

TEST(DeriveRetrieveTest, DecodesSelectionsUnderCasting)
{
  BlogFixture f;
  const Type * retrieve = derive_all(f);
  ASSERT_NE(retrieve, nullptr);

  DecodingOptions casting;
  casting.type_casting = TypeCastingStrategy::TryCasting;
  auto result = decode(
    retrieve,
    json_value(R"({
      "select": {
        "name": true,
        "bestFriend": true,
        "posts": {"select": {"title": true}, "take": 5}
      },
      "orderBy": [{"name": "asc"}, {"posts": {"_count": "desc"}}]
    })"),
    casting);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(
    result.value().get("select").get("posts"),
    json_value(R"({"select": {"title": true}, "take": 5})"));
  EXPECT_EQ(result.value().get("select").get("bestFriend"), Value::make_bool(true));
}

TEST(DeriveRetrieveTest, TaggedSelectionsDecodeExactly)
{
  BlogFixture f;
  const Type * retrieve = derive_all(f);
  ASSERT_NE(retrieve, nullptr);
  auto result = decode(
    retrieve, json_value(R"({"select": {"bestFriend": {"retrieve": {"select": {"id": true}}}}})"));
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(
    result.value().get("select").get("bestFriend"), json_value(R"({"select": {"id": true}})"));
}

// ============================================================================
// OrderBy
// ============================================================================

TEST(DeriveRetrieveTest, OrderByShape)
{
  BlogFixture f;
  const Type * order_by = concretise(field_type(derive_all(f), "orderBy")->inner);
  EXPECT_EQ(order_by->name(), "UserOrderBy");
  EXPECT_EQ(
    field_names(order_by),
    (std::vector<std::string>{
      "id", "name", "age", "active", "tags", "address", "posts", "bestFriend"}));

  EXPECT_EQ(field_type(order_by, "name")->name(), "SortDirection");
  EXPECT_EQ(field_names(field_type(order_by, "posts")), (std::vector<std::string>{"_count"}));
  EXPECT_EQ(field_names(field_type(order_by, "address")), (std::vector<std::string>{"city", "zip"}));
  EXPECT_EQ(field_type(order_by, "bestFriend"), order_by);
}

// ============================================================================
// Errors
// ============================================================================

TEST(DeriveRetrieveTest, NoCapability)
{
  BlogFixture f;
  auto result = derive_retrieve_type(f.ctx, f.user, Capabilities{});
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error(), "no retrieve capability requested");
}

TEST(DeriveRetrieveTest, NotAnEntity)
{
  BlogFixture f;
  auto result = derive_retrieve_type(
    f.ctx, f.ctx.object_type({{"a", f.ctx.string_type()}}), Capabilities::all());
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error(), "cannot derive a retrieve type from object { a: string }: not an entity");
}

TEST(DeriveRetrieveTest, ArrayOfArraysRejected)
{
  TypeContext ctx;
  TypeOptions named;
  named.name = "Grid";
  const Type * grid =
    ctx.entity_type({{"cells", ctx.array_type(ctx.array_type(ctx.number_type()))}}, named);

  for (const auto & [caps, fragment] : std::vector<std::pair<Capabilities, std::string>>{
         {Capabilities{true, false, false, false, false}, "where"},
         {Capabilities{false, true, false, false, false}, "select"},
         {Capabilities{false, false, true, false, false}, "orderBy"}}) {
    auto result = derive_retrieve_type(ctx, grid, caps);
    ASSERT_TRUE(result.is_error()) << fragment;
    EXPECT_EQ(
      result.error(),
      "array of arrays is not supported in " + fragment + ": array<array<number>>");
  }

  Capabilities paging;
  paging.take = true;
  EXPECT_TRUE(derive_retrieve_type(ctx, grid, paging).is_ok());
}

TEST(DeriveRetrieveTest, AnonymousEntityNames)
{
  TypeContext ctx;
  const Type * anonymous = ctx.entity_type({{"id", ctx.string_type()}});
  auto result = derive_retrieve_type(ctx, ctx.array_type(anonymous), Capabilities::all());
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(field_type(result.value(), "where")->name(), "AnonymousWhere");
}
