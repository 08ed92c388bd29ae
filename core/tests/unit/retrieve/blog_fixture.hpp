// tests/unit/retrieve/blog_fixture.hpp - Shared User/Post entity graph
//
#pragma once

#include <nlohmann/json.hpp>

#include "typecraft/basic/value.hpp"
#include "typecraft/types/type.hpp"

namespace typecraft::test_support
{

inline Value json_value(const char * text) { return Value::from_json(nlohmann::json::parse(text)); }

/**
 * User <-> Post, with a self relation on User.
 *
 * User { id, name, age, active, tags: string[], address: {city, zip},
 *        posts: Post[], bestFriend?: User, contact: email | phone }
 * Post { id, title, author: User, metadata: {views, info: {lang, draft}} }
 */
struct BlogFixture
{
  TypeContext ctx;
  const Type * user = nullptr;
  const Type * post = nullptr;
  const Type * lazy_user = ctx.lazy_type([this]() { return user; });
  const Type * lazy_post = ctx.lazy_type([this]() { return post; });

  BlogFixture()
  {
    TypeOptions user_name;
    user_name.name = "User";
    user = ctx.entity_type(
      {{"id", ctx.string_type()},
       {"name", ctx.string_type()},
       {"age", ctx.integer_type()},
       {"active", ctx.boolean_type()},
       {"tags", ctx.array_type(ctx.string_type())},
       {"address", ctx.object_type({{"city", ctx.string_type()}, {"zip", ctx.string_type()}})},
       {"posts", ctx.array_type(lazy_post)},
       {"bestFriend", ctx.optional_type(lazy_user)},
       {"contact",
        ctx.union_type({{"email", ctx.string_type()}, {"phone", ctx.number_type()}})}},
      user_name);

    TypeOptions post_name;
    post_name.name = "Post";
    const Type * info =
      ctx.object_type({{"lang", ctx.string_type()}, {"draft", ctx.boolean_type()}});
    post = ctx.entity_type(
      {{"id", ctx.string_type()},
       {"title", ctx.string_type()},
       {"author", ctx.reference_type(lazy_user)},
       {"metadata", ctx.object_type({{"views", ctx.number_type()}, {"info", info}})}},
      post_name);
  }
};

}  // namespace typecraft::test_support
