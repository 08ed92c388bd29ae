// tests/unit/basic/test_path.cpp - Unit tests for error paths
//
#include <gtest/gtest.h>

#include "typecraft/basic/path.hpp"

using namespace typecraft;

TEST(PathTest, RootRendersAsDollar)
{
  Path p;
  EXPECT_TRUE(p.is_root());
  EXPECT_EQ(p.to_string(), "$");
}

TEST(PathTest, FieldsAndIndices)
{
  Path p = Path{}.append_field("user").append_field("tags").append_index(2);
  EXPECT_EQ(p.to_string(), "$.user.tags[2]");
  EXPECT_EQ(p.segments().size(), 3u);
}

TEST(PathTest, NonIdentifierKeysAreQuoted)
{
  EXPECT_EQ(Path{}.append_field("odd key").to_string(), "$['odd key']");
  EXPECT_EQ(Path{}.append_field("1st").to_string(), "$['1st']");
  EXPECT_EQ(Path{}.append_field("it's").to_string(), "$['it\\'s']");
}

TEST(PathTest, VariantSegment)
{
  Path p = Path{}.append_field("shape").append_variant("circle").append_field("radius");
  EXPECT_EQ(p.to_string(), "$.shape{circle}.radius");
}

TEST(PathTest, PrependBuildsFromTheInside)
{
  Path p = Path{}.append_field("name").prepend_index(0).prepend_field("users");
  EXPECT_EQ(p.to_string(), "$.users[0].name");
}

TEST(PathTest, OperationsDoNotMutate)
{
  const Path base = Path{}.append_field("a");
  const Path extended = base.append_field("b");
  EXPECT_EQ(base.to_string(), "$.a");
  EXPECT_EQ(extended.to_string(), "$.a.b");
  EXPECT_FALSE(base == extended);
  EXPECT_TRUE(base == Path{}.append_field("a"));
}

TEST(PathTest, StartsWithAncestors)
{
  const Path tag = Path{}.append_field("user").append_field("tags").append_index(2);
  EXPECT_TRUE(tag.starts_with(Path{}));
  EXPECT_TRUE(tag.starts_with(Path{}.append_field("user")));
  EXPECT_TRUE(tag.starts_with(tag));
  EXPECT_FALSE(tag.starts_with(Path{}.append_field("users")));
  EXPECT_FALSE(Path{}.append_field("user").starts_with(tag));
}
