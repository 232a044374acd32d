#include "source/common/common/regex.h"

#include "gtest/gtest.h"

namespace CloudTrace {
namespace Regex {
namespace {

TEST(CompiledGoogleReMatcherTest, FullMatchGroups) {
  CompiledGoogleReMatcher matcher("(?P<key>[a-z]+)=(?P<value>[0-9]+)(;(?P<opt>x))?");

  const auto groups = matcher.fullMatchGroups("abc=42");
  ASSERT_TRUE(groups.has_value());
  ASSERT_EQ(5, groups->size());
  EXPECT_EQ("abc=42", groups->at(0).value());
  EXPECT_EQ("abc", groups->at(1).value());
  EXPECT_EQ("42", groups->at(2).value());
  EXPECT_FALSE(groups->at(3).has_value());
  EXPECT_FALSE(groups->at(4).has_value());

  const auto with_optional = matcher.fullMatchGroups("abc=42;x");
  ASSERT_TRUE(with_optional.has_value());
  EXPECT_EQ(";x", with_optional->at(3).value());
  EXPECT_EQ("x", with_optional->at(4).value());
}

TEST(CompiledGoogleReMatcherTest, EmptyGroupIsPresent) {
  CompiledGoogleReMatcher matcher("a([0-9]*)b");
  const auto groups = matcher.fullMatchGroups("ab");
  ASSERT_TRUE(groups.has_value());
  ASSERT_TRUE(groups->at(1).has_value());
  EXPECT_EQ("", groups->at(1).value());
}

TEST(CompiledGoogleReMatcherTest, FullMatchGroupsRequiresWholeInput) {
  CompiledGoogleReMatcher matcher("(?P<key>[a-z]+)=(?P<value>[0-9]+)");
  EXPECT_FALSE(matcher.fullMatchGroups("abc=42 ").has_value());
  EXPECT_FALSE(matcher.fullMatchGroups(" abc=42").has_value());
  EXPECT_FALSE(matcher.fullMatchGroups("abc=").has_value());
  EXPECT_FALSE(matcher.fullMatchGroups("").has_value());
}

TEST(CompiledGoogleReMatcherTest, GroupsPointIntoInput) {
  CompiledGoogleReMatcher matcher("([a-z]+)/([0-9]+)");
  const std::string input = "span/17";
  const auto groups = matcher.fullMatchGroups(input);
  ASSERT_TRUE(groups.has_value());
  EXPECT_EQ(input.data() + 5, groups->at(2)->data());
}

TEST(CompiledGoogleReMatcherDeathTest, InvalidRegex) {
  EXPECT_DEATH({ CompiledGoogleReMatcher matcher("(abc"); }, "Invalid regex");
}

} // namespace
} // namespace Regex
} // namespace CloudTrace
