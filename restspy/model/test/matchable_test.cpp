#include "restspy/matchable.hpp"

#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

#include "restspy/invalid_argument_exception.hpp"

namespace restspy {

TEST(MatchableTest, IdIsAUuidV4) {
  Matchable matchable("/test");
  const std::string& id = matchable.id();
  ASSERT_EQ(id.size(), 36U);
  EXPECT_EQ(id[8], '-');
  EXPECT_EQ(id[13], '-');
  EXPECT_EQ(id[14], '4');
  EXPECT_EQ(id[18], '-');
  EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
  EXPECT_EQ(id[23], '-');
}

TEST(MatchableTest, IdsAreUnique) {
  std::unordered_set<std::string> ids;
  for (int idx = 0; idx < 1000; ++idx) {
    EXPECT_TRUE(ids.insert(GenerateUuid()).second);
  }
}

TEST(MatchableTest, CopiesKeepId) {
  Matchable matchable("/test");
  Matchable copy = matchable;
  EXPECT_EQ(copy.id(), matchable.id());
  EXPECT_EQ(copy.pattern(), "/test");
}

TEST(MatchableTest, ExplicitId) {
  Matchable matchable("my-id", "/test");
  EXPECT_EQ(matchable.id(), "my-id");
}

TEST(MatchableTest, PatternIsSearchedInPath) {
  Matchable matchable("/test");
  EXPECT_TRUE(matchable.matches("/test"));
  EXPECT_TRUE(matchable.matches("/test/42"));
  EXPECT_TRUE(matchable.matches("/api/test"));
  EXPECT_FALSE(matchable.matches("/foo"));
}

TEST(MatchableTest, AnchoredPattern) {
  Matchable matchable("^/users/\\d+$");
  EXPECT_TRUE(matchable.matches("/users/42"));
  EXPECT_FALSE(matchable.matches("/users/42/orders"));
  EXPECT_FALSE(matchable.matches("/users/abc"));
}

TEST(MatchableTest, InvalidPatternThrows) {
  EXPECT_THROW(Matchable("/test("), invalid_argument);
  EXPECT_THROW(Matchable("id", "[a-"), invalid_argument);
}

}  // namespace restspy
