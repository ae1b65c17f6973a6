#include "restspy/matchable-registry.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "restspy/double.hpp"
#include "restspy/matchable.hpp"

namespace restspy {

namespace {

constexpr uint16_t kPort = 1234;
constexpr uint16_t kOtherPort = 4567;

std::vector<std::string> Ids(const std::vector<const Matchable*>& elements) {
  std::vector<std::string> ids;
  for (const Matchable* elem : elements) {
    ids.push_back(elem->id());
  }
  return ids;
}

}  // namespace

class MatchableRegistryTest : public ::testing::Test {
 protected:
  MatchableRegistry<> registry;
  Matchable element{"/test"};
};

TEST_F(MatchableRegistryTest, FindsRegisteredElement) {
  registry.registerElement(element, kPort);

  const Matchable* result = registry.findForEndpoint("/test", kPort);
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->id(), element.id());
}

TEST_F(MatchableRegistryTest, NothingFoundWhenNothingRegistered) {
  EXPECT_EQ(registry.findForEndpoint("/foo", kPort), nullptr);
}

TEST_F(MatchableRegistryTest, NothingFoundForNonMatchingElement) {
  registry.registerElement(element, kPort);

  EXPECT_EQ(registry.findForEndpoint("/foo", kPort), nullptr);
}

TEST_F(MatchableRegistryTest, NothingFoundOnDifferentPort) {
  registry.registerElement(element, kPort);

  EXPECT_EQ(registry.findForEndpoint("/test", kOtherPort), nullptr);
}

TEST_F(MatchableRegistryTest, LastRegisteredMatchingElementWins) {
  registry.registerElement(element, kPort);
  Matchable element2("/test");
  registry.registerElement(element2, kPort);

  const Matchable* result = registry.findForEndpoint("/test", kPort);
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->id(), element2.id());
}

TEST_F(MatchableRegistryTest, ResetRemovesAllElementsOfPort) {
  registry.registerElement(element, kPort);
  registry.registerElement(Matchable("/other"), kPort);

  registry.reset(kPort);

  EXPECT_EQ(registry.findForEndpoint("/test", kPort), nullptr);
  EXPECT_EQ(registry.size(kPort), 0U);
}

TEST_F(MatchableRegistryTest, ResetKeepsElementsOfOtherPorts) {
  registry.registerElement(element, kPort);
  registry.registerElement(Matchable("/test"), kOtherPort);

  registry.reset(kOtherPort);

  const Matchable* result = registry.findForEndpoint("/test", kPort);
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->id(), element.id());
  EXPECT_EQ(registry.findForEndpoint("/test", kOtherPort), nullptr);
}

TEST_F(MatchableRegistryTest, ResetUnknownPortIsNoop) {
  registry.reset(kOtherPort);
  EXPECT_EQ(registry.size(kOtherPort), 0U);
}

TEST_F(MatchableRegistryTest, UnregisterElement) {
  registry.registerElement(element, kPort);

  EXPECT_EQ(registry.unregister(element.id(), kPort), 1U);

  EXPECT_EQ(registry.findForEndpoint("/test", kPort), nullptr);
}

TEST_F(MatchableRegistryTest, UnregisterOtherIdKeepsElement) {
  registry.registerElement(element, kPort);

  EXPECT_EQ(registry.unregister("some-other-id", kPort), 0U);

  EXPECT_NE(registry.findForEndpoint("/test", kPort), nullptr);
}

TEST_F(MatchableRegistryTest, UnregisterWithoutElementsForPort) {
  EXPECT_EQ(registry.unregister(element.id(), kPort), 0U);

  EXPECT_EQ(registry.findForEndpoint("/test", kPort), nullptr);
}

TEST_F(MatchableRegistryTest, UnregisterDoesNotAffectOtherPorts) {
  registry.registerElement(element, kPort);

  EXPECT_EQ(registry.unregister(element.id(), kOtherPort), 0U);

  EXPECT_NE(registry.findForEndpoint("/test", kPort), nullptr);
}

TEST_F(MatchableRegistryTest, UnregisterRemovesEveryEntryWithIdAndKeepsOrder) {
  Matchable first("first", "/a");
  Matchable second("second", "/a");
  registry.registerElement(first, kPort);
  registry.registerElement(element, kPort);
  registry.registerElement(second, kPort);
  registry.registerElement(element, kPort);

  EXPECT_EQ(registry.unregister(element.id(), kPort), 2U);

  EXPECT_EQ(Ids(registry.findAllForEndpoint("/a", kPort)), (std::vector<std::string>{"first", "second"}));
}

TEST_F(MatchableRegistryTest, FindAllReturnsEmptyWhenNothingRegistered) {
  EXPECT_TRUE(registry.findAllForEndpoint("/test", kPort).empty());
}

TEST_F(MatchableRegistryTest, FindAllDoesNotReturnNonMatchingElements) {
  registry.registerElement(element, kPort);

  EXPECT_TRUE(registry.findAllForEndpoint("/foo", kPort).empty());
}

TEST_F(MatchableRegistryTest, FindAllDoesNotReturnElementsOfOtherPorts) {
  registry.registerElement(element, kPort);

  EXPECT_TRUE(registry.findAllForEndpoint("/test", kOtherPort).empty());
}

TEST_F(MatchableRegistryTest, FindAllReturnsMatchesInRegistrationOrder) {
  registry.registerElement(element, kPort);
  Matchable element2("/.*");
  registry.registerElement(element2, kPort);

  EXPECT_EQ(Ids(registry.findAllForEndpoint("/test", kPort)), (std::vector<std::string>{element.id(), element2.id()}));
}

TEST(MatchableRegistryOfDoublesTest, ReturnsDerivedType) {
  MatchableRegistry<Double> doubles;
  doubles.registerElement(Double("/users/\\d+", 200, {}, "first"), kPort);
  doubles.registerElement(Double("/users/42", 201, {}, "second"), kPort);

  const Double* found = doubles.findForEndpoint("/users/42", kPort);
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->statusCode(), 201);
  EXPECT_EQ(found->body(), "second");

  found = doubles.findForEndpoint("/users/7", kPort);
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->body(), "first");

  doubles.clear();
  EXPECT_EQ(doubles.findForEndpoint("/users/7", kPort), nullptr);
}

}  // namespace restspy
