#include "restspy/url.hpp"

#include <gtest/gtest.h>

#include "restspy/invalid_argument_exception.hpp"

namespace restspy {

TEST(UrlTest, ParseHostAndPort) {
  const auto url = Url::Parse("http://localhost:8080");
  EXPECT_EQ(url.host(), "localhost");
  EXPECT_EQ(url.port(), 8080);
  EXPECT_EQ(url.target(), "/");
  EXPECT_EQ(url.authority(), "localhost:8080");
  EXPECT_EQ(url.str(), "http://localhost:8080/");
}

TEST(UrlTest, ParseDefaultPort) {
  const auto url = Url::Parse("HTTP://example.com/api/v1?x=1#frag");
  EXPECT_EQ(url.host(), "example.com");
  EXPECT_EQ(url.port(), Url::kDefaultHttpPort);
  EXPECT_EQ(url.target(), "/api/v1?x=1");
  EXPECT_EQ(url.authority(), "example.com");
}

TEST(UrlTest, ParseQueryWithoutPath) {
  EXPECT_EQ(Url::Parse("http://h:1?a=b").target(), "/?a=b");
}

TEST(UrlTest, ParseIPv6) {
  const auto url = Url::Parse("http://[::1]:9000/x");
  EXPECT_EQ(url.host(), "::1");
  EXPECT_EQ(url.port(), 9000);
  EXPECT_EQ(url.authority(), "[::1]:9000");
}

TEST(UrlTest, ParseRejectsInvalidUrls) {
  EXPECT_THROW(Url::Parse("https://localhost:8080"), invalid_argument);
  EXPECT_THROW(Url::Parse("localhost:8080"), invalid_argument);
  EXPECT_THROW(Url::Parse("http://:8080/"), invalid_argument);
  EXPECT_THROW(Url::Parse("http://localhost:/"), invalid_argument);
  EXPECT_THROW(Url::Parse("http://localhost:0"), invalid_argument);
  EXPECT_THROW(Url::Parse("http://localhost:70000"), invalid_argument);
  EXPECT_THROW(Url::Parse("http://localhost:80a"), invalid_argument);
  EXPECT_THROW(Url::Parse("http://[::1/"), invalid_argument);
}

TEST(UrlTest, JoinAbsolutePath) {
  const auto base = Url::Parse("http://localhost:4000/api/v1?x=1");
  EXPECT_EQ(base.join("/doubles").target(), "/doubles");
  EXPECT_EQ(base.join("/spy?all=true").target(), "/spy?all=true");
  EXPECT_EQ(base.join("/doubles").port(), 4000);
}

TEST(UrlTest, JoinRelativePath) {
  const auto base = Url::Parse("http://localhost:4000/api/v1");
  EXPECT_EQ(base.join("doubles").target(), "/api/doubles");
  EXPECT_EQ(Url::Parse("http://localhost:4000/api/").join("doubles").target(), "/api/doubles");
  EXPECT_EQ(Url::Parse("http://localhost:4000").join("doubles").target(), "/doubles");
}

TEST(UrlTest, JoinQueryOnly) {
  EXPECT_EQ(Url::Parse("http://localhost:4000/a/b?old=1").join("?new=2").target(), "/a/b?new=2");
}

TEST(UrlTest, JoinEmptyKeepsUrl) {
  const auto base = Url::Parse("http://localhost:4000/a?b=c");
  EXPECT_EQ(base.join(""), base);
}

TEST(UrlTest, JoinFragmentOnlyKeepsUrl) {
  const auto base = Url::Parse("http://localhost:4000/a?b=c");
  EXPECT_EQ(base.join("#top"), base);
  EXPECT_EQ(Url::Parse("http://localhost:4000/api/").join("doubles#top").target(), "/api/doubles");
}

TEST(UrlTest, JoinRemovesDotSegments) {
  const auto base = Url::Parse("http://localhost:4000/api/v1/");
  EXPECT_EQ(base.join("../doubles").target(), "/api/doubles");
  EXPECT_EQ(base.join("./a/../b").target(), "/api/v1/b");
  EXPECT_EQ(base.join(".").target(), "/api/v1/");
  EXPECT_EQ(base.join("..").target(), "/api/");
  EXPECT_EQ(base.join("../../../../x").target(), "/x");
  EXPECT_EQ(base.join("/a/./b/../c").target(), "/a/c");
  EXPECT_EQ(base.join("/a/..").target(), "/");
  // query is left untouched
  EXPECT_EQ(base.join("../spy?path=/x/../y").target(), "/api/spy?path=/x/../y");
}

TEST(UrlTest, JoinAbsoluteUrl) {
  const auto base = Url::Parse("http://localhost:4000/api/");
  const auto url = base.join("http://other:5000/x/../y?q=1");
  EXPECT_EQ(url.host(), "other");
  EXPECT_EQ(url.port(), 5000);
  EXPECT_EQ(url.target(), "/y?q=1");

  EXPECT_EQ(base.join("HTTP://other/").str(), "http://other/");
  EXPECT_THROW((void)base.join("https://other/"), invalid_argument);
  EXPECT_THROW((void)base.join("mailto:someone"), invalid_argument);
}

TEST(UrlTest, JoinNetworkPathReference) {
  const auto base = Url::Parse("http://localhost:4000/api/");
  const auto url = base.join("//other:5000/doubles");
  EXPECT_EQ(url.host(), "other");
  EXPECT_EQ(url.port(), 5000);
  EXPECT_EQ(url.target(), "/doubles");
  EXPECT_EQ(base.join("//other").str(), "http://other/");
}

TEST(UrlTest, JoinColonAfterSlashIsNotAScheme) {
  const auto base = Url::Parse("http://localhost:4000/api/");
  EXPECT_EQ(base.join("doubles/a:b").target(), "/api/doubles/a:b");
  EXPECT_EQ(base.join("spy?at=12:00").target(), "/api/spy?at=12:00");
}

}  // namespace restspy
