#include "restspy/http-headers.hpp"

#include <gtest/gtest.h>

namespace restspy::http {

TEST(HttpHeadersTest, FindHeaderIsCaseInsensitive) {
  const Headers headers{{"Content-Type", "application/json"}, {"content-encoding", "gzip"}};
  ASSERT_TRUE(FindHeader(headers, "content-type"));
  EXPECT_EQ(*FindHeader(headers, "content-type"), "application/json");
  EXPECT_EQ(*FindHeader(headers, "Content-Encoding"), "gzip");
  EXPECT_FALSE(FindHeader(headers, "Content-Length"));
}

TEST(HttpHeadersTest, FindHeaderReturnsFirstMatch) {
  const Headers headers{{"X-A", "1"}, {"x-a", "2"}};
  EXPECT_EQ(*FindHeader(headers, "X-A"), "1");
  EXPECT_FALSE(FindHeader(Headers{}, "X-A"));
}

}  // namespace restspy::http
