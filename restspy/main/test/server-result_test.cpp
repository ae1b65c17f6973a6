#include "restspy/server-result.hpp"

#include <gtest/gtest.h>

namespace restspy {

TEST(ServerResultTest, DefaultIsSuccess) {
  ServerResult result;
  EXPECT_FALSE(result.hasError());
  EXPECT_TRUE(result);
  EXPECT_EQ(result.error(), ServerResult::Error::None);
  EXPECT_EQ(result.statusCode(), 0);
}

TEST(ServerResultTest, Success) {
  auto result = ServerResult::Success(200, "hello");
  EXPECT_TRUE(result);
  EXPECT_EQ(result.statusCode(), 200);
  EXPECT_EQ(result.body(), "hello");
}

TEST(ServerResultTest, Error) {
  ServerResult result(ServerResult::Error::HttpStatus, 500, "boom");
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error(), ServerResult::Error::HttpStatus);
  EXPECT_EQ(result.statusCode(), 500);
  EXPECT_EQ(result.body(), "boom");
}

TEST(ServerResultTest, ErrorStr) {
  EXPECT_EQ(ErrorStr(ServerResult::Error::DuplicatePort), "duplicate port");
  EXPECT_EQ(ErrorStr(ServerResult::Error::Timeout), "timeout");
  EXPECT_EQ(ErrorStr(ServerResult::Error::HttpStatus), "unexpected HTTP status");
}

}  // namespace restspy
