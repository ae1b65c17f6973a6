#include "restspy/exception.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <string_view>

#include "restspy/invalid_argument_exception.hpp"

namespace restspy {

TEST(ExceptionTest, InfoTakenFromConstCharStar) {
  EXPECT_STREQ(exception("Port 8080 is already registered").what(), "Port 8080 is already registered");
}

TEST(ExceptionTest, FormatUntruncated) {
  EXPECT_STREQ(exception("Server on port {} did not answer within {} ms", 4567, 3000).what(),
               "Server on port 4567 did not answer within 3000 ms");
}

TEST(ExceptionTest, FormatTruncated) {
  const exception ex("{} {} {} {}", std::string(60, 'a'), std::string(60, 'b'), std::string(60, 'c'), 42);
  const char* msg = ex.what();
  ASSERT_EQ(std::strlen(msg), exception::kMsgMaxLen);
  EXPECT_EQ(std::string_view(msg).substr(0, 3), "aaa");
  EXPECT_EQ(std::string_view(msg).substr(exception::kMsgMaxLen - 3), "...");
}

TEST(ExceptionTest, InvalidArgumentIsCatchableAsBase) {
  try {
    throw invalid_argument("bad pattern '{}'", "[");
  } catch (const exception& ex) {
    EXPECT_STREQ(ex.what(), "bad pattern '['");
  }
}

}  // namespace restspy
