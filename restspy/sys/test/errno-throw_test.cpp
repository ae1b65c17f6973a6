#include "restspy/errno-throw.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <system_error>

namespace restspy {

TEST(ErrnoThrow, ThrowsSystemErrorWithErrno) {
  try {
    errno = ENOENT;
    int port = 8080;
    throw_errno("Test error on port {}", port);
    FAIL() << "Expected std::system_error to be thrown";
  } catch (const std::system_error& e) {
    EXPECT_EQ(e.code().value(), ENOENT);
    EXPECT_EQ(e.code().category(), std::generic_category());
    EXPECT_EQ(e.what(), std::string("Test error on port 8080: No such file or directory"));
  }
}

TEST(ErrnoThrow, ThrowsSystemErrorWithExplicitErrorNumber) {
  errno = 0;
  try {
    throw_errnum(EACCES, "spawn of '{}' failed", "rest-spy");
    FAIL() << "Expected std::system_error to be thrown";
  } catch (const std::system_error& e) {
    EXPECT_EQ(e.code().value(), EACCES);
    EXPECT_EQ(e.what(), std::string("spawn of 'rest-spy' failed: Permission denied"));
  }
}

}  // namespace restspy
