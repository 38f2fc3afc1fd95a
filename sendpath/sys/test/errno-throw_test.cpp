#include "sendpath/errno-throw.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <system_error>

namespace sendpath {

TEST(ErrnoThrowTest, CarriesErrnoAndFormattedMessage) {
  errno = EBADF;
  try {
    ThrowErrno("operation on fd # {} failed for {}", 42, std::string("test"));
    FAIL() << "ThrowErrno returned";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code().value(), EBADF);
    EXPECT_EQ(ex.code().category(), std::generic_category());
    EXPECT_NE(std::string(ex.what()).find("operation on fd # 42 failed for test"), std::string::npos);
  }
}

TEST(ErrnoThrowTest, NoArguments) {
  errno = ENOENT;
  EXPECT_THROW(ThrowErrno("plain message"), std::system_error);
}

}  // namespace sendpath
