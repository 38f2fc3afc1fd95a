#include "sendpath/file.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>

#include "sendpath/temp-file.hpp"

namespace sendpath {

TEST(FileTest, OpensExistingFileAndRecordsSize) {
  test::ScopedTempFile tmp(std::string_view("hello sendpath"));
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), tmp.content().size());
  EXPECT_GE(file.fd(), 0);
}

TEST(FileTest, EmptyFileHasZeroSize) {
  test::ScopedTempFile tmp(std::string_view{});
  File file(tmp.filePath().c_str());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 0U);
}

TEST(FileTest, MissingFileIsNotOpened) {
  File file(std::string_view("/this/path/does/not/exist/sendpath"));
  EXPECT_FALSE(file);
  EXPECT_EQ(file.size(), File::kError);
}

TEST(FileTest, DefaultConstructedIsClosed) {
  File file;
  EXPECT_FALSE(file);
}

TEST(FileTest, CloseReleasesDescriptor) {
  test::ScopedTempFile tmp(std::uint64_t{32});
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  file.close();
  EXPECT_FALSE(file);
}

}  // namespace sendpath
