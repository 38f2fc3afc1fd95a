#include "sendpath/capability-profile.hpp"

#include <gtest/gtest.h>

#include "sendpath/fake-handles.hpp"
#include "sendpath/platform.hpp"
#include "sendpath/transfer-request.hpp"

namespace sendpath {

class CapabilityProfileTest : public ::testing::Test {
 protected:
  test::MemorySource source{"data"};
  test::ScriptedDestination destination;
};

TEST_F(CapabilityProfileTest, AllowsZeroCopyWhenSupportedAndPlain) {
  const CapabilityProfile profile(true, "linux");
  EXPECT_TRUE(profile.allowsZeroCopy({.source = source, .destination = destination}));
}

TEST_F(CapabilityProfileTest, EncryptionAlwaysDisallowsZeroCopy) {
  const TransferRequest request{.source = source, .destination = destination, .requiresEncryption = true};
  EXPECT_FALSE(CapabilityProfile(true, "linux").allowsZeroCopy(request));
  EXPECT_FALSE(CapabilityProfile(false, "other").allowsZeroCopy(request));
}

TEST_F(CapabilityProfileTest, UnsupportedPlatformNeverAllows) {
  const CapabilityProfile profile(false, "other");
  EXPECT_FALSE(profile.allowsZeroCopy({.source = source, .destination = destination}));
  EXPECT_FALSE(profile.supportsZeroCopy());
  EXPECT_EQ(profile.platformTag(), "other");
}

TEST_F(CapabilityProfileTest, DetectMatchesCompiledPlatform) {
  const auto profile = CapabilityProfile::Detect();
  EXPECT_EQ(profile.platformTag(), PlatformName());
#ifdef SENDPATH_HAS_SENDFILE
  EXPECT_TRUE(profile.supportsZeroCopy());
#else
  EXPECT_FALSE(profile.supportsZeroCopy());
#endif
  EXPECT_EQ(profile, CapabilityProfile::Detect());
}

}  // namespace sendpath
