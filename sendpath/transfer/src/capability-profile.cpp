#include "sendpath/capability-profile.hpp"

#include <string>

#include "sendpath/platform.hpp"

namespace sendpath {

CapabilityProfile CapabilityProfile::Detect() {
#ifdef SENDPATH_HAS_SENDFILE
  return {true, std::string(PlatformName())};
#else
  return {false, std::string(PlatformName())};
#endif
}

}  // namespace sendpath
