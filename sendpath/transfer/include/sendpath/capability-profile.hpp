#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "sendpath/transfer-request.hpp"

namespace sendpath {

// What zero-copy behavior the current environment permits.
// Built once (at startup, or per test) and handed to the engine; never re-probed.
class CapabilityProfile {
 public:
  CapabilityProfile(bool supportsZeroCopy, std::string platformTag)
      : _platformTag(std::move(platformTag)), _supportsZeroCopy(supportsZeroCopy) {}

  // Profile of the platform this binary was compiled for.
  static CapabilityProfile Detect();

  // Encrypted requests always need the buffered path, whatever the platform supports.
  [[nodiscard]] bool allowsZeroCopy(const TransferRequest& request) const noexcept {
    return _supportsZeroCopy && !request.requiresEncryption;
  }

  [[nodiscard]] bool supportsZeroCopy() const noexcept { return _supportsZeroCopy; }

  [[nodiscard]] std::string_view platformTag() const noexcept { return _platformTag; }

  bool operator==(const CapabilityProfile&) const noexcept = default;

 private:
  std::string _platformTag;
  bool _supportsZeroCopy;
};

}  // namespace sendpath
