#pragma once

#include <cstdint>
#include <optional>

#include "sendpath/transfer-error.hpp"
#include "sendpath/transfer-state.hpp"

namespace sendpath {

// Outcome of TransferEngine::transfer.
// completed is true iff bytesTransferred equals the requested length and error is empty.
// bytesTransferred is always authoritative: on failure it holds the bytes accepted by the destination before the
// failure, so callers may resume from offset + bytesTransferred.
struct TransferResult {
  [[nodiscard]] bool hasError() const noexcept { return error.has_value(); }

  std::uint64_t bytesTransferred{0};
  bool completed{false};
  bool usedZeroCopy{false};
  std::optional<TransferError> error;
  TransferState state{TransferState::Init};
};

}  // namespace sendpath
