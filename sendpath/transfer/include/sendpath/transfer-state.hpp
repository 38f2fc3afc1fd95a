#pragma once

#include <cstdint>
#include <string_view>

namespace sendpath {

// Lifecycle of a single transfer:
//   Init -> ProbingCapability -> {ZeroCopyActive | FallbackActive} -> {Completed | Failed | Stalled}
// Requests rejected by validation go straight from ProbingCapability to Failed.
// A zero-copy attempt refused by the kernel before any byte moved may hand over to FallbackActive.
enum class TransferState : std::uint8_t {
  Init,
  ProbingCapability,
  ZeroCopyActive,
  FallbackActive,
  Completed,
  Failed,
  Stalled,
};

[[nodiscard]] constexpr bool IsTerminal(TransferState state) noexcept {
  return state == TransferState::Completed || state == TransferState::Failed || state == TransferState::Stalled;
}

[[nodiscard]] constexpr bool IsValidTransition(TransferState from, TransferState to) noexcept {
  switch (from) {
    case TransferState::Init:
      return to == TransferState::ProbingCapability;
    case TransferState::ProbingCapability:
      return to == TransferState::ZeroCopyActive || to == TransferState::FallbackActive || to == TransferState::Failed;
    case TransferState::ZeroCopyActive:
      return to == TransferState::FallbackActive || IsTerminal(to);
    case TransferState::FallbackActive:
      return IsTerminal(to);
    default:
      return false;
  }
}

std::string_view TransferStateToString(TransferState state) noexcept;

}  // namespace sendpath
