#include "sendpath/transfer-state.hpp"

#include <string_view>
#include <utility>

namespace sendpath {

std::string_view TransferStateToString(TransferState state) noexcept {
  switch (state) {
    case TransferState::Init:
      return "Init";
    case TransferState::ProbingCapability:
      return "ProbingCapability";
    case TransferState::ZeroCopyActive:
      return "ZeroCopyActive";
    case TransferState::FallbackActive:
      return "FallbackActive";
    case TransferState::Completed:
      return "Completed";
    case TransferState::Failed:
      return "Failed";
    case TransferState::Stalled:
      return "Stalled";
    default:
      std::unreachable();
  }
}

}  // namespace sendpath
