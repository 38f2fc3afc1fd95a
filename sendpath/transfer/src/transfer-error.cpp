#include "sendpath/transfer-error.hpp"

#include <string_view>
#include <utility>

namespace sendpath {

std::string_view TransferErrorToString(TransferError error) noexcept {
  switch (error) {
    case TransferError::UnsupportedRequest:
      return "UnsupportedRequest";
    case TransferError::SourceUnavailable:
      return "SourceUnavailable";
    case TransferError::DestinationClosed:
      return "DestinationClosed";
    case TransferError::StalledTransfer:
      return "StalledTransfer";
    case TransferError::PartialBufferFlush:
      return "PartialBufferFlush";
    default:
      std::unreachable();
  }
}

}  // namespace sendpath
