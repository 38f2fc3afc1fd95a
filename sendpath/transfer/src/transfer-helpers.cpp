#include "transfer-helpers.hpp"

#include <fcntl.h>

#include <cerrno>
#include <cstdint>
#include <optional>

#include "sendpath/io-handles.hpp"
#include "sendpath/platform.hpp"
#include "sendpath/transfer-error.hpp"
#include "sendpath/transfer-result.hpp"
#include "sendpath/transfer-state.hpp"

namespace sendpath::internal {

std::optional<TransferError> IdleRetry::suspend(IDestination& destination) {
  if (++_consecutiveIdle > _budget) {
    return TransferError::StalledTransfer;
  }
  if (destination.waitWritable(_waitTimeout) == Readiness::Closed) {
    return TransferError::DestinationClosed;
  }
  return std::nullopt;
}

TransferError ClassifySendError(int err, NativeHandle inFd) noexcept {
  switch (err) {
    case error::kBrokenPipe:
    case error::kConnectionReset:
    case error::kNotConnected:
    case ECONNABORTED:
    case ETIMEDOUT:
      return TransferError::DestinationClosed;
    case error::kBadDescriptor:
      return ::fcntl(inFd, F_GETFD) == -1 ? TransferError::SourceUnavailable : TransferError::DestinationClosed;
    case EIO:
    case EOVERFLOW:
    case ESPIPE:
    case ENOMEM:
    case error::kInvalidArgument:
      return TransferError::SourceUnavailable;
    default:
      return TransferError::DestinationClosed;
  }
}

bool IsZeroCopyUnsupported(int err) noexcept {
  return err == error::kInvalidArgument || err == error::kNoSys || err == error::kNotSupported;
}

void Finalize(TransferResult& result, uint64_t length) noexcept {
  result.completed = !result.error && result.bytesTransferred == length;
  if (result.completed) {
    result.state = TransferState::Completed;
  } else if (result.error == TransferError::StalledTransfer) {
    result.state = TransferState::Stalled;
  } else {
    result.state = TransferState::Failed;
  }
}

}  // namespace sendpath::internal
