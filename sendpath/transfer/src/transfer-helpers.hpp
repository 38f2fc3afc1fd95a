#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "sendpath/io-handles.hpp"
#include "sendpath/platform.hpp"
#include "sendpath/transfer-error.hpp"
#include "sendpath/transfer-result.hpp"

namespace sendpath::internal {

// Bounded count of consecutive no-progress suspensions of one transfer.
class IdleRetry {
 public:
  IdleRetry(uint32_t budget, std::chrono::milliseconds waitTimeout) noexcept
      : _waitTimeout(waitTimeout), _budget(budget) {}

  // Bytes moved: the destination is draining again.
  void onProgress() noexcept { _consecutiveIdle = 0; }

  // Suspend until the destination becomes writable or the wait timeout elapses.
  // Returns the error ending the transfer, or nullopt when the caller should try again.
  std::optional<TransferError> suspend(IDestination& destination);

  [[nodiscard]] uint32_t consecutiveIdle() const noexcept { return _consecutiveIdle; }

 private:
  std::chrono::milliseconds _waitTimeout;
  uint32_t _budget;
  uint32_t _consecutiveIdle{0};
};

// Error kind of a failed zero-copy call. EBADF is attributed to whichever descriptor is no longer open.
TransferError ClassifySendError(int err, NativeHandle inFd) noexcept;

// True for errors meaning the zero-copy primitive cannot serve this pair of descriptors at all.
bool IsZeroCopyUnsupported(int err) noexcept;

// Set completed and the terminal state of a result once its loop has exited.
void Finalize(TransferResult& result, uint64_t length) noexcept;

}  // namespace sendpath::internal
