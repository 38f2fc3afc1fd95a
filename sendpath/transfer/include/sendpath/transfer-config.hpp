#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "sendpath/sendfile.hpp"

namespace sendpath {

/// Tuning knobs of TransferEngine and FallbackCopier.
///
/// Default values suit a server streaming files to TCP peers with one thread per connection.
struct TransferConfig {
  static constexpr std::size_t kDefaultFallbackBufferSize = 64UL * 1024UL;

  /// Upper bound of bytes requested from the zero-copy primitive per call.
  /// Range: 1 to kMaxSendfileChunk (0x7ffff000, the Linux per-call limit).
  std::size_t maxChunkBytes{kMaxSendfileChunk};

  /// Number of consecutive no-progress suspensions tolerated before a transfer is declared stalled.
  /// The counter resets each time bytes move. 0 means the first no-progress event stalls the transfer.
  /// Default: 16.
  uint32_t idleRetryBudget{16};

  /// Maximum time to stay suspended waiting for the destination to become writable, per suspension.
  /// Default: 1 second.
  std::chrono::milliseconds writableWaitTimeout{std::chrono::milliseconds{1000}};

  /// Size of each pooled fallback buffer.
  /// Default: 64 KiB.
  std::size_t fallbackBufferSize{kDefaultFallbackBufferSize};

  /// Maximum number of idle buffers kept by the pool between transfers.
  /// Leases beyond this count are allocated on demand and freed on return.
  /// Default: 64.
  std::size_t maxPooledBuffers{64};

  /// Number of zero-byte writes without error tolerated on a writable destination before the fallback
  /// path gives up flushing the current buffer.
  /// Default: 8.
  uint32_t flushRetryBudget{8};

  /// Requests shorter than this use the buffered path even when zero-copy is allowed.
  /// Default: 0 (always prefer zero-copy when allowed).
  uint64_t zeroCopyMinBytes{0};

  TransferConfig& withMaxChunkBytes(std::size_t bytes) {
    maxChunkBytes = bytes;
    return *this;
  }

  TransferConfig& withIdleRetryBudget(uint32_t budget) {
    idleRetryBudget = budget;
    return *this;
  }

  TransferConfig& withWritableWaitTimeout(std::chrono::milliseconds timeout) {
    writableWaitTimeout = timeout;
    return *this;
  }

  TransferConfig& withFallbackBufferSize(std::size_t bytes) {
    fallbackBufferSize = bytes;
    return *this;
  }

  TransferConfig& withMaxPooledBuffers(std::size_t count) {
    maxPooledBuffers = count;
    return *this;
  }

  TransferConfig& withFlushRetryBudget(uint32_t budget) {
    flushRetryBudget = budget;
    return *this;
  }

  TransferConfig& withZeroCopyMinBytes(uint64_t bytes) {
    zeroCopyMinBytes = bytes;
    return *this;
  }

  // Throws std::invalid_argument if a knob is out of range.
  void validate() const;

  bool operator==(const TransferConfig&) const noexcept = default;
};

}  // namespace sendpath
