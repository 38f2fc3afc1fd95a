#include "sendpath/fallback-copier.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "sendpath/buffer-pool.hpp"
#include "sendpath/io-handles.hpp"
#include "sendpath/log.hpp"
#include "sendpath/platform.hpp"
#include "sendpath/transfer-config.hpp"
#include "sendpath/transfer-error.hpp"
#include "sendpath/transfer-result.hpp"
#include "transfer-helpers.hpp"

namespace sendpath {

namespace {

// Write all of `pending` to the destination, repeating on partial writes.
// `flushed` is updated with every accepted byte, also when an error ends the flush.
std::optional<TransferError> FlushBuffer(IDestination& destination, std::span<const std::byte> pending,
                                         internal::IdleRetry& idleRetry, uint32_t flushRetryBudget,
                                         std::size_t& flushed) {
  uint32_t zeroWrites = 0;
  while (flushed < pending.size()) {
    const IoResult res = destination.write(pending.subspan(flushed));
    if (res.bytes > 0) {
      flushed += res.bytes;
      idleRetry.onProgress();
      zeroWrites = 0;
      continue;
    }
    if (res.err == error::kInterrupted) {
      continue;
    }
    if (res.wouldBlock()) {
      if (auto err = idleRetry.suspend(destination)) {
        return err;
      }
      continue;
    }
    if (res.err != 0) {
      log::error("write failed on destination fd # {} errno={} msg={}", destination.nativeHandle(), res.err,
                 SystemErrorMessage(res.err));
      return TransferError::DestinationClosed;
    }
    // Zero bytes accepted without any error: the destination claims to be writable but does not drain.
    if (++zeroWrites > flushRetryBudget) {
      return TransferError::PartialBufferFlush;
    }
    if (auto err = idleRetry.suspend(destination)) {
      return err == TransferError::StalledTransfer ? TransferError::PartialBufferFlush : *err;
    }
  }
  return std::nullopt;
}

}  // namespace

FallbackCopier::FallbackCopier(const TransferConfig& config)
    : _config(config), _pool(config.fallbackBufferSize, config.maxPooledBuffers) {}

TransferResult FallbackCopier::copy(ISource& source, IDestination& destination, uint64_t offset, uint64_t length) {
  TransferResult result;
  internal::IdleRetry idleRetry(_config.idleRetryBudget, _config.writableWaitTimeout);

  // Released on every exit path by the Lease destructor.
  BufferPool::Lease lease = _pool.acquire();
  const std::span<std::byte> buf = lease.buffer();

  while (result.bytesTransferred < length) {
    const auto want = static_cast<std::size_t>(std::min<uint64_t>(buf.size(), length - result.bytesTransferred));
    const IoResult rd = source.readAt(buf.first(want), offset + result.bytesTransferred);
    if (rd.err != 0) {
      log::error("read failed on source fd # {} at offset {} errno={} msg={}", source.nativeHandle(),
                 offset + result.bytesTransferred, rd.err, SystemErrorMessage(rd.err));
      result.error = TransferError::SourceUnavailable;
      break;
    }
    if (rd.bytes == 0) {
      // Source exhausted before the requested length: it shrank after validation.
      log::warn("source fd # {} ended at offset {}, {} bytes short", source.nativeHandle(),
                offset + result.bytesTransferred, length - result.bytesTransferred);
      result.error = TransferError::SourceUnavailable;
      break;
    }

    std::size_t flushed = 0;
    const auto err = FlushBuffer(destination, buf.first(rd.bytes), idleRetry, _config.flushRetryBudget, flushed);
    result.bytesTransferred += flushed;
    if (err) {
      result.error = err;
      break;
    }
  }

  internal::Finalize(result, length);
  return result;
}

}  // namespace sendpath
