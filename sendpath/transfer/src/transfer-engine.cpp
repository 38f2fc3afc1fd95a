#include "sendpath/transfer-engine.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "sendpath/capability-profile.hpp"
#include "sendpath/io-handles.hpp"
#include "sendpath/log.hpp"
#include "sendpath/platform.hpp"
#include "sendpath/transfer-config.hpp"
#include "sendpath/transfer-error.hpp"
#include "sendpath/transfer-metrics.hpp"
#include "sendpath/transfer-request.hpp"
#include "sendpath/transfer-result.hpp"
#include "sendpath/transfer-state.hpp"
#include "transfer-helpers.hpp"

namespace sendpath {

namespace {

const TransferConfig& Validated(const TransferConfig& config) {
  config.validate();
  return config;
}

void Advance(TransferResult& result, TransferState next) noexcept {
  assert(IsValidTransition(result.state, next));
  result.state = next;
}

// Effective number of bytes to move, or nullopt if the range does not fit in the source.
std::optional<uint64_t> ResolveLength(uint64_t offset, uint64_t length, uint64_t sourceSize) noexcept {
  if (offset > sourceSize) {
    return std::nullopt;
  }
  const uint64_t available = sourceSize - offset;
  if (length == 0) {
    return available;
  }
  if (length > available) {
    return std::nullopt;
  }
  return length;
}

}  // namespace

TransferEngine::TransferEngine(CapabilityProfile profile, const TransferConfig& config, TransferMetrics& metrics)
    : _profile(std::move(profile)), _config(Validated(config)), _pMetrics(&metrics), _fallbackCopier(_config) {
  log::debug("TransferEngine ready: platform={} zeroCopy={} maxChunkBytes={} fallbackBufferSize={}",
             _profile.platformTag(), _profile.supportsZeroCopy(), _config.maxChunkBytes, _config.fallbackBufferSize);
}

TransferResult TransferEngine::transfer(const TransferRequest& request) {
  TransferResult result;
  Advance(result, TransferState::ProbingCapability);

  const std::optional<uint64_t> sourceSize = request.source.size();
  if (!sourceSize) {
    result.error = TransferError::SourceUnavailable;
    Advance(result, TransferState::Failed);
    return finish(result);
  }

  const std::optional<uint64_t> length = ResolveLength(request.offset, request.length, *sourceSize);
  if (!length) {
    log::debug("Rejecting transfer of [{}, +{}) from a source of {} bytes", request.offset, request.length,
               *sourceSize);
    result.error = TransferError::UnsupportedRequest;
    Advance(result, TransferState::Failed);
    return finish(result);
  }

  // An empty range never enters the zero-copy loop: the buffered path completes it without I/O.
  const bool zeroCopy = *length != 0 && _profile.allowsZeroCopy(request) &&
                        request.source.nativeHandle() != kInvalidHandle && request.destination.acceptsZeroCopy() &&
                        *length >= _config.zeroCopyMinBytes;
  if (zeroCopy) {
    Advance(result, TransferState::ZeroCopyActive);
    result.usedZeroCopy = true;
    if (runZeroCopy(request, *length, result) == ZeroCopyOutcome::Finished) {
      internal::Finalize(result, *length);
      return finish(result);
    }
  }

  Advance(result, TransferState::FallbackActive);
  TransferResult copied = _fallbackCopier.copy(request.source, request.destination, request.offset, *length);
  Advance(result, copied.state);
  copied.usedZeroCopy = false;
  return finish(copied);
}

TransferEngine::ZeroCopyOutcome TransferEngine::runZeroCopy(const TransferRequest& request, uint64_t length,
                                                            TransferResult& result) {
  IDestination& destination = request.destination;
  const NativeHandle inFd = request.source.nativeHandle();
  internal::IdleRetry idleRetry(_config.idleRetryBudget, _config.writableWaitTimeout);

  while (result.bytesTransferred < length) {
    const auto chunk =
        static_cast<std::size_t>(std::min<uint64_t>(length - result.bytesTransferred, _config.maxChunkBytes));
    const IoResult res = destination.sendFrom(inFd, request.offset + result.bytesTransferred, chunk);
    if (res.bytes > 0) {
      result.bytesTransferred += res.bytes;
      idleRetry.onProgress();
      continue;
    }
    if (res.err == error::kInterrupted) {
      continue;
    }
    if (res.err == 0 || res.wouldBlock()) {
      // No progress: either the source ended early or the destination is full. Its readiness tells which.
      const Readiness readiness = destination.waitWritable(std::chrono::milliseconds{0});
      if (readiness == Readiness::Closed) {
        result.error = TransferError::DestinationClosed;
        break;
      }
      if (res.err == 0 && readiness == Readiness::Writable) {
        log::warn("source fd # {} ended at offset {}, {} bytes short", inFd, request.offset + result.bytesTransferred,
                  length - result.bytesTransferred);
        result.error = TransferError::SourceUnavailable;
        break;
      }
      if (auto err = idleRetry.suspend(destination)) {
        if (*err == TransferError::StalledTransfer) {
          log::warn("Transfer to fd # {} stalled after {} idle waits, {} of {} bytes sent", destination.nativeHandle(),
                    _config.idleRetryBudget, result.bytesTransferred, length);
        }
        result.error = err;
        break;
      }
      continue;
    }
    if (result.bytesTransferred == 0 && internal::IsZeroCopyUnsupported(res.err)) {
      log::warn("Zero-copy unavailable for fd # {} -> fd # {} (errno={} msg={}), using buffered copy", inFd,
                destination.nativeHandle(), res.err, SystemErrorMessage(res.err));
      return ZeroCopyOutcome::Unsupported;
    }
    result.error = internal::ClassifySendError(res.err, inFd);
    log::error("sendfile failed fd # {} -> fd # {} after {} bytes errno={} msg={} ({})", inFd,
               destination.nativeHandle(), result.bytesTransferred, res.err, SystemErrorMessage(res.err),
               TransferErrorToString(*result.error));
    break;
  }
  return ZeroCopyOutcome::Finished;
}

TransferResult TransferEngine::finish(TransferResult result) const {
  assert(IsTerminal(result.state));
  _pMetrics->recordOutcome(result);
  log::debug("Transfer {}: {} bytes, zeroCopy={}{}{}", TransferStateToString(result.state), result.bytesTransferred,
             result.usedZeroCopy, result.error ? " error=" : "",
             result.error ? TransferErrorToString(*result.error) : "");
  return result;
}

}  // namespace sendpath
