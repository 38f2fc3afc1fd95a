#include "sendpath/transfer-metrics.hpp"

#include <atomic>
#include <cstdint>

#include "sendpath/transfer-error.hpp"
#include "sendpath/transfer-result.hpp"
#include "sendpath/transfer-stats.hpp"

namespace sendpath {

TransferMetrics& TransferMetrics::Global() noexcept {
  static TransferMetrics gMetrics;
  return gMetrics;
}

void TransferMetrics::recordTransfer(uint64_t bytes, bool usedZeroCopy) noexcept {
  _totalBytesTransferred.fetch_add(bytes, std::memory_order_relaxed);
  _totalTransfers.fetch_add(1, std::memory_order_relaxed);
  if (usedZeroCopy) {
    // Release pairs with the acquire load in snapshot(): a visible zero-copy increment implies a visible total one.
    _zeroCopyTransfers.fetch_add(1, std::memory_order_release);
  }
}

void TransferMetrics::recordOutcome(const TransferResult& result) noexcept {
  recordTransfer(result.bytesTransferred, result.usedZeroCopy);
  if (result.error) {
    _failedTransfers.fetch_add(1, std::memory_order_relaxed);
    if (*result.error == TransferError::StalledTransfer) {
      _stalledTransfers.fetch_add(1, std::memory_order_relaxed);
    }
  }
}

TransferStats TransferMetrics::snapshot() const noexcept {
  TransferStats stats;
  // Read zero-copy before total so that zeroCopyTransfers <= totalTransfers in the returned view.
  stats.zeroCopyTransfers = _zeroCopyTransfers.load(std::memory_order_acquire);
  stats.totalTransfers = _totalTransfers.load(std::memory_order_relaxed);
  stats.totalBytesTransferred = _totalBytesTransferred.load(std::memory_order_relaxed);
  stats.stalledTransfers = _stalledTransfers.load(std::memory_order_relaxed);
  stats.failedTransfers = _failedTransfers.load(std::memory_order_relaxed);
  stats.fallbackTransfers = stats.totalTransfers - stats.zeroCopyTransfers;
  return stats;
}

}  // namespace sendpath
