#pragma once

#include <atomic>
#include <cstdint>

#include "sendpath/transfer-result.hpp"
#include "sendpath/transfer-stats.hpp"

namespace sendpath {

// Monotonic transfer counters, safe to update from any number of threads without external locking.
// Each counter is updated with an atomic increment, so no update is ever lost. A snapshot reads the counters one by
// one: it is not atomic across fields but never shows a counter going backwards.
class TransferMetrics {
 public:
  TransferMetrics() noexcept = default;

  TransferMetrics(const TransferMetrics&) = delete;
  TransferMetrics(TransferMetrics&&) = delete;
  TransferMetrics& operator=(const TransferMetrics&) = delete;
  TransferMetrics& operator=(TransferMetrics&&) = delete;

  ~TransferMetrics() = default;

  // Process-wide instance, living until exit.
  static TransferMetrics& Global() noexcept;

  // Account for one transfer that moved `bytes` bytes.
  void recordTransfer(uint64_t bytes, bool usedZeroCopy) noexcept;

  // Account for one finished transfer, including its failure class.
  void recordOutcome(const TransferResult& result) noexcept;

  [[nodiscard]] TransferStats snapshot() const noexcept;

 private:
  std::atomic<uint64_t> _totalBytesTransferred{0};
  std::atomic<uint64_t> _totalTransfers{0};
  std::atomic<uint64_t> _zeroCopyTransfers{0};
  std::atomic<uint64_t> _failedTransfers{0};
  std::atomic<uint64_t> _stalledTransfers{0};
};

}  // namespace sendpath
