#pragma once

#include <cstdint>
#include <string>

namespace sendpath {

// Point-in-time copy of TransferMetrics counters.
struct TransferStats {
  // Share of transfers that used the zero-copy path, in percent. 0 when no transfer was recorded.
  [[nodiscard]] double zeroCopyPercentage() const noexcept {
    if (totalTransfers == 0) {
      return 0.0;
    }
    return static_cast<double>(zeroCopyTransfers) * 100.0 / static_cast<double>(totalTransfers);
  }

  // Serialize this stats snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  // Introspection enumeration of scalar numeric fields (order matches serialization order).
  template <class F>
  void for_each_field(F&& fun) const {
    fun("totalBytesTransferred", totalBytesTransferred);
    fun("totalTransfers", totalTransfers);
    fun("zeroCopyTransfers", zeroCopyTransfers);
    fun("fallbackTransfers", fallbackTransfers);
    fun("failedTransfers", failedTransfers);
    fun("stalledTransfers", stalledTransfers);
    fun("zeroCopyPercentage", zeroCopyPercentage());
  }

  uint64_t totalBytesTransferred{};
  uint64_t totalTransfers{};
  uint64_t zeroCopyTransfers{};
  uint64_t fallbackTransfers{};
  uint64_t failedTransfers{};
  uint64_t stalledTransfers{};
};

}  // namespace sendpath
