#pragma once

#include <cstdint>

#include "sendpath/buffer-pool.hpp"
#include "sendpath/capability-profile.hpp"
#include "sendpath/fallback-copier.hpp"
#include "sendpath/transfer-config.hpp"
#include "sendpath/transfer-metrics.hpp"
#include "sendpath/transfer-request.hpp"
#include "sendpath/transfer-result.hpp"

namespace sendpath {

// Moves byte ranges from a source to a destination as efficiently as the platform allows.
//
// Each call validates the requested range, then either runs the zero-copy loop (kernel file-to-socket primitive)
// or hands the whole request to the FallbackCopier, and finally records the outcome in TransferMetrics.
// The engine keeps no per-transfer state: transfer() may be called concurrently from as many threads as there are
// active connections. The only shared resources are the metrics counters and the fallback buffer pool.
//
// There is no cancellation channel and no deadline. A caller cancels an in-flight transfer by closing the source or
// destination handle; the next I/O attempt fails and the transfer ends with the matching error.
class TransferEngine {
 public:
  // Throws std::invalid_argument if config is invalid.
  explicit TransferEngine(CapabilityProfile profile, const TransferConfig& config = {},
                          TransferMetrics& metrics = TransferMetrics::Global());

  // Transfer one request. Never throws for I/O failures: they are reported in the result, together with the number
  // of bytes the destination accepted before the failure.
  [[nodiscard]] TransferResult transfer(const TransferRequest& request);

  [[nodiscard]] const CapabilityProfile& profile() const noexcept { return _profile; }

  [[nodiscard]] const TransferConfig& config() const noexcept { return _config; }

  [[nodiscard]] TransferMetrics& metrics() const noexcept { return *_pMetrics; }

  [[nodiscard]] const BufferPool& bufferPool() const noexcept { return _fallbackCopier.bufferPool(); }

 private:
  enum class ZeroCopyOutcome : std::uint8_t { Finished, Unsupported };

  ZeroCopyOutcome runZeroCopy(const TransferRequest& request, uint64_t length, TransferResult& result);

  TransferResult finish(TransferResult result) const;

  CapabilityProfile _profile;
  TransferConfig _config;
  TransferMetrics* _pMetrics;
  FallbackCopier _fallbackCopier;
};

}  // namespace sendpath
