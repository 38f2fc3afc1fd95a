#pragma once

#include <cstdint>

#include "sendpath/buffer-pool.hpp"
#include "sendpath/io-handles.hpp"
#include "sendpath/transfer-config.hpp"
#include "sendpath/transfer-result.hpp"

namespace sendpath {

// Buffered copy strategy: read a pooled buffer's worth from the source, flush it to the destination, repeat.
// Used whenever the zero-copy path is unavailable or disallowed. Thread-safe: concurrent copies each lease their own
// buffer.
class FallbackCopier {
 public:
  // config must have been validated.
  explicit FallbackCopier(const TransferConfig& config);

  // Copy `length` bytes of `source` starting at `offset` into `destination`.
  // The range must already be validated against the source size.
  // The returned result never has usedZeroCopy set and its state is always terminal.
  TransferResult copy(ISource& source, IDestination& destination, uint64_t offset, uint64_t length);

  [[nodiscard]] const BufferPool& bufferPool() const noexcept { return _pool; }

 private:
  TransferConfig _config;
  BufferPool _pool;
};

}  // namespace sendpath
