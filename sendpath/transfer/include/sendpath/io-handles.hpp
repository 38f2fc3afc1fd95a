#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "sendpath/platform.hpp"

namespace sendpath {

// Outcome of a single I/O attempt on a source or destination.
struct IoResult {
  [[nodiscard]] bool wouldBlock() const noexcept { return err == error::kWouldBlock; }

  std::size_t bytes{0};  // bytes read, written or sent by this attempt
  int err{0};            // errno value, 0 when the attempt did not fail
};

// Writability of a destination, as observed by IDestination::waitWritable.
enum class Readiness : std::uint8_t { Writable, NotWritable, Closed };

// Readable, seekable, size-queryable byte source. Borrowed by transfers, never closed by them.
class ISource {
 public:
  virtual ~ISource() = default;

  // Current size in bytes, or nullopt if it cannot be queried (closed or failing handle).
  [[nodiscard]] virtual std::optional<std::uint64_t> size() const = 0;

  // Positioned read of up to dst.size() bytes. Does not move any shared cursor.
  // bytes == 0 with err == 0 means end of source.
  virtual IoResult readAt(std::span<std::byte> dst, std::uint64_t offset) = 0;

  // Kernel descriptor backing this source, kInvalidHandle if there is none (zero-copy then impossible).
  [[nodiscard]] virtual NativeHandle nativeHandle() const noexcept { return kInvalidHandle; }
};

// Writable destination that may report "not currently writable" (EAGAIN) without it being an error.
// Borrowed by transfers, never closed by them.
class IDestination {
 public:
  virtual ~IDestination() = default;

  // Single write attempt. May accept fewer bytes than given.
  // err == EAGAIN when the destination cannot accept bytes right now.
  virtual IoResult write(std::span<const std::byte> data) = 0;

  // Suspend the caller for at most `timeout` until the destination can accept bytes.
  // A zero timeout probes the current state without blocking.
  // Event-driven integrations override this to yield to their scheduler instead of blocking.
  virtual Readiness waitWritable(std::chrono::milliseconds timeout) = 0;

  // Kernel descriptor backing this destination, kInvalidHandle if there is none.
  [[nodiscard]] virtual NativeHandle nativeHandle() const noexcept { return kInvalidHandle; }

  // Whether sendFrom may be used to feed this destination.
  [[nodiscard]] virtual bool acceptsZeroCopy() const noexcept { return nativeHandle() != kInvalidHandle; }

  // Zero-copy primitive: move up to `count` bytes of `inFd` starting at `offset` into this destination
  // without passing them through user memory. Defaults to the platform Sendfile.
  virtual IoResult sendFrom(NativeHandle inFd, std::uint64_t offset, std::size_t count);
};

}  // namespace sendpath
