#pragma once

#include <chrono>
#include <cstddef>
#include <span>

#include "sendpath/io-handles.hpp"
#include "sendpath/platform.hpp"

namespace sendpath {

// IDestination over a borrowed, connected stream socket (blocking or non-blocking).
// Writes never raise SIGPIPE; a vanished peer surfaces as EPIPE / ECONNRESET.
class SocketDestination final : public IDestination {
 public:
  explicit SocketDestination(NativeHandle fd) noexcept;

  IoResult write(std::span<const std::byte> data) override;

  Readiness waitWritable(std::chrono::milliseconds timeout) override;

  [[nodiscard]] NativeHandle nativeHandle() const noexcept override { return _fd; }

 private:
  NativeHandle _fd;
};

}  // namespace sendpath
