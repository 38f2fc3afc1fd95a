#pragma once

#include <cstdint>

#include "sendpath/base-fd.hpp"
#include "sendpath/platform.hpp"

namespace sendpath {

// Simple RAII class wrapping an IPv4 TCP socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a socket with the given type and protocol.
  // Throws std::system_error on failure.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind and start listening on the given port. If port is 0, an ephemeral port is chosen and updated in the argument.
  // Throws std::system_error on failure.
  void bindAndListen(uint16_t& port);

  // Accept one pending connection (blocking unless the socket is non-blocking).
  // Returns a closed BaseFd when no connection could be accepted (errno set).
  [[nodiscard]] BaseFd accept() const noexcept;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace sendpath
