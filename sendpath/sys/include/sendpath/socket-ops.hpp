#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

#include "sendpath/platform.hpp"

namespace sendpath {

// Thin wrappers centralising socket system calls so that the transfer module
// never includes platform networking headers directly.

// Set a file descriptor to non-blocking mode.
// Returns true on success.
bool SetNonBlocking(NativeHandle fd) noexcept;

// Suppress SIGPIPE on a socket (macOS: SO_NOSIGPIPE).
// No-op on Linux (uses MSG_NOSIGNAL per-send).
// Returns true on success.
bool SetNoSigPipe(NativeHandle fd) noexcept;

// Send data on a connected socket with platform-appropriate flags
// (MSG_NOSIGNAL on Linux, SO_NOSIGPIPE on macOS).
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(NativeHandle fd, std::span<const std::byte> data) noexcept;

enum class PollWritable : uint8_t {
  Writable,     // at least one byte can be queued without blocking
  NotWritable,  // timeout elapsed without the fd becoming writable
  HangUp,       // peer closed, the descriptor is invalid or has a pending error
};

// Wait up to `timeout` for `fd` to become writable (0 performs a non-blocking probe).
// EINTR is retried with the full timeout.
PollWritable WaitWritable(NativeHandle fd, std::chrono::milliseconds timeout) noexcept;

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(NativeHandle fd) noexcept;

}  // namespace sendpath
