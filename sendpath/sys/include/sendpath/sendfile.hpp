#pragma once

#include <sys/types.h>  // off_t, ssize_t

#include <cstddef>
#include <cstdint>

#include "sendpath/platform.hpp"

namespace sendpath {

// Largest byte count a single Sendfile call may be asked to move.
// Linux caps sendfile(2) at 0x7ffff000 bytes per call, which also keeps the count below the signed 32-bit limit.
inline constexpr std::size_t kMaxSendfileChunk = 0x7ffff000UL;

// Platform-abstracted sendfile.
// Transfers up to `count` bytes from file descriptor `inFd` (at `offset`)
// to socket `outFd`. On success, `offset` is advanced by the number of
// bytes actually sent.
//
// Returns the number of bytes transferred (>= 0) or -1 on error (errno set).
// A return of 0 means either end of file or, on a non-blocking socket, that no byte could be queued.
//
// Linux  : wraps sendfile(2) with its native signature. SIGPIPE is suppressed for the duration of the call.
// macOS  : wraps sendfile(2) with the macOS signature (arguments reversed,
//          len is in/out). Partial progress reported together with EAGAIN is returned as success.
// Others : always fails with ENOSYS.
int64_t Sendfile(NativeHandle outFd, NativeHandle inFd, off_t& offset, std::size_t count) noexcept;

}  // namespace sendpath
