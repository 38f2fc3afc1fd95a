#pragma once

// Platform detection and portable aliases for sendpath's system layer.
//
// Detection macros:
//   SENDPATH_LINUX  – defined on Linux
//   SENDPATH_MACOS  – defined on macOS / Darwin
//   SENDPATH_POSIX  – defined on any supported POSIX system (Linux, macOS, *BSD …)
//
// SENDPATH_HAS_SENDFILE is defined when the kernel offers a file-to-socket primitive
// that sendpath knows how to drive.

#ifdef __linux__
#define SENDPATH_LINUX
#define SENDPATH_POSIX
#define SENDPATH_HAS_SENDFILE
#elifdef __APPLE__
#include <TargetConditionals.h>
#define SENDPATH_MACOS
#define SENDPATH_POSIX
#define SENDPATH_HAS_SENDFILE
#elif defined(__unix__)
#define SENDPATH_POSIX
#else
#error "Unsupported platform – sendpath requires a POSIX system"
#endif

#include <unistd.h>  // close

#include <cerrno>   // errno, EAGAIN, EINTR, …
#include <cstring>  // std::strerror
#include <string_view>

namespace sendpath {

using NativeHandle = int;
inline constexpr NativeHandle kInvalidHandle = -1;

// Short lowercase name of the platform this binary was compiled for.
constexpr std::string_view PlatformName() noexcept {
#ifdef SENDPATH_LINUX
  return "linux";
#elifdef SENDPATH_MACOS
  return "macos";
#else
  return "posix";
#endif
}

inline int LastSystemError() noexcept { return errno; }

// Human-readable description for an errno value. Always log the numeric code alongside the message.
inline const char* SystemErrorMessage(int err) noexcept { return std::strerror(err); }

// errno values the transfer loops branch on.
namespace error {
inline constexpr int kWouldBlock = EAGAIN;
inline constexpr int kInterrupted = EINTR;
inline constexpr int kConnectionReset = ECONNRESET;
inline constexpr int kBrokenPipe = EPIPE;
inline constexpr int kNotConnected = ENOTCONN;
inline constexpr int kBadDescriptor = EBADF;
inline constexpr int kNotSupported = EOPNOTSUPP;
inline constexpr int kInvalidArgument = EINVAL;
inline constexpr int kNoSys = ENOSYS;
}  // namespace error

}  // namespace sendpath
