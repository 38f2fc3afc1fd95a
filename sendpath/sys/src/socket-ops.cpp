#include "sendpath/socket-ops.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

#include "sendpath/platform.hpp"

namespace sendpath {

bool SetNonBlocking(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool SetNoSigPipe(NativeHandle fd) noexcept {
#ifdef SENDPATH_MACOS
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &kEnable, sizeof(kEnable)) == 0;
#else
  // Linux uses MSG_NOSIGNAL per-send.
  (void)fd;
  return true;
#endif
}

int64_t SafeSend(NativeHandle fd, std::span<const std::byte> data) noexcept {
#ifdef SENDPATH_LINUX
  return static_cast<int64_t>(::send(fd, data.data(), data.size(), MSG_NOSIGNAL));
#else
  // macOS relies on SO_NOSIGPIPE set on the socket.
  return static_cast<int64_t>(::send(fd, data.data(), data.size(), 0));
#endif
}

PollWritable WaitWritable(NativeHandle fd, std::chrono::milliseconds timeout) noexcept {
  if (fd < 0) {
    // poll(2) silently ignores negative descriptors.
    return PollWritable::HangUp;
  }
  pollfd pfd{fd, POLLOUT, 0};
  const auto timeoutMs = static_cast<int>(std::min<std::chrono::milliseconds::rep>(
      timeout.count(), std::numeric_limits<int>::max()));
  for (;;) {
    const int rc = ::poll(&pfd, 1, timeoutMs);
    if (rc == 0) {
      return PollWritable::NotWritable;
    }
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return PollWritable::HangUp;
    }
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
      return PollWritable::HangUp;
    }
    return PollWritable::Writable;
  }
}

bool ShutdownWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

}  // namespace sendpath
