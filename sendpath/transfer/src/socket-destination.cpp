#include "sendpath/socket-destination.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <span>

#include "sendpath/log.hpp"
#include "sendpath/platform.hpp"
#include "sendpath/socket-ops.hpp"

namespace sendpath {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

SocketDestination::SocketDestination(NativeHandle fd) noexcept : _fd(fd) {
  if (!SetNoSigPipe(_fd)) {
    const int err = LastSystemError();
    log::warn("Unable to disable SIGPIPE on fd # {} errno={} msg={}", _fd, err, SystemErrorMessage(err));
  }
}

IoResult SocketDestination::write(std::span<const std::byte> data) {
  for (;;) {
    const auto nbWritten = SafeSend(_fd, data);
    if (nbWritten >= 0) {
      return {static_cast<std::size_t>(nbWritten), 0};
    }
    if (errno != EINTR) {
      return {0, errno};
    }
  }
}

Readiness SocketDestination::waitWritable(std::chrono::milliseconds timeout) {
  switch (WaitWritable(_fd, timeout)) {
    case PollWritable::Writable:
      return Readiness::Writable;
    case PollWritable::NotWritable:
      return Readiness::NotWritable;
    default:
      return Readiness::Closed;
  }
}

}  // namespace sendpath
