#include "sendpath/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <utility>

#include "sendpath/log.hpp"
#include "sendpath/platform.hpp"

namespace sendpath {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd != kClosedFd) {
    // POSIX leaves the descriptor state unspecified after EINTR; on Linux it is always released, so no retry.
    if (::close(_fd) != 0 && errno != EINTR) {
      const int err = errno;
      log::error("close fd # {} failed: errno={} msg={}", _fd, err, SystemErrorMessage(err));
    }
    log::debug("fd # {} closed", _fd);
    _fd = kClosedFd;
  }
}

NativeHandle BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace sendpath
