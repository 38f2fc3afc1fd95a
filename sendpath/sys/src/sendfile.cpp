#include "sendpath/sendfile.hpp"

#include <sys/types.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>

#include "sendpath/platform.hpp"

#ifdef SENDPATH_LINUX
#include <pthread.h>
#include <sys/sendfile.h>

#include <csignal>
#include <ctime>
#elifdef SENDPATH_MACOS
#include <sys/socket.h>
#include <sys/uio.h>
#endif

namespace sendpath {

#ifdef SENDPATH_LINUX
namespace {

// Linux sendfile(2) has no MSG_NOSIGNAL equivalent. Block SIGPIPE for the calling thread while in scope and discard
// any SIGPIPE raised meanwhile, so that a vanished peer only surfaces as EPIPE. errno is preserved.
class SigPipeSuppressor {
 public:
  SigPipeSuppressor() noexcept {
    sigemptyset(&_sigPipe);
    sigaddset(&_sigPipe, SIGPIPE);
    sigset_t pending;
    sigemptyset(&pending);
    _alreadyPending = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
    _blocked = ::pthread_sigmask(SIG_BLOCK, &_sigPipe, &_previous) == 0;
  }

  SigPipeSuppressor(const SigPipeSuppressor&) = delete;
  SigPipeSuppressor(SigPipeSuppressor&&) = delete;
  SigPipeSuppressor& operator=(const SigPipeSuppressor&) = delete;
  SigPipeSuppressor& operator=(SigPipeSuppressor&&) = delete;

  ~SigPipeSuppressor() {
    if (!_blocked) {
      return;
    }
    const int savedErrno = errno;
    if (!_alreadyPending) {
      sigset_t pending;
      sigemptyset(&pending);
      if (::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
        timespec noWait{};
        ::sigtimedwait(&_sigPipe, nullptr, &noWait);
      }
    }
    ::pthread_sigmask(SIG_SETMASK, &_previous, nullptr);
    errno = savedErrno;
  }

 private:
  sigset_t _sigPipe;
  sigset_t _previous;
  bool _alreadyPending;
  bool _blocked;
};

}  // namespace
#endif

int64_t Sendfile(NativeHandle outFd, NativeHandle inFd, off_t& offset, std::size_t count) noexcept {
  count = std::min(count, kMaxSendfileChunk);
#ifdef SENDPATH_LINUX
  static_assert(sizeof(ssize_t) <= sizeof(int64_t), "ssize_t must fit in int64_t");
  SigPipeSuppressor sigPipeSuppressor;
  return static_cast<int64_t>(::sendfile(outFd, inFd, &offset, count));
#elifdef SENDPATH_MACOS
  auto len = static_cast<off_t>(count);
  const int rc = ::sendfile(inFd, outFd, offset, &len, nullptr, 0);
  if (rc == -1 && len == 0) {
    return -1;
  }
  offset += len;
  return static_cast<int64_t>(len);
#else
  (void)outFd;
  (void)inFd;
  (void)offset;
  errno = ENOSYS;
  return -1;
#endif
}

}  // namespace sendpath
