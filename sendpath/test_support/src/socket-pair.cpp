#include "sendpath/socket-pair.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <string>

#include "sendpath/base-fd.hpp"
#include "sendpath/errno-throw.hpp"

namespace sendpath::test {

SocketPair MakeSocketPair() {
  int sv[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) != 0) {
    ThrowErrno("socketpair failed");
  }
  return {BaseFd(sv[0]), BaseFd(sv[1])};
}

void SetSmallSendBuffer(int fd, int bytes) {
  if (::setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &bytes, sizeof(bytes)) != 0) {
    ThrowErrno("setsockopt(SO_SNDBUF) failed for fd # {}", fd);
  }
}

std::string ReadExactly(int fd, std::size_t expected) {
  std::string out(expected, '\0');
  std::size_t got = 0;
  while (got < expected) {
    const auto nb = ::read(fd, out.data() + got, expected - got);
    if (nb == 0) {
      break;
    }
    if (nb < 0) {
      if (errno == EINTR) {
        continue;
      }
      ThrowErrno("read failed for fd # {}", fd);
    }
    got += static_cast<std::size_t>(nb);
  }
  out.resize(got);
  return out;
}

}  // namespace sendpath::test
