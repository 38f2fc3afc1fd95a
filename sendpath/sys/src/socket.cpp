#include "sendpath/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>

#include "sendpath/base-fd.hpp"
#include "sendpath/errno-throw.hpp"
#include "sendpath/log.hpp"
#include "sendpath/socket-ops.hpp"

namespace sendpath {

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, SOCK_STREAM, protocol)) {
  if (!_baseFd) {
    ThrowErrno("Unable to create a new socket");
  }
  if (type == Type::StreamNonBlock && !SetNonBlocking(_baseFd.fd())) {
    ThrowErrno("Unable to set socket fd # {} non-blocking", _baseFd.fd());
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(uint16_t& port) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) == -1) {
    ThrowErrno("setsockopt(SO_REUSEADDR) failed for fd # {}", fd());
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    ThrowErrno("bind failed for port {}", port);
  }
  if (::listen(fd(), SOMAXCONN) == -1) {
    ThrowErrno("listen failed for fd # {}", fd());
  }
  if (port == 0) {
    socklen_t len = sizeof(addr);
    if (::getsockname(fd(), reinterpret_cast<sockaddr*>(&addr), &len) == -1) {
      ThrowErrno("getsockname failed for fd # {}", fd());
    }
    port = ntohs(addr.sin_port);
  }
  log::info("Listening on port {} (fd # {})", port, fd());
}

BaseFd Socket::accept() const noexcept { return BaseFd(::accept(fd(), nullptr, nullptr)); }

}  // namespace sendpath
