#pragma once

#include <cstddef>
#include <string>

#include "sendpath/base-fd.hpp"

namespace sendpath::test {

// Connected AF_UNIX stream sockets. `writer` is the end handed to transfers, `reader` plays the peer.
struct SocketPair {
  BaseFd writer;
  BaseFd reader;
};

// Throws std::system_error on failure.
SocketPair MakeSocketPair();

// Shrink the kernel send buffer of `fd` so that it fills after a few kilobytes.
void SetSmallSendBuffer(int fd, int bytes = 4096);

// Read from `fd` until `expected` bytes were received or the peer closed.
std::string ReadExactly(int fd, std::size_t expected);

}  // namespace sendpath::test
