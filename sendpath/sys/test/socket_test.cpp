#include "sendpath/socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <span>
#include <string>

#include "sendpath/base-fd.hpp"
#include "sendpath/socket-ops.hpp"
#include "sendpath/socket-pair.hpp"

namespace sendpath {

namespace {

BaseFd ConnectLoopback(uint16_t port) {
  BaseFd client(::socket(AF_INET, SOCK_STREAM, 0));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (!client || ::connect(client.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    return BaseFd{};
  }
  return client;
}

}  // namespace

TEST(SocketTest, DefaultIsClosed) {
  Socket sock;
  EXPECT_FALSE(sock);
}

TEST(SocketTest, ListenOnEphemeralPortAndAccept) {
  Socket listener(Socket::Type::Stream);
  ASSERT_TRUE(listener);
  uint16_t port = 0;
  listener.bindAndListen(port);
  EXPECT_NE(port, 0);

  BaseFd client = ConnectLoopback(port);
  ASSERT_TRUE(client);
  BaseFd accepted = listener.accept();
  ASSERT_TRUE(accepted);

  const std::string payload = "ping";
  ASSERT_EQ(SafeSend(client.fd(), std::as_bytes(std::span(payload))), 4);
  EXPECT_EQ(test::ReadExactly(accepted.fd(), 4), payload);
}

TEST(SocketTest, NonBlockingAcceptWithoutPendingConnection) {
  Socket listener(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  listener.bindAndListen(port);
  EXPECT_NE(::fcntl(listener.fd(), F_GETFL, 0) & O_NONBLOCK, 0);

  BaseFd accepted = listener.accept();
  EXPECT_FALSE(accepted);
}

}  // namespace sendpath
