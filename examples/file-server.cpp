#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "sendpath/base-fd.hpp"
#include "sendpath/capability-profile.hpp"
#include "sendpath/file-source.hpp"
#include "sendpath/file.hpp"
#include "sendpath/log.hpp"
#include "sendpath/platform.hpp"
#include "sendpath/socket-destination.hpp"
#include "sendpath/socket-ops.hpp"
#include "sendpath/socket.hpp"
#include "sendpath/transfer-engine.hpp"
#include "sendpath/transfer-error.hpp"
#include "sendpath/transfer-metrics.hpp"

using namespace sendpath;

namespace {

// Streams the whole file to one client, then closes the write side.
void Serve(TransferEngine& engine, const std::string& path, BaseFd client) {
  File file(path);
  if (!file) {
    return;
  }
  FileSource source(file);
  SocketDestination destination(client.fd());

  const auto result = engine.transfer({.source = source, .destination = destination});
  if (result.error) {
    log::warn("Client fd # {}: {} after {} bytes", client.fd(), TransferErrorToString(*result.error),
              result.bytesTransferred);
  }
  if (!ShutdownWrite(client.fd())) {
    log::debug("shutdown failed on fd # {}", client.fd());
  }
  log::info("{}", engine.metrics().snapshot().json_str());
}

}  // namespace

int main(int argc, char** argv) {
  uint16_t port = 0;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  std::string path;
  if (argc > 2) {
    path = argv[2];
  } else {
    // create a small temporary file in /tmp
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "sendpath-file-server-example.txt";
    std::ofstream ofs(tmp);
    ofs << "This is a sendpath example file.\n";
    ofs << "You can pass a path as the second argument to use your own file.\n";
    ofs.close();
    path = tmp.string();
  }

  try {
    TransferEngine engine(CapabilityProfile::Detect());
    Socket listener(Socket::Type::Stream);
    listener.bindAndListen(port);

    std::cout << "Serving " << path << " on port " << port << " - connect with e.g. nc localhost " << port << "\n";

    // The accept loop never returns: engine and path outlive every detached worker.
    for (;;) {
      BaseFd client = listener.accept();
      if (!client) {
        const int err = LastSystemError();
        log::error("accept failed errno={} msg={}", err, SystemErrorMessage(err));
        continue;
      }
      try {
        std::thread(Serve, std::ref(engine), std::cref(path), std::move(client)).detach();
      } catch (const std::system_error& e) {
        log::error("Unable to start a worker thread: {}", e.what());
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
}
