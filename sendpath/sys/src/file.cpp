#include "sendpath/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "sendpath/log.hpp"
#include "sendpath/platform.hpp"

namespace sendpath {

namespace {

int Flags(File::OpenMode mode) {
  switch (mode) {
    case File::OpenMode::ReadOnly:
      return O_RDONLY | O_CLOEXEC;
    default:
      std::unreachable();
  }
}

int CheckFd(std::string_view path, int fd) {
  if (fd < 0) {
    const int err = errno;
    log::error("Unable to open file '{}' (errno {}: {})", path, err, SystemErrorMessage(err));
    return BaseFd::kClosedFd;
  }
  return fd;
}

}  // namespace

File::File(std::string_view path, OpenMode mode) : _fd(CheckFd(path, ::open(std::string(path).c_str(), Flags(mode)))) {
  loadSize(path);
}

File::File(const char* path, OpenMode mode) : _fd(CheckFd(path, ::open(path, Flags(mode)))) { loadSize(path); }

void File::loadSize(std::string_view path) {
  if (!_fd) {
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    const int err = errno;
    log::error("Unable to stat file '{}' (errno {}: {})", path, err, SystemErrorMessage(err));
    _fd.close();
    return;
  }
  _fileSize = static_cast<std::size_t>(st.st_size);
}

}  // namespace sendpath
