#include "sendpath/file-source.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "sendpath/log.hpp"
#include "sendpath/platform.hpp"

namespace sendpath {

std::optional<std::uint64_t> FileSource::size() const {
  struct stat st{};
  if (::fstat(_fd, &st) != 0) {
    const int err = errno;
    log::error("fstat failed for source fd # {} errno={} msg={}", _fd, err, SystemErrorMessage(err));
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(st.st_size);
}

IoResult FileSource::readAt(std::span<std::byte> dst, std::uint64_t offset) {
  for (;;) {
    const auto nbRead = ::pread(_fd, dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return {static_cast<std::size_t>(nbRead), 0};
    }
    if (errno != EINTR) {
      return {0, errno};
    }
  }
}

}  // namespace sendpath
