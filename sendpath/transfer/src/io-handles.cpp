#include "sendpath/io-handles.hpp"

#include <sys/types.h>

#include <cstddef>
#include <cstdint>

#include "sendpath/platform.hpp"
#include "sendpath/sendfile.hpp"

namespace sendpath {

IoResult IDestination::sendFrom(NativeHandle inFd, std::uint64_t offset, std::size_t count) {
  auto off = static_cast<off_t>(offset);
  const int64_t nbSent = Sendfile(nativeHandle(), inFd, off, count);
  if (nbSent == -1) [[unlikely]] {
    return {0, LastSystemError()};
  }
  return {static_cast<std::size_t>(nbSent), 0};
}

}  // namespace sendpath
