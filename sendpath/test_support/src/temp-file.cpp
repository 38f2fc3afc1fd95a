#include "sendpath/temp-file.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "sendpath/base-fd.hpp"
#include "sendpath/log.hpp"

namespace sendpath::test {

std::string PatternContent(std::uint64_t size) {
  std::string content(size, '\0');
  for (std::uint64_t pos = 0; pos < size; ++pos) {
    content[pos] = static_cast<char>('a' + (pos % 26));
  }
  return content;
}

ScopedTempFile::ScopedTempFile(std::string_view content) : _content(content) {
  // mkstemp gives an atomic create+open and avoids races between concurrently running tests.
  std::string tmpl = (std::filesystem::temp_directory_path() / "sendpath_temp_XXXXXX").string();

  BaseFd raii(::mkstemp(tmpl.data()));
  if (!raii) {
    throw std::system_error(errno, std::generic_category(), "ScopedTempFile: mkstemp failed");
  }
  _path = std::filesystem::path(tmpl);

  std::size_t written = 0;
  while (written < _content.size()) {
    const auto nb = ::write(raii.fd(), _content.data() + written, _content.size() - written);
    if (nb <= 0) {
      const int err = errno;
      cleanup();
      throw std::system_error(err, std::generic_category(), "ScopedTempFile: write failed");
    }
    written += static_cast<std::size_t>(nb);
  }
}

ScopedTempFile::ScopedTempFile(std::uint64_t size) : ScopedTempFile(std::string_view(PatternContent(size))) {}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    _content = std::move(other._content);
    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  if (!_path.empty()) {
    std::error_code ec;
    if (!std::filesystem::remove(_path, ec) || ec) {
      log::error("ScopedTempFile::cleanup: remove({}) failed: {} ({})", _path.string(), ec.value(), ec.message());
    }
    _path.clear();
  }
}

}  // namespace sendpath::test
