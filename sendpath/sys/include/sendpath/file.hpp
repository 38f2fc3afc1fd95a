#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "sendpath/base-fd.hpp"
#include "sendpath/platform.hpp"

namespace sendpath {

// Owning, read-only regular file.
class File {
 public:
  enum class OpenMode : uint8_t { ReadOnly };

  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path. On failure, the error is logged and operator bool() returns false.
  explicit File(const std::string& path, OpenMode mode = OpenMode::ReadOnly) : File(path.c_str(), mode) {}

  // Open a file by path. On failure, the error is logged and operator bool() returns false.
  explicit File(std::string_view path, OpenMode mode = OpenMode::ReadOnly);

  // Open a file by path (must be null-terminated). On failure, the error is logged and operator bool() returns false.
  explicit File(const char* path, OpenMode mode = OpenMode::ReadOnly);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Return the file size in bytes, at the time of opening (kError if not opened).
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Returns the raw underlying file descriptor. The File instance remains responsible for closing it.
  [[nodiscard]] NativeHandle fd() const noexcept { return _fd.fd(); }

  // Close the descriptor now. Any transfer still reading from it fails on its next attempt.
  void close() noexcept { _fd.close(); }

 private:
  void loadSize(std::string_view path);

  BaseFd _fd;
  std::size_t _fileSize{kError};
};

}  // namespace sendpath
