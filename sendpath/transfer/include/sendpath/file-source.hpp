#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "sendpath/file.hpp"
#include "sendpath/io-handles.hpp"
#include "sendpath/platform.hpp"

namespace sendpath {

// ISource over a borrowed file descriptor (regular file, memfd, block device…).
// The size is queried on every call so that a file truncated or closed by the caller is observed.
class FileSource final : public ISource {
 public:
  explicit FileSource(NativeHandle fd) noexcept : _fd(fd) {}

  explicit FileSource(const File& file) noexcept : _fd(file.fd()) {}

  [[nodiscard]] std::optional<std::uint64_t> size() const override;

  IoResult readAt(std::span<std::byte> dst, std::uint64_t offset) override;

  [[nodiscard]] NativeHandle nativeHandle() const noexcept override { return _fd; }

 private:
  NativeHandle _fd;
};

}  // namespace sendpath
