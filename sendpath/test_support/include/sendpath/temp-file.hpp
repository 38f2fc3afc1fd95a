#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace sendpath::test {

// ScopedTempFile: creates a uniquely-named file in the system temp directory and removes it on destruction.
class ScopedTempFile {
 public:
  // Create a temp file with the given content.
  explicit ScopedTempFile(std::string_view content);

  // Create a temp file with the given size and fill it with a repeating pattern starting from 'a'.
  // The full content is kept in memory and can be retrieved with content().
  explicit ScopedTempFile(std::uint64_t size);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  // Full path to the file
  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _path;
  std::string _content;
};

// Repeating 'a'..'z' pattern of the given size.
std::string PatternContent(std::uint64_t size);

}  // namespace sendpath::test
