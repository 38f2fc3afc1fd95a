#pragma once

#include <cerrno>
#include <system_error>
#include <utility>

#include "sendpath/log.hpp"

namespace sendpath {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: ThrowErrno("open failed for {}", path);
template <typename... Args>
[[noreturn]] void ThrowErrno(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  const int savedErr = errno;
  std::error_code ec(savedErr, std::generic_category());
  throw std::system_error(ec, fmt::format(fmt, std::forward<Args>(args)...));
}

}  // namespace sendpath
