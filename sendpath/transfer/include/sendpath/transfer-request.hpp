#pragma once

#include <cstdint>

#include "sendpath/io-handles.hpp"

namespace sendpath {

// One unit of work: move `length` bytes of `source` starting at `offset` into `destination`.
// Both handles are borrowed for the duration of the call only; the caller keeps ownership.
struct TransferRequest {
  ISource& source;
  IDestination& destination;
  std::uint64_t offset{0};
  // 0 means the remainder of the source from offset.
  std::uint64_t length{0};
  // Encrypted connections must see every byte in user space, which rules out zero-copy.
  bool requiresEncryption{false};
};

}  // namespace sendpath
