#pragma once

#include <cstdint>
#include <string_view>

namespace sendpath {

// Reasons a transfer can end without completing. Carried by value in TransferResult, never thrown.
enum class TransferError : std::uint8_t {
  UnsupportedRequest,  // offset / length outside of the source
  SourceUnavailable,   // source read failed, was closed, or ended before the requested length
  DestinationClosed,   // peer reset, broken pipe, or destination handle closed
  StalledTransfer,     // idle-retry budget exhausted while the destination stayed unwritable
  PartialBufferFlush,  // fallback path could not flush a buffer after repeated zero-byte writes
};

std::string_view TransferErrorToString(TransferError error) noexcept;

}  // namespace sendpath
