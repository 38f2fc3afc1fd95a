#include "sendpath/fake-handles.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>

#include "sendpath/io-handles.hpp"
#include "sendpath/platform.hpp"

namespace sendpath::test {

std::optional<std::uint64_t> MemorySource::size() const {
  if (_sizeFails) {
    return std::nullopt;
  }
  return _content.size();
}

IoResult MemorySource::readAt(std::span<std::byte> dst, std::uint64_t offset) {
  ++_nbReads;
  if (_failFrom && offset >= *_failFrom) {
    return {0, _failErr};
  }
  const std::uint64_t limit = std::min<std::uint64_t>(_content.size(), _readLimit);
  if (offset >= limit) {
    return {0, 0};
  }
  const auto nb = static_cast<std::size_t>(std::min<std::uint64_t>(dst.size(), limit - offset));
  std::memcpy(dst.data(), _content.data() + offset, nb);
  return {nb, 0};
}

ScriptedDestination::Step ScriptedDestination::nextStep(std::size_t wanted) {
  if (closed()) {
    return Fail(error::kBrokenPipe);
  }
  Step step = _defaultStep;
  if (!_steps.empty()) {
    step = _steps.front();
    _steps.pop_front();
  }
  if (step.kind == Step::Kind::Accept) {
    step.maxBytes = std::min(step.maxBytes, wanted);
    if (_closeAfter) {
      step.maxBytes = std::min(step.maxBytes, *_closeAfter - _received.size());
    }
  }
  return step;
}

IoResult ScriptedDestination::write(std::span<const std::byte> data) {
  ++_nbWrites;
  const Step step = nextStep(data.size());
  switch (step.kind) {
    case Step::Kind::Accept:
      _received.append(reinterpret_cast<const char*>(data.data()), step.maxBytes);
      return {step.maxBytes, 0};
    case Step::Kind::AcceptNothing:
      return {0, 0};
    default:
      return {0, step.err};
  }
}

Readiness ScriptedDestination::waitWritable(std::chrono::milliseconds timeout) {
  _waits.push_back(timeout);
  if (closed()) {
    return Readiness::Closed;
  }
  if (_readiness.empty()) {
    return Readiness::Writable;
  }
  const Readiness readiness = _readiness.front();
  _readiness.pop_front();
  return readiness;
}

IoResult ScriptedDestination::sendFrom(NativeHandle inFd, std::uint64_t offset, std::size_t count) {
  _sendFromCounts.push_back(count);
  const Step step = nextStep(count);
  switch (step.kind) {
    case Step::Kind::Accept: {
      std::string chunk(step.maxBytes, '\0');
      const auto nb = ::pread(inFd, chunk.data(), chunk.size(), static_cast<off_t>(offset));
      if (nb < 0) {
        return {0, errno};
      }
      _received.append(chunk.data(), static_cast<std::size_t>(nb));
      return {static_cast<std::size_t>(nb), 0};
    }
    case Step::Kind::AcceptNothing:
      return {0, 0};
    default:
      return {0, step.err};
  }
}

}  // namespace sendpath::test
