#pragma once

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "sendpath/io-handles.hpp"
#include "sendpath/platform.hpp"

namespace sendpath::test {

// In-memory ISource with injectable failures. It has no kernel descriptor, so it always takes the buffered path.
class MemorySource : public ISource {
 public:
  explicit MemorySource(std::string content) : _content(std::move(content)) {}

  [[nodiscard]] std::optional<std::uint64_t> size() const override;

  IoResult readAt(std::span<std::byte> dst, std::uint64_t offset) override;

  // size() returns nullopt from now on.
  void failSizeQuery() noexcept { _sizeFails = true; }

  // Reads at or after `offset` fail with `err`.
  void failReadsFrom(std::uint64_t offset, int err = EIO) noexcept {
    _failFrom = offset;
    _failErr = err;
  }

  // Reads report end of source at `offset` while size() still reports the full content.
  void truncateReadsAt(std::uint64_t offset) noexcept { _readLimit = offset; }

  [[nodiscard]] std::size_t nbReads() const noexcept { return _nbReads; }

 private:
  std::string _content;
  std::uint64_t _readLimit{std::numeric_limits<std::uint64_t>::max()};
  std::optional<std::uint64_t> _failFrom;
  int _failErr{0};
  std::size_t _nbReads{0};
  bool _sizeFails{false};
};

// IDestination whose reaction to each write / sendFrom attempt follows a script.
// Accepted bytes are appended to received(). sendFrom reads the accepted bytes from the given descriptor with pread,
// so a real file source can be combined with a fully controlled destination.
class ScriptedDestination : public IDestination {
 public:
  struct Step {
    enum class Kind : std::uint8_t { Accept, WouldBlock, AcceptNothing, Fail };

    Kind kind{Kind::Accept};
    std::size_t maxBytes{std::numeric_limits<std::size_t>::max()};
    int err{0};
  };

  static Step Accept(std::size_t maxBytes = std::numeric_limits<std::size_t>::max()) {
    return {Step::Kind::Accept, maxBytes, 0};
  }
  static Step WouldBlock() { return {Step::Kind::WouldBlock, 0, error::kWouldBlock}; }
  static Step AcceptNothing() { return {Step::Kind::AcceptNothing, 0, 0}; }
  static Step Fail(int err) { return {Step::Kind::Fail, 0, err}; }

  // Steps consumed one per attempt, in order. Once exhausted, defaultStep() applies.
  void script(std::initializer_list<Step> steps) { _steps.insert(_steps.end(), steps.begin(), steps.end()); }

  void setDefaultStep(Step step) noexcept { _defaultStep = step; }

  // Results of successive waitWritable calls. Once exhausted, Writable is returned (Closed after closure).
  void scriptReadiness(std::initializer_list<Readiness> states) {
    _readiness.insert(_readiness.end(), states.begin(), states.end());
  }

  // Behave like a peer that goes away after accepting exactly `bytes` bytes: later attempts fail with EPIPE.
  void closeAfter(std::size_t bytes) noexcept { _closeAfter = bytes; }

  // Advertise the zero-copy primitive (sendFrom) to the engine.
  void enableZeroCopy(bool enable = true) noexcept { _zeroCopy = enable; }

  IoResult write(std::span<const std::byte> data) override;

  Readiness waitWritable(std::chrono::milliseconds timeout) override;

  [[nodiscard]] bool acceptsZeroCopy() const noexcept override { return _zeroCopy; }

  IoResult sendFrom(NativeHandle inFd, std::uint64_t offset, std::size_t count) override;

  [[nodiscard]] const std::string& received() const noexcept { return _received; }

  [[nodiscard]] std::size_t nbWrites() const noexcept { return _nbWrites; }

  // Requested count of each sendFrom call, in order.
  [[nodiscard]] const std::vector<std::size_t>& sendFromCounts() const noexcept { return _sendFromCounts; }

  // Timeouts passed to each waitWritable call, in order (0 for readiness probes).
  [[nodiscard]] const std::vector<std::chrono::milliseconds>& waits() const noexcept { return _waits; }

 private:
  [[nodiscard]] bool closed() const noexcept { return _closeAfter && _received.size() >= *_closeAfter; }

  // Next step, with the accepted byte count clamped to `wanted` and to the closure point.
  Step nextStep(std::size_t wanted);

  std::deque<Step> _steps;
  std::deque<Readiness> _readiness;
  std::vector<std::size_t> _sendFromCounts;
  std::vector<std::chrono::milliseconds> _waits;
  std::string _received;
  std::optional<std::size_t> _closeAfter;
  Step _defaultStep;
  std::size_t _nbWrites{0};
  bool _zeroCopy{false};
};

}  // namespace sendpath::test
