#include "sendpath/buffer-pool.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "sendpath/log.hpp"

namespace sendpath {

BufferPool::Lease::Lease(Lease&& other) noexcept
    : _pool(std::exchange(other._pool, nullptr)), _buf(std::move(other._buf)), _size(other._size) {}

BufferPool::Lease& BufferPool::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    reset();
    _pool = std::exchange(other._pool, nullptr);
    _buf = std::move(other._buf);
    _size = other._size;
  }
  return *this;
}

void BufferPool::Lease::reset() noexcept {
  if (_buf) {
    _pool->release(std::move(_buf));
  }
  _pool = nullptr;
}

BufferPool::BufferPool(std::size_t bufferSize, std::size_t maxIdleBuffers)
    : _bufferSize(bufferSize), _maxIdleBuffers(maxIdleBuffers) {
  if (bufferSize == 0) {
    throw std::invalid_argument("BufferPool: bufferSize must be greater than 0");
  }
  if (maxIdleBuffers == 0) {
    throw std::invalid_argument("BufferPool: maxIdleBuffers must be greater than 0");
  }
  _idle.reserve(maxIdleBuffers);
}

BufferPool::~BufferPool() {
  if (outstanding() != 0) {
    log::error("BufferPool destroyed with {} buffer(s) still leased", outstanding());
  }
}

BufferPool::Lease BufferPool::acquire() {
  std::unique_ptr<std::byte[]> buf;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_idle.empty()) {
      buf = std::move(_idle.back());
      _idle.pop_back();
    }
  }
  if (!buf) {
    // Allocation happens outside of the lock. Uninitialized storage: every byte is written by a read before use.
    buf = std::make_unique_for_overwrite<std::byte[]>(_bufferSize);
  }
  _outstanding.fetch_add(1, std::memory_order_acq_rel);
  return {this, std::move(buf), _bufferSize};
}

std::size_t BufferPool::idle() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _idle.size();
}

void BufferPool::release(std::unique_ptr<std::byte[]> buf) noexcept {
  _outstanding.fetch_sub(1, std::memory_order_acq_rel);
  std::lock_guard<std::mutex> lock(_mutex);
  if (_idle.size() < _maxIdleBuffers) {
    // Cannot throw: capacity was reserved up to maxIdleBuffers at construction.
    _idle.push_back(std::move(buf));
  }
}

}  // namespace sendpath
