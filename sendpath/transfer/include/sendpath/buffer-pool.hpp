#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace sendpath {

// Thread-safe pool of fixed-size byte buffers.
// A buffer is owned by exactly one Lease at a time and goes back to the pool when the Lease is destroyed,
// whatever the exit path of the code holding it. At most maxIdleBuffers idle buffers are retained; extra returned
// buffers are freed.
class BufferPool {
 public:
  class Lease {
   public:
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    ~Lease() { reset(); }

    [[nodiscard]] std::span<std::byte> buffer() const noexcept { return {_buf.get(), _buf ? _size : 0}; }

    // Return the buffer to its pool now. Idempotent.
    void reset() noexcept;

   private:
    friend class BufferPool;

    Lease(BufferPool* pool, std::unique_ptr<std::byte[]> buf, std::size_t size) noexcept
        : _pool(pool), _buf(std::move(buf)), _size(size) {}

    BufferPool* _pool;
    std::unique_ptr<std::byte[]> _buf;
    std::size_t _size;
  };

  // Throws std::invalid_argument if bufferSize or maxIdleBuffers is 0.
  BufferPool(std::size_t bufferSize, std::size_t maxIdleBuffers);

  BufferPool(const BufferPool&) = delete;
  BufferPool(BufferPool&&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;
  BufferPool& operator=(BufferPool&&) = delete;

  ~BufferPool();

  // Exclusive checkout of one buffer, reusing an idle one when available.
  [[nodiscard]] Lease acquire();

  [[nodiscard]] std::size_t bufferSize() const noexcept { return _bufferSize; }

  [[nodiscard]] std::size_t maxIdleBuffers() const noexcept { return _maxIdleBuffers; }

  // Number of buffers currently checked out.
  [[nodiscard]] std::size_t outstanding() const noexcept { return _outstanding.load(std::memory_order_acquire); }

  // Number of buffers waiting in the pool for reuse.
  [[nodiscard]] std::size_t idle() const;

 private:
  void release(std::unique_ptr<std::byte[]> buf) noexcept;

  mutable std::mutex _mutex;
  std::vector<std::unique_ptr<std::byte[]>> _idle;
  std::atomic<std::size_t> _outstanding{0};
  std::size_t _bufferSize;
  std::size_t _maxIdleBuffers;
};

}  // namespace sendpath
