// Repository: Retrovue-wavecast
// Component: Pixel Buffer Pool
// Purpose: Bounded set of reusable frame rasters; bounds in-flight frames
//          between the synthesizer and the encoder.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_RENDER_PIXEL_BUFFER_POOL_HPP_
#define WAVECAST_RENDER_PIXEL_BUFFER_POOL_HPP_

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "wavecast/render/PixelBuffer.hpp"

namespace wavecast::render {

constexpr size_t kDefaultPoolCapacity = 3;

// PixelBufferPool hands out at most Capacity() buffers at a time. A handle
// returns its buffer to the pool when destroyed; handles may outlive the
// pool, in which case the buffer is simply freed.
//
// Thread-safe: handles may be released from any thread.
class PixelBufferPool {
 private:
  struct State;

 public:
  struct Recycler {
    std::weak_ptr<State> state;
    void operator()(PixelBuffer* buffer) const;
  };
  using Handle = std::unique_ptr<PixelBuffer, Recycler>;

  PixelBufferPool(int width, int height, size_t capacity = kDefaultPoolCapacity);
  ~PixelBufferPool();

  PixelBufferPool(const PixelBufferPool&) = delete;
  PixelBufferPool& operator=(const PixelBufferPool&) = delete;

  // Returns a width x height buffer with unspecified contents, or an empty
  // handle when Capacity() buffers are already outstanding.
  Handle Acquire();

  // Frees every idle buffer. Outstanding buffers are unaffected.
  void Drain();

  int width() const;
  int height() const;
  size_t Capacity() const;
  size_t Outstanding() const;
  size_t Idle() const;

 private:
  struct State {
    std::mutex mutex;
    int width = 0;
    int height = 0;
    size_t capacity = 0;
    size_t outstanding = 0;
    std::vector<std::unique_ptr<PixelBuffer>> idle;
  };

  std::shared_ptr<State> state_;
};

}  // namespace wavecast::render

#endif  // WAVECAST_RENDER_PIXEL_BUFFER_POOL_HPP_
