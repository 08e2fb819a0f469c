// Repository: Retrovue-wavecast
// Component: Pixel Buffer Pool
// Purpose: Bounded set of reusable frame rasters; bounds in-flight frames
//          between the synthesizer and the encoder.
// Copyright (c) 2025 RetroVue

#include "wavecast/render/PixelBufferPool.hpp"

namespace wavecast::render {

void PixelBufferPool::Recycler::operator()(PixelBuffer* buffer) const {
  std::unique_ptr<PixelBuffer> owned(buffer);
  std::shared_ptr<State> s = state.lock();
  if (!s || !owned) return;
  std::lock_guard<std::mutex> lock(s->mutex);
  if (s->outstanding > 0) s->outstanding--;
  if (owned->width == s->width && owned->height == s->height) {
    s->idle.push_back(std::move(owned));
  }
}

PixelBufferPool::PixelBufferPool(int width, int height, size_t capacity)
    : state_(std::make_shared<State>()) {
  state_->width = width;
  state_->height = height;
  state_->capacity = capacity > 0 ? capacity : 1;
}

PixelBufferPool::~PixelBufferPool() = default;

PixelBufferPool::Handle PixelBufferPool::Acquire() {
  std::unique_ptr<PixelBuffer> buffer;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->outstanding >= state_->capacity) {
      return Handle(nullptr, Recycler{state_});
    }
    state_->outstanding++;
    if (!state_->idle.empty()) {
      buffer = std::move(state_->idle.back());
      state_->idle.pop_back();
    }
  }
  if (!buffer) {
    buffer = std::make_unique<PixelBuffer>(state_->width, state_->height);
  }
  return Handle(buffer.release(), Recycler{state_});
}

void PixelBufferPool::Drain() {
  std::vector<std::unique_ptr<PixelBuffer>> released;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    released.swap(state_->idle);
  }
}

int PixelBufferPool::width() const { return state_->width; }
int PixelBufferPool::height() const { return state_->height; }

size_t PixelBufferPool::Capacity() const {
  return state_->capacity;
}

size_t PixelBufferPool::Outstanding() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->outstanding;
}

size_t PixelBufferPool::Idle() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->idle.size();
}

}  // namespace wavecast::render
