// Repository: Retrovue-wavecast
// Component: Pixel Buffer Pool Tests
// Purpose: Bounded outstanding buffers, reuse, drain and safe late release.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "wavecast/render/PixelBufferPool.hpp"

namespace wavecast::render::testing {
namespace {

// =============================================================================
// Capacity bound
// =============================================================================

TEST(PixelBufferPoolTest, AcquireFailsBeyondCapacity) {
  PixelBufferPool pool(64, 32, 3);
  std::vector<PixelBufferPool::Handle> held;
  for (int i = 0; i < 3; ++i) {
    held.push_back(pool.Acquire());
    ASSERT_TRUE(held.back());
    EXPECT_EQ(held.back()->width, 64);
    EXPECT_EQ(held.back()->height, 32);
  }
  EXPECT_EQ(pool.Outstanding(), 3u);
  EXPECT_FALSE(pool.Acquire());

  held.pop_back();
  EXPECT_EQ(pool.Outstanding(), 2u);
  EXPECT_TRUE(pool.Acquire());
}

TEST(PixelBufferPoolTest, ZeroCapacityIsTreatedAsOne) {
  PixelBufferPool pool(8, 8, 0);
  EXPECT_EQ(pool.Capacity(), 1u);
  PixelBufferPool::Handle a = pool.Acquire();
  EXPECT_TRUE(a);
  EXPECT_FALSE(pool.Acquire());
}

// =============================================================================
// Reuse
// =============================================================================

TEST(PixelBufferPoolTest, ReleasedBufferIsReused) {
  PixelBufferPool pool(16, 16, 2);
  const PixelBuffer* first = nullptr;
  {
    PixelBufferPool::Handle h = pool.Acquire();
    first = h.get();
  }
  EXPECT_EQ(pool.Idle(), 1u);
  PixelBufferPool::Handle again = pool.Acquire();
  EXPECT_EQ(again.get(), first);
  EXPECT_EQ(pool.Idle(), 0u);
}

TEST(PixelBufferPoolTest, DrainFreesIdleBuffersOnly) {
  PixelBufferPool pool(16, 16, 3);
  PixelBufferPool::Handle kept = pool.Acquire();
  { PixelBufferPool::Handle released = pool.Acquire(); }
  EXPECT_EQ(pool.Idle(), 1u);
  pool.Drain();
  EXPECT_EQ(pool.Idle(), 0u);
  EXPECT_EQ(pool.Outstanding(), 1u);
  EXPECT_TRUE(kept);
}

TEST(PixelBufferPoolTest, HandleMayOutlivePool) {
  PixelBufferPool::Handle survivor;
  {
    PixelBufferPool pool(4, 4, 1);
    survivor = pool.Acquire();
    ASSERT_TRUE(survivor);
  }
  survivor->data[0] = 1;
  survivor.reset();  // Pool state is gone; the buffer is simply freed.
  SUCCEED();
}

}  // namespace
}  // namespace wavecast::render::testing
