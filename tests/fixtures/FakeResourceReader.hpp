// Repository: Retrovue-wavecast
// Component: Fake Resource Reader (test only)
// Purpose: IResourceReader returning scripted disk and memory readings.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_TESTS_FIXTURES_FAKE_RESOURCE_READER_HPP_
#define WAVECAST_TESTS_FIXTURES_FAKE_RESOURCE_READER_HPP_

#include <atomic>
#include <cstdint>
#include <string>

#include "wavecast/resource/ResourceGuard.hpp"

namespace wavecast::tests::fixtures {

class FakeResourceReader : public resource::IResourceReader {
 public:
  std::atomic<uint64_t> free_disk_bytes{10ull * 1024 * 1024 * 1024};
  std::atomic<uint64_t> resident_memory_bytes{64ull * 1024 * 1024};
  std::atomic<bool> disk_read_fails{false};
  std::atomic<int> checks{0};
  std::string last_directory;

  bool FreeDiskBytes(const std::string& directory, uint64_t* out) override {
    checks++;
    last_directory = directory;
    if (disk_read_fails.load()) return false;
    *out = free_disk_bytes.load();
    return true;
  }

  bool ResidentMemoryBytes(uint64_t* out) override {
    *out = resident_memory_bytes.load();
    return true;
  }
};

}  // namespace wavecast::tests::fixtures

#endif  // WAVECAST_TESTS_FIXTURES_FAKE_RESOURCE_READER_HPP_
