// Repository: Retrovue-wavecast
// Component: Resource Guard
// Purpose: Point-in-time free-disk and resident-memory checks run before each
//          generation attempt.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_RESOURCE_RESOURCE_GUARD_HPP_
#define WAVECAST_RESOURCE_RESOURCE_GUARD_HPP_

#include <cstdint>
#include <memory>
#include <string>

namespace wavecast::resource {

struct ResourceSnapshot {
  uint64_t free_disk_bytes = 0;
  uint64_t resident_memory_bytes = 0;
};

struct ResourceLimits {
  uint64_t min_free_disk_bytes = 100ull * 1024 * 1024;      // 100 MiB
  uint64_t max_resident_memory_bytes = 1024ull * 1024 * 1024;  // 1 GiB
};

// Source of resource readings. Production: SystemResourceReader.
class IResourceReader {
 public:
  virtual ~IResourceReader() = default;

  // Free bytes available to this process on the filesystem holding
  // directory. Returns false when the directory cannot be inspected.
  virtual bool FreeDiskBytes(const std::string& directory, uint64_t* out) = 0;

  // Resident set size of this process.
  virtual bool ResidentMemoryBytes(uint64_t* out) = 0;
};

// SystemResourceReader reads statvfs(3) and /proc/self/statm.
class SystemResourceReader : public IResourceReader {
 public:
  bool FreeDiskBytes(const std::string& directory, uint64_t* out) override;
  bool ResidentMemoryBytes(uint64_t* out) override;
};

enum class ResourceCheck {
  kOk = 0,
  kDiskExhausted,
  kMemoryExhausted,
  kReadFailed,  // Output directory could not be inspected
};

const char* ResourceCheckToString(ResourceCheck check);

struct ResourceCheckResult {
  ResourceCheck status = ResourceCheck::kOk;
  ResourceSnapshot snapshot;
  std::string detail;

  bool ok() const { return status == ResourceCheck::kOk; }
};

// ResourceGuard compares a fresh snapshot against ResourceLimits. Disk is
// checked first; a memory reading that cannot be taken is not treated as a
// failure.
class ResourceGuard {
 public:
  ResourceGuard(std::shared_ptr<IResourceReader> reader, const ResourceLimits& limits);

  ResourceCheckResult Check(const std::string& output_path) const;

  const ResourceLimits& limits() const { return limits_; }

  // Directory part of a file path ("." when there is none).
  static std::string DirectoryOf(const std::string& path);

 private:
  std::shared_ptr<IResourceReader> reader_;
  ResourceLimits limits_;
};

}  // namespace wavecast::resource

#endif  // WAVECAST_RESOURCE_RESOURCE_GUARD_HPP_
