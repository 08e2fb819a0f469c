// Repository: Retrovue-wavecast
// Component: Resource Guard
// Purpose: Point-in-time free-disk and resident-memory checks run before each
//          generation attempt.
// Copyright (c) 2025 RetroVue

#include "wavecast/resource/ResourceGuard.hpp"

#include <sys/statvfs.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "wavecast/util/Logger.hpp"

namespace wavecast::resource {

using util::Logger;

const char* ResourceCheckToString(ResourceCheck check) {
  switch (check) {
    case ResourceCheck::kOk: return "Ok";
    case ResourceCheck::kDiskExhausted: return "DiskExhausted";
    case ResourceCheck::kMemoryExhausted: return "MemoryExhausted";
    case ResourceCheck::kReadFailed: return "ReadFailed";
  }
  return "Unknown";
}

bool SystemResourceReader::FreeDiskBytes(const std::string& directory, uint64_t* out) {
  struct statvfs st;
  if (::statvfs(directory.c_str(), &st) != 0) {
    Logger::Warn("[ResourceGuard] statvfs(" + directory + ") failed: " + std::strerror(errno));
    return false;
  }
  *out = static_cast<uint64_t>(st.f_bavail) * static_cast<uint64_t>(st.f_frsize);
  return true;
}

bool SystemResourceReader::ResidentMemoryBytes(uint64_t* out) {
  std::ifstream statm("/proc/self/statm");
  uint64_t size_pages = 0;
  uint64_t resident_pages = 0;
  if (!(statm >> size_pages >> resident_pages)) {
    return false;
  }
  const long page = ::sysconf(_SC_PAGESIZE);
  *out = resident_pages * static_cast<uint64_t>(page > 0 ? page : 4096);
  return true;
}

ResourceGuard::ResourceGuard(std::shared_ptr<IResourceReader> reader, const ResourceLimits& limits)
    : reader_(std::move(reader)), limits_(limits) {}

std::string ResourceGuard::DirectoryOf(const std::string& path) {
  const std::string::size_type slash = path.find_last_of('/');
  if (slash == std::string::npos) return ".";
  if (slash == 0) return "/";
  return path.substr(0, slash);
}

ResourceCheckResult ResourceGuard::Check(const std::string& output_path) const {
  ResourceCheckResult result;
  if (!reader_) return result;

  const std::string dir = DirectoryOf(output_path);
  if (!reader_->FreeDiskBytes(dir, &result.snapshot.free_disk_bytes)) {
    result.status = ResourceCheck::kReadFailed;
    result.detail = "cannot inspect output directory " + dir;
    return result;
  }
  if (result.snapshot.free_disk_bytes < limits_.min_free_disk_bytes) {
    std::ostringstream oss;
    oss << "free disk " << result.snapshot.free_disk_bytes << " bytes on " << dir
        << " below " << limits_.min_free_disk_bytes;
    result.status = ResourceCheck::kDiskExhausted;
    result.detail = oss.str();
    return result;
  }

  if (reader_->ResidentMemoryBytes(&result.snapshot.resident_memory_bytes) &&
      result.snapshot.resident_memory_bytes > limits_.max_resident_memory_bytes) {
    std::ostringstream oss;
    oss << "resident memory " << result.snapshot.resident_memory_bytes << " bytes above "
        << limits_.max_resident_memory_bytes;
    result.status = ResourceCheck::kMemoryExhausted;
    result.detail = oss.str();
  }
  return result;
}

}  // namespace wavecast::resource
