// Repository: Retrovue-wavecast
// Component: Avatar Cache
// Purpose: Session-scoped memo of decoded avatars, cleared between attempts.
// Copyright (c) 2025 RetroVue

#include "wavecast/avatar/AvatarCache.hpp"

#include <sstream>

#include "wavecast/util/Logger.hpp"

namespace wavecast::avatar {

using util::Logger;

std::string AvatarCache::KeyFor(const AvatarSource& source) {
  if (source.bytes.empty()) return "uri:" + source.uri;
  // FNV-1a over the encoded bytes.
  uint64_t hash = 1469598103934665603ULL;
  for (uint8_t b : source.bytes) {
    hash ^= b;
    hash *= 1099511628211ULL;
  }
  std::ostringstream oss;
  oss << "bytes:" << source.bytes.size() << ":" << std::hex << hash;
  return oss.str();
}

std::shared_ptr<const render::RgbaImage> AvatarCache::Get(const AvatarSource& source,
                                                          const timing::StopSignal& stop) {
  if (source.Empty()) return nullptr;

  const std::string key = KeyFor(source);
  auto it = entries_.find(key);
  if (it != entries_.end()) return it->second;

  loads_++;
  AvatarLoadResult result = AvatarLoader::Load(source, stop);
  if (!result.ok) {
    std::ostringstream oss;
    oss << "[AvatarCache] Avatar unavailable (" << AvatarErrorToString(result.error)
        << "): " << result.detail << "; using placeholder";
    Logger::Warn(oss.str());
    // A cancelled load is not remembered; the next attempt tries again.
    if (result.error == AvatarError::kCancelled) return nullptr;
  }
  entries_[key] = result.image;
  return result.image;
}

void AvatarCache::Evict() {
  if (!entries_.empty()) {
    Logger::Debug("[AvatarCache] Evicting " + std::to_string(entries_.size()) + " entries");
  }
  entries_.clear();
}

}  // namespace wavecast::avatar
