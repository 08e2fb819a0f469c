// Repository: Retrovue-wavecast
// Component: Avatar Cache
// Purpose: Session-scoped memo of decoded avatars, cleared between attempts.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_AVATAR_AVATAR_CACHE_HPP_
#define WAVECAST_AVATAR_AVATAR_CACHE_HPP_

#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include "wavecast/avatar/AvatarLoader.hpp"

namespace wavecast::avatar {

// AvatarCache remembers the outcome of each load, including failures, so a
// bad URL is fetched once per attempt. Owned by a GenerationSession; not
// thread-safe.
class AvatarCache {
 public:
  // Returns the decoded image, or nullptr when the source is empty or could
  // not be loaded (the synthesizer then draws the placeholder).
  std::shared_ptr<const render::RgbaImage> Get(const AvatarSource& source,
                                               const timing::StopSignal& stop);

  void Evict();

  size_t Size() const { return entries_.size(); }
  uint64_t loads() const { return loads_; }

  static std::string KeyFor(const AvatarSource& source);

 private:
  std::map<std::string, std::shared_ptr<const render::RgbaImage>> entries_;
  uint64_t loads_ = 0;
};

}  // namespace wavecast::avatar

#endif  // WAVECAST_AVATAR_AVATAR_CACHE_HPP_
