// Repository: Retrovue-wavecast
// Component: Avatar Loader
// Purpose: Decodes PNG/JPEG avatars from memory, files or http(s) URLs.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_AVATAR_AVATAR_LOADER_HPP_
#define WAVECAST_AVATAR_AVATAR_LOADER_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "wavecast/render/PixelBuffer.hpp"
#include "wavecast/timing/StopSignal.hpp"

namespace wavecast::avatar {

constexpr size_t kMaxAvatarBytes = 8u * 1024u * 1024u;
constexpr int kMaxAvatarDimension = 4096;

enum class AvatarError {
  kNone = 0,
  kFetchFailed,        // URL/file could not be opened or read
  kTooLarge,           // Encoded size or decoded dimensions over the cap
  kUnsupportedFormat,  // Neither PNG nor JPEG
  kDecodeFailed,       // Codec rejected the data
  kCancelled,
};

const char* AvatarErrorToString(AvatarError error);

struct AvatarLoadResult {
  bool ok;
  AvatarError error;
  std::string detail;
  std::shared_ptr<const render::RgbaImage> image;

  static AvatarLoadResult Success(std::shared_ptr<const render::RgbaImage> img) {
    return {true, AvatarError::kNone, "", std::move(img)};
  }

  static AvatarLoadResult Failure(AvatarError err, const std::string& detail = "") {
    return {false, err, detail, nullptr};
  }
};

// Protocols AVIO may use for an avatar, including those http(s) sits on.
constexpr const char* kAvatarProtocolWhitelist = "file,http,https,tcp,tls";

// An avatar is given either as a URI (local path, file:, http:, https:) or
// as raw encoded bytes. Bytes win when both are present.
struct AvatarSource {
  std::string uri;
  std::vector<uint8_t> bytes;

  bool Empty() const { return uri.empty() && bytes.empty(); }
};

class AvatarLoader {
 public:
  // Sniffs the PNG/JPEG signature and decodes to RGBA8.
  static AvatarLoadResult Decode(const std::vector<uint8_t>& encoded);

  // Reads at most max_bytes through libavformat's AVIO layer. The stop
  // signal is wired into AVIO's interrupt callback.
  static AvatarLoadResult Fetch(const std::string& uri,
                                const timing::StopSignal& stop = timing::StopSignal(),
                                size_t max_bytes = kMaxAvatarBytes);

  // True for plain paths and file:, http: and https: URIs. Fetch refuses
  // everything else before touching AVIO.
  static bool IsAllowedUri(const std::string& uri);

  static AvatarLoadResult Load(const AvatarSource& source,
                               const timing::StopSignal& stop = timing::StopSignal());

  static bool LooksLikePng(const std::vector<uint8_t>& data);
  static bool LooksLikeJpeg(const std::vector<uint8_t>& data);

 private:
  static AvatarLoadResult DecodePng(const std::vector<uint8_t>& encoded);
  static AvatarLoadResult DecodeJpeg(const std::vector<uint8_t>& encoded);
};

}  // namespace wavecast::avatar

#endif  // WAVECAST_AVATAR_AVATAR_LOADER_HPP_
