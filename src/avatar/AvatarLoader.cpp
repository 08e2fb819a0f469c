// Repository: Retrovue-wavecast
// Component: Avatar Loader
// Purpose: Decodes PNG/JPEG avatars from memory, files or http(s) URLs.
// Copyright (c) 2025 RetroVue

#include "wavecast/avatar/AvatarLoader.hpp"

#include <cctype>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <sstream>

#include <jpeglib.h>
#include <png.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

#include "wavecast/util/Logger.hpp"

namespace wavecast::avatar {

using util::Logger;

const char* AvatarErrorToString(AvatarError error) {
  switch (error) {
    case AvatarError::kNone: return "None";
    case AvatarError::kFetchFailed: return "FetchFailed";
    case AvatarError::kTooLarge: return "TooLarge";
    case AvatarError::kUnsupportedFormat: return "UnsupportedFormat";
    case AvatarError::kDecodeFailed: return "DecodeFailed";
    case AvatarError::kCancelled: return "Cancelled";
  }
  return "Unknown";
}

namespace {

std::string AvErrorString(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return buf;
}

void EnsureNetworkInit() {
  static std::once_flag once;
  std::call_once(once, []() { avformat_network_init(); });
}

int StopThunk(void* opaque) {
  const auto* stop = static_cast<const timing::StopSignal*>(opaque);
  return (stop != nullptr && stop->StopRequested()) ? 1 : 0;
}

// ---- PNG (libpng) ----------------------------------------------------------

struct PngMemoryReader {
  const uint8_t* data = nullptr;
  size_t size = 0;
  size_t offset = 0;
};

void PngReadFromMemory(png_structp png, png_bytep out, png_size_t length) {
  auto* reader = static_cast<PngMemoryReader*>(png_get_io_ptr(png));
  if (reader == nullptr || reader->size - reader->offset < length) {
    png_error(png, "truncated PNG data");
    return;
  }
  std::memcpy(out, reader->data + reader->offset, length);
  reader->offset += length;
}

// Heap-held so nothing on the decoding frame changes between setjmp and a
// longjmp out of libpng.
struct PngDecodeState {
  PngMemoryReader reader;
  std::shared_ptr<render::RgbaImage> image;
  std::vector<png_bytep> rows;
};

// ---- JPEG (libjpeg) --------------------------------------------------------

struct JpegErrorManager {
  jpeg_error_mgr pub;
  std::jmp_buf jump;
  char message[JMSG_LENGTH_MAX];
};

void JpegErrorExit(j_common_ptr cinfo) {
  auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  std::longjmp(err->jump, 1);
}

void JpegSilentOutput(j_common_ptr) {}

struct JpegDecodeState {
  jpeg_decompress_struct cinfo;
  JpegErrorManager jerr;
  std::shared_ptr<render::RgbaImage> image;
  std::vector<uint8_t> scanline;
};

}  // namespace

bool AvatarLoader::LooksLikePng(const std::vector<uint8_t>& data) {
  static const uint8_t kSig[8] = {0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a};
  return data.size() >= 8 && std::memcmp(data.data(), kSig, 8) == 0;
}

bool AvatarLoader::LooksLikeJpeg(const std::vector<uint8_t>& data) {
  return data.size() >= 3 && data[0] == 0xff && data[1] == 0xd8 && data[2] == 0xff;
}

AvatarLoadResult AvatarLoader::Decode(const std::vector<uint8_t>& encoded) {
  if (encoded.size() > kMaxAvatarBytes) {
    return AvatarLoadResult::Failure(AvatarError::kTooLarge, "encoded avatar over size cap");
  }
  if (LooksLikePng(encoded)) return DecodePng(encoded);
  if (LooksLikeJpeg(encoded)) return DecodeJpeg(encoded);
  return AvatarLoadResult::Failure(AvatarError::kUnsupportedFormat,
                                   "avatar is neither PNG nor JPEG");
}

AvatarLoadResult AvatarLoader::DecodePng(const std::vector<uint8_t>& encoded) {
  png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if (!png) {
    return AvatarLoadResult::Failure(AvatarError::kDecodeFailed, "png_create_read_struct failed");
  }
  png_infop info = png_create_info_struct(png);
  if (!info) {
    png_destroy_read_struct(&png, nullptr, nullptr);
    return AvatarLoadResult::Failure(AvatarError::kDecodeFailed, "png_create_info_struct failed");
  }

  auto state = std::make_unique<PngDecodeState>();
  state->reader.data = encoded.data();
  state->reader.size = encoded.size();

  if (setjmp(png_jmpbuf(png))) {
    png_destroy_read_struct(&png, &info, nullptr);
    return AvatarLoadResult::Failure(AvatarError::kDecodeFailed, "libpng rejected the data");
  }

  png_set_read_fn(png, &state->reader, &PngReadFromMemory);
  png_read_info(png, info);

  const png_uint_32 width = png_get_image_width(png, info);
  const png_uint_32 height = png_get_image_height(png, info);
  if (width == 0 || height == 0 || width > kMaxAvatarDimension || height > kMaxAvatarDimension) {
    png_destroy_read_struct(&png, &info, nullptr);
    std::ostringstream oss;
    oss << "avatar dimensions " << width << "x" << height << " out of range";
    return AvatarLoadResult::Failure(AvatarError::kTooLarge, oss.str());
  }

  const png_byte color_type = png_get_color_type(png, info);
  const png_byte bit_depth = png_get_bit_depth(png, info);
  if (bit_depth == 16) png_set_strip_16(png);
  if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
  if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
  if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
  if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
    png_set_gray_to_rgb(png);
  }
  png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
  png_read_update_info(png, info);

  if (png_get_rowbytes(png, info) != static_cast<png_size_t>(width) * render::kBytesPerPixel) {
    png_destroy_read_struct(&png, &info, nullptr);
    return AvatarLoadResult::Failure(AvatarError::kDecodeFailed, "unexpected PNG row layout");
  }

  state->image = std::make_shared<render::RgbaImage>(static_cast<int>(width),
                                                     static_cast<int>(height));
  state->rows.resize(height);
  for (png_uint_32 y = 0; y < height; ++y) {
    state->rows[y] = state->image->Pixel(0, static_cast<int>(y));
  }
  png_read_image(png, state->rows.data());
  png_read_end(png, nullptr);
  png_destroy_read_struct(&png, &info, nullptr);

  return AvatarLoadResult::Success(std::move(state->image));
}

AvatarLoadResult AvatarLoader::DecodeJpeg(const std::vector<uint8_t>& encoded) {
  auto state = std::make_unique<JpegDecodeState>();
  jpeg_decompress_struct& cinfo = state->cinfo;
  cinfo.err = jpeg_std_error(&state->jerr.pub);
  state->jerr.pub.error_exit = &JpegErrorExit;
  state->jerr.pub.output_message = &JpegSilentOutput;
  state->jerr.message[0] = '\0';

  if (setjmp(state->jerr.jump)) {
    jpeg_destroy_decompress(&cinfo);
    return AvatarLoadResult::Failure(AvatarError::kDecodeFailed,
                                     std::string("libjpeg: ") + state->jerr.message);
  }

  jpeg_create_decompress(&cinfo);
  jpeg_mem_src(&cinfo, const_cast<unsigned char*>(encoded.data()),
               static_cast<unsigned long>(encoded.size()));
  if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
    jpeg_destroy_decompress(&cinfo);
    return AvatarLoadResult::Failure(AvatarError::kDecodeFailed, "no JPEG header");
  }
  if (cinfo.image_width == 0 || cinfo.image_height == 0 ||
      cinfo.image_width > kMaxAvatarDimension || cinfo.image_height > kMaxAvatarDimension) {
    jpeg_destroy_decompress(&cinfo);
    return AvatarLoadResult::Failure(AvatarError::kTooLarge, "avatar dimensions out of range");
  }

  cinfo.out_color_space = JCS_RGB;
  jpeg_start_decompress(&cinfo);

  const int width = static_cast<int>(cinfo.output_width);
  const int height = static_cast<int>(cinfo.output_height);
  const int components = cinfo.output_components;
  state->image = std::make_shared<render::RgbaImage>(width, height);
  state->scanline.resize(static_cast<size_t>(width) * static_cast<size_t>(components));

  while (cinfo.output_scanline < cinfo.output_height) {
    const int y = static_cast<int>(cinfo.output_scanline);
    JSAMPROW row = state->scanline.data();
    jpeg_read_scanlines(&cinfo, &row, 1);
    uint8_t* dst = state->image->Pixel(0, y);
    for (int x = 0; x < width; ++x) {
      const uint8_t* src = state->scanline.data() + static_cast<size_t>(x) * components;
      dst[0] = src[0];
      dst[1] = components >= 3 ? src[1] : src[0];
      dst[2] = components >= 3 ? src[2] : src[0];
      dst[3] = 255;
      dst += render::kBytesPerPixel;
    }
  }

  jpeg_finish_decompress(&cinfo);
  jpeg_destroy_decompress(&cinfo);
  return AvatarLoadResult::Success(std::move(state->image));
}

bool AvatarLoader::IsAllowedUri(const std::string& uri) {
  const size_t colon = uri.find(':');
  if (colon == std::string::npos || colon == 0) return true;
  std::string scheme;
  for (size_t i = 0; i < colon; ++i) {
    const unsigned char c = static_cast<unsigned char>(uri[i]);
    if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return true;  // a path
    scheme.push_back(static_cast<char>(std::tolower(c)));
  }
  return scheme == "file" || scheme == "http" || scheme == "https";
}

AvatarLoadResult AvatarLoader::Fetch(const std::string& uri,
                                     const timing::StopSignal& stop,
                                     size_t max_bytes) {
  if (uri.empty()) {
    return AvatarLoadResult::Failure(AvatarError::kFetchFailed, "empty avatar uri");
  }
  if (stop.StopRequested()) {
    return AvatarLoadResult::Failure(AvatarError::kCancelled, "stopped before avatar fetch");
  }
  if (!IsAllowedUri(uri)) {
    Logger::Warn("[AvatarLoader] Refusing avatar uri with disallowed protocol: " + uri);
    return AvatarLoadResult::Failure(AvatarError::kFetchFailed, "protocol not allowed: " + uri);
  }
  EnsureNetworkInit();

  AVIOInterruptCB interrupt;
  interrupt.callback = &StopThunk;
  interrupt.opaque = const_cast<timing::StopSignal*>(&stop);

  // Also applies to whatever an http redirect points at.
  AVDictionary* options = nullptr;
  av_dict_set(&options, "protocol_whitelist", kAvatarProtocolWhitelist, 0);
  AVIOContext* io = nullptr;
  int ret = avio_open2(&io, uri.c_str(), AVIO_FLAG_READ, &interrupt, &options);
  av_dict_free(&options);
  if (ret < 0) {
    if (stop.StopRequested()) {
      return AvatarLoadResult::Failure(AvatarError::kCancelled, "avatar fetch interrupted");
    }
    std::ostringstream oss;
    oss << "avio_open2(" << uri << "): " << AvErrorString(ret);
    Logger::Warn("[AvatarLoader] " + oss.str());
    return AvatarLoadResult::Failure(AvatarError::kFetchFailed, oss.str());
  }

  std::vector<uint8_t> bytes;
  std::vector<uint8_t> buffer(64 * 1024);
  for (;;) {
    ret = avio_read(io, buffer.data(), static_cast<int>(buffer.size()));
    if (ret == AVERROR_EOF || ret == 0) break;
    if (ret < 0) {
      avio_closep(&io);
      if (stop.StopRequested()) {
        return AvatarLoadResult::Failure(AvatarError::kCancelled, "avatar fetch interrupted");
      }
      return AvatarLoadResult::Failure(AvatarError::kFetchFailed,
                                       "avio_read: " + AvErrorString(ret));
    }
    if (bytes.size() + static_cast<size_t>(ret) > max_bytes) {
      avio_closep(&io);
      return AvatarLoadResult::Failure(AvatarError::kTooLarge, "avatar exceeds size cap");
    }
    bytes.insert(bytes.end(), buffer.begin(), buffer.begin() + ret);
  }
  avio_closep(&io);

  Logger::Debug("[AvatarLoader] Fetched " + std::to_string(bytes.size()) + " bytes from " + uri);
  return Decode(bytes);
}

AvatarLoadResult AvatarLoader::Load(const AvatarSource& source, const timing::StopSignal& stop) {
  if (!source.bytes.empty()) return Decode(source.bytes);
  return Fetch(source.uri, stop);
}

}  // namespace wavecast::avatar
