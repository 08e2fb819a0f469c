// Repository: Retrovue-wavecast
// Component: Avatar Loader Tests
// Purpose: PNG/JPEG decode to RGBA, format sniffing, file fetch and cache
//          memoization.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <jpeglib.h>
#include <png.h>

#include "wavecast/avatar/AvatarCache.hpp"
#include "wavecast/avatar/AvatarLoader.hpp"

namespace wavecast::avatar::testing {
namespace {

// =============================================================================
// Encoders for test images
// =============================================================================

void PngWriteToVector(png_structp png, png_bytep data, png_size_t length) {
  auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
  out->insert(out->end(), data, data + length);
}

void PngFlushNoop(png_structp) {}

// width x height RGBA PNG: left half opaque red, right half translucent blue.
std::vector<uint8_t> EncodeTestPng(int width, int height) {
  std::vector<uint8_t> out;
  png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if (png == nullptr) return out;
  png_infop info = png_create_info_struct(png);
  if (info == nullptr || setjmp(png_jmpbuf(png))) {
    png_destroy_write_struct(&png, &info);
    return std::vector<uint8_t>();
  }
  png_set_write_fn(png, &out, &PngWriteToVector, &PngFlushNoop);
  png_set_IHDR(png, info, static_cast<png_uint_32>(width), static_cast<png_uint_32>(height), 8,
               PNG_COLOR_TYPE_RGBA, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
               PNG_FILTER_TYPE_DEFAULT);
  png_write_info(png, info);

  std::vector<uint8_t> row(static_cast<size_t>(width) * 4);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      uint8_t* px = row.data() + static_cast<size_t>(x) * 4;
      const bool left = x < width / 2;
      px[0] = left ? 255 : 0;
      px[1] = 0;
      px[2] = left ? 0 : 255;
      px[3] = left ? 255 : 128;
    }
    png_write_row(png, row.data());
  }
  png_write_end(png, nullptr);
  png_destroy_write_struct(&png, &info);
  return out;
}

// Solid grey baseline JPEG.
std::vector<uint8_t> EncodeTestJpeg(int width, int height, uint8_t grey) {
  jpeg_compress_struct cinfo;
  jpeg_error_mgr jerr;
  cinfo.err = jpeg_std_error(&jerr);
  jpeg_create_compress(&cinfo);

  unsigned char* buffer = nullptr;
  unsigned long size = 0;
  jpeg_mem_dest(&cinfo, &buffer, &size);
  cinfo.image_width = static_cast<JDIMENSION>(width);
  cinfo.image_height = static_cast<JDIMENSION>(height);
  cinfo.input_components = 3;
  cinfo.in_color_space = JCS_RGB;
  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, 95, TRUE);
  jpeg_start_compress(&cinfo, TRUE);

  std::vector<uint8_t> row(static_cast<size_t>(width) * 3, grey);
  while (cinfo.next_scanline < cinfo.image_height) {
    JSAMPROW p = row.data();
    jpeg_write_scanlines(&cinfo, &p, 1);
  }
  jpeg_finish_compress(&cinfo);
  std::vector<uint8_t> out(buffer, buffer + size);
  jpeg_destroy_compress(&cinfo);
  std::free(buffer);
  return out;
}

std::string WriteTempFile(const std::string& name, const std::vector<uint8_t>& bytes) {
  const std::string path = ::testing::TempDir() + name;
  std::ofstream out(path, std::ios::binary);
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  return path;
}

// =============================================================================
// Decode
// =============================================================================

TEST(AvatarLoaderTest, DecodesRgbaPng) {
  const std::vector<uint8_t> png = EncodeTestPng(8, 4);
  ASSERT_FALSE(png.empty());
  EXPECT_TRUE(AvatarLoader::LooksLikePng(png));

  const AvatarLoadResult r = AvatarLoader::Decode(png);
  ASSERT_TRUE(r.ok) << r.detail;
  ASSERT_NE(r.image, nullptr);
  EXPECT_EQ(r.image->width, 8);
  EXPECT_EQ(r.image->height, 4);

  const uint8_t* left = r.image->Pixel(1, 2);
  EXPECT_EQ(left[0], 255);
  EXPECT_EQ(left[2], 0);
  EXPECT_EQ(left[3], 255);
  const uint8_t* right = r.image->Pixel(6, 2);
  EXPECT_EQ(right[0], 0);
  EXPECT_EQ(right[2], 255);
  EXPECT_EQ(right[3], 128);
}

TEST(AvatarLoaderTest, DecodesJpegAsOpaqueRgba) {
  const std::vector<uint8_t> jpeg = EncodeTestJpeg(16, 16, 128);
  EXPECT_TRUE(AvatarLoader::LooksLikeJpeg(jpeg));

  const AvatarLoadResult r = AvatarLoader::Decode(jpeg);
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(r.image->width, 16);
  const uint8_t* px = r.image->Pixel(8, 8);
  EXPECT_NEAR(px[0], 128, 3);
  EXPECT_NEAR(px[1], 128, 3);
  EXPECT_EQ(px[3], 255);
}

TEST(AvatarLoaderTest, UnknownSignatureIsUnsupported) {
  const std::vector<uint8_t> gif = {'G', 'I', 'F', '8', '9', 'a', 0, 0, 0, 0};
  EXPECT_EQ(AvatarLoader::Decode(gif).error, AvatarError::kUnsupportedFormat);
  EXPECT_EQ(AvatarLoader::Decode(std::vector<uint8_t>()).error, AvatarError::kUnsupportedFormat);
}

TEST(AvatarLoaderTest, TruncatedPngIsDecodeFailure) {
  std::vector<uint8_t> png = EncodeTestPng(8, 8);
  png.resize(png.size() / 2);
  EXPECT_EQ(AvatarLoader::Decode(png).error, AvatarError::kDecodeFailed);
}

TEST(AvatarLoaderTest, CorruptJpegIsDecodeFailure) {
  std::vector<uint8_t> jpeg = {0xff, 0xd8, 0xff, 0xe0, 0x00, 0x10, 'J', 'F', 'I', 'F'};
  const AvatarLoadResult r = AvatarLoader::Decode(jpeg);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, AvatarError::kDecodeFailed);
}

// =============================================================================
// Fetch and Load
// =============================================================================

TEST(AvatarLoaderTest, LoadsFromLocalFile) {
  const std::string path = WriteTempFile("wavecast_avatar.png", EncodeTestPng(4, 4));
  AvatarSource source;
  source.uri = path;
  const AvatarLoadResult r = AvatarLoader::Load(source);
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(r.image->width, 4);
  std::remove(path.c_str());
}

TEST(AvatarLoaderTest, MissingFileIsFetchFailure) {
  AvatarSource source;
  source.uri = ::testing::TempDir() + "wavecast_no_such_avatar.png";
  EXPECT_EQ(AvatarLoader::Load(source).error, AvatarError::kFetchFailed);
}

TEST(AvatarLoaderTest, FetchHonorsSizeCap) {
  const std::string path = WriteTempFile("wavecast_avatar_big.png", EncodeTestPng(32, 32));
  const AvatarLoadResult r = AvatarLoader::Fetch(path, timing::StopSignal(), 16);
  EXPECT_EQ(r.error, AvatarError::kTooLarge);
  std::remove(path.c_str());
}

TEST(AvatarLoaderTest, CancelledFetchReportsCancelled) {
  std::atomic<bool> cancel{true};
  AvatarSource source;
  source.uri = ::testing::TempDir() + "whatever.png";
  const AvatarLoadResult r =
      AvatarLoader::Load(source, timing::StopSignal(&cancel, nullptr, timing::StopSignal::kNoDeadline));
  EXPECT_EQ(r.error, AvatarError::kCancelled);
}

TEST(AvatarLoaderTest, OnlyFileAndHttpProtocolsAreAllowed) {
  EXPECT_TRUE(AvatarLoader::IsAllowedUri("/tmp/avatar.png"));
  EXPECT_TRUE(AvatarLoader::IsAllowedUri("avatars/a:b.png"));
  EXPECT_TRUE(AvatarLoader::IsAllowedUri("file:/tmp/avatar.png"));
  EXPECT_TRUE(AvatarLoader::IsAllowedUri("http://example.com/a.png"));
  EXPECT_TRUE(AvatarLoader::IsAllowedUri("HTTPS://example.com/a.png"));
  EXPECT_FALSE(AvatarLoader::IsAllowedUri("pipe:0"));
  EXPECT_FALSE(AvatarLoader::IsAllowedUri("data:image/png;base64,AAAA"));
  EXPECT_FALSE(AvatarLoader::IsAllowedUri("concat:/etc/passwd|/tmp/a.png"));
  EXPECT_FALSE(AvatarLoader::IsAllowedUri("ftp://example.com/a.png"));
}

TEST(AvatarLoaderTest, DisallowedProtocolIsFetchFailure) {
  const std::string path = WriteTempFile("wavecast_avatar_concat.png", EncodeTestPng(4, 4));
  AvatarSource source;
  source.uri = "concat:" + path;
  const AvatarLoadResult r = AvatarLoader::Load(source);
  EXPECT_EQ(r.error, AvatarError::kFetchFailed);
  EXPECT_NE(r.detail.find("protocol not allowed"), std::string::npos);

  source.uri = "file:" + path;
  EXPECT_TRUE(AvatarLoader::Load(source).ok);
  std::remove(path.c_str());
}

// =============================================================================
// Cache
// =============================================================================

TEST(AvatarCacheTest, EmptySourceYieldsPlaceholder) {
  AvatarCache cache;
  EXPECT_EQ(cache.Get(AvatarSource(), timing::StopSignal()), nullptr);
  EXPECT_EQ(cache.loads(), 0u);
}

TEST(AvatarCacheTest, SameBytesDecodeOnce) {
  AvatarCache cache;
  AvatarSource source;
  source.bytes = EncodeTestPng(4, 4);
  auto first = cache.Get(source, timing::StopSignal());
  auto second = cache.Get(source, timing::StopSignal());
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first, second);
  EXPECT_EQ(cache.loads(), 1u);
  EXPECT_EQ(cache.Size(), 1u);
}

TEST(AvatarCacheTest, FailuresAreRememberedUntilEvicted) {
  AvatarCache cache;
  AvatarSource source;
  source.bytes = {1, 2, 3, 4};
  EXPECT_EQ(cache.Get(source, timing::StopSignal()), nullptr);
  EXPECT_EQ(cache.Get(source, timing::StopSignal()), nullptr);
  EXPECT_EQ(cache.loads(), 1u);

  cache.Evict();
  EXPECT_EQ(cache.Size(), 0u);
  EXPECT_EQ(cache.Get(source, timing::StopSignal()), nullptr);
  EXPECT_EQ(cache.loads(), 2u);
}

TEST(AvatarCacheTest, KeysDistinguishSources) {
  AvatarSource a;
  a.uri = "https://example.com/a.png";
  AvatarSource b;
  b.bytes = {1, 2, 3};
  AvatarSource c;
  c.bytes = {1, 2, 4};
  EXPECT_EQ(AvatarCache::KeyFor(a), "uri:https://example.com/a.png");
  EXPECT_NE(AvatarCache::KeyFor(b), AvatarCache::KeyFor(c));
}

}  // namespace
}  // namespace wavecast::avatar::testing
