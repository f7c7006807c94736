#include <pictor/vision/image_codec.hpp>
#include "support/test_images.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace pc = pictor::core;
namespace pv = pictor::vision;
namespace pt = pictor::testing;

TEST(DetectEncoding, RecognisesSignatures) {
  EXPECT_EQ(pv::detect_encoding(pt::make_jpeg(8, 8)), "JPEG");
  EXPECT_EQ(pv::detect_encoding(pt::make_png(8, 8)), "PNG");
  EXPECT_EQ(pv::detect_encoding(pt::to_bytes("GIF89a......")), "GIF");
  EXPECT_EQ(pv::detect_encoding(pt::to_bytes(std::string("RIFF\x10\x00\x00\x00WEBPVP8 ", 16))), "WEBP");
  EXPECT_EQ(pv::detect_encoding(pt::to_bytes("hello world")), "");
  EXPECT_EQ(pv::detect_encoding({}), "");
}

TEST(DecodeImage, DecodesJpegToBgr) {
  auto decoded = pv::decode_image(pt::make_jpeg(64, 48));
  ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
  EXPECT_EQ(decoded->format, "JPEG");
  EXPECT_EQ(decoded->frame.width(), 64u);
  EXPECT_EQ(decoded->frame.height(), 48u);
  EXPECT_EQ(decoded->frame.format(), pc::PixelFormat::BGR8);
  EXPECT_EQ(decoded->frame.size_bytes(), 64u * 48 * 3);
}

TEST(DecodeImage, PngWithAlphaDecodesToThreeChannels) {
  auto decoded = pv::decode_image(pt::make_png(20, 10, 4));
  ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
  EXPECT_EQ(decoded->format, "PNG");
  EXPECT_EQ(decoded->frame.format(), pc::PixelFormat::BGR8);
}

TEST(DecodeImage, EmptyPayloadFails) {
  auto decoded = pv::decode_image({});
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().code, pc::ErrorCode::StageFailure);
}

TEST(DecodeImage, UnknownSignatureFails) {
  auto decoded = pv::decode_image(pt::to_bytes("definitely not an image"));
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().message, "cannot identify image format");
}

TEST(DecodeImage, CorruptJpegFails) {
  auto decoded = pv::decode_image(pt::make_corrupt_jpeg());
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().code, pc::ErrorCode::StageFailure);
  EXPECT_FALSE(decoded.error().message.empty());
}

TEST(EncodeJpeg, RoundTripsDimensions) {
  const pc::Frame frame = pt::make_bgr_frame(30, 20);
  auto encoded = pv::encode_jpeg(frame, 85);
  ASSERT_TRUE(encoded.has_value());
  EXPECT_EQ(pv::detect_encoding(*encoded), "JPEG");
  auto decoded = pv::decode_image(*encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->frame.width(), 30u);
  EXPECT_EQ(decoded->frame.height(), 20u);
}

TEST(EncodeJpeg, RejectsFloatFrame) {
  std::vector<std::byte> buf(pc::Frame::min_bytes(2, 2, pc::PixelFormat::Float32Planar));
  const pc::Frame frame(2, 2, pc::PixelFormat::Float32Planar, std::move(buf));
  EXPECT_FALSE(pv::encode_jpeg(frame, 85).has_value());
}
