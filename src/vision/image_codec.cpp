#include <pictor/vision/image_codec.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <vector>

namespace pictor::vision {

namespace pc = pictor::core;

namespace {

bool starts_with(std::span<const std::byte> bytes, std::span<const std::uint8_t> magic,
                 std::size_t offset = 0) {
  if (bytes.size() < offset + magic.size()) return false;
  return std::memcmp(bytes.data() + offset, magic.data(), magic.size()) == 0;
}

constexpr std::array<std::uint8_t, 3> kJpegMagic{0xFF, 0xD8, 0xFF};
constexpr std::array<std::uint8_t, 8> kPngMagic{0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::array<std::uint8_t, 4> kGifMagic{'G', 'I', 'F', '8'};
constexpr std::array<std::uint8_t, 2> kBmpMagic{'B', 'M'};
constexpr std::array<std::uint8_t, 4> kRiffMagic{'R', 'I', 'F', 'F'};
constexpr std::array<std::uint8_t, 4> kWebpMagic{'W', 'E', 'B', 'P'};
constexpr std::array<std::uint8_t, 4> kTiffLeMagic{'I', 'I', 0x2A, 0x00};
constexpr std::array<std::uint8_t, 4> kTiffBeMagic{'M', 'M', 0x00, 0x2A};

}  // namespace

std::string detect_encoding(std::span<const std::byte> bytes) noexcept {
  if (starts_with(bytes, kJpegMagic)) return "JPEG";
  if (starts_with(bytes, kPngMagic)) return "PNG";
  if (starts_with(bytes, kGifMagic)) return "GIF";
  if (starts_with(bytes, kBmpMagic)) return "BMP";
  if (starts_with(bytes, kRiffMagic) && starts_with(bytes, kWebpMagic, 8)) return "WEBP";
  if (starts_with(bytes, kTiffLeMagic) || starts_with(bytes, kTiffBeMagic)) return "TIFF";
  return {};
}

std::expected<pc::DecodedImage, pc::Error> decode_image(std::span<const std::byte> bytes) {
  if (bytes.empty()) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure, "empty image payload"));
  }
  std::string format = detect_encoding(bytes);
  if (format.empty()) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::StageFailure, "cannot identify image format"));
  }

  cv::Mat decoded;
  try {
    const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                      const_cast<std::byte*>(bytes.data()));
    decoded = cv::imdecode(raw, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
  } catch (const cv::Exception& e) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure,
                                          "cannot decode " + format + " data: " + e.what()));
  }
  if (decoded.empty()) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::StageFailure, "cannot decode " + format + " data"));
  }

  pc::Frame frame = detail::mat_to_frame(decoded);
  if (frame.empty()) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::StageFailure, "unsupported pixel layout"));
  }
  return pc::DecodedImage{std::move(frame), std::move(format)};
}

std::expected<pc::Bytes, pc::Error> encode_jpeg(const pc::Frame& frame, int quality) {
  auto mat = detail::frame_to_mat(frame);
  if (!mat) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::StageFailure, "frame cannot be encoded as JPEG"));
  }

  std::vector<uchar> encoded;
  const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100),
                                cv::IMWRITE_JPEG_PROGRESSIVE, 0};
  try {
    if (!cv::imencode(".jpg", *mat, encoded, params)) {
      return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure, "JPEG encoding failed"));
    }
  } catch (const cv::Exception& e) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure,
                                          std::string("JPEG encoding failed: ") + e.what()));
  }

  pc::Bytes out(encoded.size());
  std::memcpy(out.data(), encoded.data(), encoded.size());
  return out;
}

}  // namespace pictor::vision
