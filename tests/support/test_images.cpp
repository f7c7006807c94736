#include "support/test_images.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <random>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace pictor::testing {

namespace {

cv::Mat gradient(int width, int height, int channels) {
  cv::Mat mat(height, width, CV_8UC(channels));
  for (int y = 0; y < height; ++y) {
    auto* row = mat.ptr<std::uint8_t>(y);
    for (int x = 0; x < width; ++x) {
      for (int c = 0; c < channels; ++c) {
        const int value = x * 255 / std::max(1, width - 1) + c * 40 + y;
        row[x * channels + c] = static_cast<std::uint8_t>(value % 256);
      }
    }
  }
  return mat;
}

pictor::core::Bytes encode(const cv::Mat& mat, const std::string& ext) {
  std::vector<uchar> buf;
  if (!cv::imencode(ext, mat, buf)) throw std::runtime_error("test image encoding failed");
  pictor::core::Bytes out(buf.size());
  std::memcpy(out.data(), buf.data(), buf.size());
  return out;
}

}  // namespace

pictor::core::Bytes make_jpeg(int width, int height) {
  return encode(gradient(width, height, 3), ".jpg");
}

pictor::core::Bytes make_png(int width, int height, int channels) {
  return encode(gradient(width, height, channels), ".png");
}

pictor::core::Frame make_bgr_frame(std::uint32_t width, std::uint32_t height) {
  const cv::Mat mat = gradient(static_cast<int>(width), static_cast<int>(height), 3);
  std::vector<std::byte> buf(mat.total() * mat.elemSize());
  std::memcpy(buf.data(), mat.data, buf.size());
  return pictor::core::Frame(width, height, pictor::core::PixelFormat::BGR8, std::move(buf));
}

pictor::core::Bytes make_corrupt_jpeg() {
  pictor::core::Bytes out = to_bytes("\xFF\xD8\xFF\xE0 this is not really a jpeg");
  out.resize(256, std::byte{0x5A});
  return out;
}

pictor::core::Bytes to_bytes(const std::string& text) {
  pictor::core::Bytes out(text.size());
  std::memcpy(out.data(), text.data(), text.size());
  return out;
}

TempDir::TempDir() {
  static std::atomic<unsigned> counter{0};
  std::random_device rd;
  const auto base = std::filesystem::temp_directory_path();
  for (;;) {
    path_ = base / ("pictor_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
    if (std::filesystem::create_directories(path_)) break;
  }
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

}  // namespace pictor::testing
