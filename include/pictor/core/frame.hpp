#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace pictor::core {

/// Pixel layout of a decoded image. 8-bit layouts are interleaved, rows tightly packed.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  BGR8,
  BGRA8,
  Float32Planar,  // CHW float, model input
};

/// Channels per pixel; 0 for Unknown.
[[nodiscard]] std::size_t channel_count(PixelFormat format) noexcept;

/// Storage per pixel, 4 bytes per channel for Float32Planar.
[[nodiscard]] std::size_t bytes_per_pixel(PixelFormat format) noexcept;

/// A decoded image. Pixels are immutable once constructed, so a const Frame is shared
/// freely between the stages of one job.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width, std::uint32_t height, PixelFormat format,
        std::vector<std::byte> pixels)
      : width_(width), height_(height), format_(format), pixels_(std::move(pixels)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<const std::byte> data() const noexcept { return pixels_; }
  [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return pixels_.size(); }

  [[nodiscard]] std::size_t row_bytes() const noexcept {
    return static_cast<std::size_t>(width_) * bytes_per_pixel(format_);
  }

  /// True when the buffer covers every pixel of a known layout.
  [[nodiscard]] bool is_complete() const noexcept {
    return format_ != PixelFormat::Unknown && width_ > 0 && height_ > 0 &&
           pixels_.size() >= min_bytes(width_, height_, format_);
  }

  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width, std::uint32_t height,
                                             PixelFormat format) noexcept {
    return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
  }

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> pixels_;
};

}  // namespace pictor::core
