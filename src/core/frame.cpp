#include <pictor/core/frame.hpp>

namespace pictor::core {

std::size_t channel_count(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::BGR8:
    case PixelFormat::Float32Planar:
      return 3;
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
      break;
  }
  return 0;
}

std::size_t bytes_per_pixel(PixelFormat format) noexcept {
  const std::size_t channels = channel_count(format);
  return format == PixelFormat::Float32Planar ? channels * sizeof(float) : channels;
}

}  // namespace pictor::core
