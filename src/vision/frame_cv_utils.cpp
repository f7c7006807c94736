#include "frame_cv_utils.hpp"
#include <pictor/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace pictor::vision::detail {

namespace pc = pictor::core;

std::optional<cv::Mat> frame_to_mat(const pc::Frame& frame) {
  if (!frame.is_complete()) return std::nullopt;

  int type = 0;
  switch (frame.format()) {
    case pc::PixelFormat::Grayscale8:
      type = CV_8UC1;
      break;
    case pc::PixelFormat::BGR8:
      type = CV_8UC3;
      break;
    case pc::PixelFormat::BGRA8:
      type = CV_8UC4;
      break;
    case pc::PixelFormat::Float32Planar:
    case pc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return cv::Mat(static_cast<int>(frame.height()), static_cast<int>(frame.width()), type,
                 const_cast<std::byte*>(frame.data().data()));
}

pc::Frame mat_to_frame(const cv::Mat& mat) {
  if (mat.empty() || mat.depth() != CV_8U) return pc::Frame();

  pc::PixelFormat format = pc::PixelFormat::Unknown;
  switch (mat.channels()) {
    case 1:
      format = pc::PixelFormat::Grayscale8;
      break;
    case 3:
      format = pc::PixelFormat::BGR8;
      break;
    case 4:
      format = pc::PixelFormat::BGRA8;
      break;
    default:
      return pc::Frame();
  }

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return pc::Frame(static_cast<std::uint32_t>(packed.cols),
                   static_cast<std::uint32_t>(packed.rows), format, std::move(buffer));
}

}  // namespace pictor::vision::detail
