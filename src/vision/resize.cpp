#include <pictor/vision/resize.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace pictor::vision {

namespace pc = pictor::core;

Extent fit_within(Extent source, std::uint32_t max_width, std::uint32_t max_height) noexcept {
  if (source.width == 0 || source.height == 0 || max_width == 0 || max_height == 0) {
    return Extent{};
  }
  if (source.width <= max_width && source.height <= max_height) {
    return source;
  }

  const double scale = std::min(static_cast<double>(max_width) / source.width,
                                static_cast<double>(max_height) / source.height);
  auto scaled = [scale](std::uint32_t side, std::uint32_t bound) {
    const auto v = static_cast<std::uint32_t>(std::lround(side * scale));
    return std::clamp<std::uint32_t>(v, 1u, bound);
  };
  return Extent{scaled(source.width, max_width), scaled(source.height, max_height)};
}

std::expected<pc::Frame, pc::Error> resize_to_fit(const pc::Frame& input,
                                                  std::uint32_t max_width,
                                                  std::uint32_t max_height) {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure, "invalid frame"));
  }

  const Extent target = fit_within({input.width(), input.height()}, max_width, max_height);
  if (target.width == 0) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure, "invalid target size"));
  }
  if (target.width == input.width() && target.height == input.height()) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return pc::Frame(input.width(), input.height(), input.format(), std::move(buf));
  }

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(static_cast<int>(target.width), static_cast<int>(target.height)),
             0, 0, cv::INTER_AREA);
  return detail::mat_to_frame(mat_out);
}

}  // namespace pictor::vision
