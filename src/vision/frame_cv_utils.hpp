#pragma once

#include <pictor/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace pictor::vision::detail {

/// Non-owning cv::Mat view over an 8-bit Frame. Returns nullopt if format unsupported.
std::optional<cv::Mat> frame_to_mat(const pictor::core::Frame& frame);

/// Copy a continuous 8-bit cv::Mat into a Frame; layout derived from the channel count.
pictor::core::Frame mat_to_frame(const cv::Mat& mat);

}  // namespace pictor::vision::detail
