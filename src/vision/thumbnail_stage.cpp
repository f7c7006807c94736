#include <pictor/vision/thumbnail_stage.hpp>
#include "frame_cv_utils.hpp"
#include <pictor/vision/image_codec.hpp>
#include <pictor/vision/resize.hpp>
#include <opencv2/imgproc.hpp>

namespace pictor::vision {

namespace pc = pictor::core;

namespace {

/// JPEG has no alpha channel; thumbnails are always three-channel.
std::expected<pc::Frame, pc::Error> to_bgr(const pc::Frame& input) {
  if (input.format() == pc::PixelFormat::BGR8) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return pc::Frame(input.width(), input.height(), input.format(), std::move(buf));
  }
  auto mat = detail::frame_to_mat(input);
  if (!mat) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure, "unsupported pixel format"));
  }
  cv::Mat bgr;
  cv::cvtColor(*mat, bgr, mat->channels() == 1 ? cv::COLOR_GRAY2BGR : cv::COLOR_BGRA2BGR);
  return detail::mat_to_frame(bgr);
}

std::expected<pc::Bytes, pc::Error> make_variant(const pc::Frame& bgr, const ThumbnailSize& size) {
  auto resized = resize_to_fit(bgr, size.max_width, size.max_height);
  if (!resized) return std::unexpected(std::move(resized.error()));
  return encode_jpeg(*resized, size.jpeg_quality);
}

}  // namespace

ThumbnailStage::ThumbnailStage(ThumbnailSize small, ThumbnailSize medium)
    : small_(small), medium_(medium) {}

std::expected<void, pc::Error> ThumbnailStage::process(const pc::StageInput& input,
                                                       pc::Derivation& out) const {
  if (input.image.empty()) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure, "image has no pixels"));
  }
  auto bgr = to_bgr(input.image);
  if (!bgr) return std::unexpected(std::move(bgr.error()));

  auto small = make_variant(*bgr, small_);
  if (!small) return std::unexpected(std::move(small.error()));
  auto medium = make_variant(*bgr, medium_);
  if (!medium) return std::unexpected(std::move(medium.error()));

  out.thumbnails = pc::ThumbnailSet{std::move(*small), std::move(*medium)};
  return {};
}

}  // namespace pictor::vision
