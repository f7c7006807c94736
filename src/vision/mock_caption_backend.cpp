#include <pictor/vision/mock_caption_backend.hpp>
#include <utility>

namespace pictor::vision {

namespace pc = pictor::core;

MockCaptionBackend::MockCaptionBackend(std::string caption) : caption_(std::move(caption)) {}

void MockCaptionBackend::set_caption(std::string caption) {
  caption_ = std::move(caption);
}

void MockCaptionBackend::set_failure(std::optional<std::string> message) {
  failure_ = std::move(message);
}

std::expected<std::string, pc::Error> MockCaptionBackend::describe(const pc::Frame& image,
                                                                    std::string_view /*prompt*/) {
  ++calls_;
  if (image.empty()) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure, "empty frame"));
  }
  if (failure_) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure, *failure_));
  }
  return caption_;
}

}  // namespace pictor::vision
