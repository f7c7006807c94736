#include <pictor/vision/caption_stage.hpp>
#include <stdexcept>
#include <utility>

namespace pictor::vision {

namespace pc = pictor::core;

CaptionStage::CaptionStage(std::shared_ptr<Captioner> captioner)
    : captioner_(std::move(captioner)) {
  if (!captioner_) {
    throw std::invalid_argument("CaptionStage: captioner must not be null");
  }
}

std::expected<void, pc::Error> CaptionStage::process(const pc::StageInput& input,
                                                     pc::Derivation& out) const {
  auto caption = captioner_->describe(input.image);
  if (!caption) {
    return std::unexpected(std::move(caption.error()));
  }
  out.caption = std::move(*caption);
  return {};
}

}  // namespace pictor::vision
