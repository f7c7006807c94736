#include <pictor/vision/metadata_stage.hpp>
#include <algorithm>
#include <cctype>

namespace pictor::vision {

namespace pc = pictor::core;

std::string client_format_token(std::string_view encoder_format) {
  std::string token(encoder_format);
  std::transform(token.begin(), token.end(), token.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (token == "jpeg") token = "jpg";
  return token;
}

std::expected<void, pc::Error> MetadataStage::process(const pc::StageInput& input,
                                                      pc::Derivation& out) const {
  if (input.image.empty() || input.image.width() == 0 || input.image.height() == 0) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure, "image has no pixels"));
  }
  if (input.format.empty()) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure, "unknown image format"));
  }

  std::string format(input.format);
  std::transform(format.begin(), format.end(), format.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  out.metadata = pc::ImageMetadata{input.image.width(), input.image.height(),
                                   std::move(format), input.size_bytes};
  return {};
}

}  // namespace pictor::vision
