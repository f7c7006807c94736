#pragma once

#include <pictor/core/derivation.hpp>
#include <pictor/core/error.hpp>
#include <pictor/core/pipeline_stage.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace pictor::vision {

/// Client-facing format token: lowercase, with "jpeg" shortened to "jpg".
[[nodiscard]] std::string client_format_token(std::string_view encoder_format);

/// Records decoded dimensions, the encoder's format name and the byte size.
class MetadataStage : public pictor::core::IDerivationStage {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "metadata"; }

  [[nodiscard]] std::expected<void, pictor::core::Error> process(
      const pictor::core::StageInput& input,
      pictor::core::Derivation& out) const override;
};

}  // namespace pictor::vision
