#pragma once

#include <pictor/core/derivation.hpp>
#include <pictor/core/error.hpp>
#include <pictor/core/pipeline_stage.hpp>
#include <pictor/vision/captioner.hpp>
#include <expected>
#include <memory>

namespace pictor::vision {

/// Pipeline stage: shared Captioner -> Derivation::caption.
class CaptionStage : public pictor::core::IDerivationStage {
 public:
  explicit CaptionStage(std::shared_ptr<Captioner> captioner);

  [[nodiscard]] std::string_view name() const noexcept override { return "caption"; }

  [[nodiscard]] std::expected<void, pictor::core::Error> process(
      const pictor::core::StageInput& input,
      pictor::core::Derivation& out) const override;

 private:
  std::shared_ptr<Captioner> captioner_;
};

}  // namespace pictor::vision
