#pragma once

#include <pictor/core/derivation.hpp>
#include <pictor/core/error.hpp>
#include <pictor/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>

namespace pictor::vision {

/// Bounding box and JPEG quality of one thumbnail variant.
struct ThumbnailSize {
  std::uint32_t max_width{0};
  std::uint32_t max_height{0};
  int jpeg_quality{85};
};

inline constexpr ThumbnailSize kSmallThumbnail{256, 256, 85};
inline constexpr ThumbnailSize kMediumThumbnail{512, 512, 90};

/// Produces the small and medium JPEG thumbnails. Both are produced or neither is.
class ThumbnailStage : public pictor::core::IDerivationStage {
 public:
  explicit ThumbnailStage(ThumbnailSize small = kSmallThumbnail,
                          ThumbnailSize medium = kMediumThumbnail);

  [[nodiscard]] std::string_view name() const noexcept override { return "thumbnails"; }

  [[nodiscard]] std::expected<void, pictor::core::Error> process(
      const pictor::core::StageInput& input,
      pictor::core::Derivation& out) const override;

 private:
  ThumbnailSize small_;
  ThumbnailSize medium_;
};

}  // namespace pictor::vision
