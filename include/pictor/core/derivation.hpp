#pragma once

#include <pictor/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pictor::core {

using Bytes = std::vector<std::byte>;

/// Output of image decoding: pixels plus the encoder's canonical format name ("JPEG", "PNG").
struct DecodedImage {
  Frame frame;
  std::string format;
};

/// What every stage reads. The frame is shared read-only by all stages of one run.
struct StageInput {
  const Frame& image;
  const std::string& format;
  std::uint64_t size_bytes{0};
};

struct ImageMetadata {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::string format;  // encoder name as stored
  std::uint64_t size_bytes{0};
};

/// Encoded thumbnail pair; both are JPEG.
struct ThumbnailSet {
  Bytes small;
  Bytes medium;
};

/// Accumulated stage outputs for one run. Complete only when every stage succeeded.
struct Derivation {
  std::optional<ImageMetadata> metadata;
  std::optional<ThumbnailSet> thumbnails;
  std::optional<std::string> caption;

  [[nodiscard]] bool complete() const noexcept {
    return metadata.has_value() && thumbnails.has_value() && caption.has_value();
  }
};

}  // namespace pictor::core
