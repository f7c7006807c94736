#pragma once

#include <pictor/core/derivation.hpp>
#include <pictor/core/error.hpp>
#include <pictor/core/pipeline_stage.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace pictor::core {

/// Decodes stored bytes into pixels; supplied by the vision layer.
using ImageDecoder =
    std::function<std::expected<DecodedImage, Error>(std::span<const std::byte>)>;

/// Callback for per-stage timing: (stage_name, duration_ms). Decoding is reported as "decode".
using StageTimingCallback = std::function<void(std::string_view stage_name, double duration_ms)>;

/// Decodes once, then runs stages in insertion order; the first failure aborts the run.
class Pipeline {
 public:
  explicit Pipeline(ImageDecoder decoder);

  void add_stage(std::unique_ptr<IDerivationStage> stage);

  /// Run all stages on one encoded image.
  /// On failure the error is a StageFailure whose message starts with "<stage>: ".
  /// Thread-safe: safe to call run() from multiple threads concurrently
  /// (stages are not modified during process()).
  [[nodiscard]] std::expected<Derivation, Error> run(
      std::span<const std::byte> encoded,
      std::uint64_t size_bytes,
      const StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  ImageDecoder decoder_;
  std::vector<std::unique_ptr<IDerivationStage>> stages_;
};

}  // namespace pictor::core
