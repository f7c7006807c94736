#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/frame.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace pictor::vision {

/// Abstract captioning model: BGR8 Frame + conditioning prompt -> raw decoded text.
/// Implementations need not be thread-safe; Captioner serializes calls.
class ICaptionBackend {
 public:
  virtual ~ICaptionBackend() = default;

  /// Raw model text; may echo the prompt or be empty.
  [[nodiscard]] virtual std::expected<std::string, pictor::core::Error>
  describe(const pictor::core::Frame& image, std::string_view prompt) = 0;

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace pictor::vision
