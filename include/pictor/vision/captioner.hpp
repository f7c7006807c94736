#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/frame.hpp>
#include <pictor/vision/caption_backend.hpp>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace pictor::vision {

inline constexpr std::string_view kDefaultCaptionPrompt =
    "Describe only what is visually present in this image.";
inline constexpr std::string_view kDefaultCaptionFallback = "No caption generated.";

struct CaptionOptions {
  std::string prompt{kDefaultCaptionPrompt};
  std::string fallback{kDefaultCaptionFallback};
};

/// Trim whitespace, drop an echoed prompt prefix (case-insensitive, with trailing " .:"),
/// and substitute the fallback for an empty result.
[[nodiscard]] std::string clean_caption(std::string_view raw, std::string_view prompt,
                                        std::string_view fallback);

/// Process-wide caption model. Created once at startup and shared by every
/// pipeline run; backend calls are serialized by an internal mutex.
class Captioner {
 public:
  Captioner(std::unique_ptr<ICaptionBackend> backend, CaptionOptions options = {});

  Captioner(const Captioner&) = delete;
  Captioner& operator=(const Captioner&) = delete;

  [[nodiscard]] std::expected<std::string, pictor::core::Error>
  describe(const pictor::core::Frame& image);

  [[nodiscard]] const CaptionOptions& options() const noexcept { return options_; }

 private:
  std::unique_ptr<ICaptionBackend> backend_;
  CaptionOptions options_;
  std::mutex mutex_;
};

}  // namespace pictor::vision
