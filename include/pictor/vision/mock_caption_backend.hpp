#pragma once

#include <pictor/vision/caption_backend.hpp>
#include <atomic>
#include <cstddef>
#include <optional>
#include <string>

namespace pictor::vision {

/// Backend that returns a configured caption or failure (for tests/demo).
class MockCaptionBackend : public ICaptionBackend {
 public:
  explicit MockCaptionBackend(std::string caption = "an image");

  void set_caption(std::string caption);

  /// While set, describe() fails with this message.
  void set_failure(std::optional<std::string> message);

  [[nodiscard]] std::expected<std::string, pictor::core::Error>
  describe(const pictor::core::Frame& image, std::string_view prompt) override;

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

 private:
  std::string caption_;
  std::optional<std::string> failure_;
  std::atomic<std::size_t> calls_{0};
};

}  // namespace pictor::vision
