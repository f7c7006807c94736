#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/frame.hpp>
#include <cstdint>
#include <expected>

namespace pictor::vision {

struct Extent {
  std::uint32_t width{0};
  std::uint32_t height{0};

  friend bool operator==(const Extent&, const Extent&) = default;
};

/// Largest aspect-preserving extent inside max_width x max_height. Never enlarges;
/// each side is at least 1.
[[nodiscard]] Extent fit_within(Extent source, std::uint32_t max_width,
                                std::uint32_t max_height) noexcept;

/// Downscale an 8-bit frame to fit_within(); returns a copy when it already fits.
[[nodiscard]] std::expected<pictor::core::Frame, pictor::core::Error>
resize_to_fit(const pictor::core::Frame& input, std::uint32_t max_width,
              std::uint32_t max_height);

}  // namespace pictor::vision
