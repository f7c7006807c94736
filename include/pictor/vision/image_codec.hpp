#pragma once

#include <pictor/core/derivation.hpp>
#include <pictor/core/error.hpp>
#include <pictor/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>

namespace pictor::vision {

/// Encoder name from the payload signature: "JPEG", "PNG", "GIF", "BMP", "WEBP", "TIFF";
/// empty if unrecognised.
[[nodiscard]] std::string detect_encoding(std::span<const std::byte> bytes) noexcept;

/// Decode an encoded image to BGR8 (EXIF orientation is not applied).
/// Fails with StageFailure if the payload is empty, unrecognised or corrupt.
[[nodiscard]] std::expected<pictor::core::DecodedImage, pictor::core::Error>
decode_image(std::span<const std::byte> bytes);

/// Encode an 8-bit frame as baseline JPEG at the given quality (1..100).
[[nodiscard]] std::expected<pictor::core::Bytes, pictor::core::Error>
encode_jpeg(const pictor::core::Frame& frame, int quality);

}  // namespace pictor::vision
