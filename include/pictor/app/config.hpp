#pragma once

#include <pictor/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

namespace pictor::app {

/// Caption backend type: mock (fixed text) or onnx (real model).
enum class CaptionBackendType {
  Mock,
  Onnx,
};

/// Job dispatcher implementation.
enum class DispatcherType {
  Threads,
  Tbb,
};

/// Service configuration: storage locations, server, workers, caption model.
struct ServiceConfig {
  std::string data_dir{"data"};
  std::string db_path;        // empty = <data_dir>/app.db
  std::string originals_dir;  // empty = <data_dir>/originals
  std::string thumbs_dir;     // empty = <data_dir>/thumbs

  std::string host{"0.0.0.0"};
  std::uint16_t port{8000};

  std::size_t workers{0};  // 0 = hardware concurrency
  DispatcherType dispatcher{DispatcherType::Threads};

  CaptionBackendType caption_backend{CaptionBackendType::Mock};
  std::string caption_encoder_path;
  std::string caption_decoder_path;
  std::string caption_vocab_path;
  std::string caption_prompt{"Describe only what is visually present in this image."};
  std::size_t caption_max_new_tokens{20};
  std::string mock_caption{"an image"};

  std::string log_level{"info"};

  [[nodiscard]] std::string resolved_db_path() const;
  [[nodiscard]] std::string resolved_originals_dir() const;
  [[nodiscard]] std::string resolved_thumbs_dir() const;
};

/// Default config when no file is provided.
ServiceConfig default_config();

/// Load config from a simple key=value file (one per line, '#' comments).
/// A missing file yields the defaults; an unparsable value is an InvalidConfig error.
std::expected<ServiceConfig, pictor::core::Error> load_config(const std::string& path);

/// Apply PICTOR_DATA_DIR, PICTOR_DB_PATH, PICTOR_PORT, PICTOR_WORKERS, PICTOR_LOG_LEVEL.
std::expected<void, pictor::core::Error> apply_env_overrides(ServiceConfig& config);

/// Reject combinations that cannot start.
std::expected<void, pictor::core::Error> validate_config(const ServiceConfig& config);

}  // namespace pictor::app
