#include <pictor/app/config.hpp>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <utility>

namespace pictor::app {

namespace pc = pictor::core;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T>
std::expected<T, pc::Error> parse_number(const std::string& key, const std::string& value) {
  T out{};
  const auto* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, out);
  if (ec != std::errc() || ptr != end) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::InvalidConfig, key + ": not a number: '" + value + "'"));
  }
  return out;
}

std::expected<void, pc::Error> apply(ServiceConfig& c, const std::string& key,
                                     const std::string& value) {
  if (key == "data_dir") c.data_dir = value;
  else if (key == "db_path") c.db_path = value;
  else if (key == "originals_dir") c.originals_dir = value;
  else if (key == "thumbs_dir") c.thumbs_dir = value;
  else if (key == "host") c.host = value;
  else if (key == "port") {
    auto v = parse_number<std::uint16_t>(key, value);
    if (!v) return std::unexpected(v.error());
    c.port = *v;
  }
  else if (key == "workers") {
    auto v = parse_number<std::size_t>(key, value);
    if (!v) return std::unexpected(v.error());
    c.workers = *v;
  }
  else if (key == "dispatcher") {
    if (value == "threads") c.dispatcher = DispatcherType::Threads;
    else if (value == "tbb") c.dispatcher = DispatcherType::Tbb;
    else return std::unexpected(pc::make_error(pc::ErrorCode::InvalidConfig,
                                               "dispatcher must be threads or tbb"));
  }
  else if (key == "caption_backend") {
    if (value == "mock") c.caption_backend = CaptionBackendType::Mock;
    else if (value == "onnx") c.caption_backend = CaptionBackendType::Onnx;
    else return std::unexpected(pc::make_error(pc::ErrorCode::InvalidConfig,
                                               "caption_backend must be mock or onnx"));
  }
  else if (key == "caption_encoder_path") c.caption_encoder_path = value;
  else if (key == "caption_decoder_path") c.caption_decoder_path = value;
  else if (key == "caption_vocab_path") c.caption_vocab_path = value;
  else if (key == "caption_prompt") c.caption_prompt = value;
  else if (key == "caption_max_new_tokens") {
    auto v = parse_number<std::size_t>(key, value);
    if (!v) return std::unexpected(v.error());
    c.caption_max_new_tokens = *v;
  }
  else if (key == "mock_caption") c.mock_caption = value;
  else if (key == "log_level") c.log_level = value;
  return {};
}

std::string joined(const std::string& dir, const char* leaf) {
  return (std::filesystem::path(dir) / leaf).string();
}

}  // namespace

std::string ServiceConfig::resolved_db_path() const {
  return db_path.empty() ? joined(data_dir, "app.db") : db_path;
}

std::string ServiceConfig::resolved_originals_dir() const {
  return originals_dir.empty() ? joined(data_dir, "originals") : originals_dir;
}

std::string ServiceConfig::resolved_thumbs_dir() const {
  return thumbs_dir.empty() ? joined(data_dir, "thumbs") : thumbs_dir;
}

ServiceConfig default_config() {
  return ServiceConfig{};
}

std::expected<ServiceConfig, pc::Error> load_config(const std::string& path) {
  ServiceConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    if (auto r = apply(c, key, value); !r) return std::unexpected(r.error());
  }
  return c;
}

std::expected<void, pc::Error> apply_env_overrides(ServiceConfig& config) {
  static constexpr std::pair<const char*, const char*> kEnv[] = {
      {"PICTOR_DATA_DIR", "data_dir"},   {"PICTOR_DB_PATH", "db_path"},
      {"PICTOR_PORT", "port"},           {"PICTOR_WORKERS", "workers"},
      {"PICTOR_LOG_LEVEL", "log_level"},
  };
  for (const auto& [env, key] : kEnv) {
    if (const char* v = std::getenv(env)) {
      if (auto r = apply(config, key, v); !r) return r;
    }
  }
  return {};
}

std::expected<void, pc::Error> validate_config(const ServiceConfig& config) {
  if (config.port == 0) {
    return std::unexpected(pc::make_error(pc::ErrorCode::InvalidConfig, "port must be non-zero"));
  }
  if (config.caption_backend == CaptionBackendType::Onnx &&
      (config.caption_encoder_path.empty() || config.caption_decoder_path.empty() ||
       config.caption_vocab_path.empty())) {
    return std::unexpected(pc::make_error(
        pc::ErrorCode::InvalidConfig,
        "caption_backend=onnx requires caption_encoder_path, caption_decoder_path and "
        "caption_vocab_path"));
  }
#ifndef PICTOR_HAS_TBB
  if (config.dispatcher == DispatcherType::Tbb) {
    return std::unexpected(pc::make_error(pc::ErrorCode::InvalidConfig,
                                          "dispatcher=tbb requires a build with oneTBB"));
  }
#endif
  return {};
}

}  // namespace pictor::app
