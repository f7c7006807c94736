/**
 * pictor: image ingest service.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/pictor --serve [--config path]
 *        ./build/pictor --init [--config path]
 *        ./build/pictor --ingest <image>... [--config path]
 */

#include "http_server.hpp"

#include <pictor/app/config.hpp>
#include <pictor/app/json_views.hpp>
#include <pictor/app/service.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <exception>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace {

enum class Mode { None, Init, Serve, Ingest };

void print_usage() {
  std::cout << "Usage: pictor <mode> [--config <path>]\n"
            << "  --init               Create data directories and the database schema\n"
            << "  --serve              Run the HTTP API\n"
            << "  --ingest <path>...   Accept local images, wait for processing, print results\n"
            << "  --config <path>      key=value config file; default: built-in\n"
            << "\nEnvironment: PICTOR_DATA_DIR, PICTOR_DB_PATH, PICTOR_PORT, PICTOR_WORKERS,"
               " PICTOR_LOG_LEVEL\n";
}

std::string content_type_for_path(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
  if (ext == ".png") return "image/png";
  return "application/octet-stream";
}

int ingest_files(pictor::app::PictorService& service, const std::vector<std::string>& paths) {
  std::vector<std::string> accepted_ids;
  int failures = 0;
  for (const auto& path : paths) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      std::cerr << "Cannot open " << path << '\n';
      ++failures;
      continue;
    }
    const std::vector<char> bytes((std::istreambuf_iterator<char>(in)),
                                  std::istreambuf_iterator<char>());
    pictor::app::UploadRequest upload{
        std::filesystem::path(path).filename().string(),
        content_type_for_path(path),
        std::as_bytes(std::span<const char>(bytes)),
    };
    auto accepted = service.ingest().accept(upload);
    if (!accepted) {
      std::cerr << path << ": " << accepted.error().message << '\n';
      ++failures;
      continue;
    }
    accepted_ids.push_back(accepted->id);
  }

  service.dispatcher().wait_idle();

  for (const auto& id : accepted_ids) {
    auto view = service.query().get(id, "");
    if (!view) {
      std::cerr << id << ": " << view.error().message << '\n';
      ++failures;
      continue;
    }
    std::cout << pictor::app::to_json(*view).dump(2) << '\n';
    if (view->status != pictor::core::ItemStatus::Succeeded) ++failures;
  }
  return failures == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  Mode mode = Mode::None;
  std::string config_path;
  std::vector<std::string> inputs;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--init") {
      mode = Mode::Init;
    } else if (arg == "--serve") {
      mode = Mode::Serve;
    } else if (arg == "--ingest") {
      mode = Mode::Ingest;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (mode == Mode::Ingest) {
      inputs.push_back(arg);
    } else {
      std::cerr << "Unknown argument: " << arg << '\n';
      print_usage();
      return 2;
    }
  }
  if (mode == Mode::None) {
    print_usage();
    return 2;
  }

  auto loaded = config_path.empty() ? std::expected<pictor::app::ServiceConfig, pictor::core::Error>(
                                          pictor::app::default_config())
                                    : pictor::app::load_config(config_path);
  if (!loaded) {
    std::cerr << "Config error: " << loaded.error().message << '\n';
    return 1;
  }
  pictor::app::ServiceConfig cfg = std::move(*loaded);
  if (auto env = pictor::app::apply_env_overrides(cfg); !env) {
    std::cerr << "Config error: " << env.error().message << '\n';
    return 1;
  }
  if (auto valid = pictor::app::validate_config(cfg); !valid) {
    std::cerr << "Config error: " << valid.error().message << '\n';
    return 1;
  }
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));

  if (mode == Mode::Init) {
    if (auto init = pictor::app::initialize_storage(cfg); !init) {
      spdlog::error("init failed: {}", init.error().message);
      return 1;
    }
    spdlog::info("initialized {} (db {})", cfg.data_dir, cfg.resolved_db_path());
    return 0;
  }

  if (mode == Mode::Ingest && inputs.empty()) {
    std::cerr << "--ingest requires at least one path\n";
    return 2;
  }

  try {
    pictor::app::PictorService service(cfg);
    if (mode == Mode::Ingest) return ingest_files(service, inputs);
    return pictor::server::run_http_server(service, cfg.host, cfg.port) ? 0 : 1;
  } catch (const std::exception& e) {
    spdlog::error("startup failed: {}", e.what());
    return 1;
  }
}
