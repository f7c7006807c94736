#include "http_server.hpp"

#include <pictor/app/json_views.hpp>
#include <pictor/app/service.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <span>
#include <string>

namespace pictor::server {

namespace {

using nlohmann::json;

void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response& res, const pictor::core::Error& error) {
  send_json(res, pictor::app::http_status_for(error.code), pictor::app::error_body(error));
}

/// Scheme and authority the client used, without a trailing slash.
std::string base_url(const httplib::Request& req) {
  std::string host = req.get_header_value("Host");
  if (host.empty()) host = req.local_addr + ":" + std::to_string(req.local_port);
  return "http://" + host;
}

}  // namespace

bool run_http_server(pictor::app::PictorService& service, const std::string& host,
                     std::uint16_t port) {
  httplib::Server svr;

  svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, json{{"message", "API is working"}});
  });

  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /api/images, multipart field "file"
  svr.Post("/api/images", [&service](const httplib::Request& req, httplib::Response& res) {
    if (!req.has_file("file")) {
      send_json(res, 422, json{{"detail", "multipart field 'file' is required"}});
      return;
    }
    const auto file = req.get_file_value("file");
    pictor::app::UploadRequest upload{
        file.filename,
        file.content_type,
        std::as_bytes(std::span<const char>(file.content.data(), file.content.size())),
    };
    auto accepted = service.ingest().accept(upload);
    if (!accepted) {
      send_error(res, accepted.error());
      return;
    }
    send_json(res, 200, pictor::app::to_json(*accepted));
  });

  svr.Get("/api/images", [&service](const httplib::Request& req, httplib::Response& res) {
    auto views = service.query().list(base_url(req));
    if (!views) {
      send_error(res, views.error());
      return;
    }
    send_json(res, 200, pictor::app::to_json(*views));
  });

  svr.Get(R"(/api/images/([^/]+))", [&service](const httplib::Request& req, httplib::Response& res) {
    auto view = service.query().get(req.matches[1], base_url(req));
    if (!view) {
      send_error(res, view.error());
      return;
    }
    send_json(res, 200, pictor::app::to_json(*view));
  });

  svr.Get(R"(/api/images/([^/]+)/thumbnails/([^/]+))",
          [&service](const httplib::Request& req, httplib::Response& res) {
            auto thumb = service.query().thumbnail(req.matches[1], std::string(req.matches[2]));
            if (!thumb) {
              send_error(res, thumb.error());
              return;
            }
            res.status = 200;
            res.set_content(reinterpret_cast<const char*>(thumb->bytes.data()),
                            thumb->bytes.size(), thumb->content_type);
          });

  svr.Get("/api/stats", [&service](const httplib::Request&, httplib::Response& res) {
    auto stats = service.query().stats();
    if (!stats) {
      send_error(res, stats.error());
      return;
    }
    send_json(res, 200, pictor::app::to_json(*stats));
  });

  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                               std::exception_ptr ep) {
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      spdlog::error("{} {}: {}", req.method, req.path, e.what());
    } catch (...) {
      spdlog::error("{} {}: unknown exception", req.method, req.path);
    }
    send_json(res, 500, json{{"detail", "internal error"}});
  });

  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://{}:{}", host, port);
  if (!svr.listen(host, port)) {
    spdlog::error("Failed to bind {}:{}", host, port);
    return false;
  }
  return true;
}

}  // namespace pictor::server
