#pragma once

#include <cstdint>
#include <string>

namespace pictor::app {
class PictorService;
}

namespace pictor::server {

/// Start a blocking HTTP server over the service. Returns false if the port cannot be bound.
bool run_http_server(pictor::app::PictorService& service, const std::string& host,
                     std::uint16_t port);

}  // namespace pictor::server
