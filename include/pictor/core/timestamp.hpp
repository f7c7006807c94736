#pragma once

#include <chrono>
#include <string>

namespace pictor::core {

/// ISO-8601 UTC with second precision and a "Z" suffix, e.g. "2024-05-01T12:00:00Z".
[[nodiscard]] std::string format_utc(std::chrono::system_clock::time_point tp);

[[nodiscard]] inline std::string utc_now_iso() {
  return format_utc(std::chrono::system_clock::now());
}

}  // namespace pictor::core
