#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace pictor::core {

/// Error codes; used with std::expected for recoverable failures.
enum class ErrorCode {
  Validation,     // bad upload: content type, empty body, unknown variant
  NotFound,       // unknown item, missing blob
  Conflict,       // lifecycle precondition not met (not ready, already terminal, duplicate id)
  StageFailure,   // a derivation stage failed
  Repository,     // item store fault
  BlobStore,      // blob store fault
  Unavailable,    // dispatcher stopped
  InvalidConfig,
};

/// Error code plus a human-readable message.
struct Error {
  ErrorCode code{ErrorCode::Repository};
  std::string message;
};

[[nodiscard]] inline Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

}  // namespace pictor::core
