#include <pictor/core/error.hpp>

namespace pictor::core {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::Validation:
      return "validation";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::StageFailure:
      return "stage_failure";
    case ErrorCode::Repository:
      return "repository";
    case ErrorCode::BlobStore:
      return "blob_store";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::InvalidConfig:
      return "invalid_config";
  }
  return "unknown";
}

}  // namespace pictor::core
