#include <pictor/app/ingest_service.hpp>
#include <pictor/core/timestamp.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <random>
#include <utility>

namespace pictor::app {

namespace pc = pictor::core;

namespace {

std::string hex_digits(std::uint64_t value, int count) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out(static_cast<std::size_t>(count), '0');
  for (int i = count - 1; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kDigits[value & 0xf];
    value >>= 4;
  }
  return out;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

}  // namespace

std::string extension_for_content_type(std::string_view content_type) {
  if (const auto semi = content_type.find(';'); semi != std::string_view::npos) {
    content_type = content_type.substr(0, semi);
  }
  content_type = trim(content_type);
  std::string media(content_type);
  std::transform(media.begin(), media.end(), media.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (media == "image/jpeg") return ".jpg";
  if (media == "image/png") return ".png";
  return {};
}

std::string generate_item_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  const std::uint64_t hi = rng();
  std::uint64_t lo = rng();
  lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;  // variant 10xx
  const std::uint64_t version = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  return hex_digits(version >> 32, 8) + "-" + hex_digits((version >> 16) & 0xffff, 4) + "-" +
         hex_digits(version & 0xffff, 4) + "-" + hex_digits(lo >> 48, 4) + "-" +
         hex_digits(lo & 0xffffffffffffULL, 12);
}

IngestService::IngestService(storage::IItemRepository& repository,
                             storage::IBlobStore& blobs,
                             IJobDispatcher& dispatcher,
                             IdGenerator next_id)
    : repository_(repository),
      blobs_(blobs),
      dispatcher_(dispatcher),
      next_id_(std::move(next_id)) {}

std::expected<AcceptedUpload, pc::Error> IngestService::accept(const UploadRequest& upload) {
  const std::string extension = extension_for_content_type(upload.content_type);
  if (extension.empty()) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::Validation, "Only JPG and PNG are allowed."));
  }
  if (upload.payload.empty()) {
    return std::unexpected(pc::make_error(pc::ErrorCode::Validation, "Empty upload."));
  }

  pc::Item item;
  item.id = next_id_();
  item.original_name = upload.original_name;
  item.mime_type = upload.content_type;
  item.size_bytes = static_cast<std::int64_t>(upload.payload.size());
  item.status = pc::ItemStatus::Processing;
  item.created_at = pc::utc_now_iso();

  auto ref = blobs_.put(storage::BlobKey{item.id, std::string(storage::kOriginalVariant), extension},
                        upload.payload);
  if (!ref) {
    spdlog::error("upload {}: cannot store original: {}", item.id, ref.error().message);
    return std::unexpected(std::move(ref.error()));
  }
  item.stored_ref = std::move(*ref);

  if (auto inserted = repository_.insert(item); !inserted) {
    spdlog::error("upload {}: cannot insert row: {}", item.id, inserted.error().message);
    if (auto removed = blobs_.remove(item.stored_ref); !removed) {
      spdlog::warn("upload {}: cannot remove orphaned original: {}", item.id,
                   removed.error().message);
    }
    return std::unexpected(std::move(inserted.error()));
  }

  if (auto submitted = dispatcher_.submit(item.id); !submitted) {
    spdlog::error("upload {}: {}", item.id, submitted.error().message);
    pc::TerminalUpdate update;
    update.outcome = pc::FailureOutcome{"job dispatcher unavailable"};
    update.completed_at = pc::utc_now_iso();
    if (auto failed = repository_.complete(item.id, update); !failed) {
      spdlog::error("upload {}: cannot mark failed: {}", item.id, failed.error().message);
    }
    return std::unexpected(
        pc::make_error(pc::ErrorCode::Unavailable, "job dispatcher unavailable"));
  }

  spdlog::info("accepted {} '{}' ({} bytes)", item.id, item.original_name, item.size_bytes);
  return AcceptedUpload{item.id, pc::ItemStatus::Processing};
}

}  // namespace pictor::app
