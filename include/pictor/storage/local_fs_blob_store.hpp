#pragma once

#include <pictor/storage/blob_store.hpp>
#include <filesystem>
#include <string>

namespace pictor::storage {

/// Filesystem blob store. Originals live in originals_root as "<id><ext>",
/// derived variants in derived_root as "<id>_<variant><ext>". References are
/// absolute paths.
class LocalFsBlobStore : public IBlobStore {
 public:
  LocalFsBlobStore(std::filesystem::path originals_root, std::filesystem::path derived_root);

  /// Create both roots if missing.
  [[nodiscard]] std::expected<void, pictor::core::Error> ensure_dirs() const;

  /// Where put() would place this key.
  [[nodiscard]] std::filesystem::path path_for(const BlobKey& key) const;

  [[nodiscard]] std::expected<std::string, pictor::core::Error>
  put(const BlobKey& key, std::span<const std::byte> bytes) override;

  [[nodiscard]] std::expected<pictor::core::Bytes, pictor::core::Error>
  read(const std::string& ref) const override;

  [[nodiscard]] std::expected<std::uint64_t, pictor::core::Error>
  size(const std::string& ref) const override;

  [[nodiscard]] bool exists(const std::string& ref) const override;

  [[nodiscard]] std::expected<void, pictor::core::Error>
  remove(const std::string& ref) override;

 private:
  std::filesystem::path originals_root_;
  std::filesystem::path derived_root_;
};

}  // namespace pictor::storage
