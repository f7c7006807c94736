#include <pictor/storage/local_fs_blob_store.hpp>
#include <fstream>
#include <random>
#include <system_error>
#include <utility>

namespace pictor::storage {

namespace fs = std::filesystem;
namespace pc = pictor::core;

namespace {

pc::Error io_error(const std::string& what, const fs::path& path, const std::error_code& ec = {}) {
  std::string message = what + " " + path.string();
  if (ec) message += ": " + ec.message();
  return pc::make_error(pc::ErrorCode::BlobStore, std::move(message));
}

std::string temp_suffix() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return ".tmp" + std::to_string(rng());
}

}  // namespace

LocalFsBlobStore::LocalFsBlobStore(fs::path originals_root, fs::path derived_root)
    : originals_root_(std::move(originals_root)), derived_root_(std::move(derived_root)) {}

std::expected<void, pc::Error> LocalFsBlobStore::ensure_dirs() const {
  std::error_code ec;
  for (const auto& dir : {originals_root_, derived_root_}) {
    fs::create_directories(dir, ec);
    if (ec) return std::unexpected(io_error("cannot create", dir, ec));
  }
  return {};
}

fs::path LocalFsBlobStore::path_for(const BlobKey& key) const {
  if (key.variant == kOriginalVariant) {
    return originals_root_ / (key.item_id + key.extension);
  }
  return derived_root_ / (key.item_id + "_" + key.variant + key.extension);
}

std::expected<std::string, pc::Error> LocalFsBlobStore::put(const BlobKey& key,
                                                            std::span<const std::byte> bytes) {
  if (key.item_id.empty() || key.variant.empty()) {
    return std::unexpected(pc::make_error(pc::ErrorCode::BlobStore, "blob key is incomplete"));
  }
  const fs::path file = path_for(key);
  std::error_code ec;
  fs::create_directories(file.parent_path(), ec);
  if (ec) return std::unexpected(io_error("cannot create", file.parent_path(), ec));

  // Write beside the target and rename so readers never see a partial blob.
  fs::path tmp = file;
  tmp += temp_suffix();
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) return std::unexpected(io_error("cannot open", tmp));
    os.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      os.close();
      fs::remove(tmp, ec);
      return std::unexpected(io_error("cannot write", tmp));
    }
  }
  fs::rename(tmp, file, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return std::unexpected(io_error("cannot rename into", file, ec));
  }
  return fs::weakly_canonical(file, ec).string();
}

std::expected<pc::Bytes, pc::Error> LocalFsBlobStore::read(const std::string& ref) const {
  const fs::path file(ref);
  std::error_code ec;
  if (ref.empty() || !fs::is_regular_file(file, ec)) {
    return std::unexpected(pc::make_error(pc::ErrorCode::NotFound, "blob not found: " + ref));
  }
  std::ifstream in(file, std::ios::binary);
  if (!in) return std::unexpected(io_error("cannot open", file));
  const auto len = fs::file_size(file, ec);
  if (ec) return std::unexpected(io_error("cannot stat", file, ec));

  pc::Bytes out(static_cast<std::size_t>(len));
  in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(len));
  if (in.gcount() != static_cast<std::streamsize>(len)) {
    return std::unexpected(io_error("short read from", file));
  }
  return out;
}

std::expected<std::uint64_t, pc::Error> LocalFsBlobStore::size(const std::string& ref) const {
  std::error_code ec;
  const auto len = fs::file_size(fs::path(ref), ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return std::unexpected(pc::make_error(pc::ErrorCode::NotFound, "blob not found: " + ref));
    }
    return std::unexpected(io_error("cannot stat", fs::path(ref), ec));
  }
  return static_cast<std::uint64_t>(len);
}

bool LocalFsBlobStore::exists(const std::string& ref) const {
  std::error_code ec;
  return !ref.empty() && fs::is_regular_file(fs::path(ref), ec);
}

std::expected<void, pc::Error> LocalFsBlobStore::remove(const std::string& ref) {
  std::error_code ec;
  fs::remove(fs::path(ref), ec);
  if (ec) return std::unexpected(io_error("cannot remove", fs::path(ref), ec));
  return {};
}

}  // namespace pictor::storage
