#include "deadbolt/cas.hpp"

// Local filesystem CAS.
//
// Metadata lives in a per-object .meta sidecar written after the blob. An
// object is only visible (contains() == true) once both files exist, so a crash
// between the two renames leaves an orphan blob that the next put() of the same
// content simply completes.

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>

#if defined(DEADBOLT_WITH_ZSTD)
#include <zstd.h>
#endif

#include "deadbolt/hash.hpp"
#include "deadbolt/jsonlite.hpp"

namespace fs = std::filesystem;

namespace deadbolt {

namespace {
#if defined(DEADBOLT_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return (dir / (".tmp_" + std::to_string(rng()))).string();
}

bool valid_digest(const std::string& d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

std::string meta_to_json(const CasObjectInfo& info) {
  jsonlite::Object o;
  o["digest"] = jsonlite::Value{info.digest};
  o["encoding"] = jsonlite::Value{info.encoding};
  o["original_size"] = jsonlite::Value{static_cast<std::uint64_t>(info.original_size)};
  o["stored_size"] = jsonlite::Value{static_cast<std::uint64_t>(info.stored_size)};
  o["stored_blob_hash"] = jsonlite::Value{info.stored_blob_hash};
  o["created_at"] = jsonlite::Value{static_cast<std::uint64_t>(info.created_at_unix_ts)};
  return jsonlite::to_json(o);
}

}  // namespace

bool atomic_write_file(const std::string& target, const std::string& data) {
  const fs::path tp(target);
  std::error_code ec;
  fs::create_directories(tp.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(tp.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, tp, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

CasStore::CasStore(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
}

std::string CasStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string CasStore::meta_path(const std::string& digest) const {
  return object_path(digest) + ".meta";
}

std::string CasStore::put(const std::string& data, const std::string& compression) {
  const std::string digest = cas_content_hash(data);
  if (!valid_digest(digest)) return {};

  // Dedup: already stored. Verify the existing object instead of trusting it,
  // so silent on-disk mutation is repaired by rewriting rather than served.
  if (contains(digest)) {
    auto existing = get(digest);
    if (existing.has_value() && *existing == data) return digest;
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(DEADBOLT_WITH_ZSTD)
  if (compression == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty() && c.size() < data.size()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  if (!atomic_write_file(object_path(digest), stored)) return {};

  CasObjectInfo info;
  info.digest = digest;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));

  if (!atomic_write_file(meta_path(digest), meta_to_json(info))) {
    std::error_code ec;
    fs::remove(object_path(digest), ec);
    return {};
  }
  return digest;
}

std::optional<CasObjectInfo> CasStore::info(const std::string& digest) const {
  if (!valid_digest(digest)) return std::nullopt;
  auto text = read_file(meta_path(digest));
  if (!text) return std::nullopt;

  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;

  CasObjectInfo inf;
  inf.digest = jsonlite::get_string(obj, "digest");
  inf.encoding = jsonlite::get_string(obj, "encoding", "identity");
  inf.original_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "original_size"));
  inf.stored_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "stored_size"));
  inf.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  inf.created_at_unix_ts = jsonlite::get_u64(obj, "created_at");
  if (inf.digest != digest) return std::nullopt;
  return inf;
}

std::optional<std::string> CasStore::get(const std::string& digest) const {
  if (!valid_digest(digest)) return std::nullopt;
  auto meta = info(digest);
  if (!meta) return std::nullopt;
  auto data = read_file(object_path(digest));
  if (!data) return std::nullopt;

  if (blake3_hex(*data) != meta->stored_blob_hash) return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(DEADBOLT_WITH_ZSTD)
    auto plain = decompress_zstd(*data, meta->original_size);
    if (!plain) return std::nullopt;
    data = std::move(plain);
#else
    // Written by a zstd-enabled build; this build cannot decode it.
    return std::nullopt;
#endif
  }

  if (cas_content_hash(*data) != digest) return std::nullopt;
  return data;
}

bool CasStore::contains(const std::string& digest) const {
  if (!valid_digest(digest)) return false;
  std::error_code ec;
  return fs::exists(object_path(digest), ec) && fs::exists(meta_path(digest), ec);
}

}  // namespace deadbolt
