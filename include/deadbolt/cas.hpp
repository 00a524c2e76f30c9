#pragma once

// deadbolt/cas.hpp — Content-addressable blob storage.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. CAS key = BLAKE3("cas:" + original_bytes), always. Content-addressed,
//      never location-addressed.
//   2. Writes are atomic: tmp + rename on the same filesystem.
//   3. Reads verify integrity: the stored blob hash and then the content hash
//      are checked before any byte is returned.
//   4. Fail-closed: an integrity failure returns nullopt, never corrupted data.
//   5. Write-once: a second put() of the same content returns the same digest
//      and never rewrites the object. Concurrent writers of the same key race
//      only on an atomic rename of identical bytes.
//
// The orchestrator stores raw tool output (the evidence behind every finding)
// and serialized artifact records here.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace deadbolt {

struct CasObjectInfo {
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  uint64_t created_at_unix_ts{0};
};

// ---------------------------------------------------------------------------
// ICASBackend — abstract storage backend interface
// ---------------------------------------------------------------------------
// Thread-safety: all implementations MUST be safe for concurrent calls.
class ICASBackend {
 public:
  virtual ~ICASBackend() = default;

  // Store data. Returns the content digest on success, "" on failure.
  // compression: "off" (identity) or "zstd" (if built with DEADBOLT_WITH_ZSTD).
  virtual std::string put(const std::string& data,
                          const std::string& compression = "off") = 0;

  // Retrieve data by digest. Returns nullopt if not found or integrity fails.
  virtual std::optional<std::string> get(const std::string& digest) const = 0;

  // Check existence without loading data.
  virtual bool contains(const std::string& digest) const = 0;

  // Get object metadata without loading the blob.
  virtual std::optional<CasObjectInfo> info(const std::string& digest) const = 0;

  // Human-readable backend identifier for diagnostics.
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// CasStore — local filesystem backend
// ---------------------------------------------------------------------------
// Stores objects as sharded files under:
//   <root>/objects/AB/CD/<full-64-char-digest>
//   <root>/objects/AB/CD/<full-64-char-digest>.meta
class CasStore : public ICASBackend {
 public:
  explicit CasStore(std::string root);

  std::string put(const std::string& data, const std::string& compression = "off") override;
  std::optional<std::string> get(const std::string& digest) const override;
  bool contains(const std::string& digest) const override;
  std::optional<CasObjectInfo> info(const std::string& digest) const override;
  std::string backend_id() const override { return "local_fs"; }

  const std::string& root() const { return root_; }
  std::string object_path(const std::string& digest) const;
  std::string meta_path(const std::string& digest) const;

 private:
  std::string root_;
};

// Atomic write: temp file in the target directory, then rename into place.
// Creates parent directories. Shared by every persisted format.
bool atomic_write_file(const std::string& target, const std::string& data);

// Whole-file read. Returns nullopt if the file cannot be opened.
std::optional<std::string> read_file(const std::string& path);

}  // namespace deadbolt
