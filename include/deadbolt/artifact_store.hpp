#pragma once

// deadbolt/artifact_store.hpp — Typed, append-only artifact store.
//
// Artifacts are serialized to canonical JSON and stored as CAS blobs; an
// append-only index (artifacts.ndjson) maps artifact hash -> blob digest.
// The store is shared by every run under one output root, which is what lets a
// later run reuse an earlier run's artifacts by identity.
//
// INVARIANTS:
//   - artifact hash = BLAKE3("art:" + kind + value + content + producer).
//     It is recomputed on every get(); a record that no longer hashes to its
//     key is treated as missing.
//   - Write-once per key. put() of an existing, intact artifact is a no-op.
//   - The index is only ever appended to; a torn trailing line (crash during
//     append) is ignored on load.

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "deadbolt/cas.hpp"
#include "deadbolt/types.hpp"

namespace deadbolt {

struct StoreResult {
  bool ok{false};
  std::string hash;
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

std::string compute_artifact_hash(const Artifact& a);

// Builds an artifact and stamps its hash.
Artifact make_artifact(ArtifactKind kind, std::string value, std::string content,
                       std::string producer);

std::string artifact_to_json(const Artifact& a);
std::optional<Artifact> artifact_from_json(const std::string& text);

class ArtifactStore {
 public:
  // index_path: append-only artifact index. compress: store blobs with zstd
  // when the build supports it.
  ArtifactStore(std::shared_ptr<ICASBackend> blobs, std::string index_path,
                bool compress = false);

  StoreResult put(const Artifact& a);
  std::optional<Artifact> get(const std::string& hash) const;
  bool contains(const std::string& hash) const;

  // Raw evidence (tool stdout/stderr/output files).
  StoreResult put_blob(const std::string& data);
  std::optional<std::string> get_blob(const std::string& digest) const;
  bool contains_blob(const std::string& digest) const;

  std::size_t size() const;
  ICASBackend& blobs() { return *blobs_; }

 private:
  void load_index();

  std::shared_ptr<ICASBackend> blobs_;
  std::string index_path_;
  bool compress_{false};
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::string> index_;  // artifact hash -> blob digest
};

}  // namespace deadbolt
