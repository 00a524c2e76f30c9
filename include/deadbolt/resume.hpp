#pragma once

// deadbolt/resume.hpp — Content-addressed resume cache.
//
// fingerprint = BLAKE3("inv:" + "v<HASH_ALGORITHM_VERSION>" + tool identity +
//                      tool version + combination_hash(input artifact hashes))
//
// The cache is an append-only index (<output_root>/cache/fingerprints.ndjson)
// shared by every run under one output root: that output root is the
// run-state lineage. Only Succeeded invocations are recorded, so a Failed
// result is never served and is always retried.
//
// Hits are content-determined: no timestamps, mtimes or run ordering take part
// in the lookup. A fingerprint is recorded again only when a rerun replaced an
// inconsistent entry; the last record in the index wins.

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "deadbolt/types.hpp"

namespace deadbolt {

class ArtifactStore;

std::string compute_fingerprint(const ToolDescriptor& tool,
                                const std::vector<std::string>& input_hashes);

struct CachedResult {
  std::string fingerprint;
  std::string tool;
  std::string run_id;                 // run that executed the tool
  std::string raw_output;             // CAS digests
  std::string raw_stderr;
  std::vector<std::string> output_artifacts;
  int exit_code{0};
  std::string finished_at;
};

enum class CacheVerdict { miss, hit, inconsistent };

struct CacheLookup {
  CacheVerdict verdict{CacheVerdict::miss};
  std::optional<CachedResult> result;  // set for hit and inconsistent
  std::string detail;                  // what is missing when inconsistent
};

class ResumeCache {
 public:
  explicit ResumeCache(std::string index_path);

  // Raw index lookup.
  std::optional<CachedResult> lookup(const std::string& fingerprint) const;

  // Lookup plus a check that the raw output and every referenced artifact is
  // still intact in `store`. A record pointing at missing data is reported as
  // inconsistent and must be treated as a miss.
  CacheLookup lookup_verified(const std::string& fingerprint, const ArtifactStore& store) const;

  // Records a Succeeded invocation. Returns false on I/O failure.
  bool record(const CachedResult& result);

  std::size_t size() const;
  const std::string& index_path() const { return index_path_; }

 private:
  std::string index_path_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, CachedResult> entries_;
};

std::string cached_result_to_json(const CachedResult& r);
std::optional<CachedResult> cached_result_from_json(const std::string& line);

}  // namespace deadbolt
