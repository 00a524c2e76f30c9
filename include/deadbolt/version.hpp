#pragma once

// deadbolt/version.hpp — Version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift between the engine and the run directories it
//   wrote earlier. Every reader of a versioned format checks the matching
//   constant here before trusting the data; resume refuses a state.json whose
//   schema it does not understand rather than guessing.
//
// INVARIANT:
//   All version constants are compile-time. Changing any hashed encoding
//   (domain prefixes, canonical JSON, fingerprint payload) requires bumping
//   HASH_ALGORITHM_VERSION, which in turn invalidates every resume cache entry.

#include <cstdint>
#include <string>

namespace deadbolt {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.4.0";

// Version 1 = BLAKE3-256, hex encoded, prefix domain separation.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Version 2 = AB/CD/<64-char-digest> sharding with JSON .meta sidecars.
constexpr uint32_t CAS_FORMAT_VERSION = 2;

// state.json schema. Version 1 = {schema, run_id, phases[], invocations[], ...}.
constexpr uint32_t STATE_FORMAT_VERSION = 1;

// transitions.ndjson: hash-chained invocation/run transitions.
constexpr uint32_t TRANSITION_LOG_VERSION = 1;

// normalized/findings.json record layout.
constexpr uint32_t FINDINGS_SCHEMA_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cas_format{CAS_FORMAT_VERSION};
  uint32_t state_format{STATE_FORMAT_VERSION};
  uint32_t transition_log{TRANSITION_LOG_VERSION};
  uint32_t findings_schema{FINDINGS_SCHEMA_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

// Serialize to compact JSON.
std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;    // Empty if ok
  std::string description;
};

// Checks a persisted state.json schema number against STATE_FORMAT_VERSION.
// Never throws.
CompatibilityResult check_state_compatibility(uint32_t state_format);

}  // namespace version
}  // namespace deadbolt
