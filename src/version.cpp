#include "deadbolt/version.hpp"

#include <sstream>

namespace deadbolt {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver   = ENGINE_SEMVER;
  m.hash_primitive  = "blake3";
  // Build timestamp from preprocessor macros; deterministic within a single build.
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"hash_algorithm\":" << m.hash_algorithm
    << ",\"cas_format\":" << m.cas_format
    << ",\"state_format\":" << m.state_format
    << ",\"transition_log\":" << m.transition_log
    << ",\"findings_schema\":" << m.findings_schema
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_state_compatibility(uint32_t state_format) {
  CompatibilityResult r;
  if (state_format != STATE_FORMAT_VERSION) {
    r.ok          = false;
    r.error_code  = "state_format_mismatch";
    r.description = "state.json schema " + std::to_string(state_format) +
                    " != engine state schema " + std::to_string(STATE_FORMAT_VERSION) +
                    ". Start a fresh run; resume across schema versions is not supported.";
  }
  return r;
}

}  // namespace version
}  // namespace deadbolt
