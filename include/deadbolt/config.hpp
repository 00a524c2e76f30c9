#pragma once

// deadbolt/config.hpp — Orchestrator configuration.
//
// Precedence, lowest to highest: built-in defaults, config file (JSON),
// environment, CLI flags. Each layer only overrides the fields it sets.
//
// Environment:
//   DEADBOLT_OUTPUT_ROOT        output root (run directories, cas/, cache/)
//   DEADBOLT_MAX_CONCURRENCY    concurrent invocations per phase
//   DEADBOLT_TIMEOUT_MS         default per-invocation timeout
//   DEADBOLT_CONTAINER_RUNTIME  container runtime binary
//   DEADBOLT_SANDBOX_DISABLED   "1": run tool entrypoints on the host

#include <cstdint>
#include <string>
#include <vector>

namespace deadbolt {

struct OrchestratorConfig {
  std::string output_root{"outputs"};
  std::size_t max_concurrency{4};
  std::uint64_t default_timeout_ms{600000};
  std::size_t max_output_bytes{64u << 20};
  std::string container_runtime{"docker"};
  bool use_containers{true};
  bool compress{false};  // zstd for stored blobs
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Parses and checks a config document without applying it.
ConfigValidationResult validate_config(const std::string& config_json);

// Applies a config document onto `config`. Returns false and sets *error on an
// invalid document; `config` is left unchanged in that case.
bool apply_config_json(OrchestratorConfig& config, const std::string& config_json,
                       std::string* error);

// Applies DEADBOLT_* environment overrides. Malformed numbers are reported in
// *error and ignored.
void apply_env(OrchestratorConfig& config, std::string* error);

std::string config_to_json(const OrchestratorConfig& config);

}  // namespace deadbolt
