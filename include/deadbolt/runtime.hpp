#pragma once

// deadbolt/runtime.hpp — Run orchestration entry point.
//
// Orchestrator::run() is the whole lifecycle of one run:
//   1. tool catalog + phase plan for the domain (built-in, then tools.json)
//   2. targets and scope rules; a scope violation returns here, before any
//      directory, artifact or process exists
//   3. run directory, shared content store and resume cache under output_root
//   4. target artifacts seeded into the store
//   5. installed tool versions resolved (own sandbox only), PhaseScheduler::run()
//   6. meta.json and normalized/*.json
//
// Without RunRequest::scope_file a new run reads ./scope.json if present.
// A resume (RunRequest::resume_from) skips 2-4: targets and artifacts come
// from the recorded state. When a scope file is given the recorded targets are
// checked against it again.

#include <string>
#include <vector>

#include "deadbolt/config.hpp"
#include "deadbolt/sandbox.hpp"
#include "deadbolt/types.hpp"

namespace deadbolt {

struct RunRequest {
  std::string domain;       // web | android | ios
  std::string target;       // targets file (web) or package file (android/ios)
  std::string scope_file;   // {"allow": [...], "deny": [...]}; default ./scope.json
  std::string tools_file;   // optional {"tools": [...]} overrides
  std::string resume_from;  // run directory or run id under output_root
};

struct RunOutcome {
  bool ok{false};  // completed, possibly with gaps
  ErrorCode error{ErrorCode::none};
  std::string detail;
  std::vector<std::string> violations;
  std::string run_dir;
  RunState state;
};

// 0 completed (with or without gaps), 2 scope violation or invalid target,
// 130 cancelled, 1 everything else.
int exit_code_for(const RunOutcome& outcome);

// Scope rules picked up from the working directory when a new run names no
// scope file.
constexpr const char* kDefaultScopeFile = "scope.json";

// <dir>/scope.json when it exists as a regular file, else "".
std::string default_scope_file(const std::string& dir);

// "run_YYYYMMDD_HHMMSS" for the current UTC time.
std::string new_run_id();

class Orchestrator {
 public:
  Orchestrator(OrchestratorConfig config, CancellationToken& cancel);

  // Replaces the ProcessSandbox built from the config. Not owned.
  void set_sandbox(ISandboxAdapter* sandbox) { sandbox_ = sandbox; }

  RunOutcome run(const RunRequest& request);

  const OrchestratorConfig& config() const { return config_; }

 private:
  OrchestratorConfig config_;
  CancellationToken& cancel_;
  ISandboxAdapter* sandbox_{nullptr};
};

}  // namespace deadbolt
