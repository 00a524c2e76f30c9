#pragma once

// deadbolt/types.hpp — Core data model for the Deadbolt orchestration engine.
//
// DESIGN INVARIANTS:
//   1. Every value type here is owned by value. No borrowed references escape
//      a component boundary, so a RunState can be copied, persisted and reloaded
//      without fix-ups.
//   2. Artifacts and terminal Invocations are immutable history. A retry of a
//      Failed invocation appends a new Invocation record (attempt + 1); it never
//      rewrites the old one.
//   3. There is no process-wide "current run". A RunState value is passed
//      explicitly through every component call.
//
// Enum <-> string mappings are part of the on-disk contract (state.json,
// transitions.ndjson, findings.json). Renaming an enumerator requires bumping
// version::STATE_FORMAT_VERSION.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace deadbolt {

enum class ErrorCode {
  none,
  scope_violation,
  invalid_target,
  config_invalid,
  json_parse_error,
  sandbox_timeout,
  sandbox_non_zero_exit,
  sandbox_resource_unavailable,
  sandbox_cancelled,
  normalization_error,
  resume_inconsistency,
  state_persist_failed,
  artifact_store_io,
  mandatory_failure,
  cancelled,
};

std::string to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(std::string_view s);

// Fatal categories abort the run: auditability cannot be guaranteed past them.
bool is_fatal(ErrorCode code);

// ---------------------------------------------------------------------------
// Artifacts
// ---------------------------------------------------------------------------
enum class ArtifactKind { target, asset, path, finding };

std::string to_string(ArtifactKind kind);
std::optional<ArtifactKind> artifact_kind_from_string(std::string_view s);

// Canonical severity ladder. Ordering is significant: merges keep the max.
enum class Severity { info = 0, low = 1, medium = 2, high = 3, critical = 4 };

std::string to_string(Severity s);
// Maps tool-specific labels onto the ladder. Unknown labels map to info.
Severity severity_from_label(std::string_view label);

// A Target is what the operator asked us to test. Domain targets are hosts;
// package targets are local APK/IPA files identified by file name.
enum class TargetKind { domain, package };

struct Target {
  std::string identifier;     // lowercase host, or package file name
  TargetKind kind{TargetKind::domain};
  std::string file_path;      // absolute path for package targets, else empty
  std::string matched_rule;   // allow rule that admitted this target
};

enum class ScopeAction { allow, deny };

struct ScopeRule {
  ScopeAction action{ScopeAction::allow};
  std::string pattern;        // "example.com", "*.example.com", ".example.com"
};

// Typed unit of pipeline data. `hash` covers kind + content + producer, so the
// same record produced by two different invocations yields two artifacts.
struct Artifact {
  std::string hash;
  ArtifactKind kind{ArtifactKind::target};
  std::string value;          // host/URL for target|asset|path, finding id for findings
  std::string file_path;      // host file backing a package target
  std::string content;        // canonical JSON record
  std::string producer;       // invocation fingerprint, "seed", or "promoted"
};

// Normalized record emitted by a tool parser. Records of kind asset/path feed
// later phases; records of kind finding are security observations.
struct Finding {
  std::string id;
  ArtifactKind kind{ArtifactKind::finding};
  std::string tool;
  std::string target;         // asset/URL the record refers to
  std::string title;
  std::string category;
  Severity severity{Severity::info};
  std::string rule_id;        // template / rule identifier, if any
  std::uint64_t occurrences{1};
  std::string evidence_json{"{}"};  // canonical JSON object
  std::string discovered_at;  // ISO-8601 UTC
  std::string source_artifact;  // CAS digest of the raw tool output
  std::string invocation;     // fingerprint of the producing invocation
};

// ---------------------------------------------------------------------------
// Tool catalog
// ---------------------------------------------------------------------------
enum class InputMode {
  batch,  // one invocation over every artifact of each consumed kind
  each,   // one invocation per artifact of the first consumed kind
};

std::string to_string(InputMode m);

struct ToolDescriptor {
  std::string name;
  std::string version;
  std::vector<ArtifactKind> consumes;
  std::vector<ArtifactKind> produces;
  // Sandbox invocation template. When `image` is set the tool runs in the
  // container runtime; `entrypoint` then overrides the image entrypoint.
  // Without an image, `entrypoint` is the host executable.
  std::string image;
  std::string entrypoint;
  std::vector<std::string> args;
  std::string output_file;    // read raw output from here; empty = stdout
  std::string stdin_kind;     // feed this kind's worklist on stdin; empty = /dev/null
  std::string parser;         // normalizer adapter key
  InputMode input_mode{InputMode::batch};
  std::uint64_t timeout_ms{0};  // 0 = orchestrator default
  bool mandatory{false};
};

struct PhaseDefinition {
  std::string name;
  std::vector<std::string> tools;
  // Kinds this phase cannot do without. A mandatory tool that fails in an
  // earlier phase while producing one of these fails the run.
  std::vector<ArtifactKind> mandatory_inputs;
  // Fallback at phase start: if no artifact of `second` exists, re-register
  // every artifact of `first` as `second`.
  std::vector<std::pair<ArtifactKind, ArtifactKind>> promote_if_empty;
};

struct Plan {
  std::string domain;
  std::vector<PhaseDefinition> phases;
};

// ---------------------------------------------------------------------------
// Run state
// ---------------------------------------------------------------------------
enum class InvocationStatus { pending, running, succeeded, failed, skipped_cached };

std::string to_string(InvocationStatus s);
std::optional<InvocationStatus> invocation_status_from_string(std::string_view s);
bool is_terminal(InvocationStatus s);

struct Invocation {
  std::string tool;
  std::string tool_version;
  std::string phase;
  std::vector<std::string> input_hashes;  // sorted
  std::string input_set_hash;
  std::string fingerprint;
  std::uint32_t attempt{1};
  InvocationStatus status{InvocationStatus::pending};
  ErrorCode error{ErrorCode::none};
  std::string error_detail;
  int exit_code{0};
  std::string raw_output;     // CAS digest of captured output
  std::string raw_stderr;     // CAS digest of captured stderr
  std::string raw_path;       // run-relative copy, e.g. raw/httpx/<fp>.out
  std::vector<std::string> output_artifacts;
  std::string cached_from;    // run id that originally produced a cached result
  std::string started_at;
  std::string finished_at;
  std::uint64_t duration_ms{0};
};

enum class PhaseStatus { pending, running, completed };

std::string to_string(PhaseStatus s);
std::optional<PhaseStatus> phase_status_from_string(std::string_view s);

struct PhaseRecord {
  std::string name;
  PhaseStatus status{PhaseStatus::pending};
  std::string started_at;
  std::string finished_at;
  std::vector<std::string> skipped_tools;  // no qualifying input
};

enum class RunStatus { running, completed, completed_with_gaps, failed, cancelled };

std::string to_string(RunStatus s);
std::optional<RunStatus> run_status_from_string(std::string_view s);

struct RunState {
  std::string run_id;
  std::string domain;
  std::string started_at;
  std::string finished_at;
  std::size_t current_phase{0};
  RunStatus status{RunStatus::running};
  std::vector<Target> targets;
  std::vector<PhaseRecord> phases;
  std::vector<Invocation> invocations;   // append-only history
  std::vector<std::string> artifacts;    // artifact hashes registered with this run
  std::vector<std::string> errors;       // run-level error summaries
};

// Current UTC wall clock as "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_timestamp_now();

}  // namespace deadbolt
