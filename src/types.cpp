#include "deadbolt/types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>

namespace deadbolt {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::scope_violation: return "scope_violation";
    case ErrorCode::invalid_target: return "invalid_target";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::sandbox_timeout: return "sandbox_timeout";
    case ErrorCode::sandbox_non_zero_exit: return "sandbox_non_zero_exit";
    case ErrorCode::sandbox_resource_unavailable: return "sandbox_resource_unavailable";
    case ErrorCode::sandbox_cancelled: return "sandbox_cancelled";
    case ErrorCode::normalization_error: return "normalization_error";
    case ErrorCode::resume_inconsistency: return "resume_inconsistency";
    case ErrorCode::state_persist_failed: return "state_persist_failed";
    case ErrorCode::artifact_store_io: return "artifact_store_io";
    case ErrorCode::mandatory_failure: return "mandatory_failure";
    case ErrorCode::cancelled: return "cancelled";
  }
  return "";
}

std::optional<ErrorCode> error_code_from_string(std::string_view s) {
  static constexpr ErrorCode kAll[] = {
      ErrorCode::none,
      ErrorCode::scope_violation,
      ErrorCode::invalid_target,
      ErrorCode::config_invalid,
      ErrorCode::json_parse_error,
      ErrorCode::sandbox_timeout,
      ErrorCode::sandbox_non_zero_exit,
      ErrorCode::sandbox_resource_unavailable,
      ErrorCode::sandbox_cancelled,
      ErrorCode::normalization_error,
      ErrorCode::resume_inconsistency,
      ErrorCode::state_persist_failed,
      ErrorCode::artifact_store_io,
      ErrorCode::mandatory_failure,
      ErrorCode::cancelled,
  };
  for (ErrorCode c : kAll) {
    if (to_string(c) == s) return c;
  }
  return std::nullopt;
}

bool is_fatal(ErrorCode code) {
  return code == ErrorCode::state_persist_failed || code == ErrorCode::artifact_store_io;
}

std::string to_string(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::target: return "target";
    case ArtifactKind::asset: return "asset";
    case ArtifactKind::path: return "path";
    case ArtifactKind::finding: return "finding";
  }
  return "";
}

std::optional<ArtifactKind> artifact_kind_from_string(std::string_view s) {
  if (s == "target") return ArtifactKind::target;
  if (s == "asset") return ArtifactKind::asset;
  if (s == "path") return ArtifactKind::path;
  if (s == "finding") return ArtifactKind::finding;
  return std::nullopt;
}

std::string to_string(Severity s) {
  switch (s) {
    case Severity::info: return "info";
    case Severity::low: return "low";
    case Severity::medium: return "medium";
    case Severity::high: return "high";
    case Severity::critical: return "critical";
  }
  return "info";
}

Severity severity_from_label(std::string_view label) {
  std::string l(label);
  std::transform(l.begin(), l.end(), l.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (l == "critical") return Severity::critical;
  if (l == "high") return Severity::high;
  if (l == "medium" || l == "warning") return Severity::medium;
  if (l == "low") return Severity::low;
  // "info", "informational", "good" and anything unrecognized.
  return Severity::info;
}

std::string to_string(InputMode m) {
  return m == InputMode::each ? "each" : "batch";
}

std::string to_string(InvocationStatus s) {
  switch (s) {
    case InvocationStatus::pending: return "pending";
    case InvocationStatus::running: return "running";
    case InvocationStatus::succeeded: return "succeeded";
    case InvocationStatus::failed: return "failed";
    case InvocationStatus::skipped_cached: return "skipped_cached";
  }
  return "";
}

std::optional<InvocationStatus> invocation_status_from_string(std::string_view s) {
  if (s == "pending") return InvocationStatus::pending;
  if (s == "running") return InvocationStatus::running;
  if (s == "succeeded") return InvocationStatus::succeeded;
  if (s == "failed") return InvocationStatus::failed;
  if (s == "skipped_cached") return InvocationStatus::skipped_cached;
  return std::nullopt;
}

bool is_terminal(InvocationStatus s) {
  return s == InvocationStatus::succeeded || s == InvocationStatus::failed ||
         s == InvocationStatus::skipped_cached;
}

std::string to_string(PhaseStatus s) {
  switch (s) {
    case PhaseStatus::pending: return "pending";
    case PhaseStatus::running: return "running";
    case PhaseStatus::completed: return "completed";
  }
  return "";
}

std::optional<PhaseStatus> phase_status_from_string(std::string_view s) {
  if (s == "pending") return PhaseStatus::pending;
  if (s == "running") return PhaseStatus::running;
  if (s == "completed") return PhaseStatus::completed;
  return std::nullopt;
}

std::string to_string(RunStatus s) {
  switch (s) {
    case RunStatus::running: return "running";
    case RunStatus::completed: return "completed";
    case RunStatus::completed_with_gaps: return "completed_with_gaps";
    case RunStatus::failed: return "failed";
    case RunStatus::cancelled: return "cancelled";
  }
  return "";
}

std::optional<RunStatus> run_status_from_string(std::string_view s) {
  if (s == "running") return RunStatus::running;
  if (s == "completed") return RunStatus::completed;
  if (s == "completed_with_gaps") return RunStatus::completed_with_gaps;
  if (s == "failed") return RunStatus::failed;
  if (s == "cancelled") return RunStatus::cancelled;
  return std::nullopt;
}

std::string utc_timestamp_now() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

}  // namespace deadbolt
