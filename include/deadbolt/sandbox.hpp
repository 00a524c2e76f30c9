#pragma once

// deadbolt/sandbox.hpp — Tool execution sandbox.
//
// Two layers:
//   run_process()     fork/exec one command in its own session with rlimits,
//                     bounded output capture, a hard timeout and cooperative
//                     cancellation. Knows nothing about tools.
//   ISandboxAdapter   runs one ToolDescriptor against a set of input artifacts.
//                     ProcessSandbox is the production implementation: it
//                     materializes inputs into a private scratch directory,
//                     expands the args template, and (when an image is set)
//                     wraps the command in the container runtime.
//
// ISOLATION CONTRACT:
//   - Every invocation gets its own scratch directory, created fresh and
//     removed when the invocation finishes (ScratchDir, RAII). Two concurrent
//     invocations never share a writable path.
//   - The child runs in a new session (setsid), so a timeout or cancellation
//     kills the whole process group, not just the direct child.
//   - The child environment is exactly SandboxConfig::env; nothing else from
//     the orchestrator's environment leaks in.
//   - Raw stdout/stderr are always returned, on success and on failure.

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "deadbolt/types.hpp"

namespace deadbolt {

// Run-level cancellation flag, shared by the scheduler and every in-flight
// sandboxed execution. Once cancelled it stays cancelled.
class CancellationToken {
 public:
  void cancel() { flag_.store(true, std::memory_order_release); }
  bool cancelled() const { return flag_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> flag_{false};
};

struct ProcessSpec {
  std::string command;        // absolute path, or a name resolved via PATH in env
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  std::string cwd;
  std::string stdin_path;     // empty = /dev/null
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{4096};
  std::uint64_t max_memory_bytes{0};      // 0 = unlimited
  std::uint64_t max_file_descriptors{0};  // 0 = unlimited
  const CancellationToken* cancel{nullptr};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool cancelled{false};
  bool spawn_failed{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;
};

ProcessResult run_process(const ProcessSpec& spec);

// Resolves `name` against the PATH entry of `env` (or returns it unchanged if it
// already contains a '/'). Returns "" if no executable is found.
std::string resolve_executable(const std::string& name,
                               const std::map<std::string, std::string>& env);

// ---------------------------------------------------------------------------
// ScratchDir — per-invocation private working directory (RAII).
// ---------------------------------------------------------------------------
class ScratchDir {
 public:
  ScratchDir(const std::string& parent, const std::string& label);
  ~ScratchDir();
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  bool ok() const { return !path_.empty(); }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

// Replaces every "{key}" in `tmpl` whose key is bound. Unbound braces are left
// untouched.
std::string expand_placeholders(const std::string& tmpl,
                                const std::map<std::string, std::string>& bindings);

// ---------------------------------------------------------------------------
// ISandboxAdapter
// ---------------------------------------------------------------------------
struct SandboxRequest {
  const ToolDescriptor* tool{nullptr};
  std::vector<Artifact> inputs;
  std::string subject;        // bound to {value} for input_mode=each
  std::string label;          // scratch directory label (fingerprint prefix)
  std::uint64_t timeout_ms{0};
  const CancellationToken* cancel{nullptr};
};

struct SandboxOutcome {
  bool ok{false};
  ErrorCode error{ErrorCode::none};  // sandbox_* sub-kind when !ok
  std::string detail;
  int exit_code{0};
  std::string raw_output;     // output_file contents, or stdout when none
  std::string stdout_text;
  std::string stderr_text;
  std::uint64_t duration_ns{0};
};

// Implementations must be safe to call concurrently from worker threads.
class ISandboxAdapter {
 public:
  virtual ~ISandboxAdapter() = default;
  virtual SandboxOutcome execute(const SandboxRequest& request) = 0;
};

struct SandboxConfig {
  std::string scratch_root;                 // parent of per-invocation scratch dirs
  std::string container_runtime{"docker"};
  bool use_containers{true};                // false: run entrypoint on the host
  std::size_t max_output_bytes{64u << 20};
  std::uint64_t max_memory_bytes{0};
  std::uint64_t max_file_descriptors{0};
  std::map<std::string, std::string> env;   // complete child environment

  // PATH, HOME, LANG=C and DOCKER_* from the current environment.
  // DEADBOLT_SANDBOX_DISABLED=1 sets use_containers=false.
  static SandboxConfig from_env();
};

class ProcessSandbox : public ISandboxAdapter {
 public:
  explicit ProcessSandbox(SandboxConfig config);

  SandboxOutcome execute(const SandboxRequest& request) override;

  const SandboxConfig& config() const { return config_; }

 private:
  // Best-effort `<runtime> kill` then `<runtime> rm -f` for a named container.
  // Returns a note for the outcome detail when neither call succeeded.
  std::string stop_container(const std::string& name) const;

  SandboxConfig config_;
};

}  // namespace deadbolt
