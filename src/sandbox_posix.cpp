#ifndef _WIN32

#include "deadbolt/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <set>
#include <sstream>

#include "deadbolt/cas.hpp"
#include "deadbolt/observability.hpp"

namespace fs = std::filesystem;

namespace deadbolt {

namespace {

constexpr const char* kContainerWorkdir = "/work";
constexpr uint32_t kContainerStopTimeoutMs = 10000;

void append_limited(std::string& dst, const char* src, ssize_t n, std::size_t limit,
                    bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) truncated = true;
}

// Reads everything currently available on a non-blocking fd. Returns false
// once the pipe is at EOF (every writer closed it) or unreadable.
bool drain(int fd, std::string& dst, std::size_t limit, bool& truncated) {
  char buf[65536];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_limited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

// Container names accept [a-zA-Z0-9_.-]; anything else becomes '-'.
std::string container_name(const std::string& scratch_path) {
  std::string name = "deadbolt-" + fs::path(scratch_path).filename().string();
  for (char& c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-') c = '-';
  }
  return name;
}

void kill_group(pid_t pid) {
  kill(-pid, SIGKILL);
  kill(pid, SIGKILL);
}

}  // namespace

std::string resolve_executable(const std::string& name,
                               const std::map<std::string, std::string>& env) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? name : std::string{};
  }
  auto it = env.find("PATH");
  const std::string path = it != env.end() ? it->second : "/usr/local/bin:/usr/bin:/bin";
  std::stringstream ss(path);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) continue;
    const std::string candidate = dir + "/" + name;
    struct stat st {};
    if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return {};
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  const std::string exe = resolve_executable(spec.command, spec.env);
  if (exe.empty()) {
    result.spawn_failed = true;
    result.exit_code = 127;
    result.error_message = "executable not found: " + spec.command;
    return result;
  }

  // O_CLOEXEC keeps these pipes out of sibling children forked concurrently by
  // other worker threads; dup2() below clears the flag on the child's copies.
  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    result.spawn_failed = true;
    result.error_message = "pipe failed";
    return result;
  }
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    result.spawn_failed = true;
    result.error_message = "pipe failed";
    return result;
  }

  // Everything the child needs is built before fork(); only async-signal-safe
  // calls run between fork() and execve().
  std::vector<std::string> all = {exe};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  const std::string stdin_path = spec.stdin_path.empty() ? "/dev/null" : spec.stdin_path;

  pid_t pid = fork();
  if (pid < 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    result.spawn_failed = true;
    result.error_message = "fork failed";
    return result;
  }

  if (pid == 0) {
    setsid();
    int in_fd = open(stdin_path.c_str(), O_RDONLY);
    if (in_fd < 0) _exit(127);
    dup2(in_fd, STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) _exit(127);

    if (spec.max_memory_bytes > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.max_memory_bytes;
      rl.rlim_max = spec.max_memory_bytes;
      setrlimit(RLIMIT_AS, &rl);
    }
    if (spec.max_file_descriptors > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.max_file_descriptors;
      rl.rlim_max = spec.max_file_descriptors;
      setrlimit(RLIMIT_NOFILE, &rl);
    }
    // CPU time can never usefully exceed wall-clock timeout.
    if (spec.timeout_ms > 0) {
      struct rlimit rl;
      rl.rlim_cur = (spec.timeout_ms + 999) / 1000;
      rl.rlim_max = rl.rlim_cur + 1;
      setrlimit(RLIMIT_CPU, &rl);
    }

    execve(exe.c_str(), argv.data(), envp.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  // A pipe leaves the poll set at EOF; a hung-up fd would otherwise wake
  // poll() immediately on every pass.
  int open_fds[2] = {out_pipe[0], err_pipe[0]};
  std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
  bool* truncated[2] = {&result.stdout_truncated, &result.stderr_truncated};
  auto drain_open = [&]() {
    for (int i = 0; i < 2; ++i) {
      if (open_fds[i] < 0) continue;
      if (!drain(open_fds[i], *sinks[i], spec.max_output_bytes, *truncated[i])) {
        close(open_fds[i]);
        open_fds[i] = -1;
      }
    }
  };

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  int status = 0;
  while (true) {
    pollfd fds[2];
    nfds_t nfds = 0;
    for (int fd : open_fds) {
      if (fd >= 0) fds[nfds++] = {fd, POLLIN, 0};
    }
    poll(nfds ? fds : nullptr, nfds, 10);
    drain_open();

    if (waitpid(pid, &status, WNOHANG) == pid) break;

    if (spec.cancel && spec.cancel->cancelled()) {
      kill_group(pid);
      waitpid(pid, &status, 0);
      result.cancelled = true;
      break;
    }
    if (spec.timeout_ms > 0 && std::chrono::steady_clock::now() >= deadline) {
      kill_group(pid);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
  }

  // The child has exited; collect whatever is still buffered. Grandchildren
  // holding the write end cannot block us: the fds are non-blocking.
  drain_open();
  for (int fd : open_fds) {
    if (fd >= 0) close(fd);
  }

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (result.cancelled) {
    result.exit_code = 130;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

// ---------------------------------------------------------------------------
// ScratchDir
// ---------------------------------------------------------------------------

ScratchDir::ScratchDir(const std::string& parent, const std::string& label) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) return;
  for (int attempt = 0; attempt < 16; ++attempt) {
    const fs::path candidate = fs::path(parent) / (label + "-" + std::to_string(rng() % 1000000000ULL));
    if (fs::create_directory(candidate, ec) && !ec) {
      fs::permissions(candidate, fs::perms::owner_all, fs::perm_options::replace, ec);
      path_ = fs::absolute(candidate, ec).string();
      return;
    }
  }
}

ScratchDir::~ScratchDir() {
  if (path_.empty()) return;
  std::error_code ec;
  fs::remove_all(path_, ec);
}

std::string expand_placeholders(const std::string& tmpl,
                                const std::map<std::string, std::string>& bindings) {
  std::string out;
  out.reserve(tmpl.size());
  size_t i = 0;
  while (i < tmpl.size()) {
    if (tmpl[i] == '{') {
      const size_t close = tmpl.find('}', i + 1);
      if (close != std::string::npos) {
        auto it = bindings.find(tmpl.substr(i + 1, close - i - 1));
        if (it != bindings.end()) {
          out += it->second;
          i = close + 1;
          continue;
        }
      }
    }
    out += tmpl[i++];
  }
  return out;
}

// ---------------------------------------------------------------------------
// ProcessSandbox
// ---------------------------------------------------------------------------

SandboxConfig SandboxConfig::from_env() {
  SandboxConfig c;
  for (const char* key : {"PATH", "HOME"}) {
    if (const char* v = std::getenv(key)) c.env[key] = v;
  }
  c.env["LANG"] = "C";
  for (const char* key : {"DOCKER_HOST", "DOCKER_CONFIG", "DOCKER_CONTEXT", "DOCKER_CERT_PATH",
                          "DOCKER_TLS_VERIFY"}) {
    if (const char* v = std::getenv(key)) c.env[key] = v;
  }
  const char* disabled = std::getenv("DEADBOLT_SANDBOX_DISABLED");
  if (disabled && std::string(disabled) == "1") c.use_containers = false;
  if (const char* rt = std::getenv("DEADBOLT_CONTAINER_RUNTIME"); rt && rt[0]) c.container_runtime = rt;
  return c;
}

ProcessSandbox::ProcessSandbox(SandboxConfig config) : config_(std::move(config)) {
  if (config_.scratch_root.empty()) {
    config_.scratch_root = (fs::temp_directory_path() / "deadbolt-scratch").string();
  }
}

SandboxOutcome ProcessSandbox::execute(const SandboxRequest& request) {
  SandboxOutcome out;
  ScopeTimer timer(out.duration_ns);

  const ToolDescriptor& tool = *request.tool;
  const bool in_container = config_.use_containers && !tool.image.empty();
  if (!in_container && tool.entrypoint.empty() && tool.name.empty()) {
    out.error = ErrorCode::sandbox_resource_unavailable;
    out.detail = "descriptor has nothing to execute";
    return out;
  }

  ScratchDir scratch(config_.scratch_root, request.label.empty() ? tool.name : request.label);
  if (!scratch.ok()) {
    out.error = ErrorCode::sandbox_resource_unavailable;
    out.detail = "could not create scratch directory under " + config_.scratch_root;
    return out;
  }
  const fs::path host_root(scratch.path());
  const std::string visible_root = in_container ? kContainerWorkdir : scratch.path();
  auto visible = [&](const std::string& rel) { return visible_root + "/" + rel; };

  // Materialize inputs: one sorted, de-duplicated worklist per consumed kind;
  // package files are copied in so the container can see them.
  std::map<std::string, std::string> bindings;
  std::error_code ec;
  fs::create_directories(host_root / "inputs", ec);
  std::map<ArtifactKind, std::string> host_input_for_kind;
  for (ArtifactKind kind : tool.consumes) {
    std::set<std::string> values;
    std::vector<std::string> files;
    for (const auto& a : request.inputs) {
      if (a.kind != kind) continue;
      if (!a.file_path.empty()) {
        const std::string rel = "inputs/" + fs::path(a.file_path).filename().string();
        fs::copy_file(a.file_path, host_root / rel, fs::copy_options::overwrite_existing, ec);
        if (ec) {
          out.error = ErrorCode::sandbox_resource_unavailable;
          out.detail = "cannot stage input file " + a.file_path + ": " + ec.message();
          return out;
        }
        files.push_back(rel);
        values.insert(visible(rel));
      } else {
        values.insert(a.value);
      }
    }
    std::string rel;
    if (files.size() == 1 && values.size() == 1) {
      rel = files.front();
    } else {
      rel = "inputs/" + to_string(kind) + ".txt";
      std::string body;
      for (const auto& v : values) body += v + "\n";
      if (!atomic_write_file((host_root / rel).string(), body)) {
        out.error = ErrorCode::sandbox_resource_unavailable;
        out.detail = "cannot write input worklist " + rel;
        return out;
      }
    }
    bindings["input:" + to_string(kind)] = visible(rel);
    host_input_for_kind[kind] = (host_root / rel).string();
    if (!bindings.contains("input")) bindings["input"] = visible(rel);
  }
  if (!tool.output_file.empty()) {
    fs::create_directories((host_root / tool.output_file).parent_path(), ec);
    bindings["output"] = visible(tool.output_file);
  }
  bindings["workdir"] = visible_root;
  bindings["value"] = request.subject;

  std::vector<std::string> args;
  for (const auto& a : tool.args) args.push_back(expand_placeholders(a, bindings));

  ProcessSpec spec;
  spec.env = config_.env;
  spec.cwd = scratch.path();
  spec.timeout_ms = request.timeout_ms;
  spec.max_output_bytes = config_.max_output_bytes;
  spec.max_memory_bytes = config_.max_memory_bytes;
  spec.max_file_descriptors = config_.max_file_descriptors;
  spec.cancel = request.cancel;
  if (!tool.stdin_kind.empty()) {
    auto k = artifact_kind_from_string(tool.stdin_kind);
    if (k && host_input_for_kind.contains(*k)) spec.stdin_path = host_input_for_kind[*k];
  }

  std::string container;
  if (in_container) {
    container = container_name(scratch.path());
    spec.command = config_.container_runtime;
    spec.argv = {"run", "--rm", "--init", "--name", container};
    if (!spec.stdin_path.empty()) spec.argv.push_back("-i");
    spec.argv.push_back("-v");
    spec.argv.push_back(scratch.path() + ":" + kContainerWorkdir);
    spec.argv.push_back("-w");
    spec.argv.push_back(kContainerWorkdir);
    if (!tool.entrypoint.empty()) {
      spec.argv.push_back("--entrypoint");
      spec.argv.push_back(tool.entrypoint);
    }
    spec.argv.push_back(tool.image);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
  } else {
    spec.command = tool.entrypoint.empty() ? tool.name : tool.entrypoint;
    spec.argv = std::move(args);
  }

  ProcessResult pr = run_process(spec);
  // Killing the runtime client leaves the container itself running; stop it
  // by name while the scratch mount still exists.
  std::string cleanup_note;
  if (in_container && (pr.timed_out || pr.cancelled)) cleanup_note = stop_container(container);
  out.exit_code = pr.exit_code;
  out.stdout_text = std::move(pr.stdout_text);
  out.stderr_text = std::move(pr.stderr_text);

  if (!tool.output_file.empty()) {
    if (auto data = read_file((host_root / tool.output_file).string())) out.raw_output = std::move(*data);
  } else {
    out.raw_output = out.stdout_text;
  }

  if (pr.spawn_failed) {
    out.error = ErrorCode::sandbox_resource_unavailable;
    out.detail = pr.error_message;
  } else if (pr.cancelled) {
    out.error = ErrorCode::sandbox_cancelled;
    out.detail = "cancelled while running";
  } else if (pr.timed_out) {
    out.error = ErrorCode::sandbox_timeout;
    out.detail = "exceeded " + std::to_string(request.timeout_ms) + " ms";
  } else if (pr.exit_code == 127 || (in_container && pr.exit_code == 125)) {
    // 127: exec failed in the child; 125: the container runtime itself failed.
    out.error = ErrorCode::sandbox_resource_unavailable;
    out.detail = "exit " + std::to_string(pr.exit_code) + " (runtime or executable unavailable)";
  } else if (pr.exit_code != 0) {
    out.error = ErrorCode::sandbox_non_zero_exit;
    out.detail = "exit " + std::to_string(pr.exit_code);
  } else {
    out.ok = true;
  }
  if (pr.stdout_truncated || pr.stderr_truncated) {
    out.detail += out.detail.empty() ? "output truncated" : "; output truncated";
  }
  if (!cleanup_note.empty()) out.detail += "; " + cleanup_note;
  return out;
}

std::string ProcessSandbox::stop_container(const std::string& name) const {
  ProcessSpec kill_spec;
  kill_spec.command = config_.container_runtime;
  kill_spec.argv = {"kill", name};
  kill_spec.env = config_.env;
  kill_spec.timeout_ms = kContainerStopTimeoutMs;
  ProcessResult killed = run_process(kill_spec);

  ProcessSpec rm_spec = kill_spec;
  rm_spec.argv = {"rm", "-f", name};
  ProcessResult removed = run_process(rm_spec);

  // --rm usually removes the container as soon as kill lands, so a failing
  // rm alone is expected. Both failing means it may still be alive.
  const bool kill_ok = !killed.spawn_failed && !killed.timed_out && killed.exit_code == 0;
  const bool rm_ok = !removed.spawn_failed && !removed.timed_out && removed.exit_code == 0;
  if (kill_ok || rm_ok) return {};
  return "container " + name + " may still be running (kill exit " + std::to_string(killed.exit_code) +
         ", rm exit " + std::to_string(removed.exit_code) + ")";
}

}  // namespace deadbolt

#endif
