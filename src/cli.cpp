#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "deadbolt/audit.hpp"
#include "deadbolt/cas.hpp"
#include "deadbolt/config.hpp"
#include "deadbolt/hash.hpp"
#include "deadbolt/jsonlite.hpp"
#include "deadbolt/observability.hpp"
#include "deadbolt/recorder.hpp"
#include "deadbolt/runtime.hpp"
#include "deadbolt/sandbox.hpp"
#include "deadbolt/version.hpp"
#include "deadbolt/worker.hpp"

namespace {

deadbolt::CancellationToken g_cancel;

extern "C" void on_signal(int) { g_cancel.cancel(); }

void print_usage() {
  std::cerr << "usage:\n"
               "  deadbolt web <targets-file> [options]\n"
               "  deadbolt android <app.apk> [options]\n"
               "  deadbolt ios <app.ipa> [options]\n"
               "  deadbolt state <run-dir>\n"
               "  deadbolt health\n"
               "  deadbolt version\n"
               "options:\n"
               "  --scope <file>        scope rules {\"allow\": [...], \"deny\": [...]}\n"
               "                        (default: ./scope.json when it exists)\n"
               "  --tools <file>        tool catalog overrides {\"tools\": [...]}\n"
               "  --config <file>       orchestrator config\n"
               "  --resume-from <dir>   continue a previous run\n"
               "  --output-root <dir>   run and store root (default: outputs)\n"
               "  --concurrency <n>     parallel invocations per phase\n"
               "  --timeout-ms <n>      default tool timeout\n"
               "  --no-containers       run tool entrypoints on the host\n";
}

// Progress lines on stderr; stdout carries only the final summary.
void progress(const deadbolt::RunEvent& ev) {
  using deadbolt::RunEventType;
  switch (ev.type) {
    case RunEventType::phase_started:
      std::cerr << "[" << ev.run_id << "] phase " << ev.phase << "\n";
      break;
    case RunEventType::invocation_finished:
      std::cerr << "  " << ev.tool << " " << ev.status;
      if (ev.error != deadbolt::ErrorCode::none) std::cerr << " (" << deadbolt::to_string(ev.error) << ")";
      std::cerr << " " << ev.artifacts << " records, " << ev.duration_ns / 1000000 << " ms\n";
      break;
    case RunEventType::cache_hit:
      std::cerr << "  " << ev.tool << " cached " << ev.fingerprint.substr(0, 12) << "\n";
      break;
    case RunEventType::resume_inconsistency:
    case RunEventType::normalization_failed:
      std::cerr << "  " << ev.tool << " " << deadbolt::to_string(ev.type) << ": " << ev.detail << "\n";
      break;
    default:
      break;
  }
}

bool parse_count(const std::string& s, std::uint64_t& out) {
  if (s.empty() || s.size() > 12) return false;
  out = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    out = out * 10 + static_cast<std::uint64_t>(c - '0');
  }
  return out > 0;
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (deadbolt::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (deadbolt::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

int run_command(const std::string& domain, int argc, char** argv) {
  deadbolt::RunRequest req;
  req.domain = domain;
  std::string config_file, output_root, concurrency, timeout;
  bool no_containers = false;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&](std::string& dst) {
      if (i + 1 >= argc) return false;
      dst = argv[++i];
      return true;
    };
    bool ok = true;
    if (a == "--scope") ok = value(req.scope_file);
    else if (a == "--tools") ok = value(req.tools_file);
    else if (a == "--config") ok = value(config_file);
    else if (a == "--resume-from") ok = value(req.resume_from);
    else if (a == "--output-root") ok = value(output_root);
    else if (a == "--concurrency") ok = value(concurrency);
    else if (a == "--timeout-ms") ok = value(timeout);
    else if (a == "--no-containers") no_containers = true;
    else if (a.rfind("--", 0) == 0) ok = false;
    else if (req.target.empty()) req.target = a;
    else ok = false;
    if (!ok) {
      std::cerr << "deadbolt: bad argument '" << a << "'\n";
      print_usage();
      return 1;
    }
  }
  if (req.target.empty() && req.resume_from.empty()) {
    print_usage();
    return 2;
  }

  // Precedence: defaults < config file < environment < flags.
  deadbolt::OrchestratorConfig cfg;
  std::string error;
  if (!config_file.empty()) {
    auto text = deadbolt::read_file(config_file);
    if (!text) {
      std::cerr << "deadbolt: cannot read " << config_file << "\n";
      return 1;
    }
    const auto check = deadbolt::validate_config(*text);
    for (const auto& w : check.warnings) std::cerr << "deadbolt: config warning: " << w << "\n";
    if (!check.ok || !deadbolt::apply_config_json(cfg, *text, &error)) {
      for (const auto& e : check.errors) std::cerr << "deadbolt: config error: " << e << "\n";
      if (!error.empty()) std::cerr << "deadbolt: config error: " << error << "\n";
      return 1;
    }
  }
  deadbolt::apply_env(cfg, &error);
  if (!error.empty()) {
    std::cerr << "deadbolt: " << error << "\n";
    return 1;
  }
  if (!output_root.empty()) cfg.output_root = output_root;
  std::uint64_t n = 0;
  if (!concurrency.empty()) {
    if (!parse_count(concurrency, n)) {
      std::cerr << "deadbolt: --concurrency must be a positive integer\n";
      return 1;
    }
    cfg.max_concurrency = static_cast<std::size_t>(std::min<std::uint64_t>(n, 64));
  }
  if (!timeout.empty()) {
    if (!parse_count(timeout, n)) {
      std::cerr << "deadbolt: --timeout-ms must be a positive integer\n";
      return 1;
    }
    cfg.default_timeout_ms = n;
  }
  if (no_containers) cfg.use_containers = false;

  deadbolt::init_worker_identity();
  deadbolt::set_run_event_hook(&progress);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  deadbolt::Orchestrator orchestrator(cfg, g_cancel);
  const deadbolt::RunOutcome outcome = orchestrator.run(req);
  const int code = deadbolt::exit_code_for(outcome);

  if (outcome.state.run_id.empty()) {
    std::cerr << "deadbolt: " << deadbolt::to_string(outcome.error) << ": " << outcome.detail << "\n";
    for (std::size_t i = 1; i < outcome.violations.size(); ++i) {
      std::cerr << "deadbolt: " << outcome.violations[i] << "\n";
    }
    return code;
  }
  std::cout << deadbolt::run_summary_text(outcome.state);
  std::cout << "run directory: " << outcome.run_dir << "\n";
  if (!outcome.ok && outcome.error != deadbolt::ErrorCode::none) {
    std::cerr << "deadbolt: " << deadbolt::to_string(outcome.error) << ": " << outcome.detail << "\n";
  }
  return code;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd = argc > 1 ? argv[1] : "";
  if (cmd.empty() || cmd == "--help" || cmd == "-h") {
    print_usage();
    return cmd.empty() ? 1 : 0;
  }

  if (cmd == "web" || cmd == "android" || cmd == "ios") {
    return run_command(cmd, argc, argv);
  }

  if (cmd == "state") {
    if (argc < 3) {
      print_usage();
      return 1;
    }
    std::string error;
    auto state = deadbolt::load_run_state(argv[2], &error);
    if (!state) {
      std::cerr << "deadbolt: " << error << "\n";
      return 1;
    }
    std::cout << deadbolt::run_summary_text(*state);
    const auto chain = deadbolt::verify_transition_log(
        (std::filesystem::path(argv[2]) / "transitions.ndjson").string());
    std::cout << "transition log: " << chain.entries << " entries, "
              << (chain.ok ? "chain intact" : "chain broken: " + chain.error) << "\n";
    return chain.ok ? 0 : 1;
  }

  if (cmd == "health") {
    const auto h = deadbolt::hash_runtime_info();
    std::vector<std::string> blockers;
    if (!verify_hash_vectors()) blockers.push_back("hash_vectors_mismatch");
    deadbolt::OrchestratorConfig cfg;
    std::string env_error;
    deadbolt::apply_env(cfg, &env_error);
    if (!env_error.empty()) blockers.push_back("environment: " + env_error);
    if (cfg.use_containers) {
      const auto sc = deadbolt::SandboxConfig::from_env();
      if (deadbolt::resolve_executable(cfg.container_runtime, sc.env).empty()) {
        blockers.push_back("container runtime '" + cfg.container_runtime + "' not found on PATH");
      }
    }

    std::cout << "{\"ok\":" << (blockers.empty() ? "true" : "false") << ",\"blockers\":[";
    for (size_t i = 0; i < blockers.size(); ++i) {
      if (i) std::cout << ",";
      std::cout << "\"" << deadbolt::jsonlite::escape(blockers[i]) << "\"";
    }
    std::cout << "]";
    std::cout << ",\"hash_primitive\":\"" << h.primitive << "\"";
    std::cout << ",\"hash_backend\":\"" << h.backend << "\"";
    std::cout << ",\"hash_version\":\"" << h.version << "\"";
    std::cout << ",\"compression_capabilities\":[\"identity\"";
#if defined(DEADBOLT_WITH_ZSTD)
    std::cout << ",\"zstd\"";
#endif
    std::cout << "]";
    std::cout << ",\"config\":" << deadbolt::config_to_json(cfg);
    std::cout << ",\"worker\":" << deadbolt::worker_identity_to_json(deadbolt::init_worker_identity());
    std::cout << ",\"stats\":" << deadbolt::global_engine_stats().to_json();
    std::cout << "}" << "\n";
    return blockers.empty() ? 0 : 1;
  }

  if (cmd == "version") {
    std::cout << deadbolt::version::manifest_to_json(deadbolt::version::current_manifest()) << "\n";
    return 0;
  }

  std::cerr << "deadbolt: unknown command '" << cmd << "'\n";
  print_usage();
  return 1;
}
