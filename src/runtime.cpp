#include "deadbolt/runtime.hpp"

#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>

#include "deadbolt/artifact_store.hpp"
#include "deadbolt/cas.hpp"
#include "deadbolt/jsonlite.hpp"
#include "deadbolt/normalize.hpp"
#include "deadbolt/recorder.hpp"
#include "deadbolt/registry.hpp"
#include "deadbolt/resume.hpp"
#include "deadbolt/scheduler.hpp"
#include "deadbolt/scope.hpp"
#include "deadbolt/tool_version.hpp"

namespace fs = std::filesystem;

namespace deadbolt {

namespace {

RunOutcome fail(ErrorCode code, std::string detail) {
  RunOutcome o;
  o.error = code;
  o.detail = std::move(detail);
  return o;
}

// Creates <root>/<id>, or <root>/<id>_2, _3... when two runs start within the
// same second. Returns "" when nothing could be created.
std::string create_run_dir(const std::string& root, std::string& run_id) {
  std::error_code ec;
  fs::create_directories(root, ec);
  if (ec) return "";
  const std::string base = run_id;
  for (int n = 1; n < 1000; ++n) {
    if (n > 1) run_id = base + "_" + std::to_string(n);
    const fs::path dir = fs::path(root) / run_id;
    if (fs::create_directory(dir, ec)) return dir.string();
    if (ec) return "";
  }
  return "";
}

std::string target_content(const Target& t) {
  jsonlite::Object o;
  o["identifier"] = jsonlite::Value{t.identifier};
  o["kind"] = jsonlite::Value{std::string(t.kind == TargetKind::domain ? "domain" : "package")};
  return jsonlite::to_json(o);
}

}  // namespace

int exit_code_for(const RunOutcome& outcome) {
  if (outcome.error == ErrorCode::scope_violation || outcome.error == ErrorCode::invalid_target) {
    return 2;
  }
  if (outcome.state.status == RunStatus::cancelled || outcome.error == ErrorCode::cancelled) {
    return 130;
  }
  return outcome.ok ? 0 : 1;
}

std::string default_scope_file(const std::string& dir) {
  std::error_code ec;
  const fs::path candidate = fs::path(dir) / kDefaultScopeFile;
  return fs::is_regular_file(candidate, ec) ? candidate.string() : std::string();
}

std::string new_run_id() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "run_%Y%m%d_%H%M%S", &tm);
  return buf;
}

Orchestrator::Orchestrator(OrchestratorConfig config, CancellationToken& cancel)
    : config_(std::move(config)), cancel_(cancel) {}

RunOutcome Orchestrator::run(const RunRequest& request) {
  std::string error;
  const bool resuming = !request.resume_from.empty();

  // Recorded state first on resume: it decides the domain and the targets.
  std::optional<RunState> resumed;
  std::string run_dir;
  std::string output_root = config_.output_root;
  if (resuming) {
    run_dir = resolve_run_dir(config_.output_root, request.resume_from);
    resumed = load_run_state(run_dir, &error);
    if (!resumed) return fail(ErrorCode::resume_inconsistency, error);
    if (!request.domain.empty() && request.domain != resumed->domain) {
      return fail(ErrorCode::config_invalid, "run " + resumed->run_id + " is a " +
                                                 resumed->domain + " run, not " + request.domain);
    }
    // The content store belongs to the root the run was created under.
    output_root = fs::path(run_dir).parent_path().string();
    if (output_root.empty()) output_root = ".";
  }
  const std::string domain = resuming ? resumed->domain : request.domain;

  ToolRegistry registry = builtin_registry(domain);
  std::optional<Plan> plan = builtin_plan(domain);
  if (!plan) return fail(ErrorCode::config_invalid, "unknown domain '" + domain + "'");
  if (!request.tools_file.empty()) {
    auto text = read_file(request.tools_file);
    if (!text) return fail(ErrorCode::config_invalid, "cannot read " + request.tools_file);
    if (!registry.load_json(*text, &error)) {
      return fail(ErrorCode::config_invalid, request.tools_file + ": " + error);
    }
  }
  const std::vector<std::string> plan_errors = validate_plan(*plan, registry);
  if (!plan_errors.empty()) {
    RunOutcome o = fail(ErrorCode::config_invalid, plan_errors.front());
    o.violations = plan_errors;
    return o;
  }

  // Scope gate. Nothing has been written yet.
  std::string scope_file = request.scope_file;
  if (scope_file.empty() && !resuming) {
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) scope_file = default_scope_file(cwd.string());
  }
  std::vector<ScopeRule> rules;
  if (!scope_file.empty()) {
    auto text = read_file(scope_file);
    if (!text) return fail(ErrorCode::config_invalid, "cannot read " + scope_file);
    auto loaded = load_scope_rules(*text, &error);
    if (!loaded) return fail(ErrorCode::config_invalid, scope_file + ": " + error);
    rules = std::move(*loaded);
  }
  std::vector<Target> targets;
  if (resuming) {
    targets = resumed->targets;
  } else {
    TargetParseResult parsed;
    if (domain == "web") {
      auto text = read_file(request.target);
      if (!text) return fail(ErrorCode::invalid_target, "cannot read targets file " + request.target);
      parsed = parse_domain_targets(*text);
    } else {
      parsed = make_package_target(request.target, domain);
    }
    if (!parsed.ok) return fail(parsed.error, parsed.detail);
    targets = std::move(parsed.targets);
  }
  if (!resuming || !scope_file.empty()) {
    ScopeResult scope = validate(targets, rules);
    if (!scope.ok) {
      RunOutcome o = fail(scope.error, scope.violations.empty() ? "no target in scope"
                                                                : scope.violations.front());
      o.violations = std::move(scope.violations);
      return o;
    }
    targets = std::move(scope.allowed);
  }

  RunState state;
  if (resuming) {
    state = std::move(*resumed);
    prepare_for_resume(state);
  } else {
    state.run_id = new_run_id();
    run_dir = create_run_dir(output_root, state.run_id);
    if (run_dir.empty()) {
      return fail(ErrorCode::state_persist_failed, "cannot create a run directory under " + output_root);
    }
    state.domain = domain;
    state.targets = targets;
  }

  auto blobs = std::make_shared<CasStore>((fs::path(output_root) / "cas").string());
  ArtifactStore store(blobs, (fs::path(output_root) / "cas" / "artifacts.ndjson").string(),
                      config_.compress);
  ResumeCache cache((fs::path(output_root) / "cache" / "fingerprints.ndjson").string());
  RunStateRecorder recorder(run_dir);
  if (!recorder.ok()) {
    RunOutcome o = fail(ErrorCode::state_persist_failed, "cannot open the transition log in " + run_dir);
    o.run_dir = run_dir;
    return o;
  }

  if (!resuming) {
    for (const Target& t : state.targets) {
      Artifact a = make_artifact(ArtifactKind::target, t.identifier, target_content(t), "seed");
      a.file_path = t.file_path;
      const StoreResult put = store.put(a);
      if (!put.ok) {
        RunOutcome o = fail(put.error, put.detail);
        o.run_dir = run_dir;
        return o;
      }
      state.artifacts.push_back(a.hash);
    }
  }

  std::unique_ptr<ProcessSandbox> owned;
  ISandboxAdapter* sandbox = sandbox_;
  if (!sandbox) {
    SandboxConfig sc = SandboxConfig::from_env();
    sc.scratch_root = (fs::path(run_dir) / "work").string();
    sc.container_runtime = config_.container_runtime;
    sc.use_containers = sc.use_containers && config_.use_containers;
    sc.max_output_bytes = config_.max_output_bytes;
    resolve_tool_versions(registry, sc);
    owned = std::make_unique<ProcessSandbox>(std::move(sc));
    sandbox = owned.get();
  }

  Normalizer normalizer;
  SchedulerOptions options;
  options.max_concurrency = config_.max_concurrency;
  options.default_timeout_ms = config_.default_timeout_ms;
  PhaseScheduler scheduler(registry, store, cache, *sandbox, normalizer, recorder, cancel_, options);

  RunOutcome outcome;
  outcome.run_dir = run_dir;
  outcome.state = scheduler.run(*plan, std::move(state));

  const StoreResult written = recorder.write_outputs(outcome.state, store);
  switch (outcome.state.status) {
    case RunStatus::completed:
    case RunStatus::completed_with_gaps:
      outcome.ok = written.ok;
      break;
    case RunStatus::cancelled:
      outcome.error = ErrorCode::cancelled;
      break;
    default:
      outcome.error = ErrorCode::mandatory_failure;
      for (const auto& e : outcome.state.errors) {
        const auto colon = e.find(':');
        auto code = error_code_from_string(e.substr(0, colon));
        if (code && is_fatal(*code)) outcome.error = *code;
      }
      break;
  }
  if (!outcome.state.errors.empty()) outcome.detail = outcome.state.errors.back();
  if (!written.ok) {
    outcome.ok = false;
    outcome.error = written.error;
    outcome.detail = written.detail;
  }
  return outcome;
}

}  // namespace deadbolt
