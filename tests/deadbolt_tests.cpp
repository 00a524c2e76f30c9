#include <sys/resource.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "deadbolt/artifact_store.hpp"
#include "deadbolt/audit.hpp"
#include "deadbolt/cas.hpp"
#include "deadbolt/config.hpp"
#include "deadbolt/hash.hpp"
#include "deadbolt/jsonlite.hpp"
#include "deadbolt/normalize.hpp"
#include "deadbolt/observability.hpp"
#include "deadbolt/recorder.hpp"
#include "deadbolt/registry.hpp"
#include "deadbolt/resume.hpp"
#include "deadbolt/runtime.hpp"
#include "deadbolt/sandbox.hpp"
#include "deadbolt/scheduler.hpp"
#include "deadbolt/scope.hpp"
#include "deadbolt/tool_version.hpp"
#include "deadbolt/version.hpp"
#include "deadbolt/worker.hpp"

namespace fs = std::filesystem;
using namespace deadbolt;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("deadbolt_test_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

void write_text(const fs::path& p, const std::string& data) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << data;
}

// Stand-in container runtime: appends its arguments to <dir>/calls.log,
// answers `image inspect` with `image_id` (fails when empty) and sleeps on `run`.
fs::path fake_runtime(const fs::path& dir, const std::string& image_id) {
  const fs::path script = dir / "runtime.sh";
  write_text(script, "#!/bin/sh\n"
                     "echo \"$*\" >> '" + (dir / "calls.log").string() + "'\n"
                     "case \"$1\" in\n"
                     "  run) sleep 5 ;;\n"
                     "  image) [ -n '" + image_id + "' ] || exit 1; echo '" + image_id + "' ;;\n"
                     "esac\n");
  fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);
  return script;
}

std::vector<std::string> logged_calls(const fs::path& dir) {
  std::vector<std::string> lines;
  auto text = read_file((dir / "calls.log").string());
  if (!text) return lines;
  std::istringstream in(*text);
  for (std::string line; std::getline(in, line);) lines.push_back(line);
  return lines;
}

// ---------------------------------------------------------------------------
// Scheduler fixtures: a two-phase plan run against a scripted sandbox.
//   discover: enum  (target -> asset, one invocation per target)
//   scan:     scan (asset -> finding, one invocation per asset), needs assets
// ---------------------------------------------------------------------------

SandboxOutcome ok_output(const std::string& raw) {
  SandboxOutcome o;
  o.ok = true;
  o.raw_output = raw;
  o.stdout_text = raw;
  o.duration_ns = 1000000;
  return o;
}

SandboxOutcome failed_output(ErrorCode code, int exit_code, const std::string& raw = "") {
  SandboxOutcome o;
  o.error = code;
  o.exit_code = exit_code;
  o.detail = "exit " + std::to_string(exit_code);
  o.raw_output = raw;
  o.stdout_text = raw;
  o.stderr_text = "scripted failure\n";
  return o;
}

std::string enum_output(const std::string& subject) {
  return "www." + subject + "\napi." + subject + "\n";
}

std::string scan_output(const std::string& subject) {
  return "{\"asset\":\"" + subject +
         "\",\"title\":\"Exposed admin panel\",\"severity\":\"high\",\"rule\":\"admin-panel\"}\n";
}

SandboxOutcome standard_behavior(const SandboxRequest& req) {
  if (req.tool->name == "enum") return ok_output(enum_output(req.subject));
  return ok_output(scan_output(req.subject));
}

class FakeSandbox : public ISandboxAdapter {
 public:
  using Behavior = std::function<SandboxOutcome(const SandboxRequest&)>;

  explicit FakeSandbox(Behavior behavior = standard_behavior) : behavior_(std::move(behavior)) {}

  SandboxOutcome execute(const SandboxRequest& req) override {
    const int now = ++in_flight_;
    int seen = max_in_flight_.load();
    while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
    }
    ++executions_;
    {
      std::lock_guard<std::mutex> lk(mu_);
      calls_.push_back(req.tool->name + ":" + req.subject);
    }
    SandboxOutcome out = behavior_(req);
    --in_flight_;
    return out;
  }

  int executions() const { return executions_.load(); }
  int max_in_flight() const { return max_in_flight_.load(); }
  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lk(mu_);
    return calls_;
  }

 private:
  Behavior behavior_;
  std::atomic<int> in_flight_{0};
  std::atomic<int> max_in_flight_{0};
  std::atomic<int> executions_{0};
  mutable std::mutex mu_;
  std::vector<std::string> calls_;
};

ToolRegistry test_registry(bool enum_mandatory = false) {
  ToolRegistry r;
  std::string err;
  ToolDescriptor e;
  e.name = "enum";
  e.version = "1.0";
  e.consumes = {ArtifactKind::target};
  e.produces = {ArtifactKind::asset};
  e.entrypoint = "enum";
  e.parser = "lines_asset";
  e.input_mode = InputMode::each;
  e.mandatory = enum_mandatory;
  expect(r.add(e, &err), "enum descriptor: " + err);

  ToolDescriptor p;
  p.name = "scan";
  p.version = "2.0";
  p.consumes = {ArtifactKind::asset};
  p.produces = {ArtifactKind::finding};
  p.entrypoint = "scan";
  p.parser = "findings_jsonl";
  p.input_mode = InputMode::each;
  expect(r.add(p, &err), "scan descriptor: " + err);
  return r;
}

Plan test_plan() {
  Plan p;
  p.domain = "test";
  p.phases.push_back(PhaseDefinition{"discover", {"enum"}, {}, {}});
  p.phases.push_back(PhaseDefinition{"scan", {"scan"}, {ArtifactKind::asset}, {}});
  return p;
}

struct Harness {
  fs::path root;
  std::shared_ptr<CasStore> blobs;
  ArtifactStore store;
  ResumeCache cache;
  Normalizer normalizer;

  explicit Harness(const std::string& name)
      : root(fresh_dir(name)),
        blobs(std::make_shared<CasStore>((root / "cas").string())),
        store(blobs, (root / "cas" / "artifacts.ndjson").string()),
        cache((root / "cache" / "fingerprints.ndjson").string()) {}

  std::string run_dir(const std::string& run_id) const { return (root / run_id).string(); }

  RunState fresh_state(const std::string& run_id, const std::vector<std::string>& hosts) {
    RunState s;
    s.run_id = run_id;
    s.domain = "test";
    for (const auto& h : hosts) {
      Target t;
      t.identifier = h;
      s.targets.push_back(t);
      Artifact a = make_artifact(ArtifactKind::target, h, "{\"identifier\":\"" + h + "\"}", "seed");
      expect(store.put(a).ok, "seed artifact stored");
      s.artifacts.push_back(a.hash);
    }
    return s;
  }

  RunState run(RunState state, ISandboxAdapter& sandbox, CancellationToken& cancel,
               std::size_t concurrency = 4, const ToolRegistry& registry = test_registry(),
               const Plan& plan = test_plan()) {
    RunStateRecorder recorder(run_dir(state.run_id));
    expect(recorder.ok(), "recorder opened");
    SchedulerOptions options;
    options.max_concurrency = concurrency;
    options.default_timeout_ms = 5000;
    PhaseScheduler scheduler(registry, store, cache, sandbox, normalizer, recorder, cancel, options);
    return scheduler.run(plan, std::move(state));
  }
};

std::size_t count_status(const RunState& s, const std::string& tool, InvocationStatus status) {
  return static_cast<std::size_t>(std::count_if(
      s.invocations.begin(), s.invocations.end(),
      [&](const Invocation& i) { return i.tool == tool && i.status == status; }));
}

std::vector<std::string> finding_ids(const std::string& run_dir) {
  auto text = read_file((fs::path(run_dir) / "normalized" / "findings.json").string());
  expect(text.has_value(), "findings.json written");
  auto doc = jsonlite::parse(*text, nullptr);
  std::vector<std::string> ids;
  if (const auto* arr = jsonlite::get_array(doc, "findings")) {
    for (const auto& v : *arr) {
      if (const auto* o = std::get_if<jsonlite::Object>(&v.v)) ids.push_back(jsonlite::get_string(*o, "id"));
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  expect(hash_domain("cas:", "x") != hash_domain("art:", "x"), "cas and art domains differ");
  expect(hash_domain("inv:", "x") != hash_domain("fnd:", "x"), "inv and fnd domains differ");
  expect(cas_content_hash("x") == hash_domain("cas:", "x"), "CAS key uses the cas: domain");
}

void test_combination_hash_order_independent() {
  const std::string a = blake3_hex("a"), b = blake3_hex("b"), c = blake3_hex("c");
  expect(combination_hash({a, b, c}) == combination_hash({c, a, b}), "order does not matter");
  expect(combination_hash({a, b, b}) == combination_hash({b, a}), "duplicates collapse");
  expect(combination_hash({a, b}) != combination_hash({a, c}), "different sets differ");
}

// ============================================================================
// Scope Gate
// ============================================================================

Target domain_target(const std::string& host) {
  Target t;
  t.identifier = host;
  return t;
}

void test_scope_pattern_forms() {
  const ScopeRule exact{ScopeAction::allow, "example.com"};
  const ScopeRule sub{ScopeAction::allow, "*.example.com"};
  const ScopeRule apex{ScopeAction::allow, ".example.com"};

  expect(rule_matches(exact, domain_target("example.com")), "exact matches apex");
  expect(!rule_matches(exact, domain_target("www.example.com")), "exact rejects subdomain");
  expect(rule_matches(sub, domain_target("www.example.com")), "wildcard matches subdomain");
  expect(rule_matches(sub, domain_target("a.b.example.com")), "wildcard matches deep subdomain");
  expect(!rule_matches(sub, domain_target("example.com")), "wildcard rejects apex");
  expect(!rule_matches(sub, domain_target("badexample.com")), "wildcard respects label boundary");
  expect(rule_matches(apex, domain_target("example.com")), "dot form matches apex");
  expect(rule_matches(apex, domain_target("api.example.com")), "dot form matches subdomain");
  expect(rule_matches(ScopeRule{ScopeAction::allow, "*.EXAMPLE.com."}, domain_target("www.example.com")),
         "case and trailing dot ignored");
}

void test_scope_deny_first_all_or_nothing() {
  const std::vector<ScopeRule> rules = {{ScopeAction::allow, ".example.com"},
                                        {ScopeAction::deny, "admin.example.com"}};
  auto ok = validate({domain_target("www.example.com"), domain_target("example.com")}, rules);
  expect(ok.ok && ok.allowed.size() == 2, "in-scope targets accepted");
  expect(ok.allowed[0].matched_rule == ".example.com", "matched rule recorded");

  auto bad = validate({domain_target("www.example.com"), domain_target("admin.example.com"),
                       domain_target("other.org")},
                      rules);
  expect(!bad.ok, "one out-of-scope target rejects the run");
  expect(bad.error == ErrorCode::scope_violation, "scope_violation reported");
  expect(bad.allowed.empty(), "nothing is admitted on violation");
  expect(bad.violations.size() == 2, "every violation listed");
}

void test_scope_empty_allow_rejects() {
  auto r = validate({domain_target("example.com")}, {});
  expect(!r.ok, "empty allow list rejects everything");
  auto none = validate({}, {{ScopeAction::allow, "example.com"}});
  expect(!none.ok, "no targets is a violation");
}

void test_scope_package_targets() {
  Target apk;
  apk.identifier = "app.apk";
  apk.kind = TargetKind::package;
  expect(validate({apk}, {{ScopeAction::allow, "app.apk"}}).ok, "package matched by file name");
  expect(!validate({apk}, {{ScopeAction::allow, "App.apk"}}).ok, "package match is case-sensitive");
}

void test_scope_rules_document() {
  std::string err;
  auto rules = load_scope_rules(R"({"allow":["example.com","*.example.com"],"deny":["admin.example.com"]})", &err);
  expect(rules.has_value() && rules->size() == 3, "scope document parsed");
  expect(!load_scope_rules(R"({"allow":[""]})", &err).has_value(), "empty pattern rejected");
  expect(!load_scope_rules(R"({"allow":"example.com"})", &err).has_value(), "non-array rejected");
}

void test_target_extraction() {
  auto r = parse_domain_targets(
      "https://user@WWW.Example.com:8443/login\nexample.org.\n\n# comment\nexample.org\n");
  expect(r.ok, "targets parsed");
  expect(r.targets.size() == 2, "duplicates removed");
  expect(r.targets[0].identifier == "www.example.com", "URL reduced to lowercase host");
  expect(r.targets[1].identifier == "example.org", "trailing dot removed");
  expect(!parse_domain_targets("\n# only comments\n").ok, "empty targets file is invalid");

  const fs::path dir = fresh_dir("package");
  write_text(dir / "app.apk", "PK");
  auto apk = make_package_target((dir / "app.apk").string(), "android");
  expect(apk.ok && apk.targets[0].identifier == "app.apk", "apk target identified by file name");
  expect(make_package_target((dir / "app.apk").string(), "ios").error == ErrorCode::invalid_target,
         "ipa domain rejects apk");
  expect(!make_package_target((dir / "missing.apk").string(), "android").ok, "missing file rejected");
}

// ============================================================================
// Artifact Store
// ============================================================================

void test_cas_put_get_integrity() {
  const fs::path dir = fresh_dir("cas");
  CasStore cas(dir.string());
  const std::string d = cas.put("raw tool output");
  expect(d.size() == 64, "digest returned");
  expect(cas.put("raw tool output") == d, "write-once dedup");
  auto back = cas.get(d);
  expect(back && *back == "raw tool output", "round trip");
  auto info = cas.info(d);
  expect(info && info->original_size == 15, "metadata recorded");
}

void test_cas_corruption_detection() {
  const fs::path dir = fresh_dir("cas_corrupt");
  CasStore cas(dir.string());
  const std::string d = cas.put("evidence");
  write_text(cas.object_path(d), "tampered");
  expect(!cas.get(d).has_value(), "corrupted object is never served");
}

void test_artifact_store_identity() {
  const fs::path dir = fresh_dir("artifacts");
  auto blobs = std::make_shared<CasStore>((dir / "cas").string());
  const std::string index = (dir / "cas" / "artifacts.ndjson").string();
  Artifact a = make_artifact(ArtifactKind::asset, "www.example.com", "{\"target\":\"www.example.com\"}", "fp1");
  Artifact b = make_artifact(ArtifactKind::asset, "www.example.com", "{\"target\":\"www.example.com\"}", "fp2");
  expect(a.hash != b.hash, "producer is part of artifact identity");
  expect(a.hash == compute_artifact_hash(a), "hash stamped by make_artifact");
  {
    ArtifactStore store(blobs, index);
    expect(store.put(a).ok, "put");
    expect(store.put(a).ok, "second put is a no-op");
    expect(store.size() == 1, "one entry");
  }
  ArtifactStore reopened(blobs, index);
  auto got = reopened.get(a.hash);
  expect(got && got->value == "www.example.com" && got->kind == ArtifactKind::asset, "index survives reopen");
  expect(!reopened.get(b.hash), "unknown artifact is absent");

  // A record whose blob is damaged is treated as missing.
  write_text(blobs->object_path(cas_content_hash(artifact_to_json(a))), "junk");
  expect(!reopened.get(a.hash).has_value(), "damaged artifact is missing");
}

// ============================================================================
// Tool Registry
// ============================================================================

void test_builtin_plans_valid() {
  for (const std::string domain : {"web", "android", "ios"}) {
    auto plan = builtin_plan(domain);
    expect(plan.has_value(), domain + " plan exists");
    auto errors = validate_plan(*plan, builtin_registry(domain));
    expect(errors.empty(), domain + " plan valid: " + (errors.empty() ? "" : errors.front()));
  }
  expect(!builtin_plan("desktop").has_value(), "unknown domain has no plan");
  auto web = builtin_registry("web");
  const ToolDescriptor* nuclei = web.find("nuclei");
  expect(nuclei && nuclei->produces == std::vector<ArtifactKind>{ArtifactKind::finding},
         "nuclei produces findings");
}

void test_plan_validation_errors() {
  ToolRegistry r = test_registry();
  Plan p;
  p.domain = "test";
  p.phases.push_back(PhaseDefinition{"only", {"scan", "missing"}, {}, {}});
  auto errors = validate_plan(p, r);
  expect(errors.size() == 2, "unknown tool and unavailable input both reported");

  Plan twice = test_plan();
  twice.phases[1].tools.push_back("enum");
  expect(!validate_plan(twice, r).empty(), "tool in two phases rejected");
}

void test_registry_overrides() {
  ToolRegistry r = builtin_registry("web");
  std::string err;
  expect(r.load_json(R"({"tools":[{"name":"nuclei","version":"3.4.0","timeout_ms":1000}]})", &err),
         "override accepted: " + err);
  const ToolDescriptor* n = r.find("nuclei");
  expect(n->version == "3.4.0" && n->timeout_ms == 1000, "fields replaced");
  expect(n->parser == "nuclei", "unspecified fields kept from the built-in");
  expect(!r.load_json(R"({"tools":[{"name":"new-tool","version":"1"}]})", &err), "incomplete new tool rejected");
}

void test_fingerprint_properties() {
  ToolRegistry r = test_registry();
  ToolDescriptor t = *r.find("scan");
  const std::string a = blake3_hex("a"), b = blake3_hex("b");
  const std::string fp = compute_fingerprint(t, {a, b});
  expect(fp == compute_fingerprint(t, {b, a}), "input order does not change the fingerprint");
  ToolDescriptor bumped = t;
  bumped.version = "2.1";
  expect(fp != compute_fingerprint(bumped, {a, b}), "tool version is part of the fingerprint");
  ToolDescriptor args = t;
  args.args = {"-silent"};
  expect(fp != compute_fingerprint(args, {a, b}), "invocation template is part of the fingerprint");
  expect(fp != compute_fingerprint(t, {a}), "input set is part of the fingerprint");
}

void test_installed_version_feeds_fingerprint() {
  const fs::path dir_a = fresh_dir("tool_version_a");
  const fs::path dir_b = fresh_dir("tool_version_b");
  const fs::path dir_none = fresh_dir("tool_version_none");
  SandboxConfig a;
  a.use_containers = true;
  a.env["PATH"] = "/usr/bin:/bin";
  a.container_runtime = fake_runtime(dir_a, "sha256:aaaa").string();
  SandboxConfig b = a;
  b.container_runtime = fake_runtime(dir_b, "sha256:bbbb").string();
  SandboxConfig none = a;
  none.container_runtime = fake_runtime(dir_none, "").string();

  ToolDescriptor t = *test_registry().find("scan");
  t.image = "deadbolt-scan";
  const ToolVersion va = resolve_tool_version(t, a);
  const ToolVersion vb = resolve_tool_version(t, b);
  expect(va.value == "sha256:aaaa" && va.source == "image", "image id resolved");
  expect(vb.value == "sha256:bbbb", "rebuilt image resolved");
  const std::vector<std::string> inspected = logged_calls(dir_a);
  expect(inspected.size() == 1 && inspected.front() == "image inspect --format {{.Id}} deadbolt-scan",
         "image inspected once");

  ToolDescriptor before = t;
  ToolDescriptor after = t;
  before.version = va.value;
  after.version = vb.value;
  const std::string input = blake3_hex("asset");
  expect(compute_fingerprint(before, {input}) != compute_fingerprint(after, {input}),
         "a rebuilt image changes the fingerprint");

  write_text(dir_a / "calls.log", "");
  expect(resolve_tool_version(t, a).value == "sha256:aaaa", "same answer on the second lookup");
  expect(logged_calls(dir_a).empty(), "second lookup served from the process cache");

  const ToolVersion declared = resolve_tool_version(t, none);
  expect(declared.value == "2.0" && declared.source == "declared", "declared version is the fallback");

  ToolRegistry r = test_registry();
  ToolDescriptor scan = *r.find("scan");
  scan.image = "deadbolt-scan";
  std::string err;
  expect(r.add(scan, &err), "image added: " + err);
  resolve_tool_versions(r, b);
  expect(r.find("scan")->version == "sha256:bbbb", "registry carries the resolved version");
  expect(r.find("enum")->version == "1.0", "unresolvable host tool keeps its declared version");

  expect(extract_semver("nuclei v3.4.1 (latest)") == "3.4.1", "semver extracted");
  expect(extract_semver("build 12.3, no release") == "", "two-part numbers are not versions");
}

// ============================================================================
// Findings Normalizer
// ============================================================================

NormalizeContext fixed_context() {
  NormalizeContext ctx;
  ctx.source_artifact = blake3_hex("raw");
  ctx.invocation = blake3_hex("fp");
  ctx.discovered_at = "2026-01-01T00:00:00Z";
  return ctx;
}

void test_normalize_nuclei_merges_duplicates() {
  Normalizer n;
  const std::string raw =
      R"({"host":"https://a.example.com","template-id":"exposed-git","info":{"name":"Git exposed","severity":"low"}})"
      "\n"
      R"({"host":"https://a.example.com","template-id":"exposed-git","info":{"name":"Git config exposed","severity":"critical"}})"
      "\n"
      R"({"host":"https://b.example.com","template-id":"exposed-git","info":{"name":"Git exposed","severity":"medium"}})"
      "\n";
  auto r = n.normalize("nuclei", raw, fixed_context());
  expect(r.ok, "nuclei output normalized");
  expect(r.findings.size() == 2, "same host and template merged");
  auto it = std::find_if(r.findings.begin(), r.findings.end(),
                         [](const Finding& f) { return f.target == "https://a.example.com"; });
  expect(it != r.findings.end(), "merged finding present");
  expect(it->occurrences == 2, "occurrences accumulate");
  expect(it->severity == Severity::critical, "highest severity wins");
  expect(it->tool == "nuclei" && it->source_artifact == fixed_context().source_artifact,
         "provenance stamped");
}

void test_normalize_idempotent() {
  Normalizer n;
  const std::string raw = "www.example.com\napi.example.com\nwww.example.com\n";
  auto a = n.normalize("subfinder", raw, [] {
    auto c = fixed_context();
    c.parser = "lines_asset";
    return c;
  }());
  auto b = n.normalize("subfinder", raw, [] {
    auto c = fixed_context();
    c.parser = "lines_asset";
    return c;
  }());
  expect(a.ok && b.ok, "both normalized");
  expect(a.findings.size() == 2, "duplicate lines merged");
  for (std::size_t i = 0; i < a.findings.size(); ++i) {
    expect(a.findings[i].id == b.findings[i].id, "stable ids");
    expect(jsonlite::to_json(finding_to_json(a.findings[i])) == jsonlite::to_json(finding_to_json(b.findings[i])),
           "identical records");
  }
  expect(a.findings[0].kind == ArtifactKind::asset, "lines_asset yields assets");
}

void test_normalize_failures() {
  Normalizer n;
  auto bad = n.normalize("httpx", "this is not json\n", fixed_context());
  expect(!bad.ok && bad.error == ErrorCode::normalization_error, "malformed JSONL fails");
  auto unknown = n.normalize("no-such-tool", "x", fixed_context());
  expect(!unknown.ok && unknown.error == ErrorCode::normalization_error, "unknown parser fails");
  auto empty = n.normalize("httpx", "", fixed_context());
  expect(empty.ok && empty.findings.empty(), "empty output is valid");
}

void test_normalize_paths_and_httpx() {
  Normalizer n;
  auto ctx = fixed_context();
  ctx.parser = "lines_path";
  auto paths = n.normalize("gau", "https://example.com/a?x=1\nnot a url\n/relative\n", ctx);
  expect(paths.ok && paths.findings.size() == 1, "only absolute URLs kept");
  expect(paths.findings[0].kind == ArtifactKind::path, "paths are path artifacts");

  auto httpx = n.normalize(
      "httpx", R"({"url":"https://www.example.com","status_code":200,"title":"Home","tech":["nginx"]})", fixed_context());
  expect(httpx.ok && httpx.findings.size() == 1, "httpx row parsed");
  expect(httpx.findings[0].target == "https://www.example.com", "url is the target");
  expect(httpx.findings[0].evidence_json.find("\"status_code\":200") != std::string::npos, "evidence kept");
}

void test_finding_json_round_trip() {
  Normalizer n;
  auto r = n.normalize("findings", R"({"asset":"app","title":"Debuggable","severity":"warning","rule":"dbg"})",
                       [] {
                         auto c = fixed_context();
                         c.parser = "findings_jsonl";
                         return c;
                       }());
  expect(r.ok && r.findings.size() == 1, "finding parsed");
  expect(r.findings[0].severity == Severity::medium, "warning maps to medium");
  auto back = finding_from_json(finding_to_json(r.findings[0]));
  expect(back && back->id == r.findings[0].id && back->rule_id == "dbg", "finding survives JSON");
  expect(finding_artifact_content(r.findings[0]).find("discovered_at") == std::string::npos,
         "artifact content excludes discovery time");
}

// ============================================================================
// Run State Recorder
// ============================================================================

void test_transition_chain() {
  const fs::path dir = fresh_dir("transitions");
  const std::string path = (dir / "transitions.ndjson").string();
  {
    TransitionLog log(path);
    for (int i = 0; i < 3; ++i) {
      TransitionRecord r;
      r.run_id = "run_1";
      r.scope = "invocation";
      r.tool = "enum";
      r.status = "running";
      expect(log.append(r), "append");
      expect(r.sequence == static_cast<uint64_t>(i + 1), "sequence assigned");
    }
  }
  {
    TransitionLog reopened(path);
    TransitionRecord r;
    r.run_id = "run_1";
    r.scope = "run";
    r.status = "completed";
    expect(reopened.append(r) && r.sequence == 4, "chain resumes after reopen");
  }
  auto check = verify_transition_log(path);
  expect(check.ok && check.entries == 4, "chain verifies");

  auto text = read_file(path);
  const auto pos = text->find("running");
  text->replace(pos, 7, "failed!");
  write_text(path, *text);
  expect(!verify_transition_log(path).ok, "tampering detected");
}

void test_run_state_round_trip() {
  RunState s;
  s.run_id = "run_20260101_000000";
  s.domain = "web";
  s.started_at = "2026-01-01T00:00:00Z";
  s.status = RunStatus::completed_with_gaps;
  Target t;
  t.identifier = "example.com";
  t.matched_rule = ".example.com";
  s.targets.push_back(t);
  PhaseRecord p;
  p.name = "discovery";
  p.status = PhaseStatus::completed;
  p.skipped_tools = {"gau"};
  s.phases.push_back(p);
  Invocation inv;
  inv.tool = "subfinder";
  inv.tool_version = "2.6.6";
  inv.phase = "discovery";
  inv.input_hashes = {blake3_hex("a")};
  inv.fingerprint = blake3_hex("fp");
  inv.attempt = 2;
  inv.status = InvocationStatus::failed;
  inv.error = ErrorCode::sandbox_timeout;
  inv.error_detail = "exceeded 10 ms";
  inv.exit_code = 124;
  s.invocations.push_back(inv);
  s.artifacts = {blake3_hex("x")};
  s.errors = {"one"};

  std::string err;
  auto back = run_state_from_json(run_state_to_json(s), &err);
  expect(back.has_value(), "state parsed: " + err);
  expect(run_state_to_json(*back) == run_state_to_json(s), "state survives JSON");
  expect(back->invocations[0].error == ErrorCode::sandbox_timeout, "error kind kept");
  expect(back->phases[0].skipped_tools == p.skipped_tools, "skipped tools kept");

  auto doc = jsonlite::parse(run_state_to_json(s), nullptr);
  doc["schema"] = jsonlite::Value{static_cast<std::uint64_t>(version::STATE_FORMAT_VERSION + 1)};
  expect(!run_state_from_json(jsonlite::to_json(doc), &err).has_value(), "foreign schema refused");
}

void test_prepare_for_resume() {
  RunState s;
  s.status = RunStatus::cancelled;
  Invocation running;
  running.status = InvocationStatus::running;
  Invocation done;
  done.status = InvocationStatus::succeeded;
  s.invocations = {running, done};
  prepare_for_resume(s);
  expect(s.invocations[0].status == InvocationStatus::failed, "interrupted invocation closed");
  expect(s.invocations[0].error == ErrorCode::cancelled, "closed as cancelled");
  expect(s.invocations[1].status == InvocationStatus::succeeded, "terminal history untouched");
  expect(s.status == RunStatus::running, "run reopened");
}

// ============================================================================
// Resume Cache
// ============================================================================

void test_resume_cache_persistence() {
  const fs::path dir = fresh_dir("cache");
  auto blobs = std::make_shared<CasStore>((dir / "cas").string());
  ArtifactStore store(blobs, (dir / "cas" / "artifacts.ndjson").string());
  const std::string index = (dir / "cache" / "fingerprints.ndjson").string();

  auto raw = store.put_blob("raw");
  Artifact a = make_artifact(ArtifactKind::asset, "a.example.com", "{}", "fp");
  expect(store.put(a).ok, "artifact stored");

  CachedResult r;
  r.fingerprint = blake3_hex("fp");
  r.tool = "enum";
  r.run_id = "run_1";
  r.raw_output = raw.hash;
  r.output_artifacts = {a.hash};
  {
    ResumeCache cache(index);
    expect(cache.lookup_verified(r.fingerprint, store).verdict == CacheVerdict::miss, "miss before record");
    expect(cache.record(r), "recorded");
  }
  ResumeCache reopened(index);
  auto hit = reopened.lookup_verified(r.fingerprint, store);
  expect(hit.verdict == CacheVerdict::hit && hit.result->run_id == "run_1", "hit after reopen");

  fs::remove(blobs->object_path(raw.hash));
  auto gone = reopened.lookup_verified(r.fingerprint, store);
  expect(gone.verdict == CacheVerdict::inconsistent, "missing raw output is inconsistent");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_validation() {
  auto ok = validate_config(R"({"max_concurrency":8,"default_timeout_ms":1000,"surprise":true})");
  expect(ok.ok, "valid config");
  expect(!ok.warnings.empty(), "unknown key warned");
  expect(!validate_config(R"({"max_concurrency":0})").ok, "zero concurrency rejected");
  expect(!validate_config(R"({"use_containers":"yes"})").ok, "wrong type rejected");
  expect(!validate_config("not json").ok, "malformed config rejected");

  OrchestratorConfig c;
  std::string err;
  expect(apply_config_json(c, R"({"max_concurrency":1000,"output_root":"/tmp/x"})", &err), "applied");
  expect(c.max_concurrency == 64, "concurrency clamped");
  expect(c.output_root == "/tmp/x", "output root applied");
  expect(c.default_timeout_ms == 600000, "defaults kept");
}

// ============================================================================
// Execution Sandbox Adapter (real /bin/sh processes)
// ============================================================================

ProcessSandbox host_sandbox(const fs::path& scratch) {
  SandboxConfig c;
  c.scratch_root = scratch.string();
  c.use_containers = false;
  c.env["PATH"] = "/usr/bin:/bin";
  return ProcessSandbox(c);
}

ToolDescriptor shell_tool(const std::string& script) {
  ToolDescriptor t;
  t.name = "sh-tool";
  t.version = "1";
  t.consumes = {ArtifactKind::target};
  t.produces = {ArtifactKind::asset};
  t.entrypoint = "/bin/sh";
  t.args = {"-c", script};
  t.parser = "lines_asset";
  return t;
}

std::vector<Artifact> two_targets() {
  return {make_artifact(ArtifactKind::target, "b.example.com", "{}", "seed"),
          make_artifact(ArtifactKind::target, "a.example.com", "{}", "seed")};
}

void test_sandbox_worklist_and_output() {
  const fs::path dir = fresh_dir("sandbox_io");
  auto sb = host_sandbox(dir);
  ToolDescriptor t = shell_tool("cat {input}");
  SandboxRequest req;
  req.tool = &t;
  req.inputs = two_targets();
  req.timeout_ms = 5000;
  auto out = sb.execute(req);
  expect(out.ok, "worklist tool succeeded: " + out.detail);
  expect(out.raw_output == "a.example.com\nb.example.com\n", "sorted worklist materialized");

  ToolDescriptor f = shell_tool("echo hi > {output}; echo noise");
  f.output_file = "result.txt";
  req.tool = &f;
  auto file_out = sb.execute(req);
  expect(file_out.ok && file_out.raw_output == "hi\n", "output file is the raw output");
  expect(file_out.stdout_text == "noise\n", "stdout still captured");
}

void test_sandbox_non_zero_exit_keeps_output() {
  const fs::path dir = fresh_dir("sandbox_exit");
  auto sb = host_sandbox(dir);
  ToolDescriptor t = shell_tool("echo partial; echo oops >&2; exit 3");
  SandboxRequest req;
  req.tool = &t;
  req.inputs = two_targets();
  req.timeout_ms = 5000;
  auto out = sb.execute(req);
  expect(!out.ok && out.error == ErrorCode::sandbox_non_zero_exit, "non-zero exit is a failure");
  expect(out.exit_code == 3, "exit code kept");
  expect(out.raw_output == "partial\n" && out.stderr_text == "oops\n", "raw evidence preserved");
}

void test_sandbox_timeout() {
  const fs::path dir = fresh_dir("sandbox_timeout");
  auto sb = host_sandbox(dir);
  ToolDescriptor t = shell_tool("sleep 5");
  SandboxRequest req;
  req.tool = &t;
  req.inputs = two_targets();
  req.timeout_ms = 200;
  const auto start = std::chrono::steady_clock::now();
  auto out = sb.execute(req);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - start).count();
  expect(out.error == ErrorCode::sandbox_timeout, "timeout reported");
  expect(out.exit_code == 124, "timeout exit code");
  expect(ms < 3000, "process group killed promptly");
}

double cpu_seconds() {
  rusage ru{};
  getrusage(RUSAGE_SELF, &ru);
  return ru.ru_utime.tv_sec + ru.ru_stime.tv_sec + (ru.ru_utime.tv_usec + ru.ru_stime.tv_usec) / 1e6;
}

void test_sandbox_closed_pipes_do_not_spin() {
  const fs::path dir = fresh_dir("sandbox_closed_pipes");
  auto sb = host_sandbox(dir);
  ToolDescriptor t = shell_tool("echo early; exec >&- 2>&-; sleep 1");
  SandboxRequest req;
  req.tool = &t;
  req.inputs = two_targets();
  req.timeout_ms = 5000;
  const double before = cpu_seconds();
  auto out = sb.execute(req);
  const double used = cpu_seconds() - before;
  expect(out.ok && out.stdout_text == "early\n", "output before the close kept: " + out.detail);
  expect(used < 0.5, "waiting on a silent child costs little CPU: " + std::to_string(used) + "s");
}

void test_sandbox_cancellation() {
  const fs::path dir = fresh_dir("sandbox_cancel");
  auto sb = host_sandbox(dir);
  ToolDescriptor t = shell_tool("sleep 5");
  CancellationToken cancel;
  SandboxRequest req;
  req.tool = &t;
  req.inputs = two_targets();
  req.timeout_ms = 10000;
  req.cancel = &cancel;
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancel.cancel();
  });
  auto out = sb.execute(req);
  canceller.join();
  expect(out.error == ErrorCode::sandbox_cancelled, "cancellation reported");
  expect(out.exit_code == 130, "cancellation exit code");
}

ProcessSandbox container_sandbox(const fs::path& dir, const fs::path& runtime) {
  SandboxConfig c;
  c.scratch_root = (dir / "scratch").string();
  c.container_runtime = runtime.string();
  c.use_containers = true;
  c.env["PATH"] = "/usr/bin:/bin";
  return ProcessSandbox(c);
}

// The container started for `run_line` ("run ... --name <name> ...").
std::string container_named_in(const std::string& run_line) {
  const std::string flag = "--name ";
  const auto at = run_line.find(flag);
  if (at == std::string::npos) return "";
  const auto start = at + flag.size();
  return run_line.substr(start, run_line.find(' ', start) - start);
}

void expect_container_stopped(const fs::path& dir, const std::string& label) {
  const std::vector<std::string> calls = logged_calls(dir);
  expect(!calls.empty() && calls.front().rfind("run ", 0) == 0, "runtime asked to run the tool");
  expect(calls.front().find("--init") != std::string::npos, "init process requested");
  const std::string name = container_named_in(calls.front());
  expect(name.rfind("deadbolt-" + label + "-", 0) == 0, "container named after the invocation: " + name);
  auto kill_at = std::find(calls.begin(), calls.end(), "kill " + name);
  auto rm_at = std::find(calls.begin(), calls.end(), "rm -f " + name);
  expect(kill_at != calls.end(), "container killed by name");
  expect(rm_at != calls.end() && kill_at < rm_at, "container removed after the kill");
}

void test_sandbox_timeout_stops_container() {
  const fs::path dir = fresh_dir("sandbox_container_timeout");
  auto sb = container_sandbox(dir, fake_runtime(dir, ""));
  ToolDescriptor t = shell_tool("sleep 60");
  t.image = "deadbolt-slow";
  SandboxRequest req;
  req.tool = &t;
  req.inputs = two_targets();
  req.label = "slow";
  req.timeout_ms = 300;
  auto out = sb.execute(req);
  expect(out.error == ErrorCode::sandbox_timeout, "timeout reported: " + out.detail);
  expect_container_stopped(dir, "slow");
}

void test_sandbox_cancellation_stops_container() {
  const fs::path dir = fresh_dir("sandbox_container_cancel");
  auto sb = container_sandbox(dir, fake_runtime(dir, ""));
  ToolDescriptor t = shell_tool("sleep 60");
  t.image = "deadbolt-slow";
  CancellationToken cancel;
  SandboxRequest req;
  req.tool = &t;
  req.inputs = two_targets();
  req.label = "halted";
  req.timeout_ms = 10000;
  req.cancel = &cancel;
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    cancel.cancel();
  });
  auto out = sb.execute(req);
  canceller.join();
  expect(out.error == ErrorCode::sandbox_cancelled, "cancellation reported: " + out.detail);
  expect_container_stopped(dir, "halted");
}

void test_sandbox_scratch_isolation() {
  const fs::path dir = fresh_dir("sandbox_scratch");
  auto sb = host_sandbox(dir);
  ToolDescriptor t = shell_tool("pwd; touch marker");
  std::vector<std::string> dirs(2);
  std::vector<std::thread> threads;
  for (int i = 0; i < 2; ++i) {
    threads.emplace_back([&, i] {
      SandboxRequest req;
      req.tool = &t;
      req.inputs = two_targets();
      req.label = "job" + std::to_string(i);
      req.timeout_ms = 5000;
      auto out = sb.execute(req);
      dirs[i] = out.stdout_text;
    });
  }
  for (auto& th : threads) th.join();
  expect(!dirs[0].empty() && dirs[0] != dirs[1], "each invocation gets its own directory");
  std::size_t leftover = 0;
  for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) ++leftover;
  expect(leftover == 0, "scratch directories removed afterwards");
}

void test_expand_placeholders() {
  const std::map<std::string, std::string> b = {{"input", "/work/inputs/asset.txt"}, {"value", "x"}};
  expect(expand_placeholders("-l {input} -u {value} {unbound}", b) ==
             "-l /work/inputs/asset.txt -u x {unbound}",
         "bound placeholders replaced, unbound kept");
}

// ============================================================================
// Phase Scheduler
// ============================================================================

void test_scheduler_full_run() {
  Harness h("sched_full");
  FakeSandbox sb;
  CancellationToken cancel;
  RunState s = h.run(h.fresh_state("run_a", {"example.com", "example.org"}), sb, cancel);
  expect(s.status == RunStatus::completed, "run completed");
  expect(sb.executions() == 6, "2 enum + 4 scan executions");
  expect(count_status(s, "enum", InvocationStatus::succeeded) == 2, "enum once per target");
  expect(count_status(s, "scan", InvocationStatus::succeeded) == 4, "scan once per asset");
  expect(s.phases.size() == 2 && s.phases[1].status == PhaseStatus::completed, "phases completed");
  for (const auto& inv : s.invocations) {
    expect(inv.raw_output.size() == 64 && h.store.contains_blob(inv.raw_output), "raw evidence stored");
    expect(fs::exists(fs::path(h.run_dir("run_a")) / inv.raw_path), "raw copy in run directory");
  }
  expect(verify_transition_log((fs::path(h.run_dir("run_a")) / "transitions.ndjson").string()).ok,
         "transition chain intact");

  RunStateRecorder recorder(h.run_dir("run_a"));
  expect(recorder.write_outputs(s, h.store).ok, "outputs written");
  expect(finding_ids(h.run_dir("run_a")).size() == 4, "four findings");
  expect(fs::exists(fs::path(h.run_dir("run_a")) / "meta.json"), "meta.json written");
  expect(fs::exists(fs::path(h.run_dir("run_a")) / "normalized" / "scan.json"), "per-tool records written");
}

void test_scheduler_phase_barrier() {
  Harness h("sched_barrier");
  const std::string run_dir = h.run_dir("run_b");
  std::atomic<bool> violated{false};
  FakeSandbox sb([&](const SandboxRequest& req) {
    std::string err;
    auto snapshot = load_run_state(run_dir, &err);
    if (req.tool->name == "enum") {
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      snapshot = load_run_state(run_dir, &err);
      if (snapshot) {
        for (const auto& inv : snapshot->invocations) {
          if (inv.phase == "scan") violated = true;
        }
      }
    } else if (snapshot) {
      for (const auto& inv : snapshot->invocations) {
        if (inv.tool == "enum" && inv.status != InvocationStatus::succeeded) violated = true;
      }
    }
    return standard_behavior(req);
  });
  CancellationToken cancel;
  RunState s = h.run(h.fresh_state("run_b", {"example.com", "example.org", "example.net"}), sb, cancel);
  expect(s.status == RunStatus::completed, "run completed");
  expect(!violated.load(), "no phase-2 record exists while phase 1 runs");
}

void test_scheduler_partial_failure() {
  Harness h("sched_partial");
  FakeSandbox sb([](const SandboxRequest& req) {
    if (req.tool->name == "scan" && req.subject.rfind("api.", 0) == 0) {
      return failed_output(ErrorCode::sandbox_non_zero_exit, 2, "half a line");
    }
    return standard_behavior(req);
  });
  CancellationToken cancel;
  RunState s = h.run(h.fresh_state("run_c", {"example.com", "example.org"}), sb, cancel);
  expect(s.status == RunStatus::completed_with_gaps, "completed with gaps");
  expect(count_status(s, "scan", InvocationStatus::failed) == 2, "failed scans recorded");
  expect(count_status(s, "scan", InvocationStatus::succeeded) == 2, "other scans unaffected");
  for (const auto& inv : s.invocations) {
    if (inv.status != InvocationStatus::failed) continue;
    expect(inv.error == ErrorCode::sandbox_non_zero_exit && inv.exit_code == 2, "failure kind kept");
    expect(h.blobs->get(inv.raw_output).value_or("") == "half a line", "failed output preserved");
  }
  expect(h.cache.size() == 4, "only successes are cached");
  expect(run_summary_text(s).find("run completed with findings gaps") != std::string::npos,
         "summary distinguishes gaps from failure");

  RunOutcome o;
  o.ok = true;
  o.state = s;
  expect(exit_code_for(o) == 0, "gaps still exit 0");
}

void test_scheduler_mandatory_tool_failure() {
  Harness h("sched_mandatory");
  FakeSandbox sb([](const SandboxRequest& req) {
    if (req.tool->name == "enum" && req.subject == "example.org") {
      return failed_output(ErrorCode::sandbox_non_zero_exit, 1);
    }
    return standard_behavior(req);
  });
  CancellationToken cancel;
  RunState s = h.run(h.fresh_state("run_d", {"example.com", "example.org"}), sb, cancel, 4,
                     test_registry(/*enum_mandatory=*/true));
  expect(s.status == RunStatus::failed, "mandatory failure fails the run");
  expect(count_status(s, "scan", InvocationStatus::succeeded) == 0, "later phase never runs");
  const bool reported = std::any_of(s.errors.begin(), s.errors.end(), [](const std::string& e) {
    return e.rfind("mandatory_failure", 0) == 0;
  });
  expect(reported, "mandatory_failure recorded");
  expect(run_summary_text(s).find("result: run failed") != std::string::npos, "summary says failed");
}

void test_scheduler_missing_mandatory_input() {
  Harness h("sched_no_assets");
  FakeSandbox sb([](const SandboxRequest& req) {
    if (req.tool->name == "enum") return failed_output(ErrorCode::sandbox_timeout, 124);
    return standard_behavior(req);
  });
  CancellationToken cancel;
  RunState s = h.run(h.fresh_state("run_e", {"example.com"}), sb, cancel);
  expect(s.status == RunStatus::failed, "phase without its mandatory input fails the run");
  expect(s.invocations.size() == 1 && s.invocations[0].error == ErrorCode::sandbox_timeout,
         "timeout recorded on the producer");
}

void test_scheduler_skips_tool_without_input() {
  Harness h("sched_skip");
  FakeSandbox sb([](const SandboxRequest& req) {
    if (req.tool->name == "enum") return ok_output("");
    return standard_behavior(req);
  });
  CancellationToken cancel;
  RunState s = h.run(h.fresh_state("run_f", {"example.com"}), sb, cancel);
  expect(s.status == RunStatus::completed, "nothing failed");
  expect(s.phases[1].skipped_tools == std::vector<std::string>{"scan"}, "scan skipped for lack of input");
  expect(sb.executions() == 1, "scan never executed");
}

void test_scheduler_normalization_failure() {
  Harness h("sched_norm");
  FakeSandbox sb([](const SandboxRequest& req) {
    if (req.tool->name == "scan") return ok_output("<<not json>>\n");
    return standard_behavior(req);
  });
  CancellationToken cancel;
  RunState s = h.run(h.fresh_state("run_g", {"example.com"}), sb, cancel);
  expect(s.status == RunStatus::completed_with_gaps, "normalization failure is a gap");
  for (const auto& inv : s.invocations) {
    if (inv.tool != "scan") continue;
    expect(inv.status == InvocationStatus::failed && inv.error == ErrorCode::normalization_error,
           "normalization_error recorded");
    expect(!inv.raw_output.empty(), "raw output kept");
  }
  expect(h.cache.size() == 1, "unparseable output never cached");
}

void test_scheduler_second_run_fully_cached() {
  Harness h("sched_cache");
  FakeSandbox first;
  CancellationToken c1;
  RunState a = h.run(h.fresh_state("run_1", {"example.com", "example.org"}), first, c1);
  expect(first.executions() == 6, "first run executes everything");

  FakeSandbox second;
  CancellationToken c2;
  RunState b = h.run(h.fresh_state("run_2", {"example.com", "example.org"}), second, c2);
  expect(second.executions() == 0, "second run executes nothing");
  expect(b.status == RunStatus::completed, "cached run completes");
  expect(count_status(b, "scan", InvocationStatus::skipped_cached) == 4, "scans served from cache");
  for (const auto& inv : b.invocations) {
    expect(inv.cached_from == "run_1", "provenance points at run_1");
    expect(!inv.raw_path.empty(), "cached invocation has a raw path");
    auto copied = read_file((fs::path(h.run_dir("run_2")) / inv.raw_path).string());
    expect(copied.has_value() && *copied == h.store.get_blob(inv.raw_output).value_or("<missing>"),
           "raw output copied into the cached run");
  }
  expect(a.artifacts == b.artifacts, "identical artifact set");

  RunStateRecorder ra(h.run_dir("run_1")), rb(h.run_dir("run_2"));
  expect(ra.write_outputs(a, h.store).ok && rb.write_outputs(b, h.store).ok, "outputs written");
  expect(finding_ids(h.run_dir("run_1")) == finding_ids(h.run_dir("run_2")), "identical finding set");
}

void test_scheduler_cache_inconsistency_reruns() {
  Harness h("sched_inconsistent");
  FakeSandbox first;
  CancellationToken c1;
  RunState a = h.run(h.fresh_state("run_1", {"example.com"}), first, c1);
  const auto it = std::find_if(a.invocations.begin(), a.invocations.end(),
                               [](const Invocation& i) { return i.tool == "enum"; });
  fs::remove(h.blobs->object_path(it->raw_output));

  FakeSandbox second;
  CancellationToken c2;
  RunState b = h.run(h.fresh_state("run_2", {"example.com"}), second, c2);
  expect(second.executions() == 1, "only the damaged entry re-executes");
  expect(b.status == RunStatus::completed, "run still completes");
  const bool noted = std::any_of(b.errors.begin(), b.errors.end(), [](const std::string& e) {
    return e.rfind("resume_inconsistency", 0) == 0;
  });
  expect(noted, "inconsistency recorded");
  expect(h.store.contains_blob(it->raw_output), "raw output restored by the re-run");
}

// Blob backend whose writes start failing on demand.
class FailingWritesBackend : public ICASBackend {
 public:
  explicit FailingWritesBackend(std::shared_ptr<CasStore> inner) : inner_(std::move(inner)) {}

  std::string put(const std::string& data, const std::string& compression) override {
    return failing_ ? std::string() : inner_->put(data, compression);
  }
  std::optional<std::string> get(const std::string& digest) const override { return inner_->get(digest); }
  bool contains(const std::string& digest) const override { return inner_->contains(digest); }
  std::optional<CasObjectInfo> info(const std::string& digest) const override { return inner_->info(digest); }
  std::string backend_id() const override { return "failing-writes"; }

  void start_failing() { failing_ = true; }

 private:
  std::shared_ptr<CasStore> inner_;
  std::atomic<bool> failing_{false};
};

void test_scheduler_store_failure_is_persisted() {
  const fs::path root = fresh_dir("sched_store_failure");
  auto backend = std::make_shared<FailingWritesBackend>(std::make_shared<CasStore>((root / "cas").string()));
  ArtifactStore store(backend, (root / "cas" / "artifacts.ndjson").string());
  ResumeCache cache((root / "cache" / "fingerprints.ndjson").string());
  Normalizer normalizer;

  RunState state;
  state.run_id = "run_io";
  state.domain = "test";
  Target target;
  target.identifier = "example.com";
  state.targets.push_back(target);
  Artifact seed = make_artifact(ArtifactKind::target, "example.com", "{\"identifier\":\"example.com\"}", "seed");
  expect(store.put(seed).ok, "seed artifact stored");
  state.artifacts.push_back(seed.hash);
  backend->start_failing();

  const std::string run_dir = (root / "run_io").string();
  RunStateRecorder recorder(run_dir);
  expect(recorder.ok(), "recorder opened");
  FakeSandbox sb;
  CancellationToken cancel;
  SchedulerOptions options;
  options.default_timeout_ms = 5000;
  const ToolRegistry registry = test_registry();
  PhaseScheduler scheduler(registry, store, cache, sb, normalizer, recorder, cancel, options);
  RunState s = scheduler.run(test_plan(), std::move(state));
  expect(s.status == RunStatus::failed, "store failure fails the run");

  std::string error;
  auto reloaded = load_run_state(run_dir, &error);
  expect(reloaded.has_value(), "state.json readable: " + error);
  expect(reloaded->status == RunStatus::failed, "terminal status reached state.json");
  expect(std::any_of(reloaded->errors.begin(), reloaded->errors.end(),
                     [](const std::string& e) { return e.rfind("artifact_store_io:", 0) == 0; }),
         "store error recorded in state.json");
  expect(!reloaded->finished_at.empty(), "finish time recorded");
}

void test_scheduler_bounded_concurrency() {
  Harness h("sched_bounded");
  FakeSandbox sb([](const SandboxRequest& req) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return standard_behavior(req);
  });
  CancellationToken cancel;
  std::vector<std::string> hosts;
  for (int i = 0; i < 8; ++i) hosts.push_back("host" + std::to_string(i) + ".example.com");
  RunState s = h.run(h.fresh_state("run_h", hosts), sb, cancel, 2);
  expect(s.status == RunStatus::completed, "run completed");
  expect(sb.max_in_flight() <= 2, "never more than max_concurrency in flight");
  expect(sb.executions() == 24, "8 enum + 16 scan executions");
}

void test_scheduler_timeout_is_a_gap() {
  Harness h("sched_timeout");
  FakeSandbox sb([](const SandboxRequest& req) {
    if (req.tool->name == "scan" && req.subject == "www.example.com") {
      return failed_output(ErrorCode::sandbox_timeout, 124);
    }
    return standard_behavior(req);
  });
  CancellationToken cancel;
  RunState s = h.run(h.fresh_state("run_t", {"example.com"}), sb, cancel);
  expect(s.status == RunStatus::completed_with_gaps, "timeout leaves a gap");
  const auto it = std::find_if(s.invocations.begin(), s.invocations.end(), [](const Invocation& i) {
    return i.error == ErrorCode::sandbox_timeout;
  });
  expect(it != s.invocations.end() && it->exit_code == 124, "timeout sub-kind recorded");
}

void test_scheduler_cancel_then_resume() {
  Harness h("sched_resume");
  CancellationToken cancel;
  FakeSandbox first([&](const SandboxRequest& req) {
    if (req.tool->name == "enum" && req.subject == "example.com") {
      cancel.cancel();
      return failed_output(ErrorCode::sandbox_cancelled, 130);
    }
    return standard_behavior(req);
  });
  RunState a = h.run(h.fresh_state("run_r", {"example.com", "example.org"}), first, cancel, 1);
  expect(a.status == RunStatus::cancelled, "run cancelled");
  expect(a.phases[0].status == PhaseStatus::running, "interrupted phase left open");
  expect(count_status(a, "scan", InvocationStatus::succeeded) == 0, "no later phase after cancel");
  for (const auto& inv : a.invocations) expect(is_terminal(inv.status), "no invocation left running");

  std::string err;
  auto loaded = load_run_state(h.run_dir("run_r"), &err);
  expect(loaded.has_value(), "state reloadable: " + err);
  prepare_for_resume(*loaded);
  const std::size_t enum_done_before = count_status(*loaded, "enum", InvocationStatus::succeeded);

  FakeSandbox second;
  CancellationToken resumed_cancel;
  RunState b = h.run(std::move(*loaded), second, resumed_cancel, 1);
  expect(b.status == RunStatus::completed, "resumed run completes");
  expect(count_status(b, "enum", InvocationStatus::succeeded) == 2, "every target enumerated once");
  expect(second.executions() == static_cast<int>(2 - enum_done_before) + 4,
         "completed work is not repeated");
  const bool retried = std::any_of(b.invocations.begin(), b.invocations.end(), [](const Invocation& i) {
    return i.tool == "enum" && i.attempt == 2 && i.status == InvocationStatus::succeeded;
  });
  expect(retried, "failed attempt retried as attempt 2");
  expect(count_status(b, "enum", InvocationStatus::failed) >= 1, "failed attempt kept in history");
  expect(verify_transition_log((fs::path(h.run_dir("run_r")) / "transitions.ndjson").string()).ok,
         "transition chain spans both passes");
}

void test_scheduler_deterministic_records() {
  auto run_once = [](const std::string& name) {
    Harness h(name);
    FakeSandbox sb([](const SandboxRequest& req) {
      std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<int>(req.subject.size() % 4) * 5));
      return standard_behavior(req);
    });
    CancellationToken cancel;
    return h.run(h.fresh_state("run_x", {"example.com", "example.org", "example.net"}), sb, cancel, 4);
  };
  RunState a = run_once("sched_det_a");
  RunState b = run_once("sched_det_b");
  expect(a.invocations.size() == b.invocations.size(), "same number of records");
  for (std::size_t i = 0; i < a.invocations.size(); ++i) {
    expect(a.invocations[i].tool == b.invocations[i].tool, "same record order");
    expect(a.invocations[i].fingerprint == b.invocations[i].fingerprint, "same fingerprints");
    expect(a.invocations[i].output_artifacts == b.invocations[i].output_artifacts, "same outputs");
  }
  expect(a.artifacts == b.artifacts, "artifact registration independent of completion order");
}

void test_scheduler_events_counted() {
  Harness h("sched_events");
  auto& stats = global_engine_stats();
  const uint64_t executions_before = stats.sandbox_executions.load();
  const uint64_t hits_before = stats.cache_hits.load();
  FakeSandbox sb;
  CancellationToken c1, c2;
  h.run(h.fresh_state("run_1", {"example.com"}), sb, c1);
  h.run(h.fresh_state("run_2", {"example.com"}), sb, c2);
  expect(stats.sandbox_executions.load() - executions_before == 3, "only real executions counted");
  expect(stats.cache_hits.load() - hits_before == 3, "cache hits counted");
}

// ============================================================================
// Orchestrator
// ============================================================================

void test_orchestrator_scope_violation_has_no_side_effects() {
  const fs::path dir = fresh_dir("orch_scope");
  write_text(dir / "targets.txt", "example.com\nevil.org\n");
  write_text(dir / "scope.json", R"({"allow":[".example.com"]})");
  OrchestratorConfig cfg;
  cfg.output_root = (dir / "out").string();
  CancellationToken cancel;
  Orchestrator o(cfg, cancel);
  FakeSandbox sb;
  o.set_sandbox(&sb);
  RunRequest req;
  req.domain = "web";
  req.target = (dir / "targets.txt").string();
  req.scope_file = (dir / "scope.json").string();
  auto outcome = o.run(req);
  expect(outcome.error == ErrorCode::scope_violation, "scope violation reported");
  expect(exit_code_for(outcome) == 2, "exit code 2");
  expect(outcome.violations.size() == 1, "violating target listed");
  expect(!fs::exists(dir / "out"), "nothing written");
  expect(sb.executions() == 0, "nothing executed");
}

// Restores the working directory on scope exit.
class WorkingDirectory {
 public:
  explicit WorkingDirectory(const fs::path& dir) : saved_(fs::current_path()) { fs::current_path(dir); }
  ~WorkingDirectory() {
    std::error_code ec;
    fs::current_path(saved_, ec);
  }

 private:
  fs::path saved_;
};

void test_orchestrator_default_scope_file() {
  const fs::path dir = fresh_dir("orch_default_scope");
  write_text(dir / "targets.txt", "example.com\nevil.org\n");
  OrchestratorConfig cfg;
  cfg.output_root = (dir / "out").string();
  CancellationToken cancel;
  Orchestrator o(cfg, cancel);
  FakeSandbox sb([](const SandboxRequest&) { return ok_output(""); });
  o.set_sandbox(&sb);
  RunRequest req;
  req.domain = "web";
  req.target = (dir / "targets.txt").string();

  WorkingDirectory cwd(dir);
  expect(default_scope_file(dir.string()).empty(), "no scope.json yet");
  auto unscoped = o.run(req);
  expect(unscoped.error == ErrorCode::scope_violation, "no rules admit nothing");

  write_text(dir / "scope.json", R"({"allow":[".example.com"],"deny":["evil.org"]})");
  expect(default_scope_file(dir.string()) == (dir / "scope.json").string(), "scope.json found");
  auto denied = o.run(req);
  expect(denied.error == ErrorCode::scope_violation && denied.violations.size() == 1,
         "rules from ./scope.json applied");
  expect(!fs::exists(dir / "out"), "nothing written");

  write_text(dir / "targets.txt", "example.com\n");
  auto admitted = o.run(req);
  expect(admitted.ok, "target admitted by ./scope.json: " + admitted.detail);
  expect(admitted.state.targets.size() == 1 && admitted.state.targets[0].matched_rule == ".example.com",
         "matched rule from the default scope file");
}

void test_orchestrator_web_run_and_resume() {
  const fs::path dir = fresh_dir("orch_web");
  write_text(dir / "targets.txt", "https://example.com/\n");
  write_text(dir / "scope.json", R"({"allow":[".example.com"]})");
  OrchestratorConfig cfg;
  cfg.output_root = (dir / "out").string();
  CancellationToken cancel;
  Orchestrator o(cfg, cancel);
  FakeSandbox sb([](const SandboxRequest& req) {
    const std::string& tool = req.tool->name;
    if (tool == "subfinder") return ok_output("www.example.com\n");
    if (tool == "httpx") return ok_output(R"({"url":"https://www.example.com","status_code":200})");
    if (tool == "nuclei") {
      return ok_output(
          R"({"host":"https://www.example.com","template-id":"tech-detect","info":{"name":"Tech","severity":"info"}})");
    }
    return ok_output("");
  });
  o.set_sandbox(&sb);
  RunRequest req;
  req.domain = "web";
  req.target = (dir / "targets.txt").string();
  req.scope_file = (dir / "scope.json").string();
  auto outcome = o.run(req);
  expect(outcome.ok, "web run completed: " + outcome.detail);
  expect(exit_code_for(outcome) == 0, "exit code 0");
  expect(outcome.state.run_id.rfind("run_", 0) == 0, "run id format");
  expect(outcome.state.targets.size() == 1 && outcome.state.targets[0].matched_rule == ".example.com",
         "admitted target recorded");
  expect(fs::exists(fs::path(outcome.run_dir) / "meta.json"), "meta.json written");
  expect(finding_ids(outcome.run_dir).size() == 1, "nuclei finding reported");
  const int executed = sb.executions();

  RunRequest resume;
  resume.resume_from = outcome.run_dir;
  auto again = o.run(resume);
  expect(again.ok && again.state.run_id == outcome.state.run_id, "resume continues the same run");
  expect(sb.executions() == executed, "resume of a finished run executes nothing");
}

}  // namespace

int main() {
  std::cout << "=== Deadbolt Test Suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("combination hash order independence", test_combination_hash_order_independent);

  std::cout << "\n[Scope Gate]\n";
  run_test("pattern forms", test_scope_pattern_forms);
  run_test("deny first, all or nothing", test_scope_deny_first_all_or_nothing);
  run_test("empty allow list rejects", test_scope_empty_allow_rejects);
  run_test("package targets", test_scope_package_targets);
  run_test("scope rules document", test_scope_rules_document);
  run_test("target extraction", test_target_extraction);

  std::cout << "\n[Artifact Store]\n";
  run_test("CAS put/get integrity", test_cas_put_get_integrity);
  run_test("CAS corruption detection", test_cas_corruption_detection);
  run_test("artifact identity and index", test_artifact_store_identity);

  std::cout << "\n[Tool Registry]\n";
  run_test("built-in plans valid", test_builtin_plans_valid);
  run_test("plan validation errors", test_plan_validation_errors);
  run_test("tools.json overrides", test_registry_overrides);
  run_test("fingerprint properties", test_fingerprint_properties);
  run_test("installed version feeds the fingerprint", test_installed_version_feeds_fingerprint);

  std::cout << "\n[Findings Normalizer]\n";
  run_test("nuclei duplicates merged", test_normalize_nuclei_merges_duplicates);
  run_test("idempotent normalization", test_normalize_idempotent);
  run_test("normalization failures", test_normalize_failures);
  run_test("paths and httpx", test_normalize_paths_and_httpx);
  run_test("finding JSON round trip", test_finding_json_round_trip);

  std::cout << "\n[Run State Recorder]\n";
  run_test("transition chain", test_transition_chain);
  run_test("run state round trip", test_run_state_round_trip);
  run_test("prepare for resume", test_prepare_for_resume);

  std::cout << "\n[Resume Cache]\n";
  run_test("cache persistence and verification", test_resume_cache_persistence);

  std::cout << "\n[Configuration]\n";
  run_test("config validation", test_config_validation);

  std::cout << "\n[Execution Sandbox]\n";
  run_test("worklist and output file", test_sandbox_worklist_and_output);
  run_test("non-zero exit keeps output", test_sandbox_non_zero_exit_keeps_output);
  run_test("timeout", test_sandbox_timeout);
  run_test("cancellation", test_sandbox_cancellation);
  run_test("closed pipes do not spin", test_sandbox_closed_pipes_do_not_spin);
  run_test("timeout stops the container", test_sandbox_timeout_stops_container);
  run_test("cancellation stops the container", test_sandbox_cancellation_stops_container);
  run_test("scratch isolation", test_sandbox_scratch_isolation);
  run_test("placeholder expansion", test_expand_placeholders);

  std::cout << "\n[Phase Scheduler]\n";
  run_test("full run", test_scheduler_full_run);
  run_test("phase barrier", test_scheduler_phase_barrier);
  run_test("partial failure", test_scheduler_partial_failure);
  run_test("mandatory tool failure", test_scheduler_mandatory_tool_failure);
  run_test("missing mandatory input", test_scheduler_missing_mandatory_input);
  run_test("tool without input skipped", test_scheduler_skips_tool_without_input);
  run_test("normalization failure", test_scheduler_normalization_failure);
  run_test("second run fully cached", test_scheduler_second_run_fully_cached);
  run_test("cache inconsistency re-runs", test_scheduler_cache_inconsistency_reruns);
  run_test("store failure is persisted", test_scheduler_store_failure_is_persisted);
  run_test("bounded concurrency", test_scheduler_bounded_concurrency);
  run_test("timeout is a gap", test_scheduler_timeout_is_a_gap);
  run_test("cancel then resume", test_scheduler_cancel_then_resume);
  run_test("deterministic records", test_scheduler_deterministic_records);
  run_test("events counted", test_scheduler_events_counted);

  std::cout << "\n[Orchestrator]\n";
  run_test("scope violation has no side effects", test_orchestrator_scope_violation_has_no_side_effects);
  run_test("default scope file", test_orchestrator_default_scope_file);
  run_test("web run and resume", test_orchestrator_web_run_and_resume);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
