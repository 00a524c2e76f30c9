#include "deadbolt/recorder.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <set>
#include <sstream>

#include "deadbolt/cas.hpp"
#include "deadbolt/jsonlite.hpp"
#include "deadbolt/normalize.hpp"
#include "deadbolt/version.hpp"
#include "deadbolt/worker.hpp"

namespace fs = std::filesystem;

namespace deadbolt {

namespace {

jsonlite::Value str(const std::string& s) { return jsonlite::Value{s}; }

jsonlite::Value strings(const std::vector<std::string>& v) {
  jsonlite::Array a;
  a.reserve(v.size());
  for (const auto& s : v) a.push_back(jsonlite::Value{s});
  return jsonlite::Value{std::move(a)};
}

jsonlite::Value u64(std::uint64_t n) { return jsonlite::Value{n}; }

std::string make_run_dir(const std::string& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  return dir;
}

jsonlite::Object invocation_to_json(const Invocation& inv) {
  jsonlite::Object o;
  o["tool"] = str(inv.tool);
  o["tool_version"] = str(inv.tool_version);
  o["phase"] = str(inv.phase);
  o["input_hashes"] = strings(inv.input_hashes);
  o["input_set_hash"] = str(inv.input_set_hash);
  o["fingerprint"] = str(inv.fingerprint);
  o["attempt"] = u64(inv.attempt);
  o["status"] = str(to_string(inv.status));
  o["error"] = str(to_string(inv.error));
  o["error_detail"] = str(inv.error_detail);
  // Negative exit codes do not occur: signals are reported as 128 + signo.
  o["exit_code"] = u64(static_cast<std::uint64_t>(inv.exit_code < 0 ? 0 : inv.exit_code));
  o["raw_output"] = str(inv.raw_output);
  o["raw_stderr"] = str(inv.raw_stderr);
  o["raw_path"] = str(inv.raw_path);
  o["output_artifacts"] = strings(inv.output_artifacts);
  o["cached_from"] = str(inv.cached_from);
  o["started_at"] = str(inv.started_at);
  o["finished_at"] = str(inv.finished_at);
  o["duration_ms"] = u64(inv.duration_ms);
  return o;
}

bool invocation_from_json(const jsonlite::Object& o, Invocation& inv, std::string* error) {
  auto status = invocation_status_from_string(jsonlite::get_string(o, "status"));
  auto code = error_code_from_string(jsonlite::get_string(o, "error"));
  if (!status || !code) {
    if (error) *error = "invocation record with unknown status or error code";
    return false;
  }
  inv.tool = jsonlite::get_string(o, "tool");
  inv.tool_version = jsonlite::get_string(o, "tool_version");
  inv.phase = jsonlite::get_string(o, "phase");
  inv.input_hashes = jsonlite::get_string_array(o, "input_hashes");
  inv.input_set_hash = jsonlite::get_string(o, "input_set_hash");
  inv.fingerprint = jsonlite::get_string(o, "fingerprint");
  inv.attempt = static_cast<std::uint32_t>(jsonlite::get_u64(o, "attempt", 1));
  inv.status = *status;
  inv.error = *code;
  inv.error_detail = jsonlite::get_string(o, "error_detail");
  inv.exit_code = static_cast<int>(jsonlite::get_u64(o, "exit_code"));
  inv.raw_output = jsonlite::get_string(o, "raw_output");
  inv.raw_stderr = jsonlite::get_string(o, "raw_stderr");
  inv.raw_path = jsonlite::get_string(o, "raw_path");
  inv.output_artifacts = jsonlite::get_string_array(o, "output_artifacts");
  inv.cached_from = jsonlite::get_string(o, "cached_from");
  inv.started_at = jsonlite::get_string(o, "started_at");
  inv.finished_at = jsonlite::get_string(o, "finished_at");
  inv.duration_ms = jsonlite::get_u64(o, "duration_ms");
  return true;
}

jsonlite::Object phase_to_json(const PhaseRecord& p) {
  jsonlite::Object o;
  o["name"] = str(p.name);
  o["status"] = str(to_string(p.status));
  o["started_at"] = str(p.started_at);
  o["finished_at"] = str(p.finished_at);
  o["skipped_tools"] = strings(p.skipped_tools);
  return o;
}

jsonlite::Object target_to_json(const Target& t) {
  jsonlite::Object o;
  o["identifier"] = str(t.identifier);
  o["kind"] = str(t.kind == TargetKind::package ? "package" : "domain");
  o["file_path"] = str(t.file_path);
  o["matched_rule"] = str(t.matched_rule);
  return o;
}

bool is_completed(InvocationStatus s) {
  return s == InvocationStatus::succeeded || s == InvocationStatus::skipped_cached;
}

}  // namespace

std::string run_state_to_json(const RunState& state) {
  jsonlite::Object o;
  o["schema"] = u64(version::STATE_FORMAT_VERSION);
  o["run_id"] = str(state.run_id);
  o["domain"] = str(state.domain);
  o["started_at"] = str(state.started_at);
  o["finished_at"] = str(state.finished_at);
  o["current_phase"] = u64(state.current_phase);
  o["status"] = str(to_string(state.status));

  jsonlite::Array targets;
  for (const auto& t : state.targets) targets.push_back(jsonlite::Value{target_to_json(t)});
  o["targets"] = jsonlite::Value{std::move(targets)};

  jsonlite::Array phases;
  for (const auto& p : state.phases) phases.push_back(jsonlite::Value{phase_to_json(p)});
  o["phases"] = jsonlite::Value{std::move(phases)};

  jsonlite::Array invocations;
  for (const auto& inv : state.invocations) {
    invocations.push_back(jsonlite::Value{invocation_to_json(inv)});
  }
  o["invocations"] = jsonlite::Value{std::move(invocations)};
  o["artifacts"] = strings(state.artifacts);
  o["errors"] = strings(state.errors);
  return jsonlite::to_json(o);
}

std::optional<RunState> run_state_from_json(const std::string& text, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = "state.json: " + err->message;
    return std::nullopt;
  }
  const auto compat =
      version::check_state_compatibility(static_cast<std::uint32_t>(jsonlite::get_u64(o, "schema")));
  if (!compat.ok) {
    if (error) *error = compat.description;
    return std::nullopt;
  }

  RunState s;
  s.run_id = jsonlite::get_string(o, "run_id");
  s.domain = jsonlite::get_string(o, "domain");
  s.started_at = jsonlite::get_string(o, "started_at");
  s.finished_at = jsonlite::get_string(o, "finished_at");
  s.current_phase = static_cast<std::size_t>(jsonlite::get_u64(o, "current_phase"));
  auto status = run_status_from_string(jsonlite::get_string(o, "status"));
  if (s.run_id.empty() || !status) {
    if (error) *error = "state.json: missing run_id or unknown status";
    return std::nullopt;
  }
  s.status = *status;

  if (const auto* arr = jsonlite::get_array(o, "targets")) {
    for (const auto& v : *arr) {
      const auto* t = std::get_if<jsonlite::Object>(&v.v);
      if (!t) continue;
      Target target;
      target.identifier = jsonlite::get_string(*t, "identifier");
      target.kind = jsonlite::get_string(*t, "kind") == "package" ? TargetKind::package
                                                                  : TargetKind::domain;
      target.file_path = jsonlite::get_string(*t, "file_path");
      target.matched_rule = jsonlite::get_string(*t, "matched_rule");
      s.targets.push_back(std::move(target));
    }
  }
  if (const auto* arr = jsonlite::get_array(o, "phases")) {
    for (const auto& v : *arr) {
      const auto* p = std::get_if<jsonlite::Object>(&v.v);
      if (!p) continue;
      PhaseRecord rec;
      rec.name = jsonlite::get_string(*p, "name");
      auto ps = phase_status_from_string(jsonlite::get_string(*p, "status"));
      if (!ps) {
        if (error) *error = "state.json: unknown phase status";
        return std::nullopt;
      }
      rec.status = *ps;
      rec.started_at = jsonlite::get_string(*p, "started_at");
      rec.finished_at = jsonlite::get_string(*p, "finished_at");
      rec.skipped_tools = jsonlite::get_string_array(*p, "skipped_tools");
      s.phases.push_back(std::move(rec));
    }
  }
  if (const auto* arr = jsonlite::get_array(o, "invocations")) {
    for (const auto& v : *arr) {
      const auto* i = std::get_if<jsonlite::Object>(&v.v);
      if (!i) continue;
      Invocation inv;
      if (!invocation_from_json(*i, inv, error)) return std::nullopt;
      s.invocations.push_back(std::move(inv));
    }
  }
  s.artifacts = jsonlite::get_string_array(o, "artifacts");
  s.errors = jsonlite::get_string_array(o, "errors");
  return s;
}

std::string resolve_run_dir(const std::string& output_root, const std::string& ref) {
  std::error_code ec;
  if (fs::is_directory(ref, ec)) return ref;
  return (fs::path(output_root) / ref).string();
}

std::optional<RunState> load_run_state(const std::string& run_dir, std::string* error) {
  const std::string path = (fs::path(run_dir) / "state.json").string();
  auto text = read_file(path);
  if (!text) {
    if (error) *error = "no run state at " + path;
    return std::nullopt;
  }
  return run_state_from_json(*text, error);
}

void prepare_for_resume(RunState& state) {
  const std::string now = utc_timestamp_now();
  for (auto& inv : state.invocations) {
    if (is_terminal(inv.status)) continue;
    inv.status = InvocationStatus::failed;
    inv.error = ErrorCode::cancelled;
    inv.error_detail = "interrupted before completion";
    inv.finished_at = now;
  }
  state.status = RunStatus::running;
  state.finished_at.clear();
}

// ---------------------------------------------------------------------------
// RunStateRecorder
// ---------------------------------------------------------------------------

RunStateRecorder::RunStateRecorder(std::string run_dir)
    : run_dir_(make_run_dir(run_dir)),
      log_((fs::path(run_dir_) / "transitions.ndjson").string()) {}

StoreResult RunStateRecorder::persist(const RunState& state) {
  StoreResult r;
  const std::string text = run_state_to_json(state);
  std::lock_guard<std::mutex> lk(mu_);
  if (!atomic_write_file((fs::path(run_dir_) / "state.json").string(), text)) {
    r.error = ErrorCode::state_persist_failed;
    r.detail = "cannot write " + run_dir_ + "/state.json";
    return r;
  }
  r.ok = true;
  return r;
}

std::optional<RunState> RunStateRecorder::load(std::string* error) const {
  return load_run_state(run_dir_, error);
}

bool RunStateRecorder::log_transition(TransitionRecord record) {
  return log_.append(record);
}

std::string RunStateRecorder::write_raw(const std::string& tool, const std::string& fingerprint,
                                        const std::string& stdout_data,
                                        const std::string& stderr_data) {
  const std::string rel = "raw/" + tool + "/" + fingerprint + ".out";
  const fs::path base = fs::path(run_dir_);
  if (!atomic_write_file((base / rel).string(), stdout_data)) return {};
  if (!atomic_write_file((base / ("raw/" + tool + "/" + fingerprint + ".err")).string(), stderr_data)) {
    return {};
  }
  return rel;
}

StoreResult RunStateRecorder::write_outputs(const RunState& state, const ArtifactStore& store) {
  StoreResult r;
  const fs::path base(run_dir_);

  // Normalized records per tool, taken from the artifacts each completed
  // invocation registered. Findings are merged across invocations by id.
  std::map<std::string, jsonlite::Array> per_tool;
  std::map<std::string, Finding> findings;
  std::set<std::string> seen;
  for (const auto& inv : state.invocations) {
    if (!is_completed(inv.status)) continue;
    for (const auto& h : inv.output_artifacts) {
      auto a = store.get(h);
      if (!a) {
        r.error = ErrorCode::artifact_store_io;
        r.detail = "artifact " + h + " registered by " + inv.tool + " is unreadable";
        return r;
      }
      std::optional<jsonlite::JsonError> err;
      auto o = jsonlite::parse(a->content, &err);
      if (err) continue;
      auto f = finding_from_json(o);
      if (!f) continue;
      f->discovered_at = inv.finished_at;
      if (seen.insert(inv.tool + "\n" + h).second) {
        per_tool[inv.tool].push_back(jsonlite::Value{finding_to_json(*f)});
      }
      if (f->kind != ArtifactKind::finding) continue;
      auto [slot, inserted] = findings.emplace(f->id, *f);
      if (!inserted && slot->second.invocation != f->invocation) {
        slot->second.occurrences += f->occurrences;
        slot->second.severity = std::max(slot->second.severity, f->severity);
      }
    }
  }

  for (const auto& [tool, records] : per_tool) {
    jsonlite::Object doc;
    doc["schema"] = u64(version::FINDINGS_SCHEMA_VERSION);
    doc["tool"] = str(tool);
    doc["records"] = jsonlite::Value{records};
    if (!atomic_write_file((base / "normalized" / (tool + ".json")).string(), jsonlite::to_json(doc))) {
      r.error = ErrorCode::state_persist_failed;
      r.detail = "cannot write normalized/" + tool + ".json";
      return r;
    }
  }

  std::vector<Finding> ordered;
  ordered.reserve(findings.size());
  for (auto& [_, f] : findings) ordered.push_back(std::move(f));
  std::stable_sort(ordered.begin(), ordered.end(), [](const Finding& a, const Finding& b) {
    return a.severity > b.severity;
  });
  jsonlite::Array finding_arr;
  for (const auto& f : ordered) finding_arr.push_back(jsonlite::Value{finding_to_json(f)});
  jsonlite::Object fdoc;
  fdoc["schema"] = u64(version::FINDINGS_SCHEMA_VERSION);
  fdoc["run_id"] = str(state.run_id);
  fdoc["findings"] = jsonlite::Value{std::move(finding_arr)};
  if (!atomic_write_file((base / "normalized" / "findings.json").string(), jsonlite::to_json(fdoc))) {
    r.error = ErrorCode::state_persist_failed;
    r.detail = "cannot write normalized/findings.json";
    return r;
  }

  jsonlite::Object meta;
  meta["run_id"] = str(state.run_id);
  meta["domain"] = str(state.domain);
  meta["started_at"] = str(state.started_at);
  meta["finished_at"] = str(state.finished_at);
  meta["status"] = str(to_string(state.status));
  meta["engine"] = jsonlite::parse_value(version::manifest_to_json(version::current_manifest()), nullptr);
  meta["worker"] = jsonlite::parse_value(worker_identity_to_json(global_worker_identity()), nullptr);
  jsonlite::Array targets;
  for (const auto& t : state.targets) targets.push_back(jsonlite::Value{target_to_json(t)});
  meta["targets"] = jsonlite::Value{std::move(targets)};

  jsonlite::Object tools;
  std::map<std::string, std::vector<std::string>> tool_errors;
  for (const auto& inv : state.invocations) {
    tools[inv.tool] = str(inv.tool_version);
    if (inv.status == InvocationStatus::failed) {
      tool_errors[inv.tool].push_back("attempt " + std::to_string(inv.attempt) + ": " +
                                      to_string(inv.error) +
                                      (inv.error_detail.empty() ? "" : ": " + inv.error_detail));
    }
  }
  meta["tools"] = jsonlite::Value{std::move(tools)};
  jsonlite::Object errs;
  for (const auto& [tool, list] : tool_errors) errs[tool] = strings(list);
  meta["tool_errors"] = jsonlite::Value{std::move(errs)};

  jsonlite::Array phases;
  for (const auto& p : state.phases) phases.push_back(jsonlite::Value{phase_to_json(p)});
  meta["phases"] = jsonlite::Value{std::move(phases)};
  meta["errors"] = strings(state.errors);
  meta["findings"] = u64(ordered.size());

  if (!atomic_write_file((base / "meta.json").string(), jsonlite::to_json(meta))) {
    r.error = ErrorCode::state_persist_failed;
    r.detail = "cannot write meta.json";
    return r;
  }
  r.ok = true;
  return r;
}

// ---------------------------------------------------------------------------
// run_summary_text
// ---------------------------------------------------------------------------

std::string run_summary_text(const RunState& state) {
  std::ostringstream o;
  o << "run " << state.run_id << " (" << state.domain << "): " << to_string(state.status) << "\n";
  o << "  started " << state.started_at;
  if (!state.finished_at.empty()) o << ", finished " << state.finished_at;
  o << "\n";

  std::size_t failed = 0;
  std::size_t cached = 0;
  std::size_t executed = 0;
  for (const auto& phase : state.phases) {
    o << "phase " << phase.name << " [" << to_string(phase.status) << "]\n";
    for (const auto& inv : state.invocations) {
      if (inv.phase != phase.name) continue;
      o << "  " << inv.tool;
      if (inv.attempt > 1) o << " (attempt " << inv.attempt << ")";
      o << " " << inv.fingerprint.substr(0, 12) << ": ";
      switch (inv.status) {
        case InvocationStatus::succeeded:
          ++executed;
          o << "succeeded, " << inv.output_artifacts.size() << " artifacts";
          break;
        case InvocationStatus::skipped_cached:
          ++cached;
          o << "cached";
          if (!inv.cached_from.empty()) o << " from " << inv.cached_from;
          o << ", " << inv.output_artifacts.size() << " artifacts";
          break;
        case InvocationStatus::failed:
          ++failed;
          o << "failed (" << to_string(inv.error) << ")";
          if (!inv.error_detail.empty()) o << ": " << inv.error_detail;
          break;
        default:
          o << to_string(inv.status);
          break;
      }
      o << "\n";
    }
    if (!phase.skipped_tools.empty()) {
      o << "  skipped, no qualifying input:";
      for (const auto& t : phase.skipped_tools) o << " " << t;
      o << "\n";
    }
  }
  for (const auto& e : state.errors) o << "error: " << e << "\n";

  o << "totals: " << executed << " executed, " << cached << " cached, " << failed << " failed\n";
  switch (state.status) {
    case RunStatus::completed:
      o << "result: run completed\n";
      break;
    case RunStatus::completed_with_gaps:
      o << "result: run completed with findings gaps (" << failed << " failed invocations)\n";
      break;
    case RunStatus::failed:
      o << "result: run failed\n";
      break;
    case RunStatus::cancelled:
      o << "result: run cancelled (resumable)\n";
      break;
    case RunStatus::running:
      o << "result: run incomplete (resumable)\n";
      break;
  }
  return o.str();
}

}  // namespace deadbolt
