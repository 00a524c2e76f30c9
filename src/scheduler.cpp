#include "deadbolt/scheduler.hpp"

#include <algorithm>
#include <optional>
#include <set>

#include "deadbolt/hash.hpp"
#include "deadbolt/observability.hpp"
#include "deadbolt/worker.hpp"

namespace deadbolt {

struct PhaseScheduler::Job {
  const ToolDescriptor* tool{nullptr};
  std::vector<Artifact> inputs;
  std::vector<std::string> input_hashes;  // sorted, unique
  std::string input_set_hash;
  std::string fingerprint;
  std::string subject;
  std::size_t record{0};  // index into RunState::invocations
  bool reused{false};     // already completed earlier in this run
  bool failed{false};
  std::vector<std::string> outputs;
};

namespace {

RunEvent event(RunEventType type, const RunState& state, const std::string& phase = "") {
  RunEvent ev;
  ev.type = type;
  ev.run_id = state.run_id;
  ev.phase = phase;
  return ev;
}

RunEvent event(RunEventType type, const RunState& state, const Invocation& inv) {
  RunEvent ev = event(type, state, inv.phase);
  ev.tool = inv.tool;
  ev.fingerprint = inv.fingerprint;
  ev.status = to_string(inv.status);
  ev.error = inv.error;
  ev.detail = inv.error_detail;
  ev.artifacts = inv.output_artifacts.size();
  return ev;
}

bool completed(InvocationStatus s) {
  return s == InvocationStatus::succeeded || s == InvocationStatus::skipped_cached;
}

bool produces(const ToolDescriptor& tool, ArtifactKind kind) {
  return std::find(tool.produces.begin(), tool.produces.end(), kind) != tool.produces.end();
}

}  // namespace

PhaseScheduler::PhaseScheduler(const ToolRegistry& registry, ArtifactStore& store,
                               ResumeCache& cache, ISandboxAdapter& sandbox,
                               const Normalizer& normalizer, RunStateRecorder& recorder,
                               CancellationToken& cancel, SchedulerOptions options)
    : registry_(registry),
      store_(store),
      cache_(cache),
      sandbox_(sandbox),
      normalizer_(normalizer),
      recorder_(recorder),
      cancel_(cancel),
      options_(options) {}

RunState PhaseScheduler::run(const Plan& plan, RunState state) {
  fatal_ = false;
  fatal_code_ = ErrorCode::none;
  mandatory_failed_ = false;
  failed_producers_.clear();
  artifacts_.clear();

  // Phase records follow the plan; a resumed state keeps its history.
  std::vector<PhaseRecord> phases;
  for (const auto& p : plan.phases) {
    auto it = std::find_if(state.phases.begin(), state.phases.end(),
                           [&](const PhaseRecord& r) { return r.name == p.name; });
    if (it != state.phases.end()) {
      phases.push_back(*it);
    } else {
      PhaseRecord r;
      r.name = p.name;
      phases.push_back(std::move(r));
    }
  }
  state.phases = std::move(phases);
  state.status = RunStatus::running;
  if (state.domain.empty()) state.domain = plan.domain;
  if (state.started_at.empty()) state.started_at = utc_timestamp_now();

  emit_run_event(event(RunEventType::run_started, state));
  {
    std::lock_guard<std::mutex> lk(mu_);
    transition_locked(state, "run", "", nullptr, to_string(RunStatus::running));
    persist_locked(state);
  }

  for (std::size_t i = 0; i < plan.phases.size(); ++i) {
    if (fatal_ || mandatory_failed_ || cancel_.cancelled()) break;
    const PhaseDefinition& phase = plan.phases[i];
    if (!start_phase(phase, i, state)) break;

    std::vector<Job> jobs = plan_phase(phase, i, state);
    if (fatal_) break;

    std::vector<Job*> dispatch;
    for (auto& j : jobs) {
      if (!j.reused) dispatch.push_back(&j);
    }
    run_bounded(dispatch.size(), options_.max_concurrency,
                [&](std::size_t k) { execute(*dispatch[k], state); });

    // Barrier: every dispatched invocation is terminal here.
    register_outputs(jobs, state);
    if (fatal_ || cancel_.cancelled()) break;  // phase stays running; resume redoes it

    {
      std::lock_guard<std::mutex> lk(mu_);
      PhaseRecord& rec = state.phases[i];
      rec.status = PhaseStatus::completed;
      rec.finished_at = utc_timestamp_now();
      transition_locked(state, "phase", phase.name, nullptr, to_string(PhaseStatus::completed));
      persist_locked(state);
    }
    RunEvent ev = event(RunEventType::phase_finished, state, phase.name);
    ev.status = to_string(PhaseStatus::completed);
    emit_run_event(ev);

    if (!mandatory_check_after(plan, i, state)) break;
  }

  close_run(state);
  return state;
}

bool PhaseScheduler::start_phase(const PhaseDefinition& phase, std::size_t index,
                                 RunState& state) {
  std::lock_guard<std::mutex> lk(mu_);
  state.current_phase = index;
  PhaseRecord& rec = state.phases[index];
  rec.status = PhaseStatus::running;
  if (rec.started_at.empty()) rec.started_at = utc_timestamp_now();
  rec.finished_at.clear();

  for (const auto& [from, to] : phase.promote_if_empty) {
    if (!run_artifacts(state, to).empty()) continue;
    for (const Artifact* a : run_artifacts(state, from)) {
      Artifact promoted = make_artifact(to, a->value, a->content, "promoted");
      promoted.file_path = a->file_path;
      const StoreResult put = store_.put(promoted);
      if (!put.ok) {
        fail_fatal_locked(state, put.error, put.detail);
        return false;
      }
      if (std::find(state.artifacts.begin(), state.artifacts.end(), promoted.hash) ==
          state.artifacts.end()) {
        state.artifacts.push_back(promoted.hash);
      }
      artifacts_[promoted.hash] = promoted;
    }
  }

  transition_locked(state, "phase", phase.name, nullptr, to_string(PhaseStatus::running));
  if (!persist_locked(state)) return false;
  emit_run_event(event(RunEventType::phase_started, state, phase.name));

  // A phase that cannot do without a kind fails the run when nothing of that
  // kind exists because a producer failed. Without a failure it simply has
  // nothing to work on.
  for (ArtifactKind kind : phase.mandatory_inputs) {
    if (!run_artifacts(state, kind).empty()) continue;
    for (const auto& [tool, error] : failed_producers_) {
      if (!produces(*tool, kind)) continue;
      mandatory_failed_ = true;
      state.errors.push_back(to_string(ErrorCode::mandatory_failure) + ": phase '" + phase.name +
                             "' requires '" + to_string(kind) + "' but " + tool->name +
                             " failed (" + to_string(error) + ")");
      persist_locked(state);
      return false;
    }
  }
  return !fatal_;
}

std::vector<PhaseScheduler::Job> PhaseScheduler::plan_phase(const PhaseDefinition& phase,
                                                            std::size_t index, RunState& state) {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Job> jobs;
  std::vector<std::string> skipped;

  auto add_job = [&](const ToolDescriptor* tool, std::vector<const Artifact*> inputs,
                     std::string subject) {
    std::sort(inputs.begin(), inputs.end(),
              [](const Artifact* a, const Artifact* b) { return a->hash < b->hash; });
    inputs.erase(std::unique(inputs.begin(), inputs.end(),
                             [](const Artifact* a, const Artifact* b) { return a->hash == b->hash; }),
                 inputs.end());
    Job j;
    j.tool = tool;
    for (const Artifact* a : inputs) {
      j.inputs.push_back(*a);
      j.input_hashes.push_back(a->hash);
    }
    j.input_set_hash = combination_hash(j.input_hashes);
    j.fingerprint = compute_fingerprint(*tool, j.input_hashes);
    j.subject = std::move(subject);
    jobs.push_back(std::move(j));
  };

  for (const auto& name : phase.tools) {
    const ToolDescriptor* tool = registry_.find(name);
    if (!tool) {
      skipped.push_back(name);
      continue;
    }
    std::map<ArtifactKind, std::vector<const Artifact*>> by_kind;
    bool missing = false;
    for (ArtifactKind k : tool->consumes) {
      by_kind[k] = run_artifacts(state, k);
      missing = missing || by_kind[k].empty();
    }
    if (missing) {
      skipped.push_back(name);
      continue;
    }

    if (tool->input_mode == InputMode::each) {
      const ArtifactKind first = tool->consumes.front();
      std::map<std::string, std::vector<const Artifact*>> by_value;
      for (const Artifact* a : by_kind[first]) by_value[a->value].push_back(a);
      for (auto& [value, group] : by_value) {
        std::vector<const Artifact*> inputs = group;
        for (const auto& [k, list] : by_kind) {
          if (k != first) inputs.insert(inputs.end(), list.begin(), list.end());
        }
        add_job(tool, std::move(inputs), value);
      }
    } else {
      std::vector<const Artifact*> inputs;
      for (const auto& [_, list] : by_kind) inputs.insert(inputs.end(), list.begin(), list.end());
      add_job(tool, std::move(inputs), "");
    }
  }

  std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
    if (a.tool->name != b.tool->name) return a.tool->name < b.tool->name;
    return a.input_set_hash < b.input_set_hash;
  });

  for (auto& job : jobs) {
    std::uint32_t attempts = 0;
    const Invocation* done = nullptr;
    for (const auto& inv : state.invocations) {
      if (inv.fingerprint != job.fingerprint) continue;
      ++attempts;
      if (completed(inv.status)) done = &inv;
    }
    if (done) {
      bool intact = true;
      for (const auto& h : done->output_artifacts) intact = intact && artifact(h) != nullptr;
      if (intact) {
        job.reused = true;
        job.outputs = done->output_artifacts;
        continue;
      }
      RunEvent ev = event(RunEventType::resume_inconsistency, state, *done);
      ev.detail = "recorded outputs are missing from the artifact store";
      emit_run_event(ev);
      state.errors.push_back(to_string(ErrorCode::resume_inconsistency) + ": " + job.tool->name +
                             " " + job.fingerprint + ": recorded outputs are missing; re-running");
    }

    Invocation inv;
    inv.tool = job.tool->name;
    inv.tool_version = job.tool->version;
    inv.phase = phase.name;
    inv.input_hashes = job.input_hashes;
    inv.input_set_hash = job.input_set_hash;
    inv.fingerprint = job.fingerprint;
    inv.attempt = attempts + 1;
    inv.status = InvocationStatus::pending;
    job.record = state.invocations.size();
    state.invocations.push_back(inv);
    transition_locked(state, "invocation", phase.name, &state.invocations.back(),
                      to_string(InvocationStatus::pending));
  }

  state.phases[index].skipped_tools = std::move(skipped);
  persist_locked(state);
  return jobs;
}

void PhaseScheduler::execute(Job& job, RunState& state) {
  const ToolDescriptor& tool = *job.tool;
  Invocation inv;
  {
    std::lock_guard<std::mutex> lk(mu_);
    inv = state.invocations[job.record];
    if (fatal_ || cancel_.cancelled()) {
      inv.status = InvocationStatus::failed;
      inv.error = ErrorCode::cancelled;
      inv.error_detail = fatal_ ? "not started: run aborted" : "not started: run cancelled";
      inv.started_at = utc_timestamp_now();
    } else {
      inv.status = InvocationStatus::running;
      inv.started_at = utc_timestamp_now();
      state.invocations[job.record] = inv;
      transition_locked(state, "invocation", inv.phase, &inv, to_string(inv.status));
      persist_locked(state);
    }
  }
  if (inv.status == InvocationStatus::failed) {
    finish_invocation(job, std::move(inv), state);
    return;
  }

  CacheLookup cached = cache_.lookup_verified(job.fingerprint, store_);
  std::optional<std::string> cached_raw;
  std::optional<std::string> cached_err;
  if (cached.verdict == CacheVerdict::hit) {
    auto fetch = [&](const std::string& digest) {
      return digest.empty() ? std::optional<std::string>(std::string()) : store_.get_blob(digest);
    };
    cached_raw = fetch(cached.result->raw_output);
    cached_err = fetch(cached.result->raw_stderr);
    if (!cached_raw || !cached_err) {
      cached.verdict = CacheVerdict::inconsistent;
      cached.detail = "raw evidence of " + cached.result->run_id + " is unreadable";
    }
  }
  if (cached.verdict == CacheVerdict::hit) {
    inv.status = InvocationStatus::skipped_cached;
    inv.output_artifacts = cached.result->output_artifacts;
    inv.raw_output = cached.result->raw_output;
    inv.raw_stderr = cached.result->raw_stderr;
    inv.exit_code = cached.result->exit_code;
    inv.cached_from = cached.result->run_id;
    // Every run directory carries its own copy of the raw evidence.
    inv.raw_path = recorder_.write_raw(tool.name, job.fingerprint, *cached_raw, *cached_err);
    if (inv.raw_path.empty()) {
      inv.status = InvocationStatus::failed;
      inv.error = ErrorCode::state_persist_failed;
      inv.error_detail = "cannot copy cached raw output into the run directory";
      std::lock_guard<std::mutex> lk(mu_);
      fail_fatal_locked(state, inv.error, tool.name + ": " + inv.error_detail);
    } else {
      emit_run_event(event(RunEventType::cache_hit, state, inv));
    }
    finish_invocation(job, std::move(inv), state);
    return;
  }
  if (cached.verdict == CacheVerdict::inconsistent) {
    RunEvent ev = event(RunEventType::resume_inconsistency, state, inv);
    ev.detail = cached.detail;
    emit_run_event(ev);
    std::lock_guard<std::mutex> lk(mu_);
    state.errors.push_back(to_string(ErrorCode::resume_inconsistency) + ": " + tool.name + " " +
                           job.fingerprint + ": " + cached.detail + "; re-running");
  }

  SandboxRequest req;
  req.tool = &tool;
  req.inputs = job.inputs;
  req.subject = job.subject;
  req.label = job.fingerprint.substr(0, 16);
  req.timeout_ms = tool.timeout_ms ? tool.timeout_ms : options_.default_timeout_ms;
  req.cancel = &cancel_;
  emit_run_event(event(RunEventType::invocation_started, state, inv));
  const SandboxOutcome out = sandbox_.execute(req);
  inv.exit_code = out.exit_code;
  inv.duration_ms = out.duration_ns / 1000000u;

  // Raw evidence is kept whether or not the tool succeeded.
  const StoreResult raw = store_.put_blob(out.raw_output);
  const StoreResult err = store_.put_blob(out.stderr_text);
  if (!raw.ok || !err.ok) {
    inv.status = InvocationStatus::failed;
    inv.error = ErrorCode::artifact_store_io;
    inv.error_detail = raw.ok ? err.detail : raw.detail;
    {
      std::lock_guard<std::mutex> lk(mu_);
      fail_fatal_locked(state, inv.error, tool.name + ": " + inv.error_detail);
    }
    finish_invocation(job, std::move(inv), state);
    return;
  }
  inv.raw_output = raw.hash;
  inv.raw_stderr = err.hash;
  inv.raw_path = recorder_.write_raw(tool.name, job.fingerprint, out.raw_output, out.stderr_text);
  if (inv.raw_path.empty()) {
    inv.status = InvocationStatus::failed;
    inv.error = ErrorCode::state_persist_failed;
    inv.error_detail = "cannot copy raw output into the run directory";
    {
      std::lock_guard<std::mutex> lk(mu_);
      fail_fatal_locked(state, inv.error, tool.name + ": " + inv.error_detail);
    }
    finish_invocation(job, std::move(inv), state);
    return;
  }

  if (!out.ok) {
    inv.status = InvocationStatus::failed;
    inv.error = out.error;
    inv.error_detail = out.detail;
  } else {
    NormalizeContext ctx;
    ctx.parser = tool.parser;
    ctx.subject = job.subject;
    ctx.source_artifact = raw.hash;
    ctx.invocation = job.fingerprint;
    ctx.discovered_at = utc_timestamp_now();
    const NormalizeResult norm = normalizer_.normalize(tool.name, out.raw_output, ctx);
    if (!norm.ok) {
      inv.status = InvocationStatus::failed;
      inv.error = ErrorCode::normalization_error;
      inv.error_detail = norm.detail;
      emit_run_event(event(RunEventType::normalization_failed, state, inv));
    } else {
      for (const Finding& f : norm.findings) {
        if (!produces(tool, f.kind)) continue;  // outside the declared contract
        const Artifact a = make_artifact(f.kind, f.kind == ArtifactKind::finding ? f.id : f.target,
                                         finding_artifact_content(f), job.fingerprint);
        const StoreResult put = store_.put(a);
        if (!put.ok) {
          inv.status = InvocationStatus::failed;
          inv.error = put.error;
          inv.error_detail = put.detail;
          {
            std::lock_guard<std::mutex> lk(mu_);
            fail_fatal_locked(state, put.error, tool.name + ": " + put.detail);
          }
          finish_invocation(job, std::move(inv), state);
          return;
        }
        inv.output_artifacts.push_back(a.hash);
      }
      inv.status = InvocationStatus::succeeded;

      CachedResult rec;
      rec.fingerprint = job.fingerprint;
      rec.tool = tool.name;
      rec.run_id = state.run_id;
      rec.raw_output = inv.raw_output;
      rec.raw_stderr = inv.raw_stderr;
      rec.output_artifacts = inv.output_artifacts;
      rec.exit_code = inv.exit_code;
      rec.finished_at = utc_timestamp_now();
      if (!cache_.record(rec)) {
        std::lock_guard<std::mutex> lk(mu_);
        state.errors.push_back("resume cache: cannot record " + tool.name + " " + job.fingerprint);
      }
    }
  }

  RunEvent done = event(RunEventType::invocation_finished, state, inv);
  done.duration_ns = out.duration_ns;
  done.bytes_stdout = out.stdout_text.size();
  done.bytes_stderr = out.stderr_text.size();
  emit_run_event(done);
  finish_invocation(job, std::move(inv), state);
}

void PhaseScheduler::finish_invocation(Job& job, Invocation inv, RunState& state) {
  inv.finished_at = utc_timestamp_now();
  job.failed = inv.status == InvocationStatus::failed;
  job.outputs = inv.output_artifacts;

  std::lock_guard<std::mutex> lk(mu_);
  state.invocations[job.record] = inv;
  if (job.failed) failed_producers_.emplace_back(job.tool, inv.error);
  transition_locked(state, "invocation", inv.phase, &inv, to_string(inv.status));
  persist_locked(state);
}

void PhaseScheduler::register_outputs(const std::vector<Job>& jobs, RunState& state) {
  std::lock_guard<std::mutex> lk(mu_);
  std::set<std::string> have(state.artifacts.begin(), state.artifacts.end());
  for (const Job& job : jobs) {
    for (const auto& h : job.outputs) {
      if (have.insert(h).second) state.artifacts.push_back(h);
    }
  }
  persist_locked(state);
}

bool PhaseScheduler::mandatory_check_after(const Plan& plan, std::size_t phase_index,
                                           RunState& state) {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& [tool, error] : failed_producers_) {
    if (!tool->mandatory) continue;
    for (std::size_t j = phase_index + 1; j < plan.phases.size(); ++j) {
      for (ArtifactKind kind : plan.phases[j].mandatory_inputs) {
        if (!produces(*tool, kind)) continue;
        mandatory_failed_ = true;
        state.errors.push_back(to_string(ErrorCode::mandatory_failure) + ": " + tool->name +
                               " failed (" + to_string(error) + ") and phase '" +
                               plan.phases[j].name + "' requires '" + to_string(kind) + "'");
        persist_locked(state);
        return false;
      }
    }
  }
  return true;
}

void PhaseScheduler::close_run(RunState& state) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fatal_ || mandatory_failed_) {
    state.status = RunStatus::failed;
  } else if (cancel_.cancelled()) {
    state.status = RunStatus::cancelled;
  } else {
    // The latest attempt per fingerprint decides whether a gap remains.
    std::map<std::string, InvocationStatus> latest;
    for (const auto& inv : state.invocations) latest[inv.fingerprint] = inv.status;
    const bool gaps = std::any_of(latest.begin(), latest.end(), [](const auto& kv) {
      return kv.second == InvocationStatus::failed;
    });
    state.status = gaps ? RunStatus::completed_with_gaps : RunStatus::completed;
  }
  state.finished_at = utc_timestamp_now();
  transition_locked(state, "run", "", nullptr, to_string(state.status));
  persist_locked(state);

  RunEvent ev = event(RunEventType::run_finished, state);
  ev.status = to_string(state.status);
  if (!state.errors.empty()) ev.detail = state.errors.back();
  emit_run_event(ev);
}

const Artifact* PhaseScheduler::artifact(const std::string& hash) {
  auto it = artifacts_.find(hash);
  if (it != artifacts_.end()) return &it->second;
  auto a = store_.get(hash);
  if (!a) return nullptr;
  return &artifacts_.emplace(hash, std::move(*a)).first->second;
}

std::vector<const Artifact*> PhaseScheduler::run_artifacts(const RunState& state,
                                                           ArtifactKind kind) {
  std::vector<const Artifact*> out;
  for (const auto& h : state.artifacts) {
    const Artifact* a = artifact(h);
    if (a && a->kind == kind) out.push_back(a);
  }
  std::sort(out.begin(), out.end(), [](const Artifact* a, const Artifact* b) {
    if (a->value != b->value) return a->value < b->value;
    return a->hash < b->hash;
  });
  return out;
}

bool PhaseScheduler::persist_locked(RunState& state) {
  // Once state.json itself could not be written there is nothing more to
  // persist; any other fatal error still has to reach it.
  if (fatal_ && fatal_code_ == ErrorCode::state_persist_failed) return false;
  const StoreResult r = recorder_.persist(state);
  if (r.ok) return true;
  fail_fatal_locked(state, r.error, r.detail);
  return false;
}

void PhaseScheduler::transition_locked(RunState& state, const std::string& scope,
                                       const std::string& phase, const Invocation* inv,
                                       const std::string& status) {
  TransitionRecord rec;
  rec.run_id = state.run_id;
  rec.scope = scope;
  rec.phase = phase;
  rec.status = status;
  if (inv) {
    rec.tool = inv->tool;
    rec.fingerprint = inv->fingerprint;
    rec.attempt = inv->attempt;
    rec.error_code = to_string(inv->error);
    rec.detail = inv->error_detail;
  } else if (scope == "run" && !state.errors.empty() && status != to_string(RunStatus::running)) {
    rec.detail = state.errors.back();
  }
  if (!recorder_.log_transition(rec)) {
    fail_fatal_locked(state, ErrorCode::state_persist_failed,
                      "cannot append to " + recorder_.transitions().path());
  }
}

void PhaseScheduler::fail_fatal_locked(RunState& state, ErrorCode code, const std::string& detail) {
  if (!fatal_.exchange(true)) {
    fatal_code_ = code;
    state.errors.push_back(to_string(code) + ": " + detail);
  }
  cancel_.cancel();
}

}  // namespace deadbolt
