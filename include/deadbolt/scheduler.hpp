#pragma once

// deadbolt/scheduler.hpp — Phase Scheduler.
//
// run(plan, state) drives one run through every phase of the plan, in order:
//
//   1. Phase start: apply promote_if_empty fallbacks, then check that every
//      mandatory input kind is available (see MANDATORY below).
//   2. Eligibility: for every tool of the phase whose consumed kinds all have
//      at least one artifact registered with the run, build one invocation per
//      distinct input combination (one for batch tools, one per input value
//      for each-mode tools). Tools lacking input are recorded as skipped.
//   3. Records: invocations are sorted by (tool name, input set hash) and
//      appended to RunState in that order before anything runs. A fingerprint
//      that already Succeeded (or was cached) earlier in this run is not
//      re-dispatched; one that only ever Failed gets a new attempt record.
//   4. Dispatch on at most max_concurrency threads. Per invocation:
//      resume cache -> (miss) sandbox -> raw evidence -> normalizer ->
//      artifact store -> resume cache record.
//   5. Barrier: the phase completes only when every dispatched invocation is
//      terminal. New artifacts are then registered with the run in record
//      order, so the artifact list does not depend on completion order.
//
// RunState is persisted and a transition appended after every invocation
// status change. Both happen under one mutex, the only lock shared by worker
// threads.
//
// MANDATORY: a failed invocation fails the run (mandatory_failure) when its
// tool is flagged `mandatory` and produces a kind listed in a later phase's
// mandatory_inputs, or when a phase starts without any artifact of one of its
// mandatory_inputs while an invocation that should have produced that kind
// failed. Any other failure leaves the run completed_with_gaps.
//
// FATAL: state_persist_failed and artifact_store_io cancel in-flight work and
// finish the run as failed. Cancellation through the token finishes it as
// cancelled; in both cases everything already persisted stays valid and the
// run can be resumed.

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "deadbolt/artifact_store.hpp"
#include "deadbolt/normalize.hpp"
#include "deadbolt/recorder.hpp"
#include "deadbolt/registry.hpp"
#include "deadbolt/resume.hpp"
#include "deadbolt/sandbox.hpp"
#include "deadbolt/types.hpp"

namespace deadbolt {

struct SchedulerOptions {
  std::size_t max_concurrency{4};
  std::uint64_t default_timeout_ms{600000};
};

class PhaseScheduler {
 public:
  PhaseScheduler(const ToolRegistry& registry, ArtifactStore& store, ResumeCache& cache,
                 ISandboxAdapter& sandbox, const Normalizer& normalizer,
                 RunStateRecorder& recorder, CancellationToken& cancel,
                 SchedulerOptions options = {});

  // `state` carries the run id, targets and seeded artifacts (fresh run) or a
  // loaded, prepare_for_resume()d state (resume). Returns the final state.
  RunState run(const Plan& plan, RunState state);

 private:
  struct Job;

  bool start_phase(const PhaseDefinition& phase, std::size_t index, RunState& state);
  std::vector<Job> plan_phase(const PhaseDefinition& phase, std::size_t index, RunState& state);
  void execute(Job& job, RunState& state);
  void finish_invocation(Job& job, Invocation inv, RunState& state);
  bool mandatory_check_after(const Plan& plan, std::size_t phase_index, RunState& state);
  void register_outputs(const std::vector<Job>& jobs, RunState& state);
  void close_run(RunState& state);

  const Artifact* artifact(const std::string& hash);
  std::vector<const Artifact*> run_artifacts(const RunState& state, ArtifactKind kind);

  // Callers hold mu_.
  bool persist_locked(RunState& state);
  void transition_locked(RunState& state, const std::string& scope, const std::string& phase,
                         const Invocation* inv, const std::string& status);
  void fail_fatal_locked(RunState& state, ErrorCode code, const std::string& detail);

  const ToolRegistry& registry_;
  ArtifactStore& store_;
  ResumeCache& cache_;
  ISandboxAdapter& sandbox_;
  const Normalizer& normalizer_;
  RunStateRecorder& recorder_;
  CancellationToken& cancel_;
  SchedulerOptions options_;

  std::mutex mu_;
  std::atomic<bool> fatal_{false};
  ErrorCode fatal_code_{ErrorCode::none};  // first fatal error; guarded by mu_
  bool mandatory_failed_{false};
  std::map<std::string, Artifact> artifacts_;  // run artifacts loaded from the store
  // (tool, error) of every invocation that failed during this pass.
  std::vector<std::pair<const ToolDescriptor*, ErrorCode>> failed_producers_;
};

}  // namespace deadbolt
