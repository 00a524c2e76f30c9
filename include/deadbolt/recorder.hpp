#pragma once

// deadbolt/recorder.hpp — Run State Recorder.
//
// Owns everything under one run directory:
//   state.json            full RunState snapshot, replaced atomically on every
//                         persist() (tmp + rename); what resume reads back
//   transitions.ndjson    append-only, hash-chained transition history
//   raw/<tool>/<fp>.out   copies of raw tool output (the CAS holds the
//   raw/<tool>/<fp>.err   authoritative bytes)
//   meta.json             run metadata, written at the end of a run
//   normalized/<tool>.json, normalized/findings.json
//
// persist() is idempotent and serialized by an internal mutex, so worker
// threads may call it after every invocation transition. A failed persist is
// a state_persist_failed error: the caller must stop the run.

#include <mutex>
#include <optional>
#include <string>

#include "deadbolt/artifact_store.hpp"
#include "deadbolt/audit.hpp"
#include "deadbolt/types.hpp"

namespace deadbolt {

std::string run_state_to_json(const RunState& state);
// Checks the schema number before trusting anything else in the document.
std::optional<RunState> run_state_from_json(const std::string& text, std::string* error);

// `ref` is either a run directory or a run id under output_root.
std::string resolve_run_dir(const std::string& output_root, const std::string& ref);

std::optional<RunState> load_run_state(const std::string& run_dir, std::string* error);

// Readies a loaded state for another pass: invocations that never reached a
// terminal status (the process died under them) are closed as Failed with
// "cancelled", and the run goes back to running.
void prepare_for_resume(RunState& state);

class RunStateRecorder {
 public:
  // Creates the run directory if needed and opens the transition log.
  explicit RunStateRecorder(std::string run_dir);

  bool ok() const { return log_.ok(); }

  StoreResult persist(const RunState& state);

  // load(run_id): reads this recorder's state.json.
  std::optional<RunState> load(std::string* error) const;

  // Appends to transitions.ndjson. False means the history could not be
  // written and the run must stop.
  bool log_transition(TransitionRecord record);

  // Writes raw/<tool>/<fingerprint>.out/.err and returns the run-relative
  // path of the .out file ("" on failure).
  std::string write_raw(const std::string& tool, const std::string& fingerprint,
                        const std::string& stdout_data, const std::string& stderr_data);

  // meta.json and normalized/*.json from the final state.
  StoreResult write_outputs(const RunState& state, const ArtifactStore& store);

  const std::string& run_dir() const { return run_dir_; }
  const TransitionLog& transitions() const { return log_; }

 private:
  std::string run_dir_;
  std::mutex mu_;
  TransitionLog log_;
};

// Human-readable report of a run: phases, every invocation and how it ended
// (succeeded, cached, failed + error kind), tools skipped for lack of input,
// and whether the run failed or completed with gaps.
std::string run_summary_text(const RunState& state);

}  // namespace deadbolt
