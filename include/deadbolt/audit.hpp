#pragma once

// deadbolt/audit.hpp — Append-only, hash-chained run transition log.
//
// Every run, phase and invocation transition is appended to
// <run dir>/transitions.ndjson as one JSON line. state.json is a snapshot
// that gets replaced; this log is the history that never is.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence
//      number, continued across process restarts (resume reopens the log).
//   3. CHAINED: each entry carries the BLAKE3 digest of the previous line, so
//      a truncated or edited log is detectable with verify_transition_log().
//   4. An append that returns false wrote nothing the chain depends on; the
//      caller treats it as a persistence failure.

#include <cstdint>
#include <memory>
#include <string>

namespace deadbolt {

struct TransitionRecord {
  uint64_t sequence{0};         // assigned by append()
  std::string previous_digest;  // assigned by append()
  std::string run_id;
  std::string scope;            // "run" | "phase" | "invocation"
  std::string phase;
  std::string tool;
  std::string fingerprint;
  uint32_t attempt{0};
  std::string status;
  std::string error_code;
  std::string detail;
  uint64_t timestamp_unix_ms{0};  // assigned by append()
};

std::string transition_to_json(const TransitionRecord& r);

struct TransitionLogImpl;

// Thread-safe: one internal mutex serializes appends.
class TransitionLog {
 public:
  // Opens (or creates) the log at `path` and resumes the chain from its last
  // intact entry. The parent directory must exist.
  explicit TransitionLog(const std::string& path);
  ~TransitionLog();
  TransitionLog(const TransitionLog&) = delete;
  TransitionLog& operator=(const TransitionLog&) = delete;

  bool ok() const;

  // Assigns sequence, previous_digest and timestamp in place.
  bool append(TransitionRecord& record);

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::unique_ptr<TransitionLogImpl> impl_;
};

struct ChainCheck {
  bool ok{false};
  uint64_t entries{0};
  std::string error;  // first break, e.g. "entry 7: previous digest mismatch"
};

// Re-walks the chain from the first line.
ChainCheck verify_transition_log(const std::string& path);

}  // namespace deadbolt
