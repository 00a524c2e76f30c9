#pragma once

// deadbolt/observability.hpp — Structured run observability.
//
// DESIGN:
//   RunEvent is the canonical observable unit. The scheduler emits one event per
//   run/phase boundary and per invocation transition. Every event is:
//     - folded into the process-wide EngineStats counters (always);
//     - handed to a registered hook, if any (tests, embedders);
//     - otherwise appended as one JSON line to $DEADBOLT_EVENT_LOG, if set.
//
//   Events carry identifiers and digests only, never tool stdout/stderr; raw
//   evidence lives in the artifact store.
//
// Invariant: event emission never fails the caller. A sink that cannot be
// opened is skipped and counted in EngineStats::event_sink_failures.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "deadbolt/types.hpp"

namespace deadbolt {

enum class RunEventType {
  run_started,
  run_finished,
  phase_started,
  phase_finished,
  invocation_started,
  invocation_finished,
  cache_hit,
  resume_inconsistency,
  normalization_failed,
};

std::string to_string(RunEventType t);

struct RunEvent {
  RunEventType type{RunEventType::run_started};
  std::string run_id;
  std::string phase;
  std::string tool;
  std::string fingerprint;
  std::string status;          // invocation or run status, where applicable
  ErrorCode error{ErrorCode::none};
  std::string detail;
  uint64_t duration_ns{0};     // sandbox wall-clock for invocation_finished
  size_t bytes_stdout{0};
  size_t bytes_stderr{0};
  size_t artifacts{0};         // artifacts registered by this step
};

// Compact single-line JSON (NDJSON sink format).
std::string run_event_to_json(const RunEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 40;  // up to ~6 days; tool runs are long

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds. p in [0.0, 1.0].
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats — process-wide aggregated counters. Thread-safe.
// ---------------------------------------------------------------------------
// Exposed via `deadbolt health`.
class EngineStats {
 public:
  void record(const RunEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> runs_started{0};
  std::atomic<uint64_t> runs_failed{0};
  std::atomic<uint64_t> sandbox_executions{0};
  std::atomic<uint64_t> invocations_succeeded{0};
  std::atomic<uint64_t> invocations_failed{0};
  std::atomic<uint64_t> invocation_timeouts{0};
  std::atomic<uint64_t> cache_hits{0};
  std::atomic<uint64_t> resume_inconsistencies{0};
  std::atomic<uint64_t> normalization_failures{0};
  std::atomic<uint64_t> event_sink_failures{0};

  LatencyHistogram sandbox_latency;
};

EngineStats& global_engine_stats();

// Emit a run event (non-blocking apart from the optional file append).
void emit_run_event(const RunEvent& ev);

using RunEventHook = void (*)(const RunEvent&);
void set_run_event_hook(RunEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace deadbolt
