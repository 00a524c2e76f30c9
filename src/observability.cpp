#include "deadbolt/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "deadbolt/jsonlite.hpp"

namespace deadbolt {

namespace {

// bit_width gives floor(log2(x)) + 1 for x > 0 in one instruction.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<RunEventHook> g_event_hook{nullptr};

}  // namespace

std::string to_string(RunEventType t) {
  switch (t) {
    case RunEventType::run_started: return "run_started";
    case RunEventType::run_finished: return "run_finished";
    case RunEventType::phase_started: return "phase_started";
    case RunEventType::phase_finished: return "phase_finished";
    case RunEventType::invocation_started: return "invocation_started";
    case RunEventType::invocation_finished: return "invocation_finished";
    case RunEventType::cache_hit: return "cache_hit";
    case RunEventType::resume_inconsistency: return "resume_inconsistency";
    case RunEventType::normalization_failed: return "normalization_failed";
  }
  return "";
}

std::string run_event_to_json(const RunEvent& ev) {
  jsonlite::Object o;
  o["event"] = jsonlite::Value{to_string(ev.type)};
  o["ts"] = jsonlite::Value{utc_timestamp_now()};
  o["run_id"] = jsonlite::Value{ev.run_id};
  if (!ev.phase.empty()) o["phase"] = jsonlite::Value{ev.phase};
  if (!ev.tool.empty()) o["tool"] = jsonlite::Value{ev.tool};
  if (!ev.fingerprint.empty()) o["fingerprint"] = jsonlite::Value{ev.fingerprint};
  if (!ev.status.empty()) o["status"] = jsonlite::Value{ev.status};
  if (ev.error != ErrorCode::none) o["error"] = jsonlite::Value{to_string(ev.error)};
  if (!ev.detail.empty()) o["detail"] = jsonlite::Value{ev.detail};
  if (ev.duration_ns) o["duration_ns"] = jsonlite::Value{static_cast<std::uint64_t>(ev.duration_ns)};
  if (ev.bytes_stdout) o["bytes_stdout"] = jsonlite::Value{static_cast<std::uint64_t>(ev.bytes_stdout)};
  if (ev.bytes_stderr) o["bytes_stderr"] = jsonlite::Value{static_cast<std::uint64_t>(ev.bytes_stderr)};
  if (ev.artifacts) o["artifacts"] = jsonlite::Value{static_cast<std::uint64_t>(ev.artifacts)};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", mean_us() / 1000.0);
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.50) / 1000.0);
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.95) / 1000.0);
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.99) / 1000.0);
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record(const RunEvent& ev) {
  switch (ev.type) {
    case RunEventType::run_started:
      runs_started.fetch_add(1, std::memory_order_relaxed);
      break;
    case RunEventType::run_finished:
      if (ev.status == to_string(RunStatus::failed)) runs_failed.fetch_add(1, std::memory_order_relaxed);
      break;
    case RunEventType::invocation_finished:
      sandbox_executions.fetch_add(1, std::memory_order_relaxed);
      sandbox_latency.record(ev.duration_ns);
      if (ev.status == to_string(InvocationStatus::succeeded)) {
        invocations_succeeded.fetch_add(1, std::memory_order_relaxed);
      } else {
        invocations_failed.fetch_add(1, std::memory_order_relaxed);
      }
      if (ev.error == ErrorCode::sandbox_timeout) invocation_timeouts.fetch_add(1, std::memory_order_relaxed);
      break;
    case RunEventType::cache_hit:
      cache_hits.fetch_add(1, std::memory_order_relaxed);
      break;
    case RunEventType::resume_inconsistency:
      resume_inconsistencies.fetch_add(1, std::memory_order_relaxed);
      break;
    case RunEventType::normalization_failed:
      normalization_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case RunEventType::phase_started:
    case RunEventType::phase_finished:
    case RunEventType::invocation_started:
      break;
  }
}

std::string EngineStats::to_json() const {
  auto n = [](const std::atomic<uint64_t>& a) { return std::to_string(a.load(std::memory_order_relaxed)); };
  std::string out;
  out.reserve(512);
  out += "{\"runs\":{\"started\":" + n(runs_started) + ",\"failed\":" + n(runs_failed) + "}";
  out += ",\"invocations\":{\"sandbox_executions\":" + n(sandbox_executions) +
         ",\"succeeded\":" + n(invocations_succeeded) +
         ",\"failed\":" + n(invocations_failed) +
         ",\"timeouts\":" + n(invocation_timeouts) +
         ",\"cache_hits\":" + n(cache_hits) + "}";
  out += ",\"resume_inconsistencies\":" + n(resume_inconsistencies);
  out += ",\"normalization_failures\":" + n(normalization_failures);
  out += ",\"event_sink_failures\":" + n(event_sink_failures);
  out += ",\"sandbox_latency\":" + sandbox_latency.to_json();
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

void set_run_event_hook(RunEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_run_event(const RunEvent& ev) {
  global_engine_stats().record(ev);

  RunEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: DEADBOLT_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("DEADBOLT_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = run_event_to_json(ev) + "\n";
  // O_APPEND writes below PIPE_BUF are atomic on POSIX; concurrent workers
  // never interleave within a line.
  if (FILE* f = std::fopen(log_path, "a")) {
    if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) {
      global_engine_stats().event_sink_failures.fetch_add(1, std::memory_order_relaxed);
    }
    std::fclose(f);
  } else {
    global_engine_stats().event_sink_failures.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace deadbolt
