#pragma once

// deadbolt/worker.hpp — Worker identity and bounded fan-out.
//
// WorkerIdentity is stamped into meta.json so a run directory records which
// process on which node produced it. It is resolved once per process:
//   1. Explicit parameters (if non-empty).
//   2. Environment: DEADBOLT_WORKER_ID, DEADBOLT_NODE_ID.
//   3. Defaults: worker_id = "w-<pid>", node_id = hostname.

#include <cstddef>
#include <functional>
#include <string>

namespace deadbolt {

struct WorkerIdentity {
  std::string worker_id;
  std::string node_id;
  std::string engine_semver;
};

WorkerIdentity init_worker_identity(const std::string& worker_id = "",
                                    const std::string& node_id = "");

// Returns the process-wide identity, initializing it from the environment on
// first use. Read-only after init.
const WorkerIdentity& global_worker_identity();

std::string worker_identity_to_json(const WorkerIdentity& w);

// Runs job(0) .. job(jobs - 1) on at most `max_workers` threads (at least one)
// and returns when every job has returned. Jobs are claimed in index order;
// completion order is unspecified. `job` must not throw.
void run_bounded(std::size_t jobs, std::size_t max_workers,
                 const std::function<void(std::size_t)>& job);

}  // namespace deadbolt
