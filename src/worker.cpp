#include "deadbolt/worker.hpp"

#include <unistd.h>  // getpid, gethostname

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <thread>
#include <vector>

#include "deadbolt/jsonlite.hpp"
#include "deadbolt/version.hpp"

namespace deadbolt {

namespace {

WorkerIdentity g_worker_identity;
std::mutex g_init_mu;
bool g_initialized{false};

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0) return buf;
  return "unknown-host";
}

std::string make_default_worker_id() {
  return "w-" + std::to_string(static_cast<long>(::getpid()));
}

std::string from_env_or(const char* key, std::string fallback) {
  const char* e = std::getenv(key);
  return (e && e[0]) ? std::string(e) : fallback;
}

}  // namespace

WorkerIdentity init_worker_identity(const std::string& worker_id, const std::string& node_id) {
  std::lock_guard<std::mutex> lk(g_init_mu);
  g_worker_identity.worker_id =
      worker_id.empty() ? from_env_or("DEADBOLT_WORKER_ID", make_default_worker_id()) : worker_id;
  g_worker_identity.node_id =
      node_id.empty() ? from_env_or("DEADBOLT_NODE_ID", get_hostname()) : node_id;
  g_worker_identity.engine_semver = version::ENGINE_SEMVER;
  g_initialized = true;
  return g_worker_identity;
}

const WorkerIdentity& global_worker_identity() {
  {
    std::lock_guard<std::mutex> lk(g_init_mu);
    if (g_initialized) return g_worker_identity;
  }
  init_worker_identity();
  return g_worker_identity;
}

std::string worker_identity_to_json(const WorkerIdentity& w) {
  jsonlite::Object o;
  o["worker_id"] = jsonlite::Value{w.worker_id};
  o["node_id"] = jsonlite::Value{w.node_id};
  o["engine_semver"] = jsonlite::Value{w.engine_semver};
  return jsonlite::to_json(o);
}

void run_bounded(std::size_t jobs, std::size_t max_workers,
                 const std::function<void(std::size_t)>& job) {
  if (jobs == 0) return;
  const std::size_t n = std::max<std::size_t>(1, std::min(max_workers, jobs));
  std::atomic<std::size_t> next_job{0};

  std::vector<std::thread> workers;
  workers.reserve(n);
  for (std::size_t w = 0; w < n; ++w) {
    workers.emplace_back([&]() {
      for (;;) {
        const std::size_t idx = next_job.fetch_add(1);
        if (idx >= jobs) break;
        job(idx);
      }
    });
  }
  for (auto& t : workers) t.join();
}

}  // namespace deadbolt
