#include "deadbolt/audit.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>

#include "deadbolt/hash.hpp"
#include "deadbolt/jsonlite.hpp"
#include "deadbolt/version.hpp"

namespace deadbolt {

namespace {

const std::string kGenesisDigest(64, '0');

}  // namespace

std::string transition_to_json(const TransitionRecord& r) {
  jsonlite::Object o;
  o["v"] = jsonlite::Value{static_cast<std::uint64_t>(version::TRANSITION_LOG_VERSION)};
  o["seq"] = jsonlite::Value{static_cast<std::uint64_t>(r.sequence)};
  o["prev"] = jsonlite::Value{r.previous_digest};
  o["run_id"] = jsonlite::Value{r.run_id};
  o["scope"] = jsonlite::Value{r.scope};
  if (!r.phase.empty()) o["phase"] = jsonlite::Value{r.phase};
  if (!r.tool.empty()) o["tool"] = jsonlite::Value{r.tool};
  if (!r.fingerprint.empty()) o["fingerprint"] = jsonlite::Value{r.fingerprint};
  if (r.attempt != 0) o["attempt"] = jsonlite::Value{static_cast<std::uint64_t>(r.attempt)};
  o["status"] = jsonlite::Value{r.status};
  if (!r.error_code.empty()) o["error_code"] = jsonlite::Value{r.error_code};
  if (!r.detail.empty()) o["detail"] = jsonlite::Value{r.detail};
  o["ts_ms"] = jsonlite::Value{static_cast<std::uint64_t>(r.timestamp_unix_ms)};
  return jsonlite::to_json(o);
}

struct TransitionLogImpl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
};

TransitionLog::TransitionLog(const std::string& path)
    : path_(path), impl_(std::make_unique<TransitionLogImpl>()) {
  // Resume the chain from the last intact line; a torn trailing line from a
  // crash is ignored and the next entry chains past it.
  std::ifstream ifs(path_);
  std::string line;
  while (std::getline(ifs, line)) {
    std::optional<jsonlite::JsonError> err;
    auto o = jsonlite::parse(line, &err);
    if (err) continue;
    impl_->seq = jsonlite::get_u64(o, "seq", impl_->seq);
    impl_->last_digest = blake3_hex(line);
  }
  ifs.close();
  impl_->file = std::fopen(path_.c_str(), "a");
}

TransitionLog::~TransitionLog() {
  if (impl_->file) std::fclose(impl_->file);
}

bool TransitionLog::ok() const {
  return impl_->file != nullptr;
}

bool TransitionLog::append(TransitionRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence = impl_->seq + 1;
  record.previous_digest = impl_->last_digest;
  using SC = std::chrono::system_clock;
  record.timestamp_unix_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());

  const std::string line = transition_to_json(record);
  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size() &&
      std::fflush(impl_->file) == 0;
  if (!written) {
    ++impl_->failure_count;
    return false;
  }
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos >= 0 && post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    ++impl_->failure_count;
    return false;
  }

  impl_->seq = record.sequence;
  impl_->last_digest = blake3_hex(line);
  ++impl_->entry_count;
  return true;
}

uint64_t TransitionLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t TransitionLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

ChainCheck verify_transition_log(const std::string& path) {
  ChainCheck c;
  std::ifstream ifs(path);
  if (!ifs) {
    c.error = "cannot open " + path;
    return c;
  }
  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 1;
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    const std::string where = "entry " + std::to_string(c.entries + 1);
    std::optional<jsonlite::JsonError> err;
    auto o = jsonlite::parse(line, &err);
    if (err) {
      c.error = where + ": " + err->message;
      return c;
    }
    if (jsonlite::get_u64(o, "seq") != expected_seq) {
      c.error = where + ": sequence gap";
      return c;
    }
    if (jsonlite::get_string(o, "prev") != expected_prev) {
      c.error = where + ": previous digest mismatch";
      return c;
    }
    expected_prev = blake3_hex(line);
    ++expected_seq;
    ++c.entries;
  }
  c.ok = true;
  return c;
}

}  // namespace deadbolt
