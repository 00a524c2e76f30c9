#include "deadbolt/resume.hpp"

#include <filesystem>
#include <fstream>

#include "deadbolt/artifact_store.hpp"
#include "deadbolt/hash.hpp"
#include "deadbolt/jsonlite.hpp"
#include "deadbolt/registry.hpp"
#include "deadbolt/version.hpp"

namespace fs = std::filesystem;

namespace deadbolt {

std::string compute_fingerprint(const ToolDescriptor& tool,
                                const std::vector<std::string>& input_hashes) {
  std::string payload = "v" + std::to_string(version::HASH_ALGORITHM_VERSION);
  payload += '\n';
  payload += descriptor_identity(tool);
  payload += '\n';
  payload += tool.version;
  payload += '\n';
  payload += combination_hash(input_hashes);
  return hash_domain("inv:", payload);
}

std::string cached_result_to_json(const CachedResult& r) {
  jsonlite::Object o;
  o["fingerprint"] = jsonlite::Value{r.fingerprint};
  o["tool"] = jsonlite::Value{r.tool};
  o["run_id"] = jsonlite::Value{r.run_id};
  o["raw_output"] = jsonlite::Value{r.raw_output};
  o["raw_stderr"] = jsonlite::Value{r.raw_stderr};
  jsonlite::Array arts;
  for (const auto& h : r.output_artifacts) arts.push_back(jsonlite::Value{h});
  o["output_artifacts"] = jsonlite::Value{std::move(arts)};
  o["exit_code"] = jsonlite::Value{static_cast<std::uint64_t>(r.exit_code < 0 ? 0 : r.exit_code)};
  o["finished_at"] = jsonlite::Value{r.finished_at};
  return jsonlite::to_json(o);
}

std::optional<CachedResult> cached_result_from_json(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(line, &err);
  if (err) return std::nullopt;
  CachedResult r;
  r.fingerprint = jsonlite::get_string(o, "fingerprint");
  if (r.fingerprint.empty()) return std::nullopt;
  r.tool = jsonlite::get_string(o, "tool");
  r.run_id = jsonlite::get_string(o, "run_id");
  r.raw_output = jsonlite::get_string(o, "raw_output");
  r.raw_stderr = jsonlite::get_string(o, "raw_stderr");
  r.output_artifacts = jsonlite::get_string_array(o, "output_artifacts");
  r.exit_code = static_cast<int>(jsonlite::get_u64(o, "exit_code"));
  r.finished_at = jsonlite::get_string(o, "finished_at");
  return r;
}

ResumeCache::ResumeCache(std::string index_path) : index_path_(std::move(index_path)) {
  std::ifstream ifs(index_path_);
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    auto r = cached_result_from_json(line);
    if (!r) continue;  // torn trailing append
    entries_[r->fingerprint] = std::move(*r);
  }
}

std::optional<CachedResult> ResumeCache::lookup(const std::string& fingerprint) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(fingerprint);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

CacheLookup ResumeCache::lookup_verified(const std::string& fingerprint,
                                         const ArtifactStore& store) const {
  CacheLookup out;
  out.result = lookup(fingerprint);
  if (!out.result) return out;

  if (!out.result->raw_output.empty() && !store.contains_blob(out.result->raw_output)) {
    out.verdict = CacheVerdict::inconsistent;
    out.detail = "raw output " + out.result->raw_output + " is missing";
    return out;
  }
  for (const auto& h : out.result->output_artifacts) {
    if (!store.get(h)) {
      out.verdict = CacheVerdict::inconsistent;
      out.detail = "artifact " + h + " is missing or corrupt";
      return out;
    }
  }
  out.verdict = CacheVerdict::hit;
  return out;
}

bool ResumeCache::record(const CachedResult& result) {
  std::lock_guard<std::mutex> lk(mu_);
  if (auto it = entries_.find(result.fingerprint);
      it != entries_.end() && it->second.raw_output == result.raw_output &&
      it->second.output_artifacts == result.output_artifacts) {
    return true;
  }

  std::error_code ec;
  const fs::path parent = fs::path(index_path_).parent_path();
  if (!parent.empty()) fs::create_directories(parent, ec);
  const std::string text = cached_result_to_json(result) + "\n";
  std::ofstream ofs(index_path_, std::ios::binary | std::ios::app);
  ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
  ofs.flush();
  if (!ofs) return false;
  entries_[result.fingerprint] = result;
  return true;
}

std::size_t ResumeCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

}  // namespace deadbolt
