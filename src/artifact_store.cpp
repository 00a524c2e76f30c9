#include "deadbolt/artifact_store.hpp"

#include <fstream>

#include "deadbolt/hash.hpp"
#include "deadbolt/jsonlite.hpp"

namespace deadbolt {

std::string compute_artifact_hash(const Artifact& a) {
  std::string payload;
  payload.reserve(a.value.size() + a.content.size() + a.producer.size() + 16);
  payload += to_string(a.kind);
  payload += '\n';
  payload += a.value;
  payload += '\n';
  payload += a.content;
  payload += '\n';
  payload += a.producer;
  return hash_domain("art:", payload);
}

Artifact make_artifact(ArtifactKind kind, std::string value, std::string content,
                       std::string producer) {
  Artifact a;
  a.kind = kind;
  a.value = std::move(value);
  a.content = std::move(content);
  a.producer = std::move(producer);
  a.hash = compute_artifact_hash(a);
  return a;
}

std::string artifact_to_json(const Artifact& a) {
  jsonlite::Object o;
  o["hash"] = jsonlite::Value{a.hash};
  o["kind"] = jsonlite::Value{to_string(a.kind)};
  o["value"] = jsonlite::Value{a.value};
  o["content"] = jsonlite::Value{a.content};
  o["producer"] = jsonlite::Value{a.producer};
  if (!a.file_path.empty()) o["file_path"] = jsonlite::Value{a.file_path};
  return jsonlite::to_json(o);
}

std::optional<Artifact> artifact_from_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(text, &err);
  if (err) return std::nullopt;
  auto kind = artifact_kind_from_string(jsonlite::get_string(o, "kind"));
  if (!kind) return std::nullopt;
  Artifact a;
  a.hash = jsonlite::get_string(o, "hash");
  a.kind = *kind;
  a.value = jsonlite::get_string(o, "value");
  a.content = jsonlite::get_string(o, "content");
  a.producer = jsonlite::get_string(o, "producer");
  a.file_path = jsonlite::get_string(o, "file_path");
  return a;
}

ArtifactStore::ArtifactStore(std::shared_ptr<ICASBackend> blobs, std::string index_path,
                             bool compress)
    : blobs_(std::move(blobs)), index_path_(std::move(index_path)), compress_(compress) {
  load_index();
}

void ArtifactStore::load_index() {
  std::lock_guard<std::mutex> lk(mu_);
  std::ifstream ifs(index_path_);
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    auto o = jsonlite::parse(line, &err);
    if (err) continue;  // torn trailing append
    const auto hash = jsonlite::get_string(o, "hash");
    const auto blob = jsonlite::get_string(o, "blob");
    if (!hash.empty() && !blob.empty()) index_[hash] = blob;
  }
}

StoreResult ArtifactStore::put(const Artifact& a) {
  StoreResult r;
  Artifact stamped = a;
  stamped.hash = compute_artifact_hash(a);
  if (!a.hash.empty() && a.hash != stamped.hash) {
    r.error = ErrorCode::artifact_store_io;
    r.detail = "artifact hash does not match its content";
    return r;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(stamped.hash);
    if (it != index_.end() && blobs_->contains(it->second)) {
      r.ok = true;
      r.hash = stamped.hash;
      return r;
    }
  }

  const std::string blob = blobs_->put(artifact_to_json(stamped), compress_ ? "zstd" : "off");
  if (blob.empty()) {
    r.error = ErrorCode::artifact_store_io;
    r.detail = "blob write failed for artifact " + stamped.hash;
    return r;
  }

  std::lock_guard<std::mutex> lk(mu_);
  if (!index_.contains(stamped.hash)) {
    jsonlite::Object line;
    line["hash"] = jsonlite::Value{stamped.hash};
    line["blob"] = jsonlite::Value{blob};
    line["kind"] = jsonlite::Value{to_string(stamped.kind)};
    const std::string text = jsonlite::to_json(line) + "\n";
    std::ofstream ofs(index_path_, std::ios::binary | std::ios::app);
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
    ofs.flush();
    if (!ofs) {
      r.error = ErrorCode::artifact_store_io;
      r.detail = "index append failed: " + index_path_;
      return r;
    }
    index_[stamped.hash] = blob;
  }
  r.ok = true;
  r.hash = stamped.hash;
  return r;
}

std::optional<Artifact> ArtifactStore::get(const std::string& hash) const {
  std::string blob;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(hash);
    if (it == index_.end()) return std::nullopt;
    blob = it->second;
  }
  auto text = blobs_->get(blob);
  if (!text) return std::nullopt;
  auto a = artifact_from_json(*text);
  if (!a || a->hash != hash || compute_artifact_hash(*a) != hash) return std::nullopt;
  return a;
}

bool ArtifactStore::contains(const std::string& hash) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = index_.find(hash);
  return it != index_.end() && blobs_->contains(it->second);
}

StoreResult ArtifactStore::put_blob(const std::string& data) {
  StoreResult r;
  r.hash = blobs_->put(data, compress_ ? "zstd" : "off");
  if (r.hash.empty()) {
    r.error = ErrorCode::artifact_store_io;
    r.detail = "raw output write failed";
    return r;
  }
  r.ok = true;
  return r;
}

std::optional<std::string> ArtifactStore::get_blob(const std::string& digest) const {
  return blobs_->get(digest);
}

bool ArtifactStore::contains_blob(const std::string& digest) const {
  return blobs_->contains(digest);
}

std::size_t ArtifactStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return index_.size();
}

}  // namespace deadbolt
