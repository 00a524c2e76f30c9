#include "deadbolt/normalize.hpp"

#include <algorithm>
#include <cctype>

#include "deadbolt/hash.hpp"
#include "deadbolt/scope.hpp"

namespace deadbolt {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// Non-empty trimmed lines.
std::vector<std::string_view> lines_of(std::string_view raw) {
  std::vector<std::string_view> out;
  while (!raw.empty()) {
    const size_t nl = raw.find('\n');
    std::string_view line = raw.substr(0, nl);
    raw = nl == std::string_view::npos ? std::string_view{} : raw.substr(nl + 1);
    line = trim(line);
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

bool has_scheme_and_host(std::string_view url) {
  const size_t p = url.find("://");
  if (p == std::string_view::npos || p == 0) return false;
  for (char c : url.substr(0, p)) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') return false;
  }
  return !extract_host(url).empty();
}

const jsonlite::Object* as_object(const jsonlite::Value& v) {
  return std::get_if<jsonlite::Object>(&v.v);
}

// Copies the listed keys from `src` into `dst` when present and non-null.
void copy_keys(const jsonlite::Object& src, std::initializer_list<const char*> keys,
               jsonlite::Object& dst) {
  for (const char* k : keys) {
    auto it = src.find(k);
    if (it != src.end() && !std::holds_alternative<std::nullptr_t>(it->second.v)) {
      dst[k] = it->second;
    }
  }
}

// Parses JSONL into objects. Blank lines are skipped; anything else that is
// not a JSON object is a parse failure.
bool parse_jsonl(std::string_view raw, std::vector<jsonlite::Object>& out, std::string& error) {
  size_t lineno = 0;
  for (auto line : lines_of(raw)) {
    ++lineno;
    std::optional<jsonlite::JsonError> err;
    auto v = jsonlite::parse_value(std::string(line), &err);
    const auto* o = as_object(v);
    if (err || !o) {
      error = "record " + std::to_string(lineno) + ": " +
              (err ? err->message : std::string("not a JSON object"));
      return false;
    }
    out.push_back(*o);
  }
  return true;
}

Finding record(ArtifactKind kind, std::string target, std::string title, std::string category) {
  Finding f;
  f.kind = kind;
  f.target = std::move(target);
  f.title = std::move(title);
  f.category = std::move(category);
  return f;
}

// ---------------------------------------------------------------------------
// One value per line: hosts (asset) or URLs / component names (path).
// ---------------------------------------------------------------------------
class LinesParser : public IToolParser {
 public:
  enum class Mode { hosts, urls, names };

  LinesParser(ArtifactKind kind, Mode mode, std::string fallback_title)
      : kind_(kind), mode_(mode), fallback_title_(std::move(fallback_title)) {}

  ParseResult parse(const std::string& tool, std::string_view raw,
                    const NormalizeContext&) const override {
    ParseResult r;
    const std::string title = title_for(tool);
    for (auto line : lines_of(raw)) {
      if (line.front() == '#') continue;
      std::string value;
      switch (mode_) {
        case Mode::hosts:
          value = extract_host(line.substr(0, line.find_first_of(" \t")));
          break;
        case Mode::urls:
          if (has_scheme_and_host(line)) value = std::string(line);
          break;
        case Mode::names:
          value = std::string(line);
          break;
      }
      if (value.empty()) continue;
      r.records.push_back(record(kind_, std::move(value), title,
                                 kind_ == ArtifactKind::asset ? "attack_surface" : "endpoint"));
    }
    return r;
  }

 private:
  std::string title_for(const std::string& tool) const {
    static const std::map<std::string, std::string> kTitles = {
        {"subfinder", "Discovered subdomain"},
        {"dnsx", "Resolvable domain"},
        {"gau", "Historical URL"},
        {"waybackurls", "Archived URL"},
        {"katana", "Discovered URL"},
        {"hakrawler", "Discovered path (hakrawler)"},
        {"paramspider", "Discovered parameter (paramspider)"},
        {"jadx", "Hardcoded URL in Android APK"},
        {"apktool", "Declared manifest component"},
    };
    auto it = kTitles.find(tool);
    return it == kTitles.end() ? fallback_title_ : it->second;
  }

  ArtifactKind kind_;
  Mode mode_;
  std::string fallback_title_;
};

// ---------------------------------------------------------------------------
// httpx JSONL: one live HTTP service per line.
// ---------------------------------------------------------------------------
class HttpxParser : public IToolParser {
 public:
  explicit HttpxParser(ArtifactKind kind) : kind_(kind) {}

  ParseResult parse(const std::string&, std::string_view raw,
                    const NormalizeContext&) const override {
    ParseResult r;
    std::vector<jsonlite::Object> rows;
    if (!parse_jsonl(raw, rows, r.error)) {
      r.ok = false;
      return r;
    }
    for (const auto& row : rows) {
      const std::string url = jsonlite::get_string(row, "url");
      if (url.empty()) continue;
      std::string title = jsonlite::get_string(row, "title");
      if (title.empty()) title = "Live HTTP Service";
      Finding f = record(kind_, url, std::move(title), "http_service");
      jsonlite::Object ev;
      copy_keys(row, {"status_code", "tech", "webserver", "cdn", "cdn_name"}, ev);
      f.evidence_json = jsonlite::to_json(ev);
      r.records.push_back(std::move(f));
    }
    return r;
  }

 private:
  ArtifactKind kind_;
};

// ---------------------------------------------------------------------------
// nuclei JSONL: one line per template match. Repeated (host, template) pairs
// are merged by the Normalizer.
// ---------------------------------------------------------------------------
class NucleiParser : public IToolParser {
 public:
  ParseResult parse(const std::string&, std::string_view raw,
                    const NormalizeContext&) const override {
    ParseResult r;
    std::vector<jsonlite::Object> rows;
    if (!parse_jsonl(raw, rows, r.error)) {
      r.ok = false;
      return r;
    }
    for (const auto& row : rows) {
      std::string asset = jsonlite::get_string(row, "host");
      if (asset.empty()) asset = jsonlite::get_string(row, "matched");
      if (asset.empty()) asset = jsonlite::get_string(row, "matched-at");
      if (asset.empty()) asset = jsonlite::get_string(row, "url");
      const std::string template_id = jsonlite::get_string(row, "template-id");
      if (asset.empty() || template_id.empty()) continue;

      std::string title = "Nuclei Finding";
      std::string severity = "info";
      if (const auto* info = jsonlite::get_object(row, "info")) {
        title = jsonlite::get_string(*info, "name", title);
        severity = jsonlite::get_string(*info, "severity", severity);
      }
      Finding f = record(ArtifactKind::finding, asset, std::move(title), "vulnerability");
      f.severity = severity_from_label(severity);
      f.rule_id = template_id;
      jsonlite::Object ev;
      copy_keys(row, {"matcher-name", "type", "matched-at"}, ev);
      f.evidence_json = jsonlite::to_json(ev);
      r.records.push_back(std::move(f));
    }
    return r;
  }
};

// ---------------------------------------------------------------------------
// ffuf JSON report: {"results": [{"url": ..., "status": ...}, ...]}.
// ---------------------------------------------------------------------------
class FfufParser : public IToolParser {
 public:
  ParseResult parse(const std::string&, std::string_view raw,
                    const NormalizeContext&) const override {
    ParseResult r;
    if (trim(raw).empty()) return r;  // no hits: ffuf writes nothing
    std::optional<jsonlite::JsonError> err;
    auto doc = jsonlite::parse(std::string(raw), &err);
    if (err) {
      r.ok = false;
      r.error = err->message;
      return r;
    }
    const auto* results = jsonlite::get_array(doc, "results");
    if (!results) return r;
    for (const auto& item : *results) {
      const auto* o = as_object(item);
      if (!o) continue;
      const std::string url = jsonlite::get_string(*o, "url");
      if (url.empty()) continue;
      Finding f = record(ArtifactKind::path, url, "Discovered endpoint (ffuf)", "endpoint");
      jsonlite::Object ev;
      copy_keys(*o, {"status", "length", "words"}, ev);
      f.evidence_json = jsonlite::to_json(ev);
      r.records.push_back(std::move(f));
    }
    return r;
  }
};

// ---------------------------------------------------------------------------
// graphql-cop: "<endpoint> :: <detail>" per line.
// ---------------------------------------------------------------------------
class GraphqlCopParser : public IToolParser {
 public:
  ParseResult parse(const std::string&, std::string_view raw,
                    const NormalizeContext&) const override {
    ParseResult r;
    for (auto line : lines_of(raw)) {
      const size_t sep = line.find("::");
      if (sep == std::string_view::npos) continue;
      const std::string endpoint(trim(line.substr(0, sep)));
      const std::string detail(trim(line.substr(sep + 2)));
      if (endpoint.empty()) continue;
      Finding f = record(ArtifactKind::path, endpoint, "GraphQL exposure: " + detail, "graphql");
      f.evidence_json = R"({"technologies":["graphql"]})";
      r.records.push_back(std::move(f));
    }
    return r;
  }
};

// ---------------------------------------------------------------------------
// MobSF JSON report (Android and iOS).
// ---------------------------------------------------------------------------
class MobsfParser : public IToolParser {
 public:
  ParseResult parse(const std::string&, std::string_view raw,
                    const NormalizeContext& ctx) const override {
    ParseResult r;
    std::optional<jsonlite::JsonError> err;
    auto doc = jsonlite::parse(std::string(raw), &err);
    if (err) {
      r.ok = false;
      r.error = trim(raw).empty() ? "empty report" : err->message;
      return r;
    }

    std::string asset;
    for (const char* key : {"package_name", "bundle_id", "app_name", "file_name"}) {
      asset = jsonlite::get_string(doc, key);
      if (!asset.empty()) break;
    }
    if (asset.empty()) asset = ctx.subject.empty() ? "application" : ctx.subject;

    auto add = [&](std::string title, std::string category, const std::string& sev,
                   std::string rule, std::uint64_t occurrences, jsonlite::Object ev) {
      Finding f = record(ArtifactKind::finding, asset, std::move(title), std::move(category));
      f.severity = severity_from_label(sev);
      f.rule_id = std::move(rule);
      f.occurrences = occurrences == 0 ? 1 : occurrences;
      f.evidence_json = jsonlite::to_json(ev);
      r.records.push_back(std::move(f));
    };

    if (const auto* manifest = jsonlite::get_object(doc, "manifest_analysis")) {
      if (const auto* items = jsonlite::get_array(*manifest, "manifest_findings")) {
        for (const auto& item : *items) {
          const auto* o = as_object(item);
          if (!o) continue;
          jsonlite::Object ev;
          copy_keys(*o, {"description", "component"}, ev);
          add(jsonlite::get_string(*o, "title", "Manifest Issue"), "manifest",
              jsonlite::get_string(*o, "severity"), jsonlite::get_string(*o, "rule"), 1,
              std::move(ev));
        }
      }
    }

    if (const auto* code = jsonlite::get_object(doc, "code_analysis")) {
      if (const auto* rules = jsonlite::get_object(*code, "findings")) {
        for (const auto& [rule_id, block] : *rules) {
          const auto* b = as_object(block);
          if (!b) continue;
          jsonlite::Object meta_empty;
          const auto* meta = jsonlite::get_object(*b, "metadata");
          if (!meta) meta = &meta_empty;
          const auto* files = jsonlite::get_object(*b, "files");
          jsonlite::Object ev;
          copy_keys(*meta, {"cwe", "owasp-mobile", "masvs", "cvss", "ref"}, ev);
          if (files) ev["files"] = jsonlite::Value{*files};
          add(jsonlite::get_string(*meta, "description", rule_id), "code",
              jsonlite::get_string(*meta, "severity"), rule_id, files ? files->size() : 1,
              std::move(ev));
        }
      }
    }

    if (const auto* network = jsonlite::get_object(doc, "network_security")) {
      if (const auto* items = jsonlite::get_array(*network, "network_findings")) {
        for (const auto& item : *items) {
          const auto* o = as_object(item);
          if (!o) continue;
          jsonlite::Object ev;
          copy_keys(*o, {"description", "scope"}, ev);
          add("Network Security Issue", "network", jsonlite::get_string(*o, "severity"), "", 1,
              std::move(ev));
        }
      }
    }

    if (const auto* certs = jsonlite::get_object(doc, "certificate_analysis")) {
      if (const auto* items = jsonlite::get_array(*certs, "certificate_findings")) {
        for (const auto& item : *items) {
          const auto* triple = std::get_if<jsonlite::Array>(&item.v);
          if (!triple || triple->size() < 3) continue;
          jsonlite::Object ev;
          ev["description"] = (*triple)[1];
          add(jsonlite::scalar_text((*triple)[2]), "certificate",
              jsonlite::scalar_text((*triple)[0]), "", 1, std::move(ev));
        }
      }
    }
    return r;
  }
};

// ---------------------------------------------------------------------------
// Generic findings JSONL: {"asset", "title", "severity", "rule", "category",
// "evidence"} per line. Used by wrapper scripts that pre-digest tool output.
// ---------------------------------------------------------------------------
class FindingsJsonlParser : public IToolParser {
 public:
  ParseResult parse(const std::string&, std::string_view raw,
                    const NormalizeContext& ctx) const override {
    ParseResult r;
    std::vector<jsonlite::Object> rows;
    if (!parse_jsonl(raw, rows, r.error)) {
      r.ok = false;
      return r;
    }
    for (const auto& row : rows) {
      const std::string title = jsonlite::get_string(row, "title");
      if (title.empty()) continue;
      std::string asset = jsonlite::get_string(row, "asset");
      if (asset.empty()) asset = ctx.subject.empty() ? "application" : ctx.subject;
      Finding f = record(ArtifactKind::finding, std::move(asset), title,
                         jsonlite::get_string(row, "category", "static_analysis"));
      f.severity = severity_from_label(jsonlite::get_string(row, "severity"));
      f.rule_id = jsonlite::get_string(row, "rule");
      if (const auto* ev = jsonlite::get_object(row, "evidence")) f.evidence_json = jsonlite::to_json(*ev);
      r.records.push_back(std::move(f));
    }
    return r;
  }
};

}  // namespace

Normalizer::Normalizer() {
  using K = ArtifactKind;
  using M = LinesParser::Mode;
  register_parser("lines_asset", std::make_unique<LinesParser>(K::asset, M::hosts, "Discovered host"));
  register_parser("lines_path", std::make_unique<LinesParser>(K::path, M::urls, "Discovered URL"));
  register_parser("lines_component",
                  std::make_unique<LinesParser>(K::path, M::names, "Discovered component"));
  register_parser("httpx", std::make_unique<HttpxParser>(K::asset));
  register_parser("httpx_paths", std::make_unique<HttpxParser>(K::path));
  register_parser("nuclei", std::make_unique<NucleiParser>());
  register_parser("ffuf", std::make_unique<FfufParser>());
  register_parser("graphql_cop", std::make_unique<GraphqlCopParser>());
  register_parser("mobsf", std::make_unique<MobsfParser>());
  register_parser("findings_jsonl", std::make_unique<FindingsJsonlParser>());
}

void Normalizer::register_parser(const std::string& name, std::unique_ptr<IToolParser> parser) {
  parsers_[name] = std::move(parser);
}

bool Normalizer::has_parser(const std::string& name) const {
  return parsers_.contains(name);
}

NormalizeResult Normalizer::normalize(const std::string& tool, std::string_view raw) const {
  return normalize(tool, raw, NormalizeContext{});
}

NormalizeResult Normalizer::normalize(const std::string& tool, std::string_view raw,
                                      const NormalizeContext& ctx) const {
  NormalizeResult out;
  const std::string key = ctx.parser.empty() ? tool : ctx.parser;
  auto it = parsers_.find(key);
  if (it == parsers_.end()) {
    out.error = ErrorCode::normalization_error;
    out.detail = "no parser registered as '" + key + "'";
    return out;
  }

  ParseResult parsed = it->second->parse(tool, raw, ctx);
  if (!parsed.ok) {
    out.error = ErrorCode::normalization_error;
    out.detail = key + ": " + parsed.error;
    return out;
  }

  std::map<std::string, Finding> merged;
  for (auto& f : parsed.records) {
    std::optional<jsonlite::JsonError> err;
    f.evidence_json = jsonlite::canonicalize_json(f.evidence_json.empty() ? "{}" : f.evidence_json, &err);
    if (err) {
      out.error = ErrorCode::normalization_error;
      out.detail = key + ": evidence is not valid JSON: " + err->message;
      return out;
    }
    f.tool = tool;
    f.source_artifact = ctx.source_artifact;
    f.invocation = ctx.invocation;
    f.discovered_at = ctx.discovered_at;
    if (f.occurrences == 0) f.occurrences = 1;
    f.id = compute_finding_id(f);

    auto [slot, inserted] = merged.emplace(f.id, f);
    if (inserted) continue;
    Finding& existing = slot->second;
    existing.occurrences += f.occurrences;
    if (f.severity > existing.severity) {
      existing.severity = f.severity;
      existing.title = f.title;
    }
  }

  out.findings.reserve(merged.size());
  for (auto& [_, f] : merged) out.findings.push_back(std::move(f));
  out.ok = true;
  return out;
}

std::string finding_identity(const Finding& f) {
  std::string s = f.tool + "\n" + to_string(f.kind) + "\n" + f.target + "\n" + f.rule_id;
  if (f.rule_id.empty()) s += "\n" + f.title + "\n" + f.evidence_json;
  return s;
}

std::string compute_finding_id(const Finding& f) {
  return hash_domain("fnd:", finding_identity(f));
}

jsonlite::Object finding_to_json(const Finding& f) {
  jsonlite::Object o;
  o["id"] = jsonlite::Value{f.id};
  o["kind"] = jsonlite::Value{to_string(f.kind)};
  o["tool"] = jsonlite::Value{f.tool};
  o["target"] = jsonlite::Value{f.target};
  o["title"] = jsonlite::Value{f.title};
  o["category"] = jsonlite::Value{f.category};
  o["severity"] = jsonlite::Value{to_string(f.severity)};
  o["rule_id"] = jsonlite::Value{f.rule_id};
  o["occurrences"] = jsonlite::Value{static_cast<std::uint64_t>(f.occurrences)};
  o["evidence"] = jsonlite::parse_value(f.evidence_json, nullptr);
  o["discovered_at"] = jsonlite::Value{f.discovered_at};
  o["source_artifact"] = jsonlite::Value{f.source_artifact};
  o["invocation"] = jsonlite::Value{f.invocation};
  return o;
}

std::optional<Finding> finding_from_json(const jsonlite::Object& o) {
  auto kind = artifact_kind_from_string(jsonlite::get_string(o, "kind"));
  if (!kind) return std::nullopt;
  Finding f;
  f.id = jsonlite::get_string(o, "id");
  f.kind = *kind;
  f.tool = jsonlite::get_string(o, "tool");
  f.target = jsonlite::get_string(o, "target");
  f.title = jsonlite::get_string(o, "title");
  f.category = jsonlite::get_string(o, "category");
  f.severity = severity_from_label(jsonlite::get_string(o, "severity"));
  f.rule_id = jsonlite::get_string(o, "rule_id");
  f.occurrences = jsonlite::get_u64(o, "occurrences", 1);
  auto ev = o.find("evidence");
  f.evidence_json = ev == o.end() ? "{}" : jsonlite::to_json(ev->second);
  f.discovered_at = jsonlite::get_string(o, "discovered_at");
  f.source_artifact = jsonlite::get_string(o, "source_artifact");
  f.invocation = jsonlite::get_string(o, "invocation");
  return f;
}

std::string finding_artifact_content(const Finding& f) {
  auto o = finding_to_json(f);
  o.erase("discovered_at");
  return jsonlite::to_json(o);
}

}  // namespace deadbolt
