#include "deadbolt/registry.hpp"

#include <algorithm>
#include <set>

namespace deadbolt {

namespace {

ToolDescriptor tool(std::string name, std::string version, std::vector<ArtifactKind> consumes,
                    std::vector<ArtifactKind> produces, std::vector<std::string> args,
                    std::string output_file, std::string parser) {
  ToolDescriptor d;
  d.image = "deadbolt-" + name;
  d.name = std::move(name);
  d.version = std::move(version);
  d.consumes = std::move(consumes);
  d.produces = std::move(produces);
  d.args = std::move(args);
  d.output_file = std::move(output_file);
  d.parser = std::move(parser);
  return d;
}

jsonlite::Array kinds_to_json(const std::vector<ArtifactKind>& kinds) {
  jsonlite::Array out;
  for (auto k : kinds) out.push_back(jsonlite::Value{to_string(k)});
  return out;
}

bool kinds_from_json(const jsonlite::Object& o, const std::string& key,
                     std::vector<ArtifactKind>& out, std::string* error) {
  if (!o.contains(key)) return true;
  out.clear();
  for (const auto& s : jsonlite::get_string_array(o, key)) {
    auto k = artifact_kind_from_string(s);
    if (!k) {
      if (error) *error = "unknown artifact kind '" + s + "' in '" + key + "'";
      return false;
    }
    out.push_back(*k);
  }
  return true;
}

void add_builtin(ToolRegistry& r, ToolDescriptor d) {
  std::string err;
  (void)r.add(std::move(d), &err);  // built-ins are valid by construction
}

}  // namespace

bool ToolRegistry::add(ToolDescriptor d, std::string* error) {
  auto fail = [&](const std::string& msg) {
    if (error) *error = "tool '" + d.name + "': " + msg;
    return false;
  };
  if (d.name.empty()) return fail("name is required");
  if (d.version.empty()) return fail("version is required");
  if (d.consumes.empty()) return fail("consumes must name at least one artifact kind");
  if (d.produces.empty()) return fail("produces must name at least one artifact kind");
  if (d.image.empty() && d.entrypoint.empty()) return fail("either image or entrypoint is required");
  if (d.parser.empty()) return fail("parser is required");
  if (!d.stdin_kind.empty()) {
    auto k = artifact_kind_from_string(d.stdin_kind);
    if (!k || std::find(d.consumes.begin(), d.consumes.end(), *k) == d.consumes.end()) {
      return fail("stdin_kind must be one of the consumed kinds");
    }
  }
  if (d.output_file.find("..") != std::string::npos || (!d.output_file.empty() && d.output_file.front() == '/')) {
    return fail("output_file must be a relative path inside the scratch directory");
  }
  tools_[d.name] = std::move(d);
  return true;
}

bool ToolRegistry::load_json(const std::string& text, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  auto doc = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = "tools document: " + err->message;
    return false;
  }
  const auto* arr = jsonlite::get_array(doc, "tools");
  if (!arr) {
    if (error) *error = "tools document: 'tools' must be an array";
    return false;
  }
  for (const auto& item : *arr) {
    const auto* o = std::get_if<jsonlite::Object>(&item.v);
    if (!o) {
      if (error) *error = "tools document: every entry must be an object";
      return false;
    }
    // Entries for an existing tool only need the fields they override.
    auto d = descriptor_from_json(*o, find(jsonlite::get_string(*o, "name")), error);
    if (!d || !add(std::move(*d), error)) return false;
  }
  return true;
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
  auto it = tools_.find(name);
  return it == tools_.end() ? nullptr : &it->second;
}

std::vector<std::string> ToolRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(tools_.size());
  for (const auto& [name, _] : tools_) out.push_back(name);
  return out;
}

std::string descriptor_identity(const ToolDescriptor& d) {
  auto o = descriptor_to_json(d);
  // Scheduling knobs do not change what the tool computes.
  o.erase("version");
  o.erase("timeout_ms");
  o.erase("mandatory");
  return jsonlite::to_json(o);
}

jsonlite::Object descriptor_to_json(const ToolDescriptor& d) {
  jsonlite::Object o;
  o["name"] = jsonlite::Value{d.name};
  o["version"] = jsonlite::Value{d.version};
  o["consumes"] = jsonlite::Value{kinds_to_json(d.consumes)};
  o["produces"] = jsonlite::Value{kinds_to_json(d.produces)};
  o["image"] = jsonlite::Value{d.image};
  o["entrypoint"] = jsonlite::Value{d.entrypoint};
  jsonlite::Array args;
  for (const auto& a : d.args) args.push_back(jsonlite::Value{a});
  o["args"] = jsonlite::Value{std::move(args)};
  o["output_file"] = jsonlite::Value{d.output_file};
  o["stdin_kind"] = jsonlite::Value{d.stdin_kind};
  o["parser"] = jsonlite::Value{d.parser};
  o["input_mode"] = jsonlite::Value{to_string(d.input_mode)};
  o["timeout_ms"] = jsonlite::Value{static_cast<std::uint64_t>(d.timeout_ms)};
  o["mandatory"] = jsonlite::Value{d.mandatory};
  return o;
}

std::optional<ToolDescriptor> descriptor_from_json(const jsonlite::Object& o,
                                                   const ToolDescriptor* base,
                                                   std::string* error) {
  ToolDescriptor d;
  if (base) d = *base;
  d.name = jsonlite::get_string(o, "name");
  if (d.name.empty()) {
    if (error) *error = "tool entry without a name";
    return std::nullopt;
  }

  d.version = jsonlite::get_string(o, "version", d.version);
  if (!kinds_from_json(o, "consumes", d.consumes, error)) return std::nullopt;
  if (!kinds_from_json(o, "produces", d.produces, error)) return std::nullopt;
  d.image = jsonlite::get_string(o, "image", d.image);
  d.entrypoint = jsonlite::get_string(o, "entrypoint", d.entrypoint);
  if (o.contains("args")) d.args = jsonlite::get_string_array(o, "args");
  d.output_file = jsonlite::get_string(o, "output_file", d.output_file);
  d.stdin_kind = jsonlite::get_string(o, "stdin_kind", d.stdin_kind);
  d.parser = jsonlite::get_string(o, "parser", d.parser);
  const std::string mode = jsonlite::get_string(o, "input_mode", to_string(d.input_mode));
  if (mode != "batch" && mode != "each") {
    if (error) *error = "tool '" + d.name + "': input_mode must be 'batch' or 'each'";
    return std::nullopt;
  }
  d.input_mode = mode == "each" ? InputMode::each : InputMode::batch;
  d.timeout_ms = jsonlite::get_u64(o, "timeout_ms", d.timeout_ms);
  d.mandatory = jsonlite::get_bool(o, "mandatory", d.mandatory);
  return d;
}

ToolRegistry builtin_registry(const std::string& domain) {
  using K = ArtifactKind;
  ToolRegistry r;
  if (domain == "web") {
    add_builtin(r, tool("subfinder", "2.6.6", {K::target}, {K::asset},
                        {"-dL", "{input:target}", "-silent", "-o", "{output}"},
                        "subfinder.txt", "lines_asset"));
    add_builtin(r, tool("dnsx", "1.2.1", {K::asset}, {K::asset},
                        {"-l", "{input:asset}", "-silent", "-o", "{output}"},
                        "dnsx.txt", "lines_asset"));
    add_builtin(r, tool("httpx", "1.6.8", {K::asset}, {K::asset},
                        {"-l", "{input:asset}", "-json", "-o", "{output}"},
                        "httpx.json", "httpx"));
    add_builtin(r, tool("gau", "2.2.3", {K::asset}, {K::path},
                        {"--providers", "wayback,commoncrawl,otx", "--subs", "--o", "{output}",
                         "{input:asset}"},
                        "gau.txt", "lines_path"));
    {
      auto d = tool("waybackurls", "0.1.0", {K::asset}, {K::path},
                    {"-c", "cat {input:asset} | waybackurls > {output}"},
                    "waybackurls.txt", "lines_path");
      d.entrypoint = "sh";
      add_builtin(r, std::move(d));
    }
    add_builtin(r, tool("katana", "1.1.0", {K::asset}, {K::path},
                        {"-list", "{input:asset}", "-silent", "-o", "{output}"},
                        "katana.txt", "lines_path"));
    {
      auto d = tool("hakrawler", "2.1", {K::asset}, {K::path}, {}, "", "lines_path");
      d.stdin_kind = "asset";
      add_builtin(r, std::move(d));
    }
    add_builtin(r, tool("ffuf", "2.1.0", {K::asset}, {K::path},
                        {"-w", "{input:asset}", "-u", "https://FUZZ", "-mc",
                         "200,204,301,302,307,401,403", "-of", "json", "-o", "{output}",
                         "-timeout", "10", "-t", "20", "-sa", "-s"},
                        "ffuf.json", "ffuf"));
    {
      auto d = tool("paramspider", "1.0.1", {K::asset}, {K::path},
                    {"-d", "{value}", "-o", "{workdir}/paramspider"}, "", "lines_path");
      d.input_mode = InputMode::each;
      add_builtin(r, std::move(d));
    }
    {
      auto d = tool("graphql-cop", "1.15", {K::asset}, {K::path},
                    {"-t", "{value}/graphql", "--quiet"}, "", "graphql_cop");
      d.input_mode = InputMode::each;
      add_builtin(r, std::move(d));
    }
    {
      auto d = tool("httpx_paths", "1.6.8", {K::path}, {K::path},
                    {"-l", "{input:path}", "-json", "-o", "{output}"}, "httpx_paths.json",
                    "httpx_paths");
      d.image = "deadbolt-httpx";
      add_builtin(r, std::move(d));
    }
    add_builtin(r, tool("nuclei", "3.3.5", {K::asset}, {K::finding},
                        {"-l", "{input:asset}", "-jsonl", "-severity", "medium,high,critical",
                         "-o", "{output}"},
                        "nuclei.jsonl", "nuclei"));
  } else if (domain == "android") {
    {
      auto d = tool("apktool", "2.9.3", {K::target}, {K::path},
                    {"-c", "apktool d -f {input:target} -o {workdir}/decoded >/dev/null && "
                           "grep -o 'android:name=\"[^\"]*\"' {workdir}/decoded/AndroidManifest.xml"
                           " | cut -d'\"' -f2 | sort -u > {output}"},
                    "components.txt", "lines_component");
      d.entrypoint = "sh";
      add_builtin(r, std::move(d));
    }
    {
      auto d = tool("jadx", "1.5.0", {K::target}, {K::path},
                    {"-c", "jadx -d {workdir}/src {input:target} >/dev/null 2>&1; "
                           "grep -rhoE 'https?://[A-Za-z0-9._~:/?#@!$&*+,;=%-]+' {workdir}/src"
                           " | sort -u > {output}"},
                    "urls.txt", "lines_path");
      d.entrypoint = "sh";
      add_builtin(r, std::move(d));
    }
    add_builtin(r, tool("androguard", "4.1.2", {K::target}, {K::finding},
                        {"{input:target}", "{output}"}, "androguard.jsonl", "findings_jsonl"));
    add_builtin(r, tool("mobsf", "4.4.5", {K::target}, {K::finding},
                        {"{input:target}", "{output}"}, "mobsf.json", "mobsf"));
  } else if (domain == "ios") {
    add_builtin(r, tool("mobsf", "4.4.5", {K::target}, {K::finding},
                        {"{input:target}", "{output}"}, "mobsf.json", "mobsf"));
  }
  return r;
}

std::optional<Plan> builtin_plan(const std::string& domain) {
  using K = ArtifactKind;
  Plan p;
  p.domain = domain;
  if (domain == "web") {
    p.phases.push_back(PhaseDefinition{"discovery", {"subfinder"}, {}, {}});
    p.phases.push_back(PhaseDefinition{"resolution", {"dnsx", "httpx"}, {}, {{K::target, K::asset}}});
    p.phases.push_back(PhaseDefinition{
        "enumeration",
        {"gau", "waybackurls", "katana", "hakrawler", "ffuf", "paramspider", "graphql-cop"},
        {K::asset},
        {}});
    p.phases.push_back(PhaseDefinition{"validation", {"httpx_paths"}, {}, {}});
    p.phases.push_back(PhaseDefinition{"vulnerability", {"nuclei"}, {K::asset}, {}});
    return p;
  }
  if (domain == "android") {
    p.phases.push_back(PhaseDefinition{"static", {"apktool", "jadx", "androguard"}, {}, {}});
    p.phases.push_back(PhaseDefinition{"analysis", {"mobsf"}, {}, {}});
    return p;
  }
  if (domain == "ios") {
    p.phases.push_back(PhaseDefinition{"analysis", {"mobsf"}, {}, {}});
    return p;
  }
  return std::nullopt;
}

std::vector<std::string> validate_plan(const Plan& plan, const ToolRegistry& registry) {
  std::vector<std::string> errors;
  std::set<std::string> seen_tools;
  std::set<ArtifactKind> available{ArtifactKind::target};
  if (plan.phases.empty()) errors.push_back("plan has no phases");

  std::set<std::string> seen_phases;
  for (const auto& phase : plan.phases) {
    if (!seen_phases.insert(phase.name).second) {
      errors.push_back("phase '" + phase.name + "' declared twice");
    }
    for (const auto& [from, to] : phase.promote_if_empty) {
      if (available.contains(from)) available.insert(to);
    }
    std::set<ArtifactKind> produced_here;
    for (const auto& name : phase.tools) {
      const ToolDescriptor* d = registry.find(name);
      if (!d) {
        errors.push_back("phase '" + phase.name + "' references unknown tool '" + name + "'");
        continue;
      }
      if (!seen_tools.insert(name).second) {
        errors.push_back("tool '" + name + "' appears in more than one phase");
      }
      for (auto k : d->consumes) {
        if (!available.contains(k)) {
          errors.push_back("tool '" + name + "' consumes '" + to_string(k) +
                           "' which no earlier phase produces");
        }
      }
      produced_here.insert(d->produces.begin(), d->produces.end());
    }
    available.insert(produced_here.begin(), produced_here.end());
  }
  return errors;
}

}  // namespace deadbolt
