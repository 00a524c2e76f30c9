#include "deadbolt/tool_version.hpp"

#include <cctype>
#include <map>
#include <mutex>

namespace deadbolt {

namespace {

constexpr std::uint64_t kInspectTimeoutMs = 8000;
constexpr std::uint64_t kFlagTimeoutMs = 5000;

std::mutex g_cache_mu;
std::map<std::string, ToolVersion> g_cache;

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool succeeded(const ProcessResult& pr) {
  return !pr.spawn_failed && !pr.timed_out && !pr.cancelled && pr.exit_code == 0;
}

ProcessSpec base_spec(const SandboxConfig& config, std::uint64_t timeout_ms) {
  ProcessSpec spec;
  spec.env = config.env;
  spec.timeout_ms = timeout_ms;
  spec.max_memory_bytes = config.max_memory_bytes;
  spec.max_file_descriptors = config.max_file_descriptors;
  return spec;
}

std::string image_id(const std::string& image, const SandboxConfig& config) {
  ProcessSpec spec = base_spec(config, kInspectTimeoutMs);
  spec.command = config.container_runtime;
  spec.argv = {"image", "inspect", "--format", "{{.Id}}", image};
  ProcessResult pr = run_process(spec);
  if (!succeeded(pr)) return "";
  const std::string id = trim(pr.stdout_text);
  // More than one line means the runtime matched several images.
  return id.find('\n') == std::string::npos ? id : "";
}

std::string flag_version(const std::string& executable, const SandboxConfig& config) {
  for (const char* flag : {"-version", "--version"}) {
    ProcessSpec spec = base_spec(config, kFlagTimeoutMs);
    spec.command = executable;
    spec.argv = {flag};
    ProcessResult pr = run_process(spec);
    if (pr.spawn_failed) return "";
    if (pr.timed_out) continue;
    const std::string v = extract_semver(pr.stdout_text + "\n" + pr.stderr_text);
    if (!v.empty()) return v;
  }
  return "";
}

}  // namespace

std::string extract_semver(const std::string& text) {
  auto digits = [&](std::size_t& i) {
    const std::size_t start = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    return i > start;
  };
  for (std::size_t start = 0; start < text.size(); ++start) {
    if (!std::isdigit(static_cast<unsigned char>(text[start]))) continue;
    if (start > 0 && (std::isdigit(static_cast<unsigned char>(text[start - 1])) || text[start - 1] == '.')) {
      continue;
    }
    std::size_t i = start;
    bool ok = digits(i);
    for (int part = 0; ok && part < 2; ++part) {
      ok = i < text.size() && text[i] == '.';
      if (ok) {
        ++i;
        ok = digits(i);
      }
    }
    if (ok) return text.substr(start, i - start);
  }
  return "";
}

ToolVersion resolve_tool_version(const ToolDescriptor& tool, const SandboxConfig& config) {
  const bool in_container = config.use_containers && !tool.image.empty();
  const std::string executable = tool.entrypoint.empty() ? tool.name : tool.entrypoint;
  const std::string key = in_container ? config.container_runtime + "\n" + tool.image
                                       : "host\n" + executable + "\n" + tool.version;
  {
    std::lock_guard<std::mutex> lk(g_cache_mu);
    auto it = g_cache.find(key);
    if (it != g_cache.end()) return it->second;
  }

  ToolVersion v;
  if (in_container) {
    v.value = image_id(tool.image, config);
    v.source = "image";
  } else if (!executable.empty()) {
    v.value = flag_version(executable, config);
    v.source = "flag";
  }
  if (v.value.empty()) {
    v.value = tool.version.empty() ? "unknown" : tool.version;
    v.source = "declared";
  }

  std::lock_guard<std::mutex> lk(g_cache_mu);
  return g_cache.emplace(key, v).first->second;
}

void resolve_tool_versions(ToolRegistry& registry, const SandboxConfig& config) {
  for (const std::string& name : registry.names()) {
    ToolDescriptor d = *registry.find(name);
    d.version = resolve_tool_version(d, config).value;
    std::string err;
    (void)registry.add(std::move(d), &err);  // only the non-empty version changed
  }
}

}  // namespace deadbolt
