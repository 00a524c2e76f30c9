#include "deadbolt/config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>

#include "deadbolt/jsonlite.hpp"

namespace deadbolt {

namespace {

constexpr std::size_t kMaxConcurrency = 64;

bool parse_u64(const char* s, std::uint64_t& out) {
  if (!s || !*s) return false;
  const char* end = s + std::char_traits<char>::length(s);
  auto [p, ec] = std::from_chars(s, end, out);
  return ec == std::errc{} && p == end;
}

template <typename T>
bool require(const jsonlite::Object& o, const std::string& key, std::vector<std::string>& errors,
             const char* type_name) {
  auto it = o.find(key);
  if (it == o.end()) return false;
  if (!std::holds_alternative<T>(it->second.v)) {
    errors.push_back("'" + key + "' must be " + type_name);
    return false;
  }
  return true;
}

}  // namespace

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  static const char* kKnown[] = {"output_root",      "max_concurrency",   "default_timeout_ms",
                                 "max_output_bytes", "container_runtime", "use_containers",
                                 "compress"};
  for (const auto& [key, _] : o) {
    bool known = false;
    for (const char* k : kKnown) known = known || key == k;
    if (!known) r.warnings.push_back("unknown key '" + key + "' ignored");
  }

  if (require<std::string>(o, "output_root", r.errors, "a string") &&
      jsonlite::get_string(o, "output_root").empty()) {
    r.errors.push_back("'output_root' must not be empty");
  }
  if (require<std::uint64_t>(o, "max_concurrency", r.errors, "a positive integer")) {
    const auto n = jsonlite::get_u64(o, "max_concurrency");
    if (n == 0) r.errors.push_back("'max_concurrency' must be at least 1");
    if (n > kMaxConcurrency) r.warnings.push_back("'max_concurrency' above 64 is clamped to 64");
  }
  if (require<std::uint64_t>(o, "default_timeout_ms", r.errors, "a positive integer") &&
      jsonlite::get_u64(o, "default_timeout_ms") == 0) {
    r.errors.push_back("'default_timeout_ms' must be at least 1");
  }
  if (require<std::uint64_t>(o, "max_output_bytes", r.errors, "a positive integer") &&
      jsonlite::get_u64(o, "max_output_bytes") == 0) {
    r.errors.push_back("'max_output_bytes' must be at least 1");
  }
  if (require<std::string>(o, "container_runtime", r.errors, "a string") &&
      jsonlite::get_string(o, "container_runtime").empty()) {
    r.errors.push_back("'container_runtime' must not be empty");
  }
  require<bool>(o, "use_containers", r.errors, "a boolean");
  require<bool>(o, "compress", r.errors, "a boolean");
#ifndef DEADBOLT_WITH_ZSTD
  if (jsonlite::get_bool(o, "compress")) {
    r.warnings.push_back("'compress' requested but this build has no zstd support");
  }
#endif

  r.ok = r.errors.empty();
  return r;
}

bool apply_config_json(OrchestratorConfig& config, const std::string& config_json,
                       std::string* error) {
  const auto v = validate_config(config_json);
  if (!v.ok) {
    if (error) *error = "config: " + v.errors.front();
    return false;
  }
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(config_json, &err);
  OrchestratorConfig c = config;
  c.output_root = jsonlite::get_string(o, "output_root", c.output_root);
  c.max_concurrency = std::min<std::size_t>(
      kMaxConcurrency, jsonlite::get_u64(o, "max_concurrency", c.max_concurrency));
  c.default_timeout_ms = jsonlite::get_u64(o, "default_timeout_ms", c.default_timeout_ms);
  c.max_output_bytes = jsonlite::get_u64(o, "max_output_bytes", c.max_output_bytes);
  c.container_runtime = jsonlite::get_string(o, "container_runtime", c.container_runtime);
  c.use_containers = jsonlite::get_bool(o, "use_containers", c.use_containers);
  c.compress = jsonlite::get_bool(o, "compress", c.compress);
  config = std::move(c);
  return true;
}

void apply_env(OrchestratorConfig& config, std::string* error) {
  auto bad = [&](const char* key) {
    if (error) {
      if (!error->empty()) *error += "; ";
      *error += std::string(key) + " must be a positive integer";
    }
  };
  if (const char* v = std::getenv("DEADBOLT_OUTPUT_ROOT"); v && v[0]) config.output_root = v;
  if (const char* v = std::getenv("DEADBOLT_MAX_CONCURRENCY"); v && v[0]) {
    std::uint64_t n = 0;
    if (parse_u64(v, n) && n > 0) {
      config.max_concurrency = std::min<std::size_t>(kMaxConcurrency, n);
    } else {
      bad("DEADBOLT_MAX_CONCURRENCY");
    }
  }
  if (const char* v = std::getenv("DEADBOLT_TIMEOUT_MS"); v && v[0]) {
    std::uint64_t n = 0;
    if (parse_u64(v, n) && n > 0) {
      config.default_timeout_ms = n;
    } else {
      bad("DEADBOLT_TIMEOUT_MS");
    }
  }
  if (const char* v = std::getenv("DEADBOLT_CONTAINER_RUNTIME"); v && v[0]) {
    config.container_runtime = v;
  }
  if (const char* v = std::getenv("DEADBOLT_SANDBOX_DISABLED"); v && std::string(v) == "1") {
    config.use_containers = false;
  }
}

std::string config_to_json(const OrchestratorConfig& config) {
  jsonlite::Object o;
  o["output_root"] = jsonlite::Value{config.output_root};
  o["max_concurrency"] = jsonlite::Value{static_cast<std::uint64_t>(config.max_concurrency)};
  o["default_timeout_ms"] = jsonlite::Value{static_cast<std::uint64_t>(config.default_timeout_ms)};
  o["max_output_bytes"] = jsonlite::Value{static_cast<std::uint64_t>(config.max_output_bytes)};
  o["container_runtime"] = jsonlite::Value{config.container_runtime};
  o["use_containers"] = jsonlite::Value{config.use_containers};
  o["compress"] = jsonlite::Value{config.compress};
  return jsonlite::to_json(o);
}

}  // namespace deadbolt
