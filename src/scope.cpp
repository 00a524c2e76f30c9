#include "deadbolt/scope.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <sstream>

#include "deadbolt/jsonlite.hpp"

namespace fs = std::filesystem;

namespace deadbolt {

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string strip_trailing_dot(std::string s) {
  while (!s.empty() && s.back() == '.') s.pop_back();
  return s;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool ends_with_label(const std::string& host, const std::string& suffix) {
  return host.size() > suffix.size() + 1 &&
         host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0 &&
         host[host.size() - suffix.size() - 1] == '.';
}

bool valid_host(const std::string& h) {
  if (h.empty() || h.size() > 253) return false;
  for (unsigned char c : h) {
    if (!(std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == ':')) return false;
  }
  return h.front() != '.' && h.front() != '-';
}

}  // namespace

std::string extract_host(std::string_view line) {
  std::string_view s = trim(line);
  if (auto p = s.find("://"); p != std::string_view::npos) s.remove_prefix(p + 3);
  if (auto p = s.find_first_of("/?#"); p != std::string_view::npos) s = s.substr(0, p);
  if (auto p = s.rfind('@'); p != std::string_view::npos) s.remove_prefix(p + 1);
  if (!s.empty() && s.front() == '[') {
    auto close = s.find(']');
    if (close == std::string_view::npos) return {};
    s = s.substr(1, close - 1);
  } else if (auto p = s.find(':'); p != std::string_view::npos) {
    s = s.substr(0, p);
  }
  std::string host = strip_trailing_dot(lower(s));
  return valid_host(host) ? host : std::string{};
}

bool rule_matches(const ScopeRule& rule, const Target& target) {
  if (target.kind == TargetKind::package) {
    return rule.pattern == target.identifier;
  }
  const std::string host = strip_trailing_dot(lower(target.identifier));
  std::string pattern = strip_trailing_dot(lower(trim(rule.pattern)));
  if (pattern.rfind("*.", 0) == 0) {
    return ends_with_label(host, pattern.substr(2));
  }
  if (!pattern.empty() && pattern.front() == '.') {
    const std::string apex = pattern.substr(1);
    return host == apex || ends_with_label(host, apex);
  }
  return !pattern.empty() && host == pattern;
}

ScopeResult validate(const std::vector<Target>& targets, const std::vector<ScopeRule>& rules) {
  ScopeResult result;
  for (const auto& t : targets) {
    bool denied = false;
    for (const auto& r : rules) {
      if (r.action == ScopeAction::deny && rule_matches(r, t)) {
        result.violations.push_back(t.identifier + " is denied by rule '" + r.pattern + "'");
        denied = true;
        break;
      }
    }
    if (denied) continue;

    const ScopeRule* admitted = nullptr;
    for (const auto& r : rules) {
      if (r.action == ScopeAction::allow && rule_matches(r, t)) {
        admitted = &r;
        break;
      }
    }
    if (!admitted) {
      result.violations.push_back(t.identifier + " is not matched by any allow rule");
      continue;
    }
    Target accepted = t;
    accepted.matched_rule = admitted->pattern;
    result.allowed.push_back(std::move(accepted));
  }

  if (targets.empty()) result.violations.push_back("no targets supplied");

  if (!result.violations.empty()) {
    result.allowed.clear();
    result.error = ErrorCode::scope_violation;
    return result;
  }
  result.ok = true;
  return result;
}

std::optional<std::vector<ScopeRule>> load_scope_rules(const std::string& json_text,
                                                       std::string* error) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json_text, &err);
  if (err) {
    if (error) *error = "scope document: " + err->message;
    return std::nullopt;
  }

  std::vector<ScopeRule> rules;
  for (const auto& [key, action] : {std::pair<std::string, ScopeAction>{"deny", ScopeAction::deny},
                                    std::pair<std::string, ScopeAction>{"allow", ScopeAction::allow}}) {
    auto it = obj.find(key);
    if (it == obj.end()) continue;
    const auto* arr = std::get_if<jsonlite::Array>(&it->second.v);
    if (!arr) {
      if (error) *error = "scope document: '" + key + "' must be an array of strings";
      return std::nullopt;
    }
    for (const auto& item : *arr) {
      const auto* s = std::get_if<std::string>(&item.v);
      if (!s || trim(*s).empty() || *s == "*." || *s == ".") {
        if (error) *error = "scope document: '" + key + "' contains an empty or non-string pattern";
        return std::nullopt;
      }
      rules.push_back(ScopeRule{action, std::string(trim(*s))});
    }
  }
  return rules;
}

TargetParseResult parse_domain_targets(const std::string& text) {
  TargetParseResult r;
  std::set<std::string> seen;
  std::istringstream in(text);
  std::string line;
  size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    auto t = trim(line);
    if (t.empty() || t.front() == '#') continue;
    const std::string host = extract_host(t);
    if (host.empty()) {
      r.error = ErrorCode::invalid_target;
      r.detail = "line " + std::to_string(lineno) + ": no valid host in '" + std::string(t) + "'";
      r.targets.clear();
      return r;
    }
    if (!seen.insert(host).second) continue;
    Target target;
    target.identifier = host;
    target.kind = TargetKind::domain;
    r.targets.push_back(std::move(target));
  }
  if (r.targets.empty()) {
    r.error = ErrorCode::invalid_target;
    r.detail = "targets file contains no targets";
    return r;
  }
  r.ok = true;
  return r;
}

TargetParseResult make_package_target(const std::string& file_path, const std::string& domain) {
  TargetParseResult r;
  const std::string suffix = domain == "android" ? ".apk" : domain == "ios" ? ".ipa" : "";
  if (suffix.empty()) {
    r.error = ErrorCode::invalid_target;
    r.detail = "domain '" + domain + "' does not take package targets";
    return r;
  }
  const fs::path p(file_path);
  if (lower(p.extension().string()) != suffix) {
    r.error = ErrorCode::invalid_target;
    r.detail = file_path + ": expected a " + suffix + " file";
    return r;
  }
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) {
    r.error = ErrorCode::invalid_target;
    r.detail = file_path + ": no such file";
    return r;
  }
  Target t;
  t.identifier = p.filename().string();
  t.kind = TargetKind::package;
  t.file_path = fs::absolute(p, ec).string();
  r.targets.push_back(std::move(t));
  r.ok = true;
  return r;
}

}  // namespace deadbolt
