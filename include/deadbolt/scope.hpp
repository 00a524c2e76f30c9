#pragma once

// deadbolt/scope.hpp — Pre-execution scope gate.
//
// POLICY (fixed, tested both ways):
//   - Deny rules are evaluated first; any deny match rejects the target.
//   - A target must then match at least one allow rule. An empty allow list
//     therefore rejects everything.
//   - Domain patterns (case-insensitive, trailing dot ignored):
//       "example.com"    exact host only
//       "*.example.com"  strict subdomains only (not the apex)
//       ".example.com"   apex and every subdomain
//   - Package targets (APK/IPA) match by exact, case-sensitive file name.
//   - All-or-nothing: one rejected target rejects the whole run, and the
//     result lists every violation, not just the first.
//
// validate() is pure. It never touches the filesystem or global state.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "deadbolt/types.hpp"

namespace deadbolt {

struct ScopeResult {
  bool ok{false};
  std::vector<Target> allowed;
  ErrorCode error{ErrorCode::none};
  std::vector<std::string> violations;
};

ScopeResult validate(const std::vector<Target>& targets, const std::vector<ScopeRule>& rules);

bool rule_matches(const ScopeRule& rule, const Target& target);

// Parses {"allow": [...], "deny": [...]}. Returns nullopt and sets *error on a
// malformed document or an empty pattern.
std::optional<std::vector<ScopeRule>> load_scope_rules(const std::string& json_text,
                                                       std::string* error);

// Reduces a domain or URL line to its lowercase host: scheme, userinfo, port,
// path and trailing dot removed. Returns "" if no valid host remains.
std::string extract_host(std::string_view line);

struct TargetParseResult {
  bool ok{false};
  std::vector<Target> targets;
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

// One target per non-empty, non-comment line, de-duplicated in first-seen order.
TargetParseResult parse_domain_targets(const std::string& text);

// Package target for the android/ios domains. The file must exist and carry
// the domain's suffix (.apk / .ipa).
TargetParseResult make_package_target(const std::string& file_path, const std::string& domain);

}  // namespace deadbolt
