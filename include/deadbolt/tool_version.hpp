#pragma once

// deadbolt/tool_version.hpp — Installed tool version resolution.
//
// The version in a descriptor feeds every fingerprint, so it has to follow the
// bits that actually run rather than the number the catalog was written with.
// Resolution order per descriptor:
//   1. container tools: `<runtime> image inspect --format {{.Id}} <image>`
//   2. host tools: the first x.y.z printed for `-version` or `--version`
//   3. the declared version (or "unknown" when none was declared)
//
// Results are cached per process, keyed by runtime and image (or executable),
// so one process asks each image once.

#include <string>

#include "deadbolt/registry.hpp"
#include "deadbolt/sandbox.hpp"

namespace deadbolt {

struct ToolVersion {
  std::string value;
  std::string source;  // "image", "flag" or "declared"
};

ToolVersion resolve_tool_version(const ToolDescriptor& tool, const SandboxConfig& config);

// Rewrites every descriptor's version with its resolved one.
void resolve_tool_versions(ToolRegistry& registry, const SandboxConfig& config);

// First "x.y.z" (optionally "v"-prefixed, prefix dropped) in `text`, or "".
std::string extract_semver(const std::string& text);

}  // namespace deadbolt
