#pragma once

// deadbolt/registry.hpp — Tool catalog and phase plans.
//
// The registry is built once at process start (built-in catalog, then the
// optional tools.json overrides) and is read-only afterwards. Every component
// that needs a descriptor takes `const ToolRegistry&`.
//
// Args templates may use these placeholders, expanded by the sandbox adapter:
//   {input}         worklist (or package file) of the first consumed kind
//   {input:<kind>}  worklist (or package file) of a specific consumed kind
//   {output}        the descriptor's output_file inside the scratch directory
//   {workdir}       the invocation's scratch directory

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "deadbolt/jsonlite.hpp"
#include "deadbolt/types.hpp"

namespace deadbolt {

class ToolRegistry {
 public:
  // Adds or replaces a descriptor. Returns false and sets *error if invalid.
  bool add(ToolDescriptor d, std::string* error);

  // Applies {"tools": [descriptor, ...]} on top of the current catalog.
  bool load_json(const std::string& text, std::string* error);

  const ToolDescriptor* find(const std::string& name) const;
  std::vector<std::string> names() const;
  std::size_t size() const { return tools_.size(); }

 private:
  std::map<std::string, ToolDescriptor> tools_;
};

// Stable text over everything that changes what a tool does with its inputs
// (image, entrypoint, args, output shape, parser). Hashed into fingerprints
// together with the version.
std::string descriptor_identity(const ToolDescriptor& d);

jsonlite::Object descriptor_to_json(const ToolDescriptor& d);
// Fields absent from `o` keep their value from `base` (if given).
std::optional<ToolDescriptor> descriptor_from_json(const jsonlite::Object& o,
                                                   const ToolDescriptor* base,
                                                   std::string* error);

// Built-in catalogs and plans for "web", "android", "ios".
ToolRegistry builtin_registry(const std::string& domain);
std::optional<Plan> builtin_plan(const std::string& domain);

// Every tool referenced by the plan exists, appears in one phase only, and
// consumes only kinds that are a target or produced by an earlier phase.
std::vector<std::string> validate_plan(const Plan& plan, const ToolRegistry& registry);

}  // namespace deadbolt
