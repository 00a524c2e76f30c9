#pragma once

// deadbolt/normalize.hpp — Raw tool output -> common findings schema.
//
// Tool-specific parsing lives behind IToolParser, one adapter per output
// format, registered by name. ToolDescriptor::parser selects the adapter. The
// Normalizer owns everything common to all tools:
//   - stamping tool + provenance (source artifact, invocation, timestamp);
//   - canonicalizing evidence;
//   - id assignment: id = BLAKE3("fnd:" + identity), where identity covers the
//     tool, kind, target and rule id (plus title and evidence when there is no
//     rule id). Timestamps and provenance are never part of the id;
//   - merging duplicates: occurrences add up, the highest severity wins.
//
// normalize() is a pure function of (tool, raw, context). Output order is
// sorted by id.

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "deadbolt/jsonlite.hpp"
#include "deadbolt/types.hpp"

namespace deadbolt {

struct NormalizeContext {
  std::string parser;           // adapter key; empty = the tool name
  std::string subject;          // input value of an each-mode invocation
  std::string source_artifact;  // CAS digest of the raw output
  std::string invocation;       // fingerprint
  std::string discovered_at;
};

struct ParseResult {
  bool ok{true};
  std::vector<Finding> records;  // id/tool/provenance left empty
  std::string error;
};

class IToolParser {
 public:
  virtual ~IToolParser() = default;
  virtual ParseResult parse(const std::string& tool, std::string_view raw,
                            const NormalizeContext& ctx) const = 0;
};

struct NormalizeResult {
  bool ok{false};
  std::vector<Finding> findings;
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

class Normalizer {
 public:
  // Registers the built-in adapters.
  Normalizer();

  void register_parser(const std::string& name, std::unique_ptr<IToolParser> parser);
  bool has_parser(const std::string& name) const;

  NormalizeResult normalize(const std::string& tool, std::string_view raw,
                            const NormalizeContext& ctx) const;
  NormalizeResult normalize(const std::string& tool, std::string_view raw) const;

 private:
  std::map<std::string, std::unique_ptr<IToolParser>> parsers_;
};

std::string finding_identity(const Finding& f);
std::string compute_finding_id(const Finding& f);

jsonlite::Object finding_to_json(const Finding& f);
std::optional<Finding> finding_from_json(const jsonlite::Object& o);

// Artifact content for a normalized record: the finding JSON without
// discovered_at, so reruns over identical output store identical artifacts.
std::string finding_artifact_content(const Finding& f);

}  // namespace deadbolt
