#pragma once

// deadbolt/jsonlite.hpp — Strict, dependency-free JSON reader/writer.
//
// DETERMINISM GUARANTEES:
//   - Object is a std::map, so serialization always emits keys in sorted order.
//     to_json() output is therefore canonical and safe to hash.
//   - Doubles are formatted with a fixed "%.6f" + trailing-zero trim, never via
//     iostreams, so output is locale-independent.
//   - Duplicate keys are rejected at parse time ("json_duplicate_key"), which
//     rules out two documents with different meanings hashing the same.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace deadbolt::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v{nullptr};
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse any JSON value. On failure *error is set and a null Value is returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a document whose top level must be an object. Non-object documents
// return an empty Object and set *error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error = nullptr);

std::string to_json(const Value& v);
std::string to_json(const Object& o);
std::string to_json(const Array& a);

// Type-safe extractors. Missing keys or type mismatches yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);

// Scalar rendering used by tool parsers: strings verbatim, numbers/bools as
// their JSON text, null/containers as "".
std::string scalar_text(const Value& v);

std::string escape(const std::string& s);

}  // namespace deadbolt::jsonlite
