#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace deadbolt {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
  std::uint32_t algorithm_version{0};
};

// Core BLAKE3 hashing (64-char lowercase hex)
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. Each digest family gets its own prefix so that an
// artifact hash can never collide with a fingerprint or a blob key:
//   "cas:" blob content      "art:" artifact identity
//   "inv:" fingerprint       "fnd:" finding id
//   "set:" input combination
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string cas_content_hash(std::string_view raw_bytes);

// Order-independent combination hash over a set of member hashes. The members
// are sorted and de-duplicated before hashing, so {a,b} == {b,a} == {a,b,a}.
std::string combination_hash(std::vector<std::string> member_hashes);

}  // namespace deadbolt
