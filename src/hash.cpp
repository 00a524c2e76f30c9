#include "deadbolt/hash.hpp"
#include "deadbolt/version.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive. No fallbacks.
//   2. Domain separation prefixes ("cas:", "art:", "inv:", "fnd:", "set:") are
//      part of the on-disk schema. Changing one invalidates every fingerprint
//      in every run-state lineage; bump version::HASH_ALGORITHM_VERSION.
//   3. combination_hash() is order-independent by construction (sorted members),
//      which is what lets the resume cache ignore artifact arrival order.

#include <algorithm>
#include <array>

extern "C" {
#include <blake3.h>
}

namespace deadbolt {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.backend = "libblake3";
  info.version = blake3_version();
  info.algorithm_version = version::HASH_ALGORITHM_VERSION;
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string cas_content_hash(std::string_view raw_bytes) {
  return hash_domain("cas:", raw_bytes);
}

std::string combination_hash(std::vector<std::string> member_hashes) {
  std::sort(member_hashes.begin(), member_hashes.end());
  member_hashes.erase(std::unique(member_hashes.begin(), member_hashes.end()),
                      member_hashes.end());
  std::string joined;
  joined.reserve(member_hashes.size() * 65);
  for (const auto& h : member_hashes) {
    joined += h;
    joined += '\n';
  }
  return hash_domain("set:", joined);
}

}  // namespace deadbolt
