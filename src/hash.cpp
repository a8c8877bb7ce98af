#include "energybench/hash.hpp"

// Hash authority for the build cache.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the only hash primitive.
//   2. Keys are domain-separated ("build:", "log:"). Changing a prefix
//      invalidates every committed artifact; bump ARTIFACT_FORMAT_VERSION
//      (version.hpp) when doing so.

#include <array>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace energybench {
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

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

// Length-prefixed field: "<len>:<bytes>;" keeps concatenation unambiguous.
void update_field(blake3_hasher& hasher, std::string_view field) {
  const std::string prefix = std::to_string(field.size()) + ":";
  blake3_hasher_update(&hasher, prefix.data(), prefix.size());
  blake3_hasher_update(&hasher, field.data(), field.size());
  blake3_hasher_update(&hasher, ";", 1);
}

void update_list(blake3_hasher& hasher, const std::vector<std::string>& items) {
  update_field(hasher, std::to_string(items.size()));
  for (const auto& item : items) update_field(hasher, item);
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string blake3_version_string() {
  const char* v = blake3_version();
  return v ? std::string(v) : std::string("unknown");
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string build_content_hash(const WorkloadSpec& spec) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  static constexpr std::string_view kDomain = "build:";
  blake3_hasher_update(&hasher, kDomain.data(), kDomain.size());
  update_field(hasher, spec.language);
  update_field(hasher, spec.code);
  update_list(hasher, spec.dependencies);
  update_list(hasher, spec.options);
  return finalize_hex(hasher);
}

bool valid_digest(const std::string& d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace energybench
