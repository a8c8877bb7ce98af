#pragma once

// energybench/hash.hpp — BLAKE3 hashing for build cache keys.
//
// Domain separation: every digest used as a key is computed through
// hash_domain() with a fixed prefix ("build:", "log:"). Two contexts can never
// produce colliding keys for the same payload.

#include <string>
#include <string_view>
#include <vector>

#include "energybench/types.hpp"

namespace energybench {

std::string blake3_hex(std::string_view payload);
std::string blake3_version_string();

std::string hash_domain(std::string_view domain, std::string_view payload);

// Content hash over the fields of a spec that affect build output:
// language, code, dependencies and options. Fields are length-prefixed so
// ("ab","c") and ("a","bc") never encode identically. Name, args and the
// oracle do not participate: two specs that compile the same program share
// one artifact.
std::string build_content_hash(const WorkloadSpec& spec);

// Validate a 64-char lowercase hex digest.
bool valid_digest(const std::string& digest);

}  // namespace energybench
