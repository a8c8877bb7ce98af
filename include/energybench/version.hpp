#pragma once

// energybench/version.hpp — Version manifest for every persisted format.
//
// The artifact cache outlives a single run and reports are consumed by other
// tools, so both carry an explicit format number. Readers check it before
// trusting what they load.

#include <cstdint>
#include <string>

namespace energybench {
namespace version {

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3 (32-byte digest, 64 hex chars), "build:" domain prefix
// over the length-prefixed spec encoding in hash.cpp.
// Changing the encoding changes every content hash and requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// ARTIFACT_FORMAT_VERSION
// Layout of <cache_root>/artifacts/<hash>/ and its manifest.json.
// Artifacts written with a different version are ignored by lookup() and
// rebuilt.
// ---------------------------------------------------------------------------
constexpr uint32_t ARTIFACT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// REPORT_SCHEMA_VERSION
// Field set of the summary JSON lines and CSV columns in report.hpp.
// ---------------------------------------------------------------------------
constexpr uint32_t REPORT_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// Field set of ENERGYBENCH_EVENT_LOG lines.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t artifact_format{ARTIFACT_FORMAT_VERSION};
  uint32_t report_schema{REPORT_SCHEMA_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string semver;          // project version from CMake
  std::string hash_primitive;  // "blake3"
  std::string hash_backend_version;
  bool zstd_enabled{false};
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
};

// Check an artifact manifest's format number against this build.
CompatibilityResult check_artifact_format(uint32_t found);

}  // namespace version
}  // namespace energybench
