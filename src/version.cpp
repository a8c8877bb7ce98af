#include "energybench/version.hpp"

#include <sstream>

#include "energybench/hash.hpp"
#include "energybench/jsonlite.hpp"

#ifndef ENERGYBENCH_VERSION
#define ENERGYBENCH_VERSION "0.1.0"
#endif

namespace energybench {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? ENERGYBENCH_VERSION : semver;
  m.hash_primitive = "blake3";
  m.hash_backend_version = blake3_version_string();
#if defined(ENERGYBENCH_WITH_ZSTD)
  m.zstd_enabled = true;
#endif
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"hash_algorithm\":" << m.hash_algorithm
    << ",\"artifact_format\":" << m.artifact_format
    << ",\"report_schema\":" << m.report_schema
    << ",\"event_log\":" << m.event_log
    << ",\"semver\":\"" << jsonlite::escape(m.semver) << "\""
    << ",\"hash_primitive\":\"" << jsonlite::escape(m.hash_primitive) << "\""
    << ",\"hash_backend_version\":\"" << jsonlite::escape(m.hash_backend_version) << "\""
    << ",\"zstd\":" << (m.zstd_enabled ? "true" : "false")
    << ",\"build_timestamp\":\"" << jsonlite::escape(m.build_timestamp) << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_artifact_format(uint32_t found) {
  CompatibilityResult r;
  if (found != ARTIFACT_FORMAT_VERSION) {
    r.ok = false;
    r.error_code = "artifact_format_mismatch";
    r.description = "artifact format " + std::to_string(found) + " != supported format " +
                    std::to_string(ARTIFACT_FORMAT_VERSION) + "; the artifact will be rebuilt";
  }
  return r;
}

}  // namespace version
}  // namespace energybench
