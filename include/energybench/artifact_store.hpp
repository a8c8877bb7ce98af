#pragma once

// energybench/artifact_store.hpp — On-disk store of committed build outputs.
//
// Layout:
//   <root>/artifacts/<content_hash>/            build outputs of one spec
//   <root>/artifacts/<content_hash>/manifest.json
//   <root>/artifacts/<content_hash>/build.log   (build.log.zst when compressed)
//   <root>/staging/.tmp_<random>/               in-progress builds
//
// INVARIANTS:
//   1. An artifact directory appears only through commit(): the staging dir is
//      renamed into place. rename() onto an existing non-empty directory fails,
//      so the first committer wins and every later one adopts its result.
//   2. lookup() returns only artifacts with a readable manifest whose
//      content_hash matches the directory name. Anything else is treated as
//      absent.
//   3. get_log() verifies the stored log blob against its BLAKE3 digest in the
//      manifest before returning it.
//   4. Only successful builds are committed. Failures stay in memory.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "energybench/types.hpp"

namespace energybench {

struct ArtifactManifest {
  std::string content_hash;
  std::string spec_name;
  std::string language;
  std::string executable;  // relative to the artifact directory
  std::string log_encoding{"identity"};  // "identity" | "zstd"
  std::size_t log_size{0};
  std::string log_blob_hash;
  std::uint64_t created_at_unix_ts{0};
  std::uint32_t format_version{0};
};

class ArtifactStore {
 public:
  // compression: "off" or "zstd" (honored only with ENERGYBENCH_WITH_ZSTD).
  explicit ArtifactStore(std::string root, std::string compression = "off");

  // Fresh, empty staging directory for one build.
  std::string make_staging_dir();
  void discard_staging(const std::string& staging_dir);

  // Move a built artifact from its staging dir to artifacts/<hash>. On success
  // artifact.workdir and artifact.executable point into the committed dir.
  // When another committer got there first, the staging dir is discarded and
  // artifact is replaced by the existing one.
  bool commit(BuildArtifact& artifact, const std::string& staging_dir, Error* error);

  std::optional<BuildArtifact> lookup(const std::string& content_hash) const;
  std::optional<ArtifactManifest> manifest(const std::string& content_hash) const;
  std::optional<std::string> get_log(const std::string& content_hash) const;

  bool contains(const std::string& content_hash) const;
  bool remove(const std::string& content_hash);
  std::vector<std::string> list() const;
  std::size_t size() const { return list().size(); }

  const std::string& root() const { return root_; }
  std::string artifact_dir(const std::string& content_hash) const;

 private:
  std::string root_;
  std::string compression_;
};

}  // namespace energybench
