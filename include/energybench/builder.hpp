#pragma once

// energybench/builder.hpp — Compile workload specs into cached artifacts.
//
// CONTRACT:
//   build(spec) returns the artifact for build_content_hash(spec). Within one
//   Builder instance, a given hash is compiled at most once:
//     - the first caller runs the build; concurrent callers for the same hash
//       block on a shared future and receive the same artifact;
//     - later callers get the cached result (built or failed) immediately;
//     - a hash already committed in the ArtifactStore is reused from disk
//       without invoking the compiler.
//   Failed builds are never committed to disk, so a later Builder retries them.
//
// ERRORS:
//   missing_dependency  toolchain or spec dependency absent from the host
//   build_failure       compiler exited non-zero (stderr in build_log)
//   spec_parse_error    language has no registered environment
//   io_error            staging or commit failed
// Runtime failures of the built program are never reported here.

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "energybench/artifact_store.hpp"
#include "energybench/types.hpp"

namespace energybench {

using ArtifactPtr = std::shared_ptr<const BuildArtifact>;

struct BuildOutcome {
  ArtifactPtr artifact;  // never null; status==failed on error
  Error error;           // code==none when built
  bool cache_hit{false};
};

class Builder {
 public:
  explicit Builder(ArtifactStore& store);

  BuildOutcome build(const WorkloadSpec& spec);

  // One outcome per spec, in input order. Builds run on a pool of `workers`.
  std::vector<BuildOutcome> build_all(const std::vector<WorkloadSpec>& specs,
                                      std::size_t workers);

  // Real compiler invocations performed by this Builder.
  std::uint64_t compile_count() const { return compile_count_.load(); }
  std::uint64_t cache_hits() const { return cache_hits_.load(); }

 private:
  BuildOutcome run_build(const WorkloadSpec& spec, const std::string& content_hash);

  ArtifactStore& store_;
  std::mutex mu_;
  std::map<std::string, std::shared_future<BuildOutcome>> builds_;
  std::atomic<std::uint64_t> compile_count_{0};
  std::atomic<std::uint64_t> cache_hits_{0};
};

}  // namespace energybench
