#include "energybench/builder.hpp"

#include <exception>

#include "energybench/environment.hpp"
#include "energybench/hash.hpp"
#include "energybench/observability.hpp"
#include "energybench/worker_pool.hpp"

namespace energybench {

namespace {

BuildOutcome failed_outcome(const WorkloadSpec& spec, const std::string& content_hash,
                            ErrorCode code, const std::string& detail,
                            const std::string& build_log = "") {
  auto a = std::make_shared<BuildArtifact>();
  a->spec_name = spec.name;
  a->language = spec.language;
  a->content_hash = content_hash;
  a->build_log = build_log;
  a->status = BuildStatus::failed;
  a->error = code;

  BuildOutcome out;
  out.error.code = code;
  out.error.spec_name = spec.name;
  out.error.language = spec.language;
  out.error.source_path = spec.source_path;
  out.error.detail = detail;
  out.artifact = std::move(a);
  return out;
}

// Tail of a compiler log, enough to diagnose without flooding error output.
std::string log_tail(const std::string& log, std::size_t max_bytes = 4096) {
  if (log.size() <= max_bytes) return log;
  return "..." + log.substr(log.size() - max_bytes);
}

}  // namespace

Builder::Builder(ArtifactStore& store) : store_(store) {}

BuildOutcome Builder::build(const WorkloadSpec& spec) {
  const std::string content_hash = build_content_hash(spec);

  std::promise<BuildOutcome> promise;
  std::shared_future<BuildOutcome> shared;
  bool owner = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = builds_.find(content_hash);
    if (it != builds_.end()) {
      shared = it->second;
    } else {
      shared = promise.get_future().share();
      builds_.emplace(content_hash, shared);
      owner = true;
    }
  }

  if (!owner) {
    // In flight or finished: wait for the single build and share its result.
    BuildOutcome out = shared.get();
    out.cache_hit = true;
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
    if (!out.error.ok()) {
      out.error.spec_name = spec.name;
      out.error.language = spec.language;
      out.error.source_path = spec.source_path;
    }
    return out;
  }

  BuildOutcome out;
  std::uint64_t elapsed_ns = 0;
  {
    ScopeTimer timer(elapsed_ns);
    try {
      out = run_build(spec, content_hash);
    } catch (const std::exception& e) {
      out = failed_outcome(spec, content_hash, ErrorCode::io_error,
                           std::string("build aborted: ") + e.what());
    }
  }
  promise.set_value(out);

  HarnessEvent ev;
  ev.kind = EventKind::build;
  ev.spec_name = spec.name;
  ev.language = spec.language;
  ev.content_hash = content_hash;
  ev.ok = out.error.ok();
  ev.outcome = ev.ok ? to_string(BuildStatus::built) : to_string(out.error.code);
  ev.duration_ns = elapsed_ns;
  ev.compile_invocations = out.artifact->compile_invocations;
  ev.cache_hit = out.cache_hit;
  emit_event(ev);
  if (!ev.ok) global_harness_stats().record_failure(out.error.code);
  return out;
}

BuildOutcome Builder::run_build(const WorkloadSpec& spec, const std::string& content_hash) {
  const IEnvironment* env = environment_for(spec.language);
  if (!env) {
    return failed_outcome(spec, content_hash, ErrorCode::spec_parse_error,
                          "no build environment for language '" + spec.language + "'");
  }

  Error dep_error;
  env->resolve_dependencies(spec, &dep_error);
  if (!dep_error.ok()) {
    return failed_outcome(spec, content_hash, dep_error.code, dep_error.detail);
  }

  if (auto existing = store_.lookup(content_hash)) {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
    BuildOutcome out;
    out.cache_hit = true;
    out.artifact = std::make_shared<const BuildArtifact>(std::move(*existing));
    return out;
  }

  const std::string staging = store_.make_staging_dir();
  if (staging.empty()) {
    return failed_outcome(spec, content_hash, ErrorCode::io_error,
                          "cannot create staging directory under " + store_.root());
  }

  BuildArtifact artifact = env->compile(spec, staging);
  artifact.content_hash = content_hash;
  compile_count_.fetch_add(artifact.compile_invocations, std::memory_order_relaxed);

  if (artifact.status != BuildStatus::built) {
    store_.discard_staging(staging);
    BuildOutcome out = failed_outcome(spec, content_hash, ErrorCode::build_failure,
                                      log_tail(artifact.build_log), artifact.build_log);
    auto failed = std::make_shared<BuildArtifact>(std::move(artifact));
    failed->status = BuildStatus::failed;
    failed->error = ErrorCode::build_failure;
    failed->workdir.clear();
    failed->executable.clear();
    out.artifact = std::move(failed);
    return out;
  }

  Error commit_error;
  if (!store_.commit(artifact, staging, &commit_error)) {
    store_.discard_staging(staging);
    return failed_outcome(spec, content_hash, ErrorCode::io_error, commit_error.detail,
                          artifact.build_log);
  }

  BuildOutcome out;
  out.artifact = std::make_shared<const BuildArtifact>(std::move(artifact));
  return out;
}

std::vector<BuildOutcome> Builder::build_all(const std::vector<WorkloadSpec>& specs,
                                             std::size_t workers) {
  std::vector<BuildOutcome> results;
  results.reserve(specs.size());
  WorkerPool pool(workers);
  std::vector<std::future<BuildOutcome>> pending;
  pending.reserve(specs.size());
  for (const auto& spec : specs) {
    pending.push_back(pool.submit([this, &spec] { return build(spec); }));
  }
  for (auto& f : pending) results.push_back(f.get());
  return results;
}

}  // namespace energybench
