#pragma once

// energybench/harness.hpp — Build and measure a set of workload specs.
//
// run() has two phases:
//   1. Build: every spec goes through Builder::build_all on a bounded pool of
//      config.build_workers threads. Identical specs collapse to one build.
//   2. Measure: config.measure_workers threads each take whole specs and run
//      their trial sets. All of them contend for the one sampler lock, so at
//      most one window is open at any instant.
//
// Error propagation:
//   - build or dependency failure: recorded as that spec's error (plus its one
//     BuildFailure trial); other specs continue;
//   - Timeout / OutputMismatch / NonZeroExit: failed trials; the run continues;
//   - MeasurementUnavailable: fatal. The first one is stored in
//     HarnessResult::fatal, every worker stops before its next trial, and
//     no further spec is started.
//   - cancellation: honored between trials; HarnessResult::cancelled is set.

#include <memory>
#include <mutex>
#include <vector>

#include "energybench/aggregator.hpp"
#include "energybench/artifact_store.hpp"
#include "energybench/builder.hpp"
#include "energybench/config.hpp"
#include "energybench/energy_sampler.hpp"
#include "energybench/trial_runner.hpp"
#include "energybench/types.hpp"

namespace energybench {

struct HarnessResult {
  std::vector<MeasurementSummary> summaries;  // input order, specs with trials only
  std::vector<Error> spec_errors;
  Error fatal;
  bool cancelled{false};
  std::uint64_t compile_count{0};

  bool ok() const { return fatal.ok() && !cancelled && spec_errors.empty(); }
};

class Harness {
 public:
  Harness(HarnessConfig config, IEnergySampler& sampler);

  HarnessResult run(const std::vector<WorkloadSpec>& specs,
                    const CancellationToken* token = nullptr);

  TrialPlan plan_for(const WorkloadSpec& spec) const;

  void set_transition_hook(TransitionHook hook) { runner_.set_transition_hook(std::move(hook)); }

  const HarnessConfig& config() const { return config_; }
  Aggregator& aggregator() { return aggregator_; }
  Builder& builder() { return builder_; }
  ArtifactStore& store() { return store_; }

 private:
  HarnessConfig config_;
  ArtifactStore store_;
  Builder builder_;
  SamplerChannel channel_;
  TrialRunner runner_;
  Aggregator aggregator_;
};

// Sampler selected by config.sampler.
std::unique_ptr<IEnergySampler> make_sampler(const HarnessConfig& config);

}  // namespace energybench
