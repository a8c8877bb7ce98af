#include "energybench/harness.hpp"

#include <future>

#include "energybench/observability.hpp"
#include "energybench/worker_pool.hpp"

namespace energybench {

Harness::Harness(HarnessConfig config, IEnergySampler& sampler)
    : config_(std::move(config)),
      store_(config_.cache_root, config_.log_compression),
      builder_(store_),
      channel_(sampler),
      runner_(builder_, channel_),
      aggregator_(AggregatorOptions{config_.warmup_discard, kOutlierIqrMultiple}) {}

TrialPlan Harness::plan_for(const WorkloadSpec& spec) const {
  TrialPlan plan;
  plan.trials = spec.trials.value_or(config_.trials);
  plan.timeout_ms = spec.timeout_ms.value_or(config_.timeout_ms);
  plan.cooldown_ms = config_.cooldown_ms;
  plan.iterations = spec.iterations;
  plan.sampling = spec.sampling;
  plan.niceness = spec.niceness.value_or(config_.niceness);
  plan.perf_events = config_.perf_events;
  plan.perf_command = config_.perf_command;
  return plan;
}

HarnessResult Harness::run(const std::vector<WorkloadSpec>& specs,
                           const CancellationToken* token) {
  HarnessResult result;
  CancellationToken stop(token);

  builder_.build_all(specs, effective_build_workers(config_));

  std::mutex result_mu;
  std::vector<TrialSetResult> per_spec(specs.size());
  {
    WorkerPool pool(config_.measure_workers);
    std::vector<std::future<void>> pending;
    pending.reserve(specs.size());
    for (std::size_t i = 0; i < specs.size(); ++i) {
      pending.push_back(pool.submit([&, i] {
        if (stop.cancelled()) {
          per_spec[i].cancelled = true;
          return;
        }
        TrialSetResult r = runner_.run_trials(
            specs[i], plan_for(specs[i]), &stop,
            [this](const Trial& trial) { aggregator_.ingest(trial); });
        if (!r.fatal.ok()) {
          std::lock_guard<std::mutex> lk(result_mu);
          if (result.fatal.ok()) {
            result.fatal = r.fatal;
            HarnessEvent ev;
            ev.kind = EventKind::fatal;
            ev.spec_name = r.fatal.spec_name;
            ev.language = r.fatal.language;
            ev.outcome = to_string(r.fatal.code);
            ev.detail = r.fatal.detail;
            emit_event(ev);
          }
          stop.cancel();
        }
        per_spec[i] = std::move(r);
      }));
    }
    for (auto& f : pending) f.get();
  }

  for (std::size_t i = 0; i < specs.size(); ++i) {
    const TrialSetResult& r = per_spec[i];
    if (!r.spec_error.ok()) result.spec_errors.push_back(r.spec_error);
    if (!r.trials.empty()) {
      result.summaries.push_back(aggregator_.snapshot(specs[i].name, specs[i].language));
    }
  }
  // A stop caused by the fatal error is not a user cancellation.
  result.cancelled = token && token->cancelled();
  result.compile_count = builder_.compile_count();
  return result;
}

std::unique_ptr<IEnergySampler> make_sampler(const HarnessConfig& config) {
  if (config.sampler == "powercap") return std::make_unique<PowercapSampler>(config.powercap_root);
  return std::make_unique<UnavailableSampler>();
}

}  // namespace energybench
