#pragma once

// energybench/trial_runner.hpp — Execute one spec's trials inside sampling windows.
//
// Per trial:
//   Idle -> Building -> SamplerAcquire -> Executing -> Validating -> Recorded
//        -> SamplerRelease
//
// Building asks the Builder for the spec's artifact (a cache hit after the
// first trial). A failed build records a single BuildFailure trial and ends the
// trial set without opening a window.
//
// SamplerAcquire blocks on the process-wide sampler lock. A refused start()
// records a MeasurementUnavailable trial and sets the fatal error; the process
// is not started.
//
// Executing runs the workload with the plan's timeout and niceness, wrapped in
// `perf stat` when the plan lists perf events. The window is closed
// as soon as the process has exited or been killed, before validation, so a
// timeout still issues exactly one stop().
//
// Recorded hands the finished trial to the on_trial callback while the
// sampler lock is still held; SamplerRelease then drops the lock.
//
// Cancellation is observed only between trials. A request raised during a
// trial takes effect after that trial's SamplerRelease.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "energybench/builder.hpp"
#include "energybench/energy_sampler.hpp"
#include "energybench/types.hpp"

namespace energybench {

enum class TrialState {
  idle,
  building,
  sampler_acquire,
  executing,
  validating,
  recorded,
  sampler_release,
};

std::string to_string(TrialState state);

// Cancelled when cancel() was called on it or on its parent.
class CancellationToken {
 public:
  explicit CancellationToken(const CancellationToken* parent = nullptr) : parent_(parent) {}

  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const {
    return cancelled_.load(std::memory_order_acquire) || (parent_ && parent_->cancelled());
  }
  void reset() { cancelled_.store(false, std::memory_order_release); }

 private:
  std::atomic<bool> cancelled_{false};
  const CancellationToken* parent_;
};

struct TrialPlan {
  std::uint32_t trials{1};
  std::uint64_t timeout_ms{60000};
  std::uint64_t cooldown_ms{0};
  std::uint32_t iterations{1};  // used only in shared_window mode
  SamplingMode sampling{SamplingMode::per_invocation};
  int niceness{0};
  std::vector<std::string> perf_events;  // empty: no perf wrapper
  std::string perf_command{"perf"};
};

// Environment variable that tells an iteration-aware workload how many
// internal iterations to run inside one window.
constexpr char kIterationsEnv[] = "ENERGYBENCH_ITERATIONS";

// CRLF/CR -> LF, trailing spaces/tabs stripped per line, trailing empty lines
// dropped, every remaining line terminated with LF.
std::string normalize_output(const std::string& text);

// Normalized oracle for a window covering `iterations` internal iterations.
std::string expected_for_window(const std::string& expected_stdout, std::uint32_t iterations);

// First differing line of two normalized texts, nullopt when equal.
std::optional<LineMismatch> first_mismatch(const std::string& expected,
                                           const std::string& actual);

// Counters from `perf stat -x ,` output. Comment lines and events perf could
// not count ("<not counted>", "<not supported>") are skipped; a repeated event
// (one line per CPU or interval) is summed.
std::map<std::string, double> parse_perf_stat_csv(const std::string& text);

using TransitionHook = std::function<void(const WorkloadSpec& spec, std::uint32_t trial_index,
                                          TrialState from, TrialState to)>;

struct TrialSetResult {
  TrialSet trials;
  Error fatal;           // measurement_unavailable ends the whole run
  Error spec_error;      // build/dependency failure for this spec only
  bool cancelled{false};
};

class TrialRunner {
 public:
  TrialRunner(Builder& builder, SamplerChannel& channel);

  void set_transition_hook(TransitionHook hook) { hook_ = std::move(hook); }

  // One trial. Sets *fatal when the sampler refused or could not be read.
  Trial run_trial(const WorkloadSpec& spec, std::uint32_t index, const TrialPlan& plan,
                  const std::function<void(const Trial&)>& on_trial, Error* spec_error,
                  Error* fatal);

  // plan.trials trials in order. Stops early on a build failure, a fatal
  // sampler error, or cancellation between trials.
  TrialSetResult run_trials(const WorkloadSpec& spec, const TrialPlan& plan,
                            const CancellationToken* token = nullptr,
                            const std::function<void(const Trial&)>& on_trial = {});

 private:
  void transition(const WorkloadSpec& spec, std::uint32_t index, TrialState& state,
                  TrialState next) const;
  void record(const WorkloadSpec& spec, std::uint32_t index, TrialState& state, Trial& trial,
              const std::function<void(const Trial&)>& on_trial) const;

  Builder& builder_;
  SamplerChannel& channel_;
  TransitionHook hook_;
};

}  // namespace energybench
