#pragma once

// energybench/observability.hpp — Structured harness events and counters.
//
// DESIGN:
//   HarnessEvent is the one observable unit. Every build, trial and fatal
//   error emits exactly one event, which is:
//     - recorded in the process-wide HarnessStats (always);
//     - passed to an installed hook, if any; otherwise
//     - appended as one JSON line to the file named by ENERGYBENCH_EVENT_LOG.
//   Events carry digests, outcomes and timings only. Captured stdout of a
//   workload never goes into an event.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "energybench/types.hpp"

namespace energybench {

enum class EventKind {
  build,
  trial,
  fatal,
};

std::string to_string(EventKind kind);

struct HarnessEvent {
  EventKind kind{EventKind::trial};
  std::string spec_name;
  std::string language;
  std::string content_hash;
  std::string outcome;  // TrialOutcome / BuildStatus / ErrorCode text
  bool ok{false};
  std::uint64_t duration_ns{0};
  std::optional<double> energy_joules;
  std::uint32_t trial_index{0};
  std::uint32_t compile_invocations{0};
  bool cache_hit{false};
  std::string detail;
};

std::string event_to_json(const HarnessEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two microsecond buckets.
// Bucket i covers [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// ---------------------------------------------------------------------------
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 40;

  void record(std::uint64_t duration_ns);
  double percentile(double p) const;  // microseconds, 0.0 when empty

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;
  std::string to_json() const;

 private:
  std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// HarnessStats — process-wide counters. All members are safe to update from
// any thread.
// ---------------------------------------------------------------------------
class HarnessStats {
 public:
  void record(const HarnessEvent& ev);
  void record_failure(ErrorCode code);
  std::string to_json() const;

  std::atomic<std::uint64_t> builds_total{0};
  std::atomic<std::uint64_t> builds_failed{0};
  std::atomic<std::uint64_t> build_cache_hits{0};
  std::atomic<std::uint64_t> compile_invocations{0};

  std::atomic<std::uint64_t> trials_total{0};
  std::atomic<std::uint64_t> trials_passed{0};
  std::atomic<std::uint64_t> trials_failed{0};

  std::atomic<std::uint64_t> fatal_errors{0};

  // Sampler gate accounting, updated by SamplerChannel.
  std::atomic<std::uint64_t> windows_opened{0};
  std::atomic<std::uint64_t> windows_closed{0};
  std::atomic<std::uint64_t> sampler_refusals{0};
  std::atomic<std::uint64_t> sampler_wait_ns{0};

  LatencyHistogram build_latency;
  LatencyHistogram trial_latency;

  std::map<std::string, std::uint64_t> failure_snapshot() const;

 private:
  mutable std::mutex failure_mu_;
  std::map<ErrorCode, std::uint64_t> failures_;
};

HarnessStats& global_harness_stats();

// Fire-and-forget. Never throws, never blocks on the workload.
void emit_event(const HarnessEvent& ev);

using HarnessEventHook = void (*)(const HarnessEvent&);
void set_event_hook(HarnessEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

// Monotonic nanoseconds from the steady clock.
std::uint64_t steady_now_ns();

}  // namespace energybench
