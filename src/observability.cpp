#include "energybench/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "energybench/jsonlite.hpp"
#include "energybench/version.hpp"

namespace energybench {

namespace {

inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const std::size_t b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<HarnessEventHook> g_event_hook{nullptr};

}  // namespace

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::build: return "build";
    case EventKind::trial: return "trial";
    case EventKind::fatal: return "fatal";
  }
  return "unknown";
}

std::uint64_t steady_now_ns() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now().time_since_epoch()).count());
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", mean_us() / 1000.0);
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.50) / 1000.0);
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.95) / 1000.0);
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// HarnessStats
// ---------------------------------------------------------------------------

void HarnessStats::record_failure(ErrorCode code) {
  std::lock_guard<std::mutex> lk(failure_mu_);
  failures_[code] += 1;
}

std::map<std::string, std::uint64_t> HarnessStats::failure_snapshot() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  std::map<std::string, std::uint64_t> out;
  for (const auto& [code, n] : failures_) out[to_string(code)] = n;
  return out;
}

void HarnessStats::record(const HarnessEvent& ev) {
  switch (ev.kind) {
    case EventKind::build:
      builds_total.fetch_add(1, std::memory_order_relaxed);
      if (!ev.ok) builds_failed.fetch_add(1, std::memory_order_relaxed);
      if (ev.cache_hit) build_cache_hits.fetch_add(1, std::memory_order_relaxed);
      compile_invocations.fetch_add(ev.compile_invocations, std::memory_order_relaxed);
      build_latency.record(ev.duration_ns);
      break;
    case EventKind::trial:
      trials_total.fetch_add(1, std::memory_order_relaxed);
      if (ev.ok) {
        trials_passed.fetch_add(1, std::memory_order_relaxed);
      } else {
        trials_failed.fetch_add(1, std::memory_order_relaxed);
      }
      trial_latency.record(ev.duration_ns);
      break;
    case EventKind::fatal:
      fatal_errors.fetch_add(1, std::memory_order_relaxed);
      break;
  }
}

std::string HarnessStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"builds\":{\"total\":";
  out += std::to_string(builds_total.load(std::memory_order_relaxed));
  out += ",\"failed\":";
  out += std::to_string(builds_failed.load(std::memory_order_relaxed));
  out += ",\"cache_hits\":";
  out += std::to_string(build_cache_hits.load(std::memory_order_relaxed));
  out += ",\"compile_invocations\":";
  out += std::to_string(compile_invocations.load(std::memory_order_relaxed));
  out += ",\"latency\":";
  out += build_latency.to_json();
  out += "},\"trials\":{\"total\":";
  out += std::to_string(trials_total.load(std::memory_order_relaxed));
  out += ",\"passed\":";
  out += std::to_string(trials_passed.load(std::memory_order_relaxed));
  out += ",\"failed\":";
  out += std::to_string(trials_failed.load(std::memory_order_relaxed));
  out += ",\"latency\":";
  out += trial_latency.to_json();
  out += "},\"sampler\":{\"windows_opened\":";
  out += std::to_string(windows_opened.load(std::memory_order_relaxed));
  out += ",\"windows_closed\":";
  out += std::to_string(windows_closed.load(std::memory_order_relaxed));
  out += ",\"refusals\":";
  out += std::to_string(sampler_refusals.load(std::memory_order_relaxed));
  out += ",\"wait_ms\":";
  out += jsonlite::format_double(
      static_cast<double>(sampler_wait_ns.load(std::memory_order_relaxed)) / 1e6);
  out += "},\"fatal_errors\":";
  out += std::to_string(fatal_errors.load(std::memory_order_relaxed));
  out += ",\"failures\":{";
  bool first = true;
  for (const auto& [code, n] : failure_snapshot()) {
    if (!first) out += ',';
    first = false;
    out += "\"" + code + "\":" + std::to_string(n);
  }
  out += "}}";
  return out;
}

HarnessStats& global_harness_stats() {
  static HarnessStats inst;
  return inst;
}

std::string event_to_json(const HarnessEvent& ev) {
  jsonlite::Object o;
  o["v"] = static_cast<std::uint64_t>(version::EVENT_LOG_VERSION);
  o["kind"] = to_string(ev.kind);
  o["spec"] = ev.spec_name;
  o["language"] = ev.language;
  if (!ev.content_hash.empty()) o["content_hash"] = ev.content_hash;
  o["outcome"] = ev.outcome;
  o["ok"] = ev.ok;
  o["duration_ns"] = ev.duration_ns;
  if (ev.kind == EventKind::trial) {
    o["trial"] = static_cast<std::uint64_t>(ev.trial_index);
    o["energy_joules"] = ev.energy_joules ? jsonlite::Value{*ev.energy_joules}
                                          : jsonlite::Value{nullptr};
  }
  if (ev.kind == EventKind::build) {
    o["compile_invocations"] = static_cast<std::uint64_t>(ev.compile_invocations);
    o["cache_hit"] = ev.cache_hit;
  }
  if (!ev.detail.empty()) o["detail"] = ev.detail;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

void set_event_hook(HarnessEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_event(const HarnessEvent& ev) {
  global_harness_stats().record(ev);

  HarnessEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: ENERGYBENCH_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("ENERGYBENCH_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';
  // O_APPEND keeps lines from concurrent emitters whole for writes < PIPE_BUF.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace energybench
