#pragma once

// energybench/config.hpp — Harness configuration.
//
// Precedence, lowest first: built-in defaults, a JSON config file
// (from_json), ENERGYBENCH_* environment variables (from_env). Per-spec fields
// (timeout_ms, trials, iterations, niceness) override the harness values for
// that spec.
//
// Perf-counter mode: when perf_events is non-empty every measured run is
// wrapped in `perf_command stat -x , -o <file> -e <events> --` and the
// counters land in Trial::perf_counters. The wrapper runs inside the sampling
// window, so its overhead is part of the measured energy.
//
// validate_config() reports problems as data and never throws; the CLI refuses
// to run when errors is non-empty and prints warnings otherwise.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "energybench/types.hpp"

namespace energybench {

struct HarnessConfig {
  std::string cache_root{".energybench/cache"};
  std::uint32_t trials{10};
  std::uint64_t timeout_ms{60000};
  std::uint64_t cooldown_ms{0};
  std::size_t warmup_discard{0};
  std::size_t build_workers{0};    // 0 = hardware concurrency
  std::size_t measure_workers{1};  // threads queueing for the sampler lock
  std::string sampler{"powercap"};  // "powercap" | "none"
  std::string powercap_root{"/sys/class/powercap"};
  std::string log_compression{"off"};  // "off" | "zstd"
  int niceness{0};                     // kMinNiceness..kMaxNiceness, 0 = unchanged
  std::vector<std::string> perf_events;  // empty disables perf-counter mode
  std::string perf_command{"perf"};
};

struct ConfigValidation {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  bool ok() const { return errors.empty(); }
};

// Overlay a JSON object onto base. Unknown keys are ignored; keys of the wrong
// type are errors.
HarnessConfig config_from_json(const std::string& text, const HarnessConfig& base,
                               Error* error);

// Overlay ENERGYBENCH_* environment variables onto base. Unparseable values
// are skipped and reported in *warnings.
HarnessConfig config_from_env(const HarnessConfig& base,
                              std::vector<std::string>* warnings = nullptr);

ConfigValidation validate_config(const HarnessConfig& config);

std::string config_to_json(const HarnessConfig& config);

// Effective worker count (resolves 0 to hardware concurrency).
std::size_t effective_build_workers(const HarnessConfig& config);

}  // namespace energybench
