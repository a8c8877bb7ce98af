#pragma once

// energybench/types.hpp — Core data structures for the energybench measurement engine.
//
// OWNERSHIP:
//   - WorkloadSpec is immutable once SpecRegistry has loaded it. Consumers hold it
//     by const reference or copy; no component mutates a loaded spec.
//   - BuildArtifact is owned by the Builder cache and shared as
//     std::shared_ptr<const BuildArtifact>. Trials refer to it by content_hash.
//   - Trial is a value type, immutable once the TrialRunner returns it.
//   - MeasurementSummary is always derived. It can be recomputed from a TrialSet
//     at any time and is never the source of truth.
//
// IDENTITY:
//   A workload is identified by (name, language) where language is the canonical
//   name from environment.hpp (aliases are resolved during loading).

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace energybench {

enum class ErrorCode {
  none,
  spec_parse_error,
  config_error,
  missing_dependency,
  build_failure,
  timeout,
  output_mismatch,
  non_zero_exit,
  measurement_unavailable,
  not_found,
  spawn_failed,
  io_error,
  cancelled,
};

std::string to_string(ErrorCode code);

// Every error names the workload it came from. spec_name/language are empty only
// for errors raised before a spec could be identified (unreadable file).
struct Error {
  ErrorCode code{ErrorCode::none};
  std::string spec_name;
  std::string language;
  std::string detail;
  std::string source_path;

  bool ok() const { return code == ErrorCode::none; }
  std::string describe() const;
};

// How repeated executions of one spec map onto sampling windows.
//   per_invocation: one process invocation per window (default).
//   shared_window:  the workload loops internally ENERGYBENCH_ITERATIONS times
//                   inside a single window.
// Upper bound for any timeout_ms, harness-wide or per spec (one day).
constexpr std::uint64_t kMaxTimeoutMs = 24ull * 60 * 60 * 1000;

// setpriority(2) range. 0 leaves the scheduling priority unchanged.
constexpr int kMinNiceness = -20;
constexpr int kMaxNiceness = 19;

enum class SamplingMode {
  per_invocation,
  shared_window,
};

std::string to_string(SamplingMode mode);
std::optional<SamplingMode> parse_sampling_mode(const std::string& text);

struct WorkloadSpec {
  std::string name;
  std::string language;
  std::string code;
  std::optional<std::string> description;
  std::vector<std::string> dependencies;
  std::vector<std::string> options;
  std::vector<std::string> args;
  std::string expected_stdout;

  // Optional execution parameters. Unset fields fall back to HarnessConfig.
  std::string stdin_text;
  std::optional<std::uint64_t> timeout_ms;
  std::optional<std::uint32_t> trials;
  std::uint32_t iterations{1};
  SamplingMode sampling{SamplingMode::per_invocation};
  std::optional<int> niceness;

  std::string source_path;

  std::string key() const { return name + "/" + language; }
};

enum class BuildStatus {
  pending,
  built,
  failed,
};

std::string to_string(BuildStatus status);

struct BuildArtifact {
  std::string spec_name;
  std::string language;
  std::string content_hash;
  std::string workdir;     // absolute directory holding build outputs
  std::string executable;  // absolute path of the produced program (or staged script)
  std::string build_log;
  BuildStatus status{BuildStatus::pending};
  ErrorCode error{ErrorCode::none};  // build_failure or missing_dependency when failed
  std::uint32_t compile_invocations{0};  // 0 when served from cache
  std::uint64_t build_duration_ns{0};
};

enum class TrialOutcome {
  pass,
  output_mismatch,
  non_zero_exit,
  timeout,
  build_failure,
  measurement_unavailable,
};

std::string to_string(TrialOutcome outcome);
ErrorCode error_for(TrialOutcome outcome);

// First differing line between normalized expected and actual output.
// line is 1-based. A missing line on either side is reported as "<eof>".
struct LineMismatch {
  std::size_t line{0};
  std::string expected;
  std::string actual;
};

struct Trial {
  std::string spec_name;
  std::string language;
  std::string artifact_hash;
  std::uint32_t index{0};
  std::uint32_t iterations{1};
  std::uint64_t start_ns{0};  // steady clock
  std::uint64_t end_ns{0};
  std::optional<double> energy_joules;  // whole window
  int exit_code{0};
  std::string captured_stdout;
  TrialOutcome outcome{TrialOutcome::measurement_unavailable};
  std::optional<LineMismatch> first_mismatch;
  std::string detail;
  std::map<std::string, double> perf_counters;  // event -> count, perf mode only

  double duration_ms() const {
    return end_ns > start_ns ? static_cast<double>(end_ns - start_ns) / 1e6 : 0.0;
  }
  // Energy attributed to one internal iteration of the workload.
  std::optional<double> energy_per_iteration() const {
    if (!energy_joules) return std::nullopt;
    return *energy_joules / static_cast<double>(iterations == 0 ? 1 : iterations);
  }
};

using TrialSet = std::vector<Trial>;

struct SampleStats {
  std::size_t sample_count{0};
  double mean{0.0};
  double stddev{0.0};
  double min{0.0};
  double max{0.0};
  double ci_low{0.0};
  double ci_high{0.0};
};

struct MeasurementSummary {
  std::string spec_name;
  std::string language;
  std::size_t trial_count{0};
  std::size_t discarded_warmup{0};
  std::size_t rejected_outliers{0};
  double pass_rate{0.0};
  SampleStats energy_joules;  // per iteration
  SampleStats time_ms;        // per window
  std::map<std::string, double> perf_means;  // per event, over the kept trials
};

}  // namespace energybench
