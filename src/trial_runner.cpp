#include "energybench/trial_runner.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include "energybench/environment.hpp"
#include "energybench/observability.hpp"
#include "energybench/process.hpp"

namespace energybench {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find('\n', pos);
    if (nl == std::string::npos) {
      lines.push_back(text.substr(pos));
      break;
    }
    lines.push_back(text.substr(pos, nl - pos));
    pos = nl + 1;
  }
  return lines;
}

std::string tail(const std::string& text, std::size_t max_bytes = 2048) {
  if (text.size() <= max_bytes) return text;
  return "..." + text.substr(text.size() - max_bytes);
}

// Sleep up to ms, waking early on cancellation.
void cooldown(std::uint64_t ms, const CancellationToken* token) {
  const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  while (std::chrono::steady_clock::now() < until) {
    if (token && token->cancelled()) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(std::min<std::uint64_t>(ms, 20)));
  }
}

std::string perf_output_path() {
  static std::atomic<std::uint64_t> counter{0};
  const auto name = "energybench-perf-" + std::to_string(::getpid()) + "-" +
                    std::to_string(counter.fetch_add(1)) + ".csv";
  return (std::filesystem::temp_directory_path() / name).string();
}

std::string join(const std::vector<std::string>& items, char sep) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += sep;
    out += item;
  }
  return out;
}

}  // namespace

std::map<std::string, double> parse_perf_stat_csv(const std::string& text) {
  std::map<std::string, double> counters;
  std::stringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.empty() || line[0] == '#') continue;
    std::vector<std::string> fields;
    std::stringstream cols(line);
    std::string col;
    while (std::getline(cols, col, ',')) fields.push_back(col);
    // value,unit,event,...
    if (fields.size() < 3 || fields[2].empty()) continue;
    char* end = nullptr;
    const double value = std::strtod(fields[0].c_str(), &end);
    if (fields[0].empty() || !end || *end != '\0') continue;
    counters[fields[2]] += value;
  }
  return counters;
}

std::string to_string(TrialState state) {
  switch (state) {
    case TrialState::idle: return "idle";
    case TrialState::building: return "building";
    case TrialState::sampler_acquire: return "sampler_acquire";
    case TrialState::executing: return "executing";
    case TrialState::validating: return "validating";
    case TrialState::recorded: return "recorded";
    case TrialState::sampler_release: return "sampler_release";
  }
  return "unknown";
}

std::string normalize_output(const std::string& text) {
  std::string unified;
  unified.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      unified.push_back('\n');
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
    } else {
      unified.push_back(text[i]);
    }
  }

  std::vector<std::string> lines = split_lines(unified);
  for (auto& line : lines) {
    const auto end = line.find_last_not_of(" \t");
    line.erase(end == std::string::npos ? 0 : end + 1);
  }
  while (!lines.empty() && lines.back().empty()) lines.pop_back();

  std::string out;
  out.reserve(unified.size());
  for (const auto& line : lines) {
    out += line;
    out += '\n';
  }
  return out;
}

std::string expected_for_window(const std::string& expected_stdout, std::uint32_t iterations) {
  const std::string once = normalize_output(expected_stdout);
  std::string out;
  out.reserve(once.size() * std::max<std::uint32_t>(iterations, 1));
  for (std::uint32_t i = 0; i < std::max<std::uint32_t>(iterations, 1); ++i) out += once;
  return out;
}

std::optional<LineMismatch> first_mismatch(const std::string& expected,
                                           const std::string& actual) {
  if (expected == actual) return std::nullopt;
  const auto e = split_lines(expected);
  const auto a = split_lines(actual);
  const std::size_t n = std::max(e.size(), a.size());
  for (std::size_t i = 0; i < n; ++i) {
    const std::string exp = i < e.size() ? e[i] : "<eof>";
    const std::string act = i < a.size() ? a[i] : "<eof>";
    if (i >= e.size() || i >= a.size() || e[i] != a[i]) {
      return LineMismatch{i + 1, exp, act};
    }
  }
  return std::nullopt;
}

TrialRunner::TrialRunner(Builder& builder, SamplerChannel& channel)
    : builder_(builder), channel_(channel) {}

void TrialRunner::transition(const WorkloadSpec& spec, std::uint32_t index, TrialState& state,
                             TrialState next) const {
  const TrialState from = state;
  state = next;
  if (hook_) hook_(spec, index, from, next);
}

void TrialRunner::record(const WorkloadSpec& spec, std::uint32_t index, TrialState& state,
                         Trial& trial, const std::function<void(const Trial&)>& on_trial) const {
  transition(spec, index, state, TrialState::recorded);
  if (on_trial) on_trial(trial);

  HarnessEvent ev;
  ev.kind = EventKind::trial;
  ev.spec_name = trial.spec_name;
  ev.language = trial.language;
  ev.content_hash = trial.artifact_hash;
  ev.outcome = to_string(trial.outcome);
  ev.ok = trial.outcome == TrialOutcome::pass;
  ev.duration_ns = trial.end_ns - trial.start_ns;
  ev.energy_joules = trial.energy_joules;
  ev.trial_index = trial.index;
  if (!ev.ok) {
    ev.detail = trial.detail;
    global_harness_stats().record_failure(error_for(trial.outcome));
  }
  emit_event(ev);
}

Trial TrialRunner::run_trial(const WorkloadSpec& spec, std::uint32_t index,
                             const TrialPlan& plan,
                             const std::function<void(const Trial&)>& on_trial,
                             Error* spec_error, Error* fatal) {
  TrialState state = TrialState::idle;
  Trial trial;
  trial.spec_name = spec.name;
  trial.language = spec.language;
  trial.index = index;
  trial.iterations = plan.sampling == SamplingMode::shared_window
                         ? std::max<std::uint32_t>(plan.iterations, 1)
                         : 1;

  transition(spec, index, state, TrialState::building);
  const BuildOutcome built = builder_.build(spec);
  trial.artifact_hash = built.artifact->content_hash;
  if (!built.error.ok() || built.artifact->status != BuildStatus::built) {
    trial.outcome = TrialOutcome::build_failure;
    trial.detail = built.error.describe();
    trial.start_ns = trial.end_ns = steady_now_ns();
    if (spec_error) *spec_error = built.error;
    record(spec, index, state, trial, on_trial);
    return trial;
  }
  const BuildArtifact& artifact = *built.artifact;
  const IEnvironment* env = environment_for(spec.language);

  transition(spec, index, state, TrialState::sampler_acquire);
  SamplingWindow window = channel_.acquire();
  if (window.refused()) {
    trial.outcome = TrialOutcome::measurement_unavailable;
    trial.detail = "energy sampler refused to open a window (" +
                   channel_.sampler().sampler_id() + ")";
    trial.start_ns = trial.end_ns = steady_now_ns();
    if (fatal) {
      fatal->code = ErrorCode::measurement_unavailable;
      fatal->spec_name = spec.name;
      fatal->language = spec.language;
      fatal->source_path = spec.source_path;
      fatal->detail = trial.detail;
    }
    record(spec, index, state, trial, on_trial);
    transition(spec, index, state, TrialState::sampler_release);
    return trial;
  }

  transition(spec, index, state, TrialState::executing);
  const RunCommand cmd = env->run_command(artifact, spec.args);
  ProcessSpec ps;
  ps.command = cmd.path;
  ps.argv = cmd.argv;
  ps.env = cmd.env;
  ps.env[kIterationsEnv] = std::to_string(trial.iterations);
  ps.cwd = artifact.workdir;
  ps.stdin_text = spec.stdin_text;
  ps.timeout_ms = plan.timeout_ms;
  ps.niceness = plan.niceness;

  std::string perf_file;
  if (!plan.perf_events.empty()) {
    perf_file = perf_output_path();
    std::vector<std::string> wrapped = {"stat", "-x", ",", "-o", perf_file,
                                        "-e", join(plan.perf_events, ','), "--", ps.command};
    wrapped.insert(wrapped.end(), ps.argv.begin(), ps.argv.end());
    ps.command = plan.perf_command;
    ps.argv = std::move(wrapped);
  }

  trial.start_ns = steady_now_ns();
  const ProcessResult proc = run_process(ps);
  trial.end_ns = steady_now_ns();
  trial.energy_joules = window.close();
  trial.exit_code = proc.exit_code;
  trial.captured_stdout = proc.stdout_text;

  std::string perf_note;
  if (!perf_file.empty()) {
    std::ifstream ifs(perf_file, std::ios::binary);
    if (ifs) {
      const std::string text((std::istreambuf_iterator<char>(ifs)),
                             std::istreambuf_iterator<char>());
      trial.perf_counters = parse_perf_stat_csv(text);
    }
    if (trial.perf_counters.empty()) perf_note = "no perf counters recorded";
    std::error_code ec;
    std::filesystem::remove(perf_file, ec);
  }

  transition(spec, index, state, TrialState::validating);
  if (!trial.energy_joules) {
    trial.outcome = TrialOutcome::measurement_unavailable;
    trial.detail = "energy reading unavailable after stop() (" +
                   channel_.sampler().sampler_id() + ")";
    if (fatal) {
      fatal->code = ErrorCode::measurement_unavailable;
      fatal->spec_name = spec.name;
      fatal->language = spec.language;
      fatal->source_path = spec.source_path;
      fatal->detail = trial.detail;
    }
  } else if (proc.timed_out) {
    trial.outcome = TrialOutcome::timeout;
    trial.detail = "killed after " + std::to_string(plan.timeout_ms) + " ms";
  } else if (!proc.spawned()) {
    trial.outcome = TrialOutcome::non_zero_exit;
    trial.detail = proc.error_message;
  } else if (proc.exit_code != 0) {
    trial.outcome = TrialOutcome::non_zero_exit;
    trial.detail = "exit code " + std::to_string(proc.exit_code);
    if (!proc.stderr_text.empty()) trial.detail += ": " + tail(proc.stderr_text);
  } else {
    const std::string expected = expected_for_window(spec.expected_stdout, trial.iterations);
    const std::string actual = normalize_output(proc.stdout_text);
    trial.first_mismatch = first_mismatch(expected, actual);
    if (trial.first_mismatch) {
      trial.outcome = TrialOutcome::output_mismatch;
      trial.detail = "line " + std::to_string(trial.first_mismatch->line) + ": expected \"" +
                     trial.first_mismatch->expected + "\", got \"" +
                     trial.first_mismatch->actual + "\"";
    } else {
      trial.outcome = TrialOutcome::pass;
    }
  }
  if (!perf_note.empty()) trial.detail += trial.detail.empty() ? perf_note : "; " + perf_note;

  record(spec, index, state, trial, on_trial);
  transition(spec, index, state, TrialState::sampler_release);
  return trial;
}

TrialSetResult TrialRunner::run_trials(const WorkloadSpec& spec, const TrialPlan& plan,
                                       const CancellationToken* token,
                                       const std::function<void(const Trial&)>& on_trial) {
  TrialSetResult result;
  for (std::uint32_t i = 0; i < plan.trials; ++i) {
    if (token && token->cancelled()) {
      result.cancelled = true;
      break;
    }
    result.trials.push_back(run_trial(spec, i, plan, on_trial, &result.spec_error,
                                      &result.fatal));
    if (!result.fatal.ok() || !result.spec_error.ok()) break;
    if (plan.cooldown_ms > 0 && i + 1 < plan.trials) cooldown(plan.cooldown_ms, token);
  }
  return result;
}

}  // namespace energybench
