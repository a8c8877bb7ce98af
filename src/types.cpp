#include "energybench/types.hpp"

namespace energybench {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "none";
    case ErrorCode::spec_parse_error: return "spec_parse_error";
    case ErrorCode::config_error: return "config_error";
    case ErrorCode::missing_dependency: return "missing_dependency";
    case ErrorCode::build_failure: return "build_failure";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::output_mismatch: return "output_mismatch";
    case ErrorCode::non_zero_exit: return "non_zero_exit";
    case ErrorCode::measurement_unavailable: return "measurement_unavailable";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::cancelled: return "cancelled";
  }
  return "unknown";
}

std::string Error::describe() const {
  std::string out = to_string(code);
  if (!spec_name.empty() || !language.empty()) {
    out += " [" + spec_name + " " + language + "]";
  }
  if (!source_path.empty()) out += " (" + source_path + ")";
  if (!detail.empty()) out += ": " + detail;
  return out;
}

std::string to_string(SamplingMode mode) {
  switch (mode) {
    case SamplingMode::per_invocation: return "per_invocation";
    case SamplingMode::shared_window: return "shared_window";
  }
  return "per_invocation";
}

std::optional<SamplingMode> parse_sampling_mode(const std::string& text) {
  if (text == "per_invocation") return SamplingMode::per_invocation;
  if (text == "shared_window") return SamplingMode::shared_window;
  return std::nullopt;
}

std::string to_string(BuildStatus status) {
  switch (status) {
    case BuildStatus::pending: return "pending";
    case BuildStatus::built: return "built";
    case BuildStatus::failed: return "failed";
  }
  return "pending";
}

std::string to_string(TrialOutcome outcome) {
  switch (outcome) {
    case TrialOutcome::pass: return "pass";
    case TrialOutcome::output_mismatch: return "output_mismatch";
    case TrialOutcome::non_zero_exit: return "non_zero_exit";
    case TrialOutcome::timeout: return "timeout";
    case TrialOutcome::build_failure: return "build_failure";
    case TrialOutcome::measurement_unavailable: return "measurement_unavailable";
  }
  return "measurement_unavailable";
}

ErrorCode error_for(TrialOutcome outcome) {
  switch (outcome) {
    case TrialOutcome::pass: return ErrorCode::none;
    case TrialOutcome::output_mismatch: return ErrorCode::output_mismatch;
    case TrialOutcome::non_zero_exit: return ErrorCode::non_zero_exit;
    case TrialOutcome::timeout: return ErrorCode::timeout;
    case TrialOutcome::build_failure: return ErrorCode::build_failure;
    case TrialOutcome::measurement_unavailable: return ErrorCode::measurement_unavailable;
  }
  return ErrorCode::none;
}

}  // namespace energybench
