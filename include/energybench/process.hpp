#pragma once

// energybench/process.hpp — Subprocess execution for build and run steps.
//
// run_process() forks, places the child in its own session (process group),
// feeds stdin_text through a pipe, collects stdout/stderr and enforces a
// wall-clock timeout. On expiry the whole process group is SIGKILLed, so
// workloads that spawn helpers (JVM, dotnet host) are terminated too.
//
// Exit code convention:
//   normal exit   -> WEXITSTATUS
//   signalled     -> 128 + signal
//   timed out     -> 124, timed_out = true
//   spawn failure -> 127, error_message set
//
// A niceness the caller may not set (negative values need CAP_SYS_NICE) does
// not abort the child: a warning goes to its stderr and it runs at the
// inherited priority, as nice(1) does.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "energybench/types.hpp"

namespace energybench {

struct ProcessSpec {
  std::string command;  // absolute path, or a bare name resolved on PATH
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;  // overlaid on the harness environment
  std::string cwd;
  std::string stdin_text;
  std::uint64_t timeout_ms{60000};  // clamped to kMaxTimeoutMs
  std::size_t max_output_bytes{64 * 1024 * 1024};
  int niceness{0};  // applied with setpriority() in the child; 0 = unchanged
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;
  std::uint64_t duration_ns{0};

  bool spawned() const { return error_message.empty(); }
};

ProcessResult run_process(const ProcessSpec& spec);

// Resolve a bare program name against PATH. Names containing '/' are checked
// directly. Returns nullopt when no executable file is found.
std::optional<std::string> find_executable(const std::string& name);

// Look for a shared library "lib<name>.so*" in LD_LIBRARY_PATH and the
// standard system library directories.
std::optional<std::string> find_shared_library(const std::string& name);

}  // namespace energybench
