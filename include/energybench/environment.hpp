#pragma once

// energybench/environment.hpp — Per-language build/run capability set.
//
// Each supported language is one IEnvironment implementation. Selection goes
// through environment_for(language), a static table keyed by the canonical
// language name and every alias ("c++", "cpp", "cplusplus" → "c++").
//
// CONTRACT:
//   resolve_dependencies(spec): ordered list of host components the spec
//     needs: the language toolchain first, then spec.dependencies in order.
//     A component is satisfied by an executable on PATH or a shared library
//     lib<name>.so* in the system library directories.
//   compile(spec, workdir): writes the source into workdir and runs the
//     toolchain there. Never throws. A non-zero compiler exit returns an
//     artifact with status=failed, error=build_failure and the captured
//     stderr in build_log. Compiler warnings on stderr with exit 0 are kept in
//     the log but do not fail the build.
//   run_command(artifact, args): program path + argv for one execution.
//
// Toolchain binaries can be overridden per language with environment
// variables (ENERGYBENCH_CC, ENERGYBENCH_CXX, ENERGYBENCH_RUSTC,
// ENERGYBENCH_JAVAC, ENERGYBENCH_JAVA, ENERGYBENCH_DOTNET, ENERGYBENCH_NODE,
// ENERGYBENCH_PYTHON).

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "energybench/types.hpp"

namespace energybench {

struct RunCommand {
  std::string path;
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
};

class IEnvironment {
 public:
  virtual ~IEnvironment() = default;

  virtual std::string language() const = 0;
  virtual std::vector<std::string> aliases() const = 0;

  // Programs the language needs on the host, before any spec dependency.
  virtual std::vector<std::string> toolchain() const = 0;

  virtual std::vector<std::string> resolve_dependencies(const WorkloadSpec& spec,
                                                        Error* error) const;
  virtual BuildArtifact compile(const WorkloadSpec& spec, const std::string& workdir) const = 0;
  virtual RunCommand run_command(const BuildArtifact& artifact,
                                 const std::vector<std::string>& args) const = 0;

 protected:
  // Run one toolchain command inside workdir and fold its result into artifact.
  void run_toolchain(BuildArtifact& artifact, const std::string& program,
                     const std::vector<std::string>& argv, const std::string& workdir) const;
};

// Upper bound for a single compiler invocation.
constexpr std::uint64_t kCompileTimeoutMs = 10 * 60 * 1000;

// Returns nullptr for an unknown language or alias.
const IEnvironment* environment_for(const std::string& language);

// Lower-cased, trimmed alias → canonical language name.
std::optional<std::string> canonical_language(const std::string& alias);

std::vector<std::string> supported_languages();

// Toolchain program honoring the ENERGYBENCH_<VAR> override.
std::string toolchain_program(const std::string& env_var, const std::string& fallback);

}  // namespace energybench
