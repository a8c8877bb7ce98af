#include "energybench/environment.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>

#include "energybench/process.hpp"

namespace fs = std::filesystem;

namespace energybench {

namespace {

bool write_text(const fs::path& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  return static_cast<bool>(ofs);
}

BuildArtifact start_artifact(const WorkloadSpec& spec, const std::string& workdir) {
  BuildArtifact a;
  a.spec_name = spec.name;
  a.language = spec.language;
  a.workdir = workdir;
  a.status = BuildStatus::pending;
  return a;
}

void fail_artifact(BuildArtifact& a, const std::string& message) {
  a.status = BuildStatus::failed;
  a.error = ErrorCode::build_failure;
  if (!a.build_log.empty() && a.build_log.back() != '\n') a.build_log += '\n';
  a.build_log += message;
}

bool stage_source(BuildArtifact& a, const std::string& workdir, const std::string& file,
                  const std::string& code) {
  std::error_code ec;
  fs::create_directories(workdir, ec);
  if (ec || !write_text(fs::path(workdir) / file, code)) {
    fail_artifact(a, "cannot write source file " + file);
    return false;
  }
  return true;
}

// gcc / g++: <cc> main.c -o main <options...>
class NativeEnvironment : public IEnvironment {
 public:
  NativeEnvironment(std::string language, std::vector<std::string> aliases,
                    std::string env_var, std::string default_cc, std::string source)
      : language_(std::move(language)), aliases_(std::move(aliases)),
        env_var_(std::move(env_var)), default_cc_(std::move(default_cc)),
        source_(std::move(source)) {}

  std::string language() const override { return language_; }
  std::vector<std::string> aliases() const override { return aliases_; }
  std::vector<std::string> toolchain() const override {
    return {toolchain_program(env_var_, default_cc_)};
  }

  BuildArtifact compile(const WorkloadSpec& spec, const std::string& workdir) const override {
    BuildArtifact a = start_artifact(spec, workdir);
    if (!stage_source(a, workdir, source_, spec.code)) return a;
    const std::string target = (fs::path(workdir) / "main").string();
    std::vector<std::string> argv = {source_, "-o", target};
    argv.insert(argv.end(), spec.options.begin(), spec.options.end());
    run_toolchain(a, toolchain_program(env_var_, default_cc_), argv, workdir);
    if (a.status == BuildStatus::built) {
      if (!fs::exists(target)) {
        fail_artifact(a, "compiler exited 0 but produced no executable");
      } else {
        a.executable = target;
      }
    }
    return a;
  }

  RunCommand run_command(const BuildArtifact& artifact,
                         const std::vector<std::string>& args) const override {
    return RunCommand{artifact.executable, args, {}};
  }

 private:
  std::string language_;
  std::vector<std::string> aliases_;
  std::string env_var_;
  std::string default_cc_;
  std::string source_;
};

class RustEnvironment : public IEnvironment {
 public:
  std::string language() const override { return "rust"; }
  std::vector<std::string> aliases() const override { return {"rust", "rs"}; }
  std::vector<std::string> toolchain() const override {
    return {toolchain_program("ENERGYBENCH_RUSTC", "rustc")};
  }

  BuildArtifact compile(const WorkloadSpec& spec, const std::string& workdir) const override {
    BuildArtifact a = start_artifact(spec, workdir);
    if (!stage_source(a, workdir, "main.rs", spec.code)) return a;
    const std::string target = (fs::path(workdir) / "main").string();
    std::vector<std::string> argv = {"main.rs", "-o", target};
    argv.insert(argv.end(), spec.options.begin(), spec.options.end());
    run_toolchain(a, toolchain_program("ENERGYBENCH_RUSTC", "rustc"), argv, workdir);
    if (a.status == BuildStatus::built) a.executable = target;
    return a;
  }

  RunCommand run_command(const BuildArtifact& artifact,
                         const std::vector<std::string>& args) const override {
    return RunCommand{artifact.executable, args, {}};
  }
};

// javac into the workdir, run "Program" with the workdir on the classpath.
class JavaEnvironment : public IEnvironment {
 public:
  std::string language() const override { return "java"; }
  std::vector<std::string> aliases() const override {
    return {"java", "openjdk", "graalvm", "semeru"};
  }
  std::vector<std::string> toolchain() const override {
    return {toolchain_program("ENERGYBENCH_JAVAC", "javac"),
            toolchain_program("ENERGYBENCH_JAVA", "java")};
  }

  BuildArtifact compile(const WorkloadSpec& spec, const std::string& workdir) const override {
    BuildArtifact a = start_artifact(spec, workdir);
    if (!stage_source(a, workdir, "Program.java", spec.code)) return a;
    std::vector<std::string> argv = {"-nowarn", "-d", workdir, "-cp", workdir};
    argv.insert(argv.end(), spec.options.begin(), spec.options.end());
    argv.push_back("Program.java");
    run_toolchain(a, toolchain_program("ENERGYBENCH_JAVAC", "javac"), argv, workdir);
    if (a.status == BuildStatus::built) {
      a.executable = (fs::path(workdir) / "Program.class").string();
    }
    return a;
  }

  RunCommand run_command(const BuildArtifact& artifact,
                         const std::vector<std::string>& args) const override {
    RunCommand cmd;
    cmd.path = toolchain_program("ENERGYBENCH_JAVA", "java");
    cmd.argv = {"--enable-native-access=ALL-UNNAMED", "-cp", artifact.workdir, "Program"};
    cmd.argv.insert(cmd.argv.end(), args.begin(), args.end());
    return cmd;
  }
};

class CSharpEnvironment : public IEnvironment {
 public:
  std::string language() const override { return "c#"; }
  std::vector<std::string> aliases() const override { return {"c#", "cs", "csharp"}; }
  std::vector<std::string> toolchain() const override {
    return {toolchain_program("ENERGYBENCH_DOTNET", "dotnet")};
  }

  BuildArtifact compile(const WorkloadSpec& spec, const std::string& workdir) const override {
    BuildArtifact a = start_artifact(spec, workdir);
    if (!stage_source(a, workdir, "Program.cs", spec.code)) return a;
    // TargetFramework can be overridden with -p:TargetFramework=net<version> in options.
    static const std::string kProject =
        "<Project Sdk=\"Microsoft.NET.Sdk\"><PropertyGroup>"
        "<OutputType>Exe</OutputType><TargetFramework>net9.0</TargetFramework>"
        "<AssemblyName>program</AssemblyName><Nullable>disable</Nullable>"
        "</PropertyGroup></Project>";
    if (!stage_source(a, workdir, "program.csproj", kProject)) return a;
    const std::string out_dir = (fs::path(workdir) / "out").string();
    std::vector<std::string> argv = {"build", workdir, "--nologo", "-v", "q", "-c", "Release",
                                     "-o", out_dir, "-p:WarningLevel=0",
                                     "-p:UseSharedCompilation=false"};
    argv.insert(argv.end(), spec.options.begin(), spec.options.end());
    run_toolchain(a, toolchain_program("ENERGYBENCH_DOTNET", "dotnet"), argv, workdir);
    if (a.status == BuildStatus::built) {
      a.executable = (fs::path(out_dir) / "program").string();
    }
    return a;
  }

  RunCommand run_command(const BuildArtifact& artifact,
                         const std::vector<std::string>& args) const override {
    RunCommand cmd{artifact.executable, args, {}};
    if (auto dotnet = find_executable(toolchain_program("ENERGYBENCH_DOTNET", "dotnet"))) {
      std::error_code ec;
      const fs::path real = fs::canonical(*dotnet, ec);
      if (!ec) cmd.env["DOTNET_ROOT"] = real.parent_path().string();
    }
    return cmd;
  }
};

// Interpreted languages: "compiling" stages the source file.
class ScriptEnvironment : public IEnvironment {
 public:
  ScriptEnvironment(std::string language, std::vector<std::string> aliases,
                    std::string env_var, std::string interpreter, std::string source)
      : language_(std::move(language)), aliases_(std::move(aliases)),
        env_var_(std::move(env_var)), interpreter_(std::move(interpreter)),
        source_(std::move(source)) {}

  std::string language() const override { return language_; }
  std::vector<std::string> aliases() const override { return aliases_; }
  std::vector<std::string> toolchain() const override {
    return {toolchain_program(env_var_, interpreter_)};
  }

  BuildArtifact compile(const WorkloadSpec& spec, const std::string& workdir) const override {
    BuildArtifact a = start_artifact(spec, workdir);
    if (!stage_source(a, workdir, source_, spec.code)) return a;
    a.executable = (fs::path(workdir) / source_).string();
    a.status = BuildStatus::built;
    return a;
  }

  RunCommand run_command(const BuildArtifact& artifact,
                         const std::vector<std::string>& args) const override {
    RunCommand cmd;
    cmd.path = toolchain_program(env_var_, interpreter_);
    cmd.argv = {artifact.executable};
    cmd.argv.insert(cmd.argv.end(), args.begin(), args.end());
    return cmd;
  }

 private:
  std::string language_;
  std::vector<std::string> aliases_;
  std::string env_var_;
  std::string interpreter_;
  std::string source_;
};

std::string normalize_alias(const std::string& alias) {
  std::string out;
  for (char c : alias) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

struct EnvironmentTable {
  std::vector<std::unique_ptr<IEnvironment>> owned;
  std::map<std::string, const IEnvironment*> by_alias;

  EnvironmentTable() {
    owned.push_back(std::make_unique<NativeEnvironment>(
        "c", std::vector<std::string>{"c"}, "ENERGYBENCH_CC", "gcc", "main.c"));
    owned.push_back(std::make_unique<NativeEnvironment>(
        "c++", std::vector<std::string>{"c++", "cpp", "cplus", "cplusplus"},
        "ENERGYBENCH_CXX", "g++", "main.cpp"));
    owned.push_back(std::make_unique<RustEnvironment>());
    owned.push_back(std::make_unique<JavaEnvironment>());
    owned.push_back(std::make_unique<CSharpEnvironment>());
    owned.push_back(std::make_unique<ScriptEnvironment>(
        "javascript", std::vector<std::string>{"javascript", "js"},
        "ENERGYBENCH_NODE", "node", "main.js"));
    owned.push_back(std::make_unique<ScriptEnvironment>(
        "python", std::vector<std::string>{"python", "py"},
        "ENERGYBENCH_PYTHON", "python3", "main.py"));
    for (const auto& env : owned) {
      by_alias[env->language()] = env.get();
      for (const auto& alias : env->aliases()) by_alias[alias] = env.get();
    }
  }
};

const EnvironmentTable& table() {
  static const EnvironmentTable t;
  return t;
}

}  // namespace

std::string toolchain_program(const std::string& env_var, const std::string& fallback) {
  const char* e = std::getenv(env_var.c_str());
  return (e && e[0]) ? std::string(e) : fallback;
}

std::vector<std::string> IEnvironment::resolve_dependencies(const WorkloadSpec& spec,
                                                            Error* error) const {
  std::vector<std::string> components = toolchain();
  for (const auto& dep : spec.dependencies) {
    if (std::find(components.begin(), components.end(), dep) == components.end()) {
      components.push_back(dep);
    }
  }
  std::vector<std::string> missing;
  for (const auto& c : components) {
    if (!find_executable(c) && !find_shared_library(c)) missing.push_back(c);
  }
  if (!missing.empty()) {
    if (error) {
      error->code = ErrorCode::missing_dependency;
      error->spec_name = spec.name;
      error->language = spec.language;
      error->source_path = spec.source_path;
      error->detail = "not found on host:";
      for (const auto& m : missing) error->detail += " " + m;
    }
    return {};
  }
  return components;
}

void IEnvironment::run_toolchain(BuildArtifact& artifact, const std::string& program,
                                 const std::vector<std::string>& argv,
                                 const std::string& workdir) const {
  ProcessSpec ps;
  ps.command = program;
  ps.argv = argv;
  ps.cwd = workdir;
  ps.timeout_ms = kCompileTimeoutMs;
  const ProcessResult r = run_process(ps);
  artifact.compile_invocations += 1;
  artifact.build_duration_ns += r.duration_ns;

  if (!r.stdout_text.empty()) artifact.build_log += r.stdout_text;
  if (!r.stderr_text.empty()) artifact.build_log += r.stderr_text;

  if (!r.spawned()) {
    fail_artifact(artifact, r.error_message);
  } else if (r.timed_out) {
    fail_artifact(artifact, "compiler timed out after " + std::to_string(kCompileTimeoutMs) + " ms");
  } else if (r.exit_code != 0) {
    fail_artifact(artifact, program + " exited with code " + std::to_string(r.exit_code));
  } else {
    artifact.status = BuildStatus::built;
  }
}

const IEnvironment* environment_for(const std::string& language) {
  const auto& t = table();
  auto it = t.by_alias.find(normalize_alias(language));
  return it == t.by_alias.end() ? nullptr : it->second;
}

std::optional<std::string> canonical_language(const std::string& alias) {
  const IEnvironment* env = environment_for(alias);
  if (!env) return std::nullopt;
  return env->language();
}

std::vector<std::string> supported_languages() {
  std::vector<std::string> out;
  for (const auto& env : table().owned) out.push_back(env->language());
  return out;
}

}  // namespace energybench
