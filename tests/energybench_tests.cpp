#include <algorithm>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/resource.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "energybench/aggregator.hpp"
#include "energybench/artifact_store.hpp"
#include "energybench/builder.hpp"
#include "energybench/config.hpp"
#include "energybench/energy_sampler.hpp"
#include "energybench/environment.hpp"
#include "energybench/harness.hpp"
#include "energybench/hash.hpp"
#include "energybench/jsonlite.hpp"
#include "energybench/observability.hpp"
#include "energybench/process.hpp"
#include "energybench/report.hpp"
#include "energybench/spec_registry.hpp"
#include "energybench/trial_runner.hpp"
#include "energybench/version.hpp"
#include "energybench/worker_pool.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path scratch_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() /
                       ("energybench_test_" + std::to_string(::getpid()) + "_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_text(const fs::path& path, const std::string& text) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << text;
}

void write_script(const fs::path& path, const std::string& text) {
  write_text(path, text);
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
}

std::size_t count_lines(const fs::path& path) {
  std::ifstream ifs(path);
  std::size_t n = 0;
  std::string line;
  while (std::getline(ifs, line)) ++n;
  return n;
}

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

// Script workloads: ENERGYBENCH_PYTHON is pointed at /bin/sh in main(), so the
// "python" environment stages the code and runs it with the shell.
energybench::WorkloadSpec script_spec(const std::string& name, const std::string& code,
                                      const std::string& expected) {
  energybench::WorkloadSpec s;
  s.name = name;
  s.language = "python";
  s.code = code;
  s.expected_stdout = expected;
  s.source_path = "<test>";
  return s;
}

// Counts start/stop pairs and detects overlapping windows.
class CountingSampler : public energybench::IEnergySampler {
 public:
  explicit CountingSampler(bool grant = true, std::optional<double> joules = 1.0)
      : grant_(grant), joules_(joules) {}

  bool start() override {
    starts.fetch_add(1);
    if (!grant_) return false;
    const int now = open.fetch_add(1) + 1;
    int prev = max_open.load();
    while (now > prev && !max_open.compare_exchange_weak(prev, now)) {
    }
    return true;
  }
  void stop() override {
    stops.fetch_add(1);
    open.fetch_sub(1);
  }
  std::optional<double> last_energy_joules() const override { return joules_; }
  std::string sampler_id() const override { return "counting"; }

  std::atomic<int> starts{0};
  std::atomic<int> stops{0};
  std::atomic<int> open{0};
  std::atomic<int> max_open{0};

 private:
  bool grant_;
  std::optional<double> joules_;
};

energybench::TrialPlan one_trial_plan(std::uint64_t timeout_ms = 10000) {
  energybench::TrialPlan plan;
  plan.trials = 1;
  plan.timeout_ms = timeout_ms;
  return plan;
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(energybench::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(energybench::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const auto a = energybench::hash_domain("build:", "payload");
  const auto b = energybench::hash_domain("log:", "payload");
  expect(a != b, "different domains must produce different digests");
  expect(energybench::valid_digest(a), "domain digest must be 64 lowercase hex");
  expect(!energybench::valid_digest("ABC"), "short digest rejected");
}

void test_build_content_hash_fields() {
  auto s = script_spec("one", "echo hi\n", "hi\n");
  const auto h = energybench::build_content_hash(s);
  expect(h == energybench::build_content_hash(s), "content hash must be deterministic");

  auto renamed = s;
  renamed.name = "two";
  renamed.args = {"x"};
  renamed.expected_stdout = "other\n";
  expect(energybench::build_content_hash(renamed) == h,
         "name, args and oracle must not affect the content hash");

  auto with_option = s;
  with_option.options = {"-O2"};
  expect(energybench::build_content_hash(with_option) != h, "options change the hash");

  auto split_a = s;
  split_a.options = {"ab", "c"};
  auto split_b = s;
  split_b.options = {"a", "bc"};
  expect(energybench::build_content_hash(split_a) != energybench::build_content_hash(split_b),
         "list encoding must be length-prefixed");
}

// ============================================================================
// jsonlite
// ============================================================================

void test_json_strictness() {
  std::optional<energybench::jsonlite::JsonError> err;
  energybench::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate key rejected");

  err.reset();
  energybench::jsonlite::parse("{\"a\":1} trailing", &err);
  expect(err.has_value(), "trailing data rejected");

  err.reset();
  auto obj = energybench::jsonlite::parse("{\"n\":3,\"d\":-2.5,\"s\":\"x\\ny\"}", &err);
  expect(!err.has_value(), "valid document parses");
  expect(energybench::jsonlite::get_u64(obj, "n") == 3, "uint parsed");
  expect(near(energybench::jsonlite::get_double(obj, "d"), -2.5), "negative double parsed");
  expect(energybench::jsonlite::get_string(obj, "s") == "x\ny", "escape decoded");
  expect(energybench::jsonlite::format_double(10.0) == "10.0", "format_double trims zeros");
}

void test_json_surrogate_pairs() {
  std::optional<energybench::jsonlite::JsonError> err;
  auto obj = energybench::jsonlite::parse("{\"s\":\"\\uD83D\\uDE00\"}", &err);
  expect(!err.has_value(), "surrogate pair accepted");
  expect(energybench::jsonlite::get_string(obj, "s") == "\xF0\x9F\x98\x80",
         "surrogate pair decoded to one code point");

  for (const char* bad : {"{\"s\":\"\\uD83D\\u0041\"}", "{\"s\":\"\\uD83Dx\"}",
                          "{\"s\":\"\\uDE00\"}", "{\"s\":\"\\uD83D\\uD83D\"}"}) {
    err.reset();
    energybench::jsonlite::parse(bad, &err);
    expect(err.has_value() && err->code == "json_parse_error",
           std::string("unpaired surrogate rejected: ") + bad);
  }
}

// ============================================================================
// SpecRegistry
// ============================================================================

void test_registry_missing_fields() {
  energybench::SpecRegistry reg;
  auto report = reg.load_text("{\"name\":\"n\",\"language\":\"c\",\"code\":\"int main(){}\"}",
                              "missing_expected.json");
  expect(!report.ok() && report.loaded == 0, "missing expected_stdout is an error");
  expect(report.errors[0].code == energybench::ErrorCode::spec_parse_error,
         "missing field reported as spec_parse_error");
  expect(report.errors[0].source_path == "missing_expected.json", "error carries source path");
  expect(report.errors[0].spec_name == "n", "error carries spec name when known");

  report = reg.load_text("{\"language\":\"c\",\"code\":\"x\",\"expected_stdout\":\"\"}", "a.json");
  expect(!report.ok(), "missing name is an error");

  report = reg.load_text("{\"name\":\"n\",\"language\":\"cobol\",\"code\":\"x\","
                         "\"expected_stdout\":\"\"}",
                         "b.json");
  expect(!report.ok(), "unknown language is an error");

  report = reg.load_text("{\"name\":\"n\",\"language\":\"c\",\"expected_stdout\":\"\"}", "c.json");
  expect(!report.ok(), "missing code is an error");

  report = reg.load_text("{\"name\":\"n\",\"language\":\"python\",\"code\":\"x\","
                         "\"expected_stdout\":\"\",\"iterations\":4}",
                         "d.json");
  expect(!report.ok(), "iterations > 1 without shared_window is an error");
  expect(reg.size() == 0, "nothing registered from invalid documents");
}

void test_registry_duplicates_and_aliases() {
  energybench::SpecRegistry reg;
  const std::string doc =
      "{\"name\":\"fib\",\"language\":\"cpp\",\"code\":\"int main(){}\","
      "\"expected_stdout\":\"\",\"args\":[\"x\",3,-2]}";
  auto first = reg.load_text(doc, "first.json");
  expect(first.ok() && first.loaded == 1, "first document loads");

  auto spec = reg.get("fib", "cplusplus");
  expect(spec.has_value(), "lookup through a language alias");
  expect(spec->language == "c++", "language canonicalized");
  expect(spec->args.size() == 3 && spec->args[1] == "3" && spec->args[2] == "-2",
         "integer args converted to text");

  const std::string dup =
      "{\"name\":\"fib\",\"language\":\"C++\",\"code\":\"int main(){return 1;}\","
      "\"expected_stdout\":\"\"}";
  auto second = reg.load_text(dup, "second.json");
  expect(!second.ok(), "duplicate (name, language) rejected");
  expect(second.errors[0].source_path == "second.json", "duplicate error names the later file");
  expect(second.errors[0].detail.find("first.json") != std::string::npos,
         "duplicate error names the first file");
  expect(reg.size() == 1, "first definition stays registered");
  expect(reg.get("fib", "c++")->code == "int main(){}", "first definition wins");

  expect(!reg.get("fib", "rust").has_value(), "unknown (name, language) is not found");
  expect(!reg.get("fib", "cobol").has_value(), "unknown alias is not found");
}

void test_registry_directory_and_code_file() {
  const auto dir = scratch_dir("registry");
  write_text(dir / "prog.sh", "echo from-file\n");
  write_text(dir / "b.json",
             "{\"name\":\"b\",\"language\":\"py\",\"code_file\":\"prog.sh\","
             "\"expected_stdout\":\"from-file\\n\",\"sampling\":\"shared_window\","
             "\"iterations\":3,\"timeout_ms\":500,\"trials\":2}");
  write_text(dir / "a.json",
             "{\"name\":\"a\",\"language\":\"js\",\"code\":\"console.log(1)\","
             "\"expected_stdout\":\"1\\n\",\"dependencies\":[\"node\"]}");
  write_text(dir / "notes.txt", "ignored");

  energybench::SpecRegistry reg;
  auto report = reg.load({dir.string()});
  expect(report.ok() && report.loaded == 2, "directory scan loads every *.json");
  expect(reg.specs()[0].name == "a" && reg.specs()[1].name == "b", "sorted load order");
  const auto& b = reg.specs()[1];
  expect(b.code == "echo from-file\n", "code_file resolved relative to the spec file");
  expect(b.language == "python", "py alias canonicalized");
  expect(b.sampling == energybench::SamplingMode::shared_window, "sampling mode parsed");
  expect(b.iterations == 3 && b.timeout_ms == 500u && b.trials == 2u,
         "optional execution parameters parsed");
  expect(reg.specs()[0].dependencies.size() == 1, "dependencies parsed");
  fs::remove_all(dir);
}

std::string numeric_doc(const std::string& extra) {
  return "{\"name\":\"n\",\"language\":\"python\",\"code\":\"x\","
         "\"expected_stdout\":\"\"," + extra + "}";
}

void test_registry_numeric_ranges() {
  energybench::Error err;
  auto spec = energybench::parse_workload(numeric_doc("\"trials\":4294967296"), "t.json", &err);
  expect(!spec && err.code == energybench::ErrorCode::spec_parse_error,
         "trials above 2^32-1 rejected instead of wrapping to 0");
  expect(err.detail.find("trials") != std::string::npos, "error names the field");

  err = {};
  spec = energybench::parse_workload(
      numeric_doc("\"sampling\":\"shared_window\",\"iterations\":4294967297"), "i.json", &err);
  expect(!spec && err.detail.find("iterations") != std::string::npos,
         "iterations above 2^32-1 rejected");

  err = {};
  spec = energybench::parse_workload(numeric_doc("\"trials\":4294967295"), "max.json", &err);
  expect(spec && spec->trials == 4294967295u, "largest 32-bit trial count accepted");

  err = {};
  spec = energybench::parse_workload(numeric_doc("\"timeout_ms\":18446744073709551615"),
                                     "huge.json", &err);
  expect(!spec && err.detail.find("timeout_ms") != std::string::npos,
         "timeout_ms above one day rejected");

  err = {};
  spec = energybench::parse_workload(
      numeric_doc("\"timeout_ms\":" + std::to_string(energybench::kMaxTimeoutMs)), "day.json",
      &err);
  expect(spec && *spec->timeout_ms == energybench::kMaxTimeoutMs, "one-day timeout accepted");

  err = {};
  spec = energybench::parse_workload(numeric_doc("\"args\":[1e300]"), "a.json", &err);
  expect(!spec && err.detail.find("args") != std::string::npos,
         "argument outside the 64-bit range rejected");

  err = {};
  spec = energybench::parse_workload(numeric_doc("\"args\":[-9.3e18]"), "b.json", &err);
  expect(!spec, "negative argument outside the 64-bit range rejected");

  err = {};
  spec = energybench::parse_workload(numeric_doc("\"args\":[2.5]"), "c.json", &err);
  expect(!spec, "fractional argument rejected");

  err = {};
  spec = energybench::parse_workload(numeric_doc("\"niceness\":-5"), "nice.json", &err);
  expect(spec && spec->niceness == -5, "negative niceness parsed");

  err = {};
  spec = energybench::parse_workload(numeric_doc("\"niceness\":20"), "nice2.json", &err);
  expect(!spec && err.detail.find("niceness") != std::string::npos, "niceness above 19 rejected");
}

const char kBinaryTreesYaml[] =
    "language: c\n"
    "name: binary-trees\n"
    "description: | # https://example.org/binarytrees\n"
    "    Allocate and walk perfect binary trees.\n"
    "code: |\n"
    "    #include <stdio.h>\n"
    "    int main(int argc, char **argv) { puts(\"ok\"); return 0; }\n"
    "dependencies:\n"
    "    - gcc\n"
    "options:\n"
    "    - -pipe\n"
    "    - -O3\n"
    "args: [21]\n"
    "niceness: -5\n"
    "expected_stdout: |\n"
    "    stretch tree of depth 22\t check: 8388607\n"
    "    2097152\t trees of depth 4\t check: 65011712\n";

void test_registry_yaml_documents() {
  energybench::Error err;
  auto spec = energybench::parse_workload(kBinaryTreesYaml, "binary-trees.yml", &err);
  expect(spec.has_value(), "YAML workload parses: " + err.describe());
  expect(spec->name == "binary-trees" && spec->language == "c", "identity fields read");
  expect(spec->code.find("int main(int argc") != std::string::npos &&
             spec->code.back() == '\n',
         "block scalar code kept verbatim");
  expect(spec->description && spec->description->find("binary trees") != std::string::npos,
         "description read");
  expect(spec->dependencies == std::vector<std::string>{"gcc"}, "dependencies sequence");
  expect(spec->options == (std::vector<std::string>{"-pipe", "-O3"}), "options sequence");
  expect(spec->args == std::vector<std::string>{"21"}, "integer argument converted to text");
  expect(spec->niceness == -5, "negative plain scalar read as an integer");
  expect(spec->expected_stdout ==
             "stretch tree of depth 22\t check: 8388607\n2097152\t trees of depth 4\t check: "
             "65011712\n",
         "expected output block kept with tabs");

  err = {};
  auto quoted = energybench::parse_workload(
      "name: q\nlanguage: py\ncode: x\nexpected_stdout: \"\"\nargs: [\"007\", 8]\n",
      "q.yaml", &err);
  expect(quoted && quoted->args == (std::vector<std::string>{"007", "8"}),
         "quoted scalars stay strings");

  err = {};
  auto huge = energybench::parse_workload(
      "name: h\nlanguage: c\ncode: x\nexpected_stdout: ''\ntrials: 4294967296\n", "h.yml", &err);
  expect(!huge && err.detail.find("trials") != std::string::npos,
         "YAML goes through the same range checks");

  err = {};
  auto broken = energybench::parse_workload("name: [unclosed\n", "broken.yml", &err);
  expect(!broken && err.code == energybench::ErrorCode::spec_parse_error &&
             err.detail.find("yaml_parse_error") != std::string::npos &&
             err.source_path == "broken.yml",
         "malformed YAML is a spec_parse_error with its path");

  err = {};
  auto dup = energybench::parse_workload(
      "name: a\nname: b\nlanguage: c\ncode: x\nexpected_stdout: ''\n", "dup.yml", &err);
  expect(!dup && err.detail.find("duplicate") != std::string::npos, "duplicate YAML key rejected");

  err = {};
  auto list = energybench::parse_workload("- a\n- b\n", "list.yml", &err);
  expect(!list && err.detail.find("mapping") != std::string::npos, "root must be a mapping");

  const auto dir = scratch_dir("registry_yaml");
  write_text(dir / "binary-trees.yml", kBinaryTreesYaml);
  write_text(dir / "echo.yaml",
             "name: echo\nlanguage: python\ncode: echo hi\nexpected_stdout: |\n  hi\n");
  write_text(dir / "fib.json",
             "{\"name\":\"fib\",\"language\":\"c\",\"code\":\"x\",\"expected_stdout\":\"\"}");
  energybench::SpecRegistry reg;
  auto report = reg.load({dir.string()});
  expect(report.ok() && report.loaded == 3, "directory scan loads JSON and YAML");
  expect(reg.specs()[0].name == "binary-trees" && reg.specs()[1].name == "echo" &&
             reg.specs()[2].name == "fib",
         "mixed formats in sorted order");
  expect(reg.get("echo", "py")->expected_stdout == "hi\n", "YAML spec registered");
  fs::remove_all(dir);
}

// ============================================================================
// Output validation
// ============================================================================

void test_normalize_output() {
  expect(energybench::normalize_output("a  \r\nb\t\r\n\r\n\n") == "a\nb\n",
         "CRLF, trailing blanks and trailing empty lines normalized");
  expect(energybench::normalize_output("x") == "x\n", "final newline added");
  expect(energybench::normalize_output("") == "", "empty stays empty");
  expect(energybench::expected_for_window("ok", 3) == "ok\nok\nok\n",
         "window oracle repeats the expected output");
}

void test_first_mismatch() {
  const auto same = energybench::first_mismatch("check: 5\n", "check: 5\n");
  expect(!same.has_value(), "identical output has no mismatch");

  const auto diff = energybench::first_mismatch("a\ncheck: 5\n", "a\ncheck: 6\n");
  expect(diff.has_value() && diff->line == 2, "mismatch line is 1-based");
  expect(diff->expected == "check: 5" && diff->actual == "check: 6", "mismatch text kept");

  const auto shorter = energybench::first_mismatch("a\nb\n", "a\n");
  expect(shorter.has_value() && shorter->line == 2 && shorter->actual == "<eof>",
         "missing line reported as <eof>");
}

// ============================================================================
// Process execution
// ============================================================================

void test_process_exit_codes() {
  energybench::ProcessSpec ps;
  ps.command = "/bin/sh";
  ps.argv = {"-c", "read x; echo got:$x; echo err >&2; exit 3"};
  ps.stdin_text = "input\n";
  auto r = energybench::run_process(ps);
  expect(r.spawned(), "shell spawned");
  expect(r.exit_code == 3, "exit code propagated");
  expect(r.stdout_text == "got:input\n", "stdin fed and stdout captured");
  expect(r.stderr_text == "err\n", "stderr captured");

  energybench::ProcessSpec missing;
  missing.command = "/nonexistent/energybench-program";
  auto m = energybench::run_process(missing);
  expect(!m.spawned() && m.exit_code == 127, "spawn failure maps to 127");
}

void test_process_timeout_kills_group() {
  energybench::ProcessSpec ps;
  ps.command = "/bin/sh";
  ps.argv = {"-c", "sleep 30 & sleep 30"};
  ps.timeout_ms = 200;
  const auto t0 = std::chrono::steady_clock::now();
  auto r = energybench::run_process(ps);
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  expect(r.timed_out && r.exit_code == 124, "timeout reported as 124");
  expect(elapsed < std::chrono::seconds(10), "process group killed promptly");
}

void test_process_huge_timeout_does_not_fire() {
  for (std::uint64_t timeout : {std::numeric_limits<std::uint64_t>::max(),
                                static_cast<std::uint64_t>(10000000000000ull)}) {
    energybench::ProcessSpec ps;
    ps.command = "/bin/sh";
    ps.argv = {"-c", "sleep 0.3; echo done"};
    ps.timeout_ms = timeout;
    auto r = energybench::run_process(ps);
    expect(!r.timed_out && r.exit_code == 0, "large timeout saturates instead of firing");
    expect(r.stdout_text == "done\n", "workload ran to completion");
  }
}

void test_process_niceness() {
  energybench::ProcessSpec ps;
  ps.command = "/bin/sh";
  ps.argv = {"-c", "nice"};
  ps.niceness = 5;
  auto r = energybench::run_process(ps);
  expect(r.exit_code == 0 && r.stdout_text == "5\n", "child runs at the requested niceness");

  errno = 0;
  const int inherited = ::getpriority(PRIO_PROCESS, 0);
  ps.niceness = 0;
  r = energybench::run_process(ps);
  expect(r.stdout_text == std::to_string(inherited) + "\n", "niceness 0 keeps the priority");
}

void test_find_executable() {
  expect(energybench::find_executable("sh").has_value(), "sh resolved on PATH");
  expect(!energybench::find_executable("energybench-no-such-tool-xyz").has_value(),
         "absent program not found");
}

// ============================================================================
// Environments
// ============================================================================

void test_environment_aliases() {
  expect(energybench::canonical_language("C++") == std::optional<std::string>("c++"),
         "C++ alias");
  expect(energybench::canonical_language(" cs ") == std::optional<std::string>("c#"),
         "cs alias trimmed");
  expect(energybench::canonical_language("graalvm") == std::optional<std::string>("java"),
         "java vendor alias");
  expect(!energybench::canonical_language("cobol").has_value(), "unknown alias");
  expect(energybench::environment_for("rs") != nullptr, "rust environment by alias");
  expect(energybench::supported_languages().size() == 7, "seven languages supported");
}

void test_missing_dependency() {
  auto s = script_spec("dep", "echo hi\n", "hi\n");
  s.dependencies = {"energybench-no-such-tool-xyz"};
  energybench::Error err;
  const auto* env = energybench::environment_for(s.language);
  env->resolve_dependencies(s, &err);
  expect(err.code == energybench::ErrorCode::missing_dependency, "missing dependency detected");
  expect(err.detail.find("energybench-no-such-tool-xyz") != std::string::npos,
         "missing component named");
  expect(err.spec_name == "dep" && err.language == "python", "error carries the spec");

  const auto dir = scratch_dir("missing_dep");
  energybench::ArtifactStore store((dir / "cache").string());
  energybench::Builder builder(store);
  auto out = builder.build(s);
  expect(out.error.code == energybench::ErrorCode::missing_dependency,
         "builder reports missing_dependency");
  expect(builder.compile_count() == 0, "no compile attempted");
  fs::remove_all(dir);
}

// ============================================================================
// Artifact store
// ============================================================================

energybench::BuildArtifact staged_artifact(energybench::ArtifactStore& store,
                                           const std::string& hash, std::string* staging) {
  *staging = store.make_staging_dir();
  write_script(fs::path(*staging) / "main", "#!/bin/sh\necho ok\n");
  energybench::BuildArtifact a;
  a.spec_name = "stored";
  a.language = "c";
  a.content_hash = hash;
  a.workdir = *staging;
  a.executable = (fs::path(*staging) / "main").string();
  a.build_log = "warning: unused variable\n";
  a.status = energybench::BuildStatus::built;
  a.compile_invocations = 1;
  return a;
}

void test_artifact_store_commit_lookup() {
  const auto dir = scratch_dir("store");
  energybench::ArtifactStore store((dir / "cache").string());
  const std::string hash = energybench::blake3_hex("artifact");

  std::string staging;
  auto a = staged_artifact(store, hash, &staging);
  energybench::Error err;
  expect(store.commit(a, staging, &err), "commit succeeds");
  expect(!fs::exists(staging), "staging dir moved into place");
  expect(fs::path(a.executable).filename() == "main", "executable relocated");
  expect(fs::exists(a.executable), "executable exists in the committed dir");
  expect(store.contains(hash) && store.size() == 1, "store lists the artifact");

  auto found = store.lookup(hash);
  expect(found.has_value() && found->executable == a.executable, "lookup returns the artifact");
  expect(found->compile_invocations == 0, "a stored artifact costs no compile");
  auto log = store.get_log(hash);
  expect(log.has_value() && *log == "warning: unused variable\n", "build log round trip");

  // Lost race: a second committer adopts the existing artifact.
  std::string staging2;
  auto b = staged_artifact(store, hash, &staging2);
  expect(store.commit(b, staging2, &err), "second commit adopts the winner");
  expect(!fs::exists(staging2), "losing staging dir discarded");
  expect(b.workdir == a.workdir, "loser points at the winner's directory");
  expect(b.compile_invocations == 1, "loser keeps its own compile count");

  write_text(fs::path(store.artifact_dir(hash)) / "build.log", "tampered");
  expect(!store.get_log(hash).has_value(), "corrupted log detected");

  expect(!store.lookup("not-a-digest").has_value(), "invalid digest is absent");
  expect(store.remove(hash) && !store.contains(hash), "remove deletes the artifact");
  fs::remove_all(dir);
}

void test_artifact_store_rejects_failed_build() {
  const auto dir = scratch_dir("store_failed");
  energybench::ArtifactStore store((dir / "cache").string());
  std::string staging;
  auto a = staged_artifact(store, energybench::blake3_hex("failed"), &staging);
  a.status = energybench::BuildStatus::failed;
  energybench::Error err;
  expect(!store.commit(a, staging, &err), "failed builds are not committed");
  expect(err.code == energybench::ErrorCode::io_error, "commit refusal is an io_error");
  expect(store.size() == 0, "nothing stored");
  fs::remove_all(dir);
}

// ============================================================================
// Builder
// ============================================================================

// Fake C compiler: records each call, waits, then "compiles" by copying the
// source (a shell script) to the -o target.
fs::path install_fake_cc(const fs::path& dir, const fs::path& counter) {
  const fs::path cc = dir / "fake-cc";
  write_script(cc, "#!/bin/sh\n"
                   "echo call >> '" + counter.string() + "'\n"
                   "sleep 0.3\n"
                   "cp \"$1\" \"$3\" && chmod +x \"$3\"\n"
                   "echo 'note: fake compiler' >&2\n");
  ::setenv("ENERGYBENCH_CC", cc.c_str(), 1);
  return cc;
}

energybench::WorkloadSpec c_spec(const std::string& name) {
  energybench::WorkloadSpec s;
  s.name = name;
  s.language = "c";
  s.code = "#!/bin/sh\necho check: 5\n";
  s.expected_stdout = "check: 5\n";
  return s;
}

void test_concurrent_builds_compile_once() {
  const auto dir = scratch_dir("builder_concurrent");
  const auto counter = dir / "calls.txt";
  install_fake_cc(dir, counter);

  energybench::ArtifactStore store((dir / "cache").string());
  energybench::Builder builder(store);
  const auto spec = c_spec("concurrent");

  std::vector<energybench::BuildOutcome> outcomes(5);
  std::vector<std::thread> threads;
  for (int i = 0; i < 5; ++i) {
    threads.emplace_back([&, i] { outcomes[i] = builder.build(spec); });
  }
  for (auto& t : threads) t.join();

  expect(builder.compile_count() == 1, "five concurrent builds compile once");
  expect(count_lines(counter) == 1, "compiler invoked exactly once");
  for (const auto& o : outcomes) {
    expect(o.error.ok(), "every caller gets the built artifact");
    expect(o.artifact->executable == outcomes[0].artifact->executable,
           "every caller shares one artifact");
  }
  auto log = store.get_log(outcomes[0].artifact->content_hash);
  expect(log.has_value() && log->find("fake compiler") != std::string::npos,
         "compiler stderr kept in the build log of a successful build");

  ::unsetenv("ENERGYBENCH_CC");
  fs::remove_all(dir);
}

void test_rebuild_is_idempotent() {
  const auto dir = scratch_dir("builder_idempotent");
  const auto counter = dir / "calls.txt";
  install_fake_cc(dir, counter);
  energybench::ArtifactStore store((dir / "cache").string());
  const auto spec = c_spec("idempotent");

  {
    energybench::Builder first(store);
    auto out = first.build(spec);
    expect(out.error.ok() && !out.cache_hit, "first build compiles");
    auto again = first.build(spec);
    expect(again.cache_hit, "same builder serves the cached result");
    expect(first.compile_count() == 1, "one compile in the first builder");
  }
  energybench::Builder second(store);
  auto out = second.build(spec);
  expect(out.error.ok() && out.cache_hit, "committed artifact reused from disk");
  expect(second.compile_count() == 0, "unchanged spec never compiles again");
  expect(count_lines(counter) == 1, "compiler invoked once across builders");

  ::unsetenv("ENERGYBENCH_CC");
  fs::remove_all(dir);
}

void test_build_failure_classified() {
  const auto dir = scratch_dir("builder_failure");
  const fs::path cc = dir / "failing-cc";
  write_script(cc, "#!/bin/sh\necho 'main.c:1: error: boom' >&2\nexit 1\n");
  ::setenv("ENERGYBENCH_CC", cc.c_str(), 1);

  energybench::ArtifactStore store((dir / "cache").string());
  energybench::Builder builder(store);
  auto spec = c_spec("broken");
  auto out = builder.build(spec);
  expect(out.error.code == energybench::ErrorCode::build_failure, "compiler error is build_failure");
  expect(out.artifact->status == energybench::BuildStatus::failed, "artifact marked failed");
  expect(out.artifact->build_log.find("boom") != std::string::npos, "stderr kept in the log");
  expect(store.size() == 0, "failed build not committed");

  CountingSampler sampler;
  energybench::SamplerChannel channel(sampler);
  energybench::TrialRunner runner(builder, channel);
  auto set = runner.run_trials(spec, one_trial_plan());
  expect(set.trials.size() == 1, "one trial recorded for a failed build");
  expect(set.trials[0].outcome == energybench::TrialOutcome::build_failure,
         "trial outcome is BuildFailure");
  expect(set.spec_error.code == energybench::ErrorCode::build_failure, "spec error reported");
  expect(set.fatal.ok(), "build failure is not fatal");
  expect(sampler.starts == 0, "no sampling window for a failed build");
  expect(builder.compile_count() == 1, "failed hash not retried in the same builder");

  ::unsetenv("ENERGYBENCH_CC");
  fs::remove_all(dir);
}

// ============================================================================
// Energy sampler
// ============================================================================

void test_sampling_window_states() {
  CountingSampler granted;
  energybench::SamplerChannel channel(granted);
  {
    auto w = channel.acquire();
    expect(w.granted() && !w.closed(), "window granted");
    auto e = w.close();
    expect(e.has_value() && near(*e, 1.0), "energy reported on close");
    w.close();
    expect(granted.stops == 1, "close is idempotent");
  }
  {
    auto w = channel.acquire();
    expect(w.granted(), "second window granted after release");
  }
  expect(granted.starts == 2 && granted.stops == 2, "destructor closes an open window");

  CountingSampler refused(false);
  energybench::SamplerChannel refused_channel(refused);
  {
    auto w = refused_channel.acquire();
    expect(w.refused(), "window refused");
  }
  expect(refused.stops == 0, "refused window is never stopped");
}

void test_powercap_sampler() {
  const auto root = scratch_dir("powercap");
  const auto pkg = root / "intel-rapl:0";
  const auto sub = root / "intel-rapl:0:0";
  fs::create_directories(pkg);
  fs::create_directories(sub);
  write_text(pkg / "energy_uj", "1000000\n");
  write_text(pkg / "max_energy_range_uj", "10000000\n");
  write_text(sub / "energy_uj", "5\n");

  energybench::PowercapSampler sampler(root.string());
  expect(sampler.zone_count() == 1, "sub zones skipped");
  expect(sampler.start(), "start reads the counters");
  expect(!sampler.start(), "windows never nest");
  write_text(pkg / "energy_uj", "3500000\n");
  sampler.stop();
  expect(sampler.last_energy_joules().has_value() &&
             near(*sampler.last_energy_joules(), 2.5),
         "energy delta in joules");

  write_text(pkg / "energy_uj", "9000000\n");
  expect(sampler.start(), "restart");
  write_text(pkg / "energy_uj", "1000000\n");
  sampler.stop();
  expect(near(*sampler.last_energy_joules(), 2.0), "counter wrap-around handled");

  energybench::PowercapSampler empty((root / "absent").string());
  expect(!empty.start(), "no zones means the sampler refuses");
  fs::remove_all(root);
}

// ============================================================================
// TrialRunner
// ============================================================================

struct RunnerFixture {
  explicit RunnerFixture(const std::string& name, CountingSampler& sampler)
      : dir(scratch_dir(name)),
        store((dir / "cache").string()),
        builder(store),
        channel(sampler),
        runner(builder, channel) {}
  ~RunnerFixture() { fs::remove_all(dir); }

  fs::path dir;
  energybench::ArtifactStore store;
  energybench::Builder builder;
  energybench::SamplerChannel channel;
  energybench::TrialRunner runner;
};

void test_validation_exactness() {
  CountingSampler sampler;
  RunnerFixture fx("runner_exact", sampler);
  auto pass = fx.runner.run_trials(script_spec("five", "echo 'check: 5'\n", "check: 5\n"),
                                   one_trial_plan());
  expect(pass.trials[0].outcome == energybench::TrialOutcome::pass, "matching output passes");
  expect(pass.trials[0].energy_joules.has_value(), "energy recorded");

  auto fail = fx.runner.run_trials(script_spec("six", "echo 'check: 6'\n", "check: 5\n"),
                                   one_trial_plan());
  const auto& t = fail.trials[0];
  expect(t.outcome == energybench::TrialOutcome::output_mismatch, "different output mismatches");
  expect(t.first_mismatch.has_value() && t.first_mismatch->line == 1 &&
             t.first_mismatch->actual == "check: 6",
         "first differing line retained");
  expect(fail.spec_error.ok() && fail.fatal.ok(), "mismatch is a failed trial only");
  expect(sampler.starts == 2 && sampler.stops == 2, "one window per trial");
}

void test_trial_timeout_single_stop() {
  CountingSampler sampler;
  RunnerFixture fx("runner_timeout", sampler);
  std::vector<energybench::TrialState> states;
  fx.runner.set_transition_hook([&](const energybench::WorkloadSpec&, std::uint32_t,
                                    energybench::TrialState, energybench::TrialState to) {
    states.push_back(to);
  });
  auto spec = script_spec("forever", "while :; do sleep 1; done\n", "");
  auto set = fx.runner.run_trials(spec, one_trial_plan(1000));
  expect(set.trials[0].outcome == energybench::TrialOutcome::timeout, "non-terminating is Timeout");
  expect(sampler.starts == 1 && sampler.stops == 1, "exactly one stop after a timeout");
  expect(sampler.open == 0, "sampler left closed");

  const std::vector<energybench::TrialState> want = {
      energybench::TrialState::building,  energybench::TrialState::sampler_acquire,
      energybench::TrialState::executing, energybench::TrialState::validating,
      energybench::TrialState::recorded,  energybench::TrialState::sampler_release};
  expect(states == want, "every state visited in order");
}

void test_non_zero_exit() {
  CountingSampler sampler;
  RunnerFixture fx("runner_exit", sampler);
  auto spec = script_spec("exit", "echo partial\necho 'bad input' >&2\nexit 2\n", "partial\n");
  auto set = fx.runner.run_trials(spec, one_trial_plan());
  const auto& t = set.trials[0];
  expect(t.outcome == energybench::TrialOutcome::non_zero_exit, "exit 2 is NonZeroExit");
  expect(t.exit_code == 2, "exit code kept");
  expect(t.detail.find("bad input") != std::string::npos, "stderr in detail");
}

void test_args_stdin_and_iterations() {
  CountingSampler sampler(true, 8.0);
  RunnerFixture fx("runner_iterations", sampler);
  auto spec = script_spec("loop",
                          "read prefix\n"
                          "i=0\n"
                          "while [ $i -lt $ENERGYBENCH_ITERATIONS ]; do\n"
                          "  echo \"$prefix $1\"\n"
                          "  i=$((i+1))\n"
                          "done\n",
                          "value 42\n");
  spec.args = {"42"};
  spec.stdin_text = "value\n";
  spec.sampling = energybench::SamplingMode::shared_window;
  spec.iterations = 4;

  energybench::TrialPlan plan = one_trial_plan();
  plan.trials = 2;
  plan.iterations = spec.iterations;
  plan.sampling = spec.sampling;
  auto set = fx.runner.run_trials(spec, plan);
  expect(set.trials.size() == 2, "two trials");
  for (const auto& t : set.trials) {
    expect(t.outcome == energybench::TrialOutcome::pass, "iteration-aware workload passes");
    expect(t.iterations == 4, "window covers four iterations");
    expect(near(*t.energy_per_iteration(), 2.0), "energy divided per iteration");
  }
  expect(set.trials[0].index == 0 && set.trials[1].index == 1, "trials in invocation order");
  expect(sampler.starts == 2, "one window per trial in shared mode");
}

void test_refused_sampler_is_fatal() {
  CountingSampler sampler(false);
  RunnerFixture fx("runner_refused", sampler);
  energybench::TrialPlan plan = one_trial_plan();
  plan.trials = 3;
  auto set = fx.runner.run_trials(script_spec("r", "echo x\n", "x\n"), plan);
  expect(set.trials.size() == 1, "trial set stops at the refusal");
  expect(set.trials[0].outcome == energybench::TrialOutcome::measurement_unavailable,
         "refusal recorded as MeasurementUnavailable");
  expect(set.fatal.code == energybench::ErrorCode::measurement_unavailable, "refusal is fatal");
  expect(set.fatal.spec_name == "r", "fatal error names the spec");
  expect(sampler.stops == 0, "no stop without a granted window");
}

void test_missing_reading_is_fatal() {
  CountingSampler sampler(true, std::nullopt);
  RunnerFixture fx("runner_no_reading", sampler);
  auto set = fx.runner.run_trials(script_spec("n", "echo x\n", "x\n"), one_trial_plan());
  expect(set.trials[0].outcome == energybench::TrialOutcome::measurement_unavailable,
         "missing reading is MeasurementUnavailable");
  expect(!set.fatal.ok(), "missing reading is fatal");
  expect(sampler.stops == 1, "window still closed");
}

void test_cancellation_between_trials() {
  CountingSampler sampler;
  RunnerFixture fx("runner_cancel", sampler);
  energybench::CancellationToken parent;
  energybench::CancellationToken child(&parent);
  energybench::TrialPlan plan = one_trial_plan();
  plan.trials = 5;
  auto set = fx.runner.run_trials(script_spec("c", "echo x\n", "x\n"), plan, &child,
                                  [&](const energybench::Trial& t) {
                                    if (t.index == 1) parent.cancel();
                                  });
  expect(child.cancelled(), "child observes the parent");
  expect(set.cancelled, "trial set cancelled");
  expect(set.trials.size() == 2, "trial in progress completes, no new trial starts");
  expect(sampler.starts == sampler.stops, "every window closed");
}

void test_perf_stat_csv_parsing() {
  const auto counters = energybench::parse_perf_stat_csv(
      "# started on Mon Oct 19 10:00:00 2026\n"
      "\n"
      "1200,,cycles,1000,100.00,,\n"
      "34,,cycles,1000,100.00,,\n"
      "<not counted>,,cache-misses,0,0.00,,\n"
      "<not supported>,,msr/cpu_thermal_margin/,0,0.00,,\n"
      "812.5,msec,cpu-clock,812500,100.00,0.998,CPUs utilized\n");
  expect(counters.size() == 2, "uncounted events skipped");
  expect(near(counters.at("cycles"), 1234.0), "repeated event lines summed");
  expect(near(counters.at("cpu-clock"), 812.5), "fractional counter parsed");
}

void test_perf_counter_mode() {
  CountingSampler sampler;
  RunnerFixture fx("runner_perf", sampler);
  const auto perf = fx.dir / "fake-perf";
  write_script(perf,
               "#!/bin/sh\n"
               "[ \"$1\" = stat ] || exit 64\n"
               "out=\"\"\n"
               "while [ \"$1\" != \"--\" ]; do\n"
               "  case \"$1\" in -o) out=\"$2\"; shift 2 ;; *) shift ;; esac\n"
               "done\n"
               "shift\n"
               "printf '# started\\n\\n1234,,cycles,100,100.00,,\\n"
               "<not counted>,,cache-misses,0,0.00,,\\n' > \"$out\"\n"
               "exec \"$@\"\n");

  auto plan = one_trial_plan();
  plan.trials = 2;
  plan.perf_events = {"cycles", "cache-misses"};
  plan.perf_command = perf.string();
  std::vector<energybench::Trial> seen;
  auto set = fx.runner.run_trials(script_spec("perf", "echo 'check: 5'\n", "check: 5\n"), plan,
                                  nullptr, [&](const energybench::Trial& t) { seen.push_back(t); });
  expect(set.trials.size() == 2, "both trials ran under perf");
  for (const auto& t : set.trials) {
    expect(t.outcome == energybench::TrialOutcome::pass, "wrapped workload output validated");
    expect(t.perf_counters.size() == 1 && near(t.perf_counters.at("cycles"), 1234.0),
           "counters recorded in the trial");
  }
  expect(sampler.starts == 2 && sampler.stops == 2, "perf runs inside the window");

  energybench::Aggregator agg;
  for (const auto& t : seen) agg.ingest(t);
  const auto m = agg.snapshot("perf", "python");
  expect(near(m.perf_means.at("cycles"), 1234.0), "summary carries perf means");

  auto obj = energybench::jsonlite::parse(energybench::trial_to_json(set.trials[0]), nullptr);
  const auto* counters = energybench::jsonlite::find(obj, "perf");
  expect(counters && std::holds_alternative<energybench::jsonlite::Object>(counters->v),
         "trial JSON includes perf counters");

  plan.perf_command = (fx.dir / "no-such-perf").string();
  plan.trials = 1;
  auto missing = fx.runner.run_trials(script_spec("perf", "echo 'check: 5'\n", "check: 5\n"),
                                      plan);
  expect(missing.trials[0].outcome == energybench::TrialOutcome::non_zero_exit &&
             missing.trials[0].perf_counters.empty(),
         "missing perf binary fails the trial");
}

void test_trial_niceness() {
  CountingSampler sampler;
  RunnerFixture fx("runner_nice", sampler);
  auto plan = one_trial_plan();
  plan.niceness = 7;
  auto set = fx.runner.run_trials(script_spec("nice", "nice\n", "7\n"), plan);
  expect(set.trials[0].outcome == energybench::TrialOutcome::pass,
         "workload observes the plan's niceness");
}

// ============================================================================
// Aggregator
// ============================================================================

energybench::Trial pass_trial(std::uint32_t index, double joules, std::uint64_t ms) {
  energybench::Trial t;
  t.spec_name = "agg";
  t.language = "c";
  t.index = index;
  t.start_ns = 1000;
  t.end_ns = 1000 + ms * 1000000;
  t.energy_joules = joules;
  t.outcome = energybench::TrialOutcome::pass;
  return t;
}

void test_warmup_and_outlier_rejection() {
  energybench::TrialSet trials;
  const double energy[] = {10, 11, 9, 10, 50};
  for (std::uint32_t i = 0; i < 5; ++i) trials.push_back(pass_trial(i, energy[i], 100 + i));

  energybench::AggregatorOptions opt;
  opt.warmup_discard = 1;
  const auto m = energybench::summarize("agg", "c", trials, opt);
  expect(m.trial_count == 5, "all trials counted");
  expect(m.discarded_warmup == 1, "one warm-up trial discarded");
  expect(m.rejected_outliers == 1, "50 rejected as an outlier");
  expect(m.energy_joules.sample_count == 3, "three samples kept");
  expect(near(m.energy_joules.mean, 10.0), "mean excludes warm-up and outlier");
  expect(near(m.energy_joules.min, 9.0) && near(m.energy_joules.max, 11.0), "min/max");
  expect(near(m.energy_joules.stddev, 1.0), "sample stddev");
  const double half = 4.303 / std::sqrt(3.0);
  expect(near(m.energy_joules.ci_low, 10.0 - half, 1e-6) &&
             near(m.energy_joules.ci_high, 10.0 + half, 1e-6),
         "95% Student-t interval");
  expect(m.time_ms.sample_count == 3, "time statistics over the same trials");
  expect(near(m.pass_rate, 1.0), "pass rate");
}

void test_aggregator_statistics_helpers() {
  expect(near(energybench::quantile_sorted({1, 2, 3, 4}, 0.25), 1.75), "interpolated Q1");
  expect(near(energybench::quantile_sorted({1, 2, 3, 4}, 0.5), 2.5), "interpolated median");
  expect(near(energybench::student_t_95(1), 12.706), "t table dof 1");
  expect(near(energybench::student_t_95(1000), 1.960), "normal limit");

  std::size_t rejected = 0;
  auto kept = energybench::reject_outliers({5, 100}, 1.5, &rejected);
  expect(kept.size() == 2 && rejected == 0, "fewer than three samples are all kept");

  energybench::RunningStats r;
  for (double x : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) r.push(x);
  expect(near(r.mean, 5.0) && near(r.variance(), 32.0 / 7.0), "Welford mean and variance");
}

void test_aggregator_ingest_order() {
  energybench::Aggregator agg;
  auto other = pass_trial(0, 3.0, 10);
  other.spec_name = "second";
  agg.ingest(pass_trial(0, 1.0, 10));
  agg.ingest(other);
  auto failed = pass_trial(1, 2.0, 10);
  failed.outcome = energybench::TrialOutcome::timeout;
  agg.ingest(failed);

  const auto all = agg.snapshot_all();
  expect(all.size() == 2 && all[0].spec_name == "agg" && all[1].spec_name == "second",
         "summaries in first-arrival order");
  expect(all[0].trial_count == 2 && near(all[0].pass_rate, 0.5), "failed trials lower pass rate");
  expect(all[0].energy_joules.sample_count == 1, "only passing trials give samples");
  expect(agg.trials("agg", "c").size() == 2, "trials kept in order");
  expect(agg.snapshot("missing", "c").trial_count == 0, "unknown spec is empty");
}

void test_aggregator_running_and_perf_means() {
  energybench::Aggregator agg(energybench::AggregatorOptions{1, energybench::kOutlierIqrMultiple});
  const double energy[] = {4.0, 2.0, 4.0, 6.0};
  const double cycles[] = {900.0, 100.0, 200.0, 300.0};
  for (std::uint32_t i = 0; i < 4; ++i) {
    auto t = pass_trial(i, energy[i], 10);
    t.perf_counters["cycles"] = cycles[i];
    agg.ingest(t);
  }
  auto failed = pass_trial(4, 100.0, 10);
  failed.outcome = energybench::TrialOutcome::output_mismatch;
  agg.ingest(failed);

  const auto running = agg.running("agg", "c");
  expect(running.count == 4, "running stats count every passing trial, warm-up included");
  expect(near(running.mean, 4.0) && near(running.variance(), 8.0 / 3.0),
         "running mean and variance");
  expect(near(running.min, 2.0) && near(running.max, 6.0), "running min/max");
  expect(agg.running("missing", "c").count == 0, "unknown spec has no running stats");

  const auto m = agg.snapshot("agg", "c");
  expect(m.energy_joules.sample_count == 3, "warm-up excluded from the summary");
  expect(near(m.perf_means.at("cycles"), 200.0), "perf means over the kept trials");
}

// ============================================================================
// Harness
// ============================================================================

std::atomic<int> g_build_events{0};
std::atomic<int> g_trial_events{0};
std::atomic<int> g_fatal_events{0};

void count_event(const energybench::HarnessEvent& ev) {
  switch (ev.kind) {
    case energybench::EventKind::build: g_build_events++; break;
    case energybench::EventKind::trial: g_trial_events++; break;
    case energybench::EventKind::fatal: g_fatal_events++; break;
  }
}

energybench::HarnessConfig harness_config(const fs::path& dir) {
  energybench::HarnessConfig cfg;
  cfg.cache_root = (dir / "cache").string();
  cfg.trials = 3;
  cfg.timeout_ms = 10000;
  cfg.build_workers = 2;
  cfg.measure_workers = 4;
  return cfg;
}

void test_harness_exclusive_sampling() {
  const auto dir = scratch_dir("harness_exclusive");
  CountingSampler sampler;
  energybench::SamplerChannel::reset_instrumentation();
  g_build_events = g_trial_events = g_fatal_events = 0;
  energybench::set_event_hook(count_event);

  std::vector<energybench::WorkloadSpec> specs;
  for (int i = 0; i < 6; ++i) {
    specs.push_back(script_spec("w" + std::to_string(i),
                                "# " + std::to_string(i) + "\nsleep 0.02\necho ok\n", "ok\n"));
  }
  energybench::Harness harness(harness_config(dir), sampler);
  auto result = harness.run(specs);
  energybench::set_event_hook(nullptr);

  expect(result.ok(), "harness run succeeds");
  expect(result.summaries.size() == 6, "one summary per spec");
  for (std::size_t i = 0; i < specs.size(); ++i) {
    expect(result.summaries[i].spec_name == specs[i].name, "summaries in input order");
    expect(result.summaries[i].trial_count == 3, "configured trial count");
    expect(near(result.summaries[i].pass_rate, 1.0), "all trials pass");
  }
  expect(sampler.max_open == 1, "sampler never saw two open windows");
  expect(energybench::SamplerChannel::max_concurrent_windows() == 1,
         "channel instrumentation never saw two open windows");
  expect(sampler.starts == 18 && sampler.stops == 18, "one window per trial");
  expect(g_build_events == 6 && g_trial_events == 18 && g_fatal_events == 0,
         "one event per build and per trial");
  fs::remove_all(dir);
}

void test_harness_fatal_stops_run() {
  const auto dir = scratch_dir("harness_fatal");
  CountingSampler sampler(false);
  auto cfg = harness_config(dir);
  cfg.measure_workers = 1;
  std::vector<energybench::WorkloadSpec> specs = {script_spec("f1", "echo a\n", "a\n"),
                                                  script_spec("f2", "echo b\n", "b\n")};
  energybench::Harness harness(cfg, sampler);
  auto result = harness.run(specs);
  expect(result.fatal.code == energybench::ErrorCode::measurement_unavailable,
         "refused sampler is fatal to the run");
  expect(result.fatal.spec_name == "f1", "fatal error names the spec");
  expect(!result.cancelled, "a fatal stop is not a cancellation");
  expect(sampler.starts == 1, "no further window requested after the fatal error");
  expect(result.summaries.size() == 1, "second spec never started");
  fs::remove_all(dir);
}

void test_harness_spec_errors_isolated() {
  const auto dir = scratch_dir("harness_errors");
  CountingSampler sampler;
  auto broken = script_spec("broken", "echo x\n", "x\n");
  broken.dependencies = {"energybench-no-such-tool-xyz"};
  auto slow = script_spec("slow", "sleep 5\n", "");
  slow.timeout_ms = 300;
  slow.trials = 1;
  std::vector<energybench::WorkloadSpec> specs = {broken, slow,
                                                  script_spec("good", "echo x\n", "x\n")};
  energybench::Harness harness(harness_config(dir), sampler);
  auto result = harness.run(specs);
  expect(result.fatal.ok(), "spec errors are not fatal");
  expect(result.spec_errors.size() == 1 &&
             result.spec_errors[0].code == energybench::ErrorCode::missing_dependency &&
             result.spec_errors[0].spec_name == "broken",
         "missing dependency reported for its spec only");
  expect(result.summaries.size() == 3, "every spec has a summary");
  expect(result.summaries[1].trial_count == 1 && near(result.summaries[1].pass_rate, 0.0),
         "per-spec timeout and trial count honored");
  expect(near(result.summaries[2].pass_rate, 1.0), "other specs continue");
  fs::remove_all(dir);
}

void test_harness_cancelled_before_start() {
  const auto dir = scratch_dir("harness_cancel");
  CountingSampler sampler;
  energybench::CancellationToken token;
  token.cancel();
  energybench::Harness harness(harness_config(dir), sampler);
  auto result = harness.run({script_spec("c", "echo x\n", "x\n")}, &token);
  expect(result.cancelled, "cancellation reported");
  expect(sampler.starts == 0, "no trial started");
  fs::remove_all(dir);
}

void test_harness_niceness_precedence() {
  const auto dir = scratch_dir("harness_nice");
  CountingSampler sampler;
  auto cfg = harness_config(dir);
  cfg.trials = 1;
  cfg.niceness = 3;
  auto own = script_spec("own", "nice\n", "6\n");
  own.niceness = 6;
  std::vector<energybench::WorkloadSpec> specs = {own,
                                                  script_spec("inherit", "nice\n", "3\n")};
  energybench::Harness harness(cfg, sampler);
  auto result = harness.run(specs);
  expect(result.ok() && result.summaries.size() == 2, "both specs measured");
  expect(near(result.summaries[0].pass_rate, 1.0), "spec niceness overrides the config");
  expect(near(result.summaries[1].pass_rate, 1.0), "config niceness applies otherwise");
  fs::remove_all(dir);
}

// ============================================================================
// Config, reports, version, observability, worker pool
// ============================================================================

void test_config_layers() {
  energybench::HarnessConfig base;
  energybench::Error err;
  auto cfg = energybench::config_from_json(
      "{\"trials\":5,\"cache_root\":\"/tmp/eb\",\"sampler\":\"none\",\"unknown\":1}", base, &err);
  expect(err.ok(), "config parses");
  expect(cfg.trials == 5 && cfg.cache_root == "/tmp/eb" && cfg.sampler == "none",
         "JSON overlays defaults");
  expect(cfg.timeout_ms == 60000, "unset keys keep defaults");

  energybench::config_from_json("{\"trials\":\"many\"}", base, &err);
  expect(err.code == energybench::ErrorCode::config_error, "wrongly typed key is a config error");

  ::setenv("ENERGYBENCH_TRIALS", "7", 1);
  ::setenv("ENERGYBENCH_TIMEOUT_MS", "soon", 1);
  std::vector<std::string> warnings;
  auto env_cfg = energybench::config_from_env(cfg, &warnings);
  ::unsetenv("ENERGYBENCH_TRIALS");
  ::unsetenv("ENERGYBENCH_TIMEOUT_MS");
  expect(env_cfg.trials == 7, "environment overrides the file");
  expect(env_cfg.timeout_ms == 60000 && warnings.size() == 1, "bad value skipped with a warning");

  energybench::HarnessConfig bad;
  bad.trials = 0;
  bad.sampler = "magic";
  auto v = energybench::validate_config(bad);
  expect(!v.ok() && v.errors.size() == 2, "validation reports every error");

  auto json = energybench::jsonlite::parse(energybench::config_to_json(cfg), nullptr);
  expect(energybench::jsonlite::get_u64(json, "trials") == 5, "config serialized");
}

void test_config_ranges_niceness_and_perf() {
  energybench::HarnessConfig base;
  energybench::Error err;
  auto cfg = energybench::config_from_json("{\"trials\":4294967296}", base, &err);
  expect(err.code == energybench::ErrorCode::config_error && cfg.trials == base.trials,
         "trials above 2^32-1 rejected");

  err = {};
  cfg = energybench::config_from_json(
      "{\"niceness\":-5,\"perf_events\":[\"cycles\",\"cache-misses\"],"
      "\"perf_command\":\"/usr/bin/perf\"}",
      base, &err);
  expect(err.ok() && cfg.niceness == -5, "negative niceness read");
  expect(cfg.perf_events.size() == 2 && cfg.perf_command == "/usr/bin/perf", "perf settings read");

  auto round = energybench::config_from_json(energybench::config_to_json(cfg), base, &err);
  expect(err.ok() && round.niceness == -5 && round.perf_events == cfg.perf_events,
         "config show output reads back");

  err = {};
  energybench::config_from_json("{\"niceness\":30}", base, &err);
  expect(err.code == energybench::ErrorCode::config_error, "niceness outside [-20, 19] rejected");

  err = {};
  energybench::config_from_json("{\"perf_events\":\"cycles\"}", base, &err);
  expect(err.code == energybench::ErrorCode::config_error, "perf_events must be a list");

  energybench::HarnessConfig slow;
  slow.timeout_ms = 10000000000000ull;
  auto v = energybench::validate_config(slow);
  expect(!v.ok() && v.errors[0].find("timeout_ms") != std::string::npos,
         "timeout above one day is a validation error");
  slow.timeout_ms = energybench::kMaxTimeoutMs;
  expect(energybench::validate_config(slow).ok(), "one-day timeout allowed");

  ::setenv("ENERGYBENCH_NICENESS", "-3", 1);
  ::setenv("ENERGYBENCH_PERF_EVENTS", "cycles,,instructions", 1);
  ::setenv("ENERGYBENCH_TRIALS", "4294967296", 1);
  std::vector<std::string> warnings;
  auto env_cfg = energybench::config_from_env(base, &warnings);
  ::unsetenv("ENERGYBENCH_NICENESS");
  ::unsetenv("ENERGYBENCH_PERF_EVENTS");
  ::unsetenv("ENERGYBENCH_TRIALS");
  expect(env_cfg.niceness == -3, "niceness from the environment");
  expect(env_cfg.perf_events == (std::vector<std::string>{"cycles", "instructions"}),
         "perf events split on commas");
  expect(env_cfg.trials == base.trials && warnings.size() == 1,
         "out-of-range trials skipped with a warning");
}

void test_report_formats() {
  energybench::MeasurementSummary m;
  m.spec_name = "a,b";
  m.language = "c";
  m.trial_count = 4;
  m.pass_rate = 0.75;
  m.energy_joules.sample_count = 3;
  m.energy_joules.mean = 1.5;

  const auto header = energybench::csv_header();
  expect(header.rfind("name,language,trials,", 0) == 0, "CSV header leads with identity");
  const auto row = energybench::summary_to_csv_row(m);
  expect(row.rfind("\"a,b\",c,4,", 0) == 0, "CSV text fields quoted");
  std::size_t header_cols = 1, row_cols = 1;
  for (char c : header) header_cols += c == ',';
  for (char c : row) row_cols += c == ',';
  expect(row_cols == header_cols + 1, "row has one column per header entry");

  std::optional<energybench::jsonlite::JsonError> err;
  auto obj = energybench::jsonlite::parse(energybench::summary_to_json(m), &err);
  expect(!err.has_value(), "summary JSON parses");
  expect(energybench::jsonlite::get_u64(obj, "schema") ==
             energybench::version::REPORT_SCHEMA_VERSION,
         "summary carries the schema version");
  expect(near(energybench::jsonlite::get_double(obj, "pass_rate"), 0.75), "pass rate serialized");
  const auto* energy = energybench::jsonlite::find(obj, "energy_joules");
  expect(energy && std::holds_alternative<energybench::jsonlite::Object>(energy->v),
         "energy statistics nested");

  const auto jsonl = energybench::summaries_to_jsonl({m, m});
  expect(std::count(jsonl.begin(), jsonl.end(), '\n') == 2, "one JSON line per summary");

  const auto dir = scratch_dir("report");
  const auto path = (dir / "out" / "summary.csv").string();
  expect(energybench::write_report_file(path, energybench::summaries_to_csv({m})),
         "report written");
  expect(count_lines(path) == 2, "header plus one row");
  fs::remove_all(dir);
}

void test_version_manifest() {
  const auto quoted = energybench::version::current_manifest("1.0.0-\"rc\"\\1");
  std::optional<energybench::jsonlite::JsonError> jerr;
  auto qobj = energybench::jsonlite::parse(energybench::version::manifest_to_json(quoted), &jerr);
  expect(!jerr.has_value(), "manifest with quotes in semver is valid JSON");
  expect(energybench::jsonlite::get_string(qobj, "semver") == "1.0.0-\"rc\"\\1",
         "semver escaped and read back");

  const auto m = energybench::version::current_manifest("9.9.9");
  expect(m.semver == "9.9.9", "semver recorded");
  expect(m.hash_primitive == "blake3", "hash primitive recorded");
  auto obj = energybench::jsonlite::parse(energybench::version::manifest_to_json(m), nullptr);
  expect(energybench::jsonlite::get_u64(obj, "artifact_format") ==
             energybench::version::ARTIFACT_FORMAT_VERSION,
         "manifest JSON lists the artifact format");
  expect(energybench::version::check_artifact_format(
             energybench::version::ARTIFACT_FORMAT_VERSION).ok,
         "current format accepted");
  expect(!energybench::version::check_artifact_format(
              energybench::version::ARTIFACT_FORMAT_VERSION + 1).ok,
         "other formats rejected");
}

void test_latency_histogram_and_stats() {
  energybench::LatencyHistogram h;
  for (int i = 0; i < 100; ++i) h.record(1000000);  // 1 ms
  expect(h.count() == 100, "histogram counts samples");
  expect(h.percentile(0.5) > 0.0, "percentile estimated");

  energybench::HarnessEvent ev;
  ev.kind = energybench::EventKind::trial;
  ev.spec_name = "s";
  ev.language = "c";
  ev.outcome = "pass";
  ev.ok = true;
  ev.energy_joules = 1.25;
  auto obj = energybench::jsonlite::parse(energybench::event_to_json(ev), nullptr);
  expect(energybench::jsonlite::get_string(obj, "kind") == "trial", "event kind serialized");
  expect(near(energybench::jsonlite::get_double(obj, "energy_joules"), 1.25),
         "event energy serialized");

  auto& stats = energybench::global_harness_stats();
  const auto before = stats.failure_snapshot()["timeout"];
  stats.record_failure(energybench::ErrorCode::timeout);
  expect(stats.failure_snapshot()["timeout"] == before + 1, "failure category counted");
}

void test_worker_pool() {
  std::atomic<int> sum{0};
  std::vector<std::future<int>> results;
  {
    energybench::WorkerPool pool(4);
    expect(pool.size() == 4, "pool size");
    for (int i = 1; i <= 100; ++i) {
      results.push_back(pool.submit([i, &sum] {
        sum += i;
        return i * 2;
      }));
    }
  }
  expect(sum == 5050, "every queued task ran before shutdown");
  expect(results[9].get() == 20, "task result delivered through the future");

  energybench::WorkerPool pool(1);
  auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
  bool threw = false;
  try {
    failing.get();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  expect(threw, "task exception delivered through the future");
}

}  // namespace

int main() {
  // Script workloads run under the shell instead of a Python interpreter.
  ::setenv("ENERGYBENCH_PYTHON", "/bin/sh", 1);
  ::unsetenv("ENERGYBENCH_EVENT_LOG");

  std::cout << "=== energybench Test Suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("build content hash fields", test_build_content_hash_fields);

  std::cout << "\n[JSON]\n";
  run_test("strict parsing", test_json_strictness);
  run_test("surrogate pairs", test_json_surrogate_pairs);

  std::cout << "\n[SpecRegistry]\n";
  run_test("missing fields rejected", test_registry_missing_fields);
  run_test("duplicates and aliases", test_registry_duplicates_and_aliases);
  run_test("directory scan and code_file", test_registry_directory_and_code_file);
  run_test("numeric ranges", test_registry_numeric_ranges);
  run_test("YAML documents", test_registry_yaml_documents);

  std::cout << "\n[Validation]\n";
  run_test("output normalization", test_normalize_output);
  run_test("first mismatch", test_first_mismatch);

  std::cout << "\n[Process]\n";
  run_test("exit codes and pipes", test_process_exit_codes);
  run_test("timeout kills process group", test_process_timeout_kills_group);
  run_test("huge timeout does not fire", test_process_huge_timeout_does_not_fire);
  run_test("niceness applied in the child", test_process_niceness);
  run_test("executable lookup", test_find_executable);

  std::cout << "\n[Environment]\n";
  run_test("language aliases", test_environment_aliases);
  run_test("missing dependency", test_missing_dependency);

  std::cout << "\n[ArtifactStore]\n";
  run_test("commit, lookup, race, corruption", test_artifact_store_commit_lookup);
  run_test("failed build not committed", test_artifact_store_rejects_failed_build);

  std::cout << "\n[Builder]\n";
  run_test("5 concurrent builds compile once", test_concurrent_builds_compile_once);
  run_test("rebuild is idempotent", test_rebuild_is_idempotent);
  run_test("build failure classified", test_build_failure_classified);

  std::cout << "\n[EnergySampler]\n";
  run_test("sampling window states", test_sampling_window_states);
  run_test("powercap counters", test_powercap_sampler);

  std::cout << "\n[TrialRunner]\n";
  run_test("validation exactness", test_validation_exactness);
  run_test("timeout with single stop", test_trial_timeout_single_stop);
  run_test("non-zero exit", test_non_zero_exit);
  run_test("args, stdin and shared window", test_args_stdin_and_iterations);
  run_test("refused sampler is fatal", test_refused_sampler_is_fatal);
  run_test("missing reading is fatal", test_missing_reading_is_fatal);
  run_test("cancellation between trials", test_cancellation_between_trials);
  run_test("perf stat CSV parsing", test_perf_stat_csv_parsing);
  run_test("perf counter mode", test_perf_counter_mode);
  run_test("niceness", test_trial_niceness);

  std::cout << "\n[Aggregator]\n";
  run_test("warm-up and outlier rejection", test_warmup_and_outlier_rejection);
  run_test("statistics helpers", test_aggregator_statistics_helpers);
  run_test("ingest order", test_aggregator_ingest_order);
  run_test("running stats and perf means", test_aggregator_running_and_perf_means);

  std::cout << "\n[Harness]\n";
  run_test("exclusive sampling under concurrency", test_harness_exclusive_sampling);
  run_test("fatal error stops the run", test_harness_fatal_stops_run);
  run_test("spec errors isolated", test_harness_spec_errors_isolated);
  run_test("cancelled before start", test_harness_cancelled_before_start);
  run_test("niceness precedence", test_harness_niceness_precedence);

  std::cout << "\n[Ambient]\n";
  run_test("config layers", test_config_layers);
  run_test("config ranges, niceness and perf", test_config_ranges_niceness_and_perf);
  run_test("report formats", test_report_formats);
  run_test("version manifest", test_version_manifest);
  run_test("latency histogram and stats", test_latency_histogram_and_stats);
  run_test("worker pool", test_worker_pool);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
