#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "energybench/aggregator.hpp"
#include "energybench/artifact_store.hpp"
#include "energybench/config.hpp"
#include "energybench/environment.hpp"
#include "energybench/harness.hpp"
#include "energybench/jsonlite.hpp"
#include "energybench/observability.hpp"
#include "energybench/report.hpp"
#include "energybench/spec_registry.hpp"
#include "energybench/version.hpp"

#ifndef ENERGYBENCH_VERSION
#define ENERGYBENCH_VERSION "0.1.0"
#endif

namespace {

energybench::CancellationToken g_interrupt;

extern "C" void on_sigint(int) { g_interrupt.cancel(); }

std::string read_file(const std::string &path, bool *ok) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (ok)
      *ok = false;
    return {};
  }
  if (ok)
    *ok = true;
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

void print_error_json(const energybench::Error &e) {
  energybench::jsonlite::Object o;
  o["error"] = energybench::to_string(e.code);
  if (!e.spec_name.empty())
    o["name"] = e.spec_name;
  if (!e.language.empty())
    o["language"] = e.language;
  if (!e.source_path.empty())
    o["source"] = e.source_path;
  o["detail"] = e.detail;
  std::cerr << energybench::jsonlite::to_json(energybench::jsonlite::Value{
                   std::move(o)})
            << "\n";
}

void print_message_json(const std::string &code, const std::string &detail) {
  std::cerr << "{\"error\":\"" << energybench::jsonlite::escape(code)
            << "\",\"detail\":\"" << energybench::jsonlite::escape(detail)
            << "\"}\n";
}

struct CommonArgs {
  std::vector<std::string> sources;
  std::string config_file;
  std::string json_out;
  std::string csv_out;
  std::string trials_out;
  bool stats{false};
  bool ok{true};
};

CommonArgs parse_common(int argc, char **argv, int first) {
  CommonArgs a;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&](std::string &dst) {
      if (i + 1 >= argc) {
        print_message_json("usage", arg + " requires a value");
        a.ok = false;
        return;
      }
      dst = argv[++i];
    };
    if (arg == "--config")
      value(a.config_file);
    else if (arg == "--json")
      value(a.json_out);
    else if (arg == "--csv")
      value(a.csv_out);
    else if (arg == "--trials-out")
      value(a.trials_out);
    else if (arg == "--stats")
      a.stats = true;
    else if (arg.rfind("--", 0) == 0) {
      print_message_json("usage", "unknown option " + arg);
      a.ok = false;
    } else
      a.sources.push_back(arg);
  }
  return a;
}

// Defaults, then the config file, then ENERGYBENCH_* variables.
bool load_config(const CommonArgs &args, energybench::HarnessConfig *out) {
  energybench::HarnessConfig cfg;
  if (!args.config_file.empty()) {
    bool readable = false;
    const std::string text = read_file(args.config_file, &readable);
    if (!readable) {
      print_message_json("io_error", "cannot read " + args.config_file);
      return false;
    }
    energybench::Error err;
    cfg = energybench::config_from_json(text, cfg, &err);
    if (!err.ok()) {
      err.source_path = args.config_file;
      print_error_json(err);
      return false;
    }
  }
  std::vector<std::string> env_warnings;
  cfg = energybench::config_from_env(cfg, &env_warnings);
  for (const auto &w : env_warnings)
    std::cerr << "warning: " << w << "\n";

  const auto validation = energybench::validate_config(cfg);
  for (const auto &w : validation.warnings)
    std::cerr << "warning: " << w << "\n";
  if (!validation.ok()) {
    for (const auto &e : validation.errors)
      print_message_json("config_error", e);
    return false;
  }
  *out = std::move(cfg);
  return true;
}

bool load_specs(const CommonArgs &args, energybench::SpecRegistry &registry) {
  if (args.sources.empty()) {
    print_message_json("usage", "no workload spec files or directories given");
    return false;
  }
  const auto report = registry.load(args.sources);
  for (const auto &e : report.errors)
    print_error_json(e);
  return report.ok();
}

std::mutex g_progress_mu;

void print_progress(const energybench::Aggregator &aggregator,
                    const energybench::WorkloadSpec &spec, std::uint32_t index,
                    energybench::TrialState to) {
  if (to == energybench::TrialState::executing) {
    std::lock_guard<std::mutex> lk(g_progress_mu);
    std::cout << "[" << spec.key() << "] trial " << (index + 1) << "\n"
              << std::flush;
    return;
  }
  if (to != energybench::TrialState::sampler_release)
    return;
  const auto running = aggregator.running(spec.name, spec.language);
  if (running.count == 0)
    return;
  std::lock_guard<std::mutex> lk(g_progress_mu);
  std::cout << "[" << spec.key() << "] running mean "
            << energybench::jsonlite::format_double(running.mean) << " J (sd "
            << energybench::jsonlite::format_double(running.stddev()) << ", n "
            << running.count << ")\n"
            << std::flush;
}

void print_summary_line(const energybench::MeasurementSummary &m) {
  std::ostringstream oss;
  oss << m.spec_name << "/" << m.language << ": " << m.energy_joules.sample_count
      << "/" << m.trial_count << " samples, energy "
      << energybench::jsonlite::format_double(m.energy_joules.mean) << " J (+/- "
      << energybench::jsonlite::format_double(m.energy_joules.mean -
                                              m.energy_joules.ci_low)
      << "), time " << energybench::jsonlite::format_double(m.time_ms.mean)
      << " ms, pass rate " << energybench::jsonlite::format_double(m.pass_rate);
  std::cout << oss.str() << "\n";
}

int cmd_run(int argc, char **argv) {
  CommonArgs args = parse_common(argc, argv, 2);
  if (!args.ok)
    return 1;
  energybench::HarnessConfig cfg;
  if (!load_config(args, &cfg))
    return 1;
  energybench::SpecRegistry registry;
  if (!load_specs(args, registry))
    return 1;

  std::signal(SIGINT, on_sigint);

  auto sampler = energybench::make_sampler(cfg);
  energybench::Harness harness(cfg, *sampler);
  harness.set_transition_hook(
      [&harness](const energybench::WorkloadSpec &spec, std::uint32_t index,
                 energybench::TrialState, energybench::TrialState to) {
        print_progress(harness.aggregator(), spec, index, to);
      });

  std::cout << "energybench " << ENERGYBENCH_VERSION << ": "
            << registry.size() << " workload(s), sampler "
            << sampler->sampler_id() << "\n";
  const auto result = harness.run(registry.specs(), &g_interrupt);

  for (const auto &e : result.spec_errors)
    print_error_json(e);
  if (!result.fatal.ok())
    print_error_json(result.fatal);

  for (const auto &m : result.summaries)
    print_summary_line(m);
  if (args.stats)
    std::cout << energybench::global_harness_stats().to_json() << "\n";

  bool wrote = true;
  if (!args.json_out.empty() &&
      !energybench::write_report_file(
          args.json_out, energybench::summaries_to_jsonl(result.summaries))) {
    print_message_json("io_error", "cannot write " + args.json_out);
    wrote = false;
  }
  if (!args.csv_out.empty() &&
      !energybench::write_report_file(
          args.csv_out, energybench::summaries_to_csv(result.summaries))) {
    print_message_json("io_error", "cannot write " + args.csv_out);
    wrote = false;
  }
  if (!args.trials_out.empty()) {
    std::string lines;
    for (const auto &spec : registry.specs()) {
      for (const auto &t :
           harness.aggregator().trials(spec.name, spec.language)) {
        lines += energybench::trial_to_json(t);
        lines += '\n';
      }
    }
    if (!energybench::write_report_file(args.trials_out, lines)) {
      print_message_json("io_error", "cannot write " + args.trials_out);
      wrote = false;
    }
  }

  if (result.cancelled) {
    std::cerr << "{\"error\":\"cancelled\"}\n";
    return 130;
  }
  if (!result.fatal.ok())
    return 3;
  if (!result.spec_errors.empty() || !wrote)
    return 2;
  return 0;
}

// Load specs and resolve their host dependencies without building.
int cmd_check(int argc, char **argv) {
  CommonArgs args = parse_common(argc, argv, 2);
  if (!args.ok)
    return 1;
  energybench::SpecRegistry registry;
  bool loaded = load_specs(args, registry);

  bool all_ok = loaded;
  for (const auto &spec : registry.specs()) {
    const auto *env = energybench::environment_for(spec.language);
    energybench::Error err;
    std::vector<std::string> components;
    if (env)
      components = env->resolve_dependencies(spec, &err);
    std::cout << "{\"name\":\"" << energybench::jsonlite::escape(spec.name)
              << "\",\"language\":\"" << spec.language << "\",\"ok\":"
              << (env && err.ok() ? "true" : "false") << ",\"components\":[";
    for (std::size_t i = 0; i < components.size(); ++i) {
      if (i)
        std::cout << ",";
      std::cout << "\"" << energybench::jsonlite::escape(components[i]) << "\"";
    }
    std::cout << "]}\n";
    if (!err.ok()) {
      print_error_json(err);
      all_ok = false;
    }
  }
  return all_ok ? 0 : 2;
}

int cmd_cache(int argc, char **argv) {
  CommonArgs args = parse_common(argc, argv, 3);
  if (!args.ok)
    return 1;
  energybench::HarnessConfig cfg;
  if (!load_config(args, &cfg))
    return 1;
  energybench::ArtifactStore store(cfg.cache_root, cfg.log_compression);
  const std::string sub = argv[2];

  if (sub == "list") {
    for (const auto &hash : store.list()) {
      const auto m = store.manifest(hash);
      std::cout << "{\"hash\":\"" << hash << "\"";
      if (m) {
        std::cout << ",\"name\":\"" << energybench::jsonlite::escape(m->spec_name)
                  << "\",\"language\":\"" << m->language
                  << "\",\"log_encoding\":\"" << m->log_encoding << "\"";
      }
      std::cout << "}\n";
    }
    return 0;
  }
  if (sub == "log") {
    if (args.sources.empty()) {
      print_message_json("usage", "cache log <hash>");
      return 1;
    }
    const auto log = store.get_log(args.sources.front());
    if (!log) {
      print_message_json("not_found", args.sources.front());
      return 2;
    }
    std::cout << *log;
    return 0;
  }
  if (sub == "remove") {
    int rc = 0;
    for (const auto &hash : args.sources) {
      if (!store.remove(hash)) {
        print_message_json("not_found", hash);
        rc = 2;
      }
    }
    return rc;
  }
  print_message_json("usage", "cache list|log|remove");
  return 1;
}

void print_usage() {
  std::cerr
      << "usage: energybench <command> [options]\n"
         "  run <spec|dir>... [--config f] [--json f] [--csv f] "
         "[--trials-out f] [--stats]\n"
         "  check <spec|dir>...\n"
         "  config show [--config f]\n"
         "  cache list|log <hash>|remove <hash>... [--config f]\n"
         "  languages\n"
         "  version\n";
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }
  const std::string cmd = argv[1];

  if (cmd == "run")
    return cmd_run(argc, argv);

  if (cmd == "check")
    return cmd_check(argc, argv);

  if (cmd == "cache" && argc >= 3)
    return cmd_cache(argc, argv);

  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "show") {
    CommonArgs args = parse_common(argc, argv, 3);
    if (!args.ok)
      return 1;
    energybench::HarnessConfig cfg;
    if (!load_config(args, &cfg))
      return 1;
    std::cout << energybench::config_to_json(cfg) << "\n";
    return 0;
  }

  if (cmd == "languages") {
    for (const auto &lang : energybench::supported_languages())
      std::cout << lang << "\n";
    return 0;
  }

  if (cmd == "version") {
    const auto manifest =
        energybench::version::current_manifest(ENERGYBENCH_VERSION);
    std::cout << energybench::version::manifest_to_json(manifest) << "\n";
    return 0;
  }

  if (cmd == "help" || cmd == "--help") {
    print_usage();
    return 0;
  }

  print_usage();
  return 1;
}
