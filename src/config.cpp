#include "energybench/config.hpp"

#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <thread>
#include <type_traits>

#include "energybench/jsonlite.hpp"

namespace energybench {

namespace {

std::optional<std::uint64_t> parse_u64(const char* text) {
  if (!text || !text[0]) return std::nullopt;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text, &end, 10);
  if (end == text || *end != '\0' || text[0] == '-') return std::nullopt;
  return static_cast<std::uint64_t>(v);
}

std::optional<long long> parse_i64(const char* text) {
  if (!text || !text[0]) return std::nullopt;
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(text, &end, 10);
  if (end == text || *end != '\0' || errno == ERANGE) return std::nullopt;
  return v;
}

std::vector<std::string> split_events(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

// Returns false when key is present with a non-integer value.
bool overlay_u64(const jsonlite::Object& obj, const std::string& key, std::uint64_t& out,
                 std::string* problem) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v) return true;
  if (!std::holds_alternative<std::uint64_t>(v->v)) {
    *problem = "config key '" + key + "' must be a non-negative integer";
    return false;
  }
  out = std::get<std::uint64_t>(v->v);
  return true;
}

// Signed integer: jsonlite parses negative numbers as double.
bool overlay_int(const jsonlite::Object& obj, const std::string& key, long long& out,
                 std::string* problem) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v) return true;
  if (std::holds_alternative<std::uint64_t>(v->v)) {
    const std::uint64_t u = std::get<std::uint64_t>(v->v);
    if (u > static_cast<std::uint64_t>(std::numeric_limits<long long>::max())) {
      *problem = "config key '" + key + "' is out of range";
      return false;
    }
    out = static_cast<long long>(u);
    return true;
  }
  if (std::holds_alternative<double>(v->v)) {
    const double d = std::get<double>(v->v);
    if (std::trunc(d) == d && d >= -1e15 && d <= 1e15) {
      out = static_cast<long long>(d);
      return true;
    }
  }
  *problem = "config key '" + key + "' must be an integer";
  return false;
}

bool overlay_string_list(const jsonlite::Object& obj, const std::string& key,
                         std::vector<std::string>& out, std::string* problem) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v) return true;
  if (!std::holds_alternative<jsonlite::Array>(v->v)) {
    *problem = "config key '" + key + "' must be an array of strings";
    return false;
  }
  std::vector<std::string> items;
  for (const auto& item : std::get<jsonlite::Array>(v->v)) {
    if (!item.is_string()) {
      *problem = "config key '" + key + "' must be an array of strings";
      return false;
    }
    items.push_back(std::get<std::string>(item.v));
  }
  out = std::move(items);
  return true;
}

bool overlay_string(const jsonlite::Object& obj, const std::string& key, std::string& out,
                    std::string* problem) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v) return true;
  if (!v->is_string()) {
    *problem = "config key '" + key + "' must be a string";
    return false;
  }
  out = std::get<std::string>(v->v);
  return true;
}

}  // namespace

HarnessConfig config_from_json(const std::string& text, const HarnessConfig& base,
                               Error* error) {
  HarnessConfig c = base;
  auto fail = [&](const std::string& detail) {
    if (error) {
      error->code = ErrorCode::config_error;
      error->detail = detail;
    }
    return base;
  };

  std::optional<jsonlite::JsonError> json_error;
  const jsonlite::Object obj = jsonlite::parse(text, &json_error);
  if (json_error) return fail("config: " + json_error->message);

  std::string problem;
  std::uint64_t trials = c.trials;
  std::uint64_t warmup = c.warmup_discard;
  std::uint64_t build_workers = c.build_workers;
  std::uint64_t measure_workers = c.measure_workers;
  long long niceness = c.niceness;
  if (!overlay_string(obj, "cache_root", c.cache_root, &problem) ||
      !overlay_u64(obj, "trials", trials, &problem) ||
      !overlay_u64(obj, "timeout_ms", c.timeout_ms, &problem) ||
      !overlay_u64(obj, "cooldown_ms", c.cooldown_ms, &problem) ||
      !overlay_u64(obj, "warmup_discard", warmup, &problem) ||
      !overlay_u64(obj, "build_workers", build_workers, &problem) ||
      !overlay_u64(obj, "measure_workers", measure_workers, &problem) ||
      !overlay_string(obj, "sampler", c.sampler, &problem) ||
      !overlay_string(obj, "powercap_root", c.powercap_root, &problem) ||
      !overlay_string(obj, "log_compression", c.log_compression, &problem) ||
      !overlay_int(obj, "niceness", niceness, &problem) ||
      !overlay_string_list(obj, "perf_events", c.perf_events, &problem) ||
      !overlay_string(obj, "perf_command", c.perf_command, &problem)) {
    return fail(problem);
  }
  if (trials > std::numeric_limits<std::uint32_t>::max()) {
    return fail("config key 'trials' exceeds " +
                std::to_string(std::numeric_limits<std::uint32_t>::max()));
  }
  if (niceness < kMinNiceness || niceness > kMaxNiceness) {
    return fail("config key 'niceness' must be in [" + std::to_string(kMinNiceness) + ", " +
                std::to_string(kMaxNiceness) + "]");
  }
  c.niceness = static_cast<int>(niceness);
  c.trials = static_cast<std::uint32_t>(trials);
  c.warmup_discard = static_cast<std::size_t>(warmup);
  c.build_workers = static_cast<std::size_t>(build_workers);
  c.measure_workers = static_cast<std::size_t>(measure_workers);
  return c;
}

HarnessConfig config_from_env(const HarnessConfig& base, std::vector<std::string>* warnings) {
  HarnessConfig c = base;
  auto number = [&](const char* name, auto& field) {
    using Field = std::remove_reference_t<decltype(field)>;
    const char* e = std::getenv(name);
    if (!e || !e[0]) return;
    const auto v = parse_u64(e);
    if (v && *v <= std::numeric_limits<Field>::max()) {
      field = static_cast<Field>(*v);
    } else if (warnings) {
      warnings->push_back(std::string(name) + "='" + e + "' is not a non-negative integer; ignored");
    }
  };
  auto text = [&](const char* name, std::string& field) {
    const char* e = std::getenv(name);
    if (e && e[0]) field = e;
  };

  text("ENERGYBENCH_CACHE_ROOT", c.cache_root);
  number("ENERGYBENCH_TRIALS", c.trials);
  number("ENERGYBENCH_TIMEOUT_MS", c.timeout_ms);
  number("ENERGYBENCH_COOLDOWN_MS", c.cooldown_ms);
  number("ENERGYBENCH_WARMUP", c.warmup_discard);
  number("ENERGYBENCH_BUILD_WORKERS", c.build_workers);
  number("ENERGYBENCH_MEASURE_WORKERS", c.measure_workers);
  text("ENERGYBENCH_SAMPLER", c.sampler);
  text("ENERGYBENCH_POWERCAP_ROOT", c.powercap_root);
  text("ENERGYBENCH_LOG_COMPRESSION", c.log_compression);
  text("ENERGYBENCH_PERF", c.perf_command);

  if (const char* e = std::getenv("ENERGYBENCH_NICENESS"); e && e[0]) {
    const auto v = parse_i64(e);
    if (v && *v >= kMinNiceness && *v <= kMaxNiceness) {
      c.niceness = static_cast<int>(*v);
    } else if (warnings) {
      warnings->push_back(std::string("ENERGYBENCH_NICENESS='") + e + "' is not in [" +
                          std::to_string(kMinNiceness) + ", " + std::to_string(kMaxNiceness) +
                          "]; ignored");
    }
  }
  if (const char* e = std::getenv("ENERGYBENCH_PERF_EVENTS"); e && e[0]) {
    c.perf_events = split_events(e);
  }
  return c;
}

ConfigValidation validate_config(const HarnessConfig& config) {
  ConfigValidation v;
  if (config.cache_root.empty()) v.errors.push_back("cache_root must not be empty");
  if (config.trials == 0) v.errors.push_back("trials must be at least 1");
  if (config.timeout_ms == 0) v.errors.push_back("timeout_ms must be at least 1");
  if (config.timeout_ms > kMaxTimeoutMs) {
    v.errors.push_back("timeout_ms must not exceed " + std::to_string(kMaxTimeoutMs));
  }
  if (config.niceness < kMinNiceness || config.niceness > kMaxNiceness) {
    v.errors.push_back("niceness must be in [" + std::to_string(kMinNiceness) + ", " +
                       std::to_string(kMaxNiceness) + "]");
  }
  if (!config.perf_events.empty() && config.perf_command.empty()) {
    v.errors.push_back("perf_command must not be empty when perf_events is set");
  }
  if (config.measure_workers == 0) v.errors.push_back("measure_workers must be at least 1");
  if (config.sampler != "powercap" && config.sampler != "none") {
    v.errors.push_back("sampler must be \"powercap\" or \"none\"");
  }
  if (config.log_compression != "off" && config.log_compression != "zstd") {
    v.errors.push_back("log_compression must be \"off\" or \"zstd\"");
  }
#if !defined(ENERGYBENCH_WITH_ZSTD)
  if (config.log_compression == "zstd") {
    v.warnings.push_back("built without zstd; build logs are stored uncompressed");
  }
#endif
  if (config.warmup_discard >= config.trials && config.trials > 0) {
    v.warnings.push_back("warmup_discard >= trials; summaries will have no samples");
  }
  if (config.niceness < 0 && ::geteuid() != 0) {
    v.warnings.push_back("negative niceness needs CAP_SYS_NICE; runs may keep the default priority");
  }
  if (config.sampler == "none") {
    v.warnings.push_back("sampler \"none\" refuses every window; measurement runs will fail");
  }
  return v;
}

std::string config_to_json(const HarnessConfig& config) {
  jsonlite::Object o;
  o["cache_root"] = config.cache_root;
  o["trials"] = static_cast<std::uint64_t>(config.trials);
  o["timeout_ms"] = config.timeout_ms;
  o["cooldown_ms"] = config.cooldown_ms;
  o["warmup_discard"] = static_cast<std::uint64_t>(config.warmup_discard);
  o["build_workers"] = static_cast<std::uint64_t>(config.build_workers);
  o["measure_workers"] = static_cast<std::uint64_t>(config.measure_workers);
  o["sampler"] = config.sampler;
  o["powercap_root"] = config.powercap_root;
  o["log_compression"] = config.log_compression;
  o["niceness"] = config.niceness >= 0
                     ? jsonlite::Value{static_cast<std::uint64_t>(config.niceness)}
                     : jsonlite::Value{static_cast<double>(config.niceness)};
  jsonlite::Array events;
  for (const auto& e : config.perf_events) events.emplace_back(e);
  o["perf_events"] = jsonlite::Value{std::move(events)};
  o["perf_command"] = config.perf_command;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

std::size_t effective_build_workers(const HarnessConfig& config) {
  if (config.build_workers > 0) return config.build_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : hw;
}

}  // namespace energybench
