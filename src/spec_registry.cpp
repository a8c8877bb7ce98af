#include "energybench/spec_registry.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>

#include <yaml-cpp/yaml.h>

#include "energybench/environment.hpp"
#include "energybench/jsonlite.hpp"

namespace fs = std::filesystem;

namespace energybench {

namespace {

std::optional<std::string> read_text(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

// Fills *error and returns false when present with the wrong type.
bool read_string_list(const jsonlite::Object& obj, const std::string& key, bool allow_integers,
                      std::vector<std::string>& out, std::string* problem) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || std::holds_alternative<std::nullptr_t>(v->v)) return true;
  if (!std::holds_alternative<jsonlite::Array>(v->v)) {
    *problem = "field '" + key + "' must be an array";
    return false;
  }
  for (const auto& item : std::get<jsonlite::Array>(v->v)) {
    if (std::holds_alternative<std::string>(item.v)) {
      out.push_back(std::get<std::string>(item.v));
    } else if (allow_integers && std::holds_alternative<std::uint64_t>(item.v)) {
      out.push_back(std::to_string(std::get<std::uint64_t>(item.v)));
    } else if (allow_integers && std::holds_alternative<double>(item.v)) {
      const double d = std::get<double>(item.v);
      // Outside (-2^63, 2^63) the cast to long long is undefined.
      if (!(std::fabs(d) < 9.2e18) || std::trunc(d) != d) {
        *problem = "field '" + key + "' entries must be strings or integers";
        return false;
      }
      out.push_back(std::to_string(static_cast<long long>(d)));
    } else {
      *problem = std::string("field '") + key + "' entries must be strings" +
                 (allow_integers ? " or integers" : "");
      return false;
    }
  }
  return true;
}

// Optional integer field in [1, max]. Returns false on a wrong type or range.
bool read_positive(const jsonlite::Object& obj, const std::string& key, std::uint64_t max,
                   std::optional<std::uint64_t>& out, std::string* problem) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || std::holds_alternative<std::nullptr_t>(v->v)) return true;
  if (!std::holds_alternative<std::uint64_t>(v->v) || std::get<std::uint64_t>(v->v) == 0) {
    *problem = "field '" + key + "' must be a positive integer";
    return false;
  }
  if (std::get<std::uint64_t>(v->v) > max) {
    *problem = "field '" + key + "' must not exceed " + std::to_string(max);
    return false;
  }
  out = std::get<std::uint64_t>(v->v);
  return true;
}

// Optional signed integer in [lo, hi]. Negative numbers arrive as double.
bool read_bounded_int(const jsonlite::Object& obj, const std::string& key, int lo, int hi,
                      std::optional<int>& out, std::string* problem) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || std::holds_alternative<std::nullptr_t>(v->v)) return true;
  double d = 0.0;
  if (std::holds_alternative<std::uint64_t>(v->v)) {
    d = static_cast<double>(std::get<std::uint64_t>(v->v));
  } else if (std::holds_alternative<double>(v->v)) {
    d = std::get<double>(v->v);
  } else {
    d = std::numeric_limits<double>::quiet_NaN();
  }
  if (!(d >= lo && d <= hi) || std::trunc(d) != d) {
    *problem = "field '" + key + "' must be an integer in [" + std::to_string(lo) + ", " +
               std::to_string(hi) + "]";
    return false;
  }
  out = static_cast<int>(d);
  return true;
}

// YAML plain scalars carry no type; resolve them the way the YAML core
// schema does for the types jsonlite knows. Quoted and block scalars are
// always strings.
jsonlite::Value yaml_scalar(const YAML::Node& node) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") return jsonlite::Value{text};
  if (text == "true" || text == "True" || text == "TRUE") return jsonlite::Value{true};
  if (text == "false" || text == "False" || text == "FALSE") return jsonlite::Value{false};
  if (!text.empty() && std::all_of(text.begin(), text.end(),
                                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    errno = 0;
    const unsigned long long u = std::strtoull(text.c_str(), nullptr, 10);
    if (errno != ERANGE) return jsonlite::Value{static_cast<std::uint64_t>(u)};
  }
  if (!text.empty()) {
    char* end = nullptr;
    const double d = std::strtod(text.c_str(), &end);
    if (end && *end == '\0' && std::isfinite(d) &&
        text.find_first_not_of("0123456789+-.eE") == std::string::npos) {
      return jsonlite::Value{d};
    }
  }
  return jsonlite::Value{text};
}

bool yaml_to_value(const YAML::Node& node, jsonlite::Value& out, std::string* problem) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      out = jsonlite::Value{nullptr};
      return true;
    case YAML::NodeType::Scalar:
      out = yaml_scalar(node);
      return true;
    case YAML::NodeType::Sequence: {
      jsonlite::Array arr;
      for (const auto& item : node) {
        jsonlite::Value v;
        if (!yaml_to_value(item, v, problem)) return false;
        arr.push_back(std::move(v));
      }
      out = jsonlite::Value{std::move(arr)};
      return true;
    }
    case YAML::NodeType::Map: {
      jsonlite::Object obj;
      for (const auto& kv : node) {
        if (!kv.first.IsScalar()) {
          *problem = "mapping keys must be scalars";
          return false;
        }
        const std::string key = kv.first.Scalar();
        if (obj.contains(key)) {
          *problem = "duplicate key '" + key + "'";
          return false;
        }
        jsonlite::Value v;
        if (!yaml_to_value(kv.second, v, problem)) return false;
        obj.emplace(key, std::move(v));
      }
      out = jsonlite::Value{std::move(obj)};
      return true;
    }
  }
  *problem = "unsupported YAML node";
  return false;
}

// Parse a YAML document whose root must be a mapping.
std::optional<jsonlite::Object> parse_yaml_object(const std::string& text, std::string* problem) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    *problem = std::string("yaml_parse_error: ") + e.what();
    return std::nullopt;
  }
  if (!root.IsMap()) {
    *problem = "yaml_parse_error: document root must be a mapping";
    return std::nullopt;
  }
  jsonlite::Value value;
  if (!yaml_to_value(root, value, problem)) {
    *problem = "yaml_parse_error: " + *problem;
    return std::nullopt;
  }
  return std::get<jsonlite::Object>(std::move(value.v));
}

bool has_workload_extension(const fs::path& path) {
  const std::string ext = path.extension().string();
  return ext == ".json" || ext == ".yml" || ext == ".yaml";
}

bool read_optional_string(const jsonlite::Object& obj, const std::string& key,
                          std::optional<std::string>& out, std::string* problem) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || std::holds_alternative<std::nullptr_t>(v->v)) return true;
  if (!v->is_string()) {
    *problem = "field '" + key + "' must be a string";
    return false;
  }
  out = std::get<std::string>(v->v);
  return true;
}

std::string identity_key(const std::string& name, const std::string& language) {
  return name + "/" + language;
}

}  // namespace

SpecFormat format_for_path(const std::string& path) {
  const std::string ext = fs::path(path).extension().string();
  return ext == ".yml" || ext == ".yaml" ? SpecFormat::yaml : SpecFormat::json;
}

std::optional<WorkloadSpec> parse_workload(const std::string& text,
                                           const std::string& source_path, Error* error) {
  return parse_workload(text, source_path, format_for_path(source_path), error);
}

std::optional<WorkloadSpec> parse_workload(const std::string& text,
                                           const std::string& source_path, SpecFormat format,
                                           Error* error) {
  WorkloadSpec spec;
  spec.source_path = source_path;

  auto fail = [&](const std::string& detail) -> std::optional<WorkloadSpec> {
    if (error) {
      error->code = ErrorCode::spec_parse_error;
      error->spec_name = spec.name;
      error->language = spec.language;
      error->source_path = source_path;
      error->detail = detail;
    }
    return std::nullopt;
  };

  std::string problem;
  jsonlite::Object obj;
  if (format == SpecFormat::yaml) {
    auto parsed = parse_yaml_object(text, &problem);
    if (!parsed) return fail(problem);
    obj = std::move(*parsed);
  } else {
    std::optional<jsonlite::JsonError> json_error;
    obj = jsonlite::parse(text, &json_error);
    if (json_error) {
      return fail(json_error->code + " at offset " + std::to_string(json_error->offset) + ": " +
                  json_error->message);
    }
  }

  std::optional<std::string> name, language, code, code_file, expected, description, stdin_text,
      sampling;
  if (!read_optional_string(obj, "name", name, &problem) ||
      !read_optional_string(obj, "language", language, &problem)) {
    return fail(problem);
  }
  if (name) spec.name = *name;
  if (language) spec.language = *language;

  if (!name || name->empty()) return fail("missing required field 'name'");
  if (!language || language->empty()) return fail("missing required field 'language'");

  const auto canonical = canonical_language(*language);
  if (!canonical) return fail("unknown language '" + *language + "'");
  spec.language = *canonical;

  if (!read_optional_string(obj, "code", code, &problem) ||
      !read_optional_string(obj, "code_file", code_file, &problem) ||
      !read_optional_string(obj, "expected_stdout", expected, &problem) ||
      !read_optional_string(obj, "description", description, &problem) ||
      !read_optional_string(obj, "stdin", stdin_text, &problem) ||
      !read_optional_string(obj, "sampling", sampling, &problem)) {
    return fail(problem);
  }

  if (code && code_file) return fail("fields 'code' and 'code_file' are mutually exclusive");
  if (code) {
    spec.code = *code;
  } else if (code_file) {
    fs::path ref(*code_file);
    if (ref.is_relative() && !source_path.empty()) ref = fs::path(source_path).parent_path() / ref;
    auto contents = read_text(ref);
    if (!contents) return fail("cannot read code_file '" + ref.string() + "'");
    spec.code = std::move(*contents);
  } else {
    return fail("missing required field 'code'");
  }

  if (!expected) return fail("missing required field 'expected_stdout'");
  spec.expected_stdout = *expected;
  spec.description = description;
  if (stdin_text) spec.stdin_text = *stdin_text;

  if (!read_string_list(obj, "dependencies", false, spec.dependencies, &problem) ||
      !read_string_list(obj, "options", false, spec.options, &problem) ||
      !read_string_list(obj, "args", true, spec.args, &problem)) {
    return fail(problem);
  }

  constexpr std::uint64_t kMaxCount = std::numeric_limits<std::uint32_t>::max();
  std::optional<std::uint64_t> timeout_ms, trials, iterations;
  if (!read_positive(obj, "timeout_ms", kMaxTimeoutMs, timeout_ms, &problem) ||
      !read_positive(obj, "trials", kMaxCount, trials, &problem) ||
      !read_positive(obj, "iterations", kMaxCount, iterations, &problem) ||
      !read_bounded_int(obj, "niceness", kMinNiceness, kMaxNiceness, spec.niceness, &problem)) {
    return fail(problem);
  }
  spec.timeout_ms = timeout_ms;
  if (trials) spec.trials = static_cast<std::uint32_t>(*trials);
  if (iterations) spec.iterations = static_cast<std::uint32_t>(*iterations);

  if (sampling) {
    const auto mode = parse_sampling_mode(*sampling);
    if (!mode) {
      return fail("field 'sampling' must be \"per_invocation\" or \"shared_window\"");
    }
    spec.sampling = *mode;
  }
  if (spec.iterations > 1 && spec.sampling != SamplingMode::shared_window) {
    return fail("'iterations' > 1 requires \"sampling\": \"shared_window\"");
  }
  return spec;
}

bool SpecRegistry::add(WorkloadSpec spec, Error* error) {
  const std::string key = identity_key(spec.name, spec.language);
  if (index_.contains(key)) {
    if (error) {
      error->code = ErrorCode::spec_parse_error;
      error->spec_name = spec.name;
      error->language = spec.language;
      error->source_path = spec.source_path;
      error->detail = "duplicate (name, language); first defined in " +
                      specs_[index_.at(key)].source_path;
    }
    return false;
  }
  index_.emplace(key, specs_.size());
  specs_.push_back(std::move(spec));
  return true;
}

LoadReport SpecRegistry::load_text(const std::string& text, const std::string& source_path) {
  LoadReport report;
  Error error;
  auto spec = parse_workload(text, source_path, &error);
  if (spec && add(std::move(*spec), &error)) {
    report.loaded = 1;
  } else {
    report.errors.push_back(error);
  }
  return report;
}

void SpecRegistry::load_file(const std::string& path, LoadReport& report) {
  const auto text = read_text(path);
  if (!text) {
    Error e;
    e.code = ErrorCode::spec_parse_error;
    e.source_path = path;
    e.detail = "cannot read file";
    report.errors.push_back(e);
    return;
  }
  LoadReport one = load_text(*text, path);
  report.loaded += one.loaded;
  report.errors.insert(report.errors.end(), one.errors.begin(), one.errors.end());
}

LoadReport SpecRegistry::load(const std::vector<std::string>& sources) {
  LoadReport report;
  for (const auto& source : sources) {
    std::error_code ec;
    if (fs::is_directory(source, ec)) {
      std::vector<std::string> files;
      for (const auto& entry : fs::directory_iterator(source, ec)) {
        if (entry.is_regular_file(ec) && has_workload_extension(entry.path())) {
          files.push_back(entry.path().string());
        }
      }
      std::sort(files.begin(), files.end());
      for (const auto& f : files) load_file(f, report);
    } else {
      load_file(source, report);
    }
  }
  return report;
}

std::optional<WorkloadSpec> SpecRegistry::get(const std::string& name,
                                              const std::string& language) const {
  const auto canonical = canonical_language(language);
  if (!canonical) return std::nullopt;
  auto it = index_.find(identity_key(name, *canonical));
  if (it == index_.end()) return std::nullopt;
  return specs_[it->second];
}

}  // namespace energybench
