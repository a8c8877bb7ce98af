#pragma once

// energybench/spec_registry.hpp — Load and index workload definitions.
//
// Sources are JSON or YAML documents, one workload mapping per file; *.yml and
// *.yaml are read as YAML, anything else as JSON. A directory source is
// scanned (non-recursively) for *.json, *.yml and *.yaml files in sorted order.
// Both formats go through the same field checks.
//
// Required fields: name, language, code (or code_file), expected_stdout.
// Optional: description, dependencies[], options[], args[] (strings or
// integers), stdin, timeout_ms (at most kMaxTimeoutMs), trials and iterations
// (at most 2^32-1), sampling, niceness (kMinNiceness..kMaxNiceness).
//
// Loading never stops at the first bad document: every error is collected in
// the LoadReport with its source path, and every valid spec is registered.
// A duplicate (name, language) pair is an error for the later document; the
// first one loaded stays registered.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "energybench/types.hpp"

namespace energybench {

struct LoadReport {
  std::size_t loaded{0};
  std::vector<Error> errors;

  bool ok() const { return errors.empty(); }
};

enum class SpecFormat {
  json,
  yaml,
};

SpecFormat format_for_path(const std::string& path);

// Parse one workload document. source_path is used for diagnostics, to
// resolve code_file and, in the first overload, to pick the format.
// Returns nullopt and fills *error on failure.
std::optional<WorkloadSpec> parse_workload(const std::string& text,
                                           const std::string& source_path, Error* error);
std::optional<WorkloadSpec> parse_workload(const std::string& text,
                                           const std::string& source_path, SpecFormat format,
                                           Error* error);

class SpecRegistry {
 public:
  LoadReport load(const std::vector<std::string>& sources);

  // Register one document held in memory.
  LoadReport load_text(const std::string& text, const std::string& source_path = "<memory>");

  // language may be any alias of the canonical name.
  std::optional<WorkloadSpec> get(const std::string& name, const std::string& language) const;

  // All records in load order.
  const std::vector<WorkloadSpec>& specs() const { return specs_; }
  std::size_t size() const { return specs_.size(); }

 private:
  bool add(WorkloadSpec spec, Error* error);
  void load_file(const std::string& path, LoadReport& report);

  std::vector<WorkloadSpec> specs_;
  std::map<std::string, std::size_t> index_;
};

}  // namespace energybench
