#include "energybench/report.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "energybench/jsonlite.hpp"
#include "energybench/version.hpp"

namespace fs = std::filesystem;

namespace energybench {

namespace {

jsonlite::Value stats_value(const SampleStats& s) {
  jsonlite::Object o;
  o["n"] = static_cast<std::uint64_t>(s.sample_count);
  o["mean"] = s.mean;
  o["stddev"] = s.stddev;
  o["min"] = s.min;
  o["max"] = s.max;
  o["ci95_low"] = s.ci_low;
  o["ci95_high"] = s.ci_high;
  return jsonlite::Value{std::move(o)};
}

std::string csv_field(const std::string& s) {
  if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

void append_stats_csv(std::string& row, const SampleStats& s) {
  row += ',' + std::to_string(s.sample_count);
  for (double d : {s.mean, s.stddev, s.min, s.max, s.ci_low, s.ci_high}) {
    row += ',' + jsonlite::format_double(d);
  }
}

jsonlite::Value counters_value(const std::map<std::string, double>& counters) {
  jsonlite::Object o;
  for (const auto& [event, value] : counters) o[event] = value;
  return jsonlite::Value{std::move(o)};
}

}  // namespace

std::string summary_to_json(const MeasurementSummary& m) {
  jsonlite::Object o;
  o["schema"] = static_cast<std::uint64_t>(version::REPORT_SCHEMA_VERSION);
  o["name"] = m.spec_name;
  o["language"] = m.language;
  o["trials"] = static_cast<std::uint64_t>(m.trial_count);
  o["discarded_warmup"] = static_cast<std::uint64_t>(m.discarded_warmup);
  o["rejected_outliers"] = static_cast<std::uint64_t>(m.rejected_outliers);
  o["pass_rate"] = m.pass_rate;
  o["energy_joules"] = stats_value(m.energy_joules);
  o["time_ms"] = stats_value(m.time_ms);
  if (!m.perf_means.empty()) o["perf"] = counters_value(m.perf_means);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

std::string summaries_to_jsonl(const std::vector<MeasurementSummary>& summaries) {
  std::string out;
  for (const auto& s : summaries) {
    out += summary_to_json(s);
    out += '\n';
  }
  return out;
}

std::string csv_header() {
  std::string h = "name,language,trials,discarded_warmup,rejected_outliers,pass_rate";
  for (const char* group : {"energy_j", "time_ms"}) {
    for (const char* col : {"n", "mean", "stddev", "min", "max", "ci95_low", "ci95_high"}) {
      h += ',';
      h += group;
      h += '_';
      h += col;
    }
  }
  return h;
}

std::string summary_to_csv_row(const MeasurementSummary& m) {
  std::string row = csv_field(m.spec_name) + ',' + csv_field(m.language) + ',' +
                    std::to_string(m.trial_count) + ',' + std::to_string(m.discarded_warmup) +
                    ',' + std::to_string(m.rejected_outliers) + ',' +
                    jsonlite::format_double(m.pass_rate);
  append_stats_csv(row, m.energy_joules);
  append_stats_csv(row, m.time_ms);
  return row;
}

std::string summaries_to_csv(const std::vector<MeasurementSummary>& summaries) {
  std::string out = csv_header() + "\n";
  for (const auto& s : summaries) out += summary_to_csv_row(s) + "\n";
  return out;
}

std::string trial_to_json(const Trial& t) {
  jsonlite::Object o;
  o["name"] = t.spec_name;
  o["language"] = t.language;
  o["artifact"] = t.artifact_hash;
  o["index"] = static_cast<std::uint64_t>(t.index);
  o["iterations"] = static_cast<std::uint64_t>(t.iterations);
  o["duration_ms"] = t.duration_ms();
  o["energy_joules"] = t.energy_joules ? jsonlite::Value{*t.energy_joules} : jsonlite::Value{nullptr};
  o["exit_code"] = static_cast<std::uint64_t>(t.exit_code < 0 ? 0 : t.exit_code);
  o["outcome"] = to_string(t.outcome);
  if (t.first_mismatch) {
    jsonlite::Object mm;
    mm["line"] = static_cast<std::uint64_t>(t.first_mismatch->line);
    mm["expected"] = t.first_mismatch->expected;
    mm["actual"] = t.first_mismatch->actual;
    o["first_mismatch"] = jsonlite::Value{std::move(mm)};
  }
  if (!t.detail.empty()) o["detail"] = t.detail;
  if (!t.perf_counters.empty()) o["perf"] = counters_value(t.perf_counters);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

bool write_report_file(const std::string& path, const std::string& text) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
  const std::string tmp = path + ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

}  // namespace energybench
