#pragma once

// energybench/report.hpp — Serialization of measurement results.
//
// Summary JSON: one object per spec, one line each, keys sorted. Every object
// carries "schema" = REPORT_SCHEMA_VERSION. Energy statistics are joules per
// internal iteration; time statistics are milliseconds per window.
//
// CSV: fixed column order given by csv_header(), RFC 4180 quoting for text
// fields, numbers printed with format_double().

#include <string>
#include <vector>

#include "energybench/types.hpp"

namespace energybench {

std::string summary_to_json(const MeasurementSummary& summary);
std::string summaries_to_jsonl(const std::vector<MeasurementSummary>& summaries);

std::string csv_header();
std::string summary_to_csv_row(const MeasurementSummary& summary);
std::string summaries_to_csv(const std::vector<MeasurementSummary>& summaries);

// Raw trial record, for --trials output. captured_stdout is omitted.
std::string trial_to_json(const Trial& trial);

// Write text to path atomically (tmp + rename). Returns false on failure.
bool write_report_file(const std::string& path, const std::string& text);

}  // namespace energybench
