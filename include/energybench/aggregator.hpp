#pragma once

// energybench/aggregator.hpp — Per-spec trial accumulation and summary statistics.
//
// Trials are appended in the order they are ingested and never modified.
// snapshot() recomputes the MeasurementSummary from the stored TrialSet:
//   1. the first warmup_discard trials are excluded from the statistics;
//   2. of the rest, Pass trials with an energy reading contribute one sample
//      each (energy per internal iteration);
//   3. samples outside [Q1 - k*IQR, Q3 + k*IQR] are rejected, with quartiles
//      linearly interpolated between order statistics and k = 1.5;
//   4. mean, sample stddev (n-1), min, max and the two-sided 95% Student-t
//      interval are computed over the kept samples. time_ms uses the durations
//      of the same kept trials, perf_means their perf counters.
// pass_rate is computed over every ingested trial, warm-up included.
//
// Thread-safe: ingest() and snapshot() may be called from any thread.

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "energybench/types.hpp"

namespace energybench {

constexpr double kOutlierIqrMultiple = 1.5;

struct AggregatorOptions {
  std::size_t warmup_discard{0};
  double outlier_iqr_multiple{kOutlierIqrMultiple};
};

// Welford's online mean/variance.
struct RunningStats {
  std::size_t count{0};
  double mean{0.0};
  double m2{0.0};
  double min{0.0};
  double max{0.0};

  void push(double x);
  double variance() const { return count > 1 ? m2 / static_cast<double>(count - 1) : 0.0; }
  double stddev() const;
};

// Linear-interpolation quantile of an ascending-sorted sample, q in [0, 1].
double quantile_sorted(const std::vector<double>& sorted, double q);

// Keeps the samples inside the IQR fences, preserving input order.
std::vector<double> reject_outliers(const std::vector<double>& samples, double multiple,
                                    std::size_t* rejected = nullptr);

// Two-sided 95% Student-t critical value for `dof` degrees of freedom.
double student_t_95(std::size_t dof);

SampleStats describe(const std::vector<double>& samples);

MeasurementSummary summarize(const std::string& spec_name, const std::string& language,
                             const TrialSet& trials, const AggregatorOptions& options);

class Aggregator {
 public:
  explicit Aggregator(AggregatorOptions options = {}) : options_(options) {}

  void ingest(const Trial& trial);

  // Summary for one spec. A spec with no trials yields an all-zero summary.
  MeasurementSummary snapshot(const std::string& spec_name, const std::string& language) const;

  // One summary per spec, in the order each spec's first trial arrived.
  std::vector<MeasurementSummary> snapshot_all() const;

  TrialSet trials(const std::string& spec_name, const std::string& language) const;

  // Welford stats over every Pass trial's per-iteration energy ingested so
  // far, warm-up included and no outlier rejection. Used for progress output.
  RunningStats running(const std::string& spec_name, const std::string& language) const;

  const AggregatorOptions& options() const { return options_; }

 private:
  struct Entry {
    std::string spec_name;
    std::string language;
    TrialSet trials;
    RunningStats running_energy;
  };

  AggregatorOptions options_;
  mutable std::mutex mu_;
  std::map<std::string, Entry> entries_;
  std::vector<std::string> order_;
};

}  // namespace energybench
