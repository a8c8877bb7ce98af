#include "energybench/aggregator.hpp"

#include <algorithm>
#include <cmath>

namespace energybench {

namespace {

std::string key_of(const std::string& spec_name, const std::string& language) {
  return spec_name + "/" + language;
}

// t_{0.975, dof} for dof = 1..30.
constexpr double kT95[] = {
    12.706, 4.303, 3.182, 2.776, 2.571, 2.447, 2.365, 2.306, 2.262, 2.228,
    2.201,  2.179, 2.160, 2.145, 2.131, 2.120, 2.110, 2.101, 2.093, 2.086,
    2.080,  2.074, 2.069, 2.064, 2.060, 2.056, 2.052, 2.048, 2.045, 2.042,
};

// Fewer than three samples have no meaningful quartiles; all are kept.
std::vector<bool> inlier_flags(const std::vector<double>& samples, double multiple) {
  std::vector<bool> keep(samples.size(), true);
  if (samples.size() < 3) return keep;
  std::vector<double> sorted = samples;
  std::sort(sorted.begin(), sorted.end());
  const double q1 = quantile_sorted(sorted, 0.25);
  const double q3 = quantile_sorted(sorted, 0.75);
  const double lo = q1 - multiple * (q3 - q1);
  const double hi = q3 + multiple * (q3 - q1);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    keep[i] = samples[i] >= lo && samples[i] <= hi;
  }
  return keep;
}

}  // namespace

void RunningStats::push(double x) {
  if (count == 0) {
    min = max = x;
  } else {
    min = std::min(min, x);
    max = std::max(max, x);
  }
  ++count;
  const double delta = x - mean;
  mean += delta / static_cast<double>(count);
  m2 += delta * (x - mean);
}

double RunningStats::stddev() const { return std::sqrt(variance()); }

double quantile_sorted(const std::vector<double>& sorted, double q) {
  if (sorted.empty()) return 0.0;
  if (sorted.size() == 1) return sorted.front();
  const double pos = std::clamp(q, 0.0, 1.0) * static_cast<double>(sorted.size() - 1);
  const std::size_t lo = static_cast<std::size_t>(std::floor(pos));
  const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
  const double frac = pos - static_cast<double>(lo);
  return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

std::vector<double> reject_outliers(const std::vector<double>& samples, double multiple,
                                    std::size_t* rejected) {
  const std::vector<bool> keep = inlier_flags(samples, multiple);
  std::vector<double> kept;
  kept.reserve(samples.size());
  for (std::size_t i = 0; i < samples.size(); ++i) {
    if (keep[i]) kept.push_back(samples[i]);
  }
  if (rejected) *rejected = samples.size() - kept.size();
  return kept;
}

double student_t_95(std::size_t dof) {
  if (dof == 0) return 0.0;
  if (dof <= 30) return kT95[dof - 1];
  if (dof <= 40) return 2.021;
  if (dof <= 60) return 2.000;
  if (dof <= 120) return 1.980;
  return 1.960;
}

SampleStats describe(const std::vector<double>& samples) {
  SampleStats s;
  s.sample_count = samples.size();
  if (samples.empty()) return s;

  RunningStats r;
  for (double x : samples) r.push(x);
  s.mean = r.mean;
  s.stddev = r.stddev();
  s.min = r.min;
  s.max = r.max;
  const double half = samples.size() > 1
                          ? student_t_95(samples.size() - 1) * s.stddev /
                                std::sqrt(static_cast<double>(samples.size()))
                          : 0.0;
  s.ci_low = s.mean - half;
  s.ci_high = s.mean + half;
  return s;
}

MeasurementSummary summarize(const std::string& spec_name, const std::string& language,
                             const TrialSet& trials, const AggregatorOptions& options) {
  MeasurementSummary m;
  m.spec_name = spec_name;
  m.language = language;
  m.trial_count = trials.size();
  if (trials.empty()) return m;

  std::size_t passed = 0;
  for (const auto& t : trials) {
    if (t.outcome == TrialOutcome::pass) ++passed;
  }
  m.pass_rate = static_cast<double>(passed) / static_cast<double>(trials.size());
  m.discarded_warmup = std::min(options.warmup_discard, trials.size());

  std::vector<double> energy;
  std::vector<double> time;
  std::vector<const Trial*> sampled;
  for (std::size_t i = m.discarded_warmup; i < trials.size(); ++i) {
    const Trial& t = trials[i];
    if (t.outcome != TrialOutcome::pass) continue;
    const auto e = t.energy_per_iteration();
    if (!e) continue;
    energy.push_back(*e);
    time.push_back(t.duration_ms());
    sampled.push_back(&t);
  }

  const std::vector<bool> keep = inlier_flags(energy, options.outlier_iqr_multiple);
  std::vector<double> kept_energy;
  std::vector<double> kept_time;
  std::map<std::string, RunningStats> perf;
  for (std::size_t i = 0; i < energy.size(); ++i) {
    if (!keep[i]) continue;
    kept_energy.push_back(energy[i]);
    kept_time.push_back(time[i]);
    for (const auto& [event, value] : sampled[i]->perf_counters) perf[event].push(value);
  }
  for (const auto& [event, stats] : perf) m.perf_means[event] = stats.mean;
  m.rejected_outliers = energy.size() - kept_energy.size();
  m.energy_joules = describe(kept_energy);
  m.time_ms = describe(kept_time);
  return m;
}

void Aggregator::ingest(const Trial& trial) {
  const std::string key = key_of(trial.spec_name, trial.language);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    Entry e;
    e.spec_name = trial.spec_name;
    e.language = trial.language;
    it = entries_.emplace(key, std::move(e)).first;
    order_.push_back(key);
  }
  it->second.trials.push_back(trial);
  if (trial.outcome == TrialOutcome::pass) {
    if (const auto e = trial.energy_per_iteration()) it->second.running_energy.push(*e);
  }
}

MeasurementSummary Aggregator::snapshot(const std::string& spec_name,
                                        const std::string& language) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key_of(spec_name, language));
  if (it == entries_.end()) return summarize(spec_name, language, {}, options_);
  return summarize(spec_name, language, it->second.trials, options_);
}

std::vector<MeasurementSummary> Aggregator::snapshot_all() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<MeasurementSummary> out;
  out.reserve(order_.size());
  for (const auto& key : order_) {
    const Entry& e = entries_.at(key);
    out.push_back(summarize(e.spec_name, e.language, e.trials, options_));
  }
  return out;
}

TrialSet Aggregator::trials(const std::string& spec_name, const std::string& language) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key_of(spec_name, language));
  return it == entries_.end() ? TrialSet{} : it->second.trials;
}

RunningStats Aggregator::running(const std::string& spec_name,
                                 const std::string& language) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key_of(spec_name, language));
  return it == entries_.end() ? RunningStats{} : it->second.running_energy;
}

}  // namespace energybench
