#include "energybench/energy_sampler.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

#include "energybench/observability.hpp"

namespace fs = std::filesystem;

namespace energybench {

namespace {

std::mutex& global_window_mutex() {
  static std::mutex mu;
  return mu;
}

std::atomic<std::uint32_t> g_open_windows{0};
std::atomic<std::uint32_t> g_max_open_windows{0};

std::optional<std::uint64_t> read_counter(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) return std::nullopt;
  std::uint64_t v = 0;
  if (!(ifs >> v)) return std::nullopt;
  return v;
}

// "intel-rapl:0" is a package zone, "intel-rapl:0:1" a sub zone of it.
bool is_package_zone(const std::string& name) {
  const std::string prefix = "intel-rapl:";
  if (name.compare(0, prefix.size(), prefix) != 0) return false;
  const std::string rest = name.substr(prefix.size());
  return !rest.empty() && rest.find(':') == std::string::npos;
}

}  // namespace

// ---------------------------------------------------------------------------
// PowercapSampler
// ---------------------------------------------------------------------------

PowercapSampler::PowercapSampler(std::string root) {
  std::error_code ec;
  std::vector<fs::path> dirs;
  for (const auto& entry : fs::directory_iterator(root, ec)) {
    if (is_package_zone(entry.path().filename().string())) dirs.push_back(entry.path());
  }
  std::sort(dirs.begin(), dirs.end());
  for (const auto& dir : dirs) {
    Zone z;
    z.energy_path = (dir / "energy_uj").string();
    if (!read_counter(z.energy_path)) continue;
    z.max_range_uj = read_counter((dir / "max_energy_range_uj").string()).value_or(0);
    zones_.push_back(std::move(z));
  }
}

bool PowercapSampler::start() {
  if (open_ || zones_.empty()) return false;
  for (auto& z : zones_) {
    auto v = read_counter(z.energy_path);
    if (!v) return false;
    z.start_uj = *v;
  }
  last_joules_.reset();
  open_ = true;
  return true;
}

void PowercapSampler::stop() {
  if (!open_) return;
  open_ = false;
  std::uint64_t total_uj = 0;
  for (const auto& z : zones_) {
    auto v = read_counter(z.energy_path);
    if (!v) {
      last_joules_.reset();
      return;
    }
    if (*v >= z.start_uj) {
      total_uj += *v - z.start_uj;
    } else if (z.max_range_uj > 0) {
      total_uj += (z.max_range_uj - z.start_uj) + *v;
    } else {
      last_joules_.reset();
      return;
    }
  }
  last_joules_ = static_cast<double>(total_uj) / 1e6;
}

// ---------------------------------------------------------------------------
// SamplingWindow
// ---------------------------------------------------------------------------

SamplingWindow::SamplingWindow(SamplerChannel* channel, std::unique_lock<std::mutex> lock,
                               std::uint64_t wait_ns)
    : channel_(channel), lock_(std::move(lock)), wait_ns_(wait_ns) {}

SamplingWindow::SamplingWindow(SamplingWindow&& other) noexcept
    : channel_(other.channel_),
      lock_(std::move(other.lock_)),
      granted_(other.granted_),
      closed_(other.closed_),
      energy_(other.energy_),
      wait_ns_(other.wait_ns_) {
  other.channel_ = nullptr;
  other.granted_ = false;
  other.closed_ = true;
}

SamplingWindow::~SamplingWindow() {
  if (channel_ && granted_ && !closed_) close();
}

std::optional<double> SamplingWindow::close() {
  if (!channel_ || !granted_ || closed_) return energy_;
  closed_ = true;
  channel_->sampler_.stop();
  energy_ = channel_->sampler_.last_energy_joules();
  channel_->on_close();
  return energy_;
}

// ---------------------------------------------------------------------------
// SamplerChannel
// ---------------------------------------------------------------------------

SamplingWindow SamplerChannel::acquire() {
  const auto waited_from = std::chrono::steady_clock::now();
  std::unique_lock<std::mutex> lock(global_window_mutex());
  const auto wait_ns = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() -
                                                           waited_from).count());
  global_harness_stats().sampler_wait_ns.fetch_add(wait_ns, std::memory_order_relaxed);

  SamplingWindow window(this, std::move(lock), wait_ns);
  if (sampler_.start()) {
    window.granted_ = true;
    on_open();
  } else {
    global_harness_stats().sampler_refusals.fetch_add(1, std::memory_order_relaxed);
  }
  return window;
}

void SamplerChannel::on_open() {
  const std::uint32_t now = g_open_windows.fetch_add(1, std::memory_order_acq_rel) + 1;
  std::uint32_t seen = g_max_open_windows.load(std::memory_order_relaxed);
  while (now > seen &&
         !g_max_open_windows.compare_exchange_weak(seen, now, std::memory_order_relaxed)) {
  }
  global_harness_stats().windows_opened.fetch_add(1, std::memory_order_relaxed);
}

void SamplerChannel::on_close() {
  g_open_windows.fetch_sub(1, std::memory_order_acq_rel);
  global_harness_stats().windows_closed.fetch_add(1, std::memory_order_relaxed);
}

std::uint32_t SamplerChannel::open_windows() {
  return g_open_windows.load(std::memory_order_acquire);
}

std::uint32_t SamplerChannel::max_concurrent_windows() {
  return g_max_open_windows.load(std::memory_order_acquire);
}

void SamplerChannel::reset_instrumentation() {
  g_max_open_windows.store(g_open_windows.load(std::memory_order_acquire),
                           std::memory_order_release);
}

}  // namespace energybench
