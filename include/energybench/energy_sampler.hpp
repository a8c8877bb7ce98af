#pragma once

// energybench/energy_sampler.hpp — Exclusive energy sampling gate.
//
// IEnergySampler is the boundary to the hardware sampling subsystem:
//   start() -> bool   false = subsystem unavailable; the caller must not run
//                     the measured body.
//   stop()            closes the single open window. Exactly one stop() per
//                     successful start(); windows never nest.
//   last_energy_joules() energy of the window closed by the last stop(), or
//                     nullopt when it could not be read.
//
// SamplerChannel owns the process-wide exclusivity: every SamplingWindow holds
// one global mutex from acquire() until it is destroyed, so at most one window
// is open across the whole harness at any instant, whatever the number of
// channels or worker threads.
//
// A SamplingWindow is in exactly one of two states after acquire():
//   refused  start() returned false; stop() is never called.
//   granted  start() returned true; stop() is called exactly once, by close()
//            or at the latest by the destructor, on every exit path.

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace energybench {

class IEnergySampler {
 public:
  virtual ~IEnergySampler() = default;
  virtual bool start() = 0;
  virtual void stop() = 0;
  virtual std::optional<double> last_energy_joules() const = 0;
  virtual std::string sampler_id() const = 0;
};

// ---------------------------------------------------------------------------
// PowercapSampler — Linux powercap RAPL counters.
// ---------------------------------------------------------------------------
// Reads <root>/intel-rapl:N/energy_uj for every top-level package zone (sub
// zones "intel-rapl:N:M" are contained in their package and skipped). A
// counter that went backwards wrapped at max_energy_range_uj.
// start() refuses when no zone is readable or a window is already open.
class PowercapSampler : public IEnergySampler {
 public:
  explicit PowercapSampler(std::string root = "/sys/class/powercap");

  bool start() override;
  void stop() override;
  std::optional<double> last_energy_joules() const override { return last_joules_; }
  std::string sampler_id() const override { return "powercap"; }

  std::size_t zone_count() const { return zones_.size(); }

 private:
  struct Zone {
    std::string energy_path;
    std::uint64_t max_range_uj{0};
    std::uint64_t start_uj{0};
  };
  std::vector<Zone> zones_;
  bool open_{false};
  std::optional<double> last_joules_;
};

// Always refuses. Selected when measurement is disabled in the config.
class UnavailableSampler : public IEnergySampler {
 public:
  bool start() override { return false; }
  void stop() override {}
  std::optional<double> last_energy_joules() const override { return std::nullopt; }
  std::string sampler_id() const override { return "unavailable"; }
};

class SamplerChannel;

class SamplingWindow {
 public:
  SamplingWindow(SamplingWindow&& other) noexcept;
  SamplingWindow& operator=(SamplingWindow&&) = delete;
  SamplingWindow(const SamplingWindow&) = delete;
  SamplingWindow& operator=(const SamplingWindow&) = delete;
  ~SamplingWindow();

  bool granted() const { return granted_; }
  bool refused() const { return !granted_; }
  bool closed() const { return closed_; }

  // Stop the sampler (once) and return the window's energy. Further calls
  // return the same reading without touching the sampler.
  std::optional<double> close();

  // Nanoseconds spent waiting for the global lock.
  std::uint64_t wait_ns() const { return wait_ns_; }

 private:
  friend class SamplerChannel;
  SamplingWindow(SamplerChannel* channel, std::unique_lock<std::mutex> lock,
                 std::uint64_t wait_ns);

  SamplerChannel* channel_{nullptr};
  std::unique_lock<std::mutex> lock_;
  bool granted_{false};
  bool closed_{false};
  std::optional<double> energy_;
  std::uint64_t wait_ns_{0};
};

class SamplerChannel {
 public:
  explicit SamplerChannel(IEnergySampler& sampler) : sampler_(sampler) {}

  // Blocks until no other window is open anywhere in the process, then calls
  // start(). The returned window keeps the lock until it is destroyed.
  SamplingWindow acquire();

  IEnergySampler& sampler() { return sampler_; }

  // Instrumentation: windows currently open on this process, and the highest
  // value ever observed. max_concurrent_windows() > 1 would be a bug.
  static std::uint32_t open_windows();
  static std::uint32_t max_concurrent_windows();
  static void reset_instrumentation();

 private:
  friend class SamplingWindow;
  void on_open();
  void on_close();

  IEnergySampler& sampler_;
};

}  // namespace energybench
