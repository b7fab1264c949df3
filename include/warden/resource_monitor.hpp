#pragma once

// warden/resource_monitor.hpp — Process CPU/memory sampling and throttle
// signalling.
//
// DESIGN:
//   A background loop calls tick() once per interval. Each tick samples the
//   process CPU time and resident memory through a ResourceSampler, derives a
//   CPU percentage from the CPU-time delta over the wall-clock delta, and
//   raises or clears the throttle flag.
//
//   CPU percent is relative to one core: a process saturating two cores
//   reports 200. Limits are expressed on the same scale.
//
// INVARIANTS:
//   - on_throttle fires only on the not-throttled -> throttled edge, once per
//     exceeded resource ("cpu", "memory"). on_unthrottle("all") fires only on
//     the throttled -> not-throttled edge.
//   - Callbacks are posted to an EventDispatcher, never run inside tick().
//   - start()/stop() are idempotent and may be repeated; stop() wakes the loop
//     immediately and joins it.
//   - Live values are atomics written only by tick() and readable from any
//     thread. set_limits() takes effect on the next tick without a restart.
//
// EXTENSION_POINT: cgroup_aware_sampling
//   Current: getrusage(RUSAGE_SELF) and /proc/self/status VmRSS.
//   Upgrade: read cpu.stat / memory.current from the process cgroup so limits
//   track the container budget rather than the host.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "warden/event_dispatcher.hpp"
#include "warden/types.hpp"

namespace warden {

struct ResourceSample {
  std::chrono::nanoseconds cpu_time{0};  // cumulative process CPU time
  int64_t memory_bytes{0};               // current resident set
};

class ResourceSampler {
 public:
  virtual ~ResourceSampler() = default;
  virtual ResourceSample sample() = 0;
};

// Linux process sampler: getrusage() for CPU time, VmRSS for memory.
class ProcessSampler : public ResourceSampler {
 public:
  ResourceSample sample() override;
};

using ThrottleCallback = std::function<void(const std::string& resource)>;

struct ResourceMonitorConfig {
  double max_cpu_percent{80.0};
  int64_t max_memory_mb{1024};
  bool cpu_throttle{true};
  bool memory_throttle{true};
  std::chrono::milliseconds interval{1000};
  ThrottleCallback on_throttle;
  ThrottleCallback on_unthrottle;
};

struct ResourceMetrics {
  double cpu_percent{0.0};
  int64_t memory_mb{0};
  bool throttled{false};
  double max_cpu_percent{0.0};
  int64_t max_memory_mb{0};

  std::string to_json() const;
};

class ResourceMonitor {
 public:
  explicit ResourceMonitor(ResourceMonitorConfig config,
                           std::shared_ptr<EventDispatcher> dispatcher = nullptr,
                           std::unique_ptr<ResourceSampler> sampler = nullptr);
  ~ResourceMonitor();

  ResourceMonitor(const ResourceMonitor&) = delete;
  ResourceMonitor& operator=(const ResourceMonitor&) = delete;

  void start();
  void stop();
  bool running() const;

  // One sampling cycle, run synchronously on the caller's thread.
  void tick();

  double current_cpu() const { return current_cpu_.load(std::memory_order_relaxed); }
  int64_t current_memory_mb() const { return current_memory_bytes_.load(std::memory_order_relaxed) / (1024 * 1024); }
  bool throttled() const { return throttled_.load(std::memory_order_acquire); }
  ResourceMetrics metrics() const;

  void set_limits(double max_cpu_percent, int64_t max_memory_mb);
  void set_throttle_enabled(bool cpu, bool memory);

  uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }

 private:
  void worker_loop();
  void rebaseline();
  void notify(const ThrottleCallback& cb, const std::string& resource, bool throttle);

  const ResourceMonitorConfig config_;
  std::shared_ptr<EventDispatcher> dispatcher_;
  std::unique_ptr<ResourceSampler> sampler_;

  std::atomic<double> max_cpu_percent_;
  std::atomic<int64_t> max_memory_mb_;
  std::atomic<bool> cpu_throttle_;
  std::atomic<bool> memory_throttle_;

  std::atomic<double> current_cpu_{0.0};
  std::atomic<int64_t> current_memory_bytes_{0};
  std::atomic<bool> throttled_{false};
  std::atomic<uint64_t> ticks_{0};

  // Sampling baseline, guarded by tick_mu_.
  std::mutex tick_mu_;
  std::chrono::nanoseconds last_cpu_time_{0};
  Clock::time_point last_check_{};

  std::thread worker_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> stopping_{false};
};

}  // namespace warden
