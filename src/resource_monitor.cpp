#include "warden/resource_monitor.hpp"

#include <cstdio>
#include <fstream>

#include <sys/resource.h>

#include "warden/observability.hpp"

namespace warden {

namespace {

constexpr int64_t kBytesPerMb = 1024 * 1024;

// VmRSS from /proc/self/status in KB, 0 when unavailable.
long read_rss_kb() {
#if defined(__linux__)
  std::ifstream f("/proc/self/status");
  std::string line;
  while (std::getline(f, line)) {
    if (line.rfind("VmRSS:", 0) == 0) {
      long val = 0;
      std::sscanf(line.c_str() + 6, " %ld", &val);
      return val;
    }
  }
#endif
  return 0;
}

std::chrono::nanoseconds timeval_ns(const timeval& tv) {
  return std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec);
}

}  // namespace

ResourceSample ProcessSampler::sample() {
  ResourceSample s;
  rusage ru{};
  if (getrusage(RUSAGE_SELF, &ru) == 0) {
    s.cpu_time = timeval_ns(ru.ru_utime) + timeval_ns(ru.ru_stime);
  }
  s.memory_bytes = static_cast<int64_t>(read_rss_kb()) * 1024;
  return s;
}

std::string ResourceMetrics::to_json() const {
  char buf[32];
  std::string out = "{\"cpu_percent\":";
  std::snprintf(buf, sizeof(buf), "%.2f", cpu_percent);
  out += buf;
  out += ",\"memory_mb\":";
  out += std::to_string(memory_mb);
  out += ",\"throttled\":";
  out += throttled ? "true" : "false";
  out += ",\"max_cpu_percent\":";
  std::snprintf(buf, sizeof(buf), "%.2f", max_cpu_percent);
  out += buf;
  out += ",\"max_memory_mb\":";
  out += std::to_string(max_memory_mb);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ResourceMonitor
// ---------------------------------------------------------------------------

ResourceMonitor::ResourceMonitor(ResourceMonitorConfig config,
                                 std::shared_ptr<EventDispatcher> dispatcher,
                                 std::unique_ptr<ResourceSampler> sampler)
    : config_(std::move(config)),
      dispatcher_(std::move(dispatcher)),
      sampler_(sampler ? std::move(sampler) : std::make_unique<ProcessSampler>()),
      max_cpu_percent_(config_.max_cpu_percent),
      max_memory_mb_(config_.max_memory_mb),
      cpu_throttle_(config_.cpu_throttle),
      memory_throttle_(config_.memory_throttle) {
  if ((config_.on_throttle || config_.on_unthrottle) && !dispatcher_) {
    dispatcher_ = std::make_shared<EventDispatcher>();
  }
  rebaseline();
}

ResourceMonitor::~ResourceMonitor() { stop(); }

void ResourceMonitor::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  rebaseline();
  worker_ = std::thread([this] { worker_loop(); });
}

void ResourceMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  // Join outside mu_ so a concurrent running() never waits on the join.
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mu_);
    worker = std::move(worker_);
  }
  if (worker.joinable()) worker.join();
}

bool ResourceMonitor::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return worker_.joinable() && !stopping_;
}

void ResourceMonitor::worker_loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, config_.interval, [this] { return stopping_.load(); });
      if (stopping_) return;
    }
    tick();
  }
}

void ResourceMonitor::rebaseline() {
  const ResourceSample s = sampler_->sample();
  std::lock_guard<std::mutex> lock(tick_mu_);
  last_cpu_time_ = s.cpu_time;
  last_check_ = Clock::now();
}

void ResourceMonitor::tick() {
  const ResourceSample s = sampler_->sample();
  const auto now = Clock::now();

  double cpu_percent = 0.0;
  {
    std::lock_guard<std::mutex> lock(tick_mu_);
    const auto elapsed = now - last_check_;
    const auto cpu_delta = s.cpu_time - last_cpu_time_;
    if (elapsed.count() > 0 && cpu_delta.count() >= 0) {
      cpu_percent = static_cast<double>(cpu_delta.count()) /
                    static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count()) *
                    100.0;
    }
    last_cpu_time_ = s.cpu_time;
    last_check_ = now;
  }

  current_cpu_.store(cpu_percent, std::memory_order_relaxed);
  current_memory_bytes_.store(s.memory_bytes, std::memory_order_relaxed);
  ticks_.fetch_add(1, std::memory_order_relaxed);

  const int64_t memory_mb = s.memory_bytes / kBytesPerMb;
  const bool cpu_over = cpu_throttle_.load(std::memory_order_relaxed) &&
                        cpu_percent > max_cpu_percent_.load(std::memory_order_relaxed);
  const bool mem_over = memory_throttle_.load(std::memory_order_relaxed) &&
                        memory_mb > max_memory_mb_.load(std::memory_order_relaxed);

  if (cpu_over || mem_over) {
    const bool was = throttled_.exchange(true, std::memory_order_acq_rel);
    if (!was) {
      if (cpu_over) notify(config_.on_throttle, "cpu", true);
      if (mem_over) notify(config_.on_throttle, "memory", true);
    }
  } else if (throttled_.exchange(false, std::memory_order_acq_rel)) {
    notify(config_.on_unthrottle, "all", false);
  }
}

void ResourceMonitor::notify(const ThrottleCallback& cb, const std::string& resource,
                             bool throttle) {
  ControlEvent ev;
  ev.kind = throttle ? EventKind::throttle : EventKind::unthrottle;
  ev.severity = throttle ? Severity::warn : Severity::info;
  ev.detail = resource;
  emit_control_event(ev);

  if (cb && dispatcher_) dispatcher_->post([cb, resource] { cb(resource); });
}

ResourceMetrics ResourceMonitor::metrics() const {
  ResourceMetrics m;
  m.cpu_percent = current_cpu();
  m.memory_mb = current_memory_mb();
  m.throttled = throttled();
  m.max_cpu_percent = max_cpu_percent_.load(std::memory_order_relaxed);
  m.max_memory_mb = max_memory_mb_.load(std::memory_order_relaxed);
  return m;
}

void ResourceMonitor::set_limits(double max_cpu_percent, int64_t max_memory_mb) {
  max_cpu_percent_.store(max_cpu_percent, std::memory_order_relaxed);
  max_memory_mb_.store(max_memory_mb, std::memory_order_relaxed);
}

void ResourceMonitor::set_throttle_enabled(bool cpu, bool memory) {
  cpu_throttle_.store(cpu, std::memory_order_relaxed);
  memory_throttle_.store(memory, std::memory_order_relaxed);
}

}  // namespace warden
