#pragma once

// warden/stats.hpp — Pool-wide counters for the admission layer.
//
// The queue itself lives outside the control plane, so its length is passed
// in at snapshot time. Average latency is total latency / completed tasks,
// zero before the first completion.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "warden/observability.hpp"
#include "warden/types.hpp"

namespace warden {

struct PoolStats {
  int64_t active_workers{0};
  int64_t queued_tasks{0};
  int64_t completed_tasks{0};
  int64_t rejected_tasks{0};
  std::chrono::nanoseconds average_latency{0};
  std::chrono::nanoseconds uptime{0};
  Status last_error;

  std::string to_json() const;
};

class StatsCollector {
 public:
  StatsCollector();

  StatsCollector(const StatsCollector&) = delete;
  StatsCollector& operator=(const StatsCollector&) = delete;

  void inc_active_workers() { active_workers_.fetch_add(1, std::memory_order_relaxed); }
  void dec_active_workers() { active_workers_.fetch_sub(1, std::memory_order_relaxed); }

  void record_task_completion(std::chrono::nanoseconds duration);
  void record_task_rejection() { rejected_tasks_.fetch_add(1, std::memory_order_relaxed); }
  void record_error(const Status& status);

  PoolStats snapshot(int64_t queue_len) const;

  const LatencyHistogram& latency() const { return latency_; }

  // Snapshot plus latency percentiles.
  std::string to_json(int64_t queue_len) const;

 private:
  const Clock::time_point started_;

  alignas(64) std::atomic<int64_t> active_workers_{0};
  alignas(64) std::atomic<int64_t> completed_tasks_{0};
  alignas(64) std::atomic<int64_t> rejected_tasks_{0};
  alignas(64) std::atomic<int64_t> total_latency_ns_{0};

  LatencyHistogram latency_;

  mutable std::mutex error_mu_;
  Status last_error_;
};

}  // namespace warden
