#pragma once

// warden/resource_quota.hpp — Per-tenant resource counters against limits.
//
// INVARIANTS:
//   - tasks_used never exceeds tasks_limit while tasks_limit > 0. Reservation
//     is a compare-and-swap loop, so concurrent callers can neither lose nor
//     double-count a reservation.
//   - tasks_limit == 0 means unlimited; the CAS check is skipped.
//   - release() never drives tasks_used below zero.
//   - memory_used is the last reported absolute value (overwrite, not sum).
//     cpu_used is cumulative.
//
// CONCURRENCY: all fields are independent atomics. usage() reads each field
// atomically but the snapshot as a whole is not a single atomic cut.

#include <atomic>
#include <cstdint>
#include <string>

namespace warden {

struct QuotaUsage {
  int64_t cpu_limit{0};     // milliseconds of CPU time, 0 = unlimited
  int64_t memory_limit{0};  // bytes, 0 = unlimited
  int64_t tasks_limit{0};   // concurrent tasks, 0 = unlimited
  int64_t cpu_used{0};
  int64_t memory_used{0};
  int64_t tasks_used{0};

  std::string to_json() const;
};

class ResourceQuota {
 public:
  ResourceQuota(int64_t cpu_limit, int64_t memory_limit, int64_t tasks_limit)
      : cpu_limit_(cpu_limit), memory_limit_(memory_limit), tasks_limit_(tasks_limit) {}

  ResourceQuota(const ResourceQuota&) = delete;
  ResourceQuota& operator=(const ResourceQuota&) = delete;

  // Reserves one concurrent task slot. False when the limit is reached.
  bool check_and_reserve();

  // Returns one slot. Returns false (and changes nothing) when nothing is held.
  bool release();

  void record_cpu(int64_t delta_ms) { cpu_used_.fetch_add(delta_ms, std::memory_order_relaxed); }
  void record_memory(int64_t bytes) { memory_used_.store(bytes, std::memory_order_relaxed); }

  QuotaUsage usage() const;

  // Remaining slots; -1 when unlimited.
  int64_t available_tasks() const;

  int64_t tasks_limit() const { return tasks_limit_; }

 private:
  const int64_t cpu_limit_;
  const int64_t memory_limit_;
  const int64_t tasks_limit_;

  alignas(64) std::atomic<int64_t> cpu_used_{0};
  alignas(64) std::atomic<int64_t> memory_used_{0};
  alignas(64) std::atomic<int64_t> tasks_used_{0};
};

}  // namespace warden
