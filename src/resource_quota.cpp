#include "warden/resource_quota.hpp"

namespace warden {

bool ResourceQuota::check_and_reserve() {
  if (tasks_limit_ <= 0) {
    tasks_used_.fetch_add(1, std::memory_order_acq_rel);
    return true;
  }
  int64_t current = tasks_used_.load(std::memory_order_acquire);
  while (current < tasks_limit_) {
    if (tasks_used_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
      return true;
    }
  }
  return false;
}

bool ResourceQuota::release() {
  int64_t current = tasks_used_.load(std::memory_order_acquire);
  while (current > 0) {
    if (tasks_used_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
      return true;
    }
  }
  return false;
}

QuotaUsage ResourceQuota::usage() const {
  QuotaUsage u;
  u.cpu_limit = cpu_limit_;
  u.memory_limit = memory_limit_;
  u.tasks_limit = tasks_limit_;
  u.cpu_used = cpu_used_.load(std::memory_order_relaxed);
  u.memory_used = memory_used_.load(std::memory_order_relaxed);
  u.tasks_used = tasks_used_.load(std::memory_order_relaxed);
  return u;
}

int64_t ResourceQuota::available_tasks() const {
  if (tasks_limit_ <= 0) return -1;
  const int64_t left = tasks_limit_ - tasks_used_.load(std::memory_order_relaxed);
  return left > 0 ? left : 0;
}

std::string QuotaUsage::to_json() const {
  std::string out = "{\"cpu_used_ms\":";
  out += std::to_string(cpu_used);
  out += ",\"cpu_limit_ms\":";
  out += std::to_string(cpu_limit);
  out += ",\"memory_used_bytes\":";
  out += std::to_string(memory_used);
  out += ",\"memory_limit_bytes\":";
  out += std::to_string(memory_limit);
  out += ",\"tasks_used\":";
  out += std::to_string(tasks_used);
  out += ",\"tasks_limit\":";
  out += std::to_string(tasks_limit);
  out += '}';
  return out;
}

}  // namespace warden
