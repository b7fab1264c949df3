#include "warden/stats.hpp"

#include "warden/jsonlite.hpp"

namespace warden {

StatsCollector::StatsCollector() : started_(Clock::now()) {}

void StatsCollector::record_task_completion(std::chrono::nanoseconds duration) {
  const int64_t ns = duration.count() > 0 ? duration.count() : 0;
  completed_tasks_.fetch_add(1, std::memory_order_relaxed);
  total_latency_ns_.fetch_add(ns, std::memory_order_relaxed);
  latency_.record(static_cast<uint64_t>(ns));
}

void StatsCollector::record_error(const Status& status) {
  if (status.ok()) return;
  std::lock_guard<std::mutex> lock(error_mu_);
  last_error_ = status;
}

PoolStats StatsCollector::snapshot(int64_t queue_len) const {
  PoolStats s;
  s.active_workers = active_workers_.load(std::memory_order_relaxed);
  s.queued_tasks = queue_len;
  s.completed_tasks = completed_tasks_.load(std::memory_order_relaxed);
  s.rejected_tasks = rejected_tasks_.load(std::memory_order_relaxed);
  if (s.completed_tasks > 0) {
    s.average_latency =
        std::chrono::nanoseconds(total_latency_ns_.load(std::memory_order_relaxed) / s.completed_tasks);
  }
  s.uptime = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started_);
  {
    std::lock_guard<std::mutex> lock(error_mu_);
    s.last_error = last_error_;
  }
  return s;
}

std::string PoolStats::to_json() const {
  std::string out = "{\"active_workers\":";
  out += std::to_string(active_workers);
  out += ",\"queued_tasks\":";
  out += std::to_string(queued_tasks);
  out += ",\"completed_tasks\":";
  out += std::to_string(completed_tasks);
  out += ",\"rejected_tasks\":";
  out += std::to_string(rejected_tasks);
  out += ",\"average_latency_ns\":";
  out += std::to_string(average_latency.count());
  out += ",\"uptime_ms\":";
  out += std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(uptime).count());
  out += ",\"last_error\":\"";
  out += jsonlite::escape(last_error.ok() ? std::string() : last_error.message());
  out += "\"}";
  return out;
}

std::string StatsCollector::to_json(int64_t queue_len) const {
  std::string out = snapshot(queue_len).to_json();
  out.pop_back();  // reopen the object
  out += ",\"latency\":";
  out += latency_.to_json();
  out += '}';
  return out;
}

}  // namespace warden
