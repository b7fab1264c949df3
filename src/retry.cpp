#include "warden/retry.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <mutex>

#include "warden/observability.hpp"

namespace warden {

RetryPolicy default_retry_policy() { return RetryPolicy{}; }

std::string RetryPolicy::to_json() const {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", multiplier);
  std::string out = "{\"max_retries\":";
  out += std::to_string(max_retries);
  out += ",\"initial_delay_ms\":";
  out += std::to_string(initial_delay.count());
  out += ",\"max_delay_ms\":";
  out += std::to_string(max_delay.count());
  out += ",\"multiplier\":";
  out += buf;
  out += ",\"jitter\":";
  out += jitter ? "true" : "false";
  out += '}';
  return out;
}

std::chrono::nanoseconds compute_backoff(const RetryPolicy& policy, int attempt_index,
                                         std::mt19937& rng) {
  const double initial_ns =
      static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(policy.initial_delay).count());
  const double max_ns =
      static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(policy.max_delay).count());

  double delay = initial_ns * std::pow(policy.multiplier, static_cast<double>(attempt_index));
  if (!(delay < max_ns)) delay = max_ns;  // also catches inf from a large exponent

  if (policy.jitter) {
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    delay += delay * 0.25 * dist(rng);
  }
  if (delay < 0.0) delay = 0.0;
  return std::chrono::nanoseconds(static_cast<int64_t>(delay));
}

std::string RetryMetrics::to_json() const {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", average_attempts);
  std::string out = "{\"operations\":";
  out += std::to_string(operations);
  out += ",\"total_attempts\":";
  out += std::to_string(total_attempts);
  out += ",\"successful_retries\":";
  out += std::to_string(successful_retries);
  out += ",\"failed_retries\":";
  out += std::to_string(failed_retries);
  out += ",\"cancelled\":";
  out += std::to_string(cancelled);
  out += ",\"average_attempts\":";
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// RetryExecutor
// ---------------------------------------------------------------------------

bool RetryExecutor::wait(const TaskContext& ctx, std::chrono::nanoseconds delay) {
  auto until = Clock::now() + delay;
  if (auto deadline = ctx.deadline(); deadline && *deadline < until) until = *deadline;

  std::mutex mu;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(mu);
  // Nothing notifies cv; the stop token interrupts the wait.
  cv.wait_until(lock, ctx.stop_token(), until, [] { return false; });
  return !ctx.cancelled();
}

Status RetryExecutor::execute(const TaskContext& ctx, const RetryPolicy& policy,
                              const std::function<Status()>& fn, RetryableTask* record) {
  return execute_if(ctx, policy, nullptr, fn, record);
}

Status RetryExecutor::execute_if(const TaskContext& ctx, const RetryPolicy& policy,
                                 const RetryPredicate& should_retry,
                                 const std::function<Status()>& fn, RetryableTask* record) {
  static thread_local std::mt19937 rng(std::random_device{}());

  operations_.fetch_add(1, std::memory_order_relaxed);
  const int max_attempts = std::max(0, policy.max_retries) + 1;
  const Status cancelled = Status::failure(ErrorCode::cancelled, "operation cancelled");
  Status last;

  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    if (ctx.cancelled()) {
      cancelled_.fetch_add(1, std::memory_order_relaxed);
      return cancelled;
    }

    total_attempts_.fetch_add(1, std::memory_order_relaxed);
    if (record) {
      record->attempts++;
      record->last_attempt = WallClock::now();
      if (attempt == 0) record->first_attempt = record->last_attempt;
    }

    last = fn();
    if (last.ok()) {
      if (attempt > 0) successful_retries_.fetch_add(1, std::memory_order_relaxed);
      return last;
    }
    if (record) record->errors.push_back(last);

    if (should_retry && !should_retry(last)) break;
    if (attempt + 1 >= max_attempts) break;

    const auto delay = compute_backoff(policy, attempt, rng);
    if (record) {
      record->next_retry =
          WallClock::now() + std::chrono::duration_cast<WallClock::duration>(delay);
    }

    ControlEvent ev;
    ev.kind = EventKind::retried;
    ev.severity = Severity::debug;
    ev.tenant_id = ctx.tenant_id;
    ev.task_id = record ? record->id : ctx.request_id;
    ev.error_code = last.code;
    ev.duration_ns = static_cast<uint64_t>(delay.count());
    ev.detail = "attempt " + std::to_string(attempt + 1) + " failed: " + last.detail;
    emit_control_event(ev);

    if (ctx.cancelled() || !wait(ctx, delay)) {
      cancelled_.fetch_add(1, std::memory_order_relaxed);
      return cancelled;
    }
  }

  failed_retries_.fetch_add(1, std::memory_order_relaxed);
  return last;
}

RetryMetrics RetryExecutor::metrics() const {
  RetryMetrics m;
  m.operations = operations_.load(std::memory_order_relaxed);
  m.total_attempts = total_attempts_.load(std::memory_order_relaxed);
  m.successful_retries = successful_retries_.load(std::memory_order_relaxed);
  m.failed_retries = failed_retries_.load(std::memory_order_relaxed);
  m.cancelled = cancelled_.load(std::memory_order_relaxed);
  if (m.operations > 0) {
    m.average_attempts =
        static_cast<double>(m.total_attempts) / static_cast<double>(m.operations);
  }
  return m;
}

}  // namespace warden
