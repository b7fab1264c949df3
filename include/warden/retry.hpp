#pragma once

// warden/retry.hpp — Bounded retries with exponential backoff and jitter.
//
// DESIGN:
//   execute() runs fn up to policy.max_retries + 1 times and stops at the first
//   success. Between failed attempts it waits
//
//     delay = min(initial_delay * multiplier^attempt_index, max_delay)
//     delay += delay * 0.25 * U(-1, 1)        (only when policy.jitter)
//
//   The wait is the only blocking point in the control plane and it wakes as
//   soon as the TaskContext is cancelled or its deadline passes.
//
// INVARIANTS:
//   - Cancellation is checked before every attempt and before every wait, and
//     wins over any other outcome: the result is ErrorCode::cancelled.
//   - On exhaustion the last attempt's status is returned unmodified.
//   - execute_if() returns immediately when the predicate rejects an error,
//     without consuming the remaining attempts.
//   - execute_with_result() preserves the last produced value on failure.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "warden/task_context.hpp"
#include "warden/types.hpp"

namespace warden {

struct RetryPolicy {
  int max_retries{3};
  std::chrono::milliseconds initial_delay{100};
  std::chrono::milliseconds max_delay{30000};
  double multiplier{2.0};
  bool jitter{true};

  std::string to_json() const;
};

RetryPolicy default_retry_policy();

// Delay before attempt (attempt_index + 1), attempt_index counted from 0.
std::chrono::nanoseconds compute_backoff(const RetryPolicy& policy, int attempt_index,
                                         std::mt19937& rng);

using RetryPredicate = std::function<bool(const Status&)>;

// One in-progress retry sequence. Owned by the caller; the executor fills it
// in when one is passed.
struct RetryableTask {
  std::string id;
  int attempts{0};
  WallClock::time_point first_attempt{};
  WallClock::time_point last_attempt{};
  WallClock::time_point next_retry{};
  std::vector<Status> errors;
};

struct RetryMetrics {
  uint64_t operations{0};
  uint64_t total_attempts{0};
  uint64_t successful_retries{0};  // succeeded after at least one retry
  uint64_t failed_retries{0};      // failed after every permitted attempt
  uint64_t cancelled{0};
  double average_attempts{0.0};

  std::string to_json() const;
};

class RetryExecutor {
 public:
  RetryExecutor() = default;

  RetryExecutor(const RetryExecutor&) = delete;
  RetryExecutor& operator=(const RetryExecutor&) = delete;

  Status execute(const TaskContext& ctx, const RetryPolicy& policy,
                 const std::function<Status()>& fn, RetryableTask* record = nullptr);

  Status execute_if(const TaskContext& ctx, const RetryPolicy& policy,
                    const RetryPredicate& should_retry, const std::function<Status()>& fn,
                    RetryableTask* record = nullptr);

  template <typename T>
  Result<T> execute_with_result(const TaskContext& ctx, const RetryPolicy& policy,
                                const std::function<Result<T>()>& fn,
                                RetryableTask* record = nullptr) {
    Result<T> last;
    last.status = execute(
        ctx, policy,
        [&]() {
          Result<T> r = fn();
          last.value = std::move(r.value);
          return r.status;
        },
        record);
    return last;
  }

  RetryMetrics metrics() const;

 private:
  // False when the context was cancelled before the delay elapsed.
  static bool wait(const TaskContext& ctx, std::chrono::nanoseconds delay);

  alignas(64) std::atomic<uint64_t> operations_{0};
  alignas(64) std::atomic<uint64_t> total_attempts_{0};
  alignas(64) std::atomic<uint64_t> successful_retries_{0};
  alignas(64) std::atomic<uint64_t> failed_retries_{0};
  alignas(64) std::atomic<uint64_t> cancelled_{0};
};

}  // namespace warden
