#pragma once

// warden/circuit_breaker.hpp — Closed/open/half-open protection for one
// downstream operation, plus a per-key registry.
//
// STATE MACHINE:
//   closed    --(consecutive failures reach failure_threshold)--> open
//   open      --(first call() once timeout has elapsed since last failure)--> half_open
//   half_open --(consecutive successes reach success_threshold)--> closed
//   half_open --(any failure)--> open
//
//   Entering closed    zeroes consecutive failures, successes, half-open calls.
//   Entering open      zeroes successes and stamps the failure time.
//   Entering half_open zeroes consecutive failures, successes, half-open calls.
//
// CONCURRENCY:
//   - The closed-state fast path is lock-free: one atomic state load before the
//     call, one atomic counter update after it.
//   - Transitions and half-open trial admission run under mu_, held only for
//     the transition itself. The wrapped function never runs under mu_.
//   - Every transition bumps epoch_. A half-open trial call that completes after the
//     breaker already moved on carries a stale epoch and does not touch the
//     new phase's counters.
//   - State-change callbacks are posted to an EventDispatcher and never run
//     on the calling thread.
//
// INVARIANT: at most half_open_max_calls trial calls are in flight while half_open.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "warden/event_dispatcher.hpp"
#include "warden/types.hpp"

namespace warden {

enum class CircuitState { closed, open, half_open };

std::string to_string(CircuitState s);

using StateChangeCallback =
    std::function<void(const std::string& name, CircuitState from, CircuitState to)>;

struct CircuitBreakerConfig {
  std::string name;
  int failure_threshold{5};
  int success_threshold{2};
  std::chrono::milliseconds timeout{30000};
  int half_open_max_calls{1};
  StateChangeCallback on_state_change;
};

struct CircuitBreakerMetrics {
  std::string name;
  CircuitState state{CircuitState::closed};
  uint64_t total_failures{0};
  uint64_t total_successes{0};
  uint64_t rejected{0};
  int consecutive_failures{0};
  int successes{0};        // consecutive successes in the current half-open phase
  int half_open_calls{0};  // trial calls in flight

  std::string to_json() const;
};

class CircuitBreaker {
 public:
  // A dispatcher is created on demand when the config carries a callback and
  // none is supplied.
  explicit CircuitBreaker(CircuitBreakerConfig config,
                          std::shared_ptr<EventDispatcher> dispatcher = nullptr);

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  // Runs fn under protection. Returns circuit_open or too_many_requests
  // without invoking fn when the breaker refuses; otherwise fn's status as is.
  Status call(const std::function<Status()>& fn);

  CircuitState state() const { return state_.load(std::memory_order_acquire); }
  CircuitBreakerMetrics metrics() const;
  const std::string& name() const { return config_.name; }

  // Forces closed and clears every counter.
  void reset();

 private:
  struct Admission {
    Status status;
    CircuitState state{CircuitState::closed};
    uint64_t epoch{0};
  };
  struct Transition {
    CircuitState from;
    CircuitState to;
  };

  Admission admit();
  void on_success(const Admission& adm);
  void on_failure(const Admission& adm);

  std::optional<Transition> transition_locked(CircuitState to);
  void notify(const std::optional<Transition>& t);

  const CircuitBreakerConfig config_;
  std::shared_ptr<EventDispatcher> dispatcher_;

  mutable std::mutex mu_;
  std::atomic<CircuitState> state_{CircuitState::closed};
  uint64_t epoch_{0};     // guarded by mu_
  int half_open_calls_{0};  // guarded by mu_
  int successes_{0};        // guarded by mu_
  Clock::time_point last_failure_{};  // guarded by mu_

  alignas(64) std::atomic<int> consecutive_failures_{0};
  alignas(64) std::atomic<uint64_t> total_failures_{0};
  alignas(64) std::atomic<uint64_t> total_successes_{0};
  alignas(64) std::atomic<uint64_t> rejected_{0};
};

using CircuitBreakerPtr = std::shared_ptr<CircuitBreaker>;

// ---------------------------------------------------------------------------
// CircuitBreakerRegistry — one breaker per task-type key
// ---------------------------------------------------------------------------
// Breakers are created lazily from the template config; the key becomes the
// breaker name. All breakers share the registry's dispatcher.
class CircuitBreakerRegistry {
 public:
  CircuitBreakerRegistry(CircuitBreakerConfig config_template,
                         std::shared_ptr<EventDispatcher> dispatcher);

  CircuitBreakerPtr get(const std::string& key);
  std::map<std::string, CircuitBreakerPtr> all() const;
  std::vector<CircuitBreakerMetrics> metrics() const;
  size_t size() const;
  std::string to_json() const;

 private:
  const CircuitBreakerConfig template_;
  std::shared_ptr<EventDispatcher> dispatcher_;
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, CircuitBreakerPtr> breakers_;
};

}  // namespace warden
