#pragma once

// warden/event_dispatcher.hpp — Bounded asynchronous notification channel.
//
// DESIGN:
//   State machines in the control plane (breaker transitions, throttle edges,
//   dead-letter pushes) notify subscribers without ever running subscriber code
//   inside their own critical sections. They post a closure here; one worker
//   thread runs the closures in FIFO order.
//
// INVARIANTS:
//   - post() never blocks on subscriber code. When the queue is at capacity
//     the oldest pending notification is dropped and counted.
//   - A throwing subscriber is caught and counted in failed(); the worker keeps
//     running.
//   - The destructor runs everything already queued, then joins.
//
// EXTENSION_POINT: multi_worker_dispatch
//   Current: one worker, so notifications from one source arrive in order.
//   Upgrade: shard by source key to keep per-source ordering with more workers.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace warden {

class EventDispatcher {
 public:
  using Notification = std::function<void()>;

  explicit EventDispatcher(size_t capacity = 1024);
  ~EventDispatcher();

  EventDispatcher(const EventDispatcher&) = delete;
  EventDispatcher& operator=(const EventDispatcher&) = delete;

  void post(Notification fn);

  // Blocks until every notification posted before the call has run.
  void flush();

  size_t pending() const;
  uint64_t delivered() const { return delivered_.load(std::memory_order_relaxed); }
  uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
  uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }

 private:
  void worker_loop();

  size_t capacity_;
  std::thread worker_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable cv_idle_;
  std::deque<Notification> queue_;
  uint64_t posted_seq_{0};
  uint64_t done_seq_{0};
  bool stopping_{false};

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> failed_{0};
};

}  // namespace warden
