#include "warden/event_dispatcher.hpp"

#include <exception>
#include <string>

#include "warden/observability.hpp"

namespace warden {

EventDispatcher::EventDispatcher(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
  worker_ = std::thread([this] { worker_loop(); });
}

EventDispatcher::~EventDispatcher() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable()) worker_.join();
}

void EventDispatcher::post(Notification fn) {
  if (!fn) return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) return;
    if (queue_.size() >= capacity_) {
      // Drop oldest: the newest state is the one subscribers care about.
      queue_.pop_front();
      ++done_seq_;
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
    queue_.push_back(std::move(fn));
    ++posted_seq_;
  }
  cv_.notify_one();
}

void EventDispatcher::flush() {
  // Must not be called from inside a notification; the worker would wait on itself.
  std::unique_lock<std::mutex> lock(mu_);
  const uint64_t target = posted_seq_;
  cv_idle_.wait(lock, [this, target] { return done_seq_ >= target; });
}

size_t EventDispatcher::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

void EventDispatcher::worker_loop() {
  while (true) {
    Notification task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) return;
      task = std::move(queue_.front());
      queue_.pop_front();
    }

    bool threw = false;
    std::string failure;
    try {
      task();
      delivered_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
      threw = true;
      failure = e.what();
    } catch (...) {
      threw = true;
      failure = "non-standard exception";
    }
    if (threw) {
      failed_.fetch_add(1, std::memory_order_relaxed);
      ControlEvent ev;
      ev.kind = EventKind::notification_failed;
      ev.severity = Severity::warn;
      ev.detail = std::move(failure);
      emit_control_event(ev);
    }

    {
      std::lock_guard<std::mutex> lock(mu_);
      ++done_seq_;
    }
    cv_idle_.notify_all();
  }
}

}  // namespace warden
