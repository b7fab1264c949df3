#pragma once

// warden/task_context.hpp — Per-task cancellable operation handle.
//
// A TaskContext is created for every incoming task and travels with it through
// admission, the breaker and the retry executor. Copies share one cancellation
// state (std::stop_source semantics), so a copy handed to a worker observes a
// cancel() issued by the submitter.
//
// INVARIANTS:
//   - Identity fields are read-only once the task is submitted.
//   - cancelled() is true once cancel() was called on any copy, or once the
//     optional deadline has passed.

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "warden/types.hpp"

namespace warden {

struct Span;

class TaskContext {
 public:
  TaskContext() = default;
  explicit TaskContext(std::string tenant_id) : tenant_id(std::move(tenant_id)) {}

  std::string tenant_id;
  std::string user_id;
  std::string request_id;
  std::string source_ip;
  std::string user_agent;
  std::string token;
  std::map<std::string, std::string> claims;

  // Ambient span. Spans opened for this task become its children.
  std::shared_ptr<Span> span;

  void cancel() { source_.request_stop(); }
  bool cancelled() const;
  std::stop_token stop_token() const { return source_.get_token(); }

  // Arms a deadline relative to now. Blocking waits wake no later than it.
  void set_timeout(std::chrono::milliseconds timeout) { deadline_ = Clock::now() + timeout; }
  std::optional<Clock::time_point> deadline() const { return deadline_; }

  // Same identity and same cancellation state; used when handing a task to a
  // nested operation.
  TaskContext child() const { return *this; }

  // Claim lookup with fallback.
  std::string claim(const std::string& key, const std::string& def = "") const;

 private:
  std::stop_source source_;
  std::optional<Clock::time_point> deadline_;
};

}  // namespace warden
