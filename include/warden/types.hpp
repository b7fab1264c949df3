#pragma once

// warden/types.hpp — Core result and failure types for the Warden control plane.
//
// DESIGN:
//   Every public control-plane operation reports its outcome as a Status (or a
//   Result<T> when a value travels with it). Nothing on the admission or
//   execution path throws. ErrorCode is the single failure taxonomy shared by
//   the registry, the breaker, the retry executor and the dead-letter codec.
//
// TAXONOMY:
//   admission rejection   tenant_not_found, quota_exceeded, rate_limited, throttled
//   protection rejection  circuit_open, too_many_requests
//   cancellation          cancelled
//   execution failure     everything else that is not `none`
//
//   Admission and protection rejections are expected outcomes under load.
//   Callers must be able to tell them apart from a genuine execution failure
//   without string matching, so they stay distinct enum values.
//
// INVARIANTS:
//   - to_string(code) is stable. The strings appear in the JSONL event log and
//     in snapshot JSON; renaming one is a wire-format change.
//   - to_string(ErrorCode::none) == "".

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace warden {

enum class ErrorCode {
  none,
  tenant_not_found,
  quota_exceeded,
  rate_limited,
  throttled,
  circuit_open,
  too_many_requests,
  cancelled,
  execution_failed,
  invalid_config,
  queue_empty,
  queue_full,
  entry_corrupt,
  storage_closed,
  not_found,
};

std::string to_string(ErrorCode code);

bool is_admission_rejection(ErrorCode code);
bool is_protection_rejection(ErrorCode code);
bool is_cancellation(ErrorCode code);

// True for any failure that came out of the wrapped work itself rather than
// from the control plane refusing to run it.
bool is_execution_failure(ErrorCode code);

// ---------------------------------------------------------------------------
// Status — outcome of one operation
// ---------------------------------------------------------------------------
struct Status {
  ErrorCode code{ErrorCode::none};
  std::string detail;

  bool ok() const { return code == ErrorCode::none; }

  static Status success() { return {}; }
  static Status failure(ErrorCode c, std::string d = {}) { return {c, std::move(d)}; }

  // "quota_exceeded: tenant t1" style rendering for logs.
  std::string message() const;
};

inline bool operator==(const Status& a, const Status& b) {
  return a.code == b.code && a.detail == b.detail;
}

// ---------------------------------------------------------------------------
// Result<T> — value plus status
// ---------------------------------------------------------------------------
// `value` is meaningful on success. On failure it holds whatever the last
// producer left in it (the retry executor relies on that to preserve the last
// attempt's value).
template <typename T>
struct Result {
  T value{};
  Status status;

  bool ok() const { return status.ok(); }
};

using Clock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

// Milliseconds since the Unix epoch, used for timestamps that leave the process.
uint64_t wall_clock_ms();

}  // namespace warden
