#include "warden/types.hpp"

namespace warden {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::tenant_not_found: return "tenant_not_found";
    case ErrorCode::quota_exceeded: return "quota_exceeded";
    case ErrorCode::rate_limited: return "rate_limited";
    case ErrorCode::throttled: return "throttled";
    case ErrorCode::circuit_open: return "circuit_open";
    case ErrorCode::too_many_requests: return "too_many_requests";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::execution_failed: return "execution_failed";
    case ErrorCode::invalid_config: return "invalid_config";
    case ErrorCode::queue_empty: return "queue_empty";
    case ErrorCode::queue_full: return "queue_full";
    case ErrorCode::entry_corrupt: return "entry_corrupt";
    case ErrorCode::storage_closed: return "storage_closed";
    case ErrorCode::not_found: return "not_found";
  }
  return "";
}

bool is_admission_rejection(ErrorCode code) {
  return code == ErrorCode::tenant_not_found || code == ErrorCode::quota_exceeded ||
         code == ErrorCode::rate_limited || code == ErrorCode::throttled;
}

bool is_protection_rejection(ErrorCode code) {
  return code == ErrorCode::circuit_open || code == ErrorCode::too_many_requests;
}

bool is_cancellation(ErrorCode code) { return code == ErrorCode::cancelled; }

bool is_execution_failure(ErrorCode code) {
  return code != ErrorCode::none && !is_admission_rejection(code) &&
         !is_protection_rejection(code) && !is_cancellation(code);
}

std::string Status::message() const {
  if (ok()) return "ok";
  if (detail.empty()) return to_string(code);
  return to_string(code) + ": " + detail;
}

uint64_t wall_clock_ms() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   WallClock::now().time_since_epoch())
                                   .count());
}

}  // namespace warden
