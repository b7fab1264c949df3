#pragma once

// warden/observability.hpp — Structured control-plane event stream.
//
// DESIGN:
//   ControlEvent is the canonical observable unit of the control plane. Every
//   admission decision, completion, retry, breaker transition, throttle edge
//   and dead-letter push produces one. emit_control_event():
//     1. counts it in the process-wide ControlPlaneStats (always),
//     2. hands it to the registered hook if there is one,
//     3. otherwise appends it as one JSON line to the file named by
//        WARDEN_EVENT_LOG. Nothing is written when the variable is unset.
//   Events below WARDEN_LOG_LEVEL (debug|info|warn|error, default info) are
//   counted but not written.
//
// INVARIANTS:
//   - Emission never throws and never waits on anything but a single short
//     append to the log file.
//   - Event lines carry identifiers and error codes only. Task payloads never
//     reach the log.
//
// EXTENSION_POINT: OpenTelemetry_exporter
//   Register a hook via set_control_event_hook() and forward events to a
//   collector. The hook runs on the emitting thread and must be cheap.

#include <array>
#include <atomic>
#include <cstdint>
#include <string>

#include "warden/types.hpp"

namespace warden {

enum class Severity { debug, info, warn, error };

std::string to_string(Severity s);
Severity severity_from_string(const std::string& s, Severity def = Severity::info);

enum class EventKind {
  admitted,
  rejected,
  completed,
  failed,
  retried,
  breaker_state_change,
  throttle,
  unthrottle,
  dead_lettered,
  notification_failed,
};

std::string to_string(EventKind k);

// ---------------------------------------------------------------------------
// ControlEvent
// ---------------------------------------------------------------------------
struct ControlEvent {
  EventKind kind{EventKind::admitted};
  Severity severity{Severity::info};
  std::string tenant_id;
  std::string task_id;
  std::string task_type;
  ErrorCode error_code{ErrorCode::none};
  std::string detail;
  uint64_t duration_ns{0};
  uint64_t timestamp_ms{0};  // filled by emit_control_event() when zero
};

std::string event_to_json(const ControlEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// The last bucket also takes everything longer. Bucket boundaries are fixed;
// snapshot JSON consumers depend on them.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Upper edge, in microseconds, of the bucket holding the nearest-rank
  // sample for p in [0.0, 1.0]. 0.0 with no samples.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  static size_t bucket_index(uint64_t us);

  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// ControlPlaneStats — process-wide event counters
// ---------------------------------------------------------------------------
// One counter per EventKind plus suppressed/written totals for the log sink.
class ControlPlaneStats {
 public:
  static constexpr size_t kKinds = 10;

  void record(const ControlEvent& ev);
  uint64_t count(EventKind k) const;
  uint64_t total() const;
  std::string to_json() const;
  void reset();

  alignas(64) std::atomic<uint64_t> lines_written{0};
  alignas(64) std::atomic<uint64_t> lines_suppressed{0};

 private:
  std::array<std::atomic<uint64_t>, kKinds> by_kind_{};
};

ControlPlaneStats& global_control_stats();

void emit_control_event(const ControlEvent& ev);

using ControlEventHook = void (*)(const ControlEvent&);
void set_control_event_hook(ControlEventHook hook);

}  // namespace warden
