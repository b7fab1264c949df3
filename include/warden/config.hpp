#pragma once

// warden/config.hpp — Effective configuration of one control plane.
//
// DESIGN:
//   ControlPlaneConfig aggregates the per-component configs so the composition
//   root is built from a single value. It is resolved once, in layers:
//
//     default_config()  ->  config_from_json()  ->  config_from_env()
//
//   Each layer only overrides keys it actually carries. Callbacks are never
//   part of a loaded config; the caller wires them after loading.
//
// KEYS (JSON key / environment variable):
//   max_cpu_percent         WARDEN_MAX_CPU_PERCENT
//   max_memory_mb           WARDEN_MAX_MEMORY_MB
//   cpu_throttle            WARDEN_CPU_THROTTLE        (1/0, true/false)
//   memory_throttle         WARDEN_MEMORY_THROTTLE
//   monitor_interval_ms     -
//   retry_enabled           -
//   retry_max               WARDEN_RETRY_MAX
//   retry_initial_ms        WARDEN_RETRY_INITIAL_MS
//   retry_max_ms            WARDEN_RETRY_MAX_MS
//   retry_multiplier        -
//   retry_jitter            -
//   breaker_failures        WARDEN_BREAKER_FAILURES
//   breaker_successes       WARDEN_BREAKER_SUCCESSES
//   breaker_timeout_ms      WARDEN_BREAKER_TIMEOUT_MS
//   breaker_half_open_calls -
//   default_max_tasks       WARDEN_DEFAULT_MAX_TASKS
//   default_priority        -
//   default_rate_limit      -
//   rate_limit_burst        -
//   dlq_enabled             -
//   dlq_max_size            -
//   dlq_retention_ms        -
//   dlq_compression         -
//   notification_capacity   -
//
// Hot reload is out of scope: changing a value means building a new
// AdmissionController. ResourceMonitor::set_limits() is the one live knob.

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "warden/circuit_breaker.hpp"
#include "warden/dlq.hpp"
#include "warden/resource_monitor.hpp"
#include "warden/retry.hpp"
#include "warden/tenant.hpp"

namespace warden {

struct ControlPlaneConfig {
  TenantConfig default_tenant;
  CircuitBreakerConfig breaker;
  RetryPolicy retry;
  bool retry_enabled{true};
  ResourceMonitorConfig monitor;
  int rate_limit_burst{10};
  bool dlq_enabled{true};
  size_t dlq_max_size{10000};
  std::chrono::milliseconds dlq_retention{7LL * 24 * 3600 * 1000};
  bool dlq_compression{true};
  size_t notification_capacity{1024};
  DlqMessageCallback dlq_on_message;  // runs on the dispatcher thread per dead-lettered task
};

ControlPlaneConfig default_config();

// Overlays WARDEN_* variables onto base. Unparseable values are ignored.
ControlPlaneConfig config_from_env(ControlPlaneConfig base);

// Overlays a flat JSON document onto base. Returns base unchanged and sets
// *error when the document is not a JSON object. A key whose value is out of
// range for its field keeps the base value and is listed in *error.
ControlPlaneConfig config_from_json(const std::string& json, ControlPlaneConfig base,
                                    std::string* error = nullptr);

struct ConfigValidation {
  bool ok{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  std::string to_json() const;
};

ConfigValidation validate_config(const ControlPlaneConfig& cfg);

std::string config_to_json(const ControlPlaneConfig& cfg);

}  // namespace warden
