#include "warden/observability.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "warden/jsonlite.hpp"

namespace warden {

namespace {

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

}  // namespace

std::string to_string(Severity s) {
  switch (s) {
    case Severity::debug: return "debug";
    case Severity::info: return "info";
    case Severity::warn: return "warn";
    case Severity::error: return "error";
  }
  return "info";
}

Severity severity_from_string(const std::string& s, Severity def) {
  if (s == "debug") return Severity::debug;
  if (s == "info") return Severity::info;
  if (s == "warn" || s == "warning") return Severity::warn;
  if (s == "error") return Severity::error;
  return def;
}

std::string to_string(EventKind k) {
  switch (k) {
    case EventKind::admitted: return "admitted";
    case EventKind::rejected: return "rejected";
    case EventKind::completed: return "completed";
    case EventKind::failed: return "failed";
    case EventKind::retried: return "retried";
    case EventKind::breaker_state_change: return "breaker_state_change";
    case EventKind::throttle: return "throttle";
    case EventKind::unthrottle: return "unthrottle";
    case EventKind::dead_lettered: return "dead_lettered";
    case EventKind::notification_failed: return "notification_failed";
  }
  return "";
}

std::string event_to_json(const ControlEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"ts_ms\":";
  line += std::to_string(ev.timestamp_ms);
  line += ",\"kind\":\"";
  line += to_string(ev.kind);
  line += "\",\"severity\":\"";
  line += to_string(ev.severity);
  line += "\",\"tenant_id\":\"";
  line += jsonlite::escape(ev.tenant_id);
  line += "\",\"task_id\":\"";
  line += jsonlite::escape(ev.task_id);
  line += "\",\"task_type\":\"";
  line += jsonlite::escape(ev.task_type);
  line += "\",\"error_code\":\"";
  line += to_string(ev.error_code);
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"detail\":\"";
  line += jsonlite::escape(ev.detail);
  line += "\"}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

size_t LatencyHistogram::bucket_index(uint64_t us) {
  size_t i = 0;
  while (us != 0 && i + 1 < kBuckets) {
    us >>= 1;
    ++i;
  }
  return i;
}

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_index(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  // Nearest rank, clamped to [1, n].
  const double clamped = std::clamp(p, 0.0, 1.0);
  const uint64_t rank =
      std::max<uint64_t>(1, static_cast<uint64_t>(std::ceil(clamped * static_cast<double>(n))));

  uint64_t seen = 0;
  size_t i = 0;
  for (; i + 1 < kBuckets; ++i) {
    seen += buckets_[i].load(std::memory_order_relaxed);
    if (seen >= rank) break;
  }
  return static_cast<double>(uint64_t{1} << i);
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(256);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  append_fixed(out, "%.2f", mean_us());
  out += ",\"p50_ms\":";
  append_fixed(out, "%.3f", percentile(0.50) / 1000.0);
  out += ",\"p95_ms\":";
  append_fixed(out, "%.3f", percentile(0.95) / 1000.0);
  out += ",\"p99_ms\":";
  append_fixed(out, "%.3f", percentile(0.99) / 1000.0);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ControlPlaneStats
// ---------------------------------------------------------------------------

void ControlPlaneStats::record(const ControlEvent& ev) {
  const size_t idx = static_cast<size_t>(ev.kind);
  if (idx < kKinds) by_kind_[idx].fetch_add(1, std::memory_order_relaxed);
}

uint64_t ControlPlaneStats::count(EventKind k) const {
  const size_t idx = static_cast<size_t>(k);
  return idx < kKinds ? by_kind_[idx].load(std::memory_order_relaxed) : 0;
}

uint64_t ControlPlaneStats::total() const {
  uint64_t sum = 0;
  for (const auto& c : by_kind_) sum += c.load(std::memory_order_relaxed);
  return sum;
}

void ControlPlaneStats::reset() {
  for (auto& c : by_kind_) c.store(0, std::memory_order_relaxed);
  lines_written.store(0, std::memory_order_relaxed);
  lines_suppressed.store(0, std::memory_order_relaxed);
}

std::string ControlPlaneStats::to_json() const {
  std::string out = "{\"events\":{";
  for (size_t i = 0; i < kKinds; ++i) {
    if (i) out += ',';
    out += '"';
    out += to_string(static_cast<EventKind>(i));
    out += "\":";
    out += std::to_string(by_kind_[i].load(std::memory_order_relaxed));
  }
  out += "},\"lines_written\":";
  out += std::to_string(lines_written.load(std::memory_order_relaxed));
  out += ",\"lines_suppressed\":";
  out += std::to_string(lines_suppressed.load(std::memory_order_relaxed));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

ControlPlaneStats& global_control_stats() {
  static ControlPlaneStats inst;
  return inst;
}

namespace {
std::atomic<ControlEventHook> g_event_hook{nullptr};
}

void set_control_event_hook(ControlEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_control_event(const ControlEvent& ev_in) {
  ControlEvent ev = ev_in;
  if (ev.timestamp_ms == 0) ev.timestamp_ms = wall_clock_ms();

  // 1. Always counted.
  global_control_stats().record(ev);

  // 2. Hook replaces the file sink.
  ControlEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // 3. JSONL sink. Activation: WARDEN_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("WARDEN_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const char* level = std::getenv("WARDEN_LOG_LEVEL");
  const Severity min_level = level ? severity_from_string(level) : Severity::info;
  if (static_cast<int>(ev.severity) < static_cast<int>(min_level)) {
    global_control_stats().lines_suppressed.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  std::string line = event_to_json(ev);
  line += '\n';

  // O_APPEND keeps concurrent short writes whole on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
    global_control_stats().lines_written.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace warden
