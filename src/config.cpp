#include "warden/config.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <thread>

#include "warden/jsonlite.hpp"

namespace warden {

namespace {

// Non-empty env value or nullptr.
const char* env(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

bool parse_bool(const char* v, bool def) {
  const std::string s(v);
  if (s == "1" || s == "true" || s == "on" || s == "yes") return true;
  if (s == "0" || s == "false" || s == "off" || s == "no") return false;
  return def;
}

bool parse_i64(const char* v, long long* out) {
  errno = 0;
  char* end = nullptr;
  long long n = std::strtoll(v, &end, 10);
  if (errno == ERANGE || end == v || *end != '\0') return false;
  *out = n;
  return true;
}

bool parse_double(const char* v, double* out) {
  errno = 0;
  char* end = nullptr;
  double d = std::strtod(v, &end);
  if (errno == ERANGE || end == v || *end != '\0') return false;
  *out = d;
  return true;
}

std::string json_string_array(const std::vector<std::string>& v) {
  std::string out = "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += ",";
    out += "\"" + jsonlite::escape(v[i]) + "\"";
  }
  out += "]";
  return out;
}

}  // namespace

ControlPlaneConfig default_config() {
  ControlPlaneConfig cfg;
  cfg.default_tenant.max_queue_size = 100;
  cfg.default_tenant.priority = 0;
  cfg.breaker.name = "default";
  cfg.retry = default_retry_policy();
  return cfg;
}

ControlPlaneConfig config_from_env(ControlPlaneConfig cfg) {
  long long n = 0;
  double d = 0.0;

  if (const char* e = env("WARDEN_MAX_CPU_PERCENT")) {
    if (parse_double(e, &d)) cfg.monitor.max_cpu_percent = d;
  }
  if (const char* e = env("WARDEN_MAX_MEMORY_MB")) {
    if (parse_i64(e, &n)) cfg.monitor.max_memory_mb = n;
  }
  if (const char* e = env("WARDEN_CPU_THROTTLE")) {
    cfg.monitor.cpu_throttle = parse_bool(e, cfg.monitor.cpu_throttle);
  }
  if (const char* e = env("WARDEN_MEMORY_THROTTLE")) {
    cfg.monitor.memory_throttle = parse_bool(e, cfg.monitor.memory_throttle);
  }
  if (const char* e = env("WARDEN_RETRY_MAX")) {
    if (parse_i64(e, &n)) cfg.retry.max_retries = static_cast<int>(n);
  }
  if (const char* e = env("WARDEN_RETRY_INITIAL_MS")) {
    if (parse_i64(e, &n)) cfg.retry.initial_delay = std::chrono::milliseconds(n);
  }
  if (const char* e = env("WARDEN_RETRY_MAX_MS")) {
    if (parse_i64(e, &n)) cfg.retry.max_delay = std::chrono::milliseconds(n);
  }
  if (const char* e = env("WARDEN_BREAKER_FAILURES")) {
    if (parse_i64(e, &n)) cfg.breaker.failure_threshold = static_cast<int>(n);
  }
  if (const char* e = env("WARDEN_BREAKER_SUCCESSES")) {
    if (parse_i64(e, &n)) cfg.breaker.success_threshold = static_cast<int>(n);
  }
  if (const char* e = env("WARDEN_BREAKER_TIMEOUT_MS")) {
    if (parse_i64(e, &n)) cfg.breaker.timeout = std::chrono::milliseconds(n);
  }
  if (const char* e = env("WARDEN_DEFAULT_MAX_TASKS")) {
    if (parse_i64(e, &n)) cfg.default_tenant.max_queue_size = static_cast<int>(n);
  }
  return cfg;
}

ControlPlaneConfig config_from_json(const std::string& json, ControlPlaneConfig cfg,
                                    std::string* error) {
  const auto first = json.find_first_not_of(" \t\r\n");
  const auto last = json.find_last_not_of(" \t\r\n");
  if (first == std::string::npos || json[first] != '{' || json[last] != '}') {
    if (error) *error = "config document is not a JSON object";
    return cfg;
  }

  namespace jl = jsonlite;
  // A present key whose value does not fit its field leaves the field alone
  // and is named in *error.
  std::vector<std::string> bad;
  auto flag = [&](const char* key, bool* field) {
    if (jl::has_key(json, key)) *field = jl::get_bool(json, key, *field);
  };
  auto real = [&](const char* key, double* field) {
    if (!jl::has_key(json, key)) return;
    if (!jl::find_double(json, key, field)) bad.push_back(key);
  };
  auto whole = [&](const char* key, long long lo, long long hi, long long* out) {
    if (!jl::has_key(json, key)) return false;
    long long v = 0;
    if (!jl::find_i64(json, key, &v) || v < lo || v > hi) {
      bad.push_back(key);
      return false;
    }
    *out = v;
    return true;
  };
  auto int_field = [&](const char* key, int* field) {
    long long v = 0;
    if (whole(key, std::numeric_limits<int>::min(), std::numeric_limits<int>::max(), &v)) {
      *field = static_cast<int>(v);
    }
  };
  auto i64_field = [&](const char* key, int64_t* field) {
    long long v = 0;
    if (whole(key, std::numeric_limits<long long>::min(), std::numeric_limits<long long>::max(), &v)) {
      *field = v;
    }
  };
  auto ms_field = [&](const char* key, std::chrono::milliseconds* field) {
    long long v = 0;
    if (whole(key, std::numeric_limits<long long>::min(), std::numeric_limits<long long>::max(), &v)) {
      *field = std::chrono::milliseconds(v);
    }
  };
  auto size_field = [&](const char* key, size_t* field) {
    if (!jl::has_key(json, key)) return;
    unsigned long long v = 0;
    if (!jl::find_u64(json, key, &v) || v > std::numeric_limits<size_t>::max()) {
      bad.push_back(key);
      return;
    }
    *field = static_cast<size_t>(v);
  };

  auto& m = cfg.monitor;
  real("max_cpu_percent", &m.max_cpu_percent);
  i64_field("max_memory_mb", &m.max_memory_mb);
  flag("cpu_throttle", &m.cpu_throttle);
  flag("memory_throttle", &m.memory_throttle);
  ms_field("monitor_interval_ms", &m.interval);

  auto& r = cfg.retry;
  flag("retry_enabled", &cfg.retry_enabled);
  int_field("retry_max", &r.max_retries);
  ms_field("retry_initial_ms", &r.initial_delay);
  ms_field("retry_max_ms", &r.max_delay);
  real("retry_multiplier", &r.multiplier);
  flag("retry_jitter", &r.jitter);

  auto& b = cfg.breaker;
  int_field("breaker_failures", &b.failure_threshold);
  int_field("breaker_successes", &b.success_threshold);
  ms_field("breaker_timeout_ms", &b.timeout);
  int_field("breaker_half_open_calls", &b.half_open_max_calls);

  auto& t = cfg.default_tenant;
  int_field("default_max_tasks", &t.max_queue_size);
  int_field("default_priority", &t.priority);
  real("default_rate_limit", &t.rate_limit);
  int_field("rate_limit_burst", &cfg.rate_limit_burst);

  flag("dlq_enabled", &cfg.dlq_enabled);
  size_field("dlq_max_size", &cfg.dlq_max_size);
  ms_field("dlq_retention_ms", &cfg.dlq_retention);
  flag("dlq_compression", &cfg.dlq_compression);
  size_field("notification_capacity", &cfg.notification_capacity);

  if (!bad.empty() && error) {
    std::string msg = "value out of range or not a number:";
    for (const auto& key : bad) msg += " " + key;
    *error = msg;
  }
  return cfg;
}

ConfigValidation validate_config(const ControlPlaneConfig& cfg) {
  ConfigValidation v;
  auto error = [&](const std::string& msg) {
    v.ok = false;
    v.errors.push_back(msg);
  };

  if (cfg.retry.max_retries < 0) error("retry_max must be >= 0");
  if (cfg.retry.initial_delay.count() < 0) error("retry_initial_ms must be >= 0");
  if (cfg.retry.max_delay < cfg.retry.initial_delay) error("retry_max_ms must be >= retry_initial_ms");
  if (cfg.retry.multiplier < 1.0) error("retry_multiplier must be >= 1");

  if (cfg.breaker.failure_threshold < 1) error("breaker_failures must be >= 1");
  if (cfg.breaker.success_threshold < 1) error("breaker_successes must be >= 1");
  if (cfg.breaker.half_open_max_calls < 1) error("breaker_half_open_calls must be >= 1");
  if (cfg.breaker.timeout.count() < 0) error("breaker_timeout_ms must be >= 0");

  if (cfg.monitor.max_cpu_percent <= 0.0) error("max_cpu_percent must be > 0");
  if (cfg.monitor.max_memory_mb <= 0) error("max_memory_mb must be > 0");
  if (cfg.monitor.interval.count() <= 0) error("monitor_interval_ms must be > 0");

  if (cfg.default_tenant.max_queue_size < 0) error("default_max_tasks must be >= 0");
  if (cfg.default_tenant.rate_limit < 0.0) error("default_rate_limit must be >= 0");
  if (cfg.rate_limit_burst < 1) error("rate_limit_burst must be >= 1");
  if (cfg.notification_capacity == 0) error("notification_capacity must be > 0");

  const unsigned cores = std::thread::hardware_concurrency();
  if (cores > 0 && cfg.monitor.max_cpu_percent > 100.0 * cores) {
    v.warnings.push_back("max_cpu_percent exceeds " + std::to_string(cores) +
                         " cores and can never trigger");
  }
  if (!cfg.monitor.cpu_throttle && !cfg.monitor.memory_throttle) {
    v.warnings.push_back("both throttles disabled; intake is never deferred");
  }
  if (cfg.default_tenant.max_queue_size == 0) {
    v.warnings.push_back("default_max_tasks is 0; unregistered tenants are unlimited");
  }
  if (cfg.dlq_enabled && cfg.dlq_max_size == 0) {
    v.warnings.push_back("dlq_max_size is 0; the dead-letter queue is unbounded");
  }
  return v;
}

std::string ConfigValidation::to_json() const {
  return std::string("{\"ok\":") + (ok ? "true" : "false") + ",\"errors\":" + json_string_array(errors) +
         ",\"warnings\":" + json_string_array(warnings) + "}";
}

std::string config_to_json(const ControlPlaneConfig& cfg) {
  std::ostringstream o;
  o << "{"
    << "\"max_cpu_percent\":" << jsonlite::format_double(cfg.monitor.max_cpu_percent)
    << ",\"max_memory_mb\":" << cfg.monitor.max_memory_mb
    << ",\"cpu_throttle\":" << (cfg.monitor.cpu_throttle ? "true" : "false")
    << ",\"memory_throttle\":" << (cfg.monitor.memory_throttle ? "true" : "false")
    << ",\"monitor_interval_ms\":" << cfg.monitor.interval.count()
    << ",\"retry_enabled\":" << (cfg.retry_enabled ? "true" : "false")
    << ",\"retry_max\":" << cfg.retry.max_retries
    << ",\"retry_initial_ms\":" << cfg.retry.initial_delay.count()
    << ",\"retry_max_ms\":" << cfg.retry.max_delay.count()
    << ",\"retry_multiplier\":" << jsonlite::format_double(cfg.retry.multiplier)
    << ",\"retry_jitter\":" << (cfg.retry.jitter ? "true" : "false")
    << ",\"breaker_failures\":" << cfg.breaker.failure_threshold
    << ",\"breaker_successes\":" << cfg.breaker.success_threshold
    << ",\"breaker_timeout_ms\":" << cfg.breaker.timeout.count()
    << ",\"breaker_half_open_calls\":" << cfg.breaker.half_open_max_calls
    << ",\"default_max_tasks\":" << cfg.default_tenant.max_queue_size
    << ",\"default_priority\":" << cfg.default_tenant.priority
    << ",\"default_rate_limit\":" << jsonlite::format_double(cfg.default_tenant.rate_limit)
    << ",\"rate_limit_burst\":" << cfg.rate_limit_burst
    << ",\"dlq_enabled\":" << (cfg.dlq_enabled ? "true" : "false")
    << ",\"dlq_max_size\":" << cfg.dlq_max_size
    << ",\"dlq_retention_ms\":" << cfg.dlq_retention.count()
    << ",\"dlq_compression\":" << (cfg.dlq_compression ? "true" : "false")
    << ",\"notification_capacity\":" << cfg.notification_capacity
    << "}";
  return o.str();
}

}  // namespace warden
