#include "warden/circuit_breaker.hpp"

#include <algorithm>
#include <exception>

#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"

namespace warden {

std::string to_string(CircuitState s) {
  switch (s) {
    case CircuitState::closed: return "closed";
    case CircuitState::open: return "open";
    case CircuitState::half_open: return "half-open";
  }
  return "closed";
}

std::string CircuitBreakerMetrics::to_json() const {
  std::string out = "{\"name\":\"";
  out += jsonlite::escape(name);
  out += "\",\"state\":\"";
  out += to_string(state);
  out += "\",\"total_failures\":";
  out += std::to_string(total_failures);
  out += ",\"total_successes\":";
  out += std::to_string(total_successes);
  out += ",\"rejected\":";
  out += std::to_string(rejected);
  out += ",\"consecutive_failures\":";
  out += std::to_string(consecutive_failures);
  out += ",\"successes\":";
  out += std::to_string(successes);
  out += ",\"half_open_calls\":";
  out += std::to_string(half_open_calls);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// CircuitBreaker
// ---------------------------------------------------------------------------

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config,
                               std::shared_ptr<EventDispatcher> dispatcher)
    : config_(std::move(config)), dispatcher_(std::move(dispatcher)) {
  if (config_.on_state_change && !dispatcher_) {
    dispatcher_ = std::make_shared<EventDispatcher>();
  }
}

Status CircuitBreaker::call(const std::function<Status()>& fn) {
  const Admission adm = admit();
  if (!adm.status.ok()) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    return adm.status;
  }

  // A throwing fn is a failure like any other; the in-flight slot still ends.
  Status result;
  try {
    result = fn();
  } catch (const std::exception& e) {
    result = Status::failure(ErrorCode::execution_failed, e.what());
  } catch (...) {
    result = Status::failure(ErrorCode::execution_failed, "non-standard exception");
  }
  if (result.ok()) {
    on_success(adm);
  } else {
    on_failure(adm);
  }
  return result;
}

CircuitBreaker::Admission CircuitBreaker::admit() {
  Admission adm;
  if (state_.load(std::memory_order_acquire) == CircuitState::closed) {
    adm.state = CircuitState::closed;
    return adm;
  }

  std::optional<Transition> moved;
  {
    std::lock_guard<std::mutex> lock(mu_);
    CircuitState s = state_.load(std::memory_order_relaxed);
    if (s == CircuitState::open) {
      if (Clock::now() - last_failure_ < config_.timeout) {
        adm.status = Status::failure(ErrorCode::circuit_open, config_.name);
        adm.state = CircuitState::open;
        return adm;
      }
      // Cooldown over: this same call is re-evaluated as a half-open trial call.
      moved = transition_locked(CircuitState::half_open);
      s = CircuitState::half_open;
    }

    adm.state = s;
    if (s == CircuitState::half_open) {
      if (half_open_calls_ >= std::max(1, config_.half_open_max_calls)) {
        adm.status = Status::failure(ErrorCode::too_many_requests, config_.name);
      } else {
        ++half_open_calls_;
        adm.epoch = epoch_;
      }
    }
  }
  notify(moved);
  return adm;
}

void CircuitBreaker::on_success(const Admission& adm) {
  total_successes_.fetch_add(1, std::memory_order_relaxed);
  if (adm.state == CircuitState::closed) {
    consecutive_failures_.store(0, std::memory_order_relaxed);
    return;
  }

  std::optional<Transition> moved;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (adm.epoch != epoch_) return;  // phase already ended
    --half_open_calls_;
    ++successes_;
    consecutive_failures_.store(0, std::memory_order_relaxed);
    if (successes_ >= std::max(1, config_.success_threshold)) {
      moved = transition_locked(CircuitState::closed);
    }
  }
  notify(moved);
}

void CircuitBreaker::on_failure(const Admission& adm) {
  total_failures_.fetch_add(1, std::memory_order_relaxed);

  std::optional<Transition> moved;
  if (adm.state == CircuitState::closed) {
    const int fails = consecutive_failures_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (fails < std::max(1, config_.failure_threshold)) return;
    std::lock_guard<std::mutex> lock(mu_);
    if (state_.load(std::memory_order_relaxed) != CircuitState::closed) return;
    successes_ = 0;
    moved = transition_locked(CircuitState::open);
  } else {
    std::lock_guard<std::mutex> lock(mu_);
    if (adm.epoch != epoch_) return;
    --half_open_calls_;
    moved = transition_locked(CircuitState::open);
  }
  notify(moved);
}

std::optional<CircuitBreaker::Transition> CircuitBreaker::transition_locked(CircuitState to) {
  const CircuitState from = state_.load(std::memory_order_relaxed);
  if (from == to) return std::nullopt;

  ++epoch_;
  switch (to) {
    case CircuitState::closed:
      consecutive_failures_.store(0, std::memory_order_relaxed);
      successes_ = 0;
      half_open_calls_ = 0;
      break;
    case CircuitState::open:
      successes_ = 0;
      last_failure_ = Clock::now();
      break;
    case CircuitState::half_open:
      consecutive_failures_.store(0, std::memory_order_relaxed);
      successes_ = 0;
      half_open_calls_ = 0;
      break;
  }
  state_.store(to, std::memory_order_release);
  return Transition{from, to};
}

void CircuitBreaker::notify(const std::optional<Transition>& t) {
  if (!t) return;

  ControlEvent ev;
  ev.kind = EventKind::breaker_state_change;
  ev.severity = t->to == CircuitState::open ? Severity::warn : Severity::info;
  ev.task_type = config_.name;
  ev.detail = to_string(t->from) + "->" + to_string(t->to);
  emit_control_event(ev);

  if (config_.on_state_change && dispatcher_) {
    dispatcher_->post([cb = config_.on_state_change, name = config_.name, from = t->from,
                       to = t->to] { cb(name, from, to); });
  }
}

void CircuitBreaker::reset() {
  std::optional<Transition> moved;
  {
    std::lock_guard<std::mutex> lock(mu_);
    moved = transition_locked(CircuitState::closed);
    if (!moved) ++epoch_;  // orphan any in-flight trial calls even without a state change
    successes_ = 0;
    half_open_calls_ = 0;
    consecutive_failures_.store(0, std::memory_order_relaxed);
    total_failures_.store(0, std::memory_order_relaxed);
    total_successes_.store(0, std::memory_order_relaxed);
    rejected_.store(0, std::memory_order_relaxed);
  }
  notify(moved);
}

CircuitBreakerMetrics CircuitBreaker::metrics() const {
  CircuitBreakerMetrics m;
  m.name = config_.name;
  m.state = state();
  m.total_failures = total_failures_.load(std::memory_order_relaxed);
  m.total_successes = total_successes_.load(std::memory_order_relaxed);
  m.rejected = rejected_.load(std::memory_order_relaxed);
  m.consecutive_failures = consecutive_failures_.load(std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lock(mu_);
    m.successes = successes_;
    m.half_open_calls = half_open_calls_;
  }
  return m;
}

// ---------------------------------------------------------------------------
// CircuitBreakerRegistry
// ---------------------------------------------------------------------------

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerConfig config_template,
                                               std::shared_ptr<EventDispatcher> dispatcher)
    : template_(std::move(config_template)), dispatcher_(std::move(dispatcher)) {}

CircuitBreakerPtr CircuitBreakerRegistry::get(const std::string& key) {
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = breakers_.find(key);
    if (it != breakers_.end()) return it->second;
  }
  std::unique_lock<std::shared_mutex> lock(mu_);
  auto [it, inserted] = breakers_.try_emplace(key, nullptr);
  if (inserted) {
    CircuitBreakerConfig cfg = template_;
    cfg.name = key;
    it->second = std::make_shared<CircuitBreaker>(std::move(cfg), dispatcher_);
  }
  return it->second;
}

std::map<std::string, CircuitBreakerPtr> CircuitBreakerRegistry::all() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return std::map<std::string, CircuitBreakerPtr>(breakers_.begin(), breakers_.end());
}

std::vector<CircuitBreakerMetrics> CircuitBreakerRegistry::metrics() const {
  std::vector<CircuitBreakerMetrics> out;
  for (const auto& [key, breaker] : all()) out.push_back(breaker->metrics());
  return out;
}

size_t CircuitBreakerRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return breakers_.size();
}

std::string CircuitBreakerRegistry::to_json() const {
  std::string out = "[";
  bool first = true;
  for (const auto& m : metrics()) {
    if (!first) out += ',';
    first = false;
    out += m.to_json();
  }
  out += ']';
  return out;
}

}  // namespace warden
