#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "warden/admission.hpp"
#include "warden/circuit_breaker.hpp"
#include "warden/config.hpp"
#include "warden/dlq.hpp"
#include "warden/event_dispatcher.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/rate_limiter.hpp"
#include "warden/resource_monitor.hpp"
#include "warden/resource_quota.hpp"
#include "warden/retry.hpp"
#include "warden/stats.hpp"
#include "warden/task_context.hpp"
#include "warden/tenant.hpp"
#include "warden/tenant_scheduler.hpp"
#include "warden/tracing.hpp"
#include "warden/version.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Polls pred every millisecond until it holds or the timeout passes.
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

warden::TenantConfig tenant(const std::string& id, int max_queue, int priority = 0) {
  warden::TenantConfig c;
  c.tenant_id = id;
  c.max_queue_size = max_queue;
  c.priority = priority;
  return c;
}

warden::RetryPolicy fast_policy(int max_retries) {
  warden::RetryPolicy p;
  p.max_retries = max_retries;
  p.initial_delay = 1ms;
  p.max_delay = 5ms;
  p.jitter = false;
  return p;
}

// Deterministic sampler: every sample() advances CPU time by cpu_step and
// reports memory as given. Both knobs are shared with the test body.
struct SamplerKnobs {
  std::atomic<int64_t> cpu_step_ns{0};
  std::atomic<int64_t> memory_bytes{0};
};

class FakeSampler : public warden::ResourceSampler {
 public:
  explicit FakeSampler(std::shared_ptr<SamplerKnobs> knobs) : knobs_(std::move(knobs)) {}

  warden::ResourceSample sample() override {
    const int64_t cpu = cpu_ns_.fetch_add(knobs_->cpu_step_ns.load()) + knobs_->cpu_step_ns.load();
    warden::ResourceSample s;
    s.cpu_time = std::chrono::nanoseconds(cpu);
    s.memory_bytes = knobs_->memory_bytes.load();
    return s;
  }

 private:
  std::shared_ptr<SamplerKnobs> knobs_;
  std::atomic<int64_t> cpu_ns_{0};
};

// Event hook capture. The hook is a plain function pointer, so captured
// events live in a process-wide buffer.
std::mutex g_events_mu;
std::vector<warden::ControlEvent> g_events;

void capture_event(const warden::ControlEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

size_t captured(warden::EventKind kind) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  size_t n = 0;
  for (const auto& e : g_events)
    if (e.kind == kind) ++n;
  return n;
}

void reset_capture() {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.clear();
}

// ============================================================================
// Failure taxonomy
// ============================================================================

void test_error_taxonomy() {
  using warden::ErrorCode;
  expect(warden::is_admission_rejection(ErrorCode::quota_exceeded), "quota_exceeded is admission");
  expect(warden::is_admission_rejection(ErrorCode::tenant_not_found), "tenant_not_found is admission");
  expect(warden::is_admission_rejection(ErrorCode::throttled), "throttled is admission");
  expect(warden::is_protection_rejection(ErrorCode::circuit_open), "circuit_open is protection");
  expect(warden::is_protection_rejection(ErrorCode::too_many_requests), "too_many_requests is protection");
  expect(warden::is_cancellation(ErrorCode::cancelled), "cancelled is cancellation");
  expect(warden::is_execution_failure(ErrorCode::execution_failed), "execution_failed is execution");
  expect(!warden::is_execution_failure(ErrorCode::circuit_open), "circuit_open is not execution");
  expect(!warden::is_execution_failure(ErrorCode::cancelled), "cancelled is not execution");
  expect(!warden::is_execution_failure(ErrorCode::none), "none is not a failure");
  expect(warden::to_string(ErrorCode::none).empty(), "none renders empty");
  expect(warden::to_string(ErrorCode::circuit_open) == "circuit_open", "stable wire name");
}

void test_status_message() {
  auto s = warden::Status::failure(warden::ErrorCode::quota_exceeded, "tenant t1");
  expect(!s.ok(), "failure is not ok");
  expect(s.message() == "quota_exceeded: tenant t1", "message joins code and detail");
  expect(warden::Status::success().message() == "ok", "success message");
  expect(warden::Status::failure(warden::ErrorCode::cancelled).message() == "cancelled",
         "message without detail");
}

// ============================================================================
// ResourceQuota
// ============================================================================

void test_quota_never_exceeds_limit() {
  warden::ResourceQuota q(0, 0, 3);
  expect(q.check_and_reserve(), "reserve 1");
  expect(q.check_and_reserve(), "reserve 2");
  expect(q.check_and_reserve(), "reserve 3");
  expect(!q.check_and_reserve(), "reserve 4 must fail");
  expect(q.release(), "release 1");
  expect(q.check_and_reserve(), "reserve after release");
  expect(q.usage().tasks_used == 3, "three held");
}

void test_quota_concurrent_reservations() {
  constexpr int kLimit = 7;
  warden::ResourceQuota q(0, 0, kLimit);
  std::atomic<int> held{0};
  std::atomic<int> peak{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 2000; ++i) {
        if (!q.check_and_reserve()) continue;
        const int now = held.fetch_add(1) + 1;
        int p = peak.load();
        while (now > p && !peak.compare_exchange_weak(p, now)) {
        }
        held.fetch_sub(1);
        q.release();
      }
    });
  }
  for (auto& t : threads) t.join();
  expect(peak.load() <= kLimit, "concurrent reservations must never exceed the limit");
  expect(q.usage().tasks_used == 0, "every reservation released exactly once");
}

void test_quota_unlimited() {
  warden::ResourceQuota q(0, 0, 0);
  for (int i = 0; i < 10000; ++i) expect(q.check_and_reserve(), "limit 0 is unlimited");
  expect(q.usage().tasks_used == 10000, "all reservations counted");
  expect(q.available_tasks() == -1, "unlimited reports -1 available");
}

void test_quota_release_floor() {
  warden::ResourceQuota q(0, 0, 2);
  expect(!q.release(), "release with nothing held reports false");
  expect(q.usage().tasks_used == 0, "never below zero");
}

void test_quota_record_memory_overwrites() {
  warden::ResourceQuota q(0, 0, 0);
  q.record_memory(512);
  q.record_memory(256);
  expect(q.usage().memory_used == 256, "record_memory is last-write-wins");
  q.record_cpu(10);
  q.record_cpu(5);
  expect(q.usage().cpu_used == 15, "record_cpu accumulates");
}

// ============================================================================
// TenantRegistry
// ============================================================================

void test_registry_rejects_empty_id() {
  warden::TenantRegistry reg(tenant("", 100));
  auto s = reg.register_tenant(tenant("", 5));
  expect(s.code == warden::ErrorCode::invalid_config, "empty id is invalid_config");
  expect(reg.size() == 0, "nothing stored");
}

void test_registry_unknown_lookup_not_stored() {
  warden::TenantRegistry reg(tenant("", 100));
  for (int i = 0; i < 50; ++i) {
    auto info = reg.get_tenant("ghost-" + std::to_string(i));
    expect(info != nullptr, "synthesized record");
    expect(info->config.max_queue_size == 100, "synthesized from defaults");
  }
  expect(reg.size() == 0, "synthesized records are not stored");
  expect(reg.find("ghost-1") == nullptr, "find sees stored records only");
}

void test_registry_lazy_adoption() {
  warden::TenantRegistry reg(tenant("", 1));
  auto r = reg.check_quota("implicit");
  expect(r.ok() && r.value, "unknown tenant adopts the default quota");
  expect(reg.size() == 1, "implicit record stored on first quota check");
  expect(!reg.is_registered("implicit"), "implicit is not an explicit registration");
  auto r2 = reg.check_quota("implicit");
  expect(r2.ok() && !r2.value, "implicit quota is enforced");
  expect(reg.release_quota("implicit").ok(), "implicit quota releasable");
}

void test_registry_release_unknown_fails() {
  warden::TenantRegistry reg(tenant("", 10));
  auto s = reg.release_quota("never-seen");
  expect(s.code == warden::ErrorCode::tenant_not_found, "release on unknown tenant");
  auto e = reg.check_quota("");
  expect(e.status.code == warden::ErrorCode::tenant_not_found, "empty id never adopted");
}

void test_registry_end_to_end_quota() {
  warden::TenantRegistry reg(tenant("", 100));
  expect(reg.register_tenant(tenant("t1", 2)).ok(), "register t1");
  auto a = reg.check_quota("t1");
  auto b = reg.check_quota("t1");
  auto c = reg.check_quota("t1");
  expect(a.ok() && a.value, "first admitted");
  expect(b.ok() && b.value, "second admitted");
  expect(c.ok() && !c.value, "third rejected");
  expect(reg.release_quota("t1").ok(), "release one");
  auto d = reg.check_quota("t1");
  expect(d.ok() && d.value, "capacity restored after release");
}

void test_registry_stats_and_replace() {
  warden::TenantRegistry reg(tenant("", 100));
  expect(reg.register_tenant(tenant("t1", 5)).ok(), "register");
  expect(reg.record_task_submitted("t1").ok(), "submitted");
  expect(reg.record_task_completed("t1", 40, 1024).ok(), "completed");
  expect(reg.record_task_completed("t1", 2, 512).ok(), "completed again");
  expect(reg.record_task_rejected("t1").ok(), "rejected");
  auto st = reg.tenant_stats("t1");
  expect(st.ok(), "stats available");
  expect(st.value.tasks_submitted == 1 && st.value.tasks_completed == 2, "counts");
  expect(st.value.tasks_rejected == 1, "rejected count");
  expect(st.value.total_cpu_ms == 42, "cpu accumulates");
  expect(st.value.last_memory_bytes == 512, "memory is last sample");
  expect(reg.find("t1")->quota.usage().memory_used == 512, "quota memory overwritten");

  expect(reg.register_tenant(tenant("t1", 9, 3)).ok(), "re-register");
  auto fresh = reg.tenant_stats("t1");
  expect(fresh.value.tasks_submitted == 0, "re-register starts fresh stats");
  expect(reg.find("t1")->config.priority == 3, "new config in effect");
}

void test_registry_all_tenants_and_remove() {
  warden::TenantRegistry reg(tenant("", 100));
  expect(reg.register_tenant(tenant("b", 1)).ok(), "b");
  expect(reg.register_tenant(tenant("a", 1)).ok(), "a");
  auto all = reg.all_tenants();
  expect(all.size() == 2 && all.count("a") == 1 && all.count("b") == 1, "all tenants listed");
  expect(reg.remove_tenant("a"), "remove a");
  expect(!reg.remove_tenant("a"), "second remove is a no-op");
  expect(reg.size() == 1, "one left");
  const std::string js = reg.to_json();
  expect(js.find("\"b\"") != std::string::npos, "to_json lists b");
}

void test_registry_double_release_fails() {
  warden::TenantRegistry reg(tenant("", 100));
  expect(reg.register_tenant(tenant("t1", 2)).ok(), "register");
  expect(reg.check_quota("t1").value, "reserve one");
  expect(reg.release_quota("t1").ok(), "first release");
  auto again = reg.release_quota("t1");
  expect(again.code == warden::ErrorCode::not_found, "second release reports nothing held");
  expect(reg.find("t1")->quota.usage().tasks_used == 0, "usage stays at zero");
}

void test_registry_reservation_survives_reregistration() {
  warden::TenantRegistry reg(tenant("", 100));
  expect(reg.register_tenant(tenant("t1", 1)).ok(), "register");
  auto held = reg.reserve_quota("t1");
  expect(held.ok() && held.value != nullptr, "reserved on the first record");
  auto full = reg.reserve_quota("t1");
  expect(full.status.code == warden::ErrorCode::quota_exceeded && !full.value, "exhausted");

  expect(reg.register_tenant(tenant("t1", 1)).ok(), "re-register");
  expect(reg.check_quota("t1").value, "fresh record has its own slot");
  expect(held.value->release(), "old task releases on its own record");
  expect(!reg.check_quota("t1").value, "new record still holds its one slot");
  expect(reg.find("t1")->quota.usage().tasks_used == 1, "new record untouched by the old release");
}

void test_registry_prune_idle_implicit() {
  warden::TenantRegistry reg(tenant("", 5));
  expect(reg.register_tenant(tenant("named", 5)).ok(), "explicit");
  expect(reg.check_quota("busy").value, "implicit with a task in flight");
  expect(reg.check_quota("idle").value, "implicit");
  expect(reg.release_quota("idle").ok(), "idle finished");
  auto pruned = reg.prune_idle_implicit();
  expect(pruned.size() == 1 && pruned[0] == "idle", "only the idle implicit record goes");
  expect(reg.size() == 2, "explicit and busy records stay");
  expect(reg.find("busy") != nullptr && reg.find("named") != nullptr, "kept records");
}

// ============================================================================
// TenantScheduler
// ============================================================================

warden::TenantInfoPtr info(const std::string& id, int priority) {
  return std::make_shared<warden::TenantInfo>(tenant(id, 0, priority), false);
}

void test_scheduler_empty() {
  warden::TenantScheduler s;
  expect(s.schedule() == nullptr, "empty scheduler returns nullptr");
}

void test_scheduler_round_robin() {
  warden::TenantScheduler s;
  s.add_tenant(info("A", 0));
  s.add_tenant(info("B", 0));
  expect(s.schedule()->id() == "A", "first A");
  expect(s.schedule()->id() == "B", "then B");
  expect(s.schedule()->id() == "A", "then A again");
  expect(s.schedule()->id() == "B", "then B again");
}

void test_scheduler_strict_priority() {
  warden::TenantScheduler s;
  s.add_tenant(info("low", 0));
  s.add_tenant(info("high", 10));
  for (int i = 0; i < 10; ++i) expect(s.schedule()->id() == "high", "high always wins");
  expect(s.remove_tenant("high"), "remove high");
  expect(s.schedule()->id() == "low", "low runs once high is gone");
  auto prios = s.priorities();
  expect(prios.size() == 1 && prios[0] == 0, "empty tier erased");
}

void test_scheduler_move_between_tiers() {
  warden::TenantScheduler s;
  s.add_tenant(info("A", 0));
  s.add_tenant(info("B", 0));
  s.add_tenant(info("A", 5));
  expect(s.size() == 2, "a tenant lives in one tier");
  expect(s.schedule()->id() == "A", "A moved to the higher tier");
  expect(s.schedule()->id() == "A", "A alone in its tier");
  auto prios = s.priorities();
  expect(prios.size() == 2 && prios[0] == 5 && prios[1] == 0, "priorities highest first");
}

void test_scheduler_remove_keeps_rotation() {
  warden::TenantScheduler s;
  s.add_tenant(info("A", 0));
  s.add_tenant(info("B", 0));
  s.add_tenant(info("C", 0));
  expect(s.schedule()->id() == "A", "A");
  expect(s.remove_tenant("A"), "remove A");
  expect(s.schedule()->id() == "B", "rotation continues with B");
  expect(s.schedule()->id() == "C", "then C");
  expect(s.schedule()->id() == "B", "wraps to B");
}

// ============================================================================
// CircuitBreaker
// ============================================================================

warden::CircuitBreakerConfig breaker_config(int failures, int successes,
                                            std::chrono::milliseconds timeout) {
  warden::CircuitBreakerConfig c;
  c.name = "downstream";
  c.failure_threshold = failures;
  c.success_threshold = successes;
  c.timeout = timeout;
  c.half_open_max_calls = 1;
  return c;
}

const auto kFail = [] { return warden::Status::failure(warden::ErrorCode::execution_failed, "boom"); };
const auto kOk = [] { return warden::Status::success(); };

void test_breaker_opens_after_threshold() {
  warden::CircuitBreaker cb(breaker_config(3, 2, 10s));
  cb.call(kFail);
  cb.call(kFail);
  expect(cb.state() == warden::CircuitState::closed, "still closed below threshold");
  cb.call(kFail);
  expect(cb.state() == warden::CircuitState::open, "open at threshold");

  int invoked = 0;
  auto s = cb.call([&] {
    ++invoked;
    return warden::Status::success();
  });
  expect(s.code == warden::ErrorCode::circuit_open, "open rejects with circuit_open");
  expect(invoked == 0, "open breaker does not invoke fn");
  expect(cb.metrics().rejected == 1, "rejection counted");
}

void test_breaker_success_resets_failures() {
  warden::CircuitBreaker cb(breaker_config(3, 2, 10s));
  cb.call(kFail);
  cb.call(kFail);
  cb.call(kOk);
  cb.call(kFail);
  cb.call(kFail);
  expect(cb.state() == warden::CircuitState::closed, "failures must be consecutive");
}

void test_breaker_half_open_recovery() {
  warden::CircuitBreaker cb(breaker_config(1, 2, 30ms));
  cb.call(kFail);
  expect(cb.state() == warden::CircuitState::open, "open");
  std::this_thread::sleep_for(50ms);

  int invoked = 0;
  auto s = cb.call([&] {
    ++invoked;
    return warden::Status::success();
  });
  expect(s.ok() && invoked == 1, "call after timeout is actually attempted");
  expect(cb.state() == warden::CircuitState::half_open, "half-open after the first trial call");
  cb.call(kOk);
  expect(cb.state() == warden::CircuitState::closed, "closed after success threshold");
}

void test_breaker_half_open_failure_reopens() {
  warden::CircuitBreaker cb(breaker_config(1, 2, 30ms));
  cb.call(kFail);
  std::this_thread::sleep_for(50ms);
  auto s = cb.call(kFail);
  expect(s.code == warden::ErrorCode::execution_failed, "fn's error returned as is");
  expect(cb.state() == warden::CircuitState::open, "half-open failure reopens");
  auto again = cb.call(kOk);
  expect(again.code == warden::ErrorCode::circuit_open, "fresh cooldown after reopening");
}

void test_breaker_half_open_trial_limit() {
  warden::CircuitBreaker cb(breaker_config(1, 1, 20ms));
  cb.call(kFail);
  std::this_thread::sleep_for(40ms);

  std::atomic<bool> in_trial{false};
  std::atomic<bool> release{false};
  std::thread trial_caller([&] {
    cb.call([&] {
      in_trial = true;
      while (!release) std::this_thread::sleep_for(1ms);
      return warden::Status::success();
    });
  });
  expect(wait_until([&] { return in_trial.load(); }, 2000ms), "trial call started");

  int invoked = 0;
  auto s = cb.call([&] {
    ++invoked;
    return warden::Status::success();
  });
  expect(s.code == warden::ErrorCode::too_many_requests, "second trial call refused");
  expect(invoked == 0, "refused trial call not invoked");

  release = true;
  trial_caller.join();
  expect(cb.state() == warden::CircuitState::closed, "trial success closes");
}

std::mutex g_transitions_mu;
std::vector<std::string> g_transitions;

void test_breaker_throwing_half_open_call_reopens() {
  warden::CircuitBreaker cb(breaker_config(1, 1, 10ms));
  cb.call(kFail);
  std::this_thread::sleep_for(20ms);

  auto s = cb.call([]() -> warden::Status { throw std::runtime_error("half-open call blew up"); });
  expect(s.code == warden::ErrorCode::execution_failed, "throw becomes execution_failed");
  expect(s.detail == "half-open call blew up", "what() kept as detail");
  expect(cb.state() == warden::CircuitState::open, "failed half-open call reopens");
  expect(cb.metrics().half_open_calls == 0, "half-open slot freed");

  std::this_thread::sleep_for(20ms);
  expect(cb.call(kOk).ok(), "next call admitted after cooldown");
  expect(cb.state() == warden::CircuitState::closed, "recovers");
}

void test_breaker_non_std_throw_counts_as_failure() {
  warden::CircuitBreaker cb(breaker_config(1, 1, 10s));
  auto s = cb.call([]() -> warden::Status { throw 7; });
  expect(s.code == warden::ErrorCode::execution_failed, "non-standard throw converted");
  expect(cb.state() == warden::CircuitState::open, "counted toward the threshold");
}

void test_breaker_state_callback_async() {
  auto dispatcher = std::make_shared<warden::EventDispatcher>();
  auto cfg = breaker_config(1, 1, 20ms);
  cfg.on_state_change = [](const std::string& name, warden::CircuitState from, warden::CircuitState to) {
    std::lock_guard<std::mutex> lk(g_transitions_mu);
    g_transitions.push_back(name + ":" + warden::to_string(from) + "->" + warden::to_string(to));
  };
  warden::CircuitBreaker cb(cfg, dispatcher);
  cb.call(kFail);
  std::this_thread::sleep_for(40ms);
  cb.call(kOk);
  dispatcher->flush();

  std::lock_guard<std::mutex> lk(g_transitions_mu);
  expect(g_transitions.size() == 3, "three transitions delivered");
  expect(g_transitions[0] == "downstream:closed->open", "closed->open");
  expect(g_transitions[1] == "downstream:open->half-open", "open->half-open");
  expect(g_transitions[2] == "downstream:half-open->closed", "half-open->closed");
}

void test_breaker_reset() {
  warden::CircuitBreaker cb(breaker_config(1, 1, 10s));
  cb.call(kFail);
  expect(cb.state() == warden::CircuitState::open, "open");
  cb.reset();
  expect(cb.state() == warden::CircuitState::closed, "reset closes");
  expect(cb.call(kOk).ok(), "calls pass after reset");
}

void test_breaker_registry() {
  auto dispatcher = std::make_shared<warden::EventDispatcher>();
  warden::CircuitBreakerRegistry reg(breaker_config(2, 1, 10s), dispatcher);
  auto a = reg.get("payments");
  auto b = reg.get("payments");
  auto c = reg.get("search");
  expect(a == b, "same key, same breaker");
  expect(a != c, "different keys are independent");
  expect(a->name() == "payments", "key becomes the breaker name");
  a->call(kFail);
  a->call(kFail);
  expect(a->state() == warden::CircuitState::open, "payments open");
  expect(c->state() == warden::CircuitState::closed, "search unaffected");
  expect(reg.size() == 2, "two breakers");
  expect(reg.to_json().find("\"payments\"") != std::string::npos, "registry json lists key");
}

// ============================================================================
// RetryExecutor
// ============================================================================

void test_retry_exhaustion_count() {
  warden::RetryExecutor ex;
  warden::TaskContext ctx("t1");
  int calls = 0;
  auto s = ex.execute(ctx, fast_policy(3), [&] {
    ++calls;
    return warden::Status::failure(warden::ErrorCode::execution_failed, "attempt " + std::to_string(calls));
  });
  expect(calls == 4, "maxRetries + 1 attempts");
  expect(s.detail == "attempt 4", "last error returned unmodified");
  expect(ex.metrics().failed_retries == 1, "exhaustion counted");
}

void test_retry_success_on_attempt_k() {
  warden::RetryExecutor ex;
  warden::TaskContext ctx("t1");
  int calls = 0;
  warden::RetryableTask record;
  record.id = "job-1";
  auto s = ex.execute(
      ctx, fast_policy(5),
      [&] {
        ++calls;
        if (calls < 3) return warden::Status::failure(warden::ErrorCode::execution_failed);
        return warden::Status::success();
      },
      &record);
  expect(s.ok(), "succeeds");
  expect(calls == 3, "invoked exactly k times");
  expect(record.attempts == 3, "record counts attempts");
  expect(record.errors.size() == 2, "record keeps failed attempts");
  expect(record.first_attempt <= record.last_attempt, "timestamps ordered");
  expect(ex.metrics().successful_retries == 1, "successful retry counted");
}

void test_retry_predicate_stops() {
  warden::RetryExecutor ex;
  warden::TaskContext ctx("t1");
  int calls = 0;
  auto s = ex.execute_if(
      ctx, fast_policy(5),
      [](const warden::Status& st) { return st.code != warden::ErrorCode::invalid_config; },
      [&] {
        ++calls;
        return warden::Status::failure(warden::ErrorCode::invalid_config, "permanent");
      });
  expect(calls == 1, "non-retryable error ends the sequence");
  expect(s.code == warden::ErrorCode::invalid_config, "error returned");
}

void test_retry_cancel_before_wait() {
  warden::RetryExecutor ex;
  warden::TaskContext ctx("t1");
  warden::RetryPolicy p;
  p.max_retries = 5;
  p.initial_delay = 10s;
  p.max_delay = 10s;
  p.jitter = false;
  int calls = 0;
  const auto start = std::chrono::steady_clock::now();
  auto s = ex.execute(ctx, p, [&] {
    ++calls;
    ctx.cancel();
    return warden::Status::failure(warden::ErrorCode::execution_failed);
  });
  expect(s.code == warden::ErrorCode::cancelled, "cancellation wins");
  expect(calls == 1, "no attempt after cancellation");
  expect(std::chrono::steady_clock::now() - start < 2s, "no backoff wait after cancellation");
}

void test_retry_cancel_mid_wait() {
  warden::RetryExecutor ex;
  warden::TaskContext ctx("t1");
  warden::RetryPolicy p;
  p.max_retries = 3;
  p.initial_delay = 10s;
  p.max_delay = 10s;
  p.jitter = false;
  int calls = 0;
  warden::TaskContext remote = ctx;
  std::thread canceller([&remote] {
    std::this_thread::sleep_for(50ms);
    remote.cancel();
  });
  const auto start = std::chrono::steady_clock::now();
  auto s = ex.execute(ctx, p, [&] {
    ++calls;
    return warden::Status::failure(warden::ErrorCode::execution_failed);
  });
  canceller.join();
  expect(s.code == warden::ErrorCode::cancelled, "cancelled mid-wait");
  expect(calls == 1, "next attempt never ran");
  expect(std::chrono::steady_clock::now() - start < 5s, "wait interrupted promptly");
  expect(ex.metrics().cancelled == 1, "cancellation counted");
}

void test_retry_deadline() {
  warden::RetryExecutor ex;
  warden::TaskContext ctx("t1");
  ctx.set_timeout(50ms);
  warden::RetryPolicy p;
  p.max_retries = 3;
  p.initial_delay = 10s;
  p.max_delay = 10s;
  p.jitter = false;
  const auto start = std::chrono::steady_clock::now();
  auto s = ex.execute(ctx, p, [] { return warden::Status::failure(warden::ErrorCode::execution_failed); });
  expect(s.code == warden::ErrorCode::cancelled, "deadline cancels the wait");
  expect(std::chrono::steady_clock::now() - start < 5s, "woke at the deadline");
}

void test_retry_with_result_keeps_last_value() {
  warden::RetryExecutor ex;
  warden::TaskContext ctx("t1");
  int calls = 0;
  auto r = ex.execute_with_result<int>(ctx, fast_policy(2), [&] {
    warden::Result<int> out;
    out.value = ++calls * 10;
    out.status = warden::Status::failure(warden::ErrorCode::execution_failed);
    return out;
  });
  expect(!r.ok(), "final failure");
  expect(r.value == 30, "last produced value preserved");

  int n = 0;
  auto ok = ex.execute_with_result<std::string>(ctx, fast_policy(2), [&] {
    warden::Result<std::string> out;
    if (++n == 2) out.value = "done";
    else out.status = warden::Status::failure(warden::ErrorCode::execution_failed);
    return out;
  });
  expect(ok.ok() && ok.value == "done", "value of the successful attempt");
}

void test_compute_backoff() {
  std::mt19937 rng(42);
  warden::RetryPolicy p;
  p.initial_delay = 100ms;
  p.max_delay = 1000ms;
  p.multiplier = 2.0;
  p.jitter = false;
  expect(warden::compute_backoff(p, 0, rng) == 100ms, "attempt 0");
  expect(warden::compute_backoff(p, 3, rng) == 800ms, "attempt 3");
  expect(warden::compute_backoff(p, 4, rng) == 1000ms, "capped at max_delay");

  p.jitter = true;
  for (int i = 0; i < 200; ++i) {
    auto d = warden::compute_backoff(p, 0, rng);
    expect(d >= 75ms && d <= 125ms, "jitter within +-25%");
  }
}

// ============================================================================
// ResourceMonitor
// ============================================================================

std::mutex g_throttle_mu;
std::vector<std::string> g_throttle_log;

void log_throttle(const std::string& what) {
  std::lock_guard<std::mutex> lk(g_throttle_mu);
  g_throttle_log.push_back(what);
}

void test_monitor_edge_triggered() {
  g_throttle_log.clear();
  auto knobs = std::make_shared<SamplerKnobs>();
  knobs->cpu_step_ns = 1000000000;  // 1s of CPU per sample
  knobs->memory_bytes = 10LL * 1024 * 1024;

  auto dispatcher = std::make_shared<warden::EventDispatcher>();
  warden::ResourceMonitorConfig cfg;
  cfg.max_cpu_percent = 80.0;
  cfg.max_memory_mb = 1024;
  cfg.on_throttle = [](const std::string& r) { log_throttle("throttle:" + r); };
  cfg.on_unthrottle = [](const std::string& r) { log_throttle("unthrottle:" + r); };
  warden::ResourceMonitor mon(cfg, dispatcher, std::make_unique<FakeSampler>(knobs));

  mon.tick();
  expect(mon.throttled(), "CPU over limit throttles");
  expect(mon.current_memory_mb() == 10, "memory sampled");
  mon.tick();
  mon.tick();
  knobs->cpu_step_ns = 0;
  mon.tick();
  expect(!mon.throttled(), "idle CPU clears the flag");
  mon.tick();
  dispatcher->flush();

  std::lock_guard<std::mutex> lk(g_throttle_mu);
  expect(g_throttle_log.size() == 2, "one callback per edge");
  expect(g_throttle_log[0] == "throttle:cpu", "throttle on cpu");
  expect(g_throttle_log[1] == "unthrottle:all", "unthrottle all");
}

void test_monitor_memory_and_both() {
  g_throttle_log.clear();
  auto knobs = std::make_shared<SamplerKnobs>();
  knobs->cpu_step_ns = 1000000000;
  knobs->memory_bytes = 2048LL * 1024 * 1024;
  auto dispatcher = std::make_shared<warden::EventDispatcher>();
  warden::ResourceMonitorConfig cfg;
  cfg.on_throttle = [](const std::string& r) { log_throttle(r); };
  warden::ResourceMonitor mon(cfg, dispatcher, std::make_unique<FakeSampler>(knobs));
  mon.tick();
  dispatcher->flush();
  {
    std::lock_guard<std::mutex> lk(g_throttle_mu);
    expect(g_throttle_log.size() == 2, "both resources reported");
    expect(g_throttle_log[0] == "cpu" && g_throttle_log[1] == "memory", "cpu then memory");
  }

  mon.set_throttle_enabled(false, false);
  mon.tick();
  expect(!mon.throttled(), "disabled throttles never hold the flag");
  auto m = mon.metrics();
  expect(m.memory_mb == 2048 && m.max_memory_mb == 1024, "metrics snapshot");
}

void test_monitor_loop_limits() {
  auto knobs = std::make_shared<SamplerKnobs>();
  knobs->cpu_step_ns = 1000000;  // 1ms of CPU per sample
  warden::ResourceMonitorConfig cfg;
  cfg.max_cpu_percent = 0.0;
  cfg.interval = 10ms;
  warden::ResourceMonitor mon(cfg, nullptr, std::make_unique<FakeSampler>(knobs));
  mon.start();
  expect(mon.running(), "running");
  expect(wait_until([&] { return mon.throttled(); }, 2000ms), "unreachable limit throttles");
  mon.set_limits(1e15, 1024);
  expect(wait_until([&] { return !mon.throttled(); }, 2000ms), "raised limit clears");
  mon.stop();
  expect(!mon.running(), "stopped");
}

void test_monitor_repeated_start_stop() {
  auto knobs = std::make_shared<SamplerKnobs>();
  warden::ResourceMonitorConfig cfg;
  cfg.interval = 5ms;
  warden::ResourceMonitor mon(cfg, nullptr, std::make_unique<FakeSampler>(knobs));
  for (int i = 0; i < 5; ++i) {
    mon.start();
    mon.start();
    mon.stop();
    mon.stop();
  }
  cfg.interval = 10s;
  warden::ResourceMonitor slow(cfg, nullptr, std::make_unique<FakeSampler>(knobs));
  slow.start();
  const auto t0 = std::chrono::steady_clock::now();
  slow.stop();
  expect(std::chrono::steady_clock::now() - t0 < 2s, "stop wakes the loop immediately");
}

void test_process_sampler() {
  warden::ProcessSampler s;
  auto a = s.sample();
  expect(a.cpu_time.count() >= 0, "cpu time non-negative");
  expect(a.memory_bytes >= 0, "memory non-negative");
}

// ============================================================================
// StatsCollector
// ============================================================================

void test_stats_average_latency() {
  warden::StatsCollector stats;
  auto empty = stats.snapshot(0);
  expect(empty.average_latency.count() == 0, "zero before first completion");
  stats.record_task_completion(10ms);
  stats.record_task_completion(30ms);
  stats.record_task_rejection();
  stats.inc_active_workers();
  stats.inc_active_workers();
  stats.dec_active_workers();
  auto snap = stats.snapshot(7);
  expect(snap.completed_tasks == 2, "completed");
  expect(snap.rejected_tasks == 1, "rejected");
  expect(snap.active_workers == 1, "active workers");
  expect(snap.queued_tasks == 7, "queue length passed through");
  expect(snap.average_latency == 20ms, "average latency");
  expect(snap.uptime.count() >= 0, "uptime");
}

void test_stats_json() {
  warden::StatsCollector stats;
  stats.record_task_completion(2ms);
  stats.record_error(warden::Status::failure(warden::ErrorCode::execution_failed, "db"));
  const std::string js = stats.to_json(3);
  expect(js.find("\"queued_tasks\":3") != std::string::npos, "queue length");
  expect(js.find("\"p99_ms\"") != std::string::npos, "latency percentiles");
  expect(js.find("execution_failed: db") != std::string::npos, "last error");
}

// ============================================================================
// EventDispatcher
// ============================================================================

void test_dispatcher_order() {
  warden::EventDispatcher d;
  std::vector<int> seen;
  for (int i = 0; i < 100; ++i) d.post([&seen, i] { seen.push_back(i); });
  d.flush();
  expect(seen.size() == 100, "all delivered");
  for (int i = 0; i < 100; ++i) expect(seen[static_cast<size_t>(i)] == i, "FIFO order");
  expect(d.delivered() == 100, "delivered counter");
}

void test_dispatcher_survives_throw() {
  warden::EventDispatcher d;
  std::atomic<int> after{0};
  d.post([] { throw std::runtime_error("subscriber bug"); });
  d.post([&] { after++; });
  d.flush();
  expect(d.failed() == 1, "throw counted");
  expect(after == 1, "worker keeps running");
}

void test_dispatcher_survives_non_std_throw() {
  warden::EventDispatcher d;
  std::atomic<int> after{0};
  d.post([] { throw 1; });
  d.post([&] { after++; });
  d.flush();
  expect(d.failed() == 1, "non-standard throw counted");
  expect(after == 1, "worker keeps running");
}

void test_dispatcher_drops_oldest() {
  warden::EventDispatcher d(2);
  std::atomic<bool> gate{false};
  std::atomic<bool> blocked{false};
  std::vector<int> seen;
  std::mutex mu;
  d.post([&] {
    blocked = true;
    while (!gate) std::this_thread::sleep_for(1ms);
  });
  expect(wait_until([&] { return blocked.load(); }, 2000ms), "worker busy");
  for (int i = 1; i <= 3; ++i) {
    d.post([&, i] {
      std::lock_guard<std::mutex> lk(mu);
      seen.push_back(i);
    });
  }
  expect(d.dropped() == 1, "one dropped at capacity");
  gate = true;
  d.flush();
  std::lock_guard<std::mutex> lk(mu);
  expect(seen.size() == 2 && seen[0] == 2 && seen[1] == 3, "oldest dropped, newest kept");
}

// ============================================================================
// Rate limiting
// ============================================================================

void test_token_bucket() {
  warden::TokenBucketLimiter tb(0.001, 3);
  expect(tb.allow() && tb.allow() && tb.allow(), "burst admitted");
  expect(!tb.allow(), "bucket empty");
  expect(tb.wait_time() > 0ns, "wait time reported");

  warden::TokenBucketLimiter fast(1000.0, 1);
  expect(fast.allow(), "first");
  expect(wait_until([&] { return fast.allow(); }, 1000ms), "refills over time");

  tb.set_rate(1000.0);
  expect(tb.rate() == 1000.0, "rate updated");
  expect(wait_until([&] { return tb.allow(); }, 1000ms), "new rate refills the bucket");
}

void test_sliding_window() {
  warden::SlidingWindowLimiter sw(2, 50ms);
  expect(sw.allow() && sw.allow(), "two in window");
  expect(!sw.allow(), "third refused");
  expect(sw.wait_time() > 0ns, "wait until oldest leaves");
  std::this_thread::sleep_for(70ms);
  expect(sw.allow(), "window slid");
}

void test_per_tenant_limiter() {
  warden::PerTenantRateLimiter limiter([](const std::string& id) -> std::unique_ptr<warden::RateLimiter> {
    if (id == "free") return std::make_unique<warden::NoopRateLimiter>();
    return std::make_unique<warden::TokenBucketLimiter>(0.001, 1);
  });
  expect(limiter.wait_time("nobody") == 0ns, "unknown tenant has no wait");
  expect(limiter.allow("a"), "a first");
  expect(!limiter.allow("a"), "a limited");
  expect(limiter.allow("b"), "b independent of a");
  for (int i = 0; i < 100; ++i) expect(limiter.allow("free"), "noop never limits");
  limiter.reset("a");
  expect(limiter.allow("a"), "reset rebuilds a full bucket");
  expect(limiter.size() == 3, "three limiters");
}

// ============================================================================
// Dead-letter queue
// ============================================================================

warden::DlqEntry sample_entry(const std::string& id, size_t payload_size = 16) {
  warden::DlqEntry e;
  e.task_id = id;
  e.payload = std::string(payload_size, 'x');
  e.failed_at_ms = 1700000000000ULL;
  e.failure_count = 4;
  e.errors = {"execution_failed: \"quoted\"", "line\nbreak"};
  return e;
}

void test_dlq_codec() {
  const auto e = sample_entry("task-\"1\"", 4096);
  const std::string enc = warden::encode_dlq_entry(e, true);
  auto d = warden::decode_dlq_entry(enc);
  expect(d.ok(), "decodes");
  expect(d.value.task_id == e.task_id, "task id survives escaping");
  expect(d.value.payload == e.payload, "payload");
  expect(d.value.failure_count == 4 && d.value.failed_at_ms == e.failed_at_ms, "counters");
  expect(d.value.errors == e.errors, "arbitrary error text survives");
#if defined(WARDEN_WITH_ZSTD)
  expect(enc.find("\"encoding\":\"zstd\"") != std::string::npos, "large payload compressed");
#endif
  expect(warden::jsonlite::get_u64(enc, "v", 0) == warden::version::DLQ_ENTRY_VERSION, "versioned");
}

void test_dlq_corruption_detected() {
  const std::string enc = warden::encode_dlq_entry(sample_entry("t"), false);
  std::string tampered = enc;
  const auto at = tampered.find("\"failure_count\":4");
  tampered[at + 16] = '9';
  expect(warden::decode_dlq_entry(tampered).status.code == warden::ErrorCode::entry_corrupt,
         "tampered body rejected");
  expect(warden::decode_dlq_entry(enc.substr(0, enc.size() - 10)).status.code ==
             warden::ErrorCode::entry_corrupt,
         "truncated entry rejected");
  expect(warden::decode_dlq_entry("garbage").status.code == warden::ErrorCode::entry_corrupt,
         "garbage rejected");
}

void test_dlq_storage_contract() {
  warden::InMemoryDlqStorage st(2);
  expect(st.pop().status.code == warden::ErrorCode::queue_empty, "empty pop");
  expect(st.push({"a", "1", 0, 0, 0}).ok(), "push a");
  expect(st.push({"b", "2", 0, 0, 0}).ok(), "push b");
  expect(st.push({"c", "3", 0, 0, 0}).code == warden::ErrorCode::queue_full, "bounded");
  expect(st.peek().value.id == "a", "peek head");
  auto a = st.pop();
  expect(a.ok() && a.value.id == "a", "pop a");
  expect(st.processing() == 1 && st.len() == 1, "a in flight");
  expect(st.nack("a").ok(), "nack requeues");
  expect(st.ack("a").code == warden::ErrorCode::not_found, "a no longer processing");
  st.pop();
  auto again = st.pop();
  expect(again.value.id == "a" && again.value.attempts == 1, "requeued with attempts + 1");
  expect(st.ack("a").ok(), "ack");
  expect(st.close().ok(), "close");
  expect(st.push({"d", "4", 0, 0, 0}).code == warden::ErrorCode::storage_closed, "closed");
}

std::atomic<int> g_dlq_messages{0};

void test_dead_letter_queue() {
  auto dispatcher = std::make_shared<warden::EventDispatcher>();
  warden::DlqConfig cfg;
  cfg.max_size = 10;
  cfg.on_message = [](const warden::DlqEntry&) { g_dlq_messages++; };
  auto storage = std::make_shared<warden::InMemoryDlqStorage>();
  warden::DeadLetterQueue dlq(cfg, storage, dispatcher);

  expect(dlq.push(sample_entry("t1")).ok(), "push");
  expect(dlq.push(sample_entry("t2")).ok(), "push 2");
  dispatcher->flush();
  expect(g_dlq_messages == 2, "on_message delivered asynchronously");

  auto peeked = dlq.peek();
  expect(peeked.ok() && peeked.value.task_id == "t1", "peek");
  auto popped = dlq.pop();
  expect(popped.ok() && popped.value.task_id == "t1", "pop");
  expect(dlq.ack("t1").ok(), "ack");

  expect(storage->push({"bad", "not an entry", 0, 0, 0}).ok(), "raw corrupt item");
  dlq.pop();
  auto corrupt = dlq.pop();
  expect(corrupt.status.code == warden::ErrorCode::entry_corrupt, "corrupt surfaces");
  expect(corrupt.status.detail == "bad", "corrupt item id reported");
  expect(dlq.stats().corrupt == 1 && dlq.stats().pushed == 2, "stats");
}

void test_dlq_cleanup_retention() {
  warden::DlqConfig cfg;
  cfg.retention = 60000ms;
  warden::DeadLetterQueue dlq(cfg, nullptr);
  auto old_entry = sample_entry("old");
  old_entry.failed_at_ms = warden::wall_clock_ms() - 3600000;
  auto fresh = sample_entry("fresh");
  fresh.failed_at_ms = warden::wall_clock_ms();
  expect(dlq.push(old_entry).ok() && dlq.push(fresh).ok(), "push");
  auto removed = dlq.cleanup();
  expect(removed.ok() && removed.value == 1, "expired entry dropped");
  expect(dlq.len() == 1 && dlq.peek().value.task_id == "fresh", "fresh entry kept");
  expect(dlq.stats().expired == 1, "expired counted");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults() {
  auto cfg = warden::default_config();
  expect(cfg.retry.max_retries == 3 && cfg.retry.initial_delay == 100ms, "retry defaults");
  expect(cfg.retry.max_delay == 30s && cfg.retry.multiplier == 2.0 && cfg.retry.jitter, "retry defaults 2");
  expect(cfg.breaker.failure_threshold == 5 && cfg.breaker.success_threshold == 2, "breaker thresholds");
  expect(cfg.breaker.timeout == 30s && cfg.breaker.half_open_max_calls == 1, "breaker timing");
  expect(cfg.monitor.max_cpu_percent == 80.0 && cfg.monitor.max_memory_mb == 1024, "monitor limits");
  expect(cfg.monitor.interval == 1000ms, "monitor interval");
  expect(cfg.default_tenant.max_queue_size == 100, "default tenant");
  expect(warden::validate_config(cfg).ok, "defaults validate");
}

void test_config_json_overlay() {
  std::string err;
  auto cfg = warden::config_from_json(
      "{\"retry_max\":7,\"retry_max_ms\":500,\"breaker_failures\":2,\"cpu_throttle\":false,"
      "\"max_cpu_percent\":55.5,\"dlq_enabled\":false}",
      warden::default_config(), &err);
  expect(err.empty(), "parsed");
  expect(cfg.retry.max_retries == 7, "retry_max");
  expect(cfg.retry.max_delay == 500ms, "retry_max_ms distinct from retry_max");
  expect(cfg.breaker.failure_threshold == 2, "breaker_failures");
  expect(!cfg.monitor.cpu_throttle, "cpu_throttle");
  expect(cfg.monitor.max_cpu_percent == 55.5, "max_cpu_percent");
  expect(!cfg.dlq_enabled, "dlq_enabled");
  expect(cfg.retry.initial_delay == 100ms, "absent key keeps base");

  warden::config_from_json("[1,2]", warden::default_config(), &err);
  expect(!err.empty(), "non-object rejected");

  const std::string js = warden::config_to_json(cfg);
  auto back = warden::config_from_json(js, warden::default_config(), nullptr);
  expect(back.retry.max_retries == 7 && back.monitor.max_cpu_percent == 55.5, "to_json readable");
}

void test_config_out_of_range_numbers() {
  std::string err;
  auto base = warden::default_config();
  auto cfg = warden::config_from_json("{\"dlq_max_size\": 99999999999999999999999}", base, &err);
  expect(err.find("dlq_max_size") != std::string::npos, "oversized integer reported");
  expect(cfg.dlq_max_size == base.dlq_max_size, "field keeps base value");

  err.clear();
  cfg = warden::config_from_json("{\"max_cpu_percent\": 1e999, \"retry_max\": 4}", base, &err);
  expect(err.find("max_cpu_percent") != std::string::npos, "infinite double reported");
  expect(cfg.monitor.max_cpu_percent == base.monitor.max_cpu_percent, "cpu limit unchanged");
  expect(cfg.retry.max_retries == 4, "valid keys still applied");

  err.clear();
  cfg = warden::config_from_json("{\"breaker_failures\": 4294967296}", base, &err);
  expect(err.find("breaker_failures") != std::string::npos, "value wider than int reported");
  expect(cfg.breaker.failure_threshold == base.breaker.failure_threshold, "threshold unchanged");

  expect(warden::jsonlite::get_u64("{\"n\":99999999999999999999999}", "n", 3) == 3, "reader falls back");
}

void test_config_validation() {
  auto cfg = warden::default_config();
  cfg.retry.multiplier = 0.5;
  cfg.breaker.failure_threshold = 0;
  cfg.retry.max_delay = 10ms;
  auto v = warden::validate_config(cfg);
  expect(!v.ok, "invalid");
  expect(v.errors.size() == 3, "three errors");

  auto warn = warden::default_config();
  warn.monitor.cpu_throttle = false;
  warn.monitor.memory_throttle = false;
  auto w = warden::validate_config(warn);
  expect(w.ok && w.warnings.size() == 1, "disabled throttles are a warning, not an error");
  expect(w.to_json().find("\"warnings\":[\"") != std::string::npos, "warnings rendered");
}

void test_config_env_overlay() {
  ::setenv("WARDEN_RETRY_MAX", "9", 1);
  ::setenv("WARDEN_BREAKER_TIMEOUT_MS", "1500", 1);
  ::setenv("WARDEN_MEMORY_THROTTLE", "false", 1);
  ::setenv("WARDEN_DEFAULT_MAX_TASKS", "not-a-number", 1);
  auto cfg = warden::config_from_env(warden::default_config());
  ::unsetenv("WARDEN_RETRY_MAX");
  ::unsetenv("WARDEN_BREAKER_TIMEOUT_MS");
  ::unsetenv("WARDEN_MEMORY_THROTTLE");
  ::unsetenv("WARDEN_DEFAULT_MAX_TASKS");
  expect(cfg.retry.max_retries == 9, "WARDEN_RETRY_MAX");
  expect(cfg.breaker.timeout == 1500ms, "WARDEN_BREAKER_TIMEOUT_MS");
  expect(!cfg.monitor.memory_throttle, "WARDEN_MEMORY_THROTTLE");
  expect(cfg.default_tenant.max_queue_size == 100, "unparseable value ignored");
}

// ============================================================================
// Observability and tracing
// ============================================================================

void test_event_hook_and_counters() {
  reset_capture();
  const auto before = warden::global_control_stats().count(warden::EventKind::throttle);
  warden::set_control_event_hook(capture_event);
  warden::ControlEvent ev;
  ev.kind = warden::EventKind::throttle;
  ev.detail = "cpu";
  warden::emit_control_event(ev);
  warden::set_control_event_hook(nullptr);
  expect(captured(warden::EventKind::throttle) == 1, "hook received event");
  expect(warden::global_control_stats().count(warden::EventKind::throttle) == before + 1, "counted");
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    expect(g_events[0].timestamp_ms > 0, "timestamp filled");
  }
}

void test_event_log_file() {
  const auto path = fs::temp_directory_path() / "warden_events_test.jsonl";
  fs::remove(path);
  ::setenv("WARDEN_EVENT_LOG", path.string().c_str(), 1);
  ::setenv("WARDEN_LOG_LEVEL", "warn", 1);

  warden::ControlEvent quiet;
  quiet.kind = warden::EventKind::admitted;
  quiet.severity = warden::Severity::debug;
  warden::emit_control_event(quiet);

  warden::ControlEvent loud;
  loud.kind = warden::EventKind::failed;
  loud.severity = warden::Severity::error;
  loud.tenant_id = "t\"1";
  loud.error_code = warden::ErrorCode::execution_failed;
  warden::emit_control_event(loud);

  ::unsetenv("WARDEN_EVENT_LOG");
  ::unsetenv("WARDEN_LOG_LEVEL");

  std::ifstream in(path);
  std::string line;
  std::vector<std::string> lines;
  while (std::getline(in, line)) lines.push_back(line);
  fs::remove(path);
  expect(lines.size() == 1, "below-level event suppressed");
  expect(warden::jsonlite::get_string(lines[0], "kind") == "failed", "kind");
  expect(warden::jsonlite::get_string(lines[0], "tenant_id") == "t\"1", "escaped tenant");
  expect(warden::jsonlite::get_string(lines[0], "error_code") == "execution_failed", "error code");
}

void test_latency_histogram() {
  warden::LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 99; ++i) h.record(1000);       // 1us
  h.record(1000000000);                              // 1s
  expect(h.count() == 100, "count");
  expect(h.percentile(0.5) <= 2.0, "p50 in the fast bucket");
  expect(h.percentile(1.0) >= 500000.0, "max in the slow bucket");
  expect(h.percentile(0.99) == 2.0, "rank 99 is the last fast sample");
  expect(h.percentile(1.0) == 1048576.0, "upper edge of the 2^20us bucket");

  warden::LatencyHistogram zero;
  zero.record(0);
  expect(zero.percentile(0.0) == 1.0, "sub-microsecond bucket reports 1us");
}

void test_recording_tracer() {
  warden::RecordingTracer tracer;
  auto root = tracer.start_span("request", {{"tenant_id", "t1"}});
  auto child = tracer.start_span("task", {}, root);
  expect(child->trace_id == root->trace_id, "child shares trace id");
  expect(child->parent_id == root->span_id, "parent linkage");
  expect(root->trace_id.size() == 32 && root->span_id.size() == 16, "W3C widths");
  tracer.end_span(child, warden::Status::failure(warden::ErrorCode::execution_failed));
  tracer.end_span(root, warden::Status::success());
  tracer.end_span(root, warden::Status::success());
  auto done = tracer.finished();
  expect(done.size() == 2, "ending twice records once");
  expect(tracer.started() == 2, "two spans started");
  expect(done[0].name == "task" && done[0].status.code == warden::ErrorCode::execution_failed, "child first");
  expect(done[1].to_json().find("\"tenant_id\":\"t1\"") != std::string::npos, "attributes rendered");
  tracer.clear();
  expect(tracer.finished().empty(), "clear drops finished spans");
}

void test_hash_helpers() {
  expect(warden::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(warden::hash_domain("dlq:", "x") != warden::hash_domain("evt:", "x"), "domain separation");
  expect(warden::hex_encode("\x01\xff") == "01ff", "hex encode");
  auto back = warden::hex_decode("01FF");
  expect(back && *back == std::string("\x01\xff"), "hex decode accepts upper case");
  expect(!warden::hex_decode("abc"), "odd length rejected");
  expect(!warden::hex_decode("zz"), "non-hex rejected");
}

// ============================================================================
// AdmissionController
// ============================================================================

warden::ControlPlaneConfig controller_config() {
  auto cfg = warden::default_config();
  cfg.retry = fast_policy(2);
  cfg.breaker.failure_threshold = 100;
  cfg.monitor.cpu_throttle = false;
  cfg.monitor.memory_throttle = false;
  return cfg;
}

std::unique_ptr<warden::ResourceSampler> quiet_sampler() {
  return std::make_unique<FakeSampler>(std::make_shared<SamplerKnobs>());
}

void test_admission_end_to_end_quota() {
  warden::AdmissionController ac(controller_config(), nullptr, nullptr, quiet_sampler());
  expect(ac.register_tenant(tenant("t1", 2)).ok(), "register t1");
  warden::TaskContext ctx("t1");
  expect(ac.admit(ctx).ok(), "first");
  expect(ac.admit(ctx).ok(), "second");
  expect(ac.admit(ctx).code == warden::ErrorCode::quota_exceeded, "third rejected");
  expect(ac.release("t1").ok(), "release");
  expect(ac.admit(ctx).ok(), "admitted again");
  auto st = ac.tenants().tenant_stats("t1");
  expect(st.value.tasks_submitted == 3 && st.value.tasks_rejected == 1, "tenant accounting");
  expect(ac.stats().snapshot(0).rejected_tasks == 1, "pool rejection counted");
}

void test_admission_rejections() {
  warden::AdmissionController ac(controller_config(), nullptr, nullptr, quiet_sampler());
  warden::TaskContext anon("");
  expect(ac.admit(anon).code == warden::ErrorCode::tenant_not_found, "empty tenant");

  auto limited = tenant("rl", 0);
  limited.rate_limit = 0.001;
  expect(ac.register_tenant(limited).ok(), "register rate-limited tenant");
  warden::TaskContext ctx("rl");
  int admitted = 0;
  for (int i = 0; i < 50; ++i)
    if (ac.admit(ctx).ok()) ++admitted;
  expect(admitted == ac.config().rate_limit_burst, "burst then rate_limited");
  expect(ac.admit(ctx).code == warden::ErrorCode::rate_limited, "rate_limited code");

  warden::TaskContext cancelled("rl");
  cancelled.cancel();
  expect(ac.admit(cancelled).code == warden::ErrorCode::cancelled, "cancelled before admission");
}

void test_admission_throttled() {
  auto knobs = std::make_shared<SamplerKnobs>();
  knobs->memory_bytes = 4096LL * 1024 * 1024;
  auto cfg = controller_config();
  cfg.monitor.memory_throttle = true;
  warden::AdmissionController ac(cfg, nullptr, nullptr, std::make_unique<FakeSampler>(knobs));
  warden::TaskContext ctx("t");
  expect(ac.admit(ctx).ok(), "admitted before sampling");
  ac.monitor().tick();
  expect(ac.admit(ctx).code == warden::ErrorCode::throttled, "throttled intake");
  knobs->memory_bytes = 0;
  ac.monitor().tick();
  expect(ac.admit(ctx).ok(), "intake resumes");
}

void test_admission_execute_success() {
  auto tracer = std::make_shared<warden::RecordingTracer>();
  warden::AdmissionController ac(controller_config(), tracer, nullptr, quiet_sampler());
  expect(ac.register_tenant(tenant("t1", 1)).ok(), "register");
  auto parent = tracer->start_span("request", {});
  warden::TaskContext ctx("t1");
  ctx.span = parent;

  int calls = 0;
  warden::TaskSpec task;
  task.task_id = "job-1";
  task.task_type = "io";
  task.memory_bytes = 2048;
  task.fn = [&](const warden::TaskContext& inner) {
    ++calls;
    expect(inner.tenant_id == "t1", "context reaches the work");
    if (calls < 2) return warden::Status::failure(warden::ErrorCode::execution_failed, "flaky");
    return warden::Status::success();
  };
  expect(ac.execute(ctx, task).ok(), "succeeds after a retry");
  expect(calls == 2, "retried once");
  expect(ac.tenants().find("t1")->quota.usage().tasks_used == 0, "reservation released");
  expect(ac.admit(ctx).ok(), "capacity available again");
  expect(ac.tenants().find("t1")->quota.usage().memory_used == 2048, "memory reported");

  auto spans = tracer->finished();
  expect(spans.size() == 1 && spans[0].name == "task.execute", "one task span");
  expect(spans[0].parent_id == parent->span_id, "task span parented to ambient span");
  expect(spans[0].attributes.at("task_type") == "io", "task type attribute");
  expect(ac.breakers().get("io")->metrics().total_successes == 1, "breaker keyed by task type");
}

void test_admission_execute_dead_letters() {
  warden::AdmissionController ac(controller_config(), nullptr, nullptr, quiet_sampler());
  warden::TaskContext ctx("t2");
  int calls = 0;
  warden::TaskSpec task;
  task.task_id = "job-dead";
  task.payload = "{\"order\":17}";
  task.fn = [&](const warden::TaskContext&) {
    ++calls;
    return warden::Status::failure(warden::ErrorCode::execution_failed, "down");
  };
  auto s = ac.execute(ctx, task);
  expect(s.code == warden::ErrorCode::execution_failed, "terminal error returned");
  expect(calls == 3, "maxRetries + 1 attempts");
  expect(ac.dlq() != nullptr && ac.dlq()->len() == 1, "dead-lettered");
  auto entry = ac.dlq()->pop();
  expect(entry.ok() && entry.value.task_id == "job-dead", "entry id");
  expect(entry.value.payload == task.payload, "payload preserved");
  expect(entry.value.failure_count == 3 && entry.value.errors.size() == 3, "attempt history");
  expect(ac.tenants().find("t2")->quota.usage().tasks_used == 0, "released on failure");
}

void test_admission_breaker_not_retried() {
  auto cfg = controller_config();
  cfg.breaker.failure_threshold = 1;
  cfg.breaker.timeout = 10s;
  warden::AdmissionController ac(cfg, nullptr, nullptr, quiet_sampler());
  warden::TaskContext ctx("t3");
  int calls = 0;
  warden::TaskSpec task;
  task.task_id = "a";
  task.task_type = "flaky";
  task.fn = [&](const warden::TaskContext&) {
    ++calls;
    return warden::Status::failure(warden::ErrorCode::execution_failed);
  };
  auto first = ac.execute(ctx, task);
  expect(first.code == warden::ErrorCode::circuit_open, "breaker opens during retries");
  expect(calls == 1, "open breaker stops the retry sequence");
  expect(ac.dlq()->len() == 0, "protection rejections are not dead-lettered");
}

void test_admission_events_and_snapshot() {
  reset_capture();
  warden::set_control_event_hook(capture_event);
  {
    warden::AdmissionController ac(controller_config(), nullptr, nullptr, quiet_sampler());
    expect(ac.register_tenant(tenant("t1", 1)).ok(), "register");
    expect(ac.register_tenant(tenant("t0", 1, 5)).ok(), "register t0");
    expect(ac.schedule()->id() == "t0", "scheduler wired to registration");
    warden::TaskContext ctx("t1");
    warden::TaskSpec task;
    task.task_id = "x";
    task.fn = [](const warden::TaskContext&) { return warden::Status::success(); };
    expect(ac.execute(ctx, task).ok(), "execute");
    const std::string snap = ac.snapshot_json(5);
    expect(warden::jsonlite::get_u64(snap, "v", 0) == warden::version::SNAPSHOT_VERSION, "snapshot version");
    expect(snap.find("\"queued_tasks\":5") != std::string::npos, "pool block");
    expect(snap.find("\"breakers\":") != std::string::npos, "breakers block");
    expect(snap.find("\"monitor\":") != std::string::npos, "monitor block");
    expect(ac.remove_tenant("t0"), "remove");
    expect(ac.schedule()->id() == "t1", "removed tenant leaves the scheduler");
  }
  warden::set_control_event_hook(nullptr);
  expect(captured(warden::EventKind::admitted) == 1, "admitted event");
  expect(captured(warden::EventKind::completed) == 1, "completed event");
}

void test_admission_throwing_task() {
  warden::AdmissionController ac(controller_config(), nullptr, nullptr, quiet_sampler());
  expect(ac.register_tenant(tenant("t1", 1)).ok(), "register");
  warden::TaskContext ctx("t1");
  int calls = 0;
  warden::TaskSpec task;
  task.task_id = "throws";
  task.fn = [&](const warden::TaskContext&) -> warden::Status {
    ++calls;
    throw std::runtime_error("bad input");
  };
  auto s = ac.execute(ctx, task);
  expect(s.code == warden::ErrorCode::execution_failed, "throw surfaces as execution_failed");
  expect(calls == 3, "thrown failures are retried like returned ones");
  expect(ac.tenants().find("t1")->quota.usage().tasks_used == 0, "reservation released");
  expect(ac.stats().snapshot(0).active_workers == 0, "worker slot returned");
  expect(ac.dlq()->len() == 1, "dead-lettered");
  expect(ac.admit(ctx).ok(), "tenant not starved afterwards");
}

void test_admission_reregister_while_in_flight() {
  warden::AdmissionController ac(controller_config(), nullptr, nullptr, quiet_sampler());
  expect(ac.register_tenant(tenant("t1", 1)).ok(), "register");
  auto old_record = ac.tenants().find("t1");
  warden::TaskContext ctx("t1");
  warden::TaskSpec task;
  task.task_id = "long";
  task.fn = [&](const warden::TaskContext&) {
    expect(ac.register_tenant(tenant("t1", 1)).ok(), "re-register mid-task");
    expect(ac.admit(ctx).ok(), "new record admits its own task");
    return warden::Status::success();
  };
  expect(ac.execute(ctx, task).ok(), "execute");

  auto new_record = ac.tenants().find("t1");
  expect(new_record != old_record, "record replaced");
  expect(old_record->quota.usage().tasks_used == 0, "old reservation released on the old record");
  expect(old_record->stats.snapshot().tasks_completed == 1, "completion lands on the old record");
  expect(new_record->quota.usage().tasks_used == 1, "new reservation untouched");
  expect(new_record->stats.snapshot().tasks_completed == 0, "new record has no completions");
  expect(ac.admit(ctx).code == warden::ErrorCode::quota_exceeded, "limit 1 still enforced");
}

void test_admission_remove_while_in_flight() {
  warden::AdmissionController ac(controller_config(), nullptr, nullptr, quiet_sampler());
  expect(ac.register_tenant(tenant("t1", 1)).ok(), "register");
  warden::TaskContext ctx("t1");
  warden::TaskSpec task;
  task.task_id = "orphan";
  task.fn = [&](const warden::TaskContext&) {
    expect(ac.remove_tenant("t1"), "removed mid-task");
    return warden::Status::success();
  };
  expect(ac.execute(ctx, task).ok(), "execute");
  expect(ac.tenants().find("t1") == nullptr, "completion does not resurrect the tenant");
  expect(ac.tenants().size() == 0, "registry empty");
  expect(ac.stats().snapshot(0).last_error.ok(), "release did not fail");
}

void test_admission_dlq_on_message() {
  auto seen = std::make_shared<std::atomic<int>>(0);
  auto last_id = std::make_shared<std::string>();
  auto cfg = controller_config();
  cfg.dlq_on_message = [seen, last_id](const warden::DlqEntry& e) {
    *last_id = e.task_id;
    seen->fetch_add(1);
  };
  warden::AdmissionController ac(cfg, nullptr, nullptr, quiet_sampler());
  warden::TaskContext ctx("t1");
  warden::TaskSpec task;
  task.task_id = "poison";
  task.fn = [](const warden::TaskContext&) {
    return warden::Status::failure(warden::ErrorCode::execution_failed, "down");
  };
  expect(ac.execute(ctx, task).code == warden::ErrorCode::execution_failed, "fails");
  ac.dispatcher()->flush();
  expect(seen->load() == 1, "on_message fired once");
  expect(*last_id == "poison", "callback sees the entry");
}

void test_admission_breaker_rejection_not_completed() {
  auto cfg = controller_config();
  cfg.breaker.failure_threshold = 1;
  cfg.breaker.timeout = 10s;
  warden::AdmissionController ac(cfg, nullptr, nullptr, quiet_sampler());
  warden::TaskContext ctx("t1");
  int calls = 0;
  warden::TaskSpec task;
  task.task_id = "a";
  task.task_type = "svc";
  task.fn = [&](const warden::TaskContext&) {
    ++calls;
    return warden::Status::failure(warden::ErrorCode::execution_failed);
  };
  expect(ac.execute(ctx, task).code == warden::ErrorCode::circuit_open, "opens on first failure");
  expect(ac.stats().snapshot(0).completed_tasks == 1, "the run that reached fn counts");

  expect(ac.execute(ctx, task).code == warden::ErrorCode::circuit_open, "rejected outright");
  expect(calls == 1, "fn not called again");
  expect(ac.stats().snapshot(0).completed_tasks == 1, "rejection is not a completion");
  expect(ac.tenants().find("t1")->stats.snapshot().tasks_completed == 1, "tenant count matches");
  expect(ac.tenants().find("t1")->quota.usage().tasks_used == 0, "still released");
}

void test_admission_prune_idle_tenants() {
  warden::AdmissionController ac(controller_config(), nullptr, nullptr, quiet_sampler());
  for (int i = 0; i < 20; ++i) {
    warden::TaskContext ctx("visitor-" + std::to_string(i));
    expect(ac.admit(ctx).ok(), "implicit admit");
    expect(ac.release(ctx.tenant_id).ok(), "release");
  }
  expect(ac.tenants().size() == 20 && ac.rate_limiter().size() == 20, "one entry per id seen");
  expect(ac.prune_idle_tenants() == 20, "all idle");
  expect(ac.tenants().size() == 0 && ac.rate_limiter().size() == 0, "maps shrink back");
}

void test_admission_concurrent_execute() {
  warden::AdmissionController ac(controller_config(), nullptr, nullptr, quiet_sampler());
  expect(ac.register_tenant(tenant("shared", 3)).ok(), "register");
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};
  std::atomic<int> ok{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        warden::TaskContext ctx("shared");
        warden::TaskSpec task;
        task.task_id = "c";
        task.fn = [&](const warden::TaskContext&) {
          const int now = in_flight.fetch_add(1) + 1;
          int p = peak.load();
          while (now > p && !peak.compare_exchange_weak(p, now)) {
          }
          std::this_thread::sleep_for(100us);
          in_flight.fetch_sub(1);
          return warden::Status::success();
        };
        if (ac.execute(ctx, task).ok()) ok++;
      }
    });
  }
  for (auto& t : threads) t.join();
  expect(peak.load() <= 3, "tenant quota bounds concurrency");
  expect(ok.load() > 0, "work admitted");
  expect(ac.tenants().find("shared")->quota.usage().tasks_used == 0, "all reservations returned");
}

}  // namespace

int main() {
  std::cout << "\n[Failure taxonomy]\n";
  run_test("error classification", test_error_taxonomy);
  run_test("status message", test_status_message);

  std::cout << "\n[ResourceQuota]\n";
  run_test("reservations never exceed limit", test_quota_never_exceeds_limit);
  run_test("concurrent reservations bounded", test_quota_concurrent_reservations);
  run_test("limit 0 is unlimited", test_quota_unlimited);
  run_test("release never below zero", test_quota_release_floor);
  run_test("record_memory overwrites", test_quota_record_memory_overwrites);

  std::cout << "\n[TenantRegistry]\n";
  run_test("empty id rejected", test_registry_rejects_empty_id);
  run_test("unknown lookup not stored", test_registry_unknown_lookup_not_stored);
  run_test("lazy adoption on quota check", test_registry_lazy_adoption);
  run_test("release on unknown tenant", test_registry_release_unknown_fails);
  run_test("t1 maxQueueSize=2 scenario", test_registry_end_to_end_quota);
  run_test("stats and re-registration", test_registry_stats_and_replace);
  run_test("all tenants and remove", test_registry_all_tenants_and_remove);
  run_test("double release fails", test_registry_double_release_fails);
  run_test("reservation survives re-registration", test_registry_reservation_survives_reregistration);
  run_test("prune idle implicit records", test_registry_prune_idle_implicit);

  std::cout << "\n[TenantScheduler]\n";
  run_test("empty scheduler", test_scheduler_empty);
  run_test("equal priority round robin", test_scheduler_round_robin);
  run_test("strict priority", test_scheduler_strict_priority);
  run_test("re-add moves between tiers", test_scheduler_move_between_tiers);
  run_test("remove keeps rotation", test_scheduler_remove_keeps_rotation);

  std::cout << "\n[CircuitBreaker]\n";
  run_test("opens after threshold", test_breaker_opens_after_threshold);
  run_test("success resets failures", test_breaker_success_resets_failures);
  run_test("half-open recovery", test_breaker_half_open_recovery);
  run_test("half-open failure reopens", test_breaker_half_open_failure_reopens);
  run_test("half-open trial limit", test_breaker_half_open_trial_limit);
  run_test("throwing half-open call reopens", test_breaker_throwing_half_open_call_reopens);
  run_test("non-standard throw is a failure", test_breaker_non_std_throw_counts_as_failure);
  run_test("state callback via dispatcher", test_breaker_state_callback_async);
  run_test("reset", test_breaker_reset);
  run_test("registry per key", test_breaker_registry);

  std::cout << "\n[RetryExecutor]\n";
  run_test("exhaustion invokes maxRetries+1", test_retry_exhaustion_count);
  run_test("success on attempt k", test_retry_success_on_attempt_k);
  run_test("predicate stops retries", test_retry_predicate_stops);
  run_test("cancellation before wait", test_retry_cancel_before_wait);
  run_test("cancellation mid-wait", test_retry_cancel_mid_wait);
  run_test("deadline bounds wait", test_retry_deadline);
  run_test("typed result keeps last value", test_retry_with_result_keeps_last_value);
  run_test("backoff schedule", test_compute_backoff);

  std::cout << "\n[ResourceMonitor]\n";
  run_test("edge-triggered callbacks", test_monitor_edge_triggered);
  run_test("memory and dual throttle", test_monitor_memory_and_both);
  run_test("loop honours live limits", test_monitor_loop_limits);
  run_test("repeated start/stop", test_monitor_repeated_start_stop);
  run_test("process sampler", test_process_sampler);

  std::cout << "\n[StatsCollector]\n";
  run_test("average latency", test_stats_average_latency);
  run_test("stats json", test_stats_json);

  std::cout << "\n[EventDispatcher]\n";
  run_test("FIFO delivery", test_dispatcher_order);
  run_test("throwing subscriber contained", test_dispatcher_survives_throw);
  run_test("non-standard throw contained", test_dispatcher_survives_non_std_throw);
  run_test("drops oldest at capacity", test_dispatcher_drops_oldest);

  std::cout << "\n[Rate limiting]\n";
  run_test("token bucket", test_token_bucket);
  run_test("sliding window", test_sliding_window);
  run_test("per-tenant limiter", test_per_tenant_limiter);

  std::cout << "\n[Dead-letter queue]\n";
  run_test("entry codec", test_dlq_codec);
  run_test("corruption detected", test_dlq_corruption_detected);
  run_test("storage contract", test_dlq_storage_contract);
  run_test("queue push/pop/ack", test_dead_letter_queue);
  run_test("retention cleanup", test_dlq_cleanup_retention);

  std::cout << "\n[Configuration]\n";
  run_test("defaults", test_config_defaults);
  run_test("JSON overlay", test_config_json_overlay);
  run_test("out-of-range numbers reported", test_config_out_of_range_numbers);
  run_test("validation", test_config_validation);
  run_test("environment overlay", test_config_env_overlay);

  std::cout << "\n[Observability]\n";
  run_test("event hook and counters", test_event_hook_and_counters);
  run_test("JSONL event log", test_event_log_file);
  run_test("latency histogram", test_latency_histogram);
  run_test("recording tracer", test_recording_tracer);
  run_test("hash helpers", test_hash_helpers);

  std::cout << "\n[AdmissionController]\n";
  run_test("end-to-end quota", test_admission_end_to_end_quota);
  run_test("admission rejections", test_admission_rejections);
  run_test("throttled intake", test_admission_throttled);
  run_test("execute success path", test_admission_execute_success);
  run_test("execute dead-letters exhaustion", test_admission_execute_dead_letters);
  run_test("protection rejection ends retries", test_admission_breaker_not_retried);
  run_test("events and snapshot", test_admission_events_and_snapshot);
  run_test("throwing task releases its slot", test_admission_throwing_task);
  run_test("re-register while in flight", test_admission_reregister_while_in_flight);
  run_test("remove while in flight", test_admission_remove_while_in_flight);
  run_test("dlq on_message through execute", test_admission_dlq_on_message);
  run_test("breaker rejection not a completion", test_admission_breaker_rejection_not_completed);
  run_test("prune idle tenants", test_admission_prune_idle_tenants);
  run_test("concurrent execute", test_admission_concurrent_execute);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
