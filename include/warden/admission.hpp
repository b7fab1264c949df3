#pragma once

// warden/admission.hpp — Composition root of the control plane.
//
// DESIGN:
//   One AdmissionController owns every control-plane component for one worker
//   pool. Nothing is a process-wide singleton: two controllers in one process
//   share no tenant, breaker or limiter state. Only the ControlEvent counters
//   are global.
//
//   admit(ctx), in order:
//     1. cancelled context              -> cancelled
//     2. empty tenant id                -> tenant_not_found
//     3. resource monitor throttled     -> throttled
//     4. tenant rate_limit > 0 and its
//        token bucket is empty          -> rate_limited
//     5. tenant quota exhausted         -> quota_exceeded
//   Steps 2-5 count a rejection against the tenant and the pool. A successful
//   admit() holds one quota reservation that release() gives back.
//
//   execute(ctx, task):
//     admit -> span -> retry(breaker[task_type](fn)) -> release -> accounting
//   Only execution failures are retried; a protection rejection or a
//   cancellation ends the sequence at once. A task whose retries are exhausted
//   is pushed to the dead-letter queue when one is configured. A work function
//   that throws counts as an execution failure.
//
// INVARIANTS:
//   - execute() releases exactly the reservation its own admit() took, on
//     every path, including cancellation and a throwing work function. The
//     release and the completion stats land on the TenantInfo the reservation
//     was taken on, even if the tenant was re-registered or removed meanwhile.
//   - Completion counts and latency cover only attempts that reached the work
//     function.
//   - Destruction stops the monitor before any component it notifies goes
//     away; the dispatcher outlives every component that posts to it.
//
// EXTENSION_POINT: queue_integration
//   The pending-task queue is external. Glue calls schedule() to pick the next
//   tenant, pops that tenant's work from its own queue and hands it to
//   execute(), passing the queue length to snapshot_json().

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "warden/circuit_breaker.hpp"
#include "warden/config.hpp"
#include "warden/dlq.hpp"
#include "warden/event_dispatcher.hpp"
#include "warden/rate_limiter.hpp"
#include "warden/resource_monitor.hpp"
#include "warden/retry.hpp"
#include "warden/stats.hpp"
#include "warden/task_context.hpp"
#include "warden/tenant.hpp"
#include "warden/tenant_scheduler.hpp"
#include "warden/tracing.hpp"
#include "warden/types.hpp"

namespace warden {

// Breaker key for tasks that carry no task type.
constexpr const char* kDefaultTaskType = "default";

struct TaskSpec {
  std::string task_id;
  std::string task_type;
  std::string payload;           // opaque; kept only for the dead-letter entry
  int64_t memory_bytes{0};       // caller-reported footprint, fed to the tenant quota
  std::function<Status(const TaskContext&)> fn;
};

class AdmissionController {
 public:
  // Null collaborators get defaults: NoopTracer, InMemoryDlqStorage sized by
  // config.dlq_max_size, ProcessSampler.
  explicit AdmissionController(ControlPlaneConfig config,
                               std::shared_ptr<Tracer> tracer = nullptr,
                               std::shared_ptr<DlqStorage> dlq_storage = nullptr,
                               std::unique_ptr<ResourceSampler> sampler = nullptr);
  ~AdmissionController();

  AdmissionController(const AdmissionController&) = delete;
  AdmissionController& operator=(const AdmissionController&) = delete;

  // Registers (or replaces) the tenant and places it in the scheduler.
  Status register_tenant(const TenantConfig& config);
  bool remove_tenant(const std::string& tenant_id);
  // Forgets implicit tenants with nothing in flight, along with their limiters.
  size_t prune_idle_tenants();

  Status admit(const TaskContext& ctx);
  Status release(const std::string& tenant_id);

  // Raw quota primitives, without throttle or rate checks.
  Result<bool> check_quota(const std::string& tenant_id) { return tenants_.check_quota(tenant_id); }
  Status release_quota(const std::string& tenant_id) { return tenants_.release_quota(tenant_id); }

  TenantInfoPtr schedule() { return scheduler_.schedule(); }

  Status execute(const TaskContext& ctx, const TaskSpec& task);

  // Resource monitor loop.
  void start();
  void stop();

  std::string snapshot_json(int64_t queue_len) const;

  const ControlPlaneConfig& config() const { return config_; }
  TenantRegistry& tenants() { return tenants_; }
  TenantScheduler& scheduler() { return scheduler_; }
  CircuitBreakerRegistry& breakers() { return breakers_; }
  RetryExecutor& retry() { return retry_; }
  ResourceMonitor& monitor() { return monitor_; }
  StatsCollector& stats() { return stats_; }
  PerTenantRateLimiter& rate_limiter() { return limiter_; }
  DeadLetterQueue* dlq() { return dlq_.get(); }
  Tracer& tracer() { return *tracer_; }
  const std::shared_ptr<EventDispatcher>& dispatcher() const { return dispatcher_; }

 private:
  Status reject(const TaskContext& ctx, Status why);
  // admit() that also hands back the record the reservation was taken on.
  Status admit_held(const TaskContext& ctx, TenantInfoPtr* held);
  void dead_letter(const TaskSpec& task, const RetryableTask& record, const Status& final_status);
  std::unique_ptr<RateLimiter> make_limiter(const std::string& tenant_id) const;

  const ControlPlaneConfig config_;
  std::shared_ptr<EventDispatcher> dispatcher_;
  std::shared_ptr<Tracer> tracer_;
  TenantRegistry tenants_;
  TenantScheduler scheduler_;
  CircuitBreakerRegistry breakers_;
  RetryExecutor retry_;
  StatsCollector stats_;
  PerTenantRateLimiter limiter_;
  std::unique_ptr<DeadLetterQueue> dlq_;
  ResourceMonitor monitor_;
};

}  // namespace warden
