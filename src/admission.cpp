#include "warden/admission.hpp"

#include <chrono>
#include <sstream>
#include <vector>

#include "warden/observability.hpp"
#include "warden/version.hpp"

namespace warden {

namespace {

bool retryable(const Status& s) { return is_execution_failure(s.code); }

Severity severity_for(ErrorCode code) {
  if (is_execution_failure(code)) return Severity::error;
  return Severity::warn;
}

CircuitBreakerConfig breaker_template(const ControlPlaneConfig& cfg) {
  CircuitBreakerConfig b = cfg.breaker;
  if (b.name.empty()) b.name = kDefaultTaskType;
  return b;
}

// Holds one worker slot and one quota reservation; finish() gives both back
// exactly once, and the destructor covers any path that skipped it.
class ExecutionSlot {
 public:
  ExecutionSlot(StatsCollector& stats, TenantInfoPtr held) : stats_(stats), held_(std::move(held)) {
    stats_.inc_active_workers();
  }
  ~ExecutionSlot() { finish(); }

  ExecutionSlot(const ExecutionSlot&) = delete;
  ExecutionSlot& operator=(const ExecutionSlot&) = delete;

  void finish() {
    if (done_) return;
    done_ = true;
    stats_.dec_active_workers();
    if (!held_->release()) {
      stats_.record_error(Status::failure(ErrorCode::not_found, "no reservation held by " + held_->id()));
    }
  }

 private:
  StatsCollector& stats_;
  TenantInfoPtr held_;
  bool done_{false};
};

}  // namespace

AdmissionController::AdmissionController(ControlPlaneConfig config, std::shared_ptr<Tracer> tracer,
                                         std::shared_ptr<DlqStorage> dlq_storage,
                                         std::unique_ptr<ResourceSampler> sampler)
    : config_(std::move(config)),
      dispatcher_(std::make_shared<EventDispatcher>(config_.notification_capacity)),
      tracer_(tracer ? std::move(tracer) : std::make_shared<NoopTracer>()),
      tenants_(config_.default_tenant),
      breakers_(breaker_template(config_), dispatcher_),
      limiter_([this](const std::string& tenant_id) { return make_limiter(tenant_id); }),
      monitor_(config_.monitor, dispatcher_, std::move(sampler)) {
  if (config_.dlq_enabled) {
    DlqConfig dc;
    dc.max_size = config_.dlq_max_size;
    dc.retention = config_.dlq_retention;
    dc.compression = config_.dlq_compression;
    dc.on_message = config_.dlq_on_message;
    if (!dlq_storage) dlq_storage = std::make_shared<InMemoryDlqStorage>(config_.dlq_max_size);
    dlq_ = std::make_unique<DeadLetterQueue>(std::move(dc), std::move(dlq_storage), dispatcher_);
  }
}

AdmissionController::~AdmissionController() {
  stop();
  dispatcher_->flush();
}

std::unique_ptr<RateLimiter> AdmissionController::make_limiter(const std::string& tenant_id) const {
  const double rate = tenants_.get_tenant(tenant_id)->config.rate_limit;
  if (rate <= 0.0) return std::make_unique<NoopRateLimiter>();
  return std::make_unique<TokenBucketLimiter>(rate, config_.rate_limit_burst);
}

// ---------------------------------------------------------------------------
// Tenant membership
// ---------------------------------------------------------------------------

Status AdmissionController::register_tenant(const TenantConfig& config) {
  Status s = tenants_.register_tenant(config);
  if (!s.ok()) return s;
  // A new rate applies from the next admit().
  limiter_.reset(config.tenant_id);
  scheduler_.add_tenant(tenants_.find(config.tenant_id));
  return Status::success();
}

bool AdmissionController::remove_tenant(const std::string& tenant_id) {
  scheduler_.remove_tenant(tenant_id);
  limiter_.reset(tenant_id);
  return tenants_.remove_tenant(tenant_id);
}

size_t AdmissionController::prune_idle_tenants() {
  const std::vector<std::string> pruned = tenants_.prune_idle_implicit();
  for (const auto& id : pruned) limiter_.reset(id);
  return pruned.size();
}

// ---------------------------------------------------------------------------
// Admission
// ---------------------------------------------------------------------------

Status AdmissionController::reject(const TaskContext& ctx, Status why) {
  if (!ctx.tenant_id.empty()) {
    Status counted = tenants_.record_task_rejected(ctx.tenant_id);
    if (!counted.ok()) stats_.record_error(counted);
  }
  stats_.record_task_rejection();

  ControlEvent ev;
  ev.kind = EventKind::rejected;
  ev.severity = Severity::info;
  ev.tenant_id = ctx.tenant_id;
  ev.task_id = ctx.request_id;
  ev.error_code = why.code;
  ev.detail = why.detail;
  emit_control_event(ev);
  return why;
}

Status AdmissionController::admit(const TaskContext& ctx) {
  TenantInfoPtr held;
  return admit_held(ctx, &held);
}

Status AdmissionController::admit_held(const TaskContext& ctx, TenantInfoPtr* held) {
  if (ctx.cancelled()) return Status::failure(ErrorCode::cancelled, "before admission");
  if (ctx.tenant_id.empty()) {
    return reject(ctx, Status::failure(ErrorCode::tenant_not_found, "empty tenant id"));
  }
  if (monitor_.throttled()) {
    return reject(ctx, Status::failure(ErrorCode::throttled, "resource limits exceeded"));
  }
  if (!limiter_.allow(ctx.tenant_id)) {
    return reject(ctx, Status::failure(ErrorCode::rate_limited, ctx.tenant_id));
  }

  Result<TenantInfoPtr> reserved = tenants_.reserve_quota(ctx.tenant_id);
  if (!reserved.ok()) return reject(ctx, reserved.status);
  reserved.value->stats.tasks_submitted.fetch_add(1, std::memory_order_relaxed);
  *held = std::move(reserved.value);

  ControlEvent ev;
  ev.kind = EventKind::admitted;
  ev.severity = Severity::debug;
  ev.tenant_id = ctx.tenant_id;
  ev.task_id = ctx.request_id;
  emit_control_event(ev);
  return Status::success();
}

Status AdmissionController::release(const std::string& tenant_id) {
  return tenants_.release_quota(tenant_id);
}

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

Status AdmissionController::execute(const TaskContext& ctx, const TaskSpec& task) {
  TenantInfoPtr held;
  Status admitted = admit_held(ctx, &held);
  if (!admitted.ok()) return admitted;
  ExecutionSlot slot(stats_, held);

  const std::string task_type = task.task_type.empty() ? kDefaultTaskType : task.task_type;
  SpanPtr span = tracer_->start_span(
      "task.execute", {{"tenant_id", ctx.tenant_id}, {"task_id", task.task_id}, {"task_type", task_type}},
      ctx.span);
  TaskContext inner = ctx.child();
  inner.span = span;

  CircuitBreakerPtr breaker = breakers_.get(task_type);
  int runs = 0;  // attempts the breaker let through to the work function
  auto attempt = [&]() -> Status {
    return breaker->call([&]() -> Status {
      ++runs;
      if (!task.fn) return Status::failure(ErrorCode::execution_failed, "task has no work function");
      return task.fn(inner);
    });
  };

  RetryableTask record;
  record.id = task.task_id;
  const auto started = Clock::now();

  Status result;
  if (config_.retry_enabled) {
    result = retry_.execute_if(inner, config_.retry, retryable, attempt, &record);
  } else {
    record.first_attempt = record.last_attempt = WallClock::now();
    record.attempts = 1;
    result = attempt();
    if (!result.ok()) record.errors.push_back(result);
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started);
  slot.finish();

  // Breaker rejections and cancellations never reached the work function.
  if (runs > 0) {
    held->record_completed(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(),
                           task.memory_bytes);
    stats_.record_task_completion(elapsed);
  }

  ControlEvent ev;
  ev.tenant_id = ctx.tenant_id;
  ev.task_id = task.task_id;
  ev.task_type = task_type;
  ev.duration_ns = static_cast<uint64_t>(elapsed.count());
  if (result.ok()) {
    ev.kind = EventKind::completed;
    ev.severity = Severity::info;
  } else {
    stats_.record_error(result);
    ev.kind = EventKind::failed;
    ev.severity = severity_for(result.code);
    ev.error_code = result.code;
    ev.detail = "attempts=" + std::to_string(record.attempts);
  }
  emit_control_event(ev);

  if (!result.ok() && is_execution_failure(result.code)) dead_letter(task, record, result);

  tracer_->end_span(span, result);
  return result;
}

void AdmissionController::dead_letter(const TaskSpec& task, const RetryableTask& record,
                                      const Status& final_status) {
  if (!dlq_) return;
  DlqEntry entry;
  entry.task_id = task.task_id;
  entry.payload = task.payload;
  entry.failed_at_ms = wall_clock_ms();
  entry.failure_count = record.attempts;
  for (const auto& e : record.errors) entry.errors.push_back(e.message());
  if (entry.errors.empty()) entry.errors.push_back(final_status.message());

  Status pushed = dlq_->push(entry);
  if (!pushed.ok()) stats_.record_error(pushed);
}

// ---------------------------------------------------------------------------
// Lifecycle and reporting
// ---------------------------------------------------------------------------

void AdmissionController::start() { monitor_.start(); }

void AdmissionController::stop() { monitor_.stop(); }

std::string AdmissionController::snapshot_json(int64_t queue_len) const {
  std::ostringstream o;
  o << "{"
    << "\"v\":" << version::SNAPSHOT_VERSION
    << ",\"pool\":" << stats_.to_json(queue_len)
    << ",\"tenants\":" << tenants_.to_json()
    << ",\"breakers\":" << breakers_.to_json()
    << ",\"retry\":" << retry_.metrics().to_json()
    << ",\"monitor\":" << monitor_.metrics().to_json()
    << ",\"dlq\":" << (dlq_ ? dlq_->stats().to_json() : std::string("null"))
    << ",\"dispatcher\":{\"pending\":" << dispatcher_->pending()
    << ",\"delivered\":" << dispatcher_->delivered()
    << ",\"dropped\":" << dispatcher_->dropped()
    << ",\"failed\":" << dispatcher_->failed() << "}"
    << ",\"events\":" << global_control_stats().to_json()
    << "}";
  return o.str();
}

}  // namespace warden
