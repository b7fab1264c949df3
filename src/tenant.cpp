#include "warden/tenant.hpp"

#include <mutex>

#include "warden/jsonlite.hpp"

namespace warden {

namespace {

constexpr int64_t kBytesPerMb = 1024 * 1024;

}  // namespace

std::string TenantConfig::to_json() const {
  std::string out = "{\"tenant_id\":\"";
  out += jsonlite::escape(tenant_id);
  out += "\",\"max_workers\":";
  out += std::to_string(max_workers);
  out += ",\"max_queue_size\":";
  out += std::to_string(max_queue_size);
  out += ",\"cpu_quota\":";
  out += jsonlite::format_double(cpu_quota);
  out += ",\"memory_quota_mb\":";
  out += std::to_string(memory_quota_mb);
  out += ",\"rate_limit\":";
  out += jsonlite::format_double(rate_limit);
  out += ",\"priority\":";
  out += std::to_string(priority);
  out += '}';
  return out;
}

TenantStatsSnapshot TenantStats::snapshot() const {
  TenantStatsSnapshot s;
  s.tasks_submitted = tasks_submitted.load(std::memory_order_relaxed);
  s.tasks_completed = tasks_completed.load(std::memory_order_relaxed);
  s.tasks_rejected = tasks_rejected.load(std::memory_order_relaxed);
  s.total_cpu_ms = total_cpu_ms.load(std::memory_order_relaxed);
  s.last_memory_bytes = last_memory_bytes.load(std::memory_order_relaxed);
  return s;
}

std::string TenantStatsSnapshot::to_json() const {
  std::string out = "{\"tasks_submitted\":";
  out += std::to_string(tasks_submitted);
  out += ",\"tasks_completed\":";
  out += std::to_string(tasks_completed);
  out += ",\"tasks_rejected\":";
  out += std::to_string(tasks_rejected);
  out += ",\"total_cpu_ms\":";
  out += std::to_string(total_cpu_ms);
  out += ",\"last_memory_bytes\":";
  out += std::to_string(last_memory_bytes);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// TenantInfo
// ---------------------------------------------------------------------------

TenantInfo::TenantInfo(TenantConfig cfg, bool implicit)
    : config(std::move(cfg)),
      quota(static_cast<int64_t>(config.cpu_quota),
            config.memory_quota_mb * kBytesPerMb,
            static_cast<int64_t>(config.max_queue_size)),
      implicit_(implicit) {}

void TenantInfo::record_completed(int64_t cpu_ms, int64_t memory_bytes) {
  stats.tasks_completed.fetch_add(1, std::memory_order_relaxed);
  stats.total_cpu_ms.fetch_add(cpu_ms, std::memory_order_relaxed);
  stats.last_memory_bytes.store(memory_bytes, std::memory_order_relaxed);
  quota.record_cpu(cpu_ms);
  quota.record_memory(memory_bytes);
}

std::string TenantInfo::to_json() const {
  std::string out = "{\"config\":";
  out += config.to_json();
  out += ",\"implicit\":";
  out += implicit_ ? "true" : "false";
  out += ",\"quota\":";
  out += quota.usage().to_json();
  out += ",\"stats\":";
  out += stats.snapshot().to_json();
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// TenantRegistry
// ---------------------------------------------------------------------------

TenantRegistry::TenantRegistry(TenantConfig default_config)
    : default_config_(std::move(default_config)) {}

TenantConfig TenantRegistry::config_for(const std::string& tenant_id) const {
  TenantConfig cfg = default_config_;
  cfg.tenant_id = tenant_id;
  return cfg;
}

Status TenantRegistry::register_tenant(const TenantConfig& config) {
  if (config.tenant_id.empty()) {
    return Status::failure(ErrorCode::invalid_config, "tenant_id must not be empty");
  }
  auto info = std::make_shared<TenantInfo>(config, false);
  std::unique_lock<std::shared_mutex> lock(mu_);
  tenants_[config.tenant_id] = std::move(info);
  return Status::success();
}

TenantInfoPtr TenantRegistry::find(const std::string& tenant_id) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = tenants_.find(tenant_id);
  return it == tenants_.end() ? nullptr : it->second;
}

TenantInfoPtr TenantRegistry::get_tenant(const std::string& tenant_id) const {
  if (auto info = find(tenant_id)) return info;
  return std::make_shared<TenantInfo>(config_for(tenant_id), true);
}

TenantInfoPtr TenantRegistry::get_or_adopt(const std::string& tenant_id) {
  if (tenant_id.empty()) return nullptr;
  if (auto info = find(tenant_id)) return info;

  std::unique_lock<std::shared_mutex> lock(mu_);
  auto [it, inserted] = tenants_.try_emplace(tenant_id, nullptr);
  if (inserted) it->second = std::make_shared<TenantInfo>(config_for(tenant_id), true);
  return it->second;
}

Result<TenantInfoPtr> TenantRegistry::reserve_quota(const std::string& tenant_id) {
  Result<TenantInfoPtr> r;
  auto info = get_or_adopt(tenant_id);
  if (!info) {
    r.status = Status::failure(ErrorCode::tenant_not_found, "empty tenant id");
  } else if (!info->reserve()) {
    r.status = Status::failure(ErrorCode::quota_exceeded, tenant_id);
  } else {
    r.value = std::move(info);
  }
  return r;
}

Result<bool> TenantRegistry::check_quota(const std::string& tenant_id) {
  Result<bool> r;
  Result<TenantInfoPtr> reserved = reserve_quota(tenant_id);
  if (reserved.status.code == ErrorCode::quota_exceeded) {
    r.value = false;
    return r;
  }
  r.status = reserved.status;
  r.value = reserved.ok();
  return r;
}

Status TenantRegistry::release_quota(const std::string& tenant_id) {
  auto info = find(tenant_id);
  if (!info) return Status::failure(ErrorCode::tenant_not_found, tenant_id);
  if (!info->release()) {
    return Status::failure(ErrorCode::not_found, "no reservation held by " + tenant_id);
  }
  return Status::success();
}

Status TenantRegistry::record_task_submitted(const std::string& tenant_id) {
  auto info = get_or_adopt(tenant_id);
  if (!info) return Status::failure(ErrorCode::tenant_not_found, "empty tenant id");
  info->stats.tasks_submitted.fetch_add(1, std::memory_order_relaxed);
  return Status::success();
}

Status TenantRegistry::record_task_completed(const std::string& tenant_id, int64_t cpu_ms,
                                             int64_t memory_bytes) {
  auto info = get_or_adopt(tenant_id);
  if (!info) return Status::failure(ErrorCode::tenant_not_found, "empty tenant id");
  info->record_completed(cpu_ms, memory_bytes);
  return Status::success();
}

Status TenantRegistry::record_task_rejected(const std::string& tenant_id) {
  auto info = get_or_adopt(tenant_id);
  if (!info) return Status::failure(ErrorCode::tenant_not_found, "empty tenant id");
  info->stats.tasks_rejected.fetch_add(1, std::memory_order_relaxed);
  return Status::success();
}

Result<TenantStatsSnapshot> TenantRegistry::tenant_stats(const std::string& tenant_id) const {
  Result<TenantStatsSnapshot> r;
  auto info = find(tenant_id);
  if (!info) {
    r.status = Status::failure(ErrorCode::tenant_not_found, tenant_id);
    return r;
  }
  r.value = info->stats.snapshot();
  return r;
}

bool TenantRegistry::remove_tenant(const std::string& tenant_id) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  return tenants_.erase(tenant_id) > 0;
}

std::vector<std::string> TenantRegistry::prune_idle_implicit() {
  std::vector<std::string> pruned;
  std::unique_lock<std::shared_mutex> lock(mu_);
  for (auto it = tenants_.begin(); it != tenants_.end();) {
    if (it->second->implicit() && it->second->quota.usage().tasks_used == 0) {
      pruned.push_back(it->first);
      it = tenants_.erase(it);
    } else {
      ++it;
    }
  }
  return pruned;
}

bool TenantRegistry::is_registered(const std::string& tenant_id) const {
  auto info = find(tenant_id);
  return info && !info->implicit();
}

size_t TenantRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return tenants_.size();
}

std::map<std::string, TenantInfoPtr> TenantRegistry::all_tenants() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return std::map<std::string, TenantInfoPtr>(tenants_.begin(), tenants_.end());
}

std::string TenantRegistry::to_json() const {
  // Sorted by id so the output is stable across runs.
  const auto tenants = all_tenants();
  std::string out = "{";
  bool first = true;
  for (const auto& [id, info] : tenants) {
    if (!first) out += ',';
    first = false;
    out += '"';
    out += jsonlite::escape(id);
    out += "\":";
    out += info->to_json();
  }
  out += '}';
  return out;
}

}  // namespace warden
