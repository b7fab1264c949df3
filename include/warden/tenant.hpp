#pragma once

// warden/tenant.hpp — Tenant records and the tenant registry.
//
// DESIGN:
//   Each tenant owns one ResourceQuota and one TenantStats record, bundled in
//   a TenantInfo held by shared_ptr so the scheduler and in-flight tasks can
//   keep a record alive after it has been replaced or removed.
//
// UNKNOWN-TENANT POLICY (one rule for every entry point):
//   - get_tenant() of an unknown id synthesizes a TenantInfo from the default
//     configuration and does NOT store it. Repeated lookups leak nothing.
//   - check_quota() and record_task_*() of an unknown id lazily adopt the
//     default configuration: an implicit record is created and stored on first
//     use, so the quota it reserves is the quota later released.
//   - release_quota() never adopts. Releasing for a tenant with no stored
//     record fails with tenant_not_found (nothing was ever reserved there),
//     and releasing a record that holds no reservation fails with not_found.
//   - reserve_quota() hands back the record it reserved against. Callers that
//     outlive a re-registration or removal release on that record, never by id.
//   - Implicit records stay until prune_idle_implicit() drops the ones that
//     hold no reservation.
//   - The empty tenant id is never adopted; it fails with tenant_not_found.
//
// INVARIANTS:
//   - TenantConfig is immutable once registered; register_tenant() with the
//     same id replaces the whole record (fresh quota, fresh stats).
//   - Hot-path counters are atomics; the registry mutex covers map membership
//     only and is never held while a quota or stats counter is touched.

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "warden/resource_quota.hpp"
#include "warden/types.hpp"

namespace warden {

struct TenantConfig {
  std::string tenant_id;
  int max_workers{0};
  int max_queue_size{0};     // concurrent task limit, 0 = unlimited
  double cpu_quota{0.0};     // CPU budget, 0 = unlimited
  int64_t memory_quota_mb{0};
  double rate_limit{0.0};    // tasks per second, 0 = unlimited
  int priority{0};           // higher = scheduled first

  std::string to_json() const;
};

struct TenantStatsSnapshot {
  int64_t tasks_submitted{0};
  int64_t tasks_completed{0};
  int64_t tasks_rejected{0};
  int64_t total_cpu_ms{0};
  int64_t last_memory_bytes{0};

  std::string to_json() const;
};

struct TenantStats {
  std::atomic<int64_t> tasks_submitted{0};
  std::atomic<int64_t> tasks_completed{0};
  std::atomic<int64_t> tasks_rejected{0};
  std::atomic<int64_t> total_cpu_ms{0};
  std::atomic<int64_t> last_memory_bytes{0};

  TenantStatsSnapshot snapshot() const;
};

class TenantInfo {
 public:
  TenantInfo(TenantConfig config, bool implicit);

  const TenantConfig config;
  ResourceQuota quota;
  TenantStats stats;

  // True when the record was adopted from the default configuration rather
  // than registered explicitly.
  bool implicit() const { return implicit_; }
  const std::string& id() const { return config.tenant_id; }

  bool reserve() { return quota.check_and_reserve(); }
  // False when nothing was reserved on this record.
  bool release() { return quota.release(); }
  void record_completed(int64_t cpu_ms, int64_t memory_bytes);

  std::string to_json() const;

 private:
  bool implicit_;
};

using TenantInfoPtr = std::shared_ptr<TenantInfo>;

class TenantRegistry {
 public:
  explicit TenantRegistry(TenantConfig default_config);

  TenantRegistry(const TenantRegistry&) = delete;
  TenantRegistry& operator=(const TenantRegistry&) = delete;

  // Fails with invalid_config when config.tenant_id is empty.
  Status register_tenant(const TenantConfig& config);

  // Stored record, or a synthesized non-stored one built from the defaults.
  TenantInfoPtr get_tenant(const std::string& tenant_id) const;

  // Stored record only; nullptr otherwise.
  TenantInfoPtr find(const std::string& tenant_id) const;

  // value == false with ok status means the quota is exhausted.
  Result<bool> check_quota(const std::string& tenant_id);
  Status release_quota(const std::string& tenant_id);

  // Same reservation as check_quota(), returning the record it was taken on.
  // An exhausted quota fails with quota_exceeded and a null value.
  Result<TenantInfoPtr> reserve_quota(const std::string& tenant_id);

  Status record_task_submitted(const std::string& tenant_id);
  Status record_task_completed(const std::string& tenant_id, int64_t cpu_ms, int64_t memory_bytes);
  Status record_task_rejected(const std::string& tenant_id);

  Result<TenantStatsSnapshot> tenant_stats(const std::string& tenant_id) const;

  bool remove_tenant(const std::string& tenant_id);
  // Drops implicit records with no reservation held; returns their ids.
  std::vector<std::string> prune_idle_implicit();
  bool is_registered(const std::string& tenant_id) const;  // explicit registrations only
  size_t size() const;

  std::map<std::string, TenantInfoPtr> all_tenants() const;
  const TenantConfig& default_config() const { return default_config_; }

  std::string to_json() const;

 private:
  TenantInfoPtr get_or_adopt(const std::string& tenant_id);
  TenantConfig config_for(const std::string& tenant_id) const;

  const TenantConfig default_config_;
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, TenantInfoPtr> tenants_;
};

}  // namespace warden
