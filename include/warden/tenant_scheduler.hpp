#pragma once

// warden/tenant_scheduler.hpp — Strict-priority, round-robin-within-tier
// tenant selection.
//
// DESIGN:
//   Tenants are grouped by TenantConfig::priority. schedule() always serves
//   the highest non-empty tier; inside a tier it rotates a cursor over the
//   tenants in insertion order. There is no weighting across tiers: a lower
//   tier only runs when every higher tier is empty.
//
// INVARIANTS:
//   - A tier of N tenants returns every member exactly once per N calls.
//   - A tenant id is in at most one tier. add_tenant() of a known id moves it
//     (re-registration with a new priority) and refreshes the record.
//   - One mutex covers tier selection and cursor advance.

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "warden/tenant.hpp"

namespace warden {

class TenantScheduler {
 public:
  TenantScheduler() = default;

  TenantScheduler(const TenantScheduler&) = delete;
  TenantScheduler& operator=(const TenantScheduler&) = delete;

  void add_tenant(TenantInfoPtr info);
  bool remove_tenant(const std::string& tenant_id);

  // nullptr when no tenant is registered.
  TenantInfoPtr schedule();

  size_t size() const;
  std::vector<int> priorities() const;  // highest first

 private:
  struct Tier {
    std::vector<TenantInfoPtr> members;
    size_t cursor{0};
  };

  bool erase_locked(const std::string& tenant_id);

  mutable std::mutex mu_;
  std::map<int, Tier, std::greater<int>> tiers_;
};

}  // namespace warden
