#include "warden/tenant_scheduler.hpp"

namespace warden {

bool TenantScheduler::erase_locked(const std::string& tenant_id) {
  for (auto tier_it = tiers_.begin(); tier_it != tiers_.end(); ++tier_it) {
    auto& tier = tier_it->second;
    for (size_t i = 0; i < tier.members.size(); ++i) {
      if (tier.members[i]->id() != tenant_id) continue;
      tier.members.erase(tier.members.begin() + static_cast<std::ptrdiff_t>(i));
      // Keep the cursor on the tenant that would have been served next.
      if (i < tier.cursor) --tier.cursor;
      if (tier.members.empty()) {
        tiers_.erase(tier_it);
      } else if (tier.cursor >= tier.members.size()) {
        tier.cursor = 0;
      }
      return true;
    }
  }
  return false;
}

void TenantScheduler::add_tenant(TenantInfoPtr info) {
  if (!info) return;
  std::lock_guard<std::mutex> lock(mu_);
  auto same_tier = tiers_.find(info->config.priority);
  if (same_tier != tiers_.end()) {
    for (auto& member : same_tier->second.members) {
      if (member->id() == info->id()) {
        // Same tier: keep the rotation position, refresh the record.
        member = std::move(info);
        return;
      }
    }
  }
  erase_locked(info->id());
  tiers_[info->config.priority].members.push_back(std::move(info));
}

bool TenantScheduler::remove_tenant(const std::string& tenant_id) {
  std::lock_guard<std::mutex> lock(mu_);
  return erase_locked(tenant_id);
}

TenantInfoPtr TenantScheduler::schedule() {
  std::lock_guard<std::mutex> lock(mu_);
  if (tiers_.empty()) return nullptr;
  // Empty tiers are erased eagerly, so the first tier is the highest non-empty.
  auto& tier = tiers_.begin()->second;
  TenantInfoPtr next = tier.members[tier.cursor];
  tier.cursor = (tier.cursor + 1) % tier.members.size();
  return next;
}

size_t TenantScheduler::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  size_t n = 0;
  for (const auto& [priority, tier] : tiers_) n += tier.members.size();
  return n;
}

std::vector<int> TenantScheduler::priorities() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<int> out;
  out.reserve(tiers_.size());
  for (const auto& [priority, tier] : tiers_) out.push_back(priority);
  return out;
}

}  // namespace warden
