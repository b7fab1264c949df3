#include "warden/rate_limiter.hpp"

#include <algorithm>

namespace warden {

// ---------------------------------------------------------------------------
// TokenBucketLimiter
// ---------------------------------------------------------------------------

TokenBucketLimiter::TokenBucketLimiter(double rate_per_sec, int burst)
    : rate_(rate_per_sec), burst_(std::max(1, burst)), tokens_(static_cast<double>(std::max(1, burst))),
      last_refill_(Clock::now()) {}

void TokenBucketLimiter::refill_locked(Clock::time_point now) {
  const double elapsed_s = std::chrono::duration<double>(now - last_refill_).count();
  last_refill_ = now;
  if (elapsed_s <= 0.0) return;
  tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed_s * rate_);
}

bool TokenBucketLimiter::allow() {
  std::lock_guard<std::mutex> lock(mu_);
  refill_locked(Clock::now());
  if (tokens_ >= 1.0) {
    tokens_ -= 1.0;
    return true;
  }
  return false;
}

std::chrono::nanoseconds TokenBucketLimiter::wait_time() {
  std::lock_guard<std::mutex> lock(mu_);
  refill_locked(Clock::now());
  if (tokens_ >= 1.0) return std::chrono::nanoseconds(0);
  if (rate_ <= 0.0) return std::chrono::nanoseconds::max();
  const double seconds = (1.0 - tokens_) / rate_;
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(seconds));
}

void TokenBucketLimiter::set_rate(double rate_per_sec) {
  std::lock_guard<std::mutex> lock(mu_);
  refill_locked(Clock::now());  // settle tokens earned at the old rate
  rate_ = rate_per_sec;
}

double TokenBucketLimiter::rate() const {
  std::lock_guard<std::mutex> lock(mu_);
  return rate_;
}

// ---------------------------------------------------------------------------
// SlidingWindowLimiter
// ---------------------------------------------------------------------------

SlidingWindowLimiter::SlidingWindowLimiter(size_t limit, std::chrono::nanoseconds window)
    : limit_(limit), window_(window) {}

void SlidingWindowLimiter::evict_locked(Clock::time_point now) {
  while (!admitted_.empty() && now - admitted_.front() >= window_) admitted_.pop_front();
}

bool SlidingWindowLimiter::allow() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Clock::now();
  evict_locked(now);
  if (admitted_.size() >= limit_) return false;
  admitted_.push_back(now);
  return true;
}

std::chrono::nanoseconds SlidingWindowLimiter::wait_time() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Clock::now();
  evict_locked(now);
  if (admitted_.size() < limit_) return std::chrono::nanoseconds(0);
  if (admitted_.empty()) return window_;  // limit_ == 0
  return std::chrono::duration_cast<std::chrono::nanoseconds>(admitted_.front() + window_ - now);
}

// ---------------------------------------------------------------------------
// PerTenantRateLimiter
// ---------------------------------------------------------------------------

PerTenantRateLimiter::PerTenantRateLimiter(Factory factory) : factory_(std::move(factory)) {}

bool PerTenantRateLimiter::allow(const std::string& tenant_id) {
  std::shared_ptr<RateLimiter> limiter;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = limiters_.find(tenant_id);
    if (it != limiters_.end()) limiter = it->second;
  }
  if (!limiter) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto [it, inserted] = limiters_.try_emplace(tenant_id, nullptr);
    if (inserted) {
      std::unique_ptr<RateLimiter> built = factory_ ? factory_(tenant_id) : nullptr;
      if (built) {
        it->second = std::move(built);
      } else {
        it->second = std::make_shared<NoopRateLimiter>();
      }
    }
    limiter = it->second;
  }
  return limiter->allow();
}

std::chrono::nanoseconds PerTenantRateLimiter::wait_time(const std::string& tenant_id) {
  std::shared_ptr<RateLimiter> limiter;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = limiters_.find(tenant_id);
    if (it == limiters_.end()) return std::chrono::nanoseconds(0);
    limiter = it->second;
  }
  return limiter->wait_time();
}

void PerTenantRateLimiter::reset(const std::string& tenant_id) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  limiters_.erase(tenant_id);
}

size_t PerTenantRateLimiter::size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return limiters_.size();
}

}  // namespace warden
