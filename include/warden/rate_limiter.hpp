#pragma once

// warden/rate_limiter.hpp — Request-rate limiting for tenant intake.
//
// RateLimiter is the seam: admission only calls allow(). Concrete limiters:
//   TokenBucketLimiter    rate tokens/second, bucket of `burst`, starts full.
//   SlidingWindowLimiter  at most `limit` admissions in any trailing window.
//   NoopRateLimiter       always allows.
//   PerTenantRateLimiter  one limiter per tenant id, built by a factory on
//                         first use.
//
// wait_time() reports how long until the next allow() would succeed without
// consuming anything; zero when a request is admissible now.

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "warden/types.hpp"

namespace warden {

class RateLimiter {
 public:
  virtual ~RateLimiter() = default;
  virtual bool allow() = 0;
  virtual std::chrono::nanoseconds wait_time() = 0;
};

class TokenBucketLimiter : public RateLimiter {
 public:
  TokenBucketLimiter(double rate_per_sec, int burst);

  bool allow() override;
  std::chrono::nanoseconds wait_time() override;

  void set_rate(double rate_per_sec);
  double rate() const;
  int burst() const { return burst_; }

 private:
  void refill_locked(Clock::time_point now);

  mutable std::mutex mu_;
  double rate_;
  const int burst_;
  double tokens_;
  Clock::time_point last_refill_;
};

class SlidingWindowLimiter : public RateLimiter {
 public:
  SlidingWindowLimiter(size_t limit, std::chrono::nanoseconds window);

  bool allow() override;
  std::chrono::nanoseconds wait_time() override;

 private:
  void evict_locked(Clock::time_point now);

  std::mutex mu_;
  const size_t limit_;
  const std::chrono::nanoseconds window_;
  std::deque<Clock::time_point> admitted_;
};

class NoopRateLimiter : public RateLimiter {
 public:
  bool allow() override { return true; }
  std::chrono::nanoseconds wait_time() override { return std::chrono::nanoseconds(0); }
};

class PerTenantRateLimiter {
 public:
  using Factory = std::function<std::unique_ptr<RateLimiter>(const std::string& tenant_id)>;

  explicit PerTenantRateLimiter(Factory factory);

  bool allow(const std::string& tenant_id);

  // Zero for a tenant that has no limiter yet.
  std::chrono::nanoseconds wait_time(const std::string& tenant_id);

  // Drops the tenant's limiter; the next allow() rebuilds it.
  void reset(const std::string& tenant_id);
  size_t size() const;

 private:
  Factory factory_;
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<RateLimiter>> limiters_;
};

}  // namespace warden
