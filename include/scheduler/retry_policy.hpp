#pragma once
#include <chrono>
#include <cmath>

// Bounded exponential backoff. Retry numbers are 1-based.
// A backoff factor below 1, NaN or infinite is treated as 1 (fixed delay).
class RetryPolicy {
public:
  RetryPolicy(std::chrono::milliseconds initial_delay = std::chrono::seconds(15),
              double backoff_factor = 2.0,
              unsigned int max_retries = 3,
              std::chrono::milliseconds max_delay = std::chrono::minutes(5))
    : initial_delay_(initial_delay), backoff_factor_(std::isfinite(backoff_factor) && backoff_factor >= 1.0 ? backoff_factor : 1.0),
      max_retries_(max_retries), max_delay_(max_delay) {}
  std::chrono::milliseconds DelayFor(unsigned int retry) const;
  bool AllowsRetry(unsigned int retry) const { return retry >= 1 && retry <= max_retries_; }
  std::chrono::milliseconds InitialDelay() const { return initial_delay_; }
  double BackoffFactor() const { return backoff_factor_; }
  unsigned int MaxRetries() const { return max_retries_; }
  std::chrono::milliseconds MaxDelay() const { return max_delay_; }
private:
  std::chrono::milliseconds initial_delay_;
  double backoff_factor_;
  unsigned int max_retries_;
  std::chrono::milliseconds max_delay_;
};
