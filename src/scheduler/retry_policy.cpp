#include "scheduler/retry_policy.hpp"

std::chrono::milliseconds RetryPolicy::DelayFor(unsigned int retry) const {
  double delay = static_cast<double>(initial_delay_.count());
  const double cap = static_cast<double>(max_delay_.count());
  for (unsigned int i = 1; i < retry && delay < cap; ++i) delay *= backoff_factor_;
  if (delay > cap) delay = cap;
  return std::chrono::milliseconds(static_cast<long long>(delay));
}
