/**
 * This file is part of s3fcp.
 */

#include "pipeline/retry.h"

namespace s3fcp {

const unsigned RetryPolicy::kDefaultMaxAttempts;
const unsigned RetryPolicy::kDefaultInitDelayMs;
const unsigned RetryPolicy::kDefaultMaxDelayMs;
const double RetryPolicy::kDefaultMultiplier = 2.0;


RetryPolicy::RetryPolicy(
  const unsigned max_attempts,
  const unsigned init_delay_ms,
  const unsigned max_delay_ms,
  const double multiplier)
  : max_attempts_((max_attempts == 0) ? 1 : max_attempts)
  , init_delay_ms_(init_delay_ms)
  , max_delay_ms_(max_delay_ms)
  , multiplier_((multiplier < 1.0) ? 1.0 : multiplier)
{ }


bool RetryPolicy::ShouldRetry(
  const unsigned attempt,
  const download::Failures failure) const
{
  if (!download::IsRetryable(failure))
    return false;
  return attempt < max_attempts_;
}


unsigned RetryPolicy::GetDelayMs(const unsigned attempt) const {
  double delay = init_delay_ms_;
  for (unsigned i = 1; i < attempt; ++i) {
    delay *= multiplier_;
    if (delay >= max_delay_ms_)
      return max_delay_ms_;
  }
  if (delay >= max_delay_ms_)
    return max_delay_ms_;
  return static_cast<unsigned>(delay);
}

}  // namespace s3fcp
