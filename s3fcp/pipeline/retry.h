/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_PIPELINE_RETRY_H_
#define S3FCP_PIPELINE_RETRY_H_

#include "network/network_errors.h"

namespace s3fcp {

/**
 * Attempt budget and exponential backoff around a single fetch.  The policy
 * keeps no state; attempts are counted by the caller starting at 1, so that
 * one policy object is shared by all workers.
 */
class RetryPolicy {
 public:
  static const unsigned kDefaultMaxAttempts = 3;
  static const unsigned kDefaultInitDelayMs = 100;
  static const unsigned kDefaultMaxDelayMs = 5000;
  static const double kDefaultMultiplier;

  RetryPolicy()
    : max_attempts_(kDefaultMaxAttempts)
    , init_delay_ms_(kDefaultInitDelayMs)
    , max_delay_ms_(kDefaultMaxDelayMs)
    , multiplier_(kDefaultMultiplier)
  { }
  RetryPolicy(const unsigned max_attempts,
              const unsigned init_delay_ms,
              const unsigned max_delay_ms,
              const double multiplier);

  /**
   * Whether a failed attempt number attempt (1-based) is followed by another
   * one.  Only transient failures are retried.
   */
  bool ShouldRetry(const unsigned attempt,
                   const download::Failures failure) const;
  /**
   * Delay after the failed attempt number attempt, i.e.
   * min(max_delay, init_delay * multiplier^(attempt - 1))
   */
  unsigned GetDelayMs(const unsigned attempt) const;

  unsigned max_attempts() const { return max_attempts_; }
  unsigned init_delay_ms() const { return init_delay_ms_; }
  unsigned max_delay_ms() const { return max_delay_ms_; }
  double multiplier() const { return multiplier_; }

 private:
  unsigned max_attempts_;
  unsigned init_delay_ms_;
  unsigned max_delay_ms_;
  double multiplier_;
};

}  // namespace s3fcp

#endif  // S3FCP_PIPELINE_RETRY_H_
