/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_PIPELINE_PROGRESS_H_
#define S3FCP_PIPELINE_PROGRESS_H_

#include <stdint.h>

#include <string>

#include "util/atomic.h"
#include "util/single_copy.h"

namespace s3fcp {

/**
 * Receives the number of bytes of every completed chunk.  Report() is called
 * concurrently by the fetch workers.
 */
class ProgressSink : SingleCopy {
 public:
  virtual ~ProgressSink() { }
  virtual void Report(const uint64_t bytes_delta) = 0;
  /**
   * Called once after the last byte was written successfully
   */
  virtual void Finish() { }
};


class NullProgress : public ProgressSink {
 public:
  virtual void Report(const uint64_t /* bytes_delta */) { }
};


/**
 * Renders "<done> / <total> (<percent>) <throughput>" on a single stderr line,
 * at most once per interval.
 */
class StderrProgress : public ProgressSink {
 public:
  static const unsigned kDefaultIntervalMs = 250;

  explicit StderrProgress(const uint64_t total_bytes,
                          const unsigned interval_ms = kDefaultIntervalMs);
  virtual ~StderrProgress() { }

  virtual void Report(const uint64_t bytes_delta);
  virtual void Finish();

  uint64_t bytes_done() { return atomic_read64(&bytes_done_); }
  std::string Render(const uint64_t now_ms);

 private:
  const uint64_t total_bytes_;
  const unsigned interval_ms_;
  const uint64_t start_ms_;
  atomic_int64 bytes_done_;
  atomic_int64 last_print_ms_;
};

}  // namespace s3fcp

#endif  // S3FCP_PIPELINE_PROGRESS_H_
