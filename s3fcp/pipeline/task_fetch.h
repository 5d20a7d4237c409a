/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_PIPELINE_TASK_FETCH_H_
#define S3FCP_PIPELINE_TASK_FETCH_H_

#include "network/network_errors.h"
#include "object.h"
#include "pipeline/item.h"
#include "pipeline/worker_pool.h"
#include "util/atomic.h"
#include "util/tube.h"

namespace s3fcp {

class ProgressSink;
class RangeSource;
class RetryPolicy;

/**
 * A fetch worker: pops chunk jobs, reads them from the range source with
 * retries and pushes one ChunkResult per job into the result tube.  Once the
 * shared abort flag is raised, or once this worker reported a failure, the
 * remaining jobs are dropped without network traffic until the quit beacon
 * arrives.  On termination the worker pushes a worker-done marker.
 */
class TaskFetch : public Worker<ChunkJob> {
 public:
  TaskFetch(Tube<ChunkJob> *tube_in,
            Tube<ChunkResult> *tube_out,
            RangeSource *source,
            const ObjectDescriptor *descriptor,
            const RetryPolicy *retry_policy,
            ProgressSink *progress,
            atomic_int32 *abort_flag)
    : Worker<ChunkJob>(tube_in)
    , tube_out_(tube_out)
    , source_(source)
    , descriptor_(descriptor)
    , retry_policy_(retry_policy)
    , progress_(progress)
    , abort_flag_(abort_flag)
    , has_failed_(false)
  { }

  /**
   * Sleeps in small steps so that an abort is noticed quickly.  Returns false
   * if the sleep was interrupted by the abort flag.
   */
  static bool InterruptibleSleepMs(const unsigned ms, atomic_int32 *abort_flag);

 protected:
  virtual void Process(ChunkJob *job);
  virtual void OnTerminate();

 private:
  static const unsigned kSleepStepMs = 50;

  bool IsAborted() { return atomic_read32(abort_flag_) != 0; }

  Tube<ChunkResult> *tube_out_;
  RangeSource *source_;
  const ObjectDescriptor *descriptor_;
  const RetryPolicy *retry_policy_;
  ProgressSink *progress_;
  atomic_int32 *abort_flag_;
  bool has_failed_;
};

}  // namespace s3fcp

#endif  // S3FCP_PIPELINE_TASK_FETCH_H_
