/**
 * This file is part of s3fcp.
 */

#include "pipeline/task_fetch.h"

#include <inttypes.h>

#include "network/range_source.h"
#include "network/sink_mem.h"
#include "pipeline/progress.h"
#include "pipeline/retry.h"
#include "util/logging.h"
#include "util/pointer.h"
#include "util/posix.h"

namespace s3fcp {

const unsigned TaskFetch::kSleepStepMs;


bool TaskFetch::InterruptibleSleepMs(
  const unsigned ms,
  atomic_int32 *abort_flag)
{
  unsigned remaining = ms;
  while (remaining > 0) {
    if (atomic_read32(abort_flag) != 0)
      return false;
    const unsigned step = (remaining < kSleepStepMs) ? remaining : kSleepStepMs;
    SafeSleepMs(step);
    remaining -= step;
  }
  return atomic_read32(abort_flag) == 0;
}


void TaskFetch::Process(ChunkJob *job) {
  UniquePtr<ChunkJob> job_guard(job);
  const Chunk &chunk = job->chunk();
  if (has_failed_ || IsAborted()) {
    LogS3fcp(kLogPipeline, kLogDebug, "dropping chunk %" PRIu64, chunk.index);
    return;
  }

  UniquePtr<MemSink> payload(new MemSink());
  download::Failures retval = download::kFailOk;
  unsigned attempt = 0;
  while (true) {
    attempt++;
    unsigned throttle_ms = 0;
    retval = source_->Fetch(*descriptor_, chunk, payload.weak_ref(),
                            &throttle_ms);
    if (retval == download::kFailOk)
      break;
    if (!retry_policy_->ShouldRetry(attempt, retval))
      break;

    unsigned delay_ms = retry_policy_->GetDelayMs(attempt);
    if (throttle_ms > delay_ms)
      delay_ms = throttle_ms;
    LogS3fcp(kLogPipeline, kLogDebug | DefaultLogging::info | kLogVerbose,
             "chunk %" PRIu64 " attempt %u failed (%s), retrying in %u ms",
             chunk.index, attempt, download::Code2Ascii(retval), delay_ms);
    if (!InterruptibleSleepMs(delay_ms, abort_flag_)) {
      retval = download::kFailCanceled;
      break;
    }
  }

  if (retval != download::kFailOk) {
    has_failed_ = true;
    LogS3fcp(kLogPipeline, kLogDebug, "chunk %" PRIu64 " failed after %u "
             "attempts: %s", chunk.index, attempt,
             download::Code2Ascii(retval));
    tube_out_->EnqueueBack(new ChunkResult(chunk, retval, attempt));
    return;
  }

  progress_->Report(chunk.size());
  tube_out_->EnqueueBack(new ChunkResult(chunk, payload.Release(), attempt));
}


void TaskFetch::OnTerminate() {
  tube_out_->EnqueueBack(ChunkResult::CreateWorkerDone());
}

}  // namespace s3fcp
