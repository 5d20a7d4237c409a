/**
 * This file is part of s3fcp.
 */

#include "pipeline/pipeline.h"

#include <inttypes.h>

#include <cstdio>
#include <string>
#include <vector>

#include "network/range_source.h"
#include "network/sink.h"
#include "pipeline/chunk_planner.h"
#include "pipeline/ordering_collector.h"
#include "pipeline/task_fetch.h"
#include "pipeline/worker_pool.h"
#include "util/exception.h"
#include "util/logging.h"
#include "util/posix.h"
#include "util/string.h"

using namespace std;  // NOLINT

namespace s3fcp {

const unsigned Pipeline::kDefaultConcurrency;
const unsigned Pipeline::kMaxConcurrency;
const uint64_t Pipeline::kDefaultChunkSize;


Pipeline::Pipeline(
  RangeSource *source,
  const RetryPolicy &retry_policy,
  const unsigned concurrency,
  const uint64_t chunk_size)
  : source_(source)
  , retry_policy_(retry_policy)
  , concurrency_(concurrency)
  , chunk_size_(chunk_size)
  , num_workers_(0)
  , has_run_(false)
{
  atomic_init32(&abort_flag_);
}


Pipeline::~Pipeline() { }


download::Failures Pipeline::Probe(ObjectDescriptor *descriptor) {
  unsigned attempt = 0;
  while (true) {
    attempt++;
    const download::Failures retval = source_->Probe(descriptor);
    if (retval == download::kFailOk)
      return retval;
    if (!retry_policy_.ShouldRetry(attempt, retval)) {
      LogS3fcp(kLogPipeline, kLogDebug, "probing %s failed after %u "
               "attempts: %s", descriptor->Describe().c_str(), attempt,
               download::Code2Ascii(retval));
      return retval;
    }
    const unsigned delay_ms = retry_policy_.GetDelayMs(attempt);
    LogS3fcp(kLogPipeline, kLogDebug | DefaultLogging::info | kLogVerbose,
             "probe attempt %u failed (%s), retrying in %u ms",
             attempt, download::Code2Ascii(retval), delay_ms);
    SafeSleepMs(delay_ms);
  }
}


void Pipeline::Abort() {
  atomic_cas32(&abort_flag_, 0, 1);
  // Wakes up the dispatcher if it waits for a free slot
  *window_ = 0;
}


void *Pipeline::MainDispatch(void *data) {
  Pipeline *pipeline = reinterpret_cast<Pipeline *>(data);
  const vector<Chunk> &chunks = pipeline->chunks_;

  uint64_t dispatched = 0;
  for (; dispatched < chunks.size(); ++dispatched) {
    pipeline->window_->Increment();
    if (pipeline->IsAborted())
      break;
    pipeline->tube_jobs_->EnqueueBack(new ChunkJob(chunks[dispatched]));
  }
  LogS3fcp(kLogPipeline, kLogDebug, "dispatched %" PRIu64 " of %zu chunks",
           dispatched, chunks.size());

  for (unsigned i = 0; i < pipeline->num_workers_; ++i)
    pipeline->tube_jobs_->EnqueueBack(ChunkJob::CreateQuitBeacon());
  return NULL;
}


PipelineResult Pipeline::Run(
  const ObjectDescriptor &descriptor,
  Sink *output,
  ProgressSink *progress)
{
  PipelineResult result;
  if (has_run_)
    PANIC(kLogStderr, "pipeline for %s started twice",
          descriptor.Describe().c_str());
  has_run_ = true;

  if (!descriptor.probed) {
    result.failure = download::kFailPermanent;
    result.message = descriptor.Describe() + ": object was not probed";
    return result;
  }
  if ((concurrency_ == 0) || (concurrency_ > kMaxConcurrency)) {
    result.failure = download::kFailPermanent;
    result.message = "invalid concurrency " + StringifyUint(concurrency_);
    return result;
  }
  if (!PlanChunks(descriptor, chunk_size_, &chunks_)) {
    result.failure = download::kFailPermanent;
    result.message = "invalid chunk size " + StringifyUint(chunk_size_);
    return result;
  }
  result.num_chunks = chunks_.size();

  OrderingCollector collector(output, chunks_.size());
  if (!chunks_.empty()) {
    num_workers_ = (chunks_.size() < concurrency_) ?
                   static_cast<unsigned>(chunks_.size()) : concurrency_;
    tube_jobs_ = new Tube<ChunkJob>(concurrency_);
    tube_results_ = new Tube<ChunkResult>(concurrency_);
    window_ = new SynchronizingCounter<uint64_t>(concurrency_);

    WorkerPool<ChunkJob> workers;
    for (unsigned i = 0; i < num_workers_; ++i) {
      workers.Add(new TaskFetch(tube_jobs_.weak_ref(),
                                tube_results_.weak_ref(),
                                source_, &descriptor, &retry_policy_,
                                progress, &abort_flag_));
    }
    workers.Start();

    pthread_t thread_dispatch;
    int retval = pthread_create(&thread_dispatch, NULL, MainDispatch, this);
    if (retval != 0) {
      PANIC(kLogStderr, "failed to create dispatcher thread (error: %d)",
            retval);
    }
    LogS3fcp(kLogPipeline, kLogDebug, "transferring %zu chunks of %s with %u "
             "workers", chunks_.size(), descriptor.Describe().c_str(),
             num_workers_);

    // Collect until every worker terminated, also after a failure
    unsigned workers_done = 0;
    while (workers_done < num_workers_) {
      UniquePtr<ChunkResult> chunk_result(tube_results_->PopFront());
      if (chunk_result->IsWorkerDone()) {
        workers_done++;
        continue;
      }
      if (IsAborted())
        continue;

      download::Failures failure = chunk_result->failure();
      uint64_t failed_index = chunk_result->index();
      if (failure == download::kFailOk) {
        const uint64_t written_before = collector.next_expected();
        failure = collector.Accept(chunk_result->index(),
                                  chunk_result->ReleasePayload());
        for (uint64_t i = written_before; i < collector.next_expected(); ++i)
          window_->Decrement();
        // A failed write can concern a chunk that was buffered before
        if ((failure == download::kFailLocalIO) &&
            (collector.next_expected() < chunks_.size()))
        {
          failed_index = collector.next_expected();
        }
      }
      if (failure != download::kFailOk) {
        const Chunk &chunk = (failed_index < chunks_.size()) ?
                             chunks_[failed_index] : chunk_result->chunk();
        result.failure = failure;
        result.failed_chunk = static_cast<int64_t>(chunk.index);
        result.attempts = (failed_index == chunk_result->index()) ?
                          chunk_result->attempts() : 1;
        result.message = "chunk " + StringifyUint(chunk.index) + " [" +
          StringifyUint(chunk.start) + "-" + StringifyUint(chunk.end) +
          "] of " + descriptor.Describe() + ": " +
          download::Code2Ascii(failure);
        if (result.attempts > 1)
          result.message += " (" + StringifyUint(result.attempts) +
                            " attempts)";
        Abort();
      }
    }

    retval = pthread_join(thread_dispatch, NULL);
    if (retval != 0)
      PANIC(kLogStderr, "failed to join dispatcher thread (error: %d)", retval);
    workers.Join();
  }

  result.bytes_written = collector.bytes_written();
  result.max_buffered = collector.max_buffered();
  if (!result.IsOk())
    return result;

  if (!collector.IsComplete()) {
    result.failure = download::kFailOrderingViolation;
    result.failed_chunk = static_cast<int64_t>(collector.next_expected());
    result.message = descriptor.Describe() + ": missing chunk " +
                     StringifyUint(collector.next_expected());
    return result;
  }
  if (output->Flush() != 0) {
    result.failure = download::kFailLocalIO;
    result.message = "failed to flush " + output->Describe();
    return result;
  }
  return result;
}

}  // namespace s3fcp
