/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_PIPELINE_PIPELINE_H_
#define S3FCP_PIPELINE_PIPELINE_H_

#include <pthread.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "network/network_errors.h"
#include "object.h"
#include "pipeline/item.h"
#include "pipeline/retry.h"
#include "util/atomic.h"
#include "util/concurrency.h"
#include "util/pointer.h"
#include "util/single_copy.h"
#include "util/tube.h"

namespace s3fcp {

class ProgressSink;
class RangeSource;
class Sink;

/**
 * Outcome of a transfer.  On failure, bytes_written bytes of the object have
 * reached the output and must be treated as incomplete.
 */
struct PipelineResult {
  PipelineResult()
    : failure(download::kFailOk)
    , failed_chunk(-1)
    , attempts(0)
    , num_chunks(0)
    , bytes_written(0)
    , max_buffered(0)
  { }

  bool IsOk() const { return failure == download::kFailOk; }

  download::Failures failure;
  /**
   * Index of the chunk that caused the failure, -1 if not chunk specific
   */
  int64_t failed_chunk;
  unsigned attempts;
  uint64_t num_chunks;
  uint64_t bytes_written;
  /**
   * Largest number of out-of-order payloads held back at the same time
   */
  unsigned max_buffered;
  std::string message;
};


/**
 * Concurrent download of one object in chunks, written in order to a sink.
 *
 * Run() plans the chunks and wires three stages: a dispatcher thread feeds
 * chunk jobs into the job tube, a group of TaskFetch workers turns them into
 * ChunkResults, and the calling thread collects the results in order.  The
 * number of chunks between dispatch and write is bounded by the concurrency
 * (the window counter), which bounds the memory independent of the object
 * size and makes a slow output throttle the network side.
 *
 * On the first fatal failure the abort flag is raised and the window is
 * released; outstanding workers finish their current request, all remaining
 * jobs are dropped and Run() returns once every thread has terminated.
 */
class Pipeline : SingleCopy {
 public:
  static const unsigned kDefaultConcurrency = 10;
  static const unsigned kMaxConcurrency = 1024;
  static const uint64_t kDefaultChunkSize = 8 * 1000 * 1000;

  /**
   * The range source is not owned and must outlive the pipeline.
   */
  Pipeline(RangeSource *source,
           const RetryPolicy &retry_policy,
           const unsigned concurrency,
           const uint64_t chunk_size);
  ~Pipeline();

  /**
   * Resolves the object metadata, retrying transient failures according to
   * the retry policy.
   */
  download::Failures Probe(ObjectDescriptor *descriptor);

  /**
   * Transfers the probed object to output and reports the completed chunks
   * to progress.  Can be called once.
   */
  PipelineResult Run(const ObjectDescriptor &descriptor,
                     Sink *output,
                     ProgressSink *progress);

  unsigned concurrency() const { return concurrency_; }
  uint64_t chunk_size() const { return chunk_size_; }

 private:
  static void *MainDispatch(void *data);
  void Abort();
  bool IsAborted() { return atomic_read32(&abort_flag_) != 0; }

  RangeSource *source_;
  const RetryPolicy retry_policy_;
  const unsigned concurrency_;
  const uint64_t chunk_size_;

  std::vector<Chunk> chunks_;
  unsigned num_workers_;
  UniquePtr<Tube<ChunkJob> > tube_jobs_;
  UniquePtr<Tube<ChunkResult> > tube_results_;
  /**
   * Chunks dispatched but not yet written
   */
  UniquePtr<SynchronizingCounter<uint64_t> > window_;
  atomic_int32 abort_flag_;
  bool has_run_;
};

}  // namespace s3fcp

#endif  // S3FCP_PIPELINE_PIPELINE_H_
