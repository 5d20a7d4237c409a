/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_PIPELINE_ITEM_H_
#define S3FCP_PIPELINE_ITEM_H_

#include <stdint.h>

#include <string>

#include "network/network_errors.h"
#include "network/sink_mem.h"
#include "object.h"
#include "util/pointer.h"
#include "util/single_copy.h"

namespace s3fcp {

/**
 * A unit of work for the fetch workers.  The dispatcher ends the stream of
 * jobs with one quit beacon per worker.
 */
class ChunkJob : SingleCopy {
 public:
  explicit ChunkJob(const Chunk &chunk)
    : chunk_(chunk), is_quit_beacon_(false) { }

  static ChunkJob *CreateQuitBeacon() {
    ChunkJob *beacon = new ChunkJob(Chunk());
    beacon->is_quit_beacon_ = true;
    return beacon;
  }
  bool IsQuitBeacon() const { return is_quit_beacon_; }

  const Chunk &chunk() const { return chunk_; }

 private:
  Chunk chunk_;
  bool is_quit_beacon_;
};


/**
 * Outcome of a job, owned by the collector once it is popped from the result
 * tube.  Either a payload of exactly chunk.size() bytes or a failure.  A
 * terminating worker sends a result marked as worker-done.
 */
class ChunkResult : SingleCopy {
 public:
  ChunkResult(const Chunk &chunk, MemSink *payload, unsigned attempts)
    : chunk_(chunk)
    , payload_(payload)
    , failure_(download::kFailOk)
    , attempts_(attempts)
    , is_worker_done_(false)
  { }
  ChunkResult(const Chunk &chunk, download::Failures failure,
              unsigned attempts)
    : chunk_(chunk)
    , failure_(failure)
    , attempts_(attempts)
    , is_worker_done_(false)
  { }

  static ChunkResult *CreateWorkerDone() {
    ChunkResult *marker = new ChunkResult(Chunk(), download::kFailOk, 0);
    marker->is_worker_done_ = true;
    return marker;
  }
  bool IsWorkerDone() const { return is_worker_done_; }

  const Chunk &chunk() const { return chunk_; }
  uint64_t index() const { return chunk_.index; }
  MemSink *payload() { return payload_.weak_ref(); }
  MemSink *ReleasePayload() { return payload_.Release(); }
  download::Failures failure() const { return failure_; }
  unsigned attempts() const { return attempts_; }

 private:
  Chunk chunk_;
  UniquePtr<MemSink> payload_;
  download::Failures failure_;
  unsigned attempts_;
  bool is_worker_done_;
};

}  // namespace s3fcp

#endif  // S3FCP_PIPELINE_ITEM_H_
