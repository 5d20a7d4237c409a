/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_PIPELINE_ORDERING_COLLECTOR_H_
#define S3FCP_PIPELINE_ORDERING_COLLECTOR_H_

#include <stdint.h>

#include <map>

#include "network/network_errors.h"
#include "util/single_copy.h"

namespace s3fcp {

class MemSink;
class Sink;

/**
 * Restores the chunk order.  Payloads arrive in any order; the payload of the
 * next expected index is written to the output right away together with all
 * consecutive payloads that were buffered before.  Everything else waits in
 * the buffer.
 *
 * The collector is owned by a single thread and not thread-safe.  After the
 * first failure nothing is written anymore and Accept() keeps returning that
 * failure.
 */
class OrderingCollector : SingleCopy {
 public:
  OrderingCollector(Sink *output, const uint64_t num_chunks);
  ~OrderingCollector();

  /**
   * Takes ownership of payload.  Fails with kFailOrderingViolation on an index
   * that was written or buffered before or that is out of bounds, and with
   * kFailLocalIO if the output does not take all bytes.
   */
  download::Failures Accept(const uint64_t index, MemSink *payload);

  bool IsComplete() const {
    return (next_expected_ == num_chunks_) && buffer_.empty();
  }

  uint64_t next_expected() const { return next_expected_; }
  uint64_t num_chunks() const { return num_chunks_; }
  unsigned buffered() const { return buffer_.size(); }
  unsigned max_buffered() const { return max_buffered_; }
  uint64_t bytes_written() const { return bytes_written_; }
  download::Failures failure() const { return failure_; }

 private:
  download::Failures Write(MemSink *payload);

  Sink *output_;
  const uint64_t num_chunks_;
  uint64_t next_expected_;
  std::map<uint64_t, MemSink *> buffer_;
  unsigned max_buffered_;
  uint64_t bytes_written_;
  download::Failures failure_;
};

}  // namespace s3fcp

#endif  // S3FCP_PIPELINE_ORDERING_COLLECTOR_H_
