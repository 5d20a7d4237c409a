/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_NETWORK_RANGE_SOURCE_H_
#define S3FCP_NETWORK_RANGE_SOURCE_H_

#include <string>

#include "network/network_errors.h"
#include "object.h"
#include "util/single_copy.h"

namespace s3fcp {

class MemSink;

/**
 * Abstract access to a remote object: a metadata probe and reads of
 * inclusive byte ranges.  Implementations exist for S3 and for plain HTTP
 * origins.  Fetch() is called concurrently by all workers of the pipeline,
 * so implementations must be thread-safe.
 *
 * Failures of Fetch() are either kFailTransient (worth another attempt) or
 * kFailPermanent; Probe() may also report kFailNotFound, kFailAccessDenied
 * and kFailUnsupported.
 */
class RangeSource : SingleCopy {
 public:
  virtual ~RangeSource() { }

  /**
   * Issues a metadata-only request and fills in size and range capability.
   * The location fields of the descriptor must be set already.
   */
  virtual download::Failures Probe(ObjectDescriptor *descriptor) = 0;

  /**
   * Reads [chunk.start, chunk.end] into payload.  The payload is reset
   * first.  On success the payload contains exactly chunk.size() bytes; a
   * response of another length is a kFailTransient failure.  If the
   * descriptor does not support ranges, only the whole-object chunk is
   * valid and it is read with a plain request.
   *
   * If throttle_ms is given, it receives the server provided lower bound for
   * the delay before the next attempt (Retry-After), or 0.
   */
  download::Failures Fetch(const ObjectDescriptor &descriptor,
                           const Chunk &chunk,
                           MemSink *payload,
                           unsigned *throttle_ms = NULL);

  virtual std::string Describe() = 0;

 protected:
  virtual download::Failures DoFetch(const ObjectDescriptor &descriptor,
                                     const Chunk &chunk,
                                     MemSink *payload,
                                     unsigned *throttle_ms) = 0;

  /**
   * Failures of a range read that are not retryable all count as
   * kFailPermanent
   */
  static download::Failures ToFetchFailure(const download::Failures error);

  /**
   * A ranged reply must announce exactly the requested range.  A missing,
   * malformed or different Content-Range is kFailPermanent.
   */
  static download::Failures VerifyContentRange(
    const Chunk &chunk, const std::string &content_range);
};

}  // namespace s3fcp

#endif  // S3FCP_NETWORK_RANGE_SOURCE_H_
