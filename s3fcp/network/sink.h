/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_NETWORK_SINK_H_
#define S3FCP_NETWORK_SINK_H_

#include <stdint.h>

#include <cstddef>
#include <string>

#include "util/single_copy.h"

namespace s3fcp {

/**
 * A data sink that behaves like a writable file descriptor with a custom
 * implementation.  Response bodies are received into sinks and the ordered
 * object stream is written into one.
 */
class Sink : SingleCopy {
 protected:
  explicit Sink(bool is_owner) : is_owner_(is_owner) { }

 public:
  virtual ~Sink() { }
  /**
   * Appends data to the sink
   *
   * @returns on success: number of bytes written (can be less than requested)
   *          on failure: -errno.
   */
  virtual int64_t Write(const void *buf, uint64_t sz) = 0;
  /**
   * Truncate all written data and start over at position zero.
   *
   * @returns Success = 0
   *          Failure = -errno
   */
  virtual int Reset() = 0;
  /**
   * @returns true if the object is correctly initialized.
   */
  virtual bool IsValid() = 0;
  /**
   * Commit data to the sink
   * @returns Success = 0
   *          Failure = -errno
   */
  virtual int Flush() = 0;
  /**
   * Reserves space in sinks that require reservation (see RequiresReserve).
   * If successful, the current position is reset to 0.
   *
   * Fails if the sink does not own its data and the request is larger than
   * the current buffer, or if more space is requested than allowed.
   */
  virtual bool Reserve(size_t size) = 0;
  virtual bool RequiresReserve() = 0;
  /**
   * Return a string representation describing the type of sink and its status
   */
  virtual std::string Describe() = 0;

 protected:
  bool is_owner_;
};

}  // namespace s3fcp

#endif  // S3FCP_NETWORK_SINK_H_
