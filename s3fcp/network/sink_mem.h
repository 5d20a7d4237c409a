/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_NETWORK_SINK_MEM_H_
#define S3FCP_NETWORK_SINK_MEM_H_

#include <stdint.h>

#include <cstddef>
#include <string>

#include "network/sink.h"

namespace s3fcp {

/**
 * MemSink is a data sink that writes to an unsigned char* buffer.  It holds
 * the payload of one chunk on its way from a worker to the ordering
 * collector.
 *
 * The sink owns its buffer and grows it on demand, up to max_size.
 */
class MemSink : public Sink {
 public:
  MemSink() : Sink(true), size_(0), pos_(0),
              data_(NULL), max_size_(kMaxMemSize) { }
  MemSink(size_t size, size_t max_size);
  virtual ~MemSink();

  /**
   * Appends data to the sink.  The buffer grows up to max_size, beyond that
   * the write fails with -EFBIG.
   */
  virtual int64_t Write(const void *buf, uint64_t sz);
  virtual int Reset();
  virtual bool IsValid();
  virtual int Flush() { return 0; }
  virtual bool Reserve(size_t size);
  virtual bool RequiresReserve() { return true; }
  virtual std::string Describe();

  size_t size() { return size_; }
  size_t pos() { return pos_; }
  unsigned char* data() { return data_; }

  /**
   * Upper bound for the in-memory payload of a single chunk (4 GiB)
   */
  static const size_t kMaxMemSize = 4096ul * 1024ul * 1024ul;

 private:
  size_t size_;
  size_t pos_;
  unsigned char *data_;
  const size_t max_size_;
};

}  // namespace s3fcp

#endif  // S3FCP_NETWORK_SINK_MEM_H_
