/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_NETWORK_SINK_FILE_H_
#define S3FCP_NETWORK_SINK_FILE_H_

#include <stdint.h>

#include <cstdio>
#include <string>

#include "network/sink.h"

namespace s3fcp {

/**
 * Sequential output stream on top of a FILE, usually stdout or the file given
 * by --output.  The ordering collector is the only writer.  Partial writes are
 * completed before Write() returns.
 *
 * With is_owner set, the FILE is closed on destruction.
 */
class FileSink : public Sink {
 public:
  FileSink(FILE *stream, bool is_owner, const std::string &name);
  virtual ~FileSink();

  virtual int64_t Write(const void *buf, uint64_t sz);
  /**
   * Fails with -ESPIPE on pipes and terminals.
   */
  virtual int Reset();
  virtual bool IsValid() { return stream_ != NULL; }
  virtual int Flush();
  virtual bool Reserve(size_t /* size */) { return true; }
  virtual bool RequiresReserve() { return false; }
  virtual std::string Describe();

 private:
  FILE *stream_;
  std::string name_;
  uint64_t bytes_written_;
};

}  // namespace s3fcp

#endif  // S3FCP_NETWORK_SINK_FILE_H_
