/**
 * This file is part of s3fcp.
 */

#include "network/sink_file.h"

#include <inttypes.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <string>

#include "util/logging.h"
#include "util/string.h"

using namespace std;  // NOLINT

namespace s3fcp {

FileSink::FileSink(FILE *stream, bool is_owner, const string &name)
  : Sink(is_owner)
  , stream_(stream)
  , name_(name)
  , bytes_written_(0)
{ }


FileSink::~FileSink() {
  if (is_owner_ && (stream_ != NULL)) {
    if (fclose(stream_) != 0) {
      LogS3fcp(kLogDownload, kLogDebug, "closing %s failed (%d)",
               name_.c_str(), errno);
    }
  }
}


/**
 * @returns on success: sz
 *          on failure: -errno, or -EIO if the stream does not say
 */
int64_t FileSink::Write(const void *buf, uint64_t sz) {
  const unsigned char *cursor = static_cast<const unsigned char *>(buf);
  uint64_t remaining = sz;
  while (remaining > 0) {
    errno = 0;
    const size_t nbytes = fwrite(cursor, 1, remaining, stream_);
    if (nbytes == 0) {
      if (errno == EINTR) {
        clearerr(stream_);
        continue;
      }
      const int error = (errno != 0) ? errno : EIO;
      LogS3fcp(kLogDownload, kLogDebug, "writing to %s failed after %" PRIu64
               " bytes (%d)", name_.c_str(), bytes_written_, error);
      return -error;
    }
    cursor += nbytes;
    remaining -= nbytes;
    bytes_written_ += nbytes;
  }
  return static_cast<int64_t>(sz);
}


int FileSink::Reset() {
  if (fflush(stream_) != 0)
    return -errno;
  struct stat info;
  if (fstat(fileno(stream_), &info) != 0)
    return -errno;
  if (!S_ISREG(info.st_mode))
    return -ESPIPE;
  if ((ftruncate(fileno(stream_), 0) != 0) ||
      (fseek(stream_, 0, SEEK_SET) != 0))
    return -errno;
  bytes_written_ = 0;
  return 0;
}


int FileSink::Flush() {
  if (fflush(stream_) != 0)
    return (errno != 0) ? -errno : -EIO;
  return 0;
}


string FileSink::Describe() {
  return name_ + " (" + StringifyUint(bytes_written_) + " bytes written)";
}

}  // namespace s3fcp
