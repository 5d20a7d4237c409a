/**
 * This file is part of s3fcp.
 */

#include "network/sink_mem.h"

#include <errno.h>

#include <cassert>
#include <cstdlib>
#include <cstring>
#include <string>

#include "util/exception.h"
#include "util/string.h"

namespace s3fcp {

static unsigned char *AllocBuffer(size_t size, unsigned char *old_buffer) {
  void *mem = realloc(old_buffer, size);
  if (mem == NULL) {
    PANIC(kLogStderr | kLogSyslogErr,
          "Out of memory: cannot allocate %zu bytes", size);
  }
  return static_cast<unsigned char *>(mem);
}


MemSink::MemSink(size_t size, size_t max_size)
  : Sink(true), size_(size), pos_(0), data_(NULL), max_size_(max_size)
{
  assert(size <= max_size);
  if (size > 0)
    data_ = AllocBuffer(size, NULL);
}


MemSink::~MemSink() {
  free(data_);
}


/**
 * @returns on success: number of bytes written
 *          on failure: -errno.
 */
int64_t MemSink::Write(const void *buf, uint64_t sz) {
  if (pos_ + sz > size_) {
    if (pos_ + sz > max_size_)
      return -EFBIG;
    size_t new_size = (pos_ + sz < size_ * 2) ? size_ * 2 : pos_ + sz;
    if (new_size > max_size_)
      new_size = max_size_;
    data_ = AllocBuffer(new_size, data_);
    size_ = new_size;
  }
  if (sz > 0)
    memcpy(data_ + pos_, buf, sz);
  pos_ += sz;
  return static_cast<int64_t>(sz);
}


/**
 * Drops the written data and starts over at position zero.
 */
int MemSink::Reset() {
  free(data_);
  data_ = NULL;
  size_ = 0;
  pos_ = 0;
  return 0;
}


bool MemSink::IsValid() {
  return (size_ == 0 && pos_ == 0 && data_ == NULL) ||
         (size_ > 0 && data_ != NULL);
}


bool MemSink::Reserve(size_t size) {
  if (size <= size_) {
    pos_ = 0;
    return true;
  }
  if (size > max_size_)
    return false;
  free(data_);
  size_ = size;
  pos_ = 0;
  data_ = AllocBuffer(size, NULL);
  return true;
}


std::string MemSink::Describe() {
  std::string result = "Memory sink with ";
  result += "size: " + StringifyUint(size_);
  result += " - current pos: " + StringifyUint(pos_);
  return result;
}

}  // namespace s3fcp
