/**
 * This file is part of s3fcp.
 */

#include "pipeline/ordering_collector.h"

#include <inttypes.h>

#include <map>

#include "network/sink.h"
#include "network/sink_mem.h"
#include "util/logging.h"
#include "util/pointer.h"

using namespace std;  // NOLINT

namespace s3fcp {

OrderingCollector::OrderingCollector(Sink *output, const uint64_t num_chunks)
  : output_(output)
  , num_chunks_(num_chunks)
  , next_expected_(0)
  , max_buffered_(0)
  , bytes_written_(0)
  , failure_(download::kFailOk)
{ }


OrderingCollector::~OrderingCollector() {
  for (map<uint64_t, MemSink *>::iterator i = buffer_.begin(),
       iEnd = buffer_.end(); i != iEnd; ++i)
  {
    delete i->second;
  }
}


download::Failures OrderingCollector::Write(MemSink *payload) {
  const int64_t written = output_->Write(payload->data(), payload->pos());
  if ((written < 0) || (static_cast<uint64_t>(written) != payload->pos())) {
    LogS3fcp(kLogPipeline, kLogDebug, "failed to write chunk %" PRIu64
             " (%" PRId64 " of %zu bytes) to %s", next_expected_, written,
             payload->pos(), output_->Describe().c_str());
    return download::kFailLocalIO;
  }
  bytes_written_ += payload->pos();
  next_expected_++;
  return download::kFailOk;
}


download::Failures OrderingCollector::Accept(
  const uint64_t index,
  MemSink *payload)
{
  UniquePtr<MemSink> payload_guard(payload);
  if (failure_ != download::kFailOk)
    return failure_;

  if ((index < next_expected_) || (index >= num_chunks_) ||
      (buffer_.find(index) != buffer_.end()))
  {
    LogS3fcp(kLogPipeline, kLogDebug, "unexpected chunk %" PRIu64
             " (next expected %" PRIu64 ", %" PRIu64 " chunks)",
             index, next_expected_, num_chunks_);
    failure_ = download::kFailOrderingViolation;
    return failure_;
  }

  if (index > next_expected_) {
    buffer_[index] = payload_guard.Release();
    if (buffer_.size() > max_buffered_)
      max_buffered_ = buffer_.size();
    return download::kFailOk;
  }

  failure_ = Write(payload);
  if (failure_ != download::kFailOk)
    return failure_;

  map<uint64_t, MemSink *>::iterator i = buffer_.begin();
  while ((i != buffer_.end()) && (i->first == next_expected_)) {
    UniquePtr<MemSink> buffered(i->second);
    buffer_.erase(i++);
    failure_ = Write(buffered.weak_ref());
    if (failure_ != download::kFailOk)
      return failure_;
  }
  return download::kFailOk;
}

}  // namespace s3fcp
