/**
 * This file is part of s3fcp.
 */

#include "network/range_source.h"

#include <inttypes.h>

#include <string>

#include "network/http_client.h"
#include "network/sink_mem.h"
#include "util/logging.h"

using namespace std;  // NOLINT

namespace s3fcp {

download::Failures RangeSource::ToFetchFailure(
  const download::Failures error)
{
  switch (error) {
    case download::kFailOk:
    case download::kFailTransient:
    case download::kFailLocalIO:
    case download::kFailCanceled:
      return error;
    default:
      return download::kFailPermanent;
  }
}


download::Failures RangeSource::VerifyContentRange(
  const Chunk &chunk, const string &content_range)
{
  uint64_t first, last, total;
  if (!download::HttpClient::ParseContentRange(content_range,
                                               &first, &last, &total))
  {
    LogS3fcp(kLogDownload, kLogDebug, "chunk %" PRIu64 ": invalid "
             "Content-Range '%s'", chunk.index, content_range.c_str());
    return download::kFailPermanent;
  }
  if ((first != chunk.start) || (last != chunk.end)) {
    LogS3fcp(kLogDownload, kLogDebug, "chunk %" PRIu64 ": requested %" PRIu64
             "-%" PRIu64 ", received %" PRIu64 "-%" PRIu64, chunk.index,
             chunk.start, chunk.end, first, last);
    return download::kFailPermanent;
  }
  return download::kFailOk;
}


download::Failures RangeSource::Fetch(const ObjectDescriptor &descriptor,
                                      const Chunk &chunk,
                                      MemSink *payload,
                                      unsigned *throttle_ms)
{
  unsigned throttle_ms_dummy;
  if (throttle_ms == NULL)
    throttle_ms = &throttle_ms_dummy;
  *throttle_ms = 0;

  if ((chunk.end < chunk.start) || (chunk.end >= descriptor.size)) {
    LogS3fcp(kLogDownload, kLogDebug | kLogStderr,
             "chunk %" PRIu64 " [%" PRIu64 ", %" PRIu64 "] is outside of %s",
             chunk.index, chunk.start, chunk.end,
             descriptor.Describe().c_str());
    return download::kFailPermanent;
  }
  if (!descriptor.supports_ranges &&
      ((chunk.start != 0) || (chunk.size() != descriptor.size)))
  {
    LogS3fcp(kLogDownload, kLogDebug | kLogStderr,
             "%s cannot serve partial ranges",
             descriptor.Describe().c_str());
    return download::kFailPermanent;
  }

  payload->Reset();
  if (!payload->Reserve(chunk.size()))
    return download::kFailLocalIO;

  download::Failures retval =
    ToFetchFailure(DoFetch(descriptor, chunk, payload, throttle_ms));
  if (retval != download::kFailOk)
    return retval;

  if (payload->pos() != chunk.size()) {
    LogS3fcp(kLogDownload, kLogDebug,
             "chunk %" PRIu64 " of %s: received %zu bytes, expected %" PRIu64,
             chunk.index, descriptor.Describe().c_str(), payload->pos(),
             chunk.size());
    return download::kFailTransient;
  }
  return download::kFailOk;
}

}  // namespace s3fcp
