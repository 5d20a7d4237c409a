/**
 * This file is part of s3fcp.
 */

#include "network/range_source_http.h"

#include <inttypes.h>

#include <string>
#include <vector>

#include "network/http_client.h"
#include "network/sink_mem.h"
#include "util/logging.h"
#include "util/string.h"

using namespace std;  // NOLINT

namespace s3fcp {

/**
 * Accept-Ranges may list several units, "none" explicitly disables ranges.
 */
bool HttpRangeSource::IsRangeAdvertisement(const string &accept_ranges) {
  const vector<string> units = SplitString(accept_ranges, ',');
  for (unsigned i = 0; i < units.size(); ++i) {
    if (ToUpper(Trim(units[i], true)) == "BYTES")
      return true;
  }
  return false;
}


download::Failures HttpRangeSource::Probe(ObjectDescriptor *descriptor) {
  download::JobInfo info;
  info.url = descriptor->url;
  info.head_request = true;

  const download::Failures retval = http_client_->Perform(&info);
  if (retval != download::kFailOk) {
    LogS3fcp(kLogHttp, kLogDebug, "HEAD %s failed: %s (HTTP %d)",
             info.url.c_str(), download::Code2Ascii(retval), info.http_code);
    return retval;
  }
  if (!info.has_content_length) {
    LogS3fcp(kLogHttp, kLogDebug, "HEAD %s: missing Content-Length",
             info.url.c_str());
    return download::kFailUnsupported;
  }

  descriptor->backend = kBackendHttp;
  descriptor->size = info.content_length;
  descriptor->supports_ranges = IsRangeAdvertisement(info.accept_ranges);
  descriptor->probed = true;
  LogS3fcp(kLogHttp, kLogDebug, "%s: %" PRIu64 " bytes, ranges %s",
           info.url.c_str(), descriptor->size,
           descriptor->supports_ranges ? "supported" : "not supported");
  return download::kFailOk;
}


download::Failures HttpRangeSource::DoFetch(
  const ObjectDescriptor &descriptor,
  const Chunk &chunk,
  MemSink *payload,
  unsigned *throttle_ms)
{
  download::JobInfo info;
  info.url = descriptor.url;
  info.sink = payload;
  info.max_body_size = chunk.size();
  if (descriptor.supports_ranges) {
    info.range_start = static_cast<int64_t>(chunk.start);
    info.range_end = static_cast<int64_t>(chunk.end);
    info.expected_http_code = 206;
  } else {
    info.expected_http_code = 200;
  }

  download::Failures retval = http_client_->Perform(&info);
  *throttle_ms = info.throttle_ms;
  if ((retval == download::kFailOk) && descriptor.supports_ranges)
    retval = VerifyContentRange(chunk, info.content_range);
  if (retval != download::kFailOk) {
    LogS3fcp(kLogHttp, kLogDebug, "GET %s [%" PRIu64 "-%" PRIu64 "] failed: "
             "%s (HTTP %d)", info.url.c_str(), chunk.start, chunk.end,
             download::Code2Ascii(retval), info.http_code);
  }
  return retval;
}

}  // namespace s3fcp
