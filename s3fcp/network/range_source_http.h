/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_NETWORK_RANGE_SOURCE_HTTP_H_
#define S3FCP_NETWORK_RANGE_SOURCE_HTTP_H_

#include <string>

#include "network/range_source.h"

namespace download {
class HttpClient;
}

namespace s3fcp {

/**
 * Range reads from a plain HTTP(S) origin.  The probe is a HEAD request that
 * needs a Content-Length; "Accept-Ranges: bytes" marks the origin as range
 * capable.  Chunks are requested with a Range header and must come back as
 * 206 Partial Content.
 */
class HttpRangeSource : public RangeSource {
 public:
  /**
   * The HttpClient is not owned and must outlive the range source.
   */
  explicit HttpRangeSource(download::HttpClient *http_client)
    : http_client_(http_client) { }
  virtual ~HttpRangeSource() { }

  virtual download::Failures Probe(ObjectDescriptor *descriptor);
  virtual std::string Describe() { return "HTTP range source"; }

  static bool IsRangeAdvertisement(const std::string &accept_ranges);

 protected:
  virtual download::Failures DoFetch(const ObjectDescriptor &descriptor,
                                     const Chunk &chunk,
                                     MemSink *payload,
                                     unsigned *throttle_ms);

 private:
  download::HttpClient *http_client_;
};

}  // namespace s3fcp

#endif  // S3FCP_NETWORK_RANGE_SOURCE_HTTP_H_
