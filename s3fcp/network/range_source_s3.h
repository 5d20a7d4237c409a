/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_NETWORK_RANGE_SOURCE_S3_H_
#define S3FCP_NETWORK_RANGE_SOURCE_S3_H_

#include <string>
#include <vector>

#include "network/range_source.h"

namespace download {
class HttpClient;
}

namespace s3fcp {

/**
 * Connection parameters of an S3 compatible object store.  Without an access
 * key requests are sent unsigned (public buckets).
 */
struct S3Config {
  S3Config() : region("us-east-1"), dns_buckets(false) { }

  /**
   * scheme://host[:port], e.g. https://s3.eu-west-1.amazonaws.com
   */
  std::string endpoint;
  std::string region;
  std::string access_key;
  std::string secret_key;
  std::string session_token;
  /**
   * Virtual-host style addressing (bucket.host/key) instead of host/bucket/key
   */
  bool dns_buckets;
};


/**
 * Range reads from S3 with GetObject and HeadObject requests, authorized with
 * AWS signature version 4.  S3 always serves byte ranges.
 */
class S3RangeSource : public RangeSource {
 public:
  /**
   * Address and canonical form of a request for one object
   */
  struct Request {
    std::string url;
    std::string host;
    std::string canonical_uri;
    std::string canonical_query;
  };

  /**
   * The HttpClient is not owned and must outlive the range source.
   */
  S3RangeSource(const S3Config &config, download::HttpClient *http_client);
  virtual ~S3RangeSource() { }

  virtual download::Failures Probe(ObjectDescriptor *descriptor);
  virtual std::string Describe() { return "S3 range source"; }

  Request MkRequest(const std::string &bucket,
                    const std::string &key,
                    const std::string &version_id) const;
  /**
   * Appends the x-amz-* and Authorization headers.  The range, if not empty,
   * is sent as "Range: <range>" and is part of the signature.  The timestamp
   * has the form YYYYMMDDTHHMMSSZ.
   */
  void MkV4Authz(const std::string &method,
                 const Request &request,
                 const std::string &range,
                 const std::string &timestamp,
                 std::vector<std::string> *headers) const;

  static std::string GetUriEncode(const std::string &val, bool encode_slash);
  static std::string GetAwsV4SigningKey(const std::string &secret_key,
                                        const std::string &date,
                                        const std::string &region,
                                        const std::string &service);
  static const char *kEmptyPayloadHash;

 protected:
  virtual download::Failures DoFetch(const ObjectDescriptor &descriptor,
                                     const Chunk &chunk,
                                     MemSink *payload,
                                     unsigned *throttle_ms);

 private:
  const S3Config config_;
  download::HttpClient *http_client_;
  std::string scheme_;
  /**
   * host[:port] of the endpoint
   */
  std::string hostname_port_;
};

}  // namespace s3fcp

#endif  // S3FCP_NETWORK_RANGE_SOURCE_S3_H_
