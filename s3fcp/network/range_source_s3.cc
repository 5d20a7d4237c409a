/**
 * This file is part of s3fcp.
 */

#include "network/range_source_s3.h"

#include <inttypes.h>

#include <string>
#include <vector>

#include "crypto/hash.h"
#include "network/http_client.h"
#include "network/sink_mem.h"
#include "util/logging.h"
#include "util/string.h"

using namespace std;  // NOLINT

namespace s3fcp {

const char *S3RangeSource::kEmptyPayloadHash =
  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";


S3RangeSource::S3RangeSource(
  const S3Config &config,
  download::HttpClient *http_client)
  : config_(config)
  , http_client_(http_client)
{
  string endpoint = config_.endpoint;
  if (endpoint.empty())
    endpoint = "https://s3." + config_.region + ".amazonaws.com";
  while (HasSuffix(endpoint, "/", false))
    endpoint.erase(endpoint.length() - 1);

  const string::size_type pos_scheme = endpoint.find("://");
  if (pos_scheme == string::npos) {
    scheme_ = "https";
    hostname_port_ = endpoint;
  } else {
    scheme_ = endpoint.substr(0, pos_scheme);
    hostname_port_ = endpoint.substr(pos_scheme + 3);
  }
}


string S3RangeSource::GetUriEncode(const string &val, bool encode_slash) {
  string result;
  const unsigned len = val.length();
  result.reserve(len);
  for (unsigned i = 0; i < len; ++i) {
    const unsigned char c = val[i];
    if ((c >= 'A' && c <= 'Z') ||
        (c >= 'a' && c <= 'z') ||
        (c >= '0' && c <= '9') ||
        c == '_' || c == '-' || c == '~' || c == '.')
    {
      result.push_back(c);
    } else if (c == '/') {
      if (encode_slash) {
        result += "%2F";
      } else {
        result.push_back(c);
      }
    } else {
      result.push_back('%');
      result.push_back((c / 16) + ((c / 16 <= 9) ? '0' : 'A'-10));
      result.push_back((c % 16) + ((c % 16 <= 9) ? '0' : 'A'-10));
    }
  }
  return result;
}


string S3RangeSource::GetAwsV4SigningKey(
  const string &secret_key,
  const string &date,
  const string &region,
  const string &service)
{
  const string date_key = shash::Hmac256("AWS4" + secret_key, date, true);
  const string date_region_key = shash::Hmac256(date_key, region, true);
  const string date_region_service_key =
    shash::Hmac256(date_region_key, service, true);
  return shash::Hmac256(date_region_service_key, "aws4_request", true);
}


S3RangeSource::Request S3RangeSource::MkRequest(
  const string &bucket,
  const string &key,
  const string &version_id) const
{
  Request request;
  if (config_.dns_buckets) {
    request.host = bucket + "." + hostname_port_;
    request.canonical_uri = GetUriEncode("/" + key, false);
  } else {
    request.host = hostname_port_;
    request.canonical_uri = GetUriEncode("/" + bucket + "/" + key, false);
  }
  if (!version_id.empty())
    request.canonical_query = "versionId=" + GetUriEncode(version_id, true);

  request.url = scheme_ + "://" + request.host + request.canonical_uri;
  if (!request.canonical_query.empty())
    request.url += "?" + request.canonical_query;
  return request;
}


/**
 * The Amazon AWS4 authorization header according to
 * http://docs.aws.amazon.com/AmazonS3/latest/API/sigv4-auth-using-authorization-header.html
 */
void S3RangeSource::MkV4Authz(
  const string &method,
  const Request &request,
  const string &range,
  const string &timestamp,
  vector<string> *headers) const
{
  const string date = timestamp.substr(0, 8);
  vector<string> tokens = SplitString(request.host, ':');
  string canonical_hostname = tokens[0];
  if (tokens.size() == 2) {
    const uint64_t port = String2Uint64(tokens[1]);
    const bool default_port = (scheme_ == "http" && port == 80) ||
                              (scheme_ == "https" && port == 443);
    if (!default_port)
      canonical_hostname += ":" + tokens[1];
  }

  string signed_headers = "host;";
  string canonical_headers = "host:" + canonical_hostname + "\n";
  if (!range.empty()) {
    signed_headers += "range;";
    canonical_headers += "range:" + range + "\n";
  }
  signed_headers += "x-amz-content-sha256;x-amz-date";
  canonical_headers +=
    string("x-amz-content-sha256:") + kEmptyPayloadHash + "\n" +
    "x-amz-date:" + timestamp + "\n";
  if (!config_.session_token.empty()) {
    signed_headers += ";x-amz-security-token";
    canonical_headers +=
      "x-amz-security-token:" + config_.session_token + "\n";
  }

  const string scope = date + "/" + config_.region + "/s3/aws4_request";
  const string canonical_request =
    method + "\n" +
    request.canonical_uri + "\n" +
    request.canonical_query + "\n" +
    canonical_headers + "\n" +
    signed_headers + "\n" +
    kEmptyPayloadHash;

  const string hash_request = shash::Sha256String(canonical_request);

  const string string_to_sign =
    "AWS4-HMAC-SHA256\n" +
    timestamp + "\n" +
    scope + "\n" +
    hash_request;

  const string signing_key = GetAwsV4SigningKey(
    config_.secret_key, date, config_.region, "s3");
  const string signature = shash::Hmac256(signing_key, string_to_sign);

  headers->push_back(string("X-Amz-Content-Sha256: ") + kEmptyPayloadHash);
  headers->push_back("X-Amz-Date: " + timestamp);
  if (!config_.session_token.empty())
    headers->push_back("X-Amz-Security-Token: " + config_.session_token);
  headers->push_back(
    "Authorization: AWS4-HMAC-SHA256 "
    "Credential=" + config_.access_key + "/" + scope + ","
    "SignedHeaders=" + signed_headers + ","
    "Signature=" + signature);
}


download::Failures S3RangeSource::Probe(ObjectDescriptor *descriptor) {
  const Request request = MkRequest(descriptor->bucket, descriptor->key,
                                    descriptor->version_id);
  download::JobInfo info;
  info.url = request.url;
  info.head_request = true;
  if (!config_.access_key.empty())
    MkV4Authz("HEAD", request, "", IsoTimestamp(), &info.headers);

  const download::Failures retval = http_client_->Perform(&info);
  if (retval != download::kFailOk) {
    LogS3fcp(kLogS3, kLogDebug, "HEAD %s failed: %s (HTTP %d)",
             info.url.c_str(), download::Code2Ascii(retval), info.http_code);
    return retval;
  }
  if (!info.has_content_length) {
    LogS3fcp(kLogS3, kLogDebug, "HEAD %s: missing Content-Length",
             info.url.c_str());
    return download::kFailUnsupported;
  }

  descriptor->backend = kBackendS3;
  descriptor->url = request.url;
  descriptor->size = info.content_length;
  descriptor->supports_ranges = true;
  descriptor->probed = true;
  LogS3fcp(kLogS3, kLogDebug, "%s: %" PRIu64 " bytes",
           descriptor->Describe().c_str(), descriptor->size);
  return download::kFailOk;
}


download::Failures S3RangeSource::DoFetch(
  const ObjectDescriptor &descriptor,
  const Chunk &chunk,
  MemSink *payload,
  unsigned *throttle_ms)
{
  const Request request = MkRequest(descriptor.bucket, descriptor.key,
                                    descriptor.version_id);
  const string range =
    "bytes=" + StringifyUint(chunk.start) + "-" + StringifyUint(chunk.end);

  download::JobInfo info;
  info.url = request.url;
  info.sink = payload;
  info.max_body_size = chunk.size();
  info.expected_http_code = 206;
  info.headers.push_back("Range: " + range);
  if (!config_.access_key.empty())
    MkV4Authz("GET", request, range, IsoTimestamp(), &info.headers);

  download::Failures retval = http_client_->Perform(&info);
  *throttle_ms = info.throttle_ms;
  if (retval == download::kFailOk)
    retval = VerifyContentRange(chunk, info.content_range);
  if (retval != download::kFailOk) {
    LogS3fcp(kLogS3, kLogDebug, "GET %s [%s] failed: %s (HTTP %d)",
             info.url.c_str(), range.c_str(), download::Code2Ascii(retval),
             info.http_code);
  }
  return retval;
}

}  // namespace s3fcp
