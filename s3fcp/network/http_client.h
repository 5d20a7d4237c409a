/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_NETWORK_HTTP_CLIENT_H_
#define S3FCP_NETWORK_HTTP_CLIENT_H_

#include <curl/curl.h>
#include <pthread.h>
#include <stdint.h>

#include <set>
#include <string>
#include <vector>

#include "network/network_errors.h"
#include "util/single_copy.h"

namespace s3fcp {
class Sink;
}

namespace download {

/**
 * Request and response state of a single HTTP transfer.  The caller fills in
 * the request part, HttpClient::Perform() fills in the response part.
 */
struct JobInfo {
  JobInfo()
    : head_request(false)
    , range_start(-1)
    , range_end(-1)
    , expected_http_code(0)
    , max_body_size(0)
    , sink(NULL)
    , error_code(kFailOk)
    , http_code(-1)
    , has_content_length(false)
    , content_length(0)
    , throttle_ms(0)
    , body_size(0)
  { }

  // Request
  std::string url;
  bool head_request;
  std::vector<std::string> headers;
  /**
   * Inclusive byte range; -1 requests the whole resource
   */
  int64_t range_start;
  int64_t range_end;
  /**
   * A successful status other than this one fails the transfer as
   * kFailPermanent.  0 accepts any 2xx status.
   */
  int expected_http_code;
  /**
   * The transfer is cut with kFailTransient if the body grows beyond this
   * size.  0 means unlimited.
   */
  uint64_t max_body_size;
  s3fcp::Sink *sink;

  // Response
  Failures error_code;
  int http_code;
  bool has_content_length;
  uint64_t content_length;
  std::string accept_ranges;
  std::string content_range;
  /**
   * Server provided lower bound for the next retry (Retry-After)
   */
  unsigned throttle_ms;
  uint64_t body_size;
};


/**
 * Synchronous HTTP transfers over a pool of reusable curl easy handles.  An
 * HttpClient is shared by all worker threads; Perform() is thread-safe and
 * blocks the calling thread for the duration of the transfer.
 *
 * Transport level problems and HTTP status codes are classified into
 * download::Failures here, so that the range sources and the retry policy
 * never deal with curl or HTTP details.
 */
class HttpClient : SingleCopy {
 public:
  struct Options {
    Options()
      : timeout_sec(60)
      , low_speed_limit(1024)
      , connect_timeout_sec(20)
      , pool_max_handles(16)
      , follow_redirects(true)
      , user_agent("s3fcp")
    { }
    /**
     * Transfers slower than low_speed_limit bytes/s for timeout_sec are
     * aborted
     */
    unsigned timeout_sec;
    unsigned low_speed_limit;
    unsigned connect_timeout_sec;
    unsigned pool_max_handles;
    bool follow_redirects;
    std::string user_agent;
  };

  explicit HttpClient(const Options &options);
  ~HttpClient();

  Failures Perform(JobInfo *info);

  /**
   * Maps an HTTP status code of an unsuccessful response to a failure class
   */
  static Failures ClassifyHttpCode(const int http_code);
  static Failures ClassifyCurlCode(const int curl_error);
  static int ParseHttpCode(const char digits[3]);
  static unsigned ParseThrottleIndicator(const std::string &header_line);
  /**
   * Parses the value of a Content-Range header ("bytes 10-19/100").  An
   * unknown total ("bytes 10-19/*") leaves total at 0.
   */
  static bool ParseContentRange(const std::string &value,
                                uint64_t *first,
                                uint64_t *last,
                                uint64_t *total);

  static const unsigned kDefault429ThrottleMs;
  static const unsigned kMax429ThrottleMs;

 private:
  CURL *AcquireCurlHandle();
  void ReleaseCurlHandle(CURL *handle);
  void InitializeRequest(JobInfo *info, CURL *handle,
                         struct curl_slist **header_list);
  void VerifyAndFinalize(const int curl_error, JobInfo *info);

  Options options_;
  pthread_mutex_t lock_pool_;
  std::set<CURL *> pool_handles_idle_;
  std::set<CURL *> pool_handles_inuse_;
};

}  // namespace download

#endif  // S3FCP_NETWORK_HTTP_CLIENT_H_
