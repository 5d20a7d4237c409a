/**
 * This file is part of s3fcp.
 */

#ifndef TEST_UNITTESTS_C_HTTP_SERVER_H_
#define TEST_UNITTESTS_C_HTTP_SERVER_H_

#include <pthread.h>
#include <stdint.h>

#include <cassert>
#include <string>
#include <utility>
#include <vector>

#include "util/atomic.h"
#include "util/string.h"

typedef std::vector< std::pair<std::string, std::string> > HTTPHeaderList;

struct HTTPRequest {
  HTTPRequest() {
    content_length = 0;
  }

  /**
   * Case-insensitive lookup, empty if the header is missing
   */
  std::string GetHeader(const std::string &key) const {
    HTTPHeaderList::const_iterator it = headers.begin();
    HTTPHeaderList::const_iterator itend = headers.end();
    for (; it != itend; ++it) {
      if (ToUpper(it->first) == ToUpper(key))
        return it->second;
    }
    return "";
  }

  std::string method;
  std::string path;
  std::string protocol;
  uint64_t content_length;
  HTTPHeaderList headers;
  std::string body;
};

struct HTTPResponse {
  HTTPResponse() {
    protocol = "HTTP/1.1";
    code = 200;
    reason = "OK";
    omit_body = false;
  }

  /**
   * The Content-Length always reflects the body, also for HEAD responses
   * which set omit_body.
   */
  std::string ToString() const {
    std::string result;
    result += protocol + " " + StringifyInt(code) + " " + reason + "\r\n";
    HTTPHeaderList::const_iterator it = headers.begin();
    HTTPHeaderList::const_iterator itend = headers.end();
    for (; it != itend; ++it) {
      result += it->first + ": " + it->second + "\r\n";
    }
    result += "Content-Length: " + StringifyUint(body.length()) + "\r\n";
    result += "\r\n";
    if (!omit_body)
      result += body;
    return result;
  }

  void AddHeader(std::string key, std::string value) {
    headers.push_back(std::pair<std::string, std::string>(key, value));
  }

  std::string protocol;
  int code;
  std::string reason;
  HTTPHeaderList headers;
  std::string body;
  bool omit_body;
};

// Class for parsing HTTP request. Create one instance per one request.
// Works in a state-machine-like manner. Function Parse() parses characters
// one by one, changing the state of the parser and gradually filling the
// HTTPRequest object when needed.
class HTTPRequestParser {
 public:
  HTTPRequestParser();
  // Parses one character of the HTTP request.
  // Returns true if parsing is finished,
  // false if more characters need to be parsed.
  bool Parse(char c);
  bool IsFinished() const { return state_ == kFinished; }
  const HTTPRequest &GetParsedRequest() const;

 protected:
  void PushHeaderField();
  void FillContentLength();

  enum States {
    kBegin = 0,
    kMethod,
    kPath,
    kProtocol,
    kHeaderKey,
    kSpacePreHeaderVal,
    kHeaderVal,
    kCRFirst,
    kCRLFFirst,
    kCRSecond,
    kLFFirst,
    kBody,
    kFinished
  };

  int state_;
  std::string buffer_;
  std::string headerKeyBuffer_;
  uint64_t body_bytes_read_;
  HTTPRequest request_;
};


// A class providing HTTP server running on localhost.  Connections are
// served one after another and closed after the reply.
class MockHTTPServer {
 public:
  explicit MockHTTPServer(int port);
  ~MockHTTPServer();
  // Start function spawns the main thread. A custom response callback needs
  // to be set by SetResponseCallback before starting the HTTP server.
  bool Start();
  bool Stop();
  // The callback runs in the server thread and gets the custom data pointer
  // that was passed here.
  bool SetResponseCallback(
    HTTPResponse (*callback_func)(const HTTPRequest &, void*),
    void *data = NULL);

 protected:
  static void *Main(void *data);

  atomic_int32 running_;
  atomic_int32 server_thread_ready_;
  int server_port_;

  void *callback_data_;
  HTTPResponse (*callback_func_)(const HTTPRequest &, void*);

  pthread_t server_thread_;
};


/**
 * Serves a single in-memory object under any path.  HEAD and ranged GET
 * requests are answered like a static file server does.  A number of
 * failures can be injected before the server behaves.
 */
class MockObjectServer {
 public:
  MockObjectServer(int port, const std::string &content);
  ~MockObjectServer();

  void set_accept_ranges(bool value) { accept_ranges_ = value; }
  // The next n requests fail with the given status
  void InjectFailures(int n, int code, const std::string &retry_after = "") {
    num_failures_ = n;
    failure_code_ = code;
    retry_after_ = retry_after;
  }
  // Bodies of successful GET requests lose their last byte
  void set_truncate_bodies(bool value) { truncate_bodies_ = value; }

  int num_processed_requests() { return atomic_read32(&num_requests_); }
  HTTPRequest last_request();
  std::string url() const;

 protected:
  static HTTPResponse ObjectServerHandler(const HTTPRequest &req, void *data);
  HTTPResponse ServeRange(const std::string &range);

  int port_;
  std::string content_;
  bool accept_ranges_;
  int num_failures_;
  int failure_code_;
  std::string retry_after_;
  bool truncate_bodies_;
  atomic_int32 num_requests_;
  pthread_mutex_t lock_last_request_;
  HTTPRequest last_request_;
  MockHTTPServer *server_;
};


/**
 * Replies to every request with next_response_
 */
class MockGateway {
 public:
  explicit MockGateway(int port);
  ~MockGateway();

  HTTPResponse next_response_;
  HTTPRequest last_request_;

 private:
  static HTTPResponse GatewayHandler(const HTTPRequest &req, void *data);

  MockHTTPServer *server_;
};

#endif  // TEST_UNITTESTS_C_HTTP_SERVER_H_
