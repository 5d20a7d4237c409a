/**
 * This file is part of s3fcp.
 */

#include "network/uri.h"

#include <string>

#include "util/logging.h"
#include "util/string.h"

using namespace std;  // NOLINT

namespace s3fcp {

download::Failures ParseSourceUri(const string &uri,
                                  ObjectDescriptor *descriptor)
{
  if (HasPrefix(uri, "http://", true) || HasPrefix(uri, "https://", true)) {
    const string::size_type pos_host = uri.find("://") + 3;
    if (pos_host >= uri.length() || uri[pos_host] == '/') {
      LogS3fcp(kLogDownload, kLogDebug, "missing host in %s", uri.c_str());
      return download::kFailBadUrl;
    }
    descriptor->backend = kBackendHttp;
    descriptor->url = uri;
    return download::kFailOk;
  }

  if (!HasPrefix(uri, "s3://", false)) {
    LogS3fcp(kLogDownload, kLogDebug, "unsupported scheme in %s", uri.c_str());
    return download::kFailBadUrl;
  }

  const string path = uri.substr(5);
  const string::size_type pos_slash = path.find('/');
  if (pos_slash == string::npos) {
    LogS3fcp(kLogDownload, kLogDebug, "missing object key in %s", uri.c_str());
    return download::kFailBadUrl;
  }
  const string bucket = path.substr(0, pos_slash);
  const string key = path.substr(pos_slash + 1);
  if (bucket.empty() || key.empty()) {
    LogS3fcp(kLogDownload, kLogDebug, "empty bucket or key in %s",
             uri.c_str());
    return download::kFailBadUrl;
  }

  descriptor->backend = kBackendS3;
  descriptor->bucket = bucket;
  descriptor->key = key;
  return download::kFailOk;
}

}  // namespace s3fcp
