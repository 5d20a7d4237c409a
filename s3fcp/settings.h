/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_SETTINGS_H_
#define S3FCP_SETTINGS_H_

#include <stdint.h>

#include <string>

#include "network/http_client.h"
#include "network/range_source_s3.h"
#include "pipeline/pipeline.h"
#include "pipeline/retry.h"

class SimpleOptionsParser;

namespace s3fcp {

/**
 * Everything that can be configured in config files or the environment.
 * Command line flags are applied on top.
 */
struct Settings {
  Settings()
    : concurrency(Pipeline::kDefaultConcurrency)
    , chunk_size(Pipeline::kDefaultChunkSize)
  { }

  S3Config s3;
  download::HttpClient::Options http;
  RetryPolicy retry;
  unsigned concurrency;
  uint64_t chunk_size;
};

/**
 * Reads the S3FCP_* parameters (with AWS_* fallbacks for region and
 * credentials) into settings.  Returns false with a message on malformed
 * values.
 */
bool LoadSettings(SimpleOptionsParser *options,
                  Settings *settings,
                  std::string *error);

}  // namespace s3fcp

#endif  // S3FCP_SETTINGS_H_
