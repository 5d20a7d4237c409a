/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_NETWORK_URI_H_
#define S3FCP_NETWORK_URI_H_

#include <string>

#include "network/network_errors.h"
#include "object.h"

namespace s3fcp {

/**
 * Fills the location part of descriptor from a command line source.
 * Accepted are s3://bucket/key (the key may contain further slashes) and
 * http:// or https:// URLs, which are taken verbatim.  Everything else is
 * kFailBadUrl.
 */
download::Failures ParseSourceUri(const std::string &uri,
                                  ObjectDescriptor *descriptor);

}  // namespace s3fcp

#endif  // S3FCP_NETWORK_URI_H_
