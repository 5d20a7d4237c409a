/**
 * This file is part of s3fcp.
 *
 * Value types that describe the remote object and its byte range slices.
 */

#ifndef S3FCP_OBJECT_H_
#define S3FCP_OBJECT_H_

#include <stdint.h>

#include <string>

namespace s3fcp {

enum BackendKind {
  kBackendS3 = 0,
  kBackendHttp,
};

/**
 * Where the object lives and what the metadata probe found out about it.
 * Filled by RangeSource::Probe() and read-only afterwards.
 */
struct ObjectDescriptor {
  ObjectDescriptor()
    : backend(kBackendHttp)
    , size(0)
    , supports_ranges(false)
    , probed(false)
  { }

  std::string Describe() const {
    if (backend == kBackendS3) {
      std::string result = "s3://" + bucket + "/" + key;
      if (!version_id.empty())
        result += " (version " + version_id + ")";
      return result;
    }
    return url;
  }

  BackendKind backend;
  std::string bucket;
  std::string key;
  std::string url;
  /**
   * Empty means the latest version
   */
  std::string version_id;
  uint64_t size;
  bool supports_ranges;
  bool probed;
};


/**
 * An inclusive byte range [start, end] of the object.  The index is the
 * position of the chunk in the output stream.
 */
struct Chunk {
  Chunk() : index(0), start(0), end(0) { }
  Chunk(uint64_t i, uint64_t s, uint64_t e) : index(i), start(s), end(e) { }

  uint64_t size() const { return end - start + 1; }

  bool operator ==(const Chunk &other) const {
    return (index == other.index) && (start == other.start) &&
           (end == other.end);
  }

  uint64_t index;
  uint64_t start;
  uint64_t end;
};

}  // namespace s3fcp

#endif  // S3FCP_OBJECT_H_
