/**
 * This file is part of s3fcp.
 */

#include "crypto/hash.h"

#include <nettle/hmac.h>
#include <nettle/sha2.h>

#include <string>

using namespace std;  // NOLINT

namespace shash {

static string HexFromSha256(const unsigned char digest[SHA256_DIGEST_SIZE]) {
  const char kHexDigits[] = "0123456789abcdef";
  string result;
  result.reserve(2 * SHA256_DIGEST_SIZE);
  for (unsigned i = 0; i < SHA256_DIGEST_SIZE; ++i) {
    result.push_back(kHexDigits[digest[i] >> 4]);
    result.push_back(kHexDigits[digest[i] & 0x0f]);
  }
  return result;
}


string Sha256Mem(const unsigned char *buffer, const unsigned buffer_size) {
  unsigned char digest[SHA256_DIGEST_SIZE];
  struct sha256_ctx ctx;
  sha256_init(&ctx);
  sha256_update(&ctx, buffer_size, buffer);
  sha256_digest(&ctx, SHA256_DIGEST_SIZE, digest);
  return HexFromSha256(digest);
}


string Sha256String(const string &content) {
  return Sha256Mem(reinterpret_cast<const unsigned char *>(content.data()),
                   content.length());
}


string Hmac256(const string &key, const string &content, bool raw_output) {
  struct hmac_sha256_ctx ctx;
  unsigned char digest[SHA256_DIGEST_SIZE];
  hmac_sha256_set_key(&ctx, key.length(),
                      reinterpret_cast<const uint8_t *>(key.data()));
  hmac_sha256_update(&ctx, content.length(),
                     reinterpret_cast<const uint8_t *>(content.data()));
  hmac_sha256_digest(&ctx, SHA256_DIGEST_SIZE, digest);
  if (raw_output)
    return string(reinterpret_cast<const char *>(digest), SHA256_DIGEST_SIZE);
  return HexFromSha256(digest);
}

}  // namespace shash
