/**
 * This file is part of s3fcp.
 *
 * SHA-256 digests and HMACs for AWS request signing, based on nettle.
 */

#ifndef S3FCP_CRYPTO_HASH_H_
#define S3FCP_CRYPTO_HASH_H_

#include <string>

namespace shash {

/**
 * Lower-case hex representation of the SHA-256 digest of buffer.
 */
std::string Sha256Mem(const unsigned char *buffer, const unsigned buffer_size);
std::string Sha256String(const std::string &content);

/**
 * HMAC-SHA256 of content.  With raw_output the 32 byte binary digest is
 * returned, which is needed to chain the AWS v4 signing key derivation.
 */
std::string Hmac256(const std::string &key,
                    const std::string &content,
                    bool raw_output = false);

}  // namespace shash

#endif  // S3FCP_CRYPTO_HASH_H_
