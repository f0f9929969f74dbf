#pragma once

#include "configuration.h"
#include <openssl/evp.h>
#include <stddef.h>
#include <stdint.h>

/**
 * MD5 over a byte stream, backed by OpenSSL's EVP interface.
 *
 * Used whole for file hashes and super-chunk acknowledgements, and truncated to its first TRUNCATED_HASH_SIZE bytes for the
 * per frame check.
 */
class Digest
{
  public:
    Digest();
    ~Digest();

    Digest(const Digest &) = delete;
    Digest &operator=(const Digest &) = delete;

    /// Start over, dropping anything hashed so far
    bool reset();
    bool update(const uint8_t *bytes, size_t numBytes);

    /// Write DIGEST_SIZE bytes to out.  The digest must be reset() before it is used again.
    bool finalize(uint8_t *out);

    /// One-shot helpers
    static bool hash(const uint8_t *bytes, size_t numBytes, uint8_t *out);
    static bool truncatedHash(const uint8_t *bytes, size_t numBytes, uint8_t *out);

  private:
    EVP_MD_CTX *ctx;
    bool ready = false;
};
