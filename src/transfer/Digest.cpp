#include "Digest.h"
#include <string.h>

Digest::Digest() : ctx(EVP_MD_CTX_new())
{
    reset();
}

Digest::~Digest()
{
    EVP_MD_CTX_free(ctx);
}

bool Digest::reset()
{
    ready = ctx && EVP_DigestInit_ex(ctx, EVP_md5(), NULL) == 1;
    return ready;
}

bool Digest::update(const uint8_t *bytes, size_t numBytes)
{
    if (!ready)
        return false;
    if (numBytes == 0)
        return true;

    ready = EVP_DigestUpdate(ctx, bytes, numBytes) == 1;
    return ready;
}

bool Digest::finalize(uint8_t *out)
{
    if (!ready)
        return false;

    unsigned int len = 0;
    ready = false;
    return EVP_DigestFinal_ex(ctx, out, &len) == 1 && len == DIGEST_SIZE;
}

bool Digest::hash(const uint8_t *bytes, size_t numBytes, uint8_t *out)
{
    Digest d;
    return d.update(bytes, numBytes) && d.finalize(out);
}

bool Digest::truncatedHash(const uint8_t *bytes, size_t numBytes, uint8_t *out)
{
    uint8_t full[DIGEST_SIZE];
    if (!hash(bytes, numBytes, full))
        return false;

    memcpy(out, full, TRUNCATED_HASH_SIZE);
    return true;
}
