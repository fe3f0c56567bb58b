// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_DIGEST_H
#define MU_DIGEST_H

#include <stddef.h>

#define MU_DIGEST_MAX_SIZE 64 //large enough for any hash function up to SHA512

namespace MicroUuid {

struct DigestInput {
    const unsigned char *data;
    size_t len;
};

/*
 * Interface which allows MicroUuid to use the hash functions of the local crypto library. Name-based
 * UUIDs need MD5 (version 3) or SHA1 (version 5)
 */
class DigestFunction {
public:
    virtual ~DigestFunction() = default;

    /*
     * Hashes the concatenation of `parts[0]` to `parts[count - 1]` and writes the digest into `out`
     *
     * Returns the digest size in bytes, or -1 on failure or if `size` is too small
     */
    virtual int digest(const DigestInput *parts, size_t count, unsigned char *out, size_t size) = 0;
};

} //namespace MicroUuid
#endif
