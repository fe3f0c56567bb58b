// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_NAMEBASEDGENERATOR_H
#define MU_NAMEBASEDGENERATOR_H

#include <stddef.h>

#include <MicroUuid/Core/Uuid.h>
#include <MicroUuid/Core/Digest.h>

namespace MicroUuid {

/*
 * Name-based UUID (RFC 4122 section 4.3): hashes the 16 bytes of `ns` followed by the `nameLen`
 * bytes of `name`, keeps the first 16 bytes of the digest and stamps `version` and variant.
 * Deterministic for the same namespace, name and hash function.
 *
 * Returns DigestUnavailable if the digest fails or returns less than 16 bytes. `out` is only
 * overwritten on success
 */
UuidStatus generateNameBased(const Uuid& ns, const unsigned char *name, size_t nameLen, DigestFunction& digest, UuidVersion version, Uuid& out);

// Version 3, `md5` must be an MD5 hash function
UuidStatus generateV3(const Uuid& ns, const unsigned char *name, size_t nameLen, DigestFunction& md5, Uuid& out);

// Version 5, `sha1` must be a SHA1 hash function. The 20-byte digest is truncated to 16 bytes
UuidStatus generateV5(const Uuid& ns, const unsigned char *name, size_t nameLen, DigestFunction& sha1, Uuid& out);

} //namespace MicroUuid
#endif
