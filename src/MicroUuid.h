// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_MICROUUID_H
#define MU_MICROUUID_H

#include <MicroUuid/Version.h>
#include <MicroUuid/Platform.h>
#include <MicroUuid/Debug.h>
#include <MicroUuid/Core/Uuid.h>
#include <MicroUuid/Core/UuidError.h>
#include <MicroUuid/Core/HexCodec.h>
#include <MicroUuid/Core/TextFormat.h>
#include <MicroUuid/Core/Digest.h>
#include <MicroUuid/Core/DigestMbedTLS.h>
#include <MicroUuid/Core/Entropy.h>
#include <MicroUuid/Core/EntropyMbedTLS.h>
#include <MicroUuid/Core/SquaresRng.h>
#include <MicroUuid/Core/NameBasedGenerator.h>
#include <MicroUuid/Core/RandomGenerator.h>
#include <MicroUuid/Core/UuidJson.h>
#include <MicroUuid/Core/UuidUtils.h>

/*
 * Debug output
 */

//Set console output for the debug messages. Default is Serial on Arduino and printf on the other platforms
void mu_setDebugCb(void (*debugCb)(const char *msg));

//Set console output with level, file name and line number of each message. Overrides mu_setDebugCb()
void mu_setDebugCb2(void (*debugCb2)(int lvl, const char *fn, int line, const char *msg));

//Set debug level at runtime (MU_DL_NONE ... MU_DL_VERBOSE). Cannot exceed MU_DBG_LEVEL of the build config
void mu_setDebugLevel(int dbgLevel);

namespace MicroUuid {

/*
 * Name-based UUIDs with the hash functions of MbedTLS. `name` can also be a null-terminated
 * string. See NameBasedGenerator.h to use another hash library
 */
#if MU_ENABLE_V3
UuidStatus uuidV3(const Uuid& ns, const unsigned char *name, size_t nameLen, Uuid& out);
UuidStatus uuidV3(const Uuid& ns, const char *name, Uuid& out);
#endif //MU_ENABLE_V3

#if MU_ENABLE_V5
UuidStatus uuidV5(const Uuid& ns, const unsigned char *name, size_t nameLen, Uuid& out);
UuidStatus uuidV5(const Uuid& ns, const char *name, Uuid& out);
#endif //MU_ENABLE_V5

/*
 * Random UUID from the secure entropy source of the platform (see getDefaultEntropyCb()). Fails
 * with EntropySourceUnavailable if the platform doesn't have one
 */
#if MU_ENABLE_V4
UuidStatus uuidV4(Uuid& out);
#endif //MU_ENABLE_V4

/*
 * Pseudo random generator seeded with `seed` and the wall clock. If the platform has no clock, the
 * generator only depends on `seed` and repeats its outputs after each restart
 */
#if MU_ENABLE_PRNG
SquaresRng makeClockSeededRng(uint64_t seed);
#endif //MU_ENABLE_PRNG

} //namespace MicroUuid

#endif
