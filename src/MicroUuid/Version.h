// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_VERSION_H
#define MU_VERSION_H

#include <MicroUuid/Platform.h>

/*
 * Version specification of MicroUuid library (not related with the UUID version field)
 */
#define MU_VERSION "2.0.1"

/*
 * Enable name-based UUIDs with MD5 (version 3) in the high-level API. Needs a
 * digest backend, by default the one of MbedTLS
 */
#ifndef MU_ENABLE_V3
#define MU_ENABLE_V3 MU_ENABLE_MBEDTLS
#endif

/*
 * Enable name-based UUIDs with SHA1 (version 5) in the high-level API
 */
#ifndef MU_ENABLE_V5
#define MU_ENABLE_V5 MU_ENABLE_MBEDTLS
#endif

/*
 * Enable random UUIDs (version 4) drawn from the secure entropy source of the
 * platform. The generation fails if the platform has no such source
 */
#ifndef MU_ENABLE_V4
#define MU_ENABLE_V4 1
#endif

// Pseudo random UUIDs (version 4) from a seeded counter-based generator. Unique, but predictable
#ifndef MU_ENABLE_PRNG
#define MU_ENABLE_PRNG 1
#endif

// Read and write UUIDs from / into ArduinoJson documents
#ifndef MU_ENABLE_JSON
#define MU_ENABLE_JSON 1
#endif

#endif
