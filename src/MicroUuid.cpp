// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroUuid.h>

void mu_setDebugCb(void (*debugCb)(const char *msg)) {
    MicroUuid::debug.setDebugCb(debugCb);
}

void mu_setDebugCb2(void (*debugCb2)(int lvl, const char *fn, int line, const char *msg)) {
    MicroUuid::debug.setDebugCb2(debugCb2);
}

void mu_setDebugLevel(int dbgLevel) {
    MicroUuid::debug.setDebugLevel(dbgLevel);
}

namespace MicroUuid {

#if MU_ENABLE_V3
UuidStatus uuidV3(const Uuid& ns, const unsigned char *name, size_t nameLen, Uuid& out) {
    DigestMbedTLS md5 (DigestAlgorithm::MD5);
    return generateV3(ns, name, nameLen, md5, out);
}

UuidStatus uuidV3(const Uuid& ns, const char *name, Uuid& out) {
    return uuidV3(ns, reinterpret_cast<const unsigned char*>(name), name ? strlen(name) : 0, out);
}
#endif //MU_ENABLE_V3

#if MU_ENABLE_V5
UuidStatus uuidV5(const Uuid& ns, const unsigned char *name, size_t nameLen, Uuid& out) {
    DigestMbedTLS sha1 (DigestAlgorithm::SHA1);
    return generateV5(ns, name, nameLen, sha1, out);
}

UuidStatus uuidV5(const Uuid& ns, const char *name, Uuid& out) {
    return uuidV5(ns, reinterpret_cast<const unsigned char*>(name), name ? strlen(name) : 0, out);
}
#endif //MU_ENABLE_V5

#if MU_ENABLE_V4
UuidStatus uuidV4(Uuid& out) {
    EntropySourceCb entropy (getDefaultEntropyCb());
    return generateV4(entropy, out);
}
#endif //MU_ENABLE_V4

#if MU_ENABLE_PRNG
SquaresRng makeClockSeededRng(uint64_t seed) {
    auto clockCb = getDefaultClockCb();
    if (!clockCb) {
        MU_DBG_WARN("no clock on this platform. PRNG only depends on seed");
        return SquaresRng(seed);
    }
    return SquaresRng(seed, clockCb());
}
#endif //MU_ENABLE_PRNG

} //namespace MicroUuid
