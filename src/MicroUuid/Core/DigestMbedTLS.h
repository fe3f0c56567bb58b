// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_DIGEST_MBEDTLS_H
#define MU_DIGEST_MBEDTLS_H

#include <MicroUuid/Platform.h>

#if MU_ENABLE_MBEDTLS

#include <stdint.h>

#include <MicroUuid/Core/Digest.h>

namespace MicroUuid {

enum class DigestAlgorithm : uint8_t {
    MD5,  //16 bytes
    SHA1  //20 bytes
};

const char *serializeDigestAlgorithm(DigestAlgorithm algorithm);

/*
 * Hash function of MbedTLS. Works with the md module of MbedTLS 2.x and 3.x. The digest fails if
 * the algorithm has been disabled in the MbedTLS config
 */
class DigestMbedTLS : public DigestFunction {
private:
    DigestAlgorithm algorithm;
public:
    DigestMbedTLS(DigestAlgorithm algorithm) : algorithm(algorithm) { }

    int digest(const DigestInput *parts, size_t count, unsigned char *out, size_t size) override;

    DigestAlgorithm getAlgorithm() const {return algorithm;}
};

} //namespace MicroUuid

#endif //MU_ENABLE_MBEDTLS
#endif
