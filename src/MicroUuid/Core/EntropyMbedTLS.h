// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_ENTROPY_MBEDTLS_H
#define MU_ENTROPY_MBEDTLS_H

#include <MicroUuid/Platform.h>

#if MU_ENABLE_MBEDTLS

#include <mbedtls/entropy.h>

#include <MicroUuid/Core/Entropy.h>

namespace MicroUuid {

/*
 * Entropy pool of MbedTLS, which polls the platform entropy sources it has been built with
 * (e.g. getrandom() on Linux). Not copyable, the pool state stays with this instance
 */
class EntropyMbedTLS : public EntropySource {
private:
    mbedtls_entropy_context ctx;
public:
    EntropyMbedTLS();
    ~EntropyMbedTLS();

    EntropyMbedTLS(const EntropyMbedTLS&) = delete;
    EntropyMbedTLS& operator=(const EntropyMbedTLS&) = delete;

    bool fill(unsigned char *buf, size_t size) override;
};

} //namespace MicroUuid

#endif //MU_ENABLE_MBEDTLS
#endif
