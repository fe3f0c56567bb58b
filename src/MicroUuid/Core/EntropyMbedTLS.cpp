// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Core/EntropyMbedTLS.h>

#if MU_ENABLE_MBEDTLS

#include <mbedtls/error.h>

#include <MicroUuid/Debug.h>

using namespace MicroUuid;

EntropyMbedTLS::EntropyMbedTLS() {
    mbedtls_entropy_init(&ctx);
}

EntropyMbedTLS::~EntropyMbedTLS() {
    mbedtls_entropy_free(&ctx);
}

bool EntropyMbedTLS::fill(unsigned char *buf, size_t size) {
    while (size > 0) {
        //mbedtls_entropy_func outputs at most one block per call
        size_t chunk = size < MBEDTLS_ENTROPY_BLOCK_SIZE ? size : MBEDTLS_ENTROPY_BLOCK_SIZE;

        int ret;
        if ((ret = mbedtls_entropy_func(&ctx, buf, chunk))) {
            char err [100];
            mbedtls_strerror(ret, err, sizeof(err));
            MU_DBG_ERR("mbedtls_entropy_func: %i -- %s", ret, err);
            return false;
        }

        buf += chunk;
        size -= chunk;
    }
    return true;
}

#endif //MU_ENABLE_MBEDTLS
