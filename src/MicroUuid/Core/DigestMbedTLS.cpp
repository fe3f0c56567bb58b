// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Core/DigestMbedTLS.h>

#if MU_ENABLE_MBEDTLS

#include <mbedtls/md.h>

#include <MicroUuid/Debug.h>

namespace MicroUuid {

const char *serializeDigestAlgorithm(DigestAlgorithm algorithm) {
    const char *algorithmCstr = "";
    switch (algorithm) {
        case DigestAlgorithm::MD5:
            algorithmCstr = "MD5";
            break;
        case DigestAlgorithm::SHA1:
            algorithmCstr = "SHA1";
            break;
    }
    return algorithmCstr;
}

int DigestMbedTLS::digest(const DigestInput *parts, size_t count, unsigned char *out, size_t size) {

    mbedtls_md_type_t hash_alg_mbed;

    switch (algorithm) {
        case DigestAlgorithm::MD5:
            hash_alg_mbed = MBEDTLS_MD_MD5;
            break;
        case DigestAlgorithm::SHA1:
            hash_alg_mbed = MBEDTLS_MD_SHA1;
            break;
        default:
            MU_DBG_ERR("internal error");
            return -1;
    }

    const mbedtls_md_info_t *md_info;

    md_info = mbedtls_md_info_from_type(hash_alg_mbed);
    if (!md_info) {
        MU_DBG_ERR("hash algorithm %s not supported by MbedTLS build", serializeDigestAlgorithm(algorithm));
        return -1;
    }

    size_t hash_size = mbedtls_md_get_size(md_info);
    if (hash_size > size) {
        MU_DBG_ERR("digest buffer too small (%zu < %zu)", size, hash_size);
        return -1;
    }

    mbedtls_md_context_t ctx;
    mbedtls_md_init(&ctx);

    int ret;
    bool md_err = false;

    if ((ret = mbedtls_md_setup(&ctx, md_info, 0))) {
        MU_DBG_ERR("mbedtls_md_setup: %i", ret);
        md_err = true;
    }

    if (!md_err && (ret = mbedtls_md_starts(&ctx))) {
        MU_DBG_ERR("mbedtls_md_starts: %i", ret);
        md_err = true;
    }

    for (size_t i = 0; !md_err && i < count; i++) {
        if (!parts[i].len) {
            continue;
        }
        if ((ret = mbedtls_md_update(&ctx, parts[i].data, parts[i].len))) {
            MU_DBG_ERR("mbedtls_md_update: %i", ret);
            md_err = true;
        }
    }

    if (!md_err && (ret = mbedtls_md_finish(&ctx, out))) {
        MU_DBG_ERR("mbedtls_md_finish: %i", ret);
        md_err = true;
    }

    mbedtls_md_free(&ctx);
    if (md_err) {
        return -1;
    }

    return (int)hash_size;
}

} //namespace MicroUuid

#endif //MU_ENABLE_MBEDTLS
