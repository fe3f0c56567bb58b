// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroUuid_c.h>
#include <MicroUuid.h>

using namespace MicroUuid;

namespace {

mu_uuid_error toCError(UuidError error) {
    switch (error) {
        case UuidError::None:
            return MU_UUID_OK;
        case UuidError::InvalidLength:
            return MU_UUID_INVALID_LENGTH;
        case UuidError::InvalidFormat:
            return MU_UUID_INVALID_FORMAT;
        case UuidError::InvalidHexDigit:
            return MU_UUID_INVALID_HEX_DIGIT;
        case UuidError::EntropySourceUnavailable:
            return MU_UUID_ENTROPY_SOURCE_UNAVAILABLE;
        case UuidError::DigestUnavailable:
            return MU_UUID_DIGEST_UNAVAILABLE;
    }
    return MU_UUID_INVALID_FORMAT;
}

UuidError fromCError(mu_uuid_error error) {
    switch (error) {
        case MU_UUID_OK:
            return UuidError::None;
        case MU_UUID_INVALID_LENGTH:
            return UuidError::InvalidLength;
        case MU_UUID_INVALID_FORMAT:
            return UuidError::InvalidFormat;
        case MU_UUID_INVALID_HEX_DIGIT:
            return UuidError::InvalidHexDigit;
        case MU_UUID_ENTROPY_SOURCE_UNAVAILABLE:
            return UuidError::EntropySourceUnavailable;
        case MU_UUID_DIGEST_UNAVAILABLE:
            return UuidError::DigestUnavailable;
    }
    return UuidError::None;
}

Uuid toUuid(const mu_uuid *uuid) {
    return Uuid::fromBytes(uuid->bytes);
}

} //namespace

void mu_uuid_nil(mu_uuid *out) {
    Uuid::nil().toBytes(out->bytes);
}

void mu_uuid_max(mu_uuid *out) {
    (Uuid::max)().toBytes(out->bytes);
}

bool mu_uuid_is_nil(const mu_uuid *uuid) {
    return toUuid(uuid).isNil();
}

bool mu_uuid_is_max(const mu_uuid *uuid) {
    return toUuid(uuid).isMax();
}

int mu_uuid_compare(const mu_uuid *lhs, const mu_uuid *rhs) {
    return toUuid(lhs).compare(toUuid(rhs));
}

uint8_t mu_uuid_version(const mu_uuid *uuid) {
    return getVersion(uuid->bytes);
}

uint8_t mu_uuid_variant(const mu_uuid *uuid) {
    return getVariant(uuid->bytes);
}

mu_uuid_error mu_uuid_parse(const char *text, size_t len, mu_uuid *out, size_t *err_pos) {
    if (!out) {
        MU_DBG_ERR("invalid args");
        return MU_UUID_INVALID_FORMAT;
    }

    auto status = parseUuid(text, len, out->bytes);
    if (!status && err_pos) {
        *err_pos = status.position;
    }
    return toCError(status.error);
}

int mu_uuid_print(const mu_uuid *uuid, char *buf, size_t size, bool uppercase) {
    return toUuid(uuid).print(buf, size, uppercase ? HexCase::Upper : HexCase::Lower);
}

#if MU_ENABLE_V3
mu_uuid_error mu_uuid_v3(const mu_uuid *ns, const unsigned char *name, size_t name_len, mu_uuid *out) {
    Uuid uuid;
    auto status = uuidV3(toUuid(ns), name, name_len, uuid);
    if (status) {
        uuid.toBytes(out->bytes);
    }
    return toCError(status.error);
}
#endif

#if MU_ENABLE_V5
mu_uuid_error mu_uuid_v5(const mu_uuid *ns, const unsigned char *name, size_t name_len, mu_uuid *out) {
    Uuid uuid;
    auto status = uuidV5(toUuid(ns), name, name_len, uuid);
    if (status) {
        uuid.toBytes(out->bytes);
    }
    return toCError(status.error);
}
#endif

#if MU_ENABLE_V4
mu_uuid_error mu_uuid_v4(mu_uuid *out) {
    Uuid uuid;
    auto status = uuidV4(uuid);
    if (status) {
        uuid.toBytes(out->bytes);
    }
    return toCError(status.error);
}
#endif

#if MU_ENABLE_PRNG
void mu_prng_init(mu_prng *prng, uint64_t seed, uint64_t time) {
    SquaresRng rng (seed, time);
    prng->key = rng.getKey();
    prng->counter = rng.getCounter();
}

bool mu_prng_init_now(mu_prng *prng, uint64_t seed) {
    auto clockCb = getDefaultClockCb();
    if (!clockCb) {
        MU_DBG_ERR("no clock on this platform");
        return false;
    }
    mu_prng_init(prng, seed, clockCb());
    return true;
}

void mu_uuid_v4_prng(mu_prng *prng, mu_uuid *out) {
    auto rng = SquaresRng::restore(prng->key, prng->counter);
    generateV4(rng).toBytes(out->bytes);
    prng->counter = rng.getCounter();
}
#endif

const char *mu_uuid_error_label(mu_uuid_error error) {
    return serializeUuidError(fromCError(error));
}

void mu_set_console_out(void (*console_out)(const char *msg)) {
    mu_setDebugCb(console_out);
}
