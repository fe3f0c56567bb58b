// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_MICROUUID_C_H
#define MU_MICROUUID_C_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#include <MicroUuid/Version.h>

typedef struct mu_uuid {
    unsigned char bytes [16]; //RFC 4122 field order
} mu_uuid;

typedef enum mu_uuid_error {
    MU_UUID_OK,
    MU_UUID_INVALID_LENGTH,
    MU_UUID_INVALID_FORMAT,
    MU_UUID_INVALID_HEX_DIGIT,
    MU_UUID_ENTROPY_SOURCE_UNAVAILABLE,
    MU_UUID_DIGEST_UNAVAILABLE
}   mu_uuid_error;

/*
 * State of the pseudo random generator. Owned by the caller, one instance per thread
 */
typedef struct mu_prng {
    uint64_t key;
    uint64_t counter;
} mu_prng;

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Please refer to MicroUuid/Core/Uuid.h for the documentation
 */

void mu_uuid_nil(mu_uuid *out);
void mu_uuid_max(mu_uuid *out);
bool mu_uuid_is_nil(const mu_uuid *uuid);
bool mu_uuid_is_max(const mu_uuid *uuid);

int mu_uuid_compare(const mu_uuid *lhs, const mu_uuid *rhs); //<0, 0, >0 like memcmp

uint8_t mu_uuid_version(const mu_uuid *uuid);
uint8_t mu_uuid_variant(const mu_uuid *uuid);

/*
 * Parses the canonical form. If `err_pos` is not NULL, it receives the error position on failure
 */
mu_uuid_error mu_uuid_parse(const char *text, size_t len, mu_uuid *out, size_t *err_pos);

/*
 * Prints the canonical form with terminating null. Returns 36 on success, or -1 if `size` is
 * less than 37
 */
int mu_uuid_print(const mu_uuid *uuid, char *buf, size_t size, bool uppercase);

#if MU_ENABLE_V3
mu_uuid_error mu_uuid_v3(const mu_uuid *ns, const unsigned char *name, size_t name_len, mu_uuid *out);
#endif

#if MU_ENABLE_V5
mu_uuid_error mu_uuid_v5(const mu_uuid *ns, const unsigned char *name, size_t name_len, mu_uuid *out);
#endif

#if MU_ENABLE_V4
mu_uuid_error mu_uuid_v4(mu_uuid *out);
#endif

#if MU_ENABLE_PRNG
void mu_prng_init(mu_prng *prng, uint64_t seed, uint64_t time);
bool mu_prng_init_now(mu_prng *prng, uint64_t seed); //seeds with the platform clock. Returns false if there is none
void mu_uuid_v4_prng(mu_prng *prng, mu_uuid *out);
#endif

const char *mu_uuid_error_label(mu_uuid_error error);

void mu_set_console_out(void (*console_out)(const char *msg));

#ifdef __cplusplus
} //extern "C"
#endif

#endif
