// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid.h>
#include <MicroUuid_c.h>

/*
 * Dummy invokations of all functions in MicroUuid_c.h to avoid link-time optimization. This
 * file is only useful for firmware size analysis. The function invokations should not be
 * taken as an example.
 */

void setup() {

    mu_uuid uuid, other;
    char buf [MU_UUID_STR_SIZE];

    // Debug output
    mu_set_console_out([] (const char*) {});
    mu_setDebugLevel(MU_DL_NONE);

    // Sentinels and comparison
    mu_uuid_nil(&uuid);
    mu_uuid_max(&other);
    mu_uuid_is_nil(&uuid);
    mu_uuid_is_max(&other);
    mu_uuid_compare(&uuid, &other);

    // Layout
    mu_uuid_version(&uuid);
    mu_uuid_variant(&uuid);

    // Text form
    mu_uuid_parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8", 36, &uuid, nullptr);
    mu_uuid_print(&uuid, buf, sizeof(buf), false);

    // Generators
#if MU_ENABLE_V3
    mu_uuid_v3(&uuid, (const unsigned char*) "name", 4, &other);
#endif
#if MU_ENABLE_V5
    mu_uuid_v5(&uuid, (const unsigned char*) "name", 4, &other);
#endif
#if MU_ENABLE_V4
    mu_uuid_v4(&other);
#endif
#if MU_ENABLE_PRNG
    mu_prng prng;
    mu_prng_init(&prng, 0, 0);
    mu_prng_init_now(&prng, 0);
    mu_uuid_v4_prng(&prng, &other);
#endif

    mu_uuid_error_label(MU_UUID_OK);
}

void loop() {

}
