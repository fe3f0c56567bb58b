// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroUuid.h>
#include <MicroUuid_c.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

TEST_CASE( "C API" ) {
    printf("\nRun %s\n",  "C API");

    mu_uuid uuid;
    memset(&uuid, 0xEE, sizeof(uuid));

    char buf [MU_UUID_STR_SIZE];

    SECTION("Sentinels") {
        mu_uuid_nil(&uuid);
        REQUIRE( mu_uuid_is_nil(&uuid) );
        REQUIRE( !mu_uuid_is_max(&uuid) );

        mu_uuid max;
        mu_uuid_max(&max);
        REQUIRE( mu_uuid_is_max(&max) );

        REQUIRE( mu_uuid_compare(&uuid, &max) < 0 );
        REQUIRE( mu_uuid_compare(&max, &uuid) > 0 );
        REQUIRE( mu_uuid_compare(&max, &max) == 0 );
    }

    SECTION("Parse and print") {
        size_t errPos = 1000;
        REQUIRE( mu_uuid_parse("6BA7B811-9DAD-11D1-80B4-00C04FD430C8", MU_UUID_STR_LEN, &uuid, &errPos) == MU_UUID_OK );
        REQUIRE( errPos == 1000 );
        REQUIRE( mu_uuid_version(&uuid) == 1 );
        REQUIRE( mu_uuid_variant(&uuid) == MU_UUID_VARIANT_RFC4122 );

        REQUIRE( mu_uuid_print(&uuid, buf, sizeof(buf), false) == 36 );
        REQUIRE( !strcmp(buf, "6ba7b811-9dad-11d1-80b4-00c04fd430c8") );
        REQUIRE( mu_uuid_print(&uuid, buf, sizeof(buf), true) == 36 );
        REQUIRE( !strcmp(buf, "6BA7B811-9DAD-11D1-80B4-00C04FD430C8") );
        REQUIRE( mu_uuid_print(&uuid, buf, sizeof(buf) - 1, false) == -1 );

        mu_uuid untouched;
        mu_uuid_nil(&untouched);
        REQUIRE( mu_uuid_parse("6ba7b811-9dad-11d1-80b4-00c04fd430c", 35, &untouched, &errPos) == MU_UUID_INVALID_LENGTH );
        REQUIRE( errPos == 35 );
        REQUIRE( mu_uuid_parse("6ba7b811-9dad-11d1-80b4_00c04fd430c8", 36, &untouched, &errPos) == MU_UUID_INVALID_FORMAT );
        REQUIRE( errPos == 23 );
        REQUIRE( mu_uuid_parse("6ba7b811-9dad-11d1-80b4-00c04fd43zc8", 36, &untouched, nullptr) == MU_UUID_INVALID_HEX_DIGIT );
        REQUIRE( mu_uuid_is_nil(&untouched) );
    }

    SECTION("Error labels") {
        REQUIRE( !strcmp(mu_uuid_error_label(MU_UUID_OK), MicroUuid::serializeUuidError(MicroUuid::UuidError::None)) );
        REQUIRE( !strcmp(mu_uuid_error_label(MU_UUID_INVALID_HEX_DIGIT), MicroUuid::serializeUuidError(MicroUuid::UuidError::InvalidHexDigit)) );
        REQUIRE( strcmp(mu_uuid_error_label(MU_UUID_INVALID_LENGTH), mu_uuid_error_label(MU_UUID_INVALID_FORMAT)) );
    }

#if MU_ENABLE_PRNG
    SECTION("Pseudo random") {
        mu_prng prng;
        mu_prng_init(&prng, 1, 0);
        REQUIRE( prng.counter == 0 );

        mu_uuid_v4_prng(&prng, &uuid);
        REQUIRE( prng.counter == 2 );
        REQUIRE( mu_uuid_version(&uuid) == 4 );
        REQUIRE( mu_uuid_print(&uuid, buf, sizeof(buf), false) == 36 );
        REQUIRE( !strcmp(buf, "11527e18-4d6c-432b-9908-78998b0ca271") );

        mu_uuid next;
        mu_uuid_v4_prng(&prng, &next);
        REQUIRE( mu_uuid_compare(&uuid, &next) != 0 );
    }
#endif

#if MU_ENABLE_V5
    SECTION("Name-based") {
        mu_uuid ns;
        REQUIRE( mu_uuid_parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8", 36, &ns, nullptr) == MU_UUID_OK );

        REQUIRE( mu_uuid_v5(&ns, (const unsigned char*) "example.com", strlen("example.com"), &uuid) == MU_UUID_OK );
        mu_uuid_print(&uuid, buf, sizeof(buf), false);
        REQUIRE( !strcmp(buf, "cfbff0d1-9375-5685-968c-48ce8b15ae17") );

#if MU_ENABLE_V3
        REQUIRE( mu_uuid_v3(&ns, (const unsigned char*) "example.com", strlen("example.com"), &uuid) == MU_UUID_OK );
        mu_uuid_print(&uuid, buf, sizeof(buf), false);
        REQUIRE( !strcmp(buf, "9073926b-929f-31c2-abc9-fad77ae3e8eb") );
#endif
    }
#endif

#if MU_ENABLE_V4 && MU_PLATFORM == MU_PLATFORM_UNIX
    SECTION("Random") {
        REQUIRE( mu_uuid_v4(&uuid) == MU_UUID_OK );
        REQUIRE( mu_uuid_version(&uuid) == 4 );
        REQUIRE( mu_uuid_variant(&uuid) == MU_UUID_VARIANT_RFC4122 );
    }
#endif

    SECTION("Console output") {
        mu_set_console_out(cpp_console_out);
        consoleOut.clear();

        REQUIRE( mu_uuid_print(&uuid, buf, 10, false) == -1 );
        REQUIRE( consoleOut.find("[MU] ERROR") != std::string::npos );
    }
}
