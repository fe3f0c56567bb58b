// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroUuid.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

using namespace MicroUuid;

TEST_CASE( "Layout" ) {
    printf("\nRun %s\n",  "Layout");

    unsigned char bytes [MU_UUID_SIZE];

    SECTION("Version keeps low nibble") {
        memset(bytes, 0xAB, sizeof(bytes));

        setVersion(bytes, UuidVersion::Md5);
        REQUIRE( bytes[6] == 0x3B );

        setVersion(bytes, UuidVersion::Random);
        REQUIRE( bytes[6] == 0x4B );

        setVersion(bytes, UuidVersion::Sha1);
        REQUIRE( bytes[6] == 0x5B );
        REQUIRE( getVersion(bytes) == 5 );

        //all other bytes untouched
        for (size_t i = 0; i < MU_UUID_SIZE; i++) {
            if (i != 6) {
                REQUIRE( bytes[i] == 0xAB );
            }
        }
    }

    SECTION("Variant keeps low 6 bits") {
        memset(bytes, 0x00, sizeof(bytes));
        setVariant(bytes);
        REQUIRE( bytes[8] == 0x80 );

        bytes[8] = 0xFF;
        setVariant(bytes);
        REQUIRE( bytes[8] == 0xBF );

        bytes[8] = 0x41;
        setVariant(bytes);
        REQUIRE( bytes[8] == 0x81 );

        REQUIRE( getVariant(bytes) == MU_UUID_VARIANT_RFC4122 );
    }

    SECTION("Extraction doesn't mutate") {
        memset(bytes, 0xFF, sizeof(bytes));
        REQUIRE( getVersion(bytes) == 0xF );
        REQUIRE( getVariant(bytes) == 0x3 );
        for (size_t i = 0; i < MU_UUID_SIZE; i++) {
            REQUIRE( bytes[i] == 0xFF );
        }
    }

    SECTION("RFC 4122 fields") {
        //6ba7b810-9dad-11d1-80b4-00c04fd430c8
        auto dns = namespaceDns();
        REQUIRE( dns.timeLow() == 0x6ba7b810UL );
        REQUIRE( dns.timeMid() == 0x9dad );
        REQUIRE( dns.timeHiAndVersion() == 0x11d1 );
        REQUIRE( dns.clockSeq() == 0x80b4 );

        unsigned char node [6];
        dns.node(node);
        const unsigned char expected [] = {0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};
        REQUIRE( !memcmp(node, expected, sizeof(expected)) );

        REQUIRE( dns.getVersion() == 1 );
        REQUIRE( dns.isRfcVariant() );
    }
}
