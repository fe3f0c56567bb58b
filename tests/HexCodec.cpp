// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroUuid.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

using namespace MicroUuid;

TEST_CASE( "HexCodec" ) {
    printf("\nRun %s\n",  "HexCodec");

    char hex [3] = {'\0'};

    SECTION("Encode") {
        encodeHexByte(254, hex);
        REQUIRE( !strcmp(hex, "fe") );
        encodeHexByte(255, hex);
        REQUIRE( !strcmp(hex, "ff") );
        encodeHexByte(1, hex);
        REQUIRE( !strcmp(hex, "01") );
        encodeHexByte(15, hex);
        REQUIRE( !strcmp(hex, "0f") );
        encodeHexByte(0, hex);
        REQUIRE( !strcmp(hex, "00") );

        encodeHexByte(0xAB, hex, HexCase::Upper);
        REQUIRE( !strcmp(hex, "AB") );
        encodeHexByte(0xAB, hex, HexCase::Lower);
        REQUIRE( !strcmp(hex, "ab") );
    }

    SECTION("Decode") {
        unsigned char byte = 0;

        REQUIRE( decodeHexByte("fe", 0, byte) );
        REQUIRE( byte == 0xFE );

        REQUIRE( decodeHexByte("FE", 0, byte) );
        REQUIRE( byte == 0xFE );

        REQUIRE( decodeHexByte("0a", 0, byte) );
        REQUIRE( byte == 0x0A );

        REQUIRE( decodeHexByte("--9C", 2, byte) );
        REQUIRE( byte == 0x9C );
    }

    SECTION("Invalid digits") {
        unsigned char byte = 0x55;

        auto status = decodeHexByte("g0", 0, byte);
        REQUIRE( !status );
        REQUIRE( status.error == UuidError::InvalidHexDigit );
        REQUIRE( status.position == 0 );
        REQUIRE( status.character == 'g' );

        status = decodeHexByte("0z", 0, byte);
        REQUIRE( status.error == UuidError::InvalidHexDigit );
        REQUIRE( status.position == 1 );
        REQUIRE( status.character == 'z' );

        //position is absolute
        status = decodeHexByte("0011G2", 4, byte);
        REQUIRE( status.error == UuidError::InvalidHexDigit );
        REQUIRE( status.position == 4 );

        status = decodeHexByte("001 ", 2, byte);
        REQUIRE( status.error == UuidError::InvalidHexDigit );
        REQUIRE( status.position == 3 );
        REQUIRE( status.character == ' ' );

        REQUIRE( byte == 0x55 );
    }
}
