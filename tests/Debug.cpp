// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <string>

#include <MicroUuid.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

namespace {

int lastLevel = -1;
std::string lastMsg;

void recordDebugCb2(int lvl, const char *fn, int line, const char *msg) {
    (void)fn;
    (void)line;
    lastLevel = lvl;
    lastMsg = msg;
}

} //namespace

TEST_CASE( "Debug" ) {
    printf("\nRun %s\n",  "Debug");

    char buf [8];
    lastLevel = -1;
    lastMsg.clear();

    SECTION("Console output captured for the test run") {
        REQUIRE( testRunStarted );

        consoleOut.clear();
        REQUIRE( MicroUuid::namespaceDns().print(buf, sizeof(buf)) == -1 );
        REQUIRE( consoleOut.find("[MU] ERROR") != std::string::npos );
    }

    SECTION("Callback with level") {
        mu_setDebugCb2(recordDebugCb2);

        REQUIRE( MicroUuid::namespaceDns().print(buf, sizeof(buf)) == -1 );
        REQUIRE( lastLevel == MU_DL_ERROR );
        REQUIRE( !lastMsg.empty() );

        mu_setDebugCb2(nullptr);
    }

    SECTION("Runtime debug level") {
        mu_setDebugCb(cpp_console_out);
        mu_setDebugLevel(MU_DL_NONE);
        consoleOut.clear();

        REQUIRE( MicroUuid::namespaceDns().print(buf, sizeof(buf)) == -1 );
        REQUIRE( consoleOut.empty() );

        mu_setDebugLevel(MU_DBG_LEVEL);
        REQUIRE( MicroUuid::debug.getDebugLevel() == MU_DBG_LEVEL );

        REQUIRE( MicroUuid::namespaceDns().print(buf, sizeof(buf)) == -1 );
        REQUIRE( consoleOut.find("[MU] ERROR") != std::string::npos );
    }

    SECTION("Long messages are truncated") {
        mu_setDebugCb2(recordDebugCb2);

        std::string longText (4 * MU_DBG_MAXMSGSIZE, 'x');
        MU_DBG_ERR("%s", longText.c_str());
        REQUIRE( lastMsg.size() < MU_DBG_MAXMSGSIZE );
        REQUIRE( lastMsg.find("[...]") != std::string::npos );

        mu_setDebugCb2(nullptr);
    }
}
