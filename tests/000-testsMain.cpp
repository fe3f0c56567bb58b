//000- prefix is for the main-file to always be on top in folder view
//use the main function provided by catch2
#define CATCH_CONFIG_MAIN
//include the catch2 library
#include <catch2/catch.hpp>
