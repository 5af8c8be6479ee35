// Test runner entry point for Catch2 v2, which ships no Catch2WithMain target.
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
