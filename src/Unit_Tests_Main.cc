// Unit_Tests_Main.cc - Entry-point for the unit tests.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

