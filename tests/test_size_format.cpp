#include "size_format.h"
#include <catch2/catch_test_macros.hpp>
#include <cstddef>

using namespace MP;

TEST_CASE("Size format: Picks the largest unit", "[format]")
{
    SECTION("Bytes")
    {
        REQUIRE(format_size(0) == "0 B");
        REQUIRE(format_size(1) == "1 B");
        REQUIRE(format_size(1023) == "1023 B");
    }

    SECTION("Exact units")
    {
        REQUIRE(format_size(1024) == "1 KB");
        REQUIRE(format_size(4096) == "4 KB");
        REQUIRE(format_size(size_t{2} * 1024 * 1024) == "2 MB");
        REQUIRE(format_size(size_t{2} * 1024 * 1024 * 1024) == "2 GB");
        REQUIRE(format_size(size_t{1} << 40) == "1 TB");
    }

    SECTION("Remainders are dropped at every step")
    {
        REQUIRE(format_size(1536) == "1 KB");
        REQUIRE(format_size(1024 * 1024 - 1) == "1023 KB");
        REQUIRE(format_size(size_t{3} * 1024 * 1024 + 1023) == "3 MB");
    }

    SECTION("TB is the largest unit")
    {
        REQUIRE(format_size(size_t{1} << 50) == "1024 TB");
    }
}
