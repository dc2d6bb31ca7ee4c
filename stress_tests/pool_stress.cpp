#include "fixed_pool.h"
#include "variable_pool.h"
#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <string>
#include <vector>

using namespace MP;

TEST_CASE("Fixed pool: Stress test", "[fixed][stress]")
{
    fixed_pool p(128 * 1000, 128);

    SECTION("Many alloc/free cycles")
    {
        for (int cycle = 0; cycle < 100; ++cycle)
        {
            // Allocate half, one block at a time
            for (int i = 0; i < 500; ++i)
            {
                REQUIRE(p.allocate(128, "stress"));
            }

            for (size_t id : p.get_owner_blocks("stress"))
            {
                REQUIRE(p.free(id, "stress"));
            }
        }

        REQUIRE(p.get_remaining_blocks() == 1000);
    }

    SECTION("Allocate all, free all, repeat")
    {
        for (int cycle = 0; cycle < 10; ++cycle)
        {
            const std::string owner = "cycle-" + std::to_string(cycle);

            REQUIRE(p.allocate(128 * 1000, owner));
            REQUIRE(p.get_remaining_blocks() == 0);
            REQUIRE_FALSE(p.allocate(128, owner));

            REQUIRE(p.free_all(owner));
            REQUIRE(p.get_remaining_blocks() == 1000);
        }
    }
}

TEST_CASE("Variable pool: Stress test", "[variable][stress]")
{
    const size_t total = size_t{64} * 1024 * 1024;
    variable_pool p(total, {1024 * 1024, 64 * 1024, 4096});

    SECTION("Many alloc/free cycles")
    {
        for (int cycle = 0; cycle < 100; ++cycle)
        {
            std::vector<std::string> ids;

            for (int i = 0; i < 50; ++i)
            {
                for (const auto& c : p.allocate(1024 * 1024 + 64 * 1024 + 4096, "stress"))
                    ids.push_back(c.id);
            }
            REQUIRE(ids.size() == 150);

            for (const auto& id : ids)
            {
                REQUIRE(p.free(id, "stress"));
            }
        }

        REQUIRE(p.get_remaining_capacity() == total);
        REQUIRE(p.get_chunk_count() == 0);
    }

    SECTION("Fill with small chunks, free all, repeat")
    {
        const size_t small_total = size_t{4} * 1024 * 1024;
        variable_pool small(small_total, {4096});

        for (int cycle = 0; cycle < 10; ++cycle)
        {
            auto chunks = small.allocate_single_size(small_total, "filler", 4096);
            REQUIRE(chunks.has_value());
            REQUIRE(chunks->size() == small_total / 4096);
            REQUIRE(small.get_remaining_capacity() == 0);

            REQUIRE(small.free_all("filler"));
            REQUIRE(small.get_remaining_capacity() == small_total);
        }
    }
}
