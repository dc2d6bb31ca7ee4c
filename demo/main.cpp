#include "fixed_pool.h"
#include "report.h"
#include "variable_pool.h"
#include <cstddef>
#include <iostream>

using namespace MP;

int main()
{
    std::cout << "*** Fixed Block Size Memory Pool Demo ***\n";
    {
        fixed_pool pool(4096, 1024);

        if (!pool.allocate(1024, "initGuest"))
            std::cout << "initGuest could not get 1024 bytes\n\n";
        report::print_table(std::cout, pool);

        if (!pool.allocate(2048, "lidarReader"))
            std::cout << "lidarReader could not get 2048 bytes\n\n";
        report::print_table(std::cout, pool);

        // block 3 is free, so this is rejected
        if (!pool.free(3, "radarReader"))
            std::cout << "radarReader could not free block 3\n\n";

        report::print_table(std::cout, pool);
        report::print_summary(std::cout, pool);
        report::print_owner(std::cout, pool, "lidarReader");
    }

    std::cout << "*** Variable Block Size Memory Pool Demo ***\n";
    {
        constexpr size_t GB = size_t{1024} * 1024 * 1024;
        variable_pool pool(16 * GB);

        auto guest = pool.allocate(10 * GB, "initGuest");
        if (pool.allocate(2 * 1024 * 1024, "sensorReader").empty())
            std::cout << "sensorReader could not get 2 MB\n\n";
        report::print_table(std::cout, pool);

        if (guest.empty() || !pool.free(guest.front().id, "initGuest"))
            std::cout << "initGuest could not free its first chunk\n\n";

        report::print_table(std::cout, pool);
        report::print_summary(std::cout, pool);
        report::print_owner(std::cout, pool, "sensorReader");
    }

    return 0;
}
