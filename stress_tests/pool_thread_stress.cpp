#include "fixed_pool.h"
#include "variable_pool.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace MP;

namespace
{
size_t worker_count()
{
    const unsigned hw = std::thread::hardware_concurrency();
    if (hw == 0)
        return 8;
    return std::min<size_t>(hw, 16);
}

void wait_for_start(const std::atomic<bool>& start)
{
    while (!start.load(std::memory_order_acquire))
        std::this_thread::yield();
}

std::string owner_name(size_t tid)
{
    return "worker-" + std::to_string(tid);
}
} // namespace

int main()
{
    const size_t threads = worker_count();

    std::cout << "\n=== Pool Threaded Stress Test ===" << std::endl;
    std::cout << "Threads: " << threads << '\n' << std::endl;

    // ========================================================================
    // Test 1: Fixed pool high-contention alloc/free churn
    // ========================================================================
    {
        const size_t block_size = 128;
        const size_t block_count = threads * 256;
        const size_t iterations_per_thread = 20000;
        fixed_pool p(block_size * block_count, block_size);

        std::atomic<bool> start{false};
        std::atomic<size_t> successful_cycles{0};
        std::vector<std::thread> workers;
        workers.reserve(threads);

        auto begin = std::chrono::high_resolution_clock::now();

        for (size_t tid = 0; tid < threads; ++tid)
        {
            workers.emplace_back([&, tid] {
                const std::string owner = owner_name(tid);
                wait_for_start(start);
                for (size_t i = 0; i < iterations_per_thread; ++i)
                {
                    if (!p.allocate(block_size, owner))
                        continue;

                    if (p.free_all(owner))
                        successful_cycles.fetch_add(1, std::memory_order_relaxed);
                }
            });
        }

        start.store(true, std::memory_order_release);
        for (auto& t : workers)
            t.join();

        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> elapsed = end - begin;

        if (successful_cycles.load(std::memory_order_relaxed) == 0)
        {
            std::cerr << "ERROR: No successful allocate/free cycles completed" << std::endl;
            return 1;
        }

        if (p.get_remaining_blocks() != p.get_total_blocks())
        {
            std::cerr << "ERROR: Fixed pool did not fully recover after churn" << std::endl;
            return 1;
        }

        const size_t total_ops = successful_cycles.load(std::memory_order_relaxed) * 2;
        std::cout << "--- Test 1: Fixed pool high-contention churn ---\n"
                  << "Successful cycles: " << successful_cycles.load(std::memory_order_relaxed) << '\n'
                  << "Elapsed:           " << elapsed.count() << " s\n"
                  << "Ops/sec:           " << (total_ops / elapsed.count()) << '\n'
                  << "[PASSED]\n"
                  << std::endl;
    }

    // ========================================================================
    // Test 2: Fixed pool concurrent full exhaustion and concurrent free
    // ========================================================================
    {
        const size_t block_size = 64;
        const size_t block_count = threads * 512;
        fixed_pool p(block_size * block_count, block_size);

        std::atomic<bool> start{false};
        std::atomic<size_t> successful_allocs{0};
        std::vector<std::thread> workers;
        workers.reserve(threads);

        auto begin = std::chrono::high_resolution_clock::now();

        for (size_t tid = 0; tid < threads; ++tid)
        {
            workers.emplace_back([&, tid] {
                const std::string owner = owner_name(tid);
                wait_for_start(start);

                while (p.allocate(block_size, owner))
                    successful_allocs.fetch_add(1, std::memory_order_relaxed);
            });
        }

        start.store(true, std::memory_order_release);
        for (auto& t : workers)
            t.join();

        if (successful_allocs.load(std::memory_order_relaxed) != block_count)
        {
            std::cerr << "ERROR: Exhaustion mismatch. Expected " << block_count
                      << " allocations, got " << successful_allocs.load(std::memory_order_relaxed)
                      << std::endl;
            return 1;
        }

        std::unordered_set<size_t> unique_ids;
        unique_ids.reserve(block_count);
        for (size_t tid = 0; tid < threads; ++tid)
        {
            for (size_t id : p.get_owner_blocks(owner_name(tid)))
            {
                if (!unique_ids.insert(id).second)
                {
                    std::cerr << "ERROR: Block owned twice during full exhaustion" << std::endl;
                    return 1;
                }
            }
        }
        if (unique_ids.size() != block_count)
        {
            std::cerr << "ERROR: Owned block count mismatch during full exhaustion" << std::endl;
            return 1;
        }

        start.store(false, std::memory_order_release);
        workers.clear();
        std::atomic<size_t> failed_frees{0};
        for (size_t tid = 0; tid < threads; ++tid)
        {
            workers.emplace_back([&, tid] {
                wait_for_start(start);
                if (!p.free_all(owner_name(tid)))
                    failed_frees.fetch_add(1, std::memory_order_relaxed);
            });
        }

        start.store(true, std::memory_order_release);
        for (auto& t : workers)
            t.join();

        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> elapsed = end - begin;

        if (failed_frees.load(std::memory_order_relaxed) != 0 || p.get_remaining_blocks() != p.get_total_blocks())
        {
            std::cerr << "ERROR: Fixed pool not fully free after concurrent free phase" << std::endl;
            return 1;
        }

        std::cout << "--- Test 2: Fixed pool full exhaustion + concurrent free ---\n"
                  << "Blocks exhausted:   " << block_count << '\n'
                  << "Elapsed:            " << elapsed.count() << " s\n"
                  << "[PASSED]\n"
                  << std::endl;
    }

    // ========================================================================
    // Test 3: Variable pool concurrent allocation cycles
    // ========================================================================
    {
        const size_t chunk_size = 4096;
        const size_t chunks_per_thread = 64;
        const size_t cycles = 50;
        variable_pool p(threads * chunks_per_thread * chunk_size * 5, {chunk_size * 4, chunk_size});

        auto begin = std::chrono::high_resolution_clock::now();

        for (size_t cycle = 0; cycle < cycles; ++cycle)
        {
            std::atomic<bool> start{false};
            std::atomic<size_t> empty_allocations{0};
            std::vector<std::thread> workers;
            workers.reserve(threads);

            for (size_t tid = 0; tid < threads; ++tid)
            {
                workers.emplace_back([&, tid] {
                    const std::string owner = owner_name(tid);
                    wait_for_start(start);
                    for (size_t i = 0; i < chunks_per_thread; ++i)
                    {
                        // one large chunk plus one small chunk
                        if (p.allocate(chunk_size * 5, owner).size() != 2)
                            empty_allocations.fetch_add(1, std::memory_order_relaxed);
                    }
                });
            }

            start.store(true, std::memory_order_release);
            for (auto& t : workers)
                t.join();

            if (empty_allocations.load(std::memory_order_relaxed) != 0)
            {
                std::cerr << "ERROR: Unexpected allocation failure in cycle " << cycle << std::endl;
                return 1;
            }

            for (size_t tid = 0; tid < threads; ++tid)
            {
                if (!p.free_all(owner_name(tid)))
                {
                    std::cerr << "ERROR: Free all failed in cycle " << cycle << std::endl;
                    return 1;
                }
            }

            if (p.get_remaining_capacity() != p.get_total_capacity() || p.get_chunk_count() != 0)
            {
                std::cerr << "ERROR: Free all failed to restore capacity in cycle " << cycle << std::endl;
                return 1;
            }
        }

        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> elapsed = end - begin;

        std::cout << "--- Test 3: Variable pool concurrent cycles ---\n"
                  << "Cycles:             " << cycles << '\n'
                  << "Elapsed:            " << elapsed.count() << " s\n"
                  << "[PASSED]\n"
                  << std::endl;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "[PASSED] All pool threaded stress tests passed!" << std::endl;
    std::cout << "========================================\n" << std::endl;
    return 0;
}
