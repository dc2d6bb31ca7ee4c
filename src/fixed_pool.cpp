#include "fixed_pool.h"
#include <cassert>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace MP
{
fixed_pool::fixed_pool(size_t total_size, size_t block_size)
    : total_size(total_size), block_size(block_size), total_blocks(0), remaining_blocks(0)
{
    if (block_size == 0)
        throw std::invalid_argument("fixed_pool: block size must be greater than 0");

    if (total_size == 0)
        throw std::invalid_argument("fixed_pool: total size must be greater than 0");

    // trailing bytes that do not fill a whole block are never addressable
    total_blocks = total_size / block_size;

#if MPOOL_DEBUG
    if (total_size % block_size != 0)
    {
        std::cerr << "WARNING: fixed_pool wastes " << total_size % block_size
                  << " trailing bytes that do not fill a block\n";
    }
#endif

    block_table.reserve(total_blocks);
    for (size_t i = 0; i < total_blocks; ++i)
    {
        block_table.push_back(block{i, false, std::nullopt});
    }

    remaining_blocks = total_blocks;
}

fixed_pool::fixed_pool(fixed_pool&& other) noexcept
    : total_size(other.total_size), block_size(other.block_size), total_blocks(other.total_blocks),
      remaining_blocks(other.remaining_blocks), block_table(std::move(other.block_table))
{
    other.clear();
}

fixed_pool& fixed_pool::operator=(fixed_pool&& other) noexcept
{
    if (this == &other)
        return *this;

    total_size = other.total_size;
    block_size = other.block_size;
    total_blocks = other.total_blocks;
    remaining_blocks = other.remaining_blocks;
    block_table = std::move(other.block_table);

    other.clear();
    return *this;
}

void fixed_pool::clear()
{
    total_size = 0;
    block_size = 0;
    total_blocks = 0;
    remaining_blocks = 0;
    block_table.clear();
}

bool fixed_pool::allocate(size_t size, const std::string& owner)
{
    std::lock_guard<std::mutex> lock(pool_mutex);

    if (size > total_size)
    {
#if MPOOL_DEBUG
        std::cerr << "WARNING: fixed_pool request of " << size << " bytes by \"" << owner
                  << "\" exceeds the pool size of " << total_size << " bytes\n";
#endif
        return false;
    }

    if (remaining_blocks == 0)
    {
#if MPOOL_DEBUG
        std::cerr << "WARNING: fixed_pool has no free blocks left for \"" << owner << "\"\n";
#endif
        return false;
    }

    // a partial block at the end of the request is not allocated
    size_t num_blocks = size / block_size;

    if (remaining_blocks < num_blocks)
    {
#if MPOOL_DEBUG
        std::cerr << "WARNING: fixed_pool cannot give " << num_blocks << " blocks to \"" << owner << "\", only "
                  << remaining_blocks << " left\n";
#endif
        return false;
    }

    size_t claimed = 0;
    for (auto& b : block_table)
    {
        if (claimed == num_blocks)
            break;

        if (b.allocated)
            continue;

        b.allocated = true;
        b.owner = owner;
        claimed++;
        remaining_blocks--;
    }

    check_asserts();
    return true;
}

bool fixed_pool::free(size_t block_id, const std::string& owner)
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    return free_internal(block_id, owner);
}

bool fixed_pool::free_internal(size_t block_id, const std::string& owner)
{
    if (block_id >= total_blocks)
    {
#if MPOOL_DEBUG
        std::cerr << "WARNING: fixed_pool has no block " << block_id << "\n";
#endif
        return false;
    }

    block& b = block_table[block_id];
    if (!b.allocated || b.owner != owner)
    {
#if MPOOL_DEBUG
        std::cerr << "WARNING: block " << block_id << " is not allocated to \"" << owner << "\"\n";
#endif
        return false;
    }

    b.allocated = false;
    b.owner.reset();
    remaining_blocks++;

    check_asserts();
    return true;
}

bool fixed_pool::free_all(const std::string& owner)
{
    std::lock_guard<std::mutex> lock(pool_mutex);

    size_t fails = 0;
    for (size_t i = 0; i < block_table.size(); ++i)
    {
        if (block_table[i].owner != owner)
            continue;

        if (!free_internal(block_table[i].id, owner))
            fails++;
    }

    return fails == 0;
}

size_t fixed_pool::get_total_size() const
{
    return total_size;
}

size_t fixed_pool::get_block_size() const
{
    return block_size;
}

size_t fixed_pool::get_total_blocks() const
{
    return total_blocks;
}

size_t fixed_pool::get_remaining_blocks() const
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    return remaining_blocks;
}

size_t fixed_pool::get_allocated_blocks() const
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    return total_blocks - remaining_blocks;
}

std::vector<fixed_pool::block> fixed_pool::get_blocks() const
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    return block_table;
}

std::vector<size_t> fixed_pool::get_owner_blocks(const std::string& owner) const
{
    std::lock_guard<std::mutex> lock(pool_mutex);

    std::vector<size_t> ids;
    for (const auto& b : block_table)
    {
        if (b.owner == owner)
            ids.push_back(b.id);
    }
    return ids;
}

fixed_pool::owner_usage fixed_pool::get_owner_usage(const std::string& owner) const
{
    std::lock_guard<std::mutex> lock(pool_mutex);

    size_t count = 0;
    for (const auto& b : block_table)
    {
        if (b.owner == owner)
            count++;
    }
    return owner_usage{count, count * block_size};
}

void fixed_pool::check_asserts() const
{
    assert(block_table.size() == total_blocks && "Block table size does not match the block count.");
    assert(remaining_blocks <= total_blocks && "More blocks remaining than the pool holds.");

#ifndef NDEBUG
    size_t allocated = 0;
    for (const auto& b : block_table)
    {
        assert(b.allocated == b.owner.has_value() && "Block owner does not match its allocation state.");
        if (b.allocated)
            allocated++;
    }
    assert(allocated + remaining_blocks == total_blocks && "Allocated and remaining blocks do not add up.");
#endif
}

} // namespace MP
