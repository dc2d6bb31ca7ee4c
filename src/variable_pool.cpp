#include "variable_pool.h"
#include "chunk_id.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace MP
{
variable_pool::variable_pool(size_t total_size, std::vector<size_t> size_menu)
    : total_capacity(total_size), remaining_capacity(total_size), size_menu(std::move(size_menu))
{
    if (total_capacity == 0)
        throw std::invalid_argument("variable_pool: total size must be greater than 0");

    if (this->size_menu.empty())
        throw std::invalid_argument("variable_pool: size menu must not be empty");

    if (std::find(this->size_menu.begin(), this->size_menu.end(), size_t{0}) != this->size_menu.end())
        throw std::invalid_argument("variable_pool: size menu entries must be greater than 0");
}

variable_pool::variable_pool(size_t total_size)
    : variable_pool(total_size, std::vector<size_t>(DEFAULT_SIZE_MENU.begin(), DEFAULT_SIZE_MENU.end()))
{
}

variable_pool::variable_pool(variable_pool&& other) noexcept
    : total_capacity(other.total_capacity), remaining_capacity(other.remaining_capacity),
      size_menu(std::move(other.size_menu)), chunks(std::move(other.chunks))
{
    other.clear();
}

variable_pool& variable_pool::operator=(variable_pool&& other) noexcept
{
    if (this == &other)
        return *this;

    total_capacity = other.total_capacity;
    remaining_capacity = other.remaining_capacity;
    size_menu = std::move(other.size_menu);
    chunks = std::move(other.chunks);

    other.clear();
    return *this;
}

void variable_pool::clear()
{
    total_capacity = 0;
    remaining_capacity = 0;
    size_menu.clear();
    chunks.clear();
}

bool variable_pool::on_menu(size_t block_size) const
{
    return std::find(size_menu.begin(), size_menu.end(), block_size) != size_menu.end();
}

std::optional<std::vector<variable_pool::chunk>> variable_pool::allocate_single_size(size_t size,
                                                                                     const std::string& owner,
                                                                                     size_t block_size)
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    return allocate_single_size_internal(size, owner, block_size);
}

std::optional<std::vector<variable_pool::chunk>> variable_pool::allocate_single_size_internal(size_t size,
                                                                                              const std::string& owner,
                                                                                              size_t block_size)
{
    if (size > total_capacity)
    {
#if MPOOL_DEBUG
        std::cerr << "WARNING: variable_pool request of " << size << " bytes by \"" << owner
                  << "\" exceeds the pool size of " << total_capacity << " bytes\n";
#endif
        return std::nullopt;
    }

    if (!on_menu(block_size))
    {
#if MPOOL_DEBUG
        std::cerr << "WARNING: variable_pool has no " << block_size << " byte chunks\n";
#endif
        return std::nullopt;
    }

    if (remaining_capacity == 0 || remaining_capacity < size)
    {
#if MPOOL_DEBUG
        std::cerr << "WARNING: variable_pool cannot give " << size << " bytes to \"" << owner << "\", only "
                  << remaining_capacity << " left\n";
#endif
        return std::nullopt;
    }

    size_t count = size / block_size;

    std::vector<chunk> created;
    created.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        chunk c{make_chunk_id(), block_size, owner, true};
        chunks.push_back(c);
        created.push_back(std::move(c));
        remaining_capacity -= block_size;
    }

    check_asserts();
    return created;
}

std::vector<variable_pool::chunk> variable_pool::allocate(size_t size, const std::string& owner)
{
    std::lock_guard<std::mutex> lock(pool_mutex);

    std::vector<chunk> results;
    if (size_menu.empty())
        return results;

    // once the fallback size overshoots the request the rest stays below zero,
    // so only the fact that it overshot is kept
    const size_t last = size_menu.back();
    size_t rest = size;
    bool overshot = false;

    for (size_t block_size : size_menu)
    {
        if (!overshot && rest == 0)
            break;

        size_t request;
        if (overshot || rest < last)
            request = last;
        else
            request = (rest / block_size) * block_size;

        auto granted = allocate_single_size_internal(request, owner, block_size);
        if (granted)
            results.insert(results.end(), std::make_move_iterator(granted->begin()),
                           std::make_move_iterator(granted->end()));

        if (overshot || request > rest)
            overshot = true;
        else
            rest -= request;
    }

    return results;
}

bool variable_pool::free(const std::string& chunk_id, const std::string& owner)
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    return free_internal(chunk_id, owner);
}

bool variable_pool::free_internal(const std::string& chunk_id, const std::string& owner)
{
    auto it = std::find_if(chunks.begin(), chunks.end(),
                           [&](const chunk& c) { return c.id == chunk_id && c.owner == owner; });

    if (it == chunks.end())
    {
#if MPOOL_DEBUG
        std::cerr << "WARNING: variable_pool has no chunk " << chunk_id << " owned by \"" << owner << "\"\n";
#endif
        return false;
    }

    remaining_capacity += it->size;
    chunks.erase(it);

    check_asserts();
    return true;
}

bool variable_pool::free_all(const std::string& owner)
{
    std::lock_guard<std::mutex> lock(pool_mutex);

    std::vector<std::string> to_remove;
    for (const auto& c : chunks)
    {
        if (c.owner == owner)
            to_remove.push_back(c.id);
    }

    size_t fails = 0;
    for (const auto& id : to_remove)
    {
        if (!free_internal(id, owner))
            fails++;
    }

    return fails == 0;
}

size_t variable_pool::get_total_capacity() const
{
    return total_capacity;
}

size_t variable_pool::get_remaining_capacity() const
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    return remaining_capacity;
}

size_t variable_pool::get_free_percentage() const
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    if (total_capacity == 0)
        return 0;

    return static_cast<size_t>(
        std::lround(100.0 * static_cast<double>(remaining_capacity) / static_cast<double>(total_capacity)));
}

const std::vector<size_t>& variable_pool::get_size_menu() const
{
    return size_menu;
}

size_t variable_pool::get_chunk_count() const
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    return chunks.size();
}

std::vector<variable_pool::chunk> variable_pool::get_chunks() const
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    return chunks;
}

std::vector<variable_pool::chunk> variable_pool::get_owner_chunks(const std::string& owner) const
{
    std::lock_guard<std::mutex> lock(pool_mutex);

    std::vector<chunk> owned;
    std::copy_if(chunks.begin(), chunks.end(), std::back_inserter(owned),
                 [&](const chunk& c) { return c.owner == owner; });
    return owned;
}

variable_pool::owner_usage variable_pool::get_owner_usage(const std::string& owner) const
{
    std::lock_guard<std::mutex> lock(pool_mutex);

    owner_usage usage{0, 0};
    for (const auto& c : chunks)
    {
        if (c.owner != owner)
            continue;

        usage.chunk_count++;
        usage.total_bytes += c.size;
    }
    return usage;
}

void variable_pool::check_asserts() const
{
    assert(remaining_capacity <= total_capacity && "Remaining capacity is larger than the pool.");

#ifndef NDEBUG
    size_t used = 0;
    for (const auto& c : chunks)
    {
        assert(c.allocated && "Chunk in the pool is not marked allocated.");
        used += c.size;
    }
    assert(used + remaining_capacity == total_capacity && "Chunk sizes and remaining capacity do not add up.");
#endif
}

} // namespace MP
