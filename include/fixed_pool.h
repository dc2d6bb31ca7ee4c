#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace MP
{
class fixed_pool
{
public:
    struct block
    {
        size_t id; // position in the block table
        bool allocated;
        std::optional<std::string> owner;
    };

    struct owner_usage
    {
        size_t block_count;
        size_t total_bytes;
    };

    // throws std::invalid_argument if either size is 0
    fixed_pool(size_t total_size, size_t block_size);
    ~fixed_pool() = default;

    fixed_pool(const fixed_pool&) = delete;
    fixed_pool& operator=(const fixed_pool&) = delete;
    fixed_pool(fixed_pool&&) noexcept;
    fixed_pool& operator=(fixed_pool&&) noexcept;

    // claims size / block_size blocks for owner, lowest free index first
    // a request smaller than one block claims nothing
    // thread-safe
    // returns: false if the request is larger than the pool or than what is left
    [[nodiscard]] bool allocate(size_t size, const std::string& owner);

    // frees the block at index block_id
    // thread-safe
    // returns: false if the index is out of range, the block is free or owned by someone else
    [[nodiscard]] bool free(size_t block_id, const std::string& owner);

    // frees every block belonging to owner
    // thread-safe
    // returns: false if any single free failed
    bool free_all(const std::string& owner);

    size_t get_total_size() const;
    size_t get_block_size() const;
    size_t get_total_blocks() const;
    size_t get_remaining_blocks() const;
    size_t get_allocated_blocks() const;

    // copy of the block table, ordered by id
    std::vector<block> get_blocks() const;

    // ids of the blocks owned by owner, ascending
    std::vector<size_t> get_owner_blocks(const std::string& owner) const;
    owner_usage get_owner_usage(const std::string& owner) const;

private:
    size_t total_size;
    size_t block_size;
    size_t total_blocks;
    size_t remaining_blocks;
    std::vector<block> block_table;
    mutable std::mutex pool_mutex;

    bool free_internal(size_t block_id, const std::string& owner);
    void clear();

    void check_asserts() const;
};
} // namespace MP
