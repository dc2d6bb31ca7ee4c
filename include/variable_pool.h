#pragma once

#include <array>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace MP
{
class variable_pool
{
public:
    struct chunk
    {
        std::string id;
        size_t size;
        std::string owner;
        bool allocated; // true for as long as the chunk is in the pool
    };

    struct owner_usage
    {
        size_t chunk_count;
        size_t total_bytes;
    };

    // menu used when none is given, tried in this order
    static constexpr std::array<size_t, 3> DEFAULT_SIZE_MENU = {
        size_t{2} * 1024 * 1024 * 1024, // 2 GB
        size_t{2} * 1024 * 1024,        // 2 MB
        size_t{4} * 1024,               // 4 KB
    };
    static_assert(DEFAULT_SIZE_MENU.size() > 0, "Atleast one entry in DEFAULT_SIZE_MENU required.");

    // the menu is kept as given, its order is the order sizes are tried in
    // throws std::invalid_argument if total_size is 0, the menu is empty or holds a 0
    variable_pool(size_t total_size, std::vector<size_t> size_menu);
    explicit variable_pool(size_t total_size);
    ~variable_pool() = default;

    variable_pool(const variable_pool&) = delete;
    variable_pool& operator=(const variable_pool&) = delete;
    variable_pool(variable_pool&&) noexcept;
    variable_pool& operator=(variable_pool&&) noexcept;

    // carves size / block_size chunks of exactly block_size for owner
    // the remainder of size that does not fill a chunk is dropped
    // thread-safe
    // returns: nullopt if block_size is not on the menu or size does not fit, else the new chunks
    [[nodiscard]] std::optional<std::vector<chunk>> allocate_single_size(size_t size, const std::string& owner,
                                                                         size_t block_size);

    // walks the menu once in stored order, taking as many chunks of each size as fit
    // the rest of the request. Once the rest drops below the last menu entry every
    // following step asks for one last-entry worth of bytes instead.
    // thread-safe
    // returns: every chunk created, possibly none
    std::vector<chunk> allocate(size_t size, const std::string& owner);

    // removes the chunk with this id if owner owns it
    // thread-safe
    // returns: false if there is no such chunk for owner
    [[nodiscard]] bool free(const std::string& chunk_id, const std::string& owner);

    // removes every chunk belonging to owner
    // thread-safe
    // returns: false if any single free failed
    bool free_all(const std::string& owner);

    size_t get_total_capacity() const;
    size_t get_remaining_capacity() const;

    // remaining capacity as a percentage of the total, rounded to the nearest integer
    size_t get_free_percentage() const;

    const std::vector<size_t>& get_size_menu() const;
    size_t get_chunk_count() const;

    // copies in creation order
    std::vector<chunk> get_chunks() const;
    std::vector<chunk> get_owner_chunks(const std::string& owner) const;
    owner_usage get_owner_usage(const std::string& owner) const;

private:
    size_t total_capacity;
    size_t remaining_capacity;
    std::vector<size_t> size_menu;
    std::vector<chunk> chunks;
    mutable std::mutex pool_mutex;

    std::optional<std::vector<chunk>> allocate_single_size_internal(size_t size, const std::string& owner,
                                                                    size_t block_size);
    bool free_internal(const std::string& chunk_id, const std::string& owner);
    bool on_menu(size_t block_size) const;
    void clear();

    void check_asserts() const;
};
} // namespace MP
