#include "chunk_id.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace MP
{
namespace
{
std::mt19937_64& generator()
{
    thread_local std::mt19937_64 rng(std::random_device{}());
    return rng;
}
} // namespace

std::string make_chunk_id()
{
    static constexpr char HEX[] = "0123456789abcdef";

    std::array<uint8_t, 16> bytes;
    auto& rng = generator();
    for (size_t i = 0; i < bytes.size(); i += 8)
    {
        uint64_t word = rng();
        for (size_t j = 0; j < 8; ++j)
            bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
    }

    // version 4, variant 10xx
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string id;
    id.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            id.push_back('-');

        id.push_back(HEX[bytes[i] >> 4]);
        id.push_back(HEX[bytes[i] & 0x0F]);
    }
    return id;
}
} // namespace MP
