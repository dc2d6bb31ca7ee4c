#include "size_format.h"
#include <array>
#include <cstddef>
#include <string>

namespace MP
{
std::string format_size(size_t bytes)
{
    static constexpr std::array<const char*, 5> SUFFIXES = {"B", "KB", "MB", "GB", "TB"};

    size_t i = 0;
    while (bytes >= 1024 && i < SUFFIXES.size() - 1)
    {
        bytes /= 1024;
        i++;
    }

    return std::to_string(bytes) + " " + SUFFIXES[i];
}
} // namespace MP
